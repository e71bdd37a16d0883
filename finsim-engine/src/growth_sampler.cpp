#include "growth_sampler.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace finsim {

namespace {

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

} // anonymous namespace

// ============================================================================
// GrowthRule Implementation
// ============================================================================

GrowthRule::GrowthRule()
    : type(GrowthType::Fixed), rate(0.0) {}

GrowthRule GrowthRule::fixed(double rate) {
    GrowthRule rule;
    rule.type = GrowthType::Fixed;
    rule.rate = rate;
    return rule;
}

GrowthRule GrowthRule::historical(const std::string& category) {
    GrowthRule rule;
    rule.type = GrowthType::Historical;
    rule.category = category;
    return rule;
}

std::string GrowthRule::describe() const {
    std::ostringstream oss;
    if (type == GrowthType::Fixed) {
        oss << "fixed(" << rate << ")";
    } else {
        oss << "historical(" << category << ")";
    }
    return oss.str();
}

// ============================================================================
// Sampler Implementations
// ============================================================================

FixedGrowthSampler::FixedGrowthSampler(double rate)
    : rate_(rate) {
    if (!std::isfinite(rate) || rate < -1.0) {
        throw ConfigurationError("Growth rate must be a finite value >= -1.0, got " +
                                 std::to_string(rate));
    }
}

std::string FixedGrowthSampler::describe() const {
    return GrowthRule::fixed(rate_).describe();
}

HistoricalGrowthSampler::HistoricalGrowthSampler(std::shared_ptr<const ReturnSeries> series,
                                                 uint64_t seed)
    : series_(std::move(series)), seed_(seed), rng_(seed) {
    if (!series_ || series_->annual_returns.empty()) {
        throw ConfigurationError("Historical growth requires a non-empty return series");
    }
    index_ = std::uniform_int_distribution<size_t>(0, series_->annual_returns.size() - 1);
}

double HistoricalGrowthSampler::next_rate() {
    return series_->annual_returns[index_(rng_)];
}

std::string HistoricalGrowthSampler::describe() const {
    return GrowthRule::historical(series_->category).describe();
}

// ============================================================================
// Factory and Seeding
// ============================================================================

void validate_growth_rule(const GrowthRule& rule, const HistoricalReturns& returns) {
    if (rule.type == GrowthType::Fixed) {
        if (!std::isfinite(rule.rate) || rule.rate < -1.0) {
            throw ConfigurationError("Growth rate must be a finite value >= -1.0, got " +
                                     std::to_string(rule.rate));
        }
        return;
    }
    if (!returns.has_category(rule.category)) {
        throw ConfigurationError("Unknown growth category: '" + rule.category + "'");
    }
}

std::unique_ptr<GrowthSampler> make_sampler(const GrowthRule& rule,
                                            const HistoricalReturns& returns,
                                            uint64_t seed) {
    switch (rule.type) {
        case GrowthType::Fixed:
            return std::make_unique<FixedGrowthSampler>(rule.rate);
        case GrowthType::Historical:
            return std::make_unique<HistoricalGrowthSampler>(returns.get(rule.category), seed);
    }
    throw ConfigurationError("Unsupported growth type");
}

uint64_t derive_seed(uint64_t base_seed, uint64_t trial_index, uint64_t stream_index) {
    uint64_t h = splitmix64(base_seed);
    h = splitmix64(h ^ trial_index);
    h = splitmix64(h ^ (stream_index * 0xD1B54A32D192ED03ull));
    return h;
}

} // namespace finsim
