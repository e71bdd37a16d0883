#ifndef FINSIM_GROWTH_SAMPLER_HPP
#define FINSIM_GROWTH_SAMPLER_HPP

#include "historical_returns.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace finsim {

enum class GrowthType : uint8_t {
    Fixed = 0,
    Historical = 1
};

// Configuration-time description of how an asset grows.
// Bound to a concrete sampler once per trial.
struct GrowthRule {
    GrowthType type;
    double rate;                // Fixed only
    std::string category;       // Historical only

    GrowthRule();

    static GrowthRule fixed(double rate);
    static GrowthRule historical(const std::string& category);

    bool is_stochastic() const { return type == GrowthType::Historical; }
    std::string describe() const;
};

// Lazy per-year growth-rate sequence; next_rate() is called once per year
class GrowthSampler {
public:
    virtual ~GrowthSampler() = default;

    virtual double next_rate() = 0;
    virtual std::string describe() const = 0;
};

class FixedGrowthSampler : public GrowthSampler {
public:
    explicit FixedGrowthSampler(double rate);

    double next_rate() override { return rate_; }
    std::string describe() const override;

    double rate() const { return rate_; }

private:
    double rate_;
};

// Draws annual returns i.i.d. with replacement from one historical series.
// The same seed always reproduces the same sequence.
class HistoricalGrowthSampler : public GrowthSampler {
public:
    HistoricalGrowthSampler(std::shared_ptr<const ReturnSeries> series, uint64_t seed);

    double next_rate() override;
    std::string describe() const override;

    uint64_t seed() const { return seed_; }

private:
    std::shared_ptr<const ReturnSeries> series_;
    uint64_t seed_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<size_t> index_;
};

// Creates the sampler for `rule`.
// Throws ConfigurationError if a historical category is not in `returns`.
std::unique_ptr<GrowthSampler> make_sampler(const GrowthRule& rule,
                                            const HistoricalReturns& returns,
                                            uint64_t seed);

// Validates a rule against the reference data without building a sampler
void validate_growth_rule(const GrowthRule& rule, const HistoricalReturns& returns);

// Deterministic seed for one random stream of one trial (SplitMix64 mixing).
// Independent of the order in which trials execute.
uint64_t derive_seed(uint64_t base_seed, uint64_t trial_index, uint64_t stream_index);

} // namespace finsim

#endif // FINSIM_GROWTH_SAMPLER_HPP
