#ifndef FINSIM_FLOW_HPP
#define FINSIM_FLOW_HPP

#include "action.hpp"
#include "tax_table.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace finsim {

enum class FlowKind : uint8_t {
    Revenue = 0,
    Expense = 1
};

std::string flow_kind_to_string(FlowKind kind);

// A periodic cash amount: revenue or expense.
// current_value is the amount for the running year; history holds the value
// used in each completed year.
class TaxableFlow : public Adjustable {
public:
    // jurisdiction is only meaningful for revenues; empty means untaxed
    TaxableFlow(FlowKind kind, std::string name, double initial_value,
                double evolution_rate, std::string jurisdiction = "");

    const std::string& name() const override { return name_; }
    FlowKind kind() const { return kind_; }
    bool is_revenue() const { return kind_ == FlowKind::Revenue; }

    double current_value() const { return value_; }
    double evolution_rate() const { return rate_; }
    const std::string& jurisdiction() const { return jurisdiction_; }
    bool is_taxable() const { return is_revenue() && !jurisdiction_.empty(); }

    const std::vector<double>& history() const { return history_; }

    // Records the value used this year, then applies the evolution rate
    // for the next one
    void evolve();

    // Federal + state liability on `gross_income` under this revenue's
    // jurisdiction. Zero for expenses and untaxed revenues.
    double compute_tax(double gross_income, const TaxTable& table) const;

    // Flows accept base-value and rate mutations only
    static bool accepts(const ActionOp& op);

    bool supports(const ActionOp& op) const override { return accepts(op); }
    void apply_action(const ActionOp& op, int year, std::optional<int> duration) override;
    std::vector<std::string> restore_expired(int year) override;

private:
    enum class Field : uint8_t { Value, Rate };

    struct PendingRestore {
        int year;
        Field field;
        double prior;
    };

    FlowKind kind_;
    std::string name_;
    double value_;
    double rate_;
    std::string jurisdiction_;
    std::vector<double> history_;
    std::vector<PendingRestore> restores_;

    void remember(Field field, double prior, int year, std::optional<int> duration);
};

} // namespace finsim

#endif // FINSIM_FLOW_HPP
