#pragma once

#include <optional>
#include <string>
#include <vector>

namespace spancheck {

/**
 * @brief One record of the calculation narrative
 *
 * Numeric steps carry a value and unit; descriptive steps (e.g. the
 * section class chosen) carry only text.
 */
struct CalculationStep {
    std::string label;              ///< What was computed, with the inputs consumed
    std::optional<double> value;    ///< Computed value (absent for descriptive steps)
    std::string unit;               ///< Unit of value ("" for dimensionless)
    std::string text;               ///< Descriptive value for non-numeric steps

    /**
     * @brief Format as "label = value unit" or "label: text"
     */
    std::string to_string() const;
};

/**
 * @brief Append-only audit trail of one assessment
 *
 * Steps are kept in execution order. A log belongs to exactly one
 * assessment run.
 */
class CalculationLog {
public:
    /**
     * @brief Append a numeric step
     */
    void add(const std::string& label, double value, const std::string& unit = "");

    /**
     * @brief Append a descriptive step
     */
    void note(const std::string& label, const std::string& text);

    const std::vector<CalculationStep>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

    /**
     * @brief Numbered narrative, one step per line
     */
    std::string to_text() const;

private:
    std::vector<CalculationStep> steps_;
};

/**
 * @brief Locale-independent fixed-point formatting
 * @param value Value to format
 * @param precision Digits after the decimal point
 */
std::string format_number(double value, int precision = 2);

} // namespace spancheck
