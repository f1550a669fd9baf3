#include "spancheck/calculation_log.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace spancheck {

std::string format_number(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    // Avoid printing "-0.00"
    if (value > -0.5 * std::pow(10.0, -precision) && value < 0.0) {
        value = 0.0;
    }
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string CalculationStep::to_string() const {
    if (!value) {
        return label + ": " + text;
    }
    std::string result = label + " = " + format_number(*value, 3);
    if (!unit.empty()) {
        result += " " + unit;
    }
    return result;
}

void CalculationLog::add(const std::string& label, double value, const std::string& unit) {
    CalculationStep step;
    step.label = label;
    step.value = value;
    step.unit = unit;
    steps_.push_back(std::move(step));
}

void CalculationLog::note(const std::string& label, const std::string& text) {
    CalculationStep step;
    step.label = label;
    step.text = text;
    steps_.push_back(std::move(step));
}

std::string CalculationLog::to_text() const {
    std::ostringstream oss;
    for (size_t i = 0; i < steps_.size(); ++i) {
        oss << (i + 1) << ". " << steps_[i].to_string() << "\n";
    }
    return oss.str();
}

} // namespace spancheck
