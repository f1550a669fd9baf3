/**
 * @file warnings.hpp
 * @brief Warning system for questionable assessment inputs and results.
 *
 * Warnings indicate conditions that don't prevent an assessment
 * but that the checking engineer should review before sign-off.
 */

#ifndef SPANCHECK_WARNINGS_HPP
#define SPANCHECK_WARNINGS_HPP

#include <map>
#include <string>
#include <vector>

namespace spancheck {

/**
 * @brief Warning codes for questionable inputs or results.
 */
enum class WarningCode {
    // === Restraint / Slenderness Warnings (100-199) ===

    /// k1 outside [0.7, 1.0] or k2 outside [1.0, 1.2]
    RESTRAINT_FACTOR_OUTSIDE_RANGE = 100,

    /// Slenderness exceeds the last point of the reduction curve
    SLENDERNESS_BEYOND_CURVE = 101,

    // === Section Warnings (200-299) ===

    /// Steel section is not compact, elastic modulus used
    SLENDER_STEEL_SECTION = 200,

    /// Concrete neutral axis beyond the ductility limit
    OVER_REINFORCED_SECTION = 201,

    // === Condition / Result Warnings (300-399) ===

    /// Condition factor indicates heavy deterioration
    LOW_CONDITION_FACTOR = 300,

    /// Utilisation close to unity
    HIGH_UTILISATION = 301,

    // === Vehicle Warnings (400-499) ===

    /// Single heavier axle at midspan governs the moment envelope
    VEHICLE_SINGLE_AXLE_GOVERNS = 400
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates an input error or unsafe margin
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::RESTRAINT_FACTOR_OUTSIDE_RANGE: return "RESTRAINT_FACTOR_OUTSIDE_RANGE";
        case WarningCode::SLENDERNESS_BEYOND_CURVE: return "SLENDERNESS_BEYOND_CURVE";
        case WarningCode::SLENDER_STEEL_SECTION: return "SLENDER_STEEL_SECTION";
        case WarningCode::OVER_REINFORCED_SECTION: return "OVER_REINFORCED_SECTION";
        case WarningCode::LOW_CONDITION_FACTOR: return "LOW_CONDITION_FACTOR";
        case WarningCode::HIGH_UTILISATION: return "HIGH_UTILISATION";
        case WarningCode::VEHICLE_SINGLE_AXLE_GOVERNS: return "VEHICLE_SINGLE_AXLE_GOVERNS";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information.
 */
struct AssessmentWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested action
    std::string suggestion;

    AssessmentWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for a restraint factor outside the tabulated range.
     */
    static AssessmentWarning restraint_factor(const std::string& name, double value,
                                              double lo, double hi) {
        AssessmentWarning warn(WarningCode::RESTRAINT_FACTOR_OUTSIDE_RANGE, WarningSeverity::Medium,
            "Restraint factor " + name + " outside the usual range");
        warn.details[name] = std::to_string(value);
        warn.details["range"] = std::to_string(lo) + " - " + std::to_string(hi);
        warn.suggestion = "Confirm the support and load-height restraint conditions";
        return warn;
    }

    /**
     * @brief Create warning for slenderness beyond the reduction curve.
     */
    static AssessmentWarning slenderness_beyond_curve(double slenderness, double floor) {
        AssessmentWarning warn(WarningCode::SLENDERNESS_BEYOND_CURVE, WarningSeverity::High,
            "Slenderness beyond tabulated range, reduction factor held at floor");
        warn.details["slenderness"] = std::to_string(slenderness);
        warn.details["reduction_factor"] = std::to_string(floor);
        warn.suggestion = "Provide intermediate lateral restraint or a detailed buckling check";
        return warn;
    }

    /**
     * @brief Create warning for a steel section that is not compact.
     */
    static AssessmentWarning slender_steel_section(double flange_ratio, double web_ratio) {
        AssessmentWarning warn(WarningCode::SLENDER_STEEL_SECTION, WarningSeverity::Low,
            "Steel section is not compact, elastic section modulus used");
        warn.details["flange_outstand_ratio"] = std::to_string(flange_ratio);
        warn.details["web_depth_ratio"] = std::to_string(web_ratio);
        return warn;
    }

    /**
     * @brief Create warning for an over-reinforced concrete section.
     */
    static AssessmentWarning over_reinforced(double neutral_axis, double limit) {
        AssessmentWarning warn(WarningCode::OVER_REINFORCED_SECTION, WarningSeverity::Medium,
            "Neutral axis exceeds ductility limit, compression block capped");
        warn.details["neutral_axis_mm"] = std::to_string(neutral_axis);
        warn.details["limit_mm"] = std::to_string(limit);
        warn.suggestion = "Reinforcement beyond the balanced area does not add capacity";
        return warn;
    }

    /**
     * @brief Create warning for a low condition factor.
     */
    static AssessmentWarning low_condition_factor(double factor) {
        AssessmentWarning warn(WarningCode::LOW_CONDITION_FACTOR, WarningSeverity::High,
            "Condition factor indicates severe deterioration");
        warn.details["condition_factor"] = std::to_string(factor);
        warn.suggestion = "Consider a detailed inspection before relying on the assessment";
        return warn;
    }

    /**
     * @brief Create warning for utilisation close to unity.
     */
    static AssessmentWarning high_utilisation(const std::string& action, double utilisation) {
        AssessmentWarning warn(WarningCode::HIGH_UTILISATION, WarningSeverity::Medium,
            action + " utilisation is close to unity");
        warn.details["utilisation"] = std::to_string(utilisation);
        return warn;
    }

    /**
     * @brief Create warning when one axle alone governs the vehicle moment.
     */
    static AssessmentWarning single_axle_governs(double single_moment, double pair_moment) {
        AssessmentWarning warn(WarningCode::VEHICLE_SINGLE_AXLE_GOVERNS, WarningSeverity::Low,
            "Heavier axle alone at midspan governs the vehicle moment");
        warn.details["single_axle_moment_kNm"] = std::to_string(single_moment);
        warn.details["axle_pair_moment_kNm"] = std::to_string(pair_moment);
        return warn;
    }
};

/**
 * @brief Collection of warnings from one assessment.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<AssessmentWarning> warnings;

    void add(const AssessmentWarning& warning) {
        warnings.push_back(warning);
    }

    void add(AssessmentWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Check whether a warning with the given code was raised.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<AssessmentWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<AssessmentWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace spancheck

#endif  // SPANCHECK_WARNINGS_HPP
