#pragma once

#include <map>
#include <string>
#include <vector>

namespace spancheck {

struct AssessmentInput;

/**
 * @brief Flat named parameter set as collected by the input form
 *
 * All values are text; numeric fields are parsed on demand.
 */
using ParameterSet = std::map<std::string, std::string>;

/**
 * @brief Typed access to a ParameterSet
 *
 * Every failure throws ValidationError naming the offending key.
 * Empty or whitespace-only values count as absent.
 */
class ParameterReader {
public:
    explicit ParameterReader(const ParameterSet& params);

    /// True if the key is present with a non-blank value
    bool has(const std::string& key) const;

    /// Required text value
    std::string text(const std::string& key) const;

    /// Optional text value
    std::string text_or(const std::string& key, const std::string& fallback) const;

    /// Required decimal value
    double number(const std::string& key) const;

    /// Optional decimal value
    double number_or(const std::string& key, double fallback) const;

    /// Required positive integer value
    int count(const std::string& key) const;

    /// Optional boolean ("true"/"false", "yes"/"no", "1"/"0", "on"/"off")
    bool flag_or(const std::string& key, bool fallback) const;

    /**
     * @brief Highest entry number N over the indexed keys "<prefix>N"
     *
     * Only non-blank keys count. Returns 0 when no indexed key is present.
     */
    int last_index(const std::vector<std::string>& prefixes) const;

private:
    const ParameterSet& params_;
};

/**
 * @brief Build a typed assessment input from flat parameters
 *
 * Reads the material-specific fields for the chosen material only, so
 * fields belonging to other materials are ignored.
 *
 * @throws ValidationError for missing, malformed or out-of-range fields
 * @throws UnknownMaterialError if the material kind is not recognised
 */
AssessmentInput parse_assessment_input(const ParameterSet& params);

} // namespace spancheck
