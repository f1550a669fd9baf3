#pragma once

#include "spancheck/material.hpp"
#include "spancheck/section.hpp"

#include <Eigen/Dense>

namespace spancheck {

/**
 * @brief Restraint factors on the unrestrained length of a steel member
 *
 * - k1: Support rotational restraint (0.7 fully restrained .. 1.0 free to rotate)
 * - k2: Load application height (1.0 normal .. 1.2 destabilising)
 */
struct EffectiveLengthFactors {
    double k1 = 1.0;
    double k2 = 1.0;

    static constexpr double k1_min = 0.7;
    static constexpr double k1_max = 1.0;
    static constexpr double k2_min = 1.0;
    static constexpr double k2_max = 1.2;

    /// True if both factors lie within their tabulated ranges
    bool within_usual_range() const {
        return k1 >= k1_min && k1 <= k1_max && k2 >= k2_min && k2 <= k2_max;
    }
};

/**
 * @brief Result of effective length resolution
 */
struct EffectiveLengthResult {
    double effective_length = 0.0;   ///< Le [m]
    double slenderness = 0.0;        ///< Le / ry scaled by sqrt(fy / 275) (0 for non-steel)
    double reduction_factor = 1.0;   ///< Lateral-torsional buckling reduction factor
    bool beyond_curve = false;       ///< Slenderness exceeded the last curve point
};

/**
 * @brief Lateral-torsional buckling reduction curve
 *
 * Piecewise linear reduction factor against slenderness, equal to 1.0
 * up to the plateau and non-increasing to a floor. Values beyond the last
 * point are held at the floor.
 */
class SlendernessCurve {
public:
    /**
     * @brief Construct from tabulated points
     * @param slenderness Ascending slenderness values
     * @param factors Reduction factors (non-increasing)
     */
    SlendernessCurve(Eigen::ArrayXd slenderness, Eigen::ArrayXd factors);

    /**
     * @brief The process-wide lateral-torsional buckling curve
     */
    static const SlendernessCurve& lateral_torsional();

    /**
     * @brief Interpolate the reduction factor
     * @param slenderness Slenderness (negative values treated as 0)
     * @return Reduction factor in (0, 1]
     */
    double reduction_factor(double slenderness) const;

    double max_slenderness() const { return slenderness_(slenderness_.size() - 1); }
    double floor() const { return factors_(factors_.size() - 1); }

private:
    Eigen::ArrayXd slenderness_;
    Eigen::ArrayXd factors_;
};

/**
 * @brief Resolves effective length and slenderness reduction for a member
 */
class EffectiveLengthResolver {
public:
    /**
     * @brief Resolve effective length without a section (no slenderness reduction)
     *
     * Le = k1 * k2 * actual_length, reduction factor 1.0.
     *
     * @throws ValidationError if the length or either factor is not positive
     */
    static EffectiveLengthResult resolve(double actual_length, double k1, double k2);

    /**
     * @brief Resolve effective length and reduction factor for a member
     *
     * For steel: Le = k1 * k2 * L, slenderness = Le / ry * sqrt(fy / 275),
     * factor from SlendernessCurve::lateral_torsional().
     * For concrete and timber the restraint factors have no meaning: Le = L and
     * the factor is 1.0.
     *
     * @param actual_length Unrestrained length of the compression flange [m]
     * @param factors Restraint factors
     * @param material Material of the member
     * @param section Derived section
     * @throws ValidationError if the length or either factor is not positive
     */
    static EffectiveLengthResult resolve(double actual_length,
                                         const EffectiveLengthFactors& factors,
                                         const MaterialSpec& material,
                                         const SectionGeometry& section);
};

} // namespace spancheck
