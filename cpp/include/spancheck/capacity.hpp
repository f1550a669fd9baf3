#pragma once

#include "spancheck/material.hpp"
#include "spancheck/section.hpp"

#include <string>

namespace spancheck {

/**
 * @brief Material partial safety factors (divisors on characteristic strength)
 */
struct SafetyFactors {
    double steel = 1.05;          ///< gamma_m for structural steel
    double concrete = 1.30;       ///< gamma_c for concrete
    double reinforcement = 1.15;  ///< gamma_s for reinforcing steel
    double timber = 1.00;         ///< Additional divisor on permissible timber stresses
};

/**
 * @brief Timber service exposure (K2 modification)
 */
enum class TimberExposure {
    Dry,    ///< Service classes 1 and 2: K2 = 1.0
    Wet     ///< Service class 3: K2 = 0.8 bending, 0.9 shear
};

/**
 * @brief Duration of the design load (K3 modification)
 */
enum class LoadDuration {
    Long,       ///< K3 = 1.00
    Medium,     ///< K3 = 1.25
    Short,      ///< K3 = 1.50
    VeryShort   ///< K3 = 1.75
};

std::string timber_exposure_to_string(TimberExposure exposure);
std::string load_duration_to_string(LoadDuration duration);

/// @throws ValidationError naming timber_exposure
TimberExposure parse_timber_exposure(const std::string& name);

/// @throws ValidationError naming load_duration
LoadDuration parse_load_duration(const std::string& name);

/**
 * @brief Permissible stress modification factors for timber
 */
struct TimberModification {
    TimberExposure exposure = TimberExposure::Dry;
    LoadDuration duration = LoadDuration::Long;

    double k2_bending() const { return exposure == TimberExposure::Wet ? 0.8 : 1.0; }
    double k2_shear() const { return exposure == TimberExposure::Wet ? 0.9 : 1.0; }
    double k3() const;
};

/**
 * @brief Steel section classification
 */
enum class SectionClass {
    NotApplicable,  ///< Concrete and timber
    Compact,        ///< Plastic modulus used
    NonCompact      ///< Elastic modulus used
};

std::string section_class_to_string(SectionClass cls);

/**
 * @brief Inputs to the capacity calculation besides material and section
 */
struct CapacityParameters {
    double condition_factor = 1.0;          ///< (0, 1], multiplies both capacities
    SafetyFactors safety;
    double slenderness_factor = 1.0;        ///< Lateral-torsional buckling reduction (steel)
    TimberModification timber;
    double reinforcement_strength = 500.0;  ///< fyk of reinforcement [N/mm²]
};

/**
 * @brief Capacity of the member with the intermediate values of the method
 *
 * Fields not used by a material's method are left at 0.
 */
struct CapacityResult {
    double moment_capacity = 0.0;      ///< Design moment capacity after condition factor [kN·m]
    double shear_capacity = 0.0;       ///< Design shear capacity after condition factor [kN]
    double moment_unfactored = 0.0;    ///< Before condition factor [kN·m]
    double shear_unfactored = 0.0;     ///< Before condition factor [kN]
    std::string method;                ///< Code method description

    // Steel
    SectionClass section_class = SectionClass::NotApplicable;
    double section_modulus = 0.0;      ///< Modulus used [mm³]
    double design_strength = 0.0;      ///< fy / gamma_m [N/mm²]
    double shear_strength = 0.0;       ///< 0.6 fy / gamma_m [N/mm²]

    // Concrete
    double tensile_force = 0.0;        ///< [kN]
    double compression_block = 0.0;    ///< Depth of rectangular stress block [mm]
    double neutral_axis = 0.0;         ///< [mm]
    double lever_arm = 0.0;            ///< [mm]
    double concrete_shear_stress = 0.0;///< vRd,c [N/mm²]
    bool over_reinforced = false;

    // Timber
    double permissible_bending = 0.0;  ///< Grade bending stress x K2 x K3 / gamma [N/mm²]
    double permissible_shear = 0.0;    ///< Grade shear stress x K2 x K3 / gamma [N/mm²]
};

/**
 * @brief Computes moment and shear capacity with the material's code method
 *
 * - Steel (limit state): M = Z fy chi / gamma_m, Z plastic for compact
 *   sections and elastic otherwise; V = Av 0.6 fy / gamma_m
 * - Concrete (ultimate flexure): rectangular stress block in equilibrium with
 *   the reinforcement, M = T z; shear from vRd,c b d
 * - Timber (permissible stress): M = sigma_m K2 K3 Z / gamma,
 *   V = 2/3 tau K2 K3 A / gamma
 *
 * Both capacities are multiplied by the condition factor.
 */
class CapacityEngine {
public:
    /**
     * @brief Compute capacities
     * @throws UnsupportedMaterialError if the section does not belong to the material kind
     * @throws ValidationError if the condition factor is outside (0, 1] or a
     *         safety factor is not positive
     */
    static CapacityResult capacity(const MaterialSpec& material,
                                   const SectionGeometry& geometry,
                                   const CapacityParameters& params);

    /**
     * @brief Compute capacities with default timber and reinforcement parameters
     */
    static CapacityResult capacity(const MaterialSpec& material,
                                   const SectionGeometry& geometry,
                                   double condition_factor,
                                   const SafetyFactors& safety,
                                   double slenderness_factor);

    /**
     * @brief Classify a steel section (epsilon = sqrt(275 / fy))
     */
    static SectionClass classify(const SteelSection& section, double fy);

private:
    static void steel_capacity(const MaterialSpec& material, const SteelSection& section,
                               const CapacityParameters& params, CapacityResult& result);
    static void concrete_capacity(const MaterialSpec& material, const ConcreteSection& section,
                                  const CapacityParameters& params, CapacityResult& result);
    static void timber_capacity(const MaterialSpec& material, const TimberSection& section,
                                const CapacityParameters& params, CapacityResult& result);
};

} // namespace spancheck
