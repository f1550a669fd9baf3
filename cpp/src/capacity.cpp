#include "spancheck/capacity.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

#include <algorithm>
#include <cmath>

namespace spancheck {

namespace {

// Concrete stress block and ductility constants
constexpr double alpha_cc = 0.85;          // long-term / rectangular block coefficient
constexpr double block_ratio = 0.8;        // stress block depth / neutral axis depth
constexpr double neutral_axis_limit = 0.45;
constexpr double lever_arm_limit = 0.95;

void require_positive(double value, const std::string& field) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range(field, value, "greater than 0"));
    }
}

} // namespace

std::string timber_exposure_to_string(TimberExposure exposure) {
    return exposure == TimberExposure::Wet ? "wet" : "dry";
}

std::string load_duration_to_string(LoadDuration duration) {
    switch (duration) {
        case LoadDuration::Long: return "long";
        case LoadDuration::Medium: return "medium";
        case LoadDuration::Short: return "short";
        case LoadDuration::VeryShort: return "very_short";
        default: return "long";
    }
}

TimberExposure parse_timber_exposure(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "dry") return TimberExposure::Dry;
    if (key == "wet") return TimberExposure::Wet;
    throw ValidationError(ErrorInfo::malformed_field("timber_exposure", name, "dry or wet"));
}

LoadDuration parse_load_duration(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "long" || key == "long_term" || key == "long-term") return LoadDuration::Long;
    if (key == "medium" || key == "medium_term" || key == "medium-term") return LoadDuration::Medium;
    if (key == "short" || key == "short_term" || key == "short-term") return LoadDuration::Short;
    if (key == "very_short" || key == "very short" || key == "very-short") return LoadDuration::VeryShort;
    throw ValidationError(ErrorInfo::malformed_field("load_duration", name,
                                                     "long, medium, short or very_short"));
}

double TimberModification::k3() const {
    switch (duration) {
        case LoadDuration::Long: return 1.0;
        case LoadDuration::Medium: return 1.25;
        case LoadDuration::Short: return 1.5;
        case LoadDuration::VeryShort: return 1.75;
        default: return 1.0;
    }
}

std::string section_class_to_string(SectionClass cls) {
    switch (cls) {
        case SectionClass::Compact: return "Compact";
        case SectionClass::NonCompact: return "Non-compact";
        default: return "N/A";
    }
}

SectionClass CapacityEngine::classify(const SteelSection& section, double fy) {
    const double epsilon = std::sqrt(275.0 / fy);
    const bool flange_ok = section.flange_ratio() <= section.flange_limit_coefficient() * epsilon;
    const bool web_ok = section.web_ratio() <= SteelSection::web_limit_coefficient * epsilon;
    return (flange_ok && web_ok) ? SectionClass::Compact : SectionClass::NonCompact;
}

CapacityResult CapacityEngine::capacity(const MaterialSpec& material,
                                        const SectionGeometry& geometry,
                                        const CapacityParameters& params) {
    if (!std::isfinite(params.condition_factor) ||
        params.condition_factor <= 0.0 || params.condition_factor > 1.0) {
        throw ValidationError(ErrorInfo::out_of_range(
            "condition_factor", params.condition_factor, "in the range (0, 1]"));
    }
    if (!std::isfinite(params.slenderness_factor) ||
        params.slenderness_factor <= 0.0 || params.slenderness_factor > 1.0) {
        throw ValidationError(ErrorInfo::out_of_range(
            "slenderness_factor", params.slenderness_factor, "in the range (0, 1]"));
    }

    CapacityResult result;

    if (material.kind == MaterialKind::Steel) {
        if (const auto* section = std::get_if<SteelSection>(&geometry)) {
            steel_capacity(material, *section, params, result);
        } else {
            throw UnsupportedMaterialError(
                "Steel capacity requires an I or box section", "material");
        }
    } else if (material.kind == MaterialKind::Concrete) {
        if (const auto* section = std::get_if<ConcreteSection>(&geometry)) {
            concrete_capacity(material, *section, params, result);
        } else {
            throw UnsupportedMaterialError(
                "Concrete capacity requires a rectangular reinforced section", "material");
        }
    } else if (material.kind == MaterialKind::Timber) {
        if (const auto* section = std::get_if<TimberSection>(&geometry)) {
            timber_capacity(material, *section, params, result);
        } else {
            throw UnsupportedMaterialError(
                "Timber capacity requires a rectangular timber section", "material");
        }
    } else {
        throw UnsupportedMaterialError("No capacity method for material", "material");
    }

    result.moment_capacity = result.moment_unfactored * params.condition_factor;
    result.shear_capacity = result.shear_unfactored * params.condition_factor;
    return result;
}

CapacityResult CapacityEngine::capacity(const MaterialSpec& material,
                                        const SectionGeometry& geometry,
                                        double condition_factor,
                                        const SafetyFactors& safety,
                                        double slenderness_factor) {
    CapacityParameters params;
    params.condition_factor = condition_factor;
    params.safety = safety;
    params.slenderness_factor = slenderness_factor;
    return capacity(material, geometry, params);
}

void CapacityEngine::steel_capacity(const MaterialSpec& material, const SteelSection& section,
                                    const CapacityParameters& params, CapacityResult& result) {
    require_positive(params.safety.steel, "safety_factor_steel");

    result.section_class = classify(section, material.fy);
    result.section_modulus =
        result.section_class == SectionClass::Compact ? section.Zpl : section.Zel;
    result.design_strength = material.fy / params.safety.steel;
    result.shear_strength = 0.6 * material.fy / params.safety.steel;
    result.method = result.section_class == SectionClass::Compact
        ? "Limit state, plastic modulus"
        : "Limit state, elastic modulus";

    // mm³ * N/mm² = N·mm -> kN·m ; mm² * N/mm² = N -> kN
    result.moment_unfactored =
        result.section_modulus * result.design_strength * params.slenderness_factor / 1.0e6;
    result.shear_unfactored = section.Av * result.shear_strength / 1.0e3;
}

void CapacityEngine::concrete_capacity(const MaterialSpec& material,
                                       const ConcreteSection& section,
                                       const CapacityParameters& params,
                                       CapacityResult& result) {
    require_positive(params.safety.concrete, "safety_factor_concrete");
    require_positive(params.safety.reinforcement, "safety_factor_reinforcement");
    require_positive(params.reinforcement_strength, "rebar_strength");

    const double b = section.dims.width;
    const double d = section.effective_depth;
    const double fcd = alpha_cc * material.fck / params.safety.concrete;
    const double fyd = params.reinforcement_strength / params.safety.reinforcement;

    // Force equilibrium: fcd * b * a = As * fyd
    double tension = section.As * fyd;  // [N]
    double block = tension / (fcd * b);
    double neutral_axis = block / block_ratio;

    const double x_limit = neutral_axis_limit * d;
    if (neutral_axis > x_limit) {
        // Reinforcement beyond the balanced area does not yield; concrete governs
        result.over_reinforced = true;
        neutral_axis = x_limit;
        block = block_ratio * x_limit;
        tension = fcd * b * block;
    }

    const double lever_arm = std::min(d - block / 2.0, lever_arm_limit * d);

    result.method = "Ultimate flexure, rectangular stress block";
    result.design_strength = fcd;
    result.tensile_force = tension / 1.0e3;
    result.compression_block = block;
    result.neutral_axis = neutral_axis;
    result.lever_arm = lever_arm;
    result.moment_unfactored = tension * lever_arm / 1.0e6;

    // Concrete shear resistance without shear reinforcement
    const double k = std::min(1.0 + std::sqrt(200.0 / d), 2.0);
    const double rho = std::min(section.As / (b * d), 0.02);
    const double c_rd = 0.18 / params.safety.concrete;
    const double v_code = c_rd * k * std::cbrt(100.0 * rho * material.fck);
    const double v_min = 0.035 * std::pow(k, 1.5) * std::sqrt(material.fck);
    result.concrete_shear_stress = std::max(v_code, v_min);
    result.shear_unfactored = result.concrete_shear_stress * b * d / 1.0e3;
}

void CapacityEngine::timber_capacity(const MaterialSpec& material, const TimberSection& section,
                                     const CapacityParameters& params, CapacityResult& result) {
    require_positive(params.safety.timber, "safety_factor_timber");

    const TimberModification& mod = params.timber;
    result.method = "Permissible stress";
    result.permissible_bending =
        material.bending_stress * mod.k2_bending() * mod.k3() / params.safety.timber;
    result.permissible_shear =
        material.shear_stress * mod.k2_shear() * mod.k3() / params.safety.timber;
    result.section_modulus = section.Z;

    result.moment_unfactored = result.permissible_bending * section.Z / 1.0e6;
    // Peak shear stress on a rectangle is 1.5 V / A
    result.shear_unfactored = 2.0 / 3.0 * result.permissible_shear * section.A / 1.0e3;
}

} // namespace spancheck
