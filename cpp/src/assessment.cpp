#include "spancheck/assessment.hpp"

#include <sstream>
#include <type_traits>

namespace spancheck {

std::string assessment_state_to_string(AssessmentState state) {
    switch (state) {
        case AssessmentState::Validating: return "Validating";
        case AssessmentState::Resolving:  return "Resolving";
        case AssessmentState::Combining:  return "Combining";
        case AssessmentState::Comparing:  return "Comparing";
        case AssessmentState::Done:       return "Done";
        case AssessmentState::Failed:     return "Failed";
        default: return "Unknown";
    }
}

namespace {

constexpr double kHighUtilisation = 0.95;
constexpr double kLowConditionFactor = 0.5;

void log_section(const SectionGeometry& geometry, CalculationLog& log) {
    std::visit([&log](const auto& section) {
        using T = std::decay_t<decltype(section)>;
        if constexpr (std::is_same_v<T, SteelSection>) {
            log.note("Steel section shape",
                     section.dims.shape == SteelShape::Box ? "Box" : "I");
            log.add("Section area A", section.A, "mm²");
            log.add("Second moment of area Iy", section.Iy, "mm⁴");
            log.add("Elastic section modulus Zel", section.Zel, "mm³");
            log.add("Plastic section modulus Zpl", section.Zpl, "mm³");
            log.add("Shear area Av", section.Av, "mm²");
            log.add("Radius of gyration ry", section.ry, "mm");
        } else if constexpr (std::is_same_v<T, ConcreteSection>) {
            log.add("Section area A", section.A, "mm²");
            log.add("Reinforcement area As", section.As, "mm²");
            log.add("Weighted cover to reinforcement", section.weighted_cover, "mm");
            log.add("Effective depth d", section.effective_depth, "mm");
        } else {
            log.add("Section area A", section.A, "mm²");
            log.add("Section modulus Z = b·h²/6", section.Z, "mm³");
        }
    }, geometry);
}

void log_capacity(MaterialKind kind, const CapacityResult& capacity, CalculationLog& log) {
    log.note("Capacity method", capacity.method);
    switch (kind) {
        case MaterialKind::Steel:
            log.note("Section class", section_class_to_string(capacity.section_class));
            log.add("Section modulus used", capacity.section_modulus, "mm³");
            log.add("Design strength fy/γm", capacity.design_strength, "N/mm²");
            log.add("Shear strength 0.6·fy/γm", capacity.shear_strength, "N/mm²");
            break;
        case MaterialKind::Concrete:
            log.add("Tensile force T", capacity.tensile_force, "kN");
            log.add("Compression block depth a", capacity.compression_block, "mm");
            log.add("Neutral axis depth x", capacity.neutral_axis, "mm");
            log.add("Lever arm z", capacity.lever_arm, "mm");
            log.add("Concrete shear stress vRd,c", capacity.concrete_shear_stress, "N/mm²");
            break;
        case MaterialKind::Timber:
            log.add("Permissible bending stress", capacity.permissible_bending, "N/mm²");
            log.add("Permissible shear stress", capacity.permissible_shear, "N/mm²");
            break;
    }
    log.add("Moment capacity before condition factor", capacity.moment_unfactored, "kNm");
    log.add(kind == MaterialKind::Concrete ? "Shear capacity vRd,c·b·d before condition factor"
                                           : "Shear capacity before condition factor",
            capacity.shear_unfactored, "kN");
}

double utilisation(double demand, double capacity) {
    return capacity > 0.0 ? demand / capacity : 0.0;
}

std::string describe_loads(const std::vector<LoadCase>& loads) {
    std::ostringstream oss;
    for (size_t i = 0; i < loads.size(); ++i) {
        const LoadCase& load = loads[i];
        if (i > 0) oss << "; ";
        oss << load.description() << ": " << format_number(load.magnitude()) << " "
            << load.unit() << " (" << load_type_to_string(load.type());
        if (!load.material().empty()) {
            oss << ", " << load.material();
        }
        oss << ", " << load_distribution_to_string(load.distribution()) << ")";
    }
    return oss.str();
}

} // namespace

AssessmentOutcome AssessmentEngine::assess(const ParameterSet& params) {
    AssessmentEngine engine;
    return engine.run(params);
}

AssessmentOutcome AssessmentEngine::run(const ParameterSet& params) {
    state_ = AssessmentState::Validating;
    try {
        AssessmentInput input = parse_assessment_input(params);
        return run(input);
    } catch (const AssessmentError& e) {
        return fail(e.info());
    } catch (const std::exception& e) {
        return fail(ErrorInfo(ErrorCode::UNKNOWN_ERROR, e.what()));
    }
}

AssessmentOutcome AssessmentEngine::run(const AssessmentInput& input) {
    state_ = AssessmentState::Validating;
    AssessmentOutcome outcome;
    try {
        validate(input, outcome);
        return execute(input, std::move(outcome));
    } catch (const AssessmentError& e) {
        return fail(e.info());
    } catch (const std::exception& e) {
        return fail(ErrorInfo(ErrorCode::UNKNOWN_ERROR, e.what()));
    }
}

AssessmentOutcome AssessmentEngine::fail(ErrorInfo error) {
    failed_in_ = state_;
    state_ = AssessmentState::Failed;

    AssessmentOutcome outcome;
    outcome.error = std::move(error);
    return outcome;
}

void AssessmentEngine::validate(const AssessmentInput& input, AssessmentOutcome& outcome) const {
    if (input.span_length <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("span_length", input.span_length,
                                                      "greater than 0"));
    }
    if (input.effective_member_length <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range(
            "effective_member_length", input.effective_member_length, "greater than 0"));
    }
    if (input.condition_factor <= 0.0 || input.condition_factor > 1.0) {
        throw ValidationError(ErrorInfo::out_of_range("condition_factor", input.condition_factor,
                                                      "within (0, 1]"));
    }
    if (input.dead_load < 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("dead_load", input.dead_load, "at least 0"));
    }
    if (input.live_load < 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("live_load", input.live_load, "at least 0"));
    }
    if (input.load_factors.dead <= 0.0 || input.load_factors.live <= 0.0) {
        const bool dead = input.load_factors.dead <= 0.0;
        throw ValidationError(ErrorInfo::out_of_range(
            dead ? "dead_load_factor" : "live_load_factor",
            dead ? input.load_factors.dead : input.load_factors.live, "greater than 0"));
    }

    CalculationLog& log = outcome.log;
    log.note("Bridge type", bridge_type_to_string(input.bridge_type));
    log.add("Span length L", input.span_length, "m");
    log.note("Material", material_kind_to_string(input.material) + " " + input.grade);
    log.add("Condition factor", input.condition_factor);

    if (input.condition_factor < kLowConditionFactor) {
        outcome.warnings.add(AssessmentWarning::low_condition_factor(input.condition_factor));
    }
    if (input.material == MaterialKind::Steel) {
        const EffectiveLengthFactors& k = input.restraint;
        if (k.k1 < EffectiveLengthFactors::k1_min || k.k1 > EffectiveLengthFactors::k1_max) {
            outcome.warnings.add(AssessmentWarning::restraint_factor(
                "k1", k.k1, EffectiveLengthFactors::k1_min, EffectiveLengthFactors::k1_max));
        }
        if (k.k2 < EffectiveLengthFactors::k2_min || k.k2 > EffectiveLengthFactors::k2_max) {
            outcome.warnings.add(AssessmentWarning::restraint_factor(
                "k2", k.k2, EffectiveLengthFactors::k2_min, EffectiveLengthFactors::k2_max));
        }
    }
}

AssessmentOutcome AssessmentEngine::execute(const AssessmentInput& input, AssessmentOutcome outcome) {
    CalculationLog& log = outcome.log;
    AssessmentResult result;
    result.span_length = input.span_length;
    result.additional_loads = input.additional_loads;

    // Resolving
    state_ = AssessmentState::Resolving;
    const MaterialSpec& material = MaterialCatalog::resolve(input.material, input.grade);
    switch (material.kind) {
        case MaterialKind::Steel:
            log.add("Yield strength fy", material.fy, "N/mm²");
            break;
        case MaterialKind::Concrete:
            log.add("Characteristic cylinder strength fck", material.fck, "N/mm²");
            log.add("Reinforcement strength fyk", input.reinforcement_strength, "N/mm²");
            break;
        case MaterialKind::Timber:
            log.add("Grade bending stress", material.bending_stress, "N/mm²");
            log.add("Grade shear stress", material.shear_stress, "N/mm²");
            break;
    }

    const SectionGeometry geometry = derive_section(input.material, input.dimensions);
    log_section(geometry, log);

    const EffectiveLengthResult length = EffectiveLengthResolver::resolve(
        input.effective_member_length, input.restraint, material, geometry);
    result.effective_member_length = length.effective_length;
    result.reduction_factor = length.reduction_factor;
    if (input.material == MaterialKind::Steel) {
        log.add("Effective length Le = k1·k2·L (k1 = " + format_number(input.restraint.k1) +
                ", k2 = " + format_number(input.restraint.k2) + ")",
                length.effective_length, "m");
        log.add("Slenderness λ", length.slenderness);
        if (length.beyond_curve) {
            outcome.warnings.add(AssessmentWarning::slenderness_beyond_curve(
                length.slenderness, length.reduction_factor));
        }
    } else {
        log.add("Effective length Le", length.effective_length, "m");
    }
    log.add("Reduction factor", length.reduction_factor);

    // Combining
    state_ = AssessmentState::Combining;
    HighwayLoadParameters highway_params = input.highway;
    highway_params.span_length = input.span_length;
    const HighwayLoad highway = HighwayLoadModel::compute(highway_params);
    result.loading_type = highway.type;
    result.highway_udl = highway.udl;
    result.highway_kel = highway.kel;
    result.notional_lanes = highway.notional_lanes;

    const std::string loading = loading_type_to_string(highway.type);
    log.add("Notional lanes", highway.notional_lanes);
    log.add("Access multiplier (" + access_type_to_string(highway_params.access) + ")",
            highway.multiplier);
    log.add(loading + " intensity per lane", highway.lane_intensity, "kN/m");
    log.add(loading + " UDL", highway.udl, "kN/m");
    if (highway.type == LoadingType::HA) {
        log.add("HA KEL", highway.kel, "kN");
    }

    const VehicleEnvelope vehicle =
        VehicleLoadEnvelope::max_envelope(input.span_length, input.vehicle, input.bridge_type);
    if (input.vehicle) {
        log.note("Vehicle", input.vehicle->name + ", " +
                 load_sharing_to_string(input.vehicle->sharing));
        log.add("Scaled front axle load", vehicle.front_load, "kN");
        log.add("Scaled rear axle load", vehicle.rear_load, "kN");
        log.add("Governing axle position", vehicle.critical_position, "m");
        log.add("Vehicle maximum moment", vehicle.max_moment, "kNm");
        log.add("Vehicle maximum shear", vehicle.max_shear, "kN");
        if (vehicle.single_axle_governs) {
            outcome.warnings.add(AssessmentWarning::single_axle_governs(
                vehicle.max_moment, vehicle.axle_pair_moment));
        }
        result.vehicle_moment = vehicle.max_moment;
        result.vehicle_shear = vehicle.max_shear;
        result.vehicle_position = vehicle.critical_position;
    }

    std::vector<LoadCase> load_cases;
    load_cases.reserve(input.additional_loads.size() + 2);
    load_cases.emplace_back("Dead load", input.dead_load, LoadType::Dead);
    load_cases.emplace_back("Live load", input.live_load, LoadType::Live);
    load_cases.insert(load_cases.end(), input.additional_loads.begin(),
                      input.additional_loads.end());

    double self_weight = 0.0;
    if (input.include_self_weight) {
        // mm² to m² times kN/m³
        self_weight = section_area(geometry) / 1.0e6 * material.unit_weight;
        log.add("Self weight", self_weight, "kN/m");
    }

    const DemandSummary demand = LoadCombinator::combine(
        input.bridge_type, input.span_length, load_cases, highway, vehicle,
        input.load_factors, self_weight);

    for (const LoadContribution& c : demand.contributions) {
        log.add(c.description + " moment (" + load_type_to_string(c.type) + ")",
                c.effect.moment, "kNm");
    }
    if (input.include_self_weight) {
        log.add("Self weight moment", demand.self_weight_moment, "kNm");
        result.self_weight_moment = demand.self_weight_moment;
    }
    log.add(loading + " moment", demand.highway_moment, "kNm");
    log.add("Dead load moment", demand.dead_moment, "kNm");
    log.add("Live load moment", demand.live_moment, "kNm");
    log.add("Dead load shear", demand.dead_shear, "kN");
    log.add("Live load shear", demand.live_shear, "kN");
    log.add("Total moment demand (γd = " + format_number(input.load_factors.dead) +
            ", γl = " + format_number(input.load_factors.live) + ")",
            demand.total_moment, "kNm");
    log.add("Total shear demand", demand.total_shear, "kN");

    result.dead_moment = demand.dead_moment;
    result.live_moment = demand.live_moment;
    result.dead_shear = demand.dead_shear;
    result.live_shear = demand.live_shear;
    result.total_moment = demand.total_moment;
    result.total_shear = demand.total_shear;

    // Comparing
    state_ = AssessmentState::Comparing;
    CapacityParameters params;
    params.condition_factor = input.condition_factor;
    params.safety = input.safety;
    params.slenderness_factor = length.reduction_factor;
    params.timber = input.timber;
    params.reinforcement_strength = input.reinforcement_strength;

    const CapacityResult capacity = CapacityEngine::capacity(material, geometry, params);
    log_capacity(material.kind, capacity, log);

    if (capacity.section_class == SectionClass::NonCompact) {
        const auto& steel = std::get<SteelSection>(geometry);
        outcome.warnings.add(AssessmentWarning::slender_steel_section(
            steel.flange_ratio(), steel.web_ratio()));
    }
    if (capacity.over_reinforced) {
        const auto& concrete = std::get<ConcreteSection>(geometry);
        outcome.warnings.add(AssessmentWarning::over_reinforced(
            capacity.neutral_axis, 0.45 * concrete.effective_depth));
    }

    result.moment_capacity = capacity.moment_capacity;
    result.shear_capacity = capacity.shear_capacity;
    result.section_class = capacity.section_class;
    result.moment_utilisation = utilisation(result.total_moment, result.moment_capacity);
    result.shear_utilisation = utilisation(result.total_shear, result.shear_capacity);
    result.pass = result.moment_capacity >= result.total_moment &&
                  result.shear_capacity >= result.total_shear;

    log.add("Moment capacity", result.moment_capacity, "kNm");
    log.add("Shear capacity", result.shear_capacity, "kN");
    log.add("Moment utilisation", result.moment_utilisation);
    log.add("Shear utilisation", result.shear_utilisation);
    log.note("Result", result.pass ? "Pass" : "Fail");

    if (result.moment_utilisation > kHighUtilisation && result.moment_utilisation <= 1.0) {
        outcome.warnings.add(AssessmentWarning::high_utilisation("Moment", result.moment_utilisation));
    }
    if (result.shear_utilisation > kHighUtilisation && result.shear_utilisation <= 1.0) {
        outcome.warnings.add(AssessmentWarning::high_utilisation("Shear", result.shear_utilisation));
    }

    outcome.result = std::move(result);
    state_ = AssessmentState::Done;
    return outcome;
}

std::vector<std::pair<std::string, std::string>> AssessmentOutcome::to_fields() const {
    std::vector<std::pair<std::string, std::string>> fields;
    if (!result) {
        fields.emplace_back("Error", error ? error->message : "Assessment did not complete");
        return fields;
    }

    const AssessmentResult& r = *result;
    fields.emplace_back("Moment Capacity (kNm)", format_number(r.moment_capacity));
    fields.emplace_back("Shear Capacity (kN)", format_number(r.shear_capacity));
    fields.emplace_back("Applied Dead Load Moment (kNm)", format_number(r.dead_moment));
    fields.emplace_back("Applied Live Load Moment (kNm)", format_number(r.live_moment));
    if (r.self_weight_moment) {
        fields.emplace_back("Self Weight Moment (kNm)", format_number(*r.self_weight_moment));
    }
    if (r.vehicle_moment) {
        fields.emplace_back("Vehicle Maximum Moment (kNm)", format_number(*r.vehicle_moment));
        fields.emplace_back("Vehicle Maximum Shear (kN)", format_number(*r.vehicle_shear));
    }
    fields.emplace_back("Span Length (m)", format_number(r.span_length));
    fields.emplace_back("Effective Member Length (m)", format_number(r.effective_member_length));
    fields.emplace_back("Reduction Factor", format_number(r.reduction_factor));

    const std::string loading = loading_type_to_string(r.loading_type);
    fields.emplace_back("Loading Type", loading);
    fields.emplace_back(loading + " UDL (kN/m)", format_number(r.highway_udl));
    fields.emplace_back("Additional Loads", describe_loads(r.additional_loads));
    fields.emplace_back("Calculation Process", log.to_text());

    fields.emplace_back("Total Moment Demand (kNm)", format_number(r.total_moment));
    fields.emplace_back("Total Shear Demand (kN)", format_number(r.total_shear));
    fields.emplace_back("Moment Utilisation", format_number(r.moment_utilisation));
    fields.emplace_back("Shear Utilisation", format_number(r.shear_utilisation));
    if (r.section_class != SectionClass::NotApplicable) {
        fields.emplace_back("Section Class", section_class_to_string(r.section_class));
    }
    fields.emplace_back("Result", r.pass ? "Pass" : "Fail");
    return fields;
}

} // namespace spancheck
