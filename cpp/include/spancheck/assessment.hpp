#pragma once

#include "spancheck/beam_actions.hpp"
#include "spancheck/calculation_log.hpp"
#include "spancheck/capacity.hpp"
#include "spancheck/effective_length.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/highway_load.hpp"
#include "spancheck/load_case.hpp"
#include "spancheck/material.hpp"
#include "spancheck/parameters.hpp"
#include "spancheck/section.hpp"
#include "spancheck/vehicle_envelope.hpp"
#include "spancheck/warnings.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spancheck {

/**
 * @brief Everything needed for one assessment
 *
 * Constructed once per request and read-only thereafter. The section
 * dimensions alternative must match the material kind.
 */
struct AssessmentInput {
    BridgeType bridge_type = BridgeType::SimplySupported;
    double span_length = 0.0;                ///< [m]
    double effective_member_length = 0.0;    ///< Unrestrained length [m]

    MaterialKind material = MaterialKind::Steel;
    std::string grade;
    SectionDimensions dimensions;
    EffectiveLengthFactors restraint;        ///< Steel only
    TimberModification timber;               ///< Timber only
    double reinforcement_strength = 500.0;   ///< Concrete only [N/mm²]

    HighwayLoadParameters highway;           ///< Its span_length is replaced by the member span

    double condition_factor = 1.0;
    SafetyFactors safety;
    LoadFactors load_factors;

    double dead_load = 0.0;                  ///< Base dead UDL [kN/m]
    double live_load = 0.0;                  ///< Base live UDL [kN/m]
    std::vector<LoadCase> additional_loads;  ///< In presentation order
    bool include_self_weight = false;

    std::optional<VehicleSpec> vehicle;
};

/**
 * @brief Numeric results of a completed assessment
 */
struct AssessmentResult {
    double moment_capacity = 0.0;            ///< [kN·m]
    double shear_capacity = 0.0;             ///< [kN]
    double dead_moment = 0.0;                ///< Unfactored dead bucket [kN·m]
    double live_moment = 0.0;                ///< Unfactored live bucket [kN·m]
    double dead_shear = 0.0;                 ///< [kN]
    double live_shear = 0.0;                 ///< [kN]
    double total_moment = 0.0;               ///< Factored total demand [kN·m]
    double total_shear = 0.0;                ///< Factored total demand [kN]
    std::optional<double> self_weight_moment;///< Present when self weight was included
    std::optional<double> vehicle_moment;    ///< Present when a vehicle was specified
    std::optional<double> vehicle_shear;     ///< Present when a vehicle was specified
    std::optional<double> vehicle_position;  ///< Governing axle position [m]
    double span_length = 0.0;
    double effective_member_length = 0.0;    ///< Le [m]
    double reduction_factor = 1.0;
    LoadingType loading_type = LoadingType::HA;
    double highway_udl = 0.0;                ///< [kN/m]
    double highway_kel = 0.0;                ///< [kN]
    int notional_lanes = 1;
    double moment_utilisation = 0.0;         ///< total_moment / moment_capacity
    double shear_utilisation = 0.0;          ///< total_shear / shear_capacity
    SectionClass section_class = SectionClass::NotApplicable;
    std::vector<LoadCase> additional_loads;
    bool pass = false;
};

/**
 * @brief Outcome of one assessment: either a result or an error
 *
 * On failure only the error is set; result, narrative and warnings are empty.
 */
struct AssessmentOutcome {
    std::optional<AssessmentResult> result;
    std::optional<ErrorInfo> error;
    CalculationLog log;
    WarningList warnings;

    bool ok() const { return result.has_value(); }
    bool passed() const { return result.has_value() && result->pass; }

    /**
     * @brief Named output fields in presentation order
     *
     * Field names are consumed verbatim by the presentation layer.
     * On error only the "Error" field is produced.
     */
    std::vector<std::pair<std::string, std::string>> to_fields() const;
};

/**
 * @brief Assessment state machine states
 */
enum class AssessmentState {
    Validating,
    Resolving,
    Combining,
    Comparing,
    Done,
    Failed
};

std::string assessment_state_to_string(AssessmentState state);

/**
 * @brief Orchestrates one member assessment
 *
 * Runs Validating -> Resolving -> Combining -> Comparing -> Done, or
 * Failed on the first error. Every stage appends to the calculation
 * narrative in execution order. No exception escapes run().
 *
 * Usage:
 *   AssessmentEngine engine;
 *   AssessmentOutcome outcome = engine.run(params);
 *   if (outcome.ok()) {
 *       bool pass = outcome.result->pass;
 *       std::string narrative = outcome.log.to_text();
 *   } else {
 *       std::string message = outcome.error->message;
 *   }
 */
class AssessmentEngine {
public:
    AssessmentEngine() = default;

    /**
     * @brief Assess from flat parameters (parsing is part of validation)
     */
    AssessmentOutcome run(const ParameterSet& params);

    /**
     * @brief Assess a typed input
     */
    AssessmentOutcome run(const AssessmentInput& input);

    /**
     * @brief State reached by the last run (Done or Failed after run())
     */
    AssessmentState state() const { return state_; }

    /**
     * @brief State in which the last run failed (meaningful when state() == Failed)
     */
    AssessmentState failed_in() const { return failed_in_; }

    /**
     * @brief Convenience: fresh engine, single run
     */
    static AssessmentOutcome assess(const ParameterSet& params);

private:
    AssessmentState state_ = AssessmentState::Validating;
    AssessmentState failed_in_ = AssessmentState::Validating;

    void validate(const AssessmentInput& input, AssessmentOutcome& outcome) const;
    AssessmentOutcome execute(const AssessmentInput& input, AssessmentOutcome outcome);
    AssessmentOutcome fail(ErrorInfo error);
};

} // namespace spancheck
