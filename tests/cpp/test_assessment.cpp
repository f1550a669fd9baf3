/**
 * @file test_assessment.cpp
 * @brief End-to-end assessment scenarios and engine properties
 *
 * Tests include:
 * - Steel, concrete and vehicle scenarios
 * - Error outcomes carry no numeric results
 * - Idempotence, layer order independence and pass/fail equivalence
 */

#include <catch2/catch.hpp>

#include "spancheck/assessment.hpp"

#include <algorithm>
#include <string>

using namespace spancheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

ParameterSet steel_params() {
    return {
        {"bridge_type", "Simply Supported"},
        {"span_length", "20"},
        {"material", "Steel"},
        {"grade", "S355"},
        {"flange_width", "300"},
        {"flange_thickness", "20"},
        {"web_thickness", "10"},
        {"beam_depth", "640"},
        {"k1", "1.0"},
        {"k2", "1.0"},
        {"loading_type", "HA"},
        {"loaded_width", "7.3"},
        {"lane_width", "3.65"},
        {"access_type", "Public"},
        {"condition_factor", "1.0"},
    };
}

ParameterSet concrete_params() {
    return {
        {"bridge_type", "Simply Supported"},
        {"span_length", "10"},
        {"material", "Concrete"},
        {"grade", "C32/40"},
        {"beam_width", "300"},
        {"beam_depth", "600"},
        {"rebar_count_1", "4"},
        {"rebar_diameter_1", "25"},
        {"rebar_cover_1", "50"},
        {"loading_type", "HB"},
        {"hb_units", "1"},
        {"loaded_width", "3.65"},
        {"lane_width", "3.65"},
        {"access_type", "Company"},
        {"condition_factor", "1.0"},
    };
}

ParameterSet light_timber_params() {
    return {
        {"bridge_type", "Simply Supported"},
        {"span_length", "4"},
        {"material", "Timber"},
        {"grade", "D50"},
        {"beam_width", "300"},
        {"beam_depth", "600"},
        {"loading_type", "HB"},
        {"hb_units", "0.5"},
        {"loaded_width", "3.65"},
        {"lane_width", "3.65"},
        {"access_type", "Company"},
        {"condition_factor", "1.0"},
    };
}

std::string field(const AssessmentOutcome& outcome, const std::string& name) {
    for (const auto& [key, value] : outcome.to_fields()) {
        if (key == name) return value;
    }
    return "<absent>";
}

bool has_field(const AssessmentOutcome& outcome, const std::string& name) {
    return field(outcome, name) != "<absent>";
}

} // namespace

// =============================================================================
// Scenarios
// =============================================================================

TEST_CASE("Scenario A: steel girder under HA loading", "[Assessment][scenario][steel]") {
    AssessmentEngine engine;
    AssessmentOutcome outcome = engine.run(steel_params());

    REQUIRE(outcome.ok());
    REQUIRE(engine.state() == AssessmentState::Done);
    const AssessmentResult& r = *outcome.result;

    // 20 m unrestrained length is beyond the slenderness curve
    REQUIRE(r.reduction_factor == 0.17);
    REQUIRE(outcome.warnings.contains(WarningCode::SLENDERNESS_BEYOND_CURVE));
    REQUIRE(r.section_class == SectionClass::Compact);
    REQUIRE_THAT(r.moment_capacity, WithinAbs(265.54, 1e-6));
    REQUIRE(r.moment_capacity > 0.0);

    REQUIRE(r.notional_lanes == 2);
    REQUIRE_THAT(r.highway_udl, WithinRel(135.447326, 1e-6));
    REQUIRE_THAT(r.live_moment, WithinRel(8572.3663, 1e-6));
    REQUIRE(r.dead_moment == 0.0);
    REQUIRE_FALSE(r.pass);

    REQUIRE(field(outcome, "Loading Type") == "HA");
    REQUIRE(field(outcome, "HA UDL (kN/m)") == "135.45");
    REQUIRE(field(outcome, "Span Length (m)") == "20.00");
    REQUIRE(field(outcome, "Effective Member Length (m)") == "20.00");
    REQUIRE(field(outcome, "Reduction Factor") == "0.17");
    REQUIRE(field(outcome, "Section Class") == "Compact");
    REQUIRE(field(outcome, "Result") == "Fail");
    REQUIRE_FALSE(has_field(outcome, "Vehicle Maximum Moment (kNm)"));
    REQUIRE_FALSE(has_field(outcome, "Self Weight Moment (kNm)"));
}

TEST_CASE("Scenario B: reinforced concrete beam under HB loading", "[Assessment][scenario][concrete]") {
    AssessmentOutcome outcome = AssessmentEngine::assess(concrete_params());

    REQUIRE(outcome.ok());
    const AssessmentResult& r = *outcome.result;
    REQUIRE_THAT(r.moment_capacity, WithinRel(411.4782, 1e-6));
    REQUIRE_THAT(r.shear_capacity, WithinRel(123.2115, 1e-6));
    REQUIRE(r.reduction_factor == 1.0);
    REQUIRE(r.section_class == SectionClass::NotApplicable);

    // 1 HB unit on one lane, company access: 13 kN/m
    REQUIRE_THAT(r.highway_udl, WithinAbs(13.0, 1e-9));
    REQUIRE_THAT(r.live_moment, WithinAbs(162.5, 1e-9));
    REQUIRE_THAT(r.live_shear, WithinAbs(65.0, 1e-9));
    REQUIRE(r.pass);

    REQUIRE(field(outcome, "Loading Type") == "HB");
    REQUIRE(field(outcome, "HB UDL (kN/m)") == "13.00");
    REQUIRE(field(outcome, "Moment Capacity (kNm)") == "411.48");
    REQUIRE(field(outcome, "Result") == "Pass");
    REQUIRE_FALSE(has_field(outcome, "Section Class"));

    // Concrete shear acts on b·d, and the narrative says so
    const auto& steps = outcome.log.steps();
    auto shear = std::find_if(steps.begin(), steps.end(), [](const CalculationStep& s) {
        return s.label == "Shear capacity vRd,c·b·d before condition factor";
    });
    REQUIRE(shear != steps.end());
    REQUIRE_THAT(*shear->value, WithinRel(123.2115, 1e-6));
}

TEST_CASE("Scenario C: 18 tonne vehicle on a 12 m span", "[Assessment][scenario][vehicle]") {
    ParameterSet params = concrete_params();
    params["span_length"] = "12";
    params["vehicle_type"] = "18 tonne";
    params["axle_spacing"] = "3.0";
    params["impact_factor"] = "1.3";
    params["load_sharing"] = "per_beam";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE(outcome.ok());
    const AssessmentResult& r = *outcome.result;

    REQUIRE(r.vehicle_moment.has_value());
    REQUIRE_THAT(*r.vehicle_moment, WithinRel(285.57034, 1e-6));
    REQUIRE_THAT(*r.vehicle_shear, WithinAbs(104.65, 1e-9));
    REQUIRE_THAT(*r.vehicle_position, WithinRel(5.457627, 1e-6));

    // Vehicle joins the live bucket with the HB loading
    const double hb_moment = 13.0 * 144.0 / 8.0;
    REQUIRE_THAT(r.live_moment, WithinRel(hb_moment + 285.57034, 1e-6));

    REQUIRE(field(outcome, "Vehicle Maximum Moment (kNm)") == "285.57");
    REQUIRE(field(outcome, "Vehicle Maximum Shear (kN)") == "104.65");
}

TEST_CASE("Scenario D: unknown material yields only an error", "[Assessment][scenario][errors]") {
    ParameterSet params = steel_params();
    params["material"] = "Composite";

    AssessmentEngine engine;
    AssessmentOutcome outcome = engine.run(params);

    REQUIRE_FALSE(outcome.ok());
    REQUIRE_FALSE(outcome.passed());
    REQUIRE(outcome.error.has_value());
    REQUIRE(outcome.error->code == ErrorCode::UNKNOWN_MATERIAL);
    REQUIRE(outcome.log.empty());
    REQUIRE_FALSE(outcome.warnings.has_warnings());
    REQUIRE(engine.state() == AssessmentState::Failed);
    REQUIRE(engine.failed_in() == AssessmentState::Validating);

    auto fields = outcome.to_fields();
    REQUIRE(fields.size() == 1);
    REQUIRE(fields[0].first == "Error");
    REQUIRE(fields[0].second.find("Composite") != std::string::npos);
}

TEST_CASE("Scenario E: axle spacing longer than the span", "[Assessment][scenario][errors]") {
    ParameterSet params = concrete_params();
    params["span_length"] = "3";
    params["vehicle_type"] = "custom";
    params["front_axle_load"] = "50";
    params["rear_axle_load"] = "50";
    params["axle_spacing"] = "3.5";
    params["impact_factor"] = "1.0";

    AssessmentEngine engine;
    AssessmentOutcome outcome = engine.run(params);

    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.error->code == ErrorCode::INVALID_VEHICLE_SPACING);
    REQUIRE(outcome.error->field == "axle_spacing");
    REQUIRE(engine.failed_in() == AssessmentState::Combining);
    REQUIRE(outcome.log.empty());
    REQUIRE(outcome.to_fields().size() == 1);
}

TEST_CASE("Unknown grade fails while resolving", "[Assessment][errors]") {
    ParameterSet params = steel_params();
    params["grade"] = "S999";

    AssessmentEngine engine;
    AssessmentOutcome outcome = engine.run(params);
    REQUIRE(outcome.error->code == ErrorCode::UNKNOWN_MATERIAL);
    REQUIRE(outcome.error->field == "grade");
    REQUIRE(engine.failed_in() == AssessmentState::Resolving);
}

TEST_CASE("Loaded width below lane width fails while combining", "[Assessment][errors]") {
    ParameterSet params = steel_params();
    params["loaded_width"] = "2.0";

    AssessmentEngine engine;
    AssessmentOutcome outcome = engine.run(params);
    REQUIRE(outcome.error->code == ErrorCode::INVALID_LOADING_PARAMETERS);
    REQUIRE(engine.failed_in() == AssessmentState::Combining);
}

// =============================================================================
// Narrative, warnings and optional outputs
// =============================================================================

TEST_CASE("Narrative records every stage in order", "[Assessment][narrative]") {
    AssessmentOutcome outcome = AssessmentEngine::assess(steel_params());
    REQUIRE(outcome.ok());

    const auto& steps = outcome.log.steps();
    REQUIRE(steps.front().label == "Bridge type");
    REQUIRE(steps.back().label == "Result");
    REQUIRE(steps.back().text == "Fail");

    auto index_of = [&steps](const std::string& label) {
        auto it = std::find_if(steps.begin(), steps.end(),
                               [&label](const CalculationStep& s) { return s.label == label; });
        REQUIRE(it != steps.end());
        return it - steps.begin();
    };
    REQUIRE(index_of("Yield strength fy") < index_of("HA UDL"));
    REQUIRE(index_of("HA UDL") < index_of("Moment capacity"));

    const std::string text = outcome.log.to_text();
    REQUIRE(text.rfind("1. Bridge type: Simply Supported\n", 0) == 0);
    REQUIRE(field(outcome, "Calculation Process") == text);
}

TEST_CASE("Self weight is reported when included", "[Assessment][self_weight]") {
    ParameterSet params = concrete_params();
    params["include_self_weight"] = "true";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE(outcome.ok());
    // 0.3 x 0.6 m x 25 kN/m³ = 4.5 kN/m over 10 m
    REQUIRE_THAT(*outcome.result->self_weight_moment, WithinAbs(56.25, 1e-9));
    REQUIRE_THAT(outcome.result->dead_moment, WithinAbs(56.25, 1e-9));
    REQUIRE(field(outcome, "Self Weight Moment (kNm)") == "56.25");
}

TEST_CASE("Additional loads appear in order in the output", "[Assessment][loads]") {
    ParameterSet params = concrete_params();
    params["additional_load_description_1"] = "Surfacing";
    params["additional_load_value_1"] = "2";
    params["additional_load_type_1"] = "dead";
    params["additional_load_material_1"] = "Asphalt";
    params["additional_load_description_2"] = "Plant";
    params["additional_load_value_2"] = "20";
    params["additional_load_type_2"] = "live";
    params["additional_load_distribution_2"] = "point";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE(outcome.ok());
    REQUIRE(outcome.result->additional_loads.size() == 2);
    REQUIRE_THAT(outcome.result->dead_moment, WithinAbs(25.0, 1e-9));
    REQUIRE_THAT(outcome.result->live_moment, WithinAbs(162.5 + 50.0, 1e-9));
    REQUIRE(field(outcome, "Additional Loads") ==
            "Surfacing: 2.00 kN/m (dead, Asphalt, udl); Plant: 20.00 kN (live, point)");
}

TEST_CASE("Low condition factor and restraint warnings", "[Assessment][warnings]") {
    ParameterSet params = steel_params();
    params["condition_factor"] = "0.4";
    params["k1"] = "0.5";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE(outcome.ok());
    REQUIRE(outcome.warnings.contains(WarningCode::LOW_CONDITION_FACTOR));
    REQUIRE(outcome.warnings.contains(WarningCode::RESTRAINT_FACTOR_OUTSIDE_RANGE));
    REQUIRE(outcome.warnings.count_by_severity(WarningSeverity::High) >= 1);
}

TEST_CASE("Condition factor outside (0, 1] is an error", "[Assessment][errors]") {
    ParameterSet params = steel_params();
    params["condition_factor"] = "1.5";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.error->field == "condition_factor");
    REQUIRE(outcome.error->code == ErrorCode::OUT_OF_RANGE);
}

TEST_CASE("Load factors scale the total demand", "[Assessment][factors]") {
    ParameterSet params = concrete_params();
    params["dead_load"] = "2";
    params["dead_load_factor"] = "1.2";
    params["live_load_factor"] = "1.5";

    AssessmentOutcome outcome = AssessmentEngine::assess(params);
    REQUIRE(outcome.ok());
    REQUIRE_THAT(outcome.result->total_moment, WithinAbs(1.2 * 25.0 + 1.5 * 162.5, 1e-9));
    REQUIRE_THAT(outcome.result->moment_utilisation,
                 WithinRel(outcome.result->total_moment / outcome.result->moment_capacity, 1e-12));
}

// =============================================================================
// Properties
// =============================================================================

TEST_CASE("Repeated runs are identical", "[Assessment][property][idempotence]") {
    ParameterSet params = concrete_params();
    params["vehicle_type"] = "7.5 tonne";
    params["impact_factor"] = "1.25";

    AssessmentEngine engine;
    AssessmentOutcome first = engine.run(params);
    AssessmentOutcome second = engine.run(params);

    REQUIRE(first.ok());
    REQUIRE(first.to_fields() == second.to_fields());
    REQUIRE(first.log.to_text() == second.log.to_text());
    REQUIRE(first.result->moment_capacity == second.result->moment_capacity);
    REQUIRE(*first.result->vehicle_moment == *second.result->vehicle_moment);
}

TEST_CASE("Reinforcement layer order does not change capacity", "[Assessment][property][order]") {
    ParameterSet a = concrete_params();
    a["rebar_count_2"] = "2";
    a["rebar_diameter_2"] = "16";
    a["rebar_cover_2"] = "100";

    ParameterSet b = concrete_params();
    b["rebar_count_1"] = "2";
    b["rebar_diameter_1"] = "16";
    b["rebar_cover_1"] = "100";
    b["rebar_count_2"] = "4";
    b["rebar_diameter_2"] = "25";
    b["rebar_cover_2"] = "50";

    AssessmentOutcome oa = AssessmentEngine::assess(a);
    AssessmentOutcome ob = AssessmentEngine::assess(b);
    REQUIRE(oa.ok());
    REQUIRE(ob.ok());
    REQUIRE_THAT(oa.result->moment_capacity, WithinRel(ob.result->moment_capacity, 1e-12));
    REQUIRE_THAT(oa.result->shear_capacity, WithinRel(ob.result->shear_capacity, 1e-12));
}

TEST_CASE("Pass is exactly capacity at least demand for both actions", "[Assessment][property][pass]") {
    const ParameterSet bases[] = {steel_params(), concrete_params(), light_timber_params()};
    const char* factors[] = {"0.05", "0.3", "0.7", "1.0"};

    for (const auto& base : bases) {
        for (const char* cf : factors) {
            ParameterSet params = base;
            params["condition_factor"] = cf;
            AssessmentOutcome outcome = AssessmentEngine::assess(params);
            REQUIRE(outcome.ok());

            const AssessmentResult& r = *outcome.result;
            REQUIRE(r.moment_capacity >= 0.0);
            REQUIRE(r.shear_capacity >= 0.0);
            const bool expected = r.moment_capacity >= r.total_moment &&
                                  r.shear_capacity >= r.total_shear;
            REQUIRE(r.pass == expected);
            REQUIRE(outcome.passed() == expected);
        }
    }
}

TEST_CASE("Timber member assessment", "[Assessment][timber]") {
    AssessmentOutcome outcome = AssessmentEngine::assess(light_timber_params());
    REQUIRE(outcome.ok());
    const AssessmentResult& r = *outcome.result;

    // D50: 16 N/mm² x 300 x 600² / 6 mm³
    REQUIRE_THAT(r.moment_capacity, WithinRel(288.0, 1e-12));
    REQUIRE_THAT(r.shear_capacity, WithinRel(2.0 / 3.0 * 2.2 * 180000.0 / 1e3, 1e-12));
    REQUIRE(r.effective_member_length == 4.0);
    REQUIRE(r.pass);
}
