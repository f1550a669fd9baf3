#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "spancheck/assessment.hpp"
#include "spancheck/beam_actions.hpp"
#include "spancheck/calculation_log.hpp"
#include "spancheck/capacity.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/highway_load.hpp"
#include "spancheck/material.hpp"
#include "spancheck/parameters.hpp"
#include "spancheck/vehicle_envelope.hpp"
#include "spancheck/warnings.hpp"

namespace py = pybind11;

namespace {

/// Convert a Python dict of str/int/float/bool values to a ParameterSet
spancheck::ParameterSet to_parameter_set(const py::dict& params) {
    spancheck::ParameterSet result;
    for (const auto& item : params) {
        const std::string key = py::str(item.first);
        if (item.second.is_none()) continue;
        if (py::isinstance<py::bool_>(item.second)) {
            result[key] = item.second.cast<bool>() ? "true" : "false";
        } else {
            result[key] = py::str(item.second);
        }
    }
    return result;
}

py::dict outcome_to_dict(const spancheck::AssessmentOutcome& outcome) {
    py::dict fields;
    for (const auto& [name, value] : outcome.to_fields()) {
        fields[py::str(name)] = value;
    }
    if (outcome.ok()) {
        py::list loads;
        for (const auto& load : outcome.result->additional_loads) {
            py::dict entry;
            entry["description"] = load.description();
            entry["value"] = load.magnitude();
            entry["type"] = spancheck::load_type_to_string(load.type());
            entry["load_material"] = load.material();
            entry["load_distribution"] = spancheck::load_distribution_to_string(load.distribution());
            loads.append(entry);
        }
        fields["Additional Loads"] = loads;
    }
    return fields;
}

} // namespace

/**
 * Spancheck C++ Python bindings module.
 * The web form, PDF and HTML report generators call into this module.
 */
PYBIND11_MODULE(_spancheck_cpp, m) {
    m.doc() = "Spancheck C++ core module - Bridge member capacity assessment";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Enumerations
    // ========================================================================

    py::enum_<spancheck::MaterialKind>(m, "MaterialKind", "Structural material kind")
        .value("Steel", spancheck::MaterialKind::Steel)
        .value("Concrete", spancheck::MaterialKind::Concrete)
        .value("Timber", spancheck::MaterialKind::Timber);

    py::enum_<spancheck::BridgeType>(m, "BridgeType", "Support arrangement")
        .value("SimplySupported", spancheck::BridgeType::SimplySupported)
        .value("Cantilever", spancheck::BridgeType::Cantilever);

    py::enum_<spancheck::LoadingType>(m, "LoadingType", "Highway loading model")
        .value("HA", spancheck::LoadingType::HA)
        .value("HB", spancheck::LoadingType::HB);

    py::enum_<spancheck::AccessType>(m, "AccessType", "Access type of the carriageway")
        .value("Company", spancheck::AccessType::Company)
        .value("Public", spancheck::AccessType::Public);

    py::enum_<spancheck::SectionClass>(m, "SectionClass", "Steel section classification")
        .value("NotApplicable", spancheck::SectionClass::NotApplicable)
        .value("Compact", spancheck::SectionClass::Compact)
        .value("NonCompact", spancheck::SectionClass::NonCompact);

    py::enum_<spancheck::AssessmentState>(m, "AssessmentState", "Assessment state machine states")
        .value("Validating", spancheck::AssessmentState::Validating)
        .value("Resolving", spancheck::AssessmentState::Resolving)
        .value("Combining", spancheck::AssessmentState::Combining)
        .value("Comparing", spancheck::AssessmentState::Comparing)
        .value("Done", spancheck::AssessmentState::Done)
        .value("Failed", spancheck::AssessmentState::Failed);

    // ========================================================================
    // Errors
    // ========================================================================

    py::enum_<spancheck::ErrorCode>(m, "ErrorCode", "Error codes for assessment failures")
        .value("OK", spancheck::ErrorCode::OK, "No error")
        .value("MISSING_FIELD", spancheck::ErrorCode::MISSING_FIELD)
        .value("MALFORMED_FIELD", spancheck::ErrorCode::MALFORMED_FIELD)
        .value("OUT_OF_RANGE", spancheck::ErrorCode::OUT_OF_RANGE)
        .value("UNSUPPORTED_CONFIGURATION", spancheck::ErrorCode::UNSUPPORTED_CONFIGURATION)
        .value("UNKNOWN_MATERIAL", spancheck::ErrorCode::UNKNOWN_MATERIAL)
        .value("UNSUPPORTED_MATERIAL", spancheck::ErrorCode::UNSUPPORTED_MATERIAL)
        .value("INVALID_GEOMETRY", spancheck::ErrorCode::INVALID_GEOMETRY)
        .value("INVALID_LOADING_PARAMETERS", spancheck::ErrorCode::INVALID_LOADING_PARAMETERS)
        .value("INVALID_VEHICLE_SPACING", spancheck::ErrorCode::INVALID_VEHICLE_SPACING)
        .value("UNKNOWN_ERROR", spancheck::ErrorCode::UNKNOWN_ERROR);

    py::class_<spancheck::ErrorInfo>(m, "ErrorInfo",
        "Structured error information with machine-readable code and the offending field")
        .def(py::init<>(), "Create OK (no error) status")
        .def_readonly("code", &spancheck::ErrorInfo::code, "Error code")
        .def_readonly("message", &spancheck::ErrorInfo::message, "Error message")
        .def_readonly("field", &spancheck::ErrorInfo::field, "Offending input field")
        .def_readonly("details", &spancheck::ErrorInfo::details, "Additional details")
        .def_readonly("suggestion", &spancheck::ErrorInfo::suggestion, "Suggested fix")
        .def("is_ok", &spancheck::ErrorInfo::is_ok)
        .def("is_error", &spancheck::ErrorInfo::is_error)
        .def("code_string", &spancheck::ErrorInfo::code_string)
        .def("__repr__", [](const spancheck::ErrorInfo &e) {
            if (e.is_ok()) return std::string("<ErrorInfo OK>");
            return "<ErrorInfo " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &spancheck::ErrorInfo::to_string);

    // ========================================================================
    // Warnings
    // ========================================================================

    py::enum_<spancheck::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", spancheck::WarningSeverity::Low)
        .value("Medium", spancheck::WarningSeverity::Medium)
        .value("High", spancheck::WarningSeverity::High);

    py::enum_<spancheck::WarningCode>(m, "WarningCode", "Assessment warning codes")
        .value("RESTRAINT_FACTOR_OUTSIDE_RANGE", spancheck::WarningCode::RESTRAINT_FACTOR_OUTSIDE_RANGE)
        .value("SLENDERNESS_BEYOND_CURVE", spancheck::WarningCode::SLENDERNESS_BEYOND_CURVE)
        .value("SLENDER_STEEL_SECTION", spancheck::WarningCode::SLENDER_STEEL_SECTION)
        .value("OVER_REINFORCED_SECTION", spancheck::WarningCode::OVER_REINFORCED_SECTION)
        .value("LOW_CONDITION_FACTOR", spancheck::WarningCode::LOW_CONDITION_FACTOR)
        .value("HIGH_UTILISATION", spancheck::WarningCode::HIGH_UTILISATION)
        .value("VEHICLE_SINGLE_AXLE_GOVERNS", spancheck::WarningCode::VEHICLE_SINGLE_AXLE_GOVERNS);

    py::class_<spancheck::AssessmentWarning>(m, "AssessmentWarning", "Non-blocking assessment warning")
        .def_readonly("code", &spancheck::AssessmentWarning::code)
        .def_readonly("severity", &spancheck::AssessmentWarning::severity)
        .def_readonly("message", &spancheck::AssessmentWarning::message)
        .def_readonly("details", &spancheck::AssessmentWarning::details)
        .def_readonly("suggestion", &spancheck::AssessmentWarning::suggestion)
        .def("__str__", &spancheck::AssessmentWarning::to_string);

    py::class_<spancheck::WarningList>(m, "WarningList", "Warnings raised by one assessment")
        .def_readonly("warnings", &spancheck::WarningList::warnings)
        .def("has_warnings", &spancheck::WarningList::has_warnings)
        .def("count_by_severity", &spancheck::WarningList::count_by_severity, py::arg("severity"))
        .def("get_by_min_severity", &spancheck::WarningList::get_by_min_severity,
             py::arg("min_severity"))
        .def("summary", &spancheck::WarningList::summary)
        .def("__len__", &spancheck::WarningList::count)
        .def("__bool__", &spancheck::WarningList::has_warnings);

    // ========================================================================
    // Assessment
    // ========================================================================

    py::class_<spancheck::CalculationStep>(m, "CalculationStep", "One step of the calculation narrative")
        .def_readonly("label", &spancheck::CalculationStep::label)
        .def_readonly("value", &spancheck::CalculationStep::value)
        .def_readonly("unit", &spancheck::CalculationStep::unit)
        .def_readonly("text", &spancheck::CalculationStep::text)
        .def("__str__", &spancheck::CalculationStep::to_string);

    py::class_<spancheck::AssessmentOutcome>(m, "AssessmentOutcome",
        "Result or error of one assessment, with narrative and warnings")
        .def_readonly("error", &spancheck::AssessmentOutcome::error)
        .def_readonly("warnings", &spancheck::AssessmentOutcome::warnings)
        .def_property_readonly("steps", [](const spancheck::AssessmentOutcome &o) {
            return o.log.steps();
        })
        .def_property_readonly("narrative", [](const spancheck::AssessmentOutcome &o) {
            return o.log.to_text();
        })
        .def("ok", &spancheck::AssessmentOutcome::ok)
        .def("passed", &spancheck::AssessmentOutcome::passed)
        .def("fields", &outcome_to_dict, "Named output fields");

    m.def("run", [](const py::dict &params) {
              return spancheck::AssessmentEngine::assess(to_parameter_set(params));
          },
          py::arg("params"),
          "Run one assessment and return the full outcome");

    m.def("assess", [](const py::dict &params) {
              return outcome_to_dict(spancheck::AssessmentEngine::assess(to_parameter_set(params)));
          },
          py::arg("params"),
          "Run one assessment and return the named output fields");

    m.def("material_grades", [](const std::string &kind) {
              return spancheck::MaterialCatalog::grades(spancheck::parse_material_kind(kind));
          },
          py::arg("kind"),
          "Catalogued grades for a material kind");

    m.def("vehicle_names", []() {
              std::vector<std::string> names;
              for (const auto& v : spancheck::VehicleCatalog::all()) {
                  names.push_back(v.name);
              }
              return names;
          },
          "Catalogued assessment vehicles");
}
