#include "spancheck/parameters.hpp"
#include "spancheck/assessment.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace spancheck {

ParameterReader::ParameterReader(const ParameterSet& params)
    : params_(params) {
}

bool ParameterReader::has(const std::string& key) const {
    auto it = params_.find(key);
    return it != params_.end() && !normalize_option(it->second).empty();
}

std::string ParameterReader::text(const std::string& key) const {
    if (!has(key)) {
        throw ValidationError(ErrorInfo::missing_field(key));
    }
    return params_.at(key);
}

std::string ParameterReader::text_or(const std::string& key, const std::string& fallback) const {
    return has(key) ? params_.at(key) : fallback;
}

double ParameterReader::number(const std::string& key) const {
    const std::string raw = text(key);
    const std::string trimmed = normalize_option(raw);

    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(trimmed, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(ErrorInfo::malformed_field(key, raw, "a decimal number"));
    }
    if (consumed != trimmed.size() || !std::isfinite(value)) {
        throw ValidationError(ErrorInfo::malformed_field(key, raw, "a decimal number"));
    }
    return value;
}

double ParameterReader::number_or(const std::string& key, double fallback) const {
    return has(key) ? number(key) : fallback;
}

int ParameterReader::count(const std::string& key) const {
    const double value = number(key);
    if (value < 1.0 || std::floor(value) != value) {
        throw ValidationError(ErrorInfo::out_of_range(key, value, "a whole number of at least 1"));
    }
    if (value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ValidationError(ErrorInfo::out_of_range(
            key, value, "at most " + std::to_string(std::numeric_limits<int>::max())));
    }
    return static_cast<int>(value);
}

bool ParameterReader::flag_or(const std::string& key, bool fallback) const {
    if (!has(key)) return fallback;
    const std::string value = normalize_option(params_.at(key));
    if (value == "true" || value == "yes" || value == "1" || value == "on") return true;
    if (value == "false" || value == "no" || value == "0" || value == "off") return false;
    throw ValidationError(ErrorInfo::malformed_field(key, params_.at(key), "true or false"));
}

int ParameterReader::last_index(const std::vector<std::string>& prefixes) const {
    int last = 0;
    for (const auto& [key, value] : params_) {
        if (normalize_option(value).empty()) continue;
        for (const auto& prefix : prefixes) {
            if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            const std::string suffix = key.substr(prefix.size());
            const bool digits = std::all_of(suffix.begin(), suffix.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!digits) continue;
            const int index = suffix.size() > 6 ? 0 : std::stoi(suffix);
            if (index < 1) {
                throw ValidationError(ErrorInfo::malformed_field(
                    key, suffix, "an entry number between 1 and 999999"));
            }
            last = std::max(last, index);
        }
    }
    return last;
}

namespace {

double positive(const ParameterReader& reader, const std::string& key) {
    double value = reader.number(key);
    if (value <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range(key, value, "greater than 0"));
    }
    return value;
}

double positive_or(const ParameterReader& reader, const std::string& key, double fallback) {
    return reader.has(key) ? positive(reader, key) : fallback;
}

double non_negative_or(const ParameterReader& reader, const std::string& key, double fallback) {
    double value = reader.number_or(key, fallback);
    if (value < 0.0) {
        throw ValidationError(ErrorInfo::out_of_range(key, value, "at least 0"));
    }
    return value;
}

SteelDimensions read_steel(const ParameterReader& reader) {
    SteelDimensions dims;
    const std::string shape = normalize_option(reader.text_or("section_shape", "I"));
    if (shape == "i" || shape == "i-beam" || shape == "i-section") {
        dims.shape = SteelShape::I;
    } else if (shape == "box" || shape == "box girder") {
        dims.shape = SteelShape::Box;
    } else {
        throw ValidationError(ErrorInfo::malformed_field(
            "section_shape", reader.text("section_shape"), "I or Box"));
    }
    dims.flange_width = positive(reader, "flange_width");
    dims.flange_thickness = positive(reader, "flange_thickness");
    dims.web_thickness = positive(reader, "web_thickness");
    dims.depth = positive(reader, "beam_depth");
    return dims;
}

ConcreteDimensions read_concrete(const ParameterReader& reader) {
    ConcreteDimensions dims;
    dims.width = positive(reader, "beam_width");
    dims.depth = positive(reader, "beam_depth");

    // Every entry up to the highest number must be complete; a gap is a missing field
    const int last = reader.last_index({"rebar_count_", "rebar_diameter_", "rebar_cover_"});
    for (int i = 1; i <= last; ++i) {
        const std::string n = std::to_string(i);
        dims.layers.emplace_back(reader.count("rebar_count_" + n),
                                 positive(reader, "rebar_diameter_" + n),
                                 positive(reader, "rebar_cover_" + n));
    }

    if (dims.layers.empty()) {
        if (!reader.has("rebar_spacing")) {
            throw ValidationError(ErrorInfo::missing_field("rebar_count_1"));
        }
        // Slab form: bars at a regular spacing across the width
        const double spacing = positive(reader, "rebar_spacing");
        const double bars = std::floor(dims.width / spacing);
        if (bars > static_cast<double>(std::numeric_limits<int>::max())) {
            throw ValidationError(ErrorInfo::out_of_range(
                "rebar_spacing", spacing, "large enough to give a representable bar count"));
        }
        dims.layers.emplace_back(std::max(1, static_cast<int>(bars)), positive(reader, "rebar_size"),
                                 positive(reader, "rebar_cover"));
    }
    return dims;
}

TimberDimensions read_timber(const ParameterReader& reader) {
    TimberDimensions dims;
    dims.width = positive(reader, "beam_width");
    dims.depth = positive(reader, "beam_depth");
    return dims;
}

std::vector<LoadCase> read_additional_loads(const ParameterReader& reader) {
    const std::string prefix = "additional_load_";
    const int last = reader.last_index({prefix + "description_", prefix + "value_",
                                        prefix + "type_", prefix + "material_",
                                        prefix + "distribution_"});
    std::vector<LoadCase> loads;
    for (int i = 1; i <= last; ++i) {
        const std::string n = std::to_string(i);

        const std::string description =
            reader.text_or(prefix + "description_" + n, "Additional load " + n);
        const double value = reader.number(prefix + "value_" + n);
        if (value < 0.0) {
            throw ValidationError(ErrorInfo::out_of_range(prefix + "value_" + n, value, "at least 0"));
        }
        const LoadType type = parse_load_type(reader.text(prefix + "type_" + n),
                                              prefix + "type_" + n);
        const std::string material = reader.text_or(prefix + "material_" + n, "");
        const LoadDistribution distribution = parse_load_distribution(
            reader.text_or(prefix + "distribution_" + n, "udl"), prefix + "distribution_" + n);

        loads.emplace_back(description, value, type, material, distribution);
    }
    return loads;
}

std::optional<VehicleSpec> read_vehicle(const ParameterReader& reader) {
    const std::string type = reader.text_or("vehicle_type", "none");
    const std::string key = normalize_option(type);
    if (key == "none" || key.empty()) {
        return std::nullopt;
    }

    VehicleSpec vehicle;
    if (key == "custom") {
        vehicle.name = "custom";
        vehicle.front_axle_load = reader.number("front_axle_load");
        vehicle.rear_axle_load = reader.number("rear_axle_load");
        vehicle.axle_spacing = reader.number("axle_spacing");
    } else {
        auto catalogued = VehicleCatalog::find(type);
        if (!catalogued) {
            throw ValidationError(ErrorInfo::malformed_field(
                "vehicle_type", type, "none, 3 tonne, 7.5 tonne, 18 tonne or custom"));
        }
        vehicle.name = catalogued->name;
        vehicle.front_axle_load = non_negative_or(reader, "front_axle_load", catalogued->front_axle_load);
        vehicle.rear_axle_load = non_negative_or(reader, "rear_axle_load", catalogued->rear_axle_load);
        vehicle.axle_spacing = reader.number_or("axle_spacing", catalogued->axle_spacing);
    }

    vehicle.impact_factor = reader.number("impact_factor");
    vehicle.dispersion = reader.number_or("dispersion", 0.0);
    vehicle.sharing = parse_load_sharing(reader.text_or("load_sharing", "per_beam"));
    return vehicle;
}

} // namespace

AssessmentInput parse_assessment_input(const ParameterSet& params) {
    ParameterReader reader(params);
    AssessmentInput input;

    input.bridge_type = parse_bridge_type(reader.text("bridge_type"));
    input.span_length = positive(reader, "span_length");
    input.effective_member_length = positive_or(reader, "effective_member_length", input.span_length);

    input.material = parse_material_kind(reader.text("material"));
    input.grade = reader.text("grade");

    switch (input.material) {
        case MaterialKind::Steel:
            input.dimensions = read_steel(reader);
            input.restraint.k1 = positive_or(reader, "k1", 1.0);
            input.restraint.k2 = positive_or(reader, "k2", 1.0);
            break;
        case MaterialKind::Concrete:
            input.dimensions = read_concrete(reader);
            input.reinforcement_strength = positive_or(reader, "rebar_strength", 500.0);
            break;
        case MaterialKind::Timber:
            input.dimensions = read_timber(reader);
            input.timber.exposure = parse_timber_exposure(reader.text_or("timber_exposure", "dry"));
            input.timber.duration = parse_load_duration(reader.text_or("load_duration", "long"));
            break;
    }

    input.highway.type = parse_loading_type(reader.text("loading_type"));
    input.highway.span_length = input.span_length;
    input.highway.loaded_width = reader.number("loaded_width");
    input.highway.lane_width = reader.number("lane_width");
    input.highway.access = parse_access_type(reader.text("access_type"));
    if (input.highway.type == LoadingType::HB) {
        input.highway.hb_units = reader.number("hb_units");
    }

    input.condition_factor = reader.number("condition_factor");

    input.safety.steel = positive_or(reader, "safety_factor_steel", input.safety.steel);
    input.safety.concrete = positive_or(reader, "safety_factor_concrete", input.safety.concrete);
    input.safety.reinforcement =
        positive_or(reader, "safety_factor_reinforcement", input.safety.reinforcement);
    input.safety.timber = positive_or(reader, "safety_factor_timber", input.safety.timber);
    input.load_factors.dead = positive_or(reader, "dead_load_factor", 1.0);
    input.load_factors.live = positive_or(reader, "live_load_factor", 1.0);

    input.dead_load = non_negative_or(reader, "dead_load", 0.0);
    input.live_load = non_negative_or(reader, "live_load", 0.0);
    input.additional_loads = read_additional_loads(reader);
    input.include_self_weight = reader.flag_or("include_self_weight", false);

    input.vehicle = read_vehicle(reader);

    return input;
}

} // namespace spancheck
