#include "spancheck/highway_load.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace spancheck {

std::string loading_type_to_string(LoadingType type) {
    return type == LoadingType::HB ? "HB" : "HA";
}

std::string access_type_to_string(AccessType type) {
    return type == AccessType::Company ? "Company" : "Public";
}

LoadingType parse_loading_type(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "ha") return LoadingType::HA;
    if (key == "hb") return LoadingType::HB;
    throw ValidationError(ErrorInfo::malformed_field("loading_type", name, "HA or HB"));
}

AccessType parse_access_type(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "company") return AccessType::Company;
    if (key == "public") return AccessType::Public;
    throw ValidationError(ErrorInfo::malformed_field("access_type", name, "Company or Public"));
}

double HighwayLoadModel::ha_udl_per_lane(double span_length) {
    if (span_length <= ha_transition_span) {
        return ha_short_coefficient * std::pow(1.0 / span_length, ha_short_exponent);
    }
    return ha_long_coefficient * std::pow(1.0 / span_length, ha_long_exponent);
}

int HighwayLoadModel::notional_lanes(double loaded_width, double lane_width) {
    const double ratio = loaded_width / lane_width;
    const double lanes = std::floor(ratio * (1.0 + lane_ratio_tolerance));
    if (!(lanes <= static_cast<double>(std::numeric_limits<int>::max()))) {
        throw InvalidLoadingParametersError(
            "loaded_width / lane_width gives more notional lanes than can be represented",
            "loaded_width");
    }
    return std::max(static_cast<int>(lanes), 1);
}

double HighwayLoadModel::access_multiplier(AccessType access) {
    return access == AccessType::Company ? 1.3 : 1.5;
}

HighwayLoad HighwayLoadModel::compute(const HighwayLoadParameters& params) {
    if (!std::isfinite(params.span_length) || params.span_length <= 0.0) {
        throw InvalidLoadingParametersError(
            "span_length must be greater than 0 for highway loading", "span_length");
    }
    if (!std::isfinite(params.lane_width) || params.lane_width <= 0.0) {
        throw InvalidLoadingParametersError(
            "lane_width must be greater than 0", "lane_width");
    }
    if (!std::isfinite(params.loaded_width) || params.loaded_width < params.lane_width) {
        throw InvalidLoadingParametersError(
            "loaded_width (" + std::to_string(params.loaded_width) +
            " m) must not be less than lane_width (" + std::to_string(params.lane_width) + " m)",
            "loaded_width");
    }

    HighwayLoad load;
    load.type = params.type;
    load.notional_lanes = notional_lanes(params.loaded_width, params.lane_width);
    load.multiplier = access_multiplier(params.access);

    if (params.type == LoadingType::HA) {
        load.lane_intensity = ha_udl_per_lane(params.span_length);
        load.udl = load.lane_intensity * load.notional_lanes * load.multiplier;
        load.kel = kel_per_lane * load.notional_lanes * load.multiplier;
    } else {
        if (!std::isfinite(params.hb_units) || params.hb_units <= 0.0) {
            throw InvalidLoadingParametersError(
                "hb_units must be greater than 0 for HB loading", "hb_units");
        }
        // One HB vehicle shared across the notional lanes
        load.lane_intensity = params.hb_units * hb_unit_load / load.notional_lanes;
        load.udl = load.lane_intensity * load.multiplier;
        load.kel = 0.0;
    }

    return load;
}

HighwayLoad HighwayLoadModel::compute(LoadingType type, double span_length, double loaded_width,
                                      double lane_width, AccessType access, double hb_units) {
    HighwayLoadParameters params;
    params.type = type;
    params.span_length = span_length;
    params.loaded_width = loaded_width;
    params.lane_width = lane_width;
    params.access = access;
    params.hb_units = hb_units;
    return compute(params);
}

LoadEffect HighwayLoadModel::effect(const HighwayLoad& load, BridgeType bridge,
                                    double span_length) {
    LoadEffect total = uniform_load_effect(bridge, load.udl, span_length);
    if (load.kel > 0.0) {
        total += point_load_effect(bridge, load.kel, span_length);
    }
    return total;
}

} // namespace spancheck
