#include "spancheck/load_case.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

namespace spancheck {

std::string load_type_to_string(LoadType type) {
    return type == LoadType::Dead ? "dead" : "live";
}

std::string load_distribution_to_string(LoadDistribution distribution) {
    return distribution == LoadDistribution::Point ? "point" : "udl";
}

LoadType parse_load_type(const std::string& text, const std::string& field) {
    const std::string key = normalize_option(text);
    if (key == "dead" || key == "permanent") return LoadType::Dead;
    if (key == "live" || key == "variable") return LoadType::Live;
    throw ValidationError(ErrorInfo::malformed_field(field, text, "dead or live"));
}

LoadDistribution parse_load_distribution(const std::string& text, const std::string& field) {
    const std::string key = normalize_option(text);
    if (key == "udl" || key == "uniform") return LoadDistribution::Uniform;
    if (key == "point") return LoadDistribution::Point;
    throw ValidationError(ErrorInfo::malformed_field(field, text, "udl or point"));
}

LoadCase::LoadCase(std::string description, double magnitude, LoadType type,
                   std::string material, LoadDistribution distribution)
    : description_(std::move(description)), magnitude_(magnitude), type_(type),
      material_(std::move(material)), distribution_(distribution) {
    if (!(magnitude_ >= 0.0)) {
        throw ValidationError(ErrorInfo::out_of_range(
            "load '" + description_ + "'", magnitude_, "at least 0"));
    }
}

std::string LoadCase::unit() const {
    return distribution_ == LoadDistribution::Point ? "kN" : "kN/m";
}

LoadEffect LoadCase::effect(BridgeType bridge, double span) const {
    if (distribution_ == LoadDistribution::Point) {
        return point_load_effect(bridge, magnitude_, span);
    }
    return uniform_load_effect(bridge, magnitude_, span);
}

DemandSummary LoadCombinator::combine(BridgeType bridge, double span,
                                      const std::vector<LoadCase>& load_cases,
                                      const HighwayLoad& highway,
                                      const VehicleEnvelope& vehicle,
                                      const LoadFactors& factors,
                                      double self_weight) {
    DemandSummary demand;
    LoadEffect dead;
    LoadEffect live;

    if (self_weight > 0.0) {
        LoadEffect sw = uniform_load_effect(bridge, self_weight, span);
        demand.self_weight_moment = sw.moment;
        demand.self_weight_shear = sw.shear;
        dead += sw;
    }

    for (const auto& lc : load_cases) {
        LoadEffect e = lc.effect(bridge, span);
        if (lc.type() == LoadType::Dead) {
            dead += e;
        } else {
            live += e;
        }
        demand.contributions.push_back({lc.description(), lc.type(), e});
    }

    LoadEffect hw = HighwayLoadModel::effect(highway, bridge, span);
    demand.highway_moment = hw.moment;
    demand.highway_shear = hw.shear;
    live += hw;

    demand.vehicle_moment = vehicle.max_moment;
    demand.vehicle_shear = vehicle.max_shear;
    live += vehicle.effect();

    demand.dead_moment = dead.moment;
    demand.dead_shear = dead.shear;
    demand.live_moment = live.moment;
    demand.live_shear = live.shear;

    LoadEffect total = dead * factors.get_type_factor(LoadType::Dead)
                     + live * factors.get_type_factor(LoadType::Live);
    demand.total_moment = total.moment;
    demand.total_shear = total.shear;

    return demand;
}

} // namespace spancheck
