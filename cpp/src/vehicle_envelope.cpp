#include "spancheck/vehicle_envelope.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace spancheck {

std::string load_sharing_to_string(LoadSharing sharing) {
    return sharing == LoadSharing::Full ? "full" : "per_beam";
}

LoadSharing parse_load_sharing(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "per_beam" || key == "per beam" || key == "per-beam" || key == "half") {
        return LoadSharing::PerBeam;
    }
    if (key == "full") {
        return LoadSharing::Full;
    }
    throw ValidationError(ErrorInfo::malformed_field("load_sharing", name, "per_beam or full"));
}

double VehicleSpec::load_scale() const {
    double sharing_factor = sharing == LoadSharing::PerBeam ? 0.5 : 1.0;
    return impact_factor * (1.0 - dispersion / 100.0) * sharing_factor;
}

const std::vector<VehicleTemplate>& VehicleCatalog::all() {
    static const std::vector<VehicleTemplate> vehicles = {
        {"3 tonne", 11.8, 17.6, 2.0},
        {"7.5 tonne", 25.5, 48.1, 2.6},
        {"18 tonne", 64.0, 113.0, 3.0},
    };
    return vehicles;
}

std::optional<VehicleTemplate> VehicleCatalog::find(const std::string& name) {
    const std::string key = normalize_option(name);
    for (const auto& vehicle : all()) {
        if (normalize_option(vehicle.name) == key) {
            return vehicle;
        }
    }
    return std::nullopt;
}

std::optional<double> VehicleLoadEnvelope::critical_moment(double span, double governing,
                                                           double other, double spacing,
                                                           double& position) {
    const double R = governing + other;
    if (R <= 0.0) {
        position = span / 2.0;
        return 0.0;
    }

    // Midspan bisects the governing axle and the resultant
    const double c = spacing * other / (2.0 * R);
    const double x_governing = span / 2.0 - c;
    if (x_governing < 0.0 || x_governing + spacing > span) {
        return std::nullopt;
    }

    position = x_governing;
    const double a = span / 2.0 - c;
    return R * a * a / span;
}

VehicleEnvelope VehicleLoadEnvelope::max_envelope(double span, double front_load,
                                                  double rear_load, double axle_spacing,
                                                  double impact_factor, double dispersion,
                                                  LoadSharing sharing, BridgeType bridge) {
    if (!std::isfinite(span) || span <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("span_length", span, "greater than 0"));
    }
    if (!std::isfinite(axle_spacing) || axle_spacing <= 0.0) {
        throw InvalidVehicleSpacingError(
            "axle_spacing must be greater than 0 (got " + std::to_string(axle_spacing) + " m)",
            "axle_spacing");
    }
    if (axle_spacing >= span) {
        throw InvalidVehicleSpacingError(
            "axle_spacing (" + std::to_string(axle_spacing) +
            " m) must be less than span_length (" + std::to_string(span) +
            " m) for both axles to fit on the span", "axle_spacing");
    }
    if (front_load < 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("front_axle_load", front_load, "at least 0"));
    }
    if (rear_load < 0.0) {
        throw ValidationError(ErrorInfo::out_of_range("rear_axle_load", rear_load, "at least 0"));
    }
    if (impact_factor < 1.0) {
        throw ValidationError(ErrorInfo::out_of_range("impact_factor", impact_factor, "at least 1"));
    }
    if (dispersion < 0.0 || dispersion >= 100.0) {
        throw ValidationError(ErrorInfo::out_of_range("dispersion", dispersion,
                                                      "in the range [0, 100)"));
    }

    VehicleSpec spec;
    spec.front_axle_load = front_load;
    spec.rear_axle_load = rear_load;
    spec.axle_spacing = axle_spacing;
    spec.impact_factor = impact_factor;
    spec.dispersion = dispersion;
    spec.sharing = sharing;

    const Eigen::Vector2d axles = Eigen::Vector2d(front_load, rear_load) * spec.load_scale();
    const double heavier = axles.maxCoeff();
    const double lighter = axles.minCoeff();
    const double L = span;
    const double s = axle_spacing;

    VehicleEnvelope env;
    env.front_load = axles(0);
    env.rear_load = axles(1);

    if (bridge == BridgeType::Cantilever) {
        // Heavier axle at the tip, lighter axle s towards the root
        env.max_moment = heavier * L + lighter * (L - s);
        env.max_shear = axles.sum();
        env.critical_position = L;
        env.axle_pair_moment = env.max_moment;
        return env;
    }

    // Moment: each axle as governing load, then the heavier axle alone
    double best_pair = 0.0;
    double best_position = L / 2.0;
    bool have_pair = false;
    for (int g = 0; g < 2; ++g) {
        double position = 0.0;
        auto moment = critical_moment(L, axles(g), axles(1 - g), s, position);
        if (moment && (!have_pair || *moment > best_pair)) {
            best_pair = *moment;
            best_position = position;
            have_pair = true;
        }
    }

    const double single = heavier * L / 4.0;
    env.axle_pair_moment = best_pair;
    if (!have_pair || single > best_pair) {
        env.max_moment = single;
        env.critical_position = L / 2.0;
        env.single_axle_governs = true;
    } else {
        env.max_moment = best_pair;
        env.critical_position = best_position;
    }

    // Shear: one axle at the support, the other s into the span
    const double shear_front_at_support = axles(0) + axles(1) * (L - s) / L;
    const double shear_rear_at_support = axles(1) + axles(0) * (L - s) / L;
    env.max_shear = std::max(shear_front_at_support, shear_rear_at_support);

    return env;
}

VehicleEnvelope VehicleLoadEnvelope::max_envelope(double span,
                                                  const std::optional<VehicleSpec>& vehicle,
                                                  BridgeType bridge) {
    if (!vehicle) {
        return VehicleEnvelope{};
    }
    return max_envelope(span, vehicle->front_axle_load, vehicle->rear_axle_load,
                        vehicle->axle_spacing, vehicle->impact_factor, vehicle->dispersion,
                        vehicle->sharing, bridge);
}

} // namespace spancheck
