#pragma once

#include <string>

namespace spancheck {

/**
 * @brief Single-span support arrangement
 *
 * Only statically determinate single spans are modelled.
 */
enum class BridgeType {
    SimplySupported,    ///< Pinned at both ends
    Cantilever          ///< Fixed at the root, free at the tip
};

/**
 * @brief Parse a bridge type name (case-insensitive)
 *
 * Accepts "Simply Supported" / "simply_supported" and "Cantilever".
 *
 * @throws ValidationError for "Continuous" (multi-span) or any other name
 */
BridgeType parse_bridge_type(const std::string& name);

/**
 * @brief Convert bridge type to display name
 */
std::string bridge_type_to_string(BridgeType type);

/**
 * @brief Peak internal actions produced by one load
 *
 * Sign conventions are not tracked: all loads act downwards
 * and peaks are reported as magnitudes.
 */
struct LoadEffect {
    double moment = 0.0;  ///< Peak bending moment [kN·m]
    double shear = 0.0;   ///< Peak shear force [kN]

    LoadEffect() = default;
    LoadEffect(double m, double v) : moment(m), shear(v) {}

    LoadEffect& operator+=(const LoadEffect& other) {
        moment += other.moment;
        shear += other.shear;
        return *this;
    }

    LoadEffect operator*(double factor) const {
        return LoadEffect(moment * factor, shear * factor);
    }
};

inline LoadEffect operator+(LoadEffect a, const LoadEffect& b) {
    a += b;
    return a;
}

/**
 * @brief Peak actions from a full-length uniformly distributed load
 *
 * - Simply supported: M = w L² / 8, V = w L / 2
 * - Cantilever: M = w L² / 2, V = w L
 *
 * @param type Support arrangement
 * @param w Load intensity [kN/m]
 * @param L Span [m]
 */
LoadEffect uniform_load_effect(BridgeType type, double w, double L);

/**
 * @brief Peak actions from a point load at its most onerous position
 *
 * - Simply supported: moment with the load at midspan, M = P L / 4;
 *   shear with the load at a support, V = P
 * - Cantilever: load at the tip, M = P L, V = P
 *
 * @param type Support arrangement
 * @param P Load magnitude [kN]
 * @param L Span [m]
 */
LoadEffect point_load_effect(BridgeType type, double P, double L);

} // namespace spancheck
