#pragma once

#include "spancheck/beam_actions.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spancheck {

/**
 * @brief How axle loads are shared between beam lines
 */
enum class LoadSharing {
    PerBeam,    ///< Half of each axle (one wheel line) per beam, factor 0.5
    Full        ///< Whole axle on the member, factor 1.0
};

std::string load_sharing_to_string(LoadSharing sharing);

/**
 * @brief Parse "per_beam" / "per beam" / "half" and "full" (case-insensitive)
 * @throws ValidationError naming load_sharing otherwise
 */
LoadSharing parse_load_sharing(const std::string& name);

/**
 * @brief Two-axle assessment vehicle
 *
 * Loads are nominal (unfactored) axle loads in [kN].
 */
struct VehicleSpec {
    std::string name;                 ///< Catalog name or "custom"
    double front_axle_load = 0.0;     ///< [kN]
    double rear_axle_load = 0.0;      ///< [kN]
    double axle_spacing = 0.0;        ///< [m]
    double impact_factor = 1.0;       ///< Dynamic amplification (>= 1)
    double dispersion = 0.0;          ///< Percentage reduction for load dispersal [0, 100)
    LoadSharing sharing = LoadSharing::PerBeam;

    /**
     * @brief Combined scale applied to both nominal axle loads
     *
     * impact_factor * (1 - dispersion / 100) * sharing factor
     */
    double load_scale() const;
};

/**
 * @brief Nominal axle loads and spacing of a catalogued vehicle
 */
struct VehicleTemplate {
    std::string name;
    double front_axle_load;   ///< [kN]
    double rear_axle_load;    ///< [kN]
    double axle_spacing;      ///< [m]
};

/**
 * @brief Read-only catalog of two-axle assessment vehicles
 */
class VehicleCatalog {
public:
    /**
     * @brief Find a vehicle by name ("3 tonne", "7.5 tonne", "18 tonne"), case-insensitive
     * @return The template, or std::nullopt if not catalogued
     */
    static std::optional<VehicleTemplate> find(const std::string& name);

    static const std::vector<VehicleTemplate>& all();
};

/**
 * @brief Maximum actions under the vehicle
 */
struct VehicleEnvelope {
    double max_moment = 0.0;          ///< [kN·m]
    double max_shear = 0.0;           ///< [kN]
    double critical_position = 0.0;   ///< Position of the governing axle from the left support / root [m]
    double front_load = 0.0;          ///< Scaled front axle load [kN]
    double rear_load = 0.0;           ///< Scaled rear axle load [kN]
    bool single_axle_governs = false; ///< Heavier axle alone at midspan gave the maximum moment
    double axle_pair_moment = 0.0;    ///< Best two-axle critical position moment [kN·m]

    LoadEffect effect() const { return LoadEffect(max_moment, max_shear); }
};

/**
 * @brief Places a two-axle vehicle on a single span to find peak actions
 *
 * Simply supported spans use the classical critical-position rule: the span
 * midpoint bisects the distance between the resultant R = P1 + P2 and the
 * governing axle, giving M = R (L/2 - c)² / L with c = s P_other / (2R).
 * Both axles are tried as the governing load (each only if the other axle
 * stays on the span), and the heavier axle alone at midspan is also checked.
 * Maximum shear has one axle at the support and the other at distance s
 * inside the span, for both orders.
 *
 * Cantilevers carry the heavier axle at the tip and the other axle s inboard.
 */
class VehicleLoadEnvelope {
public:
    /**
     * @brief Compute the envelope from raw parameters
     *
     * @param span Span length [m]
     * @param front_load Nominal front axle load [kN]
     * @param rear_load Nominal rear axle load [kN]
     * @param axle_spacing Distance between axles [m]
     * @param impact_factor Dynamic amplification
     * @param dispersion Percentage reduction
     * @param sharing Load sharing mode
     * @param bridge Support arrangement (simply supported by default)
     * @throws InvalidVehicleSpacingError if axle_spacing <= 0 or >= span
     * @throws ValidationError if loads are negative, impact factor < 1 or
     *         dispersion outside [0, 100)
     */
    static VehicleEnvelope max_envelope(double span, double front_load, double rear_load,
                                        double axle_spacing, double impact_factor,
                                        double dispersion, LoadSharing sharing,
                                        BridgeType bridge = BridgeType::SimplySupported);

    /**
     * @brief Compute the envelope for an optional vehicle
     *
     * Returns a zero envelope when no vehicle is specified.
     */
    static VehicleEnvelope max_envelope(double span, const std::optional<VehicleSpec>& vehicle,
                                        BridgeType bridge = BridgeType::SimplySupported);

    /**
     * @brief Moment under the governing axle at its critical position (simply supported)
     *
     * @param span Span [m]
     * @param governing Load of the governing axle [kN]
     * @param other Load of the other axle [kN]
     * @param spacing Axle spacing [m]
     * @param[out] position Position of the governing axle from the left support [m]
     * @return Moment [kN·m], or std::nullopt if the other axle would leave the span
     */
    static std::optional<double> critical_moment(double span, double governing, double other,
                                                 double spacing, double& position);
};

} // namespace spancheck
