#pragma once

#include "spancheck/beam_actions.hpp"
#include "spancheck/highway_load.hpp"
#include "spancheck/vehicle_envelope.hpp"

#include <string>
#include <vector>

namespace spancheck {

/**
 * @brief Type classification for load cases
 */
enum class LoadType {
    Dead,   ///< Permanent: self weight, surfacing, fixed equipment
    Live    ///< Variable: traffic, pedestrians, imposed loads
};

/**
 * @brief Spatial distribution of a load case
 */
enum class LoadDistribution {
    Uniform,    ///< Full-length UDL, magnitude in [kN/m]
    Point       ///< Concentrated load at its most onerous position, magnitude in [kN]
};

std::string load_type_to_string(LoadType type);
std::string load_distribution_to_string(LoadDistribution distribution);

/**
 * @brief Parse "dead"/"permanent" or "live"/"variable" (case-insensitive)
 * @param text Value to parse
 * @param field Field name reported on failure
 * @throws ValidationError naming the field
 */
LoadType parse_load_type(const std::string& text, const std::string& field);

/**
 * @brief Parse "udl"/"uniform" or "point" (case-insensitive)
 * @throws ValidationError naming the field
 */
LoadDistribution parse_load_distribution(const std::string& text, const std::string& field);

/**
 * @brief A single user-defined load on the member
 *
 * Usage:
 *   LoadCase surfacing("Surfacing", 2.4, LoadType::Dead, "Asphalt", LoadDistribution::Uniform);
 *   LoadEffect e = surfacing.effect(BridgeType::SimplySupported, 12.0);
 */
class LoadCase {
public:
    /**
     * @brief Construct a load case
     * @param description Text shown in the narrative
     * @param magnitude [kN/m] for Uniform, [kN] for Point (must be >= 0)
     * @param type Dead or Live
     * @param material Material tag of the load (e.g. "Asphalt"), informational
     * @param distribution Uniform or Point
     */
    LoadCase(std::string description, double magnitude, LoadType type,
             std::string material = "", LoadDistribution distribution = LoadDistribution::Uniform);

    // Getters
    const std::string& description() const { return description_; }
    double magnitude() const { return magnitude_; }
    LoadType type() const { return type_; }
    const std::string& material() const { return material_; }
    LoadDistribution distribution() const { return distribution_; }

    /**
     * @brief Unit of the magnitude ("kN/m" or "kN")
     */
    std::string unit() const;

    /**
     * @brief Peak moment and shear of this load on the span
     */
    LoadEffect effect(BridgeType bridge, double span) const;

private:
    std::string description_;
    double magnitude_;
    LoadType type_;
    std::string material_;
    LoadDistribution distribution_;
};

/**
 * @brief Partial load factors applied to each load type
 *
 * Type-based: each bucket total is multiplied by its factor
 * when the total demand is formed.
 */
struct LoadFactors {
    double dead = 1.0;    ///< Factor on the dead bucket
    double live = 1.0;    ///< Factor on the live bucket (includes highway and vehicle)

    double get_type_factor(LoadType type) const {
        return type == LoadType::Dead ? dead : live;
    }
};

/**
 * @brief Contribution of one load case to the demand (for the narrative)
 */
struct LoadContribution {
    std::string description;
    LoadType type;
    LoadEffect effect;
};

/**
 * @brief Demand on the member, split by load type
 *
 * The live bucket includes the highway loading and the vehicle envelope;
 * those are also reported separately. The dead bucket includes self weight,
 * also reported separately. Bucket values are unfactored.
 */
struct DemandSummary {
    double dead_moment = 0.0;
    double live_moment = 0.0;
    double dead_shear = 0.0;
    double live_shear = 0.0;
    double vehicle_moment = 0.0;
    double vehicle_shear = 0.0;
    double highway_moment = 0.0;
    double highway_shear = 0.0;
    double self_weight_moment = 0.0;
    double self_weight_shear = 0.0;

    double total_moment = 0.0;  ///< Factored dead + factored live [kN·m]
    double total_shear = 0.0;   ///< Factored dead + factored live [kN]

    std::vector<LoadContribution> contributions;  ///< In load case order
};

/**
 * @brief Aggregates all loads on the member into total demand
 *
 * Summation is order independent; the order of load cases only affects
 * the order of DemandSummary::contributions.
 */
class LoadCombinator {
public:
    /**
     * @brief Combine load cases, highway loading and vehicle envelope
     *
     * @param bridge Support arrangement
     * @param span Span [m]
     * @param load_cases User-defined load cases (in presentation order)
     * @param highway Highway loading intensities
     * @param vehicle Vehicle envelope (zero if no vehicle)
     * @param factors Partial load factors
     * @param self_weight Self weight UDL [kN/m] (0 to omit)
     */
    static DemandSummary combine(BridgeType bridge, double span,
                                 const std::vector<LoadCase>& load_cases,
                                 const HighwayLoad& highway,
                                 const VehicleEnvelope& vehicle,
                                 const LoadFactors& factors = LoadFactors{},
                                 double self_weight = 0.0);
};

} // namespace spancheck
