#pragma once

#include "spancheck/beam_actions.hpp"

#include <string>

namespace spancheck {

/**
 * @brief Highway live load model
 */
enum class LoadingType {
    HA,     ///< Normal traffic: span-dependent UDL plus knife edge load
    HB      ///< Abnormal vehicle expressed in HB units
};

/**
 * @brief Access classification of the structure
 */
enum class AccessType {
    Company,    ///< Private/company access, multiplier 1.3
    Public      ///< Public highway, multiplier 1.5
};

std::string loading_type_to_string(LoadingType type);
std::string access_type_to_string(AccessType type);

/**
 * @brief Parse "HA" / "HB" (case-insensitive)
 * @throws ValidationError naming loading_type otherwise
 */
LoadingType parse_loading_type(const std::string& name);

/**
 * @brief Parse "Company" / "Public" (case-insensitive)
 * @throws ValidationError naming access_type otherwise
 */
AccessType parse_access_type(const std::string& name);

/**
 * @brief Inputs to the highway load model
 */
struct HighwayLoadParameters {
    LoadingType type = LoadingType::HA;
    double span_length = 0.0;     ///< Loaded length [m]
    double loaded_width = 0.0;    ///< Carriageway width carried [m]
    double lane_width = 0.0;      ///< Notional lane width [m]
    AccessType access = AccessType::Public;
    double hb_units = 0.0;        ///< HB units (HB only)
};

/**
 * @brief Highway loading intensities carried by the member
 *
 * udl and kel already include the notional lane count and access multiplier.
 */
struct HighwayLoad {
    LoadingType type = LoadingType::HA;
    int notional_lanes = 1;
    double lane_intensity = 0.0;   ///< HA W per lane, or HB unit load share [kN/m]
    double multiplier = 1.0;       ///< Access multiplier
    double udl = 0.0;              ///< [kN/m]
    double kel = 0.0;              ///< [kN], zero for HB
};

/**
 * @brief Computes HA/HB loading intensities
 *
 * HA:
 *   W = 336 (1/L)^0.67 for L <= 50 m, 36 (1/L)^0.1 beyond [kN/m per lane]
 *   udl = W * lanes * multiplier, kel = 120 * lanes * multiplier
 * HB:
 *   udl = hb_units * 10 / lanes * multiplier, kel = 0
 */
class HighwayLoadModel {
public:
    static constexpr double kel_per_lane = 120.0;       ///< [kN]
    static constexpr double hb_unit_load = 10.0;        ///< [kN] per HB unit
    static constexpr double ha_short_coefficient = 336.0;
    static constexpr double ha_short_exponent = 0.67;
    static constexpr double ha_long_coefficient = 36.0;
    static constexpr double ha_long_exponent = 0.1;
    static constexpr double ha_transition_span = 50.0;  ///< [m]
    static constexpr double lane_ratio_tolerance = 1.0e-9;

    /**
     * @brief Compute the loading carried by the member
     * @throws InvalidLoadingParametersError if span <= 0, lane width <= 0,
     *         loaded width < lane width, or HB units <= 0 for HB loading
     */
    static HighwayLoad compute(const HighwayLoadParameters& params);

    /**
     * @brief Compute HA or HB loading (HB units required for HB)
     */
    static HighwayLoad compute(LoadingType type, double span_length, double loaded_width,
                               double lane_width, AccessType access, double hb_units = 0.0);

    /**
     * @brief HA UDL intensity per notional lane [kN/m], non-increasing in span
     */
    static double ha_udl_per_lane(double span_length);

    /**
     * @brief Number of notional lanes: floor(loaded / lane), at least 1
     *
     * Widths are decimal inputs, so a ratio within lane_ratio_tolerance
     * below a whole number counts as that whole number (11.1 / 3.7 is 3).
     *
     * @throws InvalidLoadingParametersError if the lane count does not fit an int
     */
    static int notional_lanes(double loaded_width, double lane_width);

    static double access_multiplier(AccessType access);

    /**
     * @brief Peak actions of the UDL over the full span plus the KEL at its
     *        most onerous position (midspan / tip)
     */
    static LoadEffect effect(const HighwayLoad& load, BridgeType bridge, double span_length);
};

} // namespace spancheck
