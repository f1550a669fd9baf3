#pragma once

#include "spancheck/material.hpp"

#include <string>
#include <variant>
#include <vector>

namespace spancheck {

/**
 * @brief Steel cross-section shape
 */
enum class SteelShape {
    I,      ///< Doubly symmetric I-section, one web
    Box     ///< Box girder, two webs, flanges spanning between them
};

/**
 * @brief One layer of tension reinforcement
 *
 * Dimensions in [mm]. Cover is measured from the tension face to the
 * bar centroid.
 */
struct ReinforcementLayer {
    int bar_count = 0;          ///< Number of bars in the layer
    double bar_diameter = 0.0;  ///< Bar diameter [mm]
    double cover = 0.0;         ///< Tension face to bar centroid [mm]

    ReinforcementLayer() = default;
    ReinforcementLayer(int count, double diameter, double cover_mm)
        : bar_count(count), bar_diameter(diameter), cover(cover_mm) {}

    /**
     * @brief Steel area of the layer: n * pi * d² / 4 [mm²]
     */
    double area() const;
};

/// Raw steel section dimensions [mm] (depth is the overall depth)
struct SteelDimensions {
    SteelShape shape = SteelShape::I;
    double flange_width = 0.0;
    double flange_thickness = 0.0;
    double web_thickness = 0.0;
    double depth = 0.0;
};

/// Raw rectangular reinforced concrete dimensions [mm]
struct ConcreteDimensions {
    double width = 0.0;
    double depth = 0.0;
    std::vector<ReinforcementLayer> layers;
};

/// Raw rectangular timber dimensions [mm]
struct TimberDimensions {
    double width = 0.0;
    double depth = 0.0;
};

/// Raw dimensions as supplied by the caller, one alternative per material
using SectionDimensions = std::variant<SteelDimensions, ConcreteDimensions, TimberDimensions>;

/**
 * @brief Steel I or box section with derived properties
 *
 * Geometric properties in [mm] units:
 * - A: Cross-sectional area [mm²]
 * - Iy: Major axis second moment of area [mm⁴]
 * - Iz: Minor axis second moment of area [mm⁴]
 * - Zel, Zpl: Elastic and plastic section moduli about the major axis [mm³]
 * - Av: Shear area (web thickness x overall depth, per web) [mm²]
 * - ry: Minor axis radius of gyration [mm]
 */
class SteelSection {
public:
    SteelDimensions dims;   ///< Dimensions the properties were derived from

    double A = 0.0;
    double Iy = 0.0;
    double Iz = 0.0;
    double Zel = 0.0;
    double Zpl = 0.0;
    double Av = 0.0;
    double ry = 0.0;

    /**
     * @brief Derive properties from thin-walled plate dimensions
     * @throws InvalidGeometryError if any dimension is missing, non-positive
     *         or the plates do not fit together
     */
    static SteelSection derive(const SteelDimensions& dims);

    /// Clear web depth between flanges [mm]
    double web_depth() const { return dims.depth - 2.0 * dims.flange_thickness; }

    /**
     * @brief Compression flange width-to-thickness ratio
     *
     * Outstand (b - tw) / 2 / tf for I-sections, internal panel
     * (b - 2 tw) / tf for box sections.
     */
    double flange_ratio() const;

    /**
     * @brief Compact limit coefficient for flange_ratio(), to be multiplied by epsilon
     *
     * 9 for outstand flanges, 28 for internal panels.
     */
    double flange_limit_coefficient() const;

    /// Web depth-to-thickness ratio hw / tw
    double web_ratio() const { return web_depth() / dims.web_thickness; }

    /// Compact web limit coefficient, to be multiplied by epsilon
    static constexpr double web_limit_coefficient = 80.0;
};

/**
 * @brief Rectangular reinforced concrete section with derived properties
 *
 * - As: Total tension reinforcement area [mm²]
 * - weighted_cover: Area-weighted centroid of the layers from the tension face [mm]
 * - effective_depth: depth - weighted_cover [mm]
 * - A, Z, I: Gross concrete properties [mm², mm³, mm⁴]
 *
 * Only total area and area-weighted cover enter the properties,
 * so the order of layers has no effect.
 */
class ConcreteSection {
public:
    ConcreteDimensions dims;

    double A = 0.0;
    double Z = 0.0;
    double I = 0.0;
    double As = 0.0;
    double weighted_cover = 0.0;
    double effective_depth = 0.0;

    /**
     * @brief Derive properties
     * @throws InvalidGeometryError if width/depth are non-positive, no layer is
     *         given, or a layer has a non-positive count, diameter or cover,
     *         or cover not inside the depth
     */
    static ConcreteSection derive(const ConcreteDimensions& dims);
};

/**
 * @brief Rectangular timber section with derived properties
 *
 * A = b h, Z = b h² / 6, I = b h³ / 12 [mm², mm³, mm⁴]
 */
class TimberSection {
public:
    TimberDimensions dims;

    double A = 0.0;
    double Z = 0.0;
    double I = 0.0;

    /**
     * @brief Derive properties
     * @throws InvalidGeometryError if width or depth is non-positive
     */
    static TimberSection derive(const TimberDimensions& dims);
};

/// Derived section, kind-tagged by alternative
using SectionGeometry = std::variant<SteelSection, ConcreteSection, TimberSection>;

/**
 * @brief Derive section properties for a material kind
 *
 * @param kind Material kind the dimensions must describe
 * @param dimensions Raw dimensions
 * @return Derived section (alternative matching the kind)
 * @throws InvalidGeometryError if the dimensions do not match the kind
 *         or any dimension is invalid
 */
SectionGeometry derive_section(MaterialKind kind, const SectionDimensions& dimensions);

/**
 * @brief Material kind described by a derived section
 */
MaterialKind section_kind(const SectionGeometry& section);

/**
 * @brief Gross cross-sectional area of any section [mm²]
 */
double section_area(const SectionGeometry& section);

} // namespace spancheck
