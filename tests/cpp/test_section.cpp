/**
 * @file test_section.cpp
 * @brief Tests for steel, concrete and timber section properties
 */

#include <catch2/catch.hpp>

#include "spancheck/section.hpp"
#include "spancheck/errors.hpp"

#include <cmath>
#include <utility>

using namespace spancheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

SteelDimensions plate_girder() {
    SteelDimensions dims;
    dims.shape = SteelShape::I;
    dims.flange_width = 300.0;
    dims.flange_thickness = 20.0;
    dims.web_thickness = 10.0;
    dims.depth = 640.0;
    return dims;
}

} // namespace

// =============================================================================
// Steel
// =============================================================================

TEST_CASE("I-section properties from plate dimensions", "[Section][steel]") {
    SteelSection s = SteelSection::derive(plate_girder());

    REQUIRE_THAT(s.A, WithinAbs(18000.0, 1e-9));
    REQUIRE_THAT(s.Iy, WithinRel(1.3336e9, 1e-9));
    REQUIRE_THAT(s.Zel, WithinRel(4.1675e6, 1e-9));
    REQUIRE_THAT(s.Zpl, WithinRel(4.62e6, 1e-9));
    REQUIRE_THAT(s.Iz, WithinRel(9.005e7, 1e-9));
    REQUIRE_THAT(s.Av, WithinAbs(6400.0, 1e-9));
    REQUIRE_THAT(s.ry, WithinRel(std::sqrt(9.005e7 / 18000.0), 1e-12));

    REQUIRE(s.web_depth() == 600.0);
    REQUIRE(s.web_ratio() == 60.0);
    REQUIRE_THAT(s.flange_ratio(), WithinAbs(7.25, 1e-12));
    REQUIRE(s.flange_limit_coefficient() == 9.0);
}

TEST_CASE("Plastic modulus exceeds elastic modulus", "[Section][steel]") {
    SteelSection s = SteelSection::derive(plate_girder());
    REQUIRE(s.Zpl > s.Zel);
}

TEST_CASE("Box section doubles the web terms", "[Section][steel][box]") {
    SteelDimensions dims;
    dims.shape = SteelShape::Box;
    dims.flange_width = 400.0;
    dims.flange_thickness = 20.0;
    dims.web_thickness = 12.0;
    dims.depth = 800.0;

    SteelSection s = SteelSection::derive(dims);
    REQUIRE_THAT(s.A, WithinAbs(34240.0, 1e-9));
    REQUIRE_THAT(s.Zpl, WithinRel(9.7056e6, 1e-9));
    REQUIRE_THAT(s.Iz, WithinRel(900032853.3333, 1e-9));
    REQUIRE_THAT(s.Av, WithinAbs(2.0 * 12.0 * 800.0, 1e-9));
    REQUIRE_THAT(s.flange_ratio(), WithinAbs(18.8, 1e-12));
    REQUIRE(s.flange_limit_coefficient() == 28.0);
}

TEST_CASE("Steel dimensions must be positive", "[Section][steel][errors]") {
    SteelDimensions dims = plate_girder();
    dims.web_thickness = 0.0;
    try {
        SteelSection::derive(dims);
        FAIL("expected InvalidGeometryError");
    } catch (const InvalidGeometryError& e) {
        REQUIRE(e.info().field == "web_thickness");
        REQUIRE(e.code() == ErrorCode::INVALID_GEOMETRY);
    }

    dims = plate_girder();
    dims.flange_width = -300.0;
    REQUIRE_THROWS_AS(SteelSection::derive(dims), InvalidGeometryError);
}

TEST_CASE("Flanges must fit within the depth", "[Section][steel][errors]") {
    SteelDimensions dims = plate_girder();
    dims.flange_thickness = 320.0;
    REQUIRE_THROWS_AS(SteelSection::derive(dims), InvalidGeometryError);
}

// =============================================================================
// Concrete
// =============================================================================

TEST_CASE("Effective depth from a single layer", "[Section][concrete]") {
    ConcreteDimensions dims;
    dims.width = 300.0;
    dims.depth = 600.0;
    dims.layers.emplace_back(4, 25.0, 50.0);

    ConcreteSection s = ConcreteSection::derive(dims);
    REQUIRE_THAT(s.As, WithinRel(1963.495, 1e-6));
    REQUIRE_THAT(s.effective_depth, WithinAbs(550.0, 1e-9));
    REQUIRE_THAT(s.Z, WithinAbs(300.0 * 600.0 * 600.0 / 6.0, 1e-6));
}

TEST_CASE("Effective depth uses the area-weighted cover", "[Section][concrete]") {
    ConcreteDimensions dims;
    dims.width = 300.0;
    dims.depth = 600.0;
    dims.layers.emplace_back(3, 20.0, 40.0);
    dims.layers.emplace_back(2, 16.0, 90.0);

    ConcreteSection s = ConcreteSection::derive(dims);
    REQUIRE_THAT(s.As, WithinRel(1344.6017, 1e-6));
    REQUIRE_THAT(s.weighted_cover, WithinRel(54.95327, 1e-6));
    REQUIRE_THAT(s.effective_depth, WithinRel(600.0 - 54.95327, 1e-6));
}

TEST_CASE("Reinforcement layer order does not change the section", "[Section][concrete][order]") {
    ConcreteDimensions a;
    a.width = 300.0;
    a.depth = 600.0;
    a.layers.emplace_back(3, 20.0, 40.0);
    a.layers.emplace_back(2, 16.0, 90.0);

    ConcreteDimensions b = a;
    std::swap(b.layers[0], b.layers[1]);

    ConcreteSection sa = ConcreteSection::derive(a);
    ConcreteSection sb = ConcreteSection::derive(b);
    REQUIRE_THAT(sa.As, WithinRel(sb.As, 1e-12));
    REQUIRE_THAT(sa.effective_depth, WithinRel(sb.effective_depth, 1e-12));
}

TEST_CASE("Concrete reinforcement errors name the layer", "[Section][concrete][errors]") {
    ConcreteDimensions dims;
    dims.width = 300.0;
    dims.depth = 600.0;
    REQUIRE_THROWS_AS(ConcreteSection::derive(dims), InvalidGeometryError);

    dims.layers.emplace_back(4, 25.0, 50.0);
    dims.layers.emplace_back(2, 20.0, 600.0);
    try {
        ConcreteSection::derive(dims);
        FAIL("expected InvalidGeometryError");
    } catch (const InvalidGeometryError& e) {
        REQUIRE(e.info().field == "rebar_cover_2");
    }

    dims.layers[1] = ReinforcementLayer(2, 0.0, 90.0);
    try {
        ConcreteSection::derive(dims);
        FAIL("expected InvalidGeometryError");
    } catch (const InvalidGeometryError& e) {
        REQUIRE(e.info().field == "rebar_diameter_2");
    }
}

// =============================================================================
// Timber and dispatch
// =============================================================================

TEST_CASE("Timber rectangle properties", "[Section][timber]") {
    TimberSection s = TimberSection::derive(TimberDimensions{200.0, 400.0});
    REQUIRE(s.A == 80000.0);
    REQUIRE_THAT(s.Z, WithinRel(200.0 * 400.0 * 400.0 / 6.0, 1e-12));
    REQUIRE_THAT(s.I, WithinRel(200.0 * 400.0 * 400.0 * 400.0 / 12.0, 1e-12));

    REQUIRE_THROWS_AS(TimberSection::derive(TimberDimensions{0.0, 400.0}), InvalidGeometryError);
}

TEST_CASE("derive_section dispatches on material kind", "[Section][dispatch]") {
    SectionGeometry g = derive_section(MaterialKind::Steel, plate_girder());
    REQUIRE(std::holds_alternative<SteelSection>(g));
    REQUIRE(section_kind(g) == MaterialKind::Steel);
    REQUIRE(section_area(g) == 18000.0);

    REQUIRE_THROWS_AS(derive_section(MaterialKind::Timber, plate_girder()), InvalidGeometryError);
}

TEST_CASE("Default constructed sections hold zero properties", "[Section][defaults]") {
    SteelSection steel;
    REQUIRE(steel.A == 0.0);
    REQUIRE(steel.Zpl == 0.0);
    REQUIRE(steel.ry == 0.0);

    ConcreteSection concrete;
    REQUIRE(concrete.As == 0.0);
    REQUIRE(concrete.effective_depth == 0.0);

    TimberSection timber;
    REQUIRE(timber.Z == 0.0);
}
