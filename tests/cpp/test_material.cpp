/**
 * @file test_material.cpp
 * @brief Tests for the material catalog
 */

#include <catch2/catch.hpp>

#include "spancheck/material.hpp"
#include "spancheck/errors.hpp"

using namespace spancheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Steel grades resolve to their yield strength", "[Material][steel]") {
    const MaterialSpec& s355 = MaterialCatalog::resolve(MaterialKind::Steel, "S355");
    REQUIRE(s355.kind == MaterialKind::Steel);
    REQUIRE(s355.fy == 355.0);
    REQUIRE(s355.E == 210000.0);
    REQUIRE(s355.unit_weight == 78.5);

    REQUIRE(MaterialCatalog::resolve(MaterialKind::Steel, "S275").fy == 275.0);
}

TEST_CASE("Grade and kind matching is case-insensitive", "[Material][lookup]") {
    const MaterialSpec& a = MaterialCatalog::resolve("steel", "s355");
    const MaterialSpec& b = MaterialCatalog::resolve("  STEEL ", "S355");
    REQUIRE(&a == &b);

    REQUIRE(MaterialCatalog::resolve("Concrete", "c32/40").fck == 32.0);
    REQUIRE(MaterialCatalog::resolve("TIMBER", "c24").bending_stress == 7.5);
}

TEST_CASE("Concrete grades carry fck, fcu and Ecm", "[Material][concrete]") {
    const MaterialSpec& c = MaterialCatalog::resolve(MaterialKind::Concrete, "C32/40");
    REQUIRE(c.fck == 32.0);
    REQUIRE(c.fcu == 40.0);
    REQUIRE(c.unit_weight == 25.0);
    // Ecm = 22 (40/10)^0.3 GPa
    REQUIRE_THAT(c.E, WithinRel(33345.8, 1e-4));
    REQUIRE_THAT(MaterialSpec::compute_Ecm(32.0), WithinRel(c.E, 1e-12));
}

TEST_CASE("Timber unit weight derives from density", "[Material][timber]") {
    const MaterialSpec& t = MaterialCatalog::resolve(MaterialKind::Timber, "C24");
    REQUIRE(t.shear_stress == 0.71);
    REQUIRE_THAT(t.unit_weight, WithinAbs(420.0 * 9.81 / 1000.0, 1e-12));
}

TEST_CASE("Unknown material kind is rejected", "[Material][errors]") {
    REQUIRE_THROWS_AS(parse_material_kind("Composite"), UnknownMaterialError);
    REQUIRE_THROWS_AS(MaterialCatalog::resolve("Aluminium", "6061"), UnknownMaterialError);

    try {
        parse_material_kind("Composite");
        FAIL("expected UnknownMaterialError");
    } catch (const UnknownMaterialError& e) {
        REQUIRE(e.code() == ErrorCode::UNKNOWN_MATERIAL);
        REQUIRE(e.info().field == "material");
        REQUIRE(e.info().message.find("Composite") != std::string::npos);
    }
}

TEST_CASE("Unknown grade names the grade", "[Material][errors]") {
    try {
        MaterialCatalog::resolve(MaterialKind::Steel, "S999");
        FAIL("expected UnknownMaterialError");
    } catch (const UnknownMaterialError& e) {
        REQUIRE(e.info().field == "grade");
        REQUIRE(e.info().message.find("S999") != std::string::npos);
    }

    // Concrete grade is not a steel grade
    REQUIRE_THROWS_AS(MaterialCatalog::resolve(MaterialKind::Steel, "C32/40"), UnknownMaterialError);
}

TEST_CASE("Catalog lists grades per kind", "[Material][lookup]") {
    auto steel = MaterialCatalog::grades(MaterialKind::Steel);
    REQUIRE(steel.size() == 5);
    REQUIRE(steel.front() == "S235");

    auto timber = MaterialCatalog::grades(MaterialKind::Timber);
    REQUIRE(timber.size() == 12);
    REQUIRE(timber.back() == "D70");

    REQUIRE(material_kind_to_string(MaterialKind::Concrete) == "Concrete");
}
