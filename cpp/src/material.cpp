#include "spancheck/material.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

#include <cmath>

namespace spancheck {

MaterialSpec::MaterialSpec(std::string grade, MaterialKind kind)
    : grade(std::move(grade)), kind(kind), fy(0.0), fck(0.0), fcu(0.0),
      bending_stress(0.0), shear_stress(0.0), E(0.0), unit_weight(0.0) {
}

MaterialSpec MaterialSpec::steel(std::string grade, double fy, double E) {
    MaterialSpec spec(std::move(grade), MaterialKind::Steel);
    spec.fy = fy;
    spec.E = E;
    spec.unit_weight = 78.5;
    return spec;
}

MaterialSpec MaterialSpec::concrete(std::string grade, double fck, double fcu) {
    MaterialSpec spec(std::move(grade), MaterialKind::Concrete);
    spec.fck = fck;
    spec.fcu = fcu;
    spec.E = compute_Ecm(fck);
    spec.unit_weight = 25.0;  // reinforced concrete
    return spec;
}

MaterialSpec MaterialSpec::timber(std::string grade, double bending_stress, double shear_stress,
                                  double E, double density) {
    MaterialSpec spec(std::move(grade), MaterialKind::Timber);
    spec.bending_stress = bending_stress;
    spec.shear_stress = shear_stress;
    spec.E = E;
    // density [kg/m³] -> unit weight [kN/m³]
    spec.unit_weight = density * 9.81 / 1000.0;
    return spec;
}

double MaterialSpec::compute_Ecm(double fck) {
    double fcm = fck + 8.0;
    return 22.0 * std::pow(fcm / 10.0, 0.3) * 1000.0;
}

std::string material_kind_to_string(MaterialKind kind) {
    switch (kind) {
        case MaterialKind::Steel: return "Steel";
        case MaterialKind::Concrete: return "Concrete";
        case MaterialKind::Timber: return "Timber";
        default: return "Unknown";
    }
}

MaterialKind parse_material_kind(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "steel") return MaterialKind::Steel;
    if (key == "concrete") return MaterialKind::Concrete;
    if (key == "timber") return MaterialKind::Timber;
    throw UnknownMaterialError(
        "Material '" + name + "' is not recognised (expected Steel, Concrete or Timber)",
        "material");
}

const std::vector<MaterialSpec>& MaterialCatalog::table(MaterialKind kind) {
    static const std::vector<MaterialSpec> steel_grades = {
        MaterialSpec::steel("S235", 235.0),
        MaterialSpec::steel("S275", 275.0),
        MaterialSpec::steel("S355", 355.0),
        MaterialSpec::steel("S420", 420.0),
        MaterialSpec::steel("S460", 460.0),
    };

    // Strength classes as fck/fcu
    static const std::vector<MaterialSpec> concrete_grades = {
        MaterialSpec::concrete("C20/25", 20.0, 25.0),
        MaterialSpec::concrete("C25/30", 25.0, 30.0),
        MaterialSpec::concrete("C28/35", 28.0, 35.0),
        MaterialSpec::concrete("C30/37", 30.0, 37.0),
        MaterialSpec::concrete("C32/40", 32.0, 40.0),
        MaterialSpec::concrete("C35/45", 35.0, 45.0),
        MaterialSpec::concrete("C40/50", 40.0, 50.0),
        MaterialSpec::concrete("C45/55", 45.0, 55.0),
        MaterialSpec::concrete("C50/60", 50.0, 60.0),
    };

    // Grade stresses (bending, shear parallel to grain), Emean, mean density
    static const std::vector<MaterialSpec> timber_grades = {
        MaterialSpec::timber("C14", 4.1, 0.60, 6800.0, 350.0),
        MaterialSpec::timber("C16", 5.3, 0.67, 8800.0, 370.0),
        MaterialSpec::timber("C18", 5.8, 0.67, 9100.0, 380.0),
        MaterialSpec::timber("C22", 6.8, 0.71, 9700.0, 410.0),
        MaterialSpec::timber("C24", 7.5, 0.71, 10800.0, 420.0),
        MaterialSpec::timber("C27", 10.0, 1.10, 12300.0, 450.0),
        MaterialSpec::timber("C30", 11.0, 1.20, 12300.0, 460.0),
        MaterialSpec::timber("D30", 9.0, 1.40, 9500.0, 640.0),
        MaterialSpec::timber("D40", 12.5, 2.00, 10800.0, 700.0),
        MaterialSpec::timber("D50", 16.0, 2.20, 15000.0, 780.0),
        MaterialSpec::timber("D60", 19.5, 2.40, 17000.0, 840.0),
        MaterialSpec::timber("D70", 23.0, 2.60, 20000.0, 1080.0),
    };

    switch (kind) {
        case MaterialKind::Steel: return steel_grades;
        case MaterialKind::Concrete: return concrete_grades;
        case MaterialKind::Timber: return timber_grades;
    }
    throw UnknownMaterialError("Material kind has no catalog", "material");
}

const MaterialSpec& MaterialCatalog::resolve(MaterialKind kind, const std::string& grade) {
    const std::string key = normalize_option(grade);
    for (const auto& spec : table(kind)) {
        if (normalize_option(spec.grade) == key) {
            return spec;
        }
    }

    throw UnknownMaterialError(
        "Grade '" + grade + "' is not catalogued for " + material_kind_to_string(kind),
        "grade");
}

const MaterialSpec& MaterialCatalog::resolve(const std::string& kind, const std::string& grade) {
    return resolve(parse_material_kind(kind), grade);
}

std::vector<std::string> MaterialCatalog::grades(MaterialKind kind) {
    std::vector<std::string> result;
    for (const auto& spec : table(kind)) {
        result.push_back(spec.grade);
    }
    return result;
}

} // namespace spancheck
