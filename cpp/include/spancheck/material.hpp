#pragma once

#include <string>
#include <vector>

namespace spancheck {

/**
 * @brief Material families with a capacity method
 */
enum class MaterialKind {
    Steel,      ///< Structural steel, limit state (yield) method
    Concrete,   ///< Reinforced concrete, ultimate flexural theory
    Timber      ///< Solid timber, permissible stress method
};

/**
 * @brief Characteristic material properties for one grade
 *
 * Stores properties in consistent units:
 * - fy, fck, fcu, bending/shear stress, E: [N/mm²]
 * - unit_weight: [kN/m³]
 *
 * Fields that do not apply to a material kind are 0
 * (e.g. fck for steel, fy for timber).
 */
class MaterialSpec {
public:
    std::string grade;      ///< Grade identifier as catalogued (e.g. "S355", "C32/40", "C24")
    MaterialKind kind;      ///< Material family
    double fy;              ///< Steel yield strength [N/mm²]
    double fck;             ///< Concrete characteristic cylinder strength [N/mm²]
    double fcu;             ///< Concrete characteristic cube strength [N/mm²]
    double bending_stress;  ///< Timber grade bending stress parallel to grain [N/mm²]
    double shear_stress;    ///< Timber grade shear stress parallel to grain [N/mm²]
    double E;               ///< Modulus of elasticity (mean) [N/mm²]
    double unit_weight;     ///< Unit weight for self-weight [kN/m³]

    /**
     * @brief Construct a steel grade
     */
    static MaterialSpec steel(std::string grade, double fy, double E = 210000.0);

    /**
     * @brief Construct a concrete grade
     *
     * The mean modulus is computed from the cylinder strength:
     * Ecm = 22 * (fcm / 10)^0.3 [GPa], fcm = fck + 8
     */
    static MaterialSpec concrete(std::string grade, double fck, double fcu);

    /**
     * @brief Construct a timber strength class
     */
    static MaterialSpec timber(std::string grade, double bending_stress, double shear_stress,
                               double E, double density);

    /**
     * @brief Compute mean concrete modulus from cylinder strength
     * @param fck Characteristic cylinder strength [N/mm²]
     * @return double Ecm [N/mm²]
     */
    static double compute_Ecm(double fck);

private:
    MaterialSpec(std::string grade, MaterialKind kind);
};

/**
 * @brief Convert material kind to its display name ("Steel", "Concrete", "Timber")
 */
std::string material_kind_to_string(MaterialKind kind);

/**
 * @brief Parse a material kind name (case-insensitive)
 * @throws UnknownMaterialError if the name is not Steel, Concrete or Timber
 */
MaterialKind parse_material_kind(const std::string& name);

/**
 * @brief Process-wide read-only catalog of material grades
 *
 * The grade tables are built once on first use and never mutated,
 * so concurrent lookups need no synchronisation.
 *
 * Usage:
 *   const MaterialSpec& s355 = MaterialCatalog::resolve(MaterialKind::Steel, "S355");
 *   double fy = s355.fy;  // 355 N/mm²
 */
class MaterialCatalog {
public:
    /**
     * @brief Look up a grade for a material kind
     * @param kind Material family
     * @param grade Grade identifier (case-insensitive, e.g. "s355", "C32/40")
     * @return Catalogued properties
     * @throws UnknownMaterialError if the grade is not catalogued for the kind
     */
    static const MaterialSpec& resolve(MaterialKind kind, const std::string& grade);

    /**
     * @brief Look up a grade by material kind name
     * @throws UnknownMaterialError if the kind or grade is unknown
     */
    static const MaterialSpec& resolve(const std::string& kind, const std::string& grade);

    /**
     * @brief List catalogued grades for a material kind, in catalog order
     */
    static std::vector<std::string> grades(MaterialKind kind);

private:
    static const std::vector<MaterialSpec>& table(MaterialKind kind);
};

} // namespace spancheck
