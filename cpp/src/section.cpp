#include "spancheck/section.hpp"
#include "spancheck/errors.hpp"

#include <Eigen/Dense>
#include <cmath>

namespace spancheck {

namespace {

constexpr double PI = 3.14159265358979323846;

void require_positive(double value, const std::string& field) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidGeometryError(
            "Section dimension '" + field + "' must be a positive number (got " +
            std::to_string(value) + ")", field);
    }
}

} // namespace

double ReinforcementLayer::area() const {
    return bar_count * PI * bar_diameter * bar_diameter / 4.0;
}

SteelSection SteelSection::derive(const SteelDimensions& dims) {
    require_positive(dims.flange_width, "flange_width");
    require_positive(dims.flange_thickness, "flange_thickness");
    require_positive(dims.web_thickness, "web_thickness");
    require_positive(dims.depth, "beam_depth");

    const double b = dims.flange_width;
    const double tf = dims.flange_thickness;
    const double tw = dims.web_thickness;
    const double h = dims.depth;
    const double hw = h - 2.0 * tf;

    if (hw <= 0.0) {
        throw InvalidGeometryError(
            "Flanges (2 x " + std::to_string(tf) + " mm) do not fit within beam_depth " +
            std::to_string(h) + " mm", "flange_thickness");
    }

    const int webs = dims.shape == SteelShape::Box ? 2 : 1;
    if (webs * tw >= b) {
        throw InvalidGeometryError(
            "Web thickness does not fit within flange_width", "web_thickness");
    }

    SteelSection s;
    s.dims = dims;

    s.A = 2.0 * b * tf + webs * tw * hw;

    // Full rectangle less the voids beside the web(s)
    s.Iy = b * h * h * h / 12.0 - (b - webs * tw) * hw * hw * hw / 12.0;
    s.Zel = s.Iy / (h / 2.0);
    s.Zpl = b * tf * (h - tf) + webs * tw * hw * hw / 4.0;

    if (dims.shape == SteelShape::Box) {
        double web_offset = (b - tw) / 2.0;
        s.Iz = 2.0 * tf * b * b * b / 12.0
             + 2.0 * (hw * tw * tw * tw / 12.0 + hw * tw * web_offset * web_offset);
    } else {
        s.Iz = 2.0 * tf * b * b * b / 12.0 + hw * tw * tw * tw / 12.0;
    }

    s.Av = webs * tw * h;
    s.ry = std::sqrt(s.Iz / s.A);
    return s;
}

double SteelSection::flange_ratio() const {
    if (dims.shape == SteelShape::Box) {
        return (dims.flange_width - 2.0 * dims.web_thickness) / dims.flange_thickness;
    }
    return (dims.flange_width - dims.web_thickness) / 2.0 / dims.flange_thickness;
}

double SteelSection::flange_limit_coefficient() const {
    return dims.shape == SteelShape::Box ? 28.0 : 9.0;
}

ConcreteSection ConcreteSection::derive(const ConcreteDimensions& dims) {
    require_positive(dims.width, "beam_width");
    require_positive(dims.depth, "beam_depth");

    if (dims.layers.empty()) {
        throw InvalidGeometryError(
            "Concrete section requires at least one reinforcement layer", "rebar_count_1");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(dims.layers.size());
    Eigen::ArrayXd areas(n);
    Eigen::ArrayXd covers(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& layer = dims.layers[static_cast<size_t>(i)];
        const std::string suffix = "_" + std::to_string(i + 1);

        if (layer.bar_count <= 0) {
            throw InvalidGeometryError(
                "Reinforcement layer " + std::to_string(i + 1) + " must have at least one bar",
                "rebar_count" + suffix);
        }
        require_positive(layer.bar_diameter, "rebar_diameter" + suffix);
        require_positive(layer.cover, "rebar_cover" + suffix);
        if (layer.cover >= dims.depth) {
            throw InvalidGeometryError(
                "Reinforcement layer " + std::to_string(i + 1) +
                " cover must be less than beam_depth", "rebar_cover" + suffix);
        }

        areas(i) = layer.area();
        covers(i) = layer.cover;
    }

    ConcreteSection s;
    s.dims = dims;
    s.A = dims.width * dims.depth;
    s.Z = dims.width * dims.depth * dims.depth / 6.0;
    s.I = dims.width * std::pow(dims.depth, 3) / 12.0;
    s.As = areas.sum();
    s.weighted_cover = (areas * covers).sum() / s.As;
    s.effective_depth = dims.depth - s.weighted_cover;
    return s;
}

TimberSection TimberSection::derive(const TimberDimensions& dims) {
    require_positive(dims.width, "beam_width");
    require_positive(dims.depth, "beam_depth");

    TimberSection s;
    s.dims = dims;
    s.A = dims.width * dims.depth;
    s.Z = dims.width * dims.depth * dims.depth / 6.0;
    s.I = dims.width * std::pow(dims.depth, 3) / 12.0;
    return s;
}

SectionGeometry derive_section(MaterialKind kind, const SectionDimensions& dimensions) {
    switch (kind) {
        case MaterialKind::Steel:
            if (auto dims = std::get_if<SteelDimensions>(&dimensions)) {
                return SteelSection::derive(*dims);
            }
            break;
        case MaterialKind::Concrete:
            if (auto dims = std::get_if<ConcreteDimensions>(&dimensions)) {
                return ConcreteSection::derive(*dims);
            }
            break;
        case MaterialKind::Timber:
            if (auto dims = std::get_if<TimberDimensions>(&dimensions)) {
                return TimberSection::derive(*dims);
            }
            break;
    }

    throw InvalidGeometryError(
        "Section dimensions do not describe a " + material_kind_to_string(kind) + " section",
        "material");
}

MaterialKind section_kind(const SectionGeometry& section) {
    if (std::holds_alternative<SteelSection>(section)) return MaterialKind::Steel;
    if (std::holds_alternative<ConcreteSection>(section)) return MaterialKind::Concrete;
    return MaterialKind::Timber;
}

double section_area(const SectionGeometry& section) {
    return std::visit([](const auto& s) { return s.A; }, section);
}

} // namespace spancheck
