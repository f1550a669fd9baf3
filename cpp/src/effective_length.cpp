#include "spancheck/effective_length.hpp"
#include "spancheck/errors.hpp"

#include <cmath>

namespace spancheck {

namespace {

void require_positive(double value, const std::string& field) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ValidationError(ErrorInfo::out_of_range(field, value, "greater than 0"));
    }
}

} // namespace

SlendernessCurve::SlendernessCurve(Eigen::ArrayXd slenderness, Eigen::ArrayXd factors)
    : slenderness_(std::move(slenderness)), factors_(std::move(factors)) {
    if (slenderness_.size() < 2 || slenderness_.size() != factors_.size()) {
        throw std::invalid_argument("SlendernessCurve: need at least two matching points");
    }
}

const SlendernessCurve& SlendernessCurve::lateral_torsional() {
    static const SlendernessCurve curve = [] {
        Eigen::ArrayXd lambda(10);
        Eigen::ArrayXd chi(10);
        lambda << 0.0, 40.0, 60.0, 80.0, 100.0, 120.0, 150.0, 200.0, 250.0, 300.0;
        chi    << 1.0, 1.00, 0.93, 0.84, 0.74,  0.63,  0.49,  0.33,  0.23,  0.17;
        return SlendernessCurve(lambda, chi);
    }();
    return curve;
}

double SlendernessCurve::reduction_factor(double slenderness) const {
    if (slenderness <= slenderness_(0)) {
        return factors_(0);
    }
    const Eigen::Index last = slenderness_.size() - 1;
    if (slenderness >= slenderness_(last)) {
        return factors_(last);
    }

    Eigen::Index i = 1;
    while (slenderness > slenderness_(i)) {
        ++i;
    }

    double t = (slenderness - slenderness_(i - 1)) / (slenderness_(i) - slenderness_(i - 1));
    return factors_(i - 1) + t * (factors_(i) - factors_(i - 1));
}

EffectiveLengthResult EffectiveLengthResolver::resolve(double actual_length, double k1, double k2) {
    require_positive(actual_length, "effective_member_length");
    require_positive(k1, "k1");
    require_positive(k2, "k2");

    EffectiveLengthResult result;
    result.effective_length = k1 * k2 * actual_length;
    return result;
}

EffectiveLengthResult EffectiveLengthResolver::resolve(double actual_length,
                                                       const EffectiveLengthFactors& factors,
                                                       const MaterialSpec& material,
                                                       const SectionGeometry& section) {
    const auto* steel = std::get_if<SteelSection>(&section);
    if (material.kind != MaterialKind::Steel || steel == nullptr) {
        require_positive(actual_length, "effective_member_length");
        EffectiveLengthResult result;
        result.effective_length = actual_length;
        return result;
    }

    EffectiveLengthResult result = resolve(actual_length, factors.k1, factors.k2);

    // ry is in mm, Le in m
    const double ry_m = steel->ry / 1000.0;
    const double epsilon_scale = std::sqrt(material.fy / 275.0);
    result.slenderness = result.effective_length / ry_m * epsilon_scale;

    const SlendernessCurve& curve = SlendernessCurve::lateral_torsional();
    result.reduction_factor = curve.reduction_factor(result.slenderness);
    result.beyond_curve = result.slenderness > curve.max_slenderness();
    return result;
}

} // namespace spancheck
