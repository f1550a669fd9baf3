#include "spancheck/beam_actions.hpp"
#include "spancheck/errors.hpp"
#include "spancheck/text.hpp"

namespace spancheck {

BridgeType parse_bridge_type(const std::string& name) {
    const std::string key = normalize_option(name);
    if (key == "simply supported" || key == "simply_supported" || key == "simply-supported") {
        return BridgeType::SimplySupported;
    }
    if (key == "cantilever") {
        return BridgeType::Cantilever;
    }
    if (key == "continuous") {
        ErrorInfo err(ErrorCode::UNSUPPORTED_CONFIGURATION,
            "Field 'bridge_type': continuous multi-span members are not assessed", "bridge_type");
        err.suggestion = "Assess each span as simply supported or cantilever.";
        throw ValidationError(err);
    }
    throw ValidationError(ErrorInfo::malformed_field("bridge_type", name,
                                                     "Simply Supported or Cantilever"));
}

std::string bridge_type_to_string(BridgeType type) {
    switch (type) {
        case BridgeType::SimplySupported: return "Simply Supported";
        case BridgeType::Cantilever: return "Cantilever";
        default: return "Unknown";
    }
}

LoadEffect uniform_load_effect(BridgeType type, double w, double L) {
    if (type == BridgeType::Cantilever) {
        return LoadEffect(w * L * L / 2.0, w * L);
    }
    return LoadEffect(w * L * L / 8.0, w * L / 2.0);
}

LoadEffect point_load_effect(BridgeType type, double P, double L) {
    if (type == BridgeType::Cantilever) {
        return LoadEffect(P * L, P);
    }
    return LoadEffect(P * L / 4.0, P);
}

} // namespace spancheck
