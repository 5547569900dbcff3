// types.cpp
#include "types.hpp"

namespace umpire {

int frameIndexOf(const Observation& obs) {
    return std::visit([](const auto& o) { return o.frame_index; }, obs);
}

const BallDetection* usableDetection(const Observation& obs) {
    const auto* det = std::get_if<BallDetection>(&obs);
    if (!det || det->visibility == Visibility::ABSENT) return nullptr;
    return det;
}

const char* toString(Visibility v) {
    switch (v) {
        case Visibility::VISIBLE:  return "visible";
        case Visibility::OCCLUDED: return "occluded";
        case Visibility::ABSENT:   return "absent";
    }
    return "unknown";
}

const char* toString(ImpactType t) {
    switch (t) {
        case ImpactType::BAT:    return "bat";
        case ImpactType::PAD:    return "pad";
        case ImpactType::GROUND: return "ground";
        case ImpactType::STUMPS: return "stumps";
        case ImpactType::WALL:   return "wall";
        case ImpactType::NONE:   return "none";
    }
    return "unknown";
}

const char* toString(Handedness h) {
    return h == Handedness::LEFT ? "left" : "right";
}

}  // namespace umpire
