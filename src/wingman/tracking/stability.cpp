#include "tracking/stability.hpp"

#include <algorithm>

GeometryDebouncer::GeometryDebouncer(int required_polls)
    : required_polls_(std::max(1, required_polls)) {}

std::optional<Geometry> GeometryDebouncer::observe(const std::optional<Geometry>& geometry) {
    if (has_observation_ && geometry == last_observed_) {
        ++stable_count_;
    } else {
        stable_count_ = 1;
        last_observed_ = geometry;
        has_observation_ = true;
    }

    if (stable_count_ < required_polls_) return std::nullopt;
    if (!geometry || !geometry->valid()) return std::nullopt;
    if (geometry == last_docked_) return std::nullopt;

    last_docked_ = geometry;
    return geometry;
}

void GeometryDebouncer::reset() {
    stable_count_ = 0;
    has_observation_ = false;
    last_observed_.reset();
    last_docked_.reset();
}
