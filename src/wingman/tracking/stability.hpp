#pragma once

#include "tracking/window_info.hpp"

#include <optional>

// Counts consecutive identical geometry reports and releases a geometry once
// it has been stable for `required_polls` observations. A released geometry
// is not released again until a different one has been released.
class GeometryDebouncer {
public:
    explicit GeometryDebouncer(int required_polls = 3);

    std::optional<Geometry> observe(const std::optional<Geometry>& geometry);
    void reset();

    int stable_count() const { return stable_count_; }
    const std::optional<Geometry>& last_docked() const { return last_docked_; }

private:
    int required_polls_;
    int stable_count_ = 0;
    bool has_observation_ = false;
    std::optional<Geometry> last_observed_;
    std::optional<Geometry> last_docked_;
};
