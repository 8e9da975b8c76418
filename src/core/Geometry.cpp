#include "Geometry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "Combatant.hpp"

namespace skirmish::core
{
    namespace
    {
        auto Axes(Vec3 const v) -> std::array<float, 3> { return {v.x, v.y, v.z}; }
    }

    auto Geometry::VolumeOf(Combatant const& c) const -> Volume
    {
        return VolumeOf(c, c.Position());
    }

    auto BoxGeometry::VolumeOf(Combatant const& c, Vec3 const at) const -> Volume
    {
        return Volume{.center = at, .half_extents = c.Footprint()};
    }

    auto BoxGeometry::Intersects(Volume const& a, Volume const& b) const -> bool
    {
        auto const ca = Axes(a.center), cb = Axes(b.center);
        auto const ha = Axes(a.half_extents), hb = Axes(b.half_extents);
        for (size_t i{}; i < 3; ++i)
        {
            if (std::fabs(ca[i] - cb[i]) > ha[i] + hb[i] + constants::ContactTolerance) return false;
        }
        return true;
    }

    auto BoxGeometry::Gap(Volume const& a, Volume const& b) const -> float
    {
        auto const ca = Axes(a.center), cb = Axes(b.center);
        auto const ha = Axes(a.half_extents), hb = Axes(b.half_extents);
        float sq{};
        for (size_t i{}; i < 3; ++i)
        {
            float const sep = std::max(std::fabs(ca[i] - cb[i]) - (ha[i] + hb[i]), 0.0f);
            sq += sep * sep;
        }
        return std::sqrt(sq);
    }

    auto BoxGeometry::ContactDistance(Volume const& moving, Vec3 const direction,
                                      Volume const& target) const -> std::optional<float>
    {
        // slab test on the Minkowski sum of both boxes
        auto const cm = Axes(moving.center), ct = Axes(target.center), d = Axes(direction);
        auto const hm = Axes(moving.half_extents), ht = Axes(target.half_extents);

        float t_enter = -std::numeric_limits<float>::infinity();
        float t_exit = std::numeric_limits<float>::infinity();

        for (size_t i{}; i < 3; ++i)
        {
            float const reach = hm[i] + ht[i];
            float const offset = ct[i] - cm[i];
            if (d[i] == 0.0f)
            {
                if (std::fabs(offset) > reach + constants::ContactTolerance) return std::nullopt;
                continue;
            }
            float t1 = (offset - reach) / d[i];
            float t2 = (offset + reach) / d[i];
            if (t1 > t2) std::swap(t1, t2);
            t_enter = std::max(t_enter, t1);
            t_exit = std::min(t_exit, t2);
        }

        if (t_enter > t_exit || t_exit < 0.0f) return std::nullopt;
        return std::max(t_enter, 0.0f);
    }
}
