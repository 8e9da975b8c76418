#ifndef SKIRMISH_GEOMETRY_HPP
#define SKIRMISH_GEOMETRY_HPP

#include "Types.hpp"

namespace skirmish::core
{
    class Combatant;

    // Axis-aligned bounding volume
    struct Volume
    {
        Vec3 center{};
        Vec3 half_extents{};
    };

    // Collision primitives the rules need. The presentation layer owns the real
    // shapes; BoxGeometry is the stand-in used when it does not provide one.
    class Geometry
    {
    public:
        virtual ~Geometry() = default;

        // Volume of the combatant if it stood at `at`
        virtual auto VolumeOf(Combatant const& c, Vec3 at) const -> Volume = 0;
        virtual auto Intersects(Volume const& a, Volume const& b) const -> bool = 0;
        // Closest-point separation, 0 when touching or overlapping
        virtual auto Gap(Volume const& a, Volume const& b) const -> float = 0;
        // Travel along `direction` (unit length) before `moving` first touches `target`.
        // Empty when the straight line never reaches it.
        virtual auto ContactDistance(Volume const& moving, Vec3 direction,
                                     Volume const& target) const -> std::optional<float> = 0;

        auto VolumeOf(Combatant const& c) const -> Volume;
    };

    class BoxGeometry final : public Geometry
    {
    public:
        using Geometry::VolumeOf;

        auto VolumeOf(Combatant const& c, Vec3 at) const -> Volume override;
        auto Intersects(Volume const& a, Volume const& b) const -> bool override;
        auto Gap(Volume const& a, Volume const& b) const -> float override;
        auto ContactDistance(Volume const& moving, Vec3 direction,
                             Volume const& target) const -> std::optional<float> override;
    };
}

#endif //SKIRMISH_GEOMETRY_HPP
