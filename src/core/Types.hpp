#ifndef SKIRMISH_TYPES_HPP
#define SKIRMISH_TYPES_HPP

#define SKM_ENABLE_TEST_HOOKS true

#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <variant>

namespace skirmish::core::constants
{
    // Fight resolution walks initiative tiers from here down to 1
    inline constexpr int MaxInitiative = 10;
    // Added to the movement characteristic for the maximum charge range
    inline constexpr float ChargeRangeBonus = 6.0f;
    inline constexpr float PileInDistance = 3.0f;
    // Boxes closer than this (world units) count as being in base contact
    inline constexpr float ContactTolerance = 0.01f;
    inline constexpr int NoInvulnerableSave = 7;
    inline constexpr size_t PlayerCount = 2;
}

namespace skirmish::core
{
    using PlayerId = uint8_t;
    using CombatantId = uint32_t;

    inline constexpr PlayerId PlayerOne = 1;
    inline constexpr PlayerId PlayerTwo = 2;

    inline constexpr auto OtherPlayer(PlayerId const p) noexcept -> PlayerId
    {
        return p == PlayerOne ? PlayerTwo : PlayerOne;
    }

    struct Vec3
    {
        float x{};
        float y{};
        float z{};
    };

    inline auto operator+(Vec3 const a, Vec3 const b) -> Vec3 { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    inline auto operator-(Vec3 const a, Vec3 const b) -> Vec3 { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    inline auto operator*(Vec3 const a, float const s) -> Vec3 { return {a.x * s, a.y * s, a.z * s}; }
    inline auto operator==(Vec3 const a, Vec3 const b) -> bool { return a.x == b.x && a.y == b.y && a.z == b.z; }

    // Rules distances ignore the vertical axis
    inline auto PlanarDistance(Vec3 const a, Vec3 const b) -> float
    {
        return std::hypot(a.x - b.x, a.z - b.z);
    }

    inline auto PlanarDirection(Vec3 const from, Vec3 const to) -> Vec3
    {
        float const len = PlanarDistance(from, to);
        if (len <= 0.0f) return {};
        return {(to.x - from.x) / len, 0.0f, (to.z - from.z) / len};
    }

    enum class Faction : uint8_t
    {
        AdeptusMechanicus = 0,
        DeathGuard
    };

    enum class FightMode : uint8_t
    {
        PileInOnly,
        PileInAndAttacks
    };

    struct MatchConfig
    {
        // tabletop inches -> world units
        float     conversion_factor{10.0f};
        FightMode fight_mode{FightMode::PileInAndAttacks};
        uint64_t  seed{std::random_device{}()};
    };

    struct WeaponRef
    {
        CombatantId owner{};
        uint8_t index{};

        auto operator<=>(WeaponRef const&) const = default;
    };
}

#endif //SKIRMISH_TYPES_HPP
