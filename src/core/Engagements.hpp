#ifndef SKIRMISH_ENGAGEMENTS_HPP
#define SKIRMISH_ENGAGEMENTS_HPP

#include <vector>
#include "Types.hpp"

namespace skirmish::core
{
    class Battlefield;

    // Union-find over a dense index range (combatant ids)
    class DisjointSet
    {
    public:
        explicit DisjointSet(size_t n);

        auto Find(size_t x) -> size_t;
        // Returns false when both were already in the same set
        auto Unite(size_t a, size_t b) -> bool;

    private:
        std::vector<size_t> parent_;
        std::vector<size_t> size_;
    };

    struct Engagement
    {
        // ascending ids
        std::vector<CombatantId> participants;

        auto Contains(CombatantId id) const -> bool;
    };

    // Connected components of the "in base contact" relation, size >= 2.
    // Participants ascending, engagements ordered by their lowest id, so the result
    // only depends on the contact graph.
    auto DiscoverEngagements(Battlefield const& battlefield) -> std::vector<Engagement>;
}

#endif //SKIRMISH_ENGAGEMENTS_HPP
