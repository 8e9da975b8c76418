#include "Engagements.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <ranges>
#include <utility>

#include "Battlefield.hpp"

namespace skirmish::core
{
    DisjointSet::DisjointSet(size_t const n) :
        parent_(n),
        size_(n, 1)
    {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    auto DisjointSet::Find(size_t x) -> size_t
    {
        while (parent_[x] != x)
        {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    auto DisjointSet::Unite(size_t a, size_t b) -> bool
    {
        a = Find(a);
        b = Find(b);
        if (a == b) return false;
        if (size_[a] < size_[b]) std::swap(a, b);
        parent_[b] = a;
        size_[a] += size_[b];
        return true;
    }

    auto Engagement::Contains(CombatantId const id) const -> bool
    {
        return std::ranges::binary_search(participants, id);
    }

    auto DiscoverEngagements(Battlefield const& battlefield) -> std::vector<Engagement>
    {
        std::vector<CombatantId> const live = battlefield.Live();
        DisjointSet sets(battlefield.Capacity());

        for (size_t i{}; i < live.size(); ++i)
        {
            for (size_t j{i + 1}; j < live.size(); ++j)
            {
                if (battlefield.InContact(live[i], live[j])) sets.Unite(live[i], live[j]);
            }
        }

        // live is ascending, so every group comes out sorted and keyed by its root
        std::map<size_t, std::vector<CombatantId>> groups;
        for (CombatantId const id : live) groups[sets.Find(id)].push_back(id);

        std::vector<Engagement> out;
        for (auto& members : groups | std::views::values)
        {
            if (members.size() >= 2) out.push_back(Engagement{std::move(members)});
        }
        std::ranges::sort(out, {}, [](Engagement const& e) { return e.participants.front(); });
        return out;
    }
}
