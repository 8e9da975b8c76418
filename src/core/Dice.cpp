#include "Dice.hpp"

namespace skirmish::core
{
    RandomDice::RandomDice(uint64_t const seed) :
        rng_{seed}
    {
    }

    auto RandomDice::RollD6() -> int
    {
        return d6_(rng_);
    }
}
