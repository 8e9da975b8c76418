#ifndef SKIRMISH_DICE_HPP
#define SKIRMISH_DICE_HPP

#include <cstdint>
#include <random>

namespace skirmish::core
{
    // The only source of randomness the rules consume
    class Dice
    {
    public:
        virtual ~Dice() = default;
        // Uniform in [1, 6]
        virtual auto RollD6() -> int = 0;
    };

    class RandomDice final : public Dice
    {
    public:
        explicit RandomDice(uint64_t seed);

        auto RollD6() -> int override;

    private:
        std::mt19937_64 rng_;
        std::uniform_int_distribution<int> d6_{1, 6};
    };
}

#endif //SKIRMISH_DICE_HPP
