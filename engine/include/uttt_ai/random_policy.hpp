#pragma once
#include "uttt/game_state.hpp"
#include "uttt/move.hpp"
#include <cstdint>
#include <random>

namespace uttt_ai {

class RandomPolicy {
public:
  RandomPolicy();
  explicit RandomPolicy(uint32_t seed);

  // Throws std::invalid_argument when s has no legal move.
  uttt::Move pick(const uttt::GameState& s);

private:
  std::mt19937 rng_;
};

} // namespace uttt_ai
