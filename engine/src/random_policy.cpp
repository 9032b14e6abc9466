#include "uttt_ai/random_policy.hpp"
#include "uttt/rules.hpp"
#include <stdexcept>

namespace uttt_ai {

RandomPolicy::RandomPolicy() : rng_(std::random_device{}()) {}

RandomPolicy::RandomPolicy(uint32_t seed) : rng_(seed) {}

uttt::Move RandomPolicy::pick(const uttt::GameState& s) {
  std::vector<uttt::Move> moves = uttt::Rules::legal_moves(s);
  if (moves.empty()) {
    throw std::invalid_argument("RandomPolicy::pick: no legal moves");
  }
  std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
  return moves[dist(rng_)];
}

} // namespace uttt_ai
