#include "uttt_ai/mcts_policy.hpp"
#include <utility>

namespace uttt_ai {

template class MCTS<uttt::GameEngine>;

MctsPolicy::MctsPolicy(SearchConfig config) : mcts_(std::move(config)) {}

uttt::Move MctsPolicy::pick(const uttt::GameState& s) {
  return mcts_.think(engine_, s);
}

} // namespace uttt_ai
