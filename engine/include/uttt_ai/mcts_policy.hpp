#pragma once
#include "uttt/game_engine.hpp"
#include "uttt/game_state.hpp"
#include "uttt/move.hpp"
#include "uttt_ai/mcts.hpp"
#include "uttt_ai/search_config.hpp"

namespace uttt_ai {

extern template class MCTS<uttt::GameEngine>;

/**
 * Ultimate Tic-Tac-Toe 用の MCTS プレイヤー
 *
 * 使用例：
 *   MctsPolicy policy(SearchConfig::thorough());
 *   Move move = policy.pick(current_state);
 */
class MctsPolicy {
public:
  explicit MctsPolicy(SearchConfig config = SearchConfig::thorough());

  uttt::Move pick(const uttt::GameState& s);

  const SearchSummary<uttt::Move>& last_summary() const { return mcts_.last_summary(); }

private:
  uttt::GameEngine engine_;
  MCTS<uttt::GameEngine> mcts_;
};

} // namespace uttt_ai
