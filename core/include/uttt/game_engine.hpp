#pragma once
#include "uttt/game_state.hpp"
#include "uttt/move.hpp"
#include "uttt/rules.hpp"
#include "uttt/types.hpp"
#include <map>
#include <vector>

namespace uttt {

/**
 * 探索側から見たゲームエンジン
 *
 * uttt_ai::MCTS が要求する契約（State / Action / PlayerId と5つの関数）を
 * Rules に委譲して提供する。状態を持たない。
 */
class GameEngine {
public:
  using State = GameState;
  using Action = Move;
  using PlayerId = Player;

  std::vector<Move> legal_actions(const GameState& s) const { return Rules::legal_moves(s); }
  GameState next_state(const GameState& s, const Move& m) const { return Rules::next_state(s, m); }
  bool is_ended(const GameState& s) const { return Rules::is_ended(s); }
  Player current_player(const GameState& s) const { return s.current_player(); }
  std::map<Player, int> points_values(const GameState& s) const { return Rules::points_values(s); }
};

} // namespace uttt
