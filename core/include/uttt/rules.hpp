#pragma once
#include "uttt/game_state.hpp"
#include "uttt/move.hpp"
#include <array>
#include <map>
#include <vector>

namespace uttt {

class Rules {
public:
  // 箱は行優先、箱内のマスも行優先。終局なら空
  static std::vector<Move> legal_moves(const GameState& s);

  static bool is_legal(const GameState& s, const Move& m);

  // Copy of s with m applied. Throws std::invalid_argument if m is illegal.
  static GameState next_state(const GameState& s, const Move& m);

  static bool is_ended(const GameState& s);

  // Player::None while the game is running or when it ended drawn.
  static Player winner(const GameState& s);

  // +1 / -1 for the winner / loser, 0 / 0 for a draw.
  // Throws std::logic_error when s is not terminal.
  static std::map<Player, int> points_values(const GameState& s);

  // Owner of any complete line in a 3x3 grid (row-major), or Player::None.
  static Player line_owner(const std::array<Player, BOX_COUNT>& grid);
};

} // namespace uttt
