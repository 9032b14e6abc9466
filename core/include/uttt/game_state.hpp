#pragma once
#include "uttt/types.hpp"
#include "uttt/move.hpp"
#include <array>
#include <string>

namespace uttt {

class GameState {
public:
  GameState() { reset(); }

  void reset();

  // Places the mover's mark and updates box status, forced box and turn.
  // No legality check here; Rules::next_state validates.
  void apply_move(const Move& m);

  Player current_player() const { return to_move_; }
  int ply() const { return ply_; }

  Player cell(int R, int C, int r, int c) const {
    return cells_[(R * BOX_DIM + C) * BOX_COUNT + r * BOX_DIM + c];
  }
  BoxStatus box(int R, int C) const { return boxes_[R * BOX_DIM + C]; }

  // -1 = free choice
  int forced_box() const { return forced_box_; }

  // 81 cell chars ('.', '1', '2') + ' ' + forced box ('-' or 0-8) + ' ' + player ('1' / '2')
  std::string serialize() const;
  static GameState deserialize(const std::string& text);

  std::string to_string() const;

  bool operator==(const GameState& o) const {
    return cells_ == o.cells_ && forced_box_ == o.forced_box_ && to_move_ == o.to_move_;
  }
  bool operator!=(const GameState& o) const { return !(*this == o); }

private:
  std::array<Player, CELL_COUNT> cells_{};    // 箱ごとに連続: (box * 9 + cell)
  std::array<BoxStatus, BOX_COUNT> boxes_{};
  int forced_box_ = -1;
  Player to_move_ = Player::One;
  int ply_ = 0;

  void refresh_box(int box);
};

} // namespace uttt
