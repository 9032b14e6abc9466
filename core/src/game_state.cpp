#include "uttt/game_state.hpp"
#include "uttt/rules.hpp"
#include <sstream>
#include <stdexcept>

namespace uttt {

void GameState::reset() {
  cells_.fill(Player::None);
  boxes_.fill(BoxStatus::Open);
  forced_box_ = -1;
  to_move_ = Player::One;
  ply_ = 0;
}

void GameState::refresh_box(int box) {
  std::array<Player, BOX_COUNT> grid;
  bool full = true;
  for (int i = 0; i < BOX_COUNT; ++i) {
    grid[i] = cells_[box * BOX_COUNT + i];
    if (grid[i] == Player::None) full = false;
  }
  Player owner = Rules::line_owner(grid);
  if (owner != Player::None) {
    boxes_[box] = won_by(owner);
  } else if (full) {
    boxes_[box] = BoxStatus::Drawn;
  } else {
    boxes_[box] = BoxStatus::Open;
  }
}

void GameState::apply_move(const Move& m) {
  const int box = m.box_index();
  cells_[box * BOX_COUNT + m.cell_index()] = to_move_;
  if (boxes_[box] == BoxStatus::Open) {
    refresh_box(box);
  }

  // 送り先の箱が閉じていれば自由選択
  const int target = m.cell_index();
  forced_box_ = (boxes_[target] == BoxStatus::Open) ? target : -1;

  to_move_ = opponent(to_move_);
  ++ply_;
}

std::string GameState::serialize() const {
  std::string out;
  out.reserve(CELL_COUNT + 4);
  for (Player p : cells_) {
    out.push_back(p == Player::None ? '.' : (p == Player::One ? '1' : '2'));
  }
  out.push_back(' ');
  out.push_back(forced_box_ < 0 ? '-' : static_cast<char>('0' + forced_box_));
  out.push_back(' ');
  out.push_back(to_move_ == Player::One ? '1' : '2');
  return out;
}

GameState GameState::deserialize(const std::string& text) {
  if (text.size() != CELL_COUNT + 4 || text[CELL_COUNT] != ' ' || text[CELL_COUNT + 2] != ' ') {
    throw std::invalid_argument("malformed position: \"" + text + "\"");
  }

  GameState s;
  int marks = 0;
  for (int i = 0; i < CELL_COUNT; ++i) {
    switch (text[i]) {
      case '.': s.cells_[i] = Player::None; break;
      case '1': s.cells_[i] = Player::One; ++marks; break;
      case '2': s.cells_[i] = Player::Two; ++marks; break;
      default:
        throw std::invalid_argument(std::string("bad cell character '") + text[i] + "' in position");
    }
  }
  for (int b = 0; b < BOX_COUNT; ++b) s.refresh_box(b);

  const char forced = text[CELL_COUNT + 1];
  if (forced == '-') {
    s.forced_box_ = -1;
  } else if (forced >= '0' && forced <= '8') {
    s.forced_box_ = forced - '0';
    if (s.boxes_[s.forced_box_] != BoxStatus::Open) {
      throw std::invalid_argument("position forces play into a closed box");
    }
  } else {
    throw std::invalid_argument(std::string("bad forced box '") + forced + "' in position");
  }

  const char mover = text[CELL_COUNT + 3];
  if (mover == '1') {
    s.to_move_ = Player::One;
  } else if (mover == '2') {
    s.to_move_ = Player::Two;
  } else {
    throw std::invalid_argument(std::string("bad player '") + mover + "' in position");
  }
  s.ply_ = marks;
  return s;
}

std::string GameState::to_string() const {
  std::ostringstream oss;
  for (int R = 0; R < BOX_DIM; ++R) {
    if (R > 0) oss << "------+-------+------\n";
    for (int r = 0; r < BOX_DIM; ++r) {
      for (int C = 0; C < BOX_DIM; ++C) {
        if (C > 0) oss << "| ";
        for (int c = 0; c < BOX_DIM; ++c) {
          Player p = cell(R, C, r, c);
          oss << (p == Player::One ? 'X' : (p == Player::Two ? 'O' : '.')) << ' ';
        }
      }
      oss << "\n";
    }
  }
  oss << "To move: " << player_name(to_move_);
  if (forced_box_ >= 0) {
    oss << " (box " << forced_box_ / BOX_DIM << " " << forced_box_ % BOX_DIM << ")";
  } else {
    oss << " (any box)";
  }
  oss << "\n";
  return oss.str();
}

} // namespace uttt
