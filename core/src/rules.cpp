#include "uttt/rules.hpp"
#include "uttt/game_state.hpp"
#include <stdexcept>

namespace uttt {

namespace {

constexpr int kLines[8][3] = {
  {0, 1, 2}, {3, 4, 5}, {6, 7, 8},  // rows
  {0, 3, 6}, {1, 4, 7}, {2, 5, 8},  // columns
  {0, 4, 8}, {2, 4, 6},             // diagonals
};

Player box_owner(BoxStatus status) {
  switch (status) {
    case BoxStatus::WonByOne: return Player::One;
    case BoxStatus::WonByTwo: return Player::Two;
    default: return Player::None;
  }
}

std::array<Player, BOX_COUNT> box_owners(const GameState& s) {
  std::array<Player, BOX_COUNT> owners;
  for (int b = 0; b < BOX_COUNT; ++b) {
    owners[b] = box_owner(s.box(b / BOX_DIM, b % BOX_DIM));
  }
  return owners;
}

bool any_open_box(const GameState& s) {
  for (int b = 0; b < BOX_COUNT; ++b) {
    if (s.box(b / BOX_DIM, b % BOX_DIM) == BoxStatus::Open) return true;
  }
  return false;
}

} // namespace

Player Rules::line_owner(const std::array<Player, BOX_COUNT>& grid) {
  for (const auto& line : kLines) {
    Player p = grid[line[0]];
    if (p != Player::None && grid[line[1]] == p && grid[line[2]] == p) {
      return p;
    }
  }
  return Player::None;
}

std::vector<Move> Rules::legal_moves(const GameState& s) {
  std::vector<Move> out;
  if (is_ended(s)) return out;

  for (int b = 0; b < BOX_COUNT; ++b) {
    if (s.forced_box() >= 0 && s.forced_box() != b) continue;

    const int R = b / BOX_DIM;
    const int C = b % BOX_DIM;
    if (s.box(R, C) != BoxStatus::Open) continue;

    for (int r = 0; r < BOX_DIM; ++r) {
      for (int c = 0; c < BOX_DIM; ++c) {
        if (s.cell(R, C, r, c) != Player::None) continue;
        Move m;
        m.R = R; m.C = C; m.r = r; m.c = c;
        out.push_back(m);
      }
    }
  }
  return out;
}

bool Rules::is_legal(const GameState& s, const Move& m) {
  if (m.R < 0 || m.R >= BOX_DIM || m.C < 0 || m.C >= BOX_DIM ||
      m.r < 0 || m.r >= BOX_DIM || m.c < 0 || m.c >= BOX_DIM) {
    return false;
  }
  if (is_ended(s)) return false;
  if (s.forced_box() >= 0 && s.forced_box() != m.box_index()) return false;
  if (s.box(m.R, m.C) != BoxStatus::Open) return false;
  return s.cell(m.R, m.C, m.r, m.c) == Player::None;
}

GameState Rules::next_state(const GameState& s, const Move& m) {
  if (!is_legal(s, m)) {
    throw std::invalid_argument("illegal move: " + m.to_string());
  }
  GameState next = s;
  next.apply_move(m);
  return next;
}

Player Rules::winner(const GameState& s) {
  return line_owner(box_owners(s));
}

bool Rules::is_ended(const GameState& s) {
  return winner(s) != Player::None || !any_open_box(s);
}

std::map<Player, int> Rules::points_values(const GameState& s) {
  if (!is_ended(s)) {
    throw std::logic_error("points_values called on a non-terminal state");
  }
  Player w = winner(s);
  if (w == Player::None) {
    return {{Player::One, 0}, {Player::Two, 0}};
  }
  return {{w, 1}, {opponent(w), -1}};
}

} // namespace uttt
