#pragma once
#include <cstdint>

namespace uttt {

// 外側 3x3 の箱 × 内側 3x3 のマス
constexpr int BOX_DIM = 3;
constexpr int BOARD_DIM = BOX_DIM * BOX_DIM;
constexpr int BOX_COUNT = BOX_DIM * BOX_DIM;
constexpr int CELL_COUNT = BOARD_DIM * BOARD_DIM;

// One / Two are the external identities 1 and 2.
enum class Player : uint8_t { None = 0, One = 1, Two = 2 };

enum class BoxStatus : uint8_t { Open = 0, WonByOne = 1, WonByTwo = 2, Drawn = 3 };

constexpr Player opponent(Player p) {
  return p == Player::One ? Player::Two : (p == Player::Two ? Player::One : Player::None);
}

constexpr BoxStatus won_by(Player p) {
  return p == Player::One ? BoxStatus::WonByOne : BoxStatus::WonByTwo;
}

inline const char* player_name(Player p) {
  switch (p) {
    case Player::One: return "One";
    case Player::Two: return "Two";
    default: return "None";
  }
}

} // namespace uttt
