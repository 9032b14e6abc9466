#pragma once
#include "uttt/types.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace uttt {

// (R, C) = 外側の箱, (r, c) = 箱の中のマス
struct Move {
  int R = 0, C = 0;
  int r = 0, c = 0;

  int box_index() const { return R * BOX_DIM + C; }
  int cell_index() const { return r * BOX_DIM + c; }

  // "R C r c"
  std::string to_string() const;
};

inline bool operator==(const Move& a, const Move& b) {
  return a.R == b.R && a.C == b.C && a.r == b.r && a.c == b.c;
}

inline bool operator!=(const Move& a, const Move& b) { return !(a == b); }

} // namespace uttt

namespace std {
template <>
struct hash<uttt::Move> {
  size_t operator()(const uttt::Move& m) const noexcept {
    return static_cast<size_t>(m.box_index() * uttt::BOX_COUNT + m.cell_index());
  }
};
} // namespace std
