#pragma once
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

// 表で定義する小さなゲーム。状態・行動・プレイヤーは int
struct ScriptedGame {
  using State = int;
  using Action = int;
  using PlayerId = int;

  struct Vertex {
    int player = 1;
    std::vector<std::pair<int, int>> edges;   // (action, next state)
    bool terminal = false;
    int winner = 0;                            // 0 = draw
  };

  std::map<int, Vertex> vertices;

  // next_state が呼ばれた遷移元の状態（呼び出し順）
  mutable std::vector<int> transitions;

  void add_inner(int id, int player, std::vector<std::pair<int, int>> edges) {
    Vertex v;
    v.player = player;
    v.edges = std::move(edges);
    vertices[id] = v;
  }

  void add_terminal(int id, int player, int winner) {
    Vertex v;
    v.player = player;
    v.terminal = true;
    v.winner = winner;
    vertices[id] = v;
  }

  std::vector<int> legal_actions(int s) const {
    std::vector<int> out;
    const Vertex& v = vertices.at(s);
    if (v.terminal) return out;
    for (const auto& e : v.edges) out.push_back(e.first);
    return out;
  }

  int next_state(int s, int a) const {
    transitions.push_back(s);
    for (const auto& e : vertices.at(s).edges) {
      if (e.first == a) return e.second;
    }
    throw std::invalid_argument("ScriptedGame: illegal action");
  }

  bool is_ended(int s) const { return vertices.at(s).terminal; }

  int current_player(int s) const { return vertices.at(s).player; }

  std::map<int, int> points_values(int s) const {
    const Vertex& v = vertices.at(s);
    if (!v.terminal) throw std::logic_error("ScriptedGame: points_values on non-terminal state");
    if (v.winner == 0) return {{1, 0}, {2, 0}};
    return {{v.winner, 1}, {3 - v.winner, -1}};
  }

  // Player 1 to move; action 10 loses at once, action 20 wins at once.
  static ScriptedGame one_move_from_end() {
    ScriptedGame g;
    g.add_inner(0, 1, {{10, 1}, {20, 2}});
    g.add_terminal(1, 2, 2);
    g.add_terminal(2, 2, 1);
    return g;
  }

  // Full binary tree of depth 3 in heap order (children of k: 2k+1, 2k+2).
  // Actions are 0 / 1, player 1 moves at even depth. Leaves 7..14.
  static ScriptedGame binary_tree() {
    ScriptedGame g;
    for (int id = 0; id < 7; ++id) {
      int depth = (id == 0) ? 0 : (id < 3 ? 1 : 2);
      g.add_inner(id, depth % 2 == 0 ? 1 : 2, {{0, 2 * id + 1}, {1, 2 * id + 2}});
    }
    const int winners[8] = {2, 1, 1, 2, 2, 2, 1, 0};
    for (int id = 7; id < 15; ++id) {
      g.add_terminal(id, 2, winners[id - 7]);
    }
    return g;
  }

  // 0 -> 1 -> ... -> length, one action (0) per state; player 1 wins at the end.
  static ScriptedGame chain(int length) {
    ScriptedGame g;
    for (int id = 0; id < length; ++id) {
      g.add_inner(id, id % 2 == 0 ? 1 : 2, {{0, id + 1}});
    }
    g.add_terminal(length, 2, 1);
    return g;
  }

  // 0 -> 1 only. From 1: action 0 wins at once for player 1 (state 2),
  // action 1 detours to 3, whose only action ends in a player 2 win (state 4).
  static ScriptedGame win_or_detour() {
    ScriptedGame g;
    g.add_inner(0, 1, {{0, 1}});
    g.add_inner(1, 2, {{0, 2}, {1, 3}});
    g.add_terminal(2, 1, 1);
    g.add_inner(3, 1, {{0, 4}});
    g.add_terminal(4, 2, 2);
    return g;
  }

  // Player 1 chooses action 0 / 1 / 2 into states 1 / 2 / 3; each has a single
  // action ending in leaf 4 / 5 / 6 with the given winners.
  static ScriptedGame three_way(int w4, int w5, int w6) {
    ScriptedGame g;
    g.add_inner(0, 1, {{0, 1}, {1, 2}, {2, 3}});
    g.add_inner(1, 2, {{0, 4}});
    g.add_inner(2, 2, {{0, 5}});
    g.add_inner(3, 2, {{0, 6}});
    g.add_terminal(4, 1, w4);
    g.add_terminal(5, 1, w5);
    g.add_terminal(6, 1, w6);
    return g;
  }

  // State 1 offers no action but is not flagged terminal.
  static ScriptedGame dead_end() {
    ScriptedGame g;
    g.add_inner(0, 1, {{0, 1}});
    g.add_inner(1, 2, {});
    return g;
  }
};
