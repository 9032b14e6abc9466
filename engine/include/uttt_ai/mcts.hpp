#pragma once
#include "uttt_ai/search_config.hpp"
#include "uttt_ai/search_node.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace uttt_ai {

// 予算を使い切ってもルートの子に訪問済みのものが無い
class NoDecidableAction : public std::runtime_error {
public:
  explicit NoDecidableAction(const std::string& what) : std::runtime_error(what) {}
};

/**
 * UCB1値
 *
 * visits == 0 なら +inf（他の引数に関係なく）。
 * それ以外は wins/visits + C * sqrt(ln(parent_visits) / visits)。
 * is_opponent なら 1 - value を返す（選択側は常に最大を取るので、相手番では探索側の勝率を最小化する）。
 */
double ucb_value(int wins, int visits, int parent_visits, double exploration_constant, bool is_opponent);

// "[MCTS] Iterations: ..." の1行を出力
void log_decision(int iterations, int best_visits, double win_rate, long long elapsed_ms);

template <typename Action>
struct ChildStats {
  Action action;
  int visits = 0;
  int wins = 0;
};

// 直前の think() のルート直下の統計（展開順）
template <typename Action>
struct SearchSummary {
  std::vector<ChildStats<Action>> children;
  int iterations = 0;
  long long elapsed_ms = 0;
};

/**
 * モンテカルロ木探索
 *
 * Engine は以下を提供する:
 *   State, Action, PlayerId 型
 *   legal_actions(s), next_state(s, a), is_ended(s), current_player(s),
 *   points_values(s)  (終局でのみ有効、PlayerId -> 値、1 が勝ち)
 *
 * 1回の反復: Selection -> Expansion -> Simulation -> Backpropagation
 * 木は think() ごとに作り直す。呼び出し間で残るのは乱数列だけ。
 */
template <typename Engine>
class MCTS {
public:
  using State = typename Engine::State;
  using Action = typename Engine::Action;
  using PlayerId = typename Engine::PlayerId;
  using Node = SearchNode<Action>;

  explicit MCTS(SearchConfig config = SearchConfig{});

  // current_state の手番側として次の一手を返す。
  // 終局状態なら std::invalid_argument、決められなければ NoDecidableAction。
  Action think(const Engine& board, const State& current_state);

  const SearchSummary<Action>& last_summary() const { return summary_; }
  const SearchConfig& config() const { return config_; }

  double ucb(const Node& node, bool is_opponent) const;

  // Selection: 未試行の手がある / 子が無い / 終局 のノードまで UCB で降りる
  std::pair<Node*, State> traverse_nodes(const Engine& board, Node* node, State state, PlayerId bot) const;

  // Expansion: untried_actions の先頭を1つ展開
  std::pair<Node*, State> expand_leaf(const Engine& board, Node* node, State state) const;

  // Simulation: 木に触れずに終局まで進める
  State rollout(const Engine& board, State state, PlayerId bot);

  // 先読みプローブ。小さいほど良い（勝ちは -depth、それ以外は depth）
  int testaction(const Engine& board, const State& state, const Action& action, PlayerId bot);

  // Backpropagation: node からルートまで visits / wins を加算
  static void backpropagate(Node* node, bool won);

  static bool is_win(const Engine& board, const State& state, PlayerId bot);

  // wins/visits 最大の子（同率は先勝ち）。訪問済みの子が無ければ nullptr
  static const Node* best_child(const Node& root);

private:
  SearchConfig config_;
  std::mt19937 rng_;
  SearchSummary<Action> summary_;

  State random_rollout(const Engine& board, State state);
  State semi_greedy_rollout(const Engine& board, State state, PlayerId bot);
  const Action& random_action(const std::vector<Action>& actions);
};

// ============================================================================
// Implementation
// ============================================================================

template <typename Engine>
MCTS<Engine>::MCTS(SearchConfig config)
  : config_(std::move(config)),
    rng_(config_.seed ? *config_.seed : std::random_device{}()) {
  config_.validate();
}

template <typename Engine>
double MCTS<Engine>::ucb(const Node& node, bool is_opponent) const {
  const int parent_visits = node.parent ? node.parent->visits : 0;
  return ucb_value(node.wins, node.visits, parent_visits, config_.exploration_constant, is_opponent);
}

template <typename Engine>
std::pair<typename MCTS<Engine>::Node*, typename MCTS<Engine>::State>
MCTS<Engine>::traverse_nodes(const Engine& board, Node* node, State state, PlayerId bot) const {
  while (!node->children.empty() && node->untried_actions.empty() && !board.is_ended(state)) {
    const bool is_opponent = board.current_player(state) != bot;

    // 同値は後勝ち (>=)
    Node* best = nullptr;
    double best_value = -std::numeric_limits<double>::infinity();
    for (const auto& child : node->children) {
      double value = ucb(*child, is_opponent);
      if (value >= best_value) {
        best_value = value;
        best = child.get();
      }
    }

    node = best;
    state = board.next_state(state, *node->parent_action);
  }
  return {node, std::move(state)};
}

template <typename Engine>
std::pair<typename MCTS<Engine>::Node*, typename MCTS<Engine>::State>
MCTS<Engine>::expand_leaf(const Engine& board, Node* node, State state) const {
  if (node->untried_actions.empty()) {
    return {node, std::move(state)};
  }

  Action action = node->untried_actions.front();
  node->untried_actions.erase(node->untried_actions.begin());

  State next = board.next_state(state, action);
  Node* child = Node::create_child(node, action, board.legal_actions(next));
  return {child, std::move(next)};
}

template <typename Engine>
const typename MCTS<Engine>::Action& MCTS<Engine>::random_action(const std::vector<Action>& actions) {
  std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
  return actions[dist(rng_)];
}

template <typename Engine>
typename MCTS<Engine>::State MCTS<Engine>::rollout(const Engine& board, State state, PlayerId bot) {
  if (config_.rollout == RolloutPolicy::Random) {
    return random_rollout(board, std::move(state));
  }
  return semi_greedy_rollout(board, std::move(state), bot);
}

template <typename Engine>
typename MCTS<Engine>::State MCTS<Engine>::random_rollout(const Engine& board, State state) {
  while (!board.is_ended(state)) {
    std::vector<Action> actions = board.legal_actions(state);
    if (actions.empty()) break;
    state = board.next_state(state, random_action(actions));
  }
  return state;
}

template <typename Engine>
typename MCTS<Engine>::State MCTS<Engine>::semi_greedy_rollout(const Engine& board, State state, PlayerId bot) {
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  while (!board.is_ended(state)) {
    std::vector<Action> actions = board.legal_actions(state);
    if (actions.empty()) break;  // 合法手なしだが終局でない

    // 即終局する手があれば勝敗に関係なく打って終わる
    for (const Action& a : actions) {
      State next = board.next_state(state, a);
      if (board.is_ended(next)) return next;
    }

    const Action* chosen = nullptr;
    if (coin(rng_) < config_.exploration_factor) {
      chosen = &random_action(actions);
    } else {
      int best_score = std::numeric_limits<int>::max();
      for (const Action& a : actions) {
        int score = testaction(board, state, a, bot);
        if (score < best_score) {
          best_score = score;
          chosen = &a;
        }
      }
    }
    state = board.next_state(state, *chosen);

    // 毎回もう半手ランダムに進める
    std::vector<Action> replies = board.legal_actions(state);
    if (replies.empty()) break;
    state = board.next_state(state, random_action(replies));
  }
  return state;
}

template <typename Engine>
int MCTS<Engine>::testaction(const Engine& board, const State& state, const Action& action, PlayerId bot) {
  State probe = state;
  Action next = action;
  int depth = 0;
  while (true) {
    probe = board.next_state(probe, next);
    const bool ended = board.is_ended(probe);
    if (ended || depth >= config_.lookahead_depth) {
      return (ended && is_win(board, probe, bot)) ? -depth : depth;
    }

    std::vector<Action> actions = board.legal_actions(probe);
    if (actions.empty()) return depth;
    next = random_action(actions);
    ++depth;
  }
}

template <typename Engine>
void MCTS<Engine>::backpropagate(Node* node, bool won) {
  for (; node != nullptr; node = node->parent) {
    node->visits++;
    if (won) node->wins++;
  }
}

template <typename Engine>
bool MCTS<Engine>::is_win(const Engine& board, const State& state, PlayerId bot) {
  if (!board.is_ended(state)) {
    throw std::logic_error("is_win called on a non-terminal state");
  }
  return board.points_values(state).at(bot) == 1;
}

template <typename Engine>
const typename MCTS<Engine>::Node* MCTS<Engine>::best_child(const Node& root) {
  const Node* best = nullptr;
  double best_rate = -1.0;
  for (const auto& child : root.children) {
    if (child->visits == 0) continue;
    double rate = static_cast<double>(child->wins) / child->visits;
    if (rate > best_rate) {
      best_rate = rate;
      best = child.get();
    }
  }
  return best;
}

template <typename Engine>
typename MCTS<Engine>::Action MCTS<Engine>::think(const Engine& board, const State& current_state) {
  if (board.is_ended(current_state)) {
    throw std::invalid_argument("think called on a terminal state");
  }

  auto start_time = std::chrono::steady_clock::now();
  auto elapsed_ms = [&start_time]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
  };

  const PlayerId bot = board.current_player(current_state);
  auto root = Node::create_root(board.legal_actions(current_state));

  int iterations = 0;
  while (iterations < config_.iterations) {
    if (config_.time_budget_ms && iterations > 0 && elapsed_ms() >= *config_.time_budget_ms) {
      break;
    }

    // 1. Selection
    auto selected = traverse_nodes(board, root.get(), current_state, bot);

    // 2. Expansion
    auto expanded = expand_leaf(board, selected.first, std::move(selected.second));

    // 3. Simulation
    State terminal = rollout(board, std::move(expanded.second), bot);

    // 4. Backpropagation
    backpropagate(expanded.first, is_win(board, terminal, bot));

    iterations++;
  }

  summary_ = SearchSummary<Action>{};
  summary_.iterations = iterations;
  summary_.elapsed_ms = elapsed_ms();
  for (const auto& child : root->children) {
    summary_.children.push_back(ChildStats<Action>{*child->parent_action, child->visits, child->wins});
  }

  const Node* best = best_child(*root);
  if (best == nullptr) {
    throw NoDecidableAction("no root child was visited after " + std::to_string(iterations) + " iterations");
  }

  if (config_.verbose) {
    log_decision(iterations, best->visits, static_cast<double>(best->wins) / best->visits,
                 summary_.elapsed_ms);
  }

  return *best->parent_action;
}

} // namespace uttt_ai
