#include "uttt_ai/mcts.hpp"
#include "uttt_ai/search_config.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace uttt_ai {

// ============================================================================
// SearchConfig
// ============================================================================

SearchConfig SearchConfig::fast() {
  SearchConfig config;
  config.iterations = 100;
  config.rollout = RolloutPolicy::Random;
  return config;
}

SearchConfig SearchConfig::thorough() {
  SearchConfig config;
  config.iterations = 750;
  config.rollout = RolloutPolicy::SemiGreedy;
  return config;
}

void SearchConfig::validate() const {
  if (iterations < 0) {
    throw std::invalid_argument("iterations must be non-negative");
  }
  if (!std::isfinite(exploration_constant) || exploration_constant <= 0.0) {
    throw std::invalid_argument("exploration_constant must be positive and finite");
  }
  if (!(exploration_factor >= 0.0 && exploration_factor <= 1.0)) {
    throw std::invalid_argument("exploration_factor must be within [0, 1]");
  }
  if (lookahead_depth < 1) {
    throw std::invalid_argument("lookahead_depth must be at least 1");
  }
  if (time_budget_ms && *time_budget_ms <= 0) {
    throw std::invalid_argument("time_budget_ms must be positive when set");
  }
}

// ============================================================================
// UCB
// ============================================================================

double ucb_value(int wins, int visits, int parent_visits, double exploration_constant, bool is_opponent) {
  if (visits == 0) {
    return std::numeric_limits<double>::infinity();
  }
  if (parent_visits < visits) {
    throw std::logic_error("ucb_value: parent visited fewer times than child");
  }

  double exploitation = static_cast<double>(wins) / visits;
  double exploration = exploration_constant * std::sqrt(std::log(static_cast<double>(parent_visits)) / visits);
  double value = exploitation + exploration;

  return is_opponent ? 1.0 - value : value;
}

void log_decision(int iterations, int best_visits, double win_rate, long long elapsed_ms) {
  std::cout << "[MCTS] Iterations: " << iterations
            << " | Best move visits: " << best_visits
            << " | Win rate: " << win_rate * 100.0 << "%"
            << " | Time: " << elapsed_ms << "ms\n";
}

} // namespace uttt_ai
