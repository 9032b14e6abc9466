#pragma once
#include <cstdint>
#include <optional>

namespace uttt_ai {

enum class RolloutPolicy {
  Random,      // 終局まで一様ランダム
  SemiGreedy   // 即終局手を優先 + 確率的に先読みプローブ
};

/**
 * MCTSの調整パラメータ
 *
 * 探索ごとに値で渡す。プロセス全体の状態は持たないので、
 * 異なる設定の探索を同時に作れる。
 */
struct SearchConfig {
  int iterations = 750;
  double exploration_constant = 2.0;   // UCBの C
  double exploration_factor = 0.8;     // ロールアウトでランダム手を選ぶ確率
  int lookahead_depth = 20;            // testaction プローブの深さ上限
  RolloutPolicy rollout = RolloutPolicy::SemiGreedy;

  // 設定時は経過時間でも打ち切る（iterations と早い方）
  std::optional<int> time_budget_ms;

  // 未設定なら std::random_device から
  std::optional<uint32_t> seed;

  bool verbose = false;

  // 100 iterations, pure random rollouts
  static SearchConfig fast();

  // 750 iterations, semi-greedy rollouts
  static SearchConfig thorough();

  // Throws std::invalid_argument on out-of-range values.
  void validate() const;
};

} // namespace uttt_ai
