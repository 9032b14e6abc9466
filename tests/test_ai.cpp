#include <gtest/gtest.h>
#include "uttt/game_state.hpp"
#include "uttt/rules.hpp"
#include "uttt/move.hpp"
#include "uttt_ai/mcts_policy.hpp"
#include "uttt_ai/random_policy.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace uttt;

namespace {

// Helper function to play a game between two policies
template <typename PolicyOne, typename PolicyTwo>
Player play_game(PolicyOne& one, PolicyTwo& two, GameState state = GameState()) {
  while (!Rules::is_ended(state)) {
    Move move = (state.current_player() == Player::One) ? one.pick(state) : two.pick(state);
    state = Rules::next_state(state, move);
  }
  return Rules::winner(state);
}

bool is_legal_pick(const GameState& s, const Move& m) {
  std::vector<Move> moves = Rules::legal_moves(s);
  return std::find(moves.begin(), moves.end(), m) != moves.end();
}

uttt_ai::SearchConfig fast_seeded(uint32_t seed) {
  uttt_ai::SearchConfig config = uttt_ai::SearchConfig::fast();
  config.seed = seed;
  return config;
}

} // namespace

TEST(AITest, RandomPolicyCanPickMove) {
  GameState state;
  uttt_ai::RandomPolicy policy(1);
  EXPECT_TRUE(is_legal_pick(state, policy.pick(state)));
}

TEST(AITest, RandomPolicyRejectsFinishedGame) {
  const char* won_top_row = "111......111......111......";
  GameState state = GameState::deserialize(std::string(won_top_row) + std::string(54, '.') + " - 2");
  ASSERT_TRUE(Rules::is_ended(state));

  uttt_ai::RandomPolicy policy(1);
  EXPECT_THROW(policy.pick(state), std::invalid_argument);
}

TEST(AITest, MctsPolicyCanPickMove) {
  GameState state;
  uttt_ai::MctsPolicy policy(fast_seeded(3));
  EXPECT_TRUE(is_legal_pick(state, policy.pick(state)));
  EXPECT_EQ(policy.last_summary().iterations, 100);
}

TEST(AITest, MctsPolicyRejectsNegativeIterations) {
  uttt_ai::SearchConfig config = fast_seeded(3);
  config.iterations = -5;
  EXPECT_THROW(uttt_ai::MctsPolicy policy(config), std::invalid_argument);
}

TEST(AITest, MctsTakesGameWinningMove) {
  // One は箱0と箱1を取っており、箱2の上段 (0,2,0,2) で勝てる
  std::string cells(81, '.');
  for (int c = 0; c < 3; ++c) {
    cells[0 * 9 + c] = '1';
    cells[1 * 9 + c] = '1';
    cells[3 * 9 + c] = '2';
  }
  cells[2 * 9 + 0] = '1';
  cells[2 * 9 + 1] = '1';
  cells[4 * 9 + 0] = '2';
  cells[4 * 9 + 4] = '2';
  cells[8 * 9 + 8] = '2';
  GameState state = GameState::deserialize(cells + " 2 1");
  ASSERT_FALSE(Rules::is_ended(state));

  uttt_ai::MctsPolicy policy(fast_seeded(5));
  Move move = policy.pick(state);
  EXPECT_EQ(move.to_string(), "0 2 0 2");
}

TEST(AITest, RandomVsRandomCanFinishGame) {
  uttt_ai::RandomPolicy one(10);
  uttt_ai::RandomPolicy two(11);

  Player winner = play_game(one, two);
  EXPECT_TRUE(winner == Player::One || winner == Player::Two || winner == Player::None);
}

TEST(AITest, MctsVsRandomCanFinishGame) {
  uttt_ai::MctsPolicy one(fast_seeded(21));
  uttt_ai::RandomPolicy two(22);

  Player winner = play_game(one, two);
  EXPECT_TRUE(winner == Player::One || winner == Player::Two || winner == Player::None);

  if (winner == Player::None) {
    std::cout << "MCTS vs Random: Draw\n";
  } else {
    std::cout << "MCTS vs Random: " << player_name(winner) << " wins\n";
  }
}

TEST(AITest, SemiGreedyMctsCanFinishGame) {
  uttt_ai::SearchConfig config = uttt_ai::SearchConfig::thorough();
  config.iterations = 60;
  config.seed = 31;
  uttt_ai::MctsPolicy one(config);
  uttt_ai::MctsPolicy two(fast_seeded(32));

  Player winner = play_game(one, two);
  EXPECT_TRUE(winner == Player::One || winner == Player::Two || winner == Player::None);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
