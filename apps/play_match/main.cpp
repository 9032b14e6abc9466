#include "uttt/game_state.hpp"
#include "uttt/rules.hpp"
#include "uttt/move.hpp"
#include "uttt_ai/mcts_policy.hpp"
#include "uttt_ai/random_policy.hpp"
#include "uttt_ai/search_config.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

using namespace uttt;
using namespace uttt_ai;

namespace {

// 対局者: random / mcts-fast / mcts / human
class Agent {
public:
  virtual ~Agent() = default;
  virtual Move pick(const GameState& s) = 0;
  virtual std::string name() const = 0;
};

class RandomAgent : public Agent {
public:
  explicit RandomAgent(std::optional<uint32_t> seed)
    : policy_(seed ? RandomPolicy(*seed) : RandomPolicy()) {}
  Move pick(const GameState& s) override { return policy_.pick(s); }
  std::string name() const override { return "Random"; }

private:
  RandomPolicy policy_;
};

class MctsAgent : public Agent {
public:
  MctsAgent(const SearchConfig& config, std::string label) : policy_(config), label_(std::move(label)) {}
  Move pick(const GameState& s) override { return policy_.pick(s); }
  std::string name() const override { return label_; }

private:
  MctsPolicy policy_;
  std::string label_;
};

class HumanAgent : public Agent {
public:
  Move pick(const GameState& s) override {
    std::cout << s.to_string();
    while (true) {
      std::cout << "Enter move as \"R C r c\": " << std::flush;
      std::string line;
      if (!std::getline(std::cin, line)) {
        throw std::runtime_error("stdin closed while waiting for a move");
      }
      std::istringstream iss(line);
      Move m;
      if (!(iss >> m.R >> m.C >> m.r >> m.c)) {
        std::cerr << "Could not parse \"" << line << "\"\n";
        continue;
      }
      if (!Rules::is_legal(s, m)) {
        std::cerr << "Illegal move: " << m.to_string() << "\n";
        continue;
      }
      return m;
    }
  }
  std::string name() const override { return "Human"; }
};

struct MatchOptions {
  std::optional<int> iterations;       // 未指定ならプロファイルの既定値
  std::optional<int> time_ms;
  std::optional<uint32_t> seed;
  bool verbose = false;
};

std::unique_ptr<Agent> make_agent(const std::string& type, const MatchOptions& opts, uint32_t seed_offset) {
  std::optional<uint32_t> seed;
  if (opts.seed) seed = *opts.seed + seed_offset;

  if (type == "random") {
    return std::make_unique<RandomAgent>(seed);
  }
  if (type == "human") {
    return std::make_unique<HumanAgent>();
  }
  if (type == "mcts" || type == "mcts-fast") {
    SearchConfig config = (type == "mcts") ? SearchConfig::thorough() : SearchConfig::fast();
    if (opts.iterations) config.iterations = *opts.iterations;
    config.time_budget_ms = opts.time_ms;
    config.seed = seed;
    config.verbose = opts.verbose;
    return std::make_unique<MctsAgent>(config, type == "mcts" ? "MCTS" : "MCTS-fast");
  }
  throw std::invalid_argument("unknown player type: " + type);
}

struct MatchStats {
  int p1_wins = 0;
  int p2_wins = 0;
  int draws = 0;
  int total_moves = 0;

  void record_game(Player winner, int moves) {
    if (winner == Player::One) {
      p1_wins++;
    } else if (winner == Player::Two) {
      p2_wins++;
    } else {
      draws++;
    }
    total_moves += moves;
  }

  int total_games() const { return p1_wins + p2_wins + draws; }

  void print(const std::string& p1_name, const std::string& p2_name) const {
    int total = total_games();
    if (total == 0) return;
    std::cout << "\nResults after " << total << " games:\n";
    std::cout << "  " << p1_name << " (One) wins: " << p1_wins << " ("
              << (100.0 * p1_wins / total) << "%)\n";
    std::cout << "  " << p2_name << " (Two) wins: " << p2_wins << " ("
              << (100.0 * p2_wins / total) << "%)\n";
    std::cout << "  Draws: " << draws << " (" << (100.0 * draws / total) << "%)\n";
    std::cout << "  Average moves: " << static_cast<double>(total_moves) / total << "\n";
  }
};

Player play_game(Agent& p1, Agent& p2, const GameState& start, int& moves, bool verbose) {
  GameState state = start;
  moves = 0;

  while (!Rules::is_ended(state)) {
    Agent& agent = (state.current_player() == Player::One) ? p1 : p2;
    Move move = agent.pick(state);
    state = Rules::next_state(state, move);
    moves++;

    if (verbose) {
      std::cout << agent.name() << " plays " << move.to_string() << "\n";
      std::cout << state.to_string() << "\n";
    }
  }
  return Rules::winner(state);
}

void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options]\n";
  std::cout << "Options:\n";
  std::cout << "  --p1 <type>            Player One: random, mcts-fast, mcts, human (default: mcts)\n";
  std::cout << "  --p2 <type>            Player Two: random, mcts-fast, mcts, human (default: mcts-fast)\n";
  std::cout << "  --games <n>            Number of games to play (default: 10)\n";
  std::cout << "  --iterations <n>       Override the MCTS iteration budget\n";
  std::cout << "  --time-ms <n>          Also stop each search after n milliseconds\n";
  std::cout << "  --seed <n>             Seed all players for reproducible games\n";
  std::cout << "  --position <text>      Start from a serialized position\n";
  std::cout << "  --verbose              Print every move and search summary\n";
  std::cout << "  --help                 Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
  std::string p1_type = "mcts";
  std::string p2_type = "mcts-fast";
  std::string position;
  int num_games = 10;
  MatchOptions opts;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--p1") == 0 && i + 1 < argc) {
      p1_type = argv[++i];
    } else if (std::strcmp(argv[i], "--p2") == 0 && i + 1 < argc) {
      p2_type = argv[++i];
    } else if (std::strcmp(argv[i], "--games") == 0 && i + 1 < argc) {
      num_games = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
      opts.iterations = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--time-ms") == 0 && i + 1 < argc) {
      opts.time_ms = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--position") == 0 && i + 1 < argc) {
      position = argv[++i];
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Error: Unknown option: " << argv[i] << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  try {
    GameState start;
    if (!position.empty()) {
      start = GameState::deserialize(position);
    }

    std::unique_ptr<Agent> p1 = make_agent(p1_type, opts, 0);
    std::unique_ptr<Agent> p2 = make_agent(p2_type, opts, 1);

    std::cout << p1->name() << " (One) vs " << p2->name() << " (Two)\n";
    std::cout << "========================================================\n";
    std::cout << "Number of games: " << num_games << "\n\n";

    MatchStats stats;
    for (int i = 0; i < num_games; ++i) {
      int moves = 0;
      Player winner = play_game(*p1, *p2, start, moves, opts.verbose);
      stats.record_game(winner, moves);
      std::cout << "Game " << (i + 1) << "/" << num_games << ": "
                << (winner == Player::None ? "Draw" : std::string(player_name(winner)) + " wins")
                << " in " << moves << " moves\n";
    }

    stats.print(p1->name(), p2->name());
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
