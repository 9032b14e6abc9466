#pragma once
#include <memory>
#include <optional>
#include <vector>

namespace uttt_ai {

/**
 * 探索木のノード
 *
 * 子ノードは unique_ptr で所有し、親へは所有しない生ポインタで戻る。
 * ルートを破棄すれば木全体が解放される。
 * children は展開順に並ぶ（行動ごとに高々1つ）。
 */
template <typename Action>
struct SearchNode {
  SearchNode* parent = nullptr;
  std::optional<Action> parent_action;          // ルートでは空
  std::vector<std::unique_ptr<SearchNode>> children;
  std::vector<Action> untried_actions;          // 先頭から展開する
  int visits = 0;
  int wins = 0;                                 // 探索側の勝ち数 (wins <= visits)

  static std::unique_ptr<SearchNode> create_root(std::vector<Action> legal_actions) {
    auto node = std::make_unique<SearchNode>();
    node->untried_actions = std::move(legal_actions);
    return node;
  }

  // Creates the child for `action` and registers it under `parent`.
  static SearchNode* create_child(SearchNode* parent, const Action& action,
                                  std::vector<Action> legal_actions) {
    auto node = std::make_unique<SearchNode>();
    node->parent = parent;
    node->parent_action = action;
    node->untried_actions = std::move(legal_actions);
    SearchNode* ptr = node.get();
    parent->children.push_back(std::move(node));
    return ptr;
  }

  bool is_fully_expanded() const { return untried_actions.empty() && !children.empty(); }

  const SearchNode* child(const Action& action) const {
    for (const auto& c : children) {
      if (*c->parent_action == action) return c.get();
    }
    return nullptr;
  }
};

} // namespace uttt_ai
