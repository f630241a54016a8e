#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../src/persistent_tree.hpp"

namespace {

using Tree = PersistentTree<int, std::string, std::less<int>>;
using NodePtr = Tree::NodePtr;

// Returns the black height, or -1 if a red-black rule is broken
int checkBlackHeight(const TreeNode<int, std::string>* node) {
  if (!node) return 1;
  if (node->right && node->right->isRed()) return -1;  // left-leaning only
  if (node->isRed() && node->left && node->left->isRed()) return -1;

  int left = checkBlackHeight(node->left.get());
  int right = checkBlackHeight(node->right.get());
  if (left < 0 || right < 0 || left != right) return -1;
  return left + (node->isBlack() ? 1 : 0);
}

std::vector<int> inOrderKeys(const NodePtr& root) {
  std::vector<int> keys;
  TreeCursor<int, std::string, std::less<int>> cursor(root, std::nullopt, std::nullopt,
                                                      std::less<int>());
  while (cursor.hasNext()) {
    keys.push_back(cursor.next()->key);
  }
  return keys;
}

NodePtr put(const Tree& tree, const NodePtr& root, int key, const std::string& value) {
  bool inserted = false;
  std::optional<std::string> previous;
  return tree.assoc(root, key, value, inserted, previous);
}

}  // namespace

TEST_CASE("persistent tree assoc keeps keys ordered", "[persistent_tree]") {
  Tree tree;
  NodePtr root;

  for (int key : {5, 1, 9, 3, 7, 2, 8}) {
    root = put(tree, root, key, std::to_string(key));
  }

  REQUIRE(inOrderKeys(root) == std::vector<int>{1, 2, 3, 5, 7, 8, 9});
  REQUIRE(root->isBlack());
  REQUIRE(checkBlackHeight(root.get()) > 0);
}

TEST_CASE("persistent tree reports replaced values", "[persistent_tree]") {
  Tree tree;
  NodePtr root = put(tree, NodePtr(), 1, "one");

  bool inserted = true;
  std::optional<std::string> previous;
  root = tree.assoc(root, 1, "uno", inserted, previous);

  REQUIRE_FALSE(inserted);
  REQUIRE(previous == std::string("one"));
  REQUIRE(tree.find(root, 1)->value == "uno");
}

TEST_CASE("persistent tree versions are independent", "[persistent_tree]") {
  Tree tree;
  NodePtr v1;
  for (int key = 0; key < 20; ++key) {
    v1 = put(tree, v1, key, "v1");
  }

  NodePtr v2 = put(tree, v1, 100, "v2");
  v2 = tree.dissoc(v2, 0);
  v2 = put(tree, v2, 5, "changed");

  SECTION("Old version is unchanged") {
    std::vector<int> expected;
    for (int key = 0; key < 20; ++key) expected.push_back(key);
    REQUIRE(inOrderKeys(v1) == expected);
    REQUIRE(tree.find(v1, 5)->value == "v1");
    REQUIRE(tree.find(v1, 100) == nullptr);
  }

  SECTION("New version has the changes") {
    REQUIRE(tree.find(v2, 0) == nullptr);
    REQUIRE(tree.find(v2, 100)->value == "v2");
    REQUIRE(tree.find(v2, 5)->value == "changed");
    REQUIRE(checkBlackHeight(v2.get()) > 0);
  }
}

TEST_CASE("persistent tree stays balanced under random churn", "[persistent_tree]") {
  Tree tree;
  NodePtr root;
  std::map<int, std::string> reference;
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> keyDist(0, 199);
  std::uniform_int_distribution<int> opDist(0, 2);

  for (int step = 0; step < 2000; ++step) {
    int key = keyDist(rng);
    if (opDist(rng) == 0 && reference.count(key)) {
      root = tree.dissoc(root, key);
      reference.erase(key);
    } else if (opDist(rng) == 1 && !reference.empty()) {
      root = tree.dissocMin(root);
      reference.erase(reference.begin());
    } else {
      root = put(tree, root, key, std::to_string(step));
      reference[key] = std::to_string(step);
    }

    if (root) {
      REQUIRE(root->isBlack());
      REQUIRE(checkBlackHeight(root.get()) > 0);
    }
  }

  std::vector<int> expected;
  for (const auto& entry : reference) expected.push_back(entry.first);
  REQUIRE(inOrderKeys(root) == expected);
  for (const auto& entry : reference) {
    REQUIRE(tree.find(root, entry.first)->value == entry.second);
  }
}

TEST_CASE("persistent tree floor and ceiling", "[persistent_tree]") {
  Tree tree;
  NodePtr root;
  for (int key : {10, 20, 30}) {
    root = put(tree, root, key, "x");
  }

  REQUIRE(tree.floor(root, 25)->key == 20);
  REQUIRE(tree.floor(root, 30)->key == 30);
  REQUIRE(tree.floor(root, 5) == nullptr);

  REQUIRE(tree.ceiling(root, 25)->key == 30);
  REQUIRE(tree.ceiling(root, 10)->key == 10);
  REQUIRE(tree.ceiling(root, 31) == nullptr);

  REQUIRE(Tree::findMin(root)->key == 10);
  REQUIRE(Tree::findMax(root)->key == 30);
  REQUIRE(Tree::findMin(NodePtr()) == nullptr);
}

TEST_CASE("tree cursor honours inclusive bounds", "[persistent_tree]") {
  Tree tree;
  NodePtr root;
  for (int key = 1; key <= 9; ++key) {
    root = put(tree, root, key, "x");
  }

  auto collect = [&](std::optional<int> lower, std::optional<int> upper) {
    std::vector<int> keys;
    TreeCursor<int, std::string, std::less<int>> cursor(root, lower, upper, std::less<int>());
    while (cursor.hasNext()) keys.push_back(cursor.next()->key);
    return keys;
  };

  REQUIRE(collect(3, 6) == std::vector<int>{3, 4, 5, 6});
  REQUIRE(collect(std::nullopt, 2) == std::vector<int>{1, 2});
  REQUIRE(collect(8, std::nullopt) == std::vector<int>{8, 9});
  REQUIRE(collect(10, std::nullopt).empty());
  REQUIRE(collect(std::nullopt, 0).empty());
}
