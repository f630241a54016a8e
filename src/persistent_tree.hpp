#ifndef PERSISTENT_TREE_HPP
#define PERSISTENT_TREE_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

// Color for red-black tree nodes
enum class Color { RED, BLACK };

// TreeNode - Red-black tree node shared between tree versions.
// A node reachable from a published root is never written again: every
// update copies the nodes on its path (structural sharing).
template <typename K, typename V>
struct TreeNode {
    K key;
    V value;
    std::shared_ptr<TreeNode> left;
    std::shared_ptr<TreeNode> right;
    Color color;

    TreeNode(const K& k, const V& v, Color c = Color::RED)
        : key(k), value(v), left(), right(), color(c) {}

    bool isRed() const { return color == Color::RED; }
    bool isBlack() const { return color == Color::BLACK; }
};

/**
 * PersistentTree - Left-leaning red-black tree with path copying
 *
 * The tree itself holds no root; every operation takes a root and returns
 * the root of a new version, leaving the old version intact. Callers keep
 * old roots around as snapshots and publish a new root with a single
 * pointer swap, so a failed operation never leaves a half-updated tree.
 *
 * Internal helpers follow one rule: a node passed in as `h` is already a
 * private copy owned by the running operation, and any child that gets
 * written is copied first.
 */
template <typename K, typename V, typename KeyLess>
class PersistentTree {
public:
    using Node = TreeNode<K, V>;
    using NodePtr = std::shared_ptr<Node>;

    PersistentTree() = default;

    const KeyLess& keyLess() const { return less_; }

    // Three-way key comparison built from the strict weak order
    int compareKeys(const K& k1, const K& k2) const {
        if (less_(k1, k2)) return -1;
        if (less_(k2, k1)) return 1;
        return 0;
    }

    // Binds key to val; `previous` receives the replaced value, if any
    NodePtr assoc(const NodePtr& root, const K& key, const V& val,
                  bool& inserted, std::optional<V>& previous) const {
        NodePtr newRoot = insert(root, key, val, inserted, previous);
        newRoot->color = Color::BLACK;
        return newRoot;
    }

    // Removes key, which must be present in the tree
    NodePtr dissoc(const NodePtr& root, const K& key) const {
        NodePtr h = copyOf(root);
        if (!isRed(h->left) && !isRed(h->right)) {
            h->color = Color::RED;
        }
        h = remove(h, key);
        if (h) h->color = Color::BLACK;
        return h;
    }

    // Removes the smallest key; root must not be empty
    NodePtr dissocMin(const NodePtr& root) const {
        NodePtr h = copyOf(root);
        if (!isRed(h->left) && !isRed(h->right)) {
            h->color = Color::RED;
        }
        h = removeMin(h);
        if (h) h->color = Color::BLACK;
        return h;
    }

    const Node* find(const NodePtr& root, const K& key) const {
        const Node* node = root.get();
        while (node) {
            int cmp = compareKeys(key, node->key);
            if (cmp < 0) {
                node = node->left.get();
            } else if (cmp > 0) {
                node = node->right.get();
            } else {
                return node;
            }
        }
        return nullptr;
    }

    static const Node* findMin(const NodePtr& root) {
        const Node* node = root.get();
        while (node && node->left) {
            node = node->left.get();
        }
        return node;
    }

    static const Node* findMax(const NodePtr& root) {
        const Node* node = root.get();
        while (node && node->right) {
            node = node->right.get();
        }
        return node;
    }

    // Largest key <= bound
    const Node* floor(const NodePtr& root, const K& bound) const {
        const Node* best = nullptr;
        const Node* node = root.get();
        while (node) {
            int cmp = compareKeys(bound, node->key);
            if (cmp == 0) return node;
            if (cmp < 0) {
                node = node->left.get();
            } else {
                best = node;
                node = node->right.get();
            }
        }
        return best;
    }

    // Smallest key >= bound
    const Node* ceiling(const NodePtr& root, const K& bound) const {
        const Node* best = nullptr;
        const Node* node = root.get();
        while (node) {
            int cmp = compareKeys(bound, node->key);
            if (cmp == 0) return node;
            if (cmp > 0) {
                node = node->right.get();
            } else {
                best = node;
                node = node->left.get();
            }
        }
        return best;
    }

private:
    KeyLess less_;

    static bool isRed(const NodePtr& node) { return node && node->isRed(); }

    static NodePtr copyOf(const NodePtr& node) {
        return std::make_shared<Node>(*node);
    }

    static Color flip(Color c) {
        return c == Color::RED ? Color::BLACK : Color::RED;
    }

    NodePtr insert(const NodePtr& node, const K& key, const V& val,
                   bool& inserted, std::optional<V>& previous) const {
        if (!node) {
            inserted = true;
            return std::make_shared<Node>(key, val, Color::RED);
        }

        NodePtr h = copyOf(node);
        int cmp = compareKeys(key, h->key);
        if (cmp < 0) {
            h->left = insert(h->left, key, val, inserted, previous);
        } else if (cmp > 0) {
            h->right = insert(h->right, key, val, inserted, previous);
        } else {
            // Key exists, update value in the copy
            previous = h->value;
            h->value = val;
            inserted = false;
        }
        return balance(h);
    }

    NodePtr remove(const NodePtr& node, const K& key) const {
        NodePtr h = copyOf(node);

        if (compareKeys(key, h->key) < 0) {
            if (!isRed(h->left) && !isRed(h->left->left)) {
                h = moveRedLeft(h);
            }
            h->left = remove(h->left, key);
        } else {
            if (isRed(h->left)) {
                h = rotateRight(h);
            }
            if (compareKeys(key, h->key) == 0 && !h->right) {
                return nullptr;
            }
            if (!isRed(h->right) && !isRed(h->right->left)) {
                h = moveRedRight(h);
            }
            if (compareKeys(key, h->key) == 0) {
                // Replace with the minimum of the right subtree
                const Node* successor = findMin(h->right);
                h->key = successor->key;
                h->value = successor->value;
                h->right = removeMin(h->right);
            } else {
                h->right = remove(h->right, key);
            }
        }
        return balance(h);
    }

    NodePtr removeMin(const NodePtr& node) const {
        if (!node->left) return nullptr;

        NodePtr h = copyOf(node);
        if (!isRed(h->left) && !isRed(h->left->left)) {
            h = moveRedLeft(h);
        }
        h->left = removeMin(h->left);
        return balance(h);
    }

    // Red-black tree balancing operations

    NodePtr rotateLeft(NodePtr h) const {
        NodePtr x = copyOf(h->right);
        h->right = x->left;
        x->left = h;
        x->color = h->color;
        h->color = Color::RED;
        return x;
    }

    NodePtr rotateRight(NodePtr h) const {
        NodePtr x = copyOf(h->left);
        h->left = x->right;
        x->right = h;
        x->color = h->color;
        h->color = Color::RED;
        return x;
    }

    void flipColors(const NodePtr& h) const {
        h->color = flip(h->color);
        h->left = copyOf(h->left);
        h->left->color = flip(h->left->color);
        h->right = copyOf(h->right);
        h->right->color = flip(h->right->color);
    }

    NodePtr moveRedLeft(NodePtr h) const {
        flipColors(h);
        if (isRed(h->right->left)) {
            h->right = rotateRight(h->right);
            h = rotateLeft(h);
            flipColors(h);
        }
        return h;
    }

    NodePtr moveRedRight(NodePtr h) const {
        flipColors(h);
        if (isRed(h->left->left)) {
            h = rotateRight(h);
            flipColors(h);
        }
        return h;
    }

    NodePtr balance(NodePtr h) const {
        // Right-leaning red - rotate left
        if (isRed(h->right) && !isRed(h->left)) {
            h = rotateLeft(h);
        }
        // Two reds in a row on left - rotate right
        if (isRed(h->left) && isRed(h->left->left)) {
            h = rotateRight(h);
        }
        // Both children red - flip colors
        if (isRed(h->left) && isRed(h->right)) {
            flipColors(h);
        }
        return h;
    }
};

// TreeCursor - In-order traversal over one tree version, optionally
// restricted to keys in [lower, upper]. Holds the root so the version
// stays alive for as long as the cursor does.
template <typename K, typename V, typename KeyLess>
class TreeCursor {
public:
    using Node = TreeNode<K, V>;

    TreeCursor() = default;

    TreeCursor(std::shared_ptr<Node> root, const std::optional<K>& lower,
               const std::optional<K>& upper, const KeyLess& less)
        : root_(std::move(root)), upper_(upper), less_(less) {
        seek(root_.get(), lower);
    }

    bool hasNext() const { return !stack_.empty(); }

    const Node* next() {
        const Node* node = stack_.back();
        stack_.pop_back();
        pushLeft(node->right.get());
        return node;
    }

private:
    std::shared_ptr<Node> root_;
    std::vector<const Node*> stack_;
    std::optional<K> upper_;
    KeyLess less_;

    // Positions the stack on the first key >= lower
    void seek(const Node* node, const std::optional<K>& lower) {
        while (node) {
            if (lower && less_(node->key, *lower)) {
                node = node->right.get();
            } else {
                stack_.push_back(node);
                node = node->left.get();
            }
        }
        stopPastUpper();
    }

    void pushLeft(const Node* node) {
        while (node) {
            stack_.push_back(node);
            node = node->left.get();
        }
        stopPastUpper();
    }

    // Keys come out ascending, so the first one above upper ends the walk
    void stopPastUpper() {
        if (upper_ && !stack_.empty() && less_(*upper_, stack_.back()->key)) {
            stack_.clear();
        }
    }
};

struct KeyProjection {
    template <typename N>
    const auto& operator()(const N& node) const { return node.key; }
};

struct ValueProjection {
    template <typename N>
    const auto& operator()(const N& node) const { return node.value; }
};

struct ItemProjection {
    template <typename N>
    auto operator()(const N& node) const { return std::make_pair(node.key, node.value); }
};

// Input iterator adapter over TreeCursor
template <typename K, typename V, typename KeyLess, typename Projection>
class TreeIterator {
public:
    using Node = TreeNode<K, V>;
    using iterator_category = std::input_iterator_tag;
    using reference = decltype(std::declval<Projection>()(std::declval<const Node&>()));
    using value_type = std::decay_t<reference>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;

    TreeIterator() : current_(nullptr) {}

    explicit TreeIterator(TreeCursor<K, V, KeyLess> cursor)
        : cursor_(std::move(cursor)), current_(nullptr) {
        advance();
    }

    reference operator*() const { return Projection()(*current_); }

    TreeIterator& operator++() {
        advance();
        return *this;
    }

    TreeIterator operator++(int) {
        TreeIterator tmp = *this;
        advance();
        return tmp;
    }

    bool operator==(const TreeIterator& other) const { return current_ == other.current_; }
    bool operator!=(const TreeIterator& other) const { return current_ != other.current_; }

private:
    TreeCursor<K, V, KeyLess> cursor_;
    const Node* current_;

    void advance() {
        current_ = cursor_.hasNext() ? cursor_.next() : nullptr;
    }
};

// TreeView - Restartable range over a snapshot of one tree version.
// Each begin() starts a new traversal of the same snapshot.
template <typename K, typename V, typename KeyLess, typename Projection>
class TreeView {
public:
    using Node = TreeNode<K, V>;
    using iterator = TreeIterator<K, V, KeyLess, Projection>;
    using const_iterator = iterator;

    TreeView(std::shared_ptr<Node> root, std::optional<K> lower,
             std::optional<K> upper, const KeyLess& less)
        : root_(std::move(root)), lower_(std::move(lower)),
          upper_(std::move(upper)), less_(less) {}

    iterator begin() const {
        return iterator(TreeCursor<K, V, KeyLess>(root_, lower_, upper_, less_));
    }

    iterator end() const { return iterator(); }

    bool empty() const { return begin() == end(); }

private:
    std::shared_ptr<Node> root_;
    std::optional<K> lower_;
    std::optional<K> upper_;
    KeyLess less_;
};

#endif // PERSISTENT_TREE_HPP
