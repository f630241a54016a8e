#ifndef ORDERED_BOUNDED_MAP_HPP
#define ORDERED_BOUNDED_MAP_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "collection_errors.hpp"
#include "collection_health.hpp"
#include "collection_policy.hpp"
#include "debug_log.hpp"
#include "persistent_tree.hpp"

namespace pcutils {
    template <typename T, typename = void>
    struct HasLessThan : std::false_type {};

    template <typename T>
    struct HasLessThan<T, std::void_t<decltype(std::declval<const T&>() < std::declval<const T&>())>>
        : std::true_type {};
}

// Value order used by byValue(): operator< when the type has one,
// UnorderableError otherwise.
template <typename T>
struct NaturalOrder {
    static constexpr bool orderable = pcutils::HasLessThan<T>::value;

    bool operator()(const T& a, const T& b) const {
        if constexpr (orderable) {
            return a < b;
        } else {
            (void)a;
            (void)b;
            throw UnorderableError("values of this type have no ordering");
        }
    }
};

template <typename Less>
struct IsUnorderable : std::false_type {};

template <typename T>
struct IsUnorderable<NaturalOrder<T>> : std::bool_constant<!NaturalOrder<T>::orderable> {};

// Comparison policies for keys and values
template <typename K, typename V>
struct CollectionTraits {
    using KeyLess = std::less<K>;
    using ValueLess = NaturalOrder<V>;
    using ValueEqual = std::equal_to<V>;
};

/**
 * OrderedBoundedMap - Ordered associative container with an optional
 * entry limit
 *
 * Keys are kept in ascending order in a persistent red-black tree. Every
 * mutation builds a new tree version and commits it only once it has fully
 * succeeded, so a failing call (capacity, comparison errors, a throwing
 * mutation listener) leaves the collection untouched. Sequences returned
 * by keys()/values()/items() and the iter* range variants capture the
 * version current at call time.
 *
 * Capacity:
 * - Unset means unbounded
 * - OverflowPolicy::Reject fails a new-key insert at capacity
 * - OverflowPolicy::EvictMinKey drops the smallest key to make room
 *
 * Metadata is an opaque attachment (label, schema descriptor) that is
 * stored and persisted but never interpreted.
 */
template <typename K, typename V, typename M = std::string,
          typename Traits = CollectionTraits<K, V>>
class OrderedBoundedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using metadata_type = M;
    using KeyLess = typename Traits::KeyLess;
    using ValueLess = typename Traits::ValueLess;
    using ValueEqual = typename Traits::ValueEqual;
    using Tree = PersistentTree<K, V, KeyLess>;
    using Node = typename Tree::Node;
    using NodePtr = typename Tree::NodePtr;
    using Entry = std::pair<K, V>;
    using KeyView = TreeView<K, V, KeyLess, KeyProjection>;
    using ValueView = TreeView<K, V, KeyLess, ValueProjection>;
    using ItemView = TreeView<K, V, KeyLess, ItemProjection>;
    using MutationListener = std::function<void(MutationKind)>;

    // Everything needed to rebuild an equal collection
    struct State {
        std::vector<Entry> entries;
        std::optional<int64_t> capacity;
        OverflowPolicy policy = OverflowPolicy::Reject;
        std::optional<M> metadata;
    };

    explicit OrderedBoundedMap(std::optional<int64_t> capacity = std::nullopt,
                               std::optional<M> metadata = std::nullopt,
                               OverflowPolicy policy = OverflowPolicy::Reject)
        : tree_(), valueLess_(), root_(), count_(0),
          capacity_(checkedCapacity(capacity)), policy_(policy),
          metadata_(std::move(metadata)), listener_() {}

    // Inserts or overwrites; returns the previous value at key
    std::optional<V> insert(const K& key, const V& value) {
        NodePtr root = root_;
        size_t count = count_;
        bool evicted = false;
        std::optional<V> previous = put(root, count, key, value, evicted);
        publish(std::move(root), count, evicted, MutationKind::Insert);
        return previous;
    }

    // Inserts every pair of `other` in ascending key order, all or nothing
    template <typename Pairs>
    void update(const Pairs& other) {
        applyUpdate(std::vector<Entry>(std::begin(other), std::end(other)));
    }

    void update(std::initializer_list<Entry> other) {
        applyUpdate(std::vector<Entry>(other));
    }

    V pop(const K& key) {
        const Node* node = tree_.find(root_, key);
        if (!node) {
            throw KeyNotFoundError("key not found in collection");
        }
        V value = node->value;
        publish(tree_.dissoc(root_, key), count_ - 1, false, MutationKind::Pop);
        return value;
    }

    V pop(const K& key, const V& defaultValue) {
        const Node* node = tree_.find(root_, key);
        if (!node) return defaultValue;

        V value = node->value;
        publish(tree_.dissoc(root_, key), count_ - 1, false, MutationKind::Pop);
        return value;
    }

    // Removes and returns the entry with the smallest key
    Entry popItem() {
        const Node* node = Tree::findMin(root_);
        if (!node) {
            throw EmptyCollectionError("popitem() called on an empty collection");
        }
        Entry entry(node->key, node->value);
        publish(tree_.dissocMin(root_), count_ - 1, false, MutationKind::PopItem);
        return entry;
    }

    V setDefault(const K& key, const V& defaultValue) {
        const Node* node = tree_.find(root_, key);
        if (node) return node->value;

        NodePtr root = root_;
        size_t count = count_;
        bool evicted = false;
        put(root, count, key, defaultValue, evicted);
        publish(std::move(root), count, evicted, MutationKind::SetDefault);
        return defaultValue;
    }

    void clear() {
        if (!root_) return;
        publish(NodePtr(), 0, false, MutationKind::Clear);
    }

    std::optional<V> get(const K& key) const {
        const Node* node = tree_.find(root_, key);
        if (!node) return std::nullopt;
        return node->value;
    }

    V get(const K& key, const V& defaultValue) const {
        const Node* node = tree_.find(root_, key);
        return node ? node->value : defaultValue;
    }

    bool contains(const K& key) const {
        return tree_.find(root_, key) != nullptr;
    }

    // Ascending-key sequences over the current version

    KeyView keys() const {
        return KeyView(root_, std::nullopt, std::nullopt, tree_.keyLess());
    }

    ValueView values() const {
        return ValueView(root_, std::nullopt, std::nullopt, tree_.keyLess());
    }

    ItemView items() const {
        return ItemView(root_, std::nullopt, std::nullopt, tree_.keyLess());
    }

    // Same as above, restricted to keys in [min, max]; absent bounds are open

    KeyView iterKeys(const std::optional<K>& min = std::nullopt,
                     const std::optional<K>& max = std::nullopt) const {
        checkRange(min, max);
        return KeyView(root_, min, max, tree_.keyLess());
    }

    ValueView iterValues(const std::optional<K>& min = std::nullopt,
                         const std::optional<K>& max = std::nullopt) const {
        checkRange(min, max);
        return ValueView(root_, min, max, tree_.keyLess());
    }

    ItemView iterItems(const std::optional<K>& min = std::nullopt,
                       const std::optional<K>& max = std::nullopt) const {
        checkRange(min, max);
        return ItemView(root_, min, max, tree_.keyLess());
    }

    // Entries with value >= min by ascending value, equal values by key
    std::vector<Entry> byValue(const std::optional<V>& min = std::nullopt) const {
        if constexpr (IsUnorderable<ValueLess>::value) {
            throw UnorderableError("byValue() requires values with an ordering");
        } else {
            std::vector<const Node*> selected;
            selected.reserve(count_);

            TreeCursor<K, V, KeyLess> cursor(root_, std::nullopt, std::nullopt, tree_.keyLess());
            while (cursor.hasNext()) {
                const Node* node = cursor.next();
                if (!min || !valueLess_(node->value, *min)) {
                    selected.push_back(node);
                }
            }

            // Input is in key order, so a stable sort breaks value ties by key
            std::stable_sort(selected.begin(), selected.end(),
                             [this](const Node* a, const Node* b) {
                                 return valueLess_(a->value, b->value);
                             });

            std::vector<Entry> result;
            result.reserve(selected.size());
            for (const Node* node : selected) {
                result.emplace_back(node->key, node->value);
            }
            return result;
        }
    }

    // Largest key <= max, or the largest key overall
    K maxKey(const std::optional<K>& max = std::nullopt) const {
        const Node* node = max ? tree_.floor(root_, *max) : Tree::findMax(root_);
        if (!node) {
            throw EmptyCollectionError(max ? "no key at or below the given maximum"
                                           : "maxKey() called on an empty collection");
        }
        return node->key;
    }

    // Smallest key >= min, or the smallest key overall
    K minKey(const std::optional<K>& min = std::nullopt) const {
        const Node* node = min ? tree_.ceiling(root_, *min) : Tree::findMin(root_);
        if (!node) {
            throw EmptyCollectionError(min ? "no key at or above the given minimum"
                                           : "minKey() called on an empty collection");
        }
        return node->key;
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    std::optional<size_t> capacity() const { return capacity_; }
    OverflowPolicy overflowPolicy() const { return policy_; }

    const std::optional<M>& metadata() const { return metadata_; }

    void setMetadata(std::optional<M> metadata) {
        std::optional<M> previous = std::exchange(metadata_, std::move(metadata));
        try {
            notify(MutationKind::Metadata);
        } catch (const std::exception& e) {
            logListenerFailure(MutationKind::Metadata, e);
            metadata_ = std::move(previous);
            throw;
        }
    }

    // Fraction of capacity in use; absent for unbounded collections
    std::optional<double> usage() const {
        if (!capacity_) return std::nullopt;
        return usageFraction(count_, *capacity_);
    }

    HealthStatus status() const {
        if (!capacity_) return HealthStatus::Healthy;
        return healthStatusFor(count_, *capacity_);
    }

    // Called after every operation that changed the collection, with the new
    // version already visible. An exception from the listener undoes the
    // operation and propagates to the caller.
    void setMutationListener(MutationListener listener) {
        listener_ = std::move(listener);
    }

    State state() const {
        State s;
        s.entries.reserve(count_);
        for (const Entry& entry : items()) {
            s.entries.push_back(entry);
        }
        if (capacity_) s.capacity = static_cast<int64_t>(*capacity_);
        s.policy = policy_;
        s.metadata = metadata_;
        return s;
    }

    // Replaces entries, capacity, policy and metadata; keeps the listener.
    // Like every mutation, it is undone if the listener throws.
    void restore(const State& state) {
        OrderedBoundedMap rebuilt = fromState(state);
        swapState(rebuilt);
        try {
            notify(MutationKind::Restore);
        } catch (const std::exception& e) {
            logListenerFailure(MutationKind::Restore, e);
            swapState(rebuilt);
            throw;
        }
    }

    static OrderedBoundedMap fromState(const State& state) {
        OrderedBoundedMap result(state.capacity, state.metadata, state.policy);

        NodePtr root;
        size_t count = 0;
        for (const Entry& entry : state.entries) {
            bool inserted = false;
            std::optional<V> previous;
            root = result.tree_.assoc(root, entry.first, entry.second, inserted, previous);
            if (inserted) ++count;
        }

        if (result.capacity_ && count > *result.capacity_) {
            throw CapacityExceededError("restored state holds " + std::to_string(count) +
                                        " entries, more than its capacity of " +
                                        std::to_string(*result.capacity_));
        }

        result.root_ = std::move(root);
        result.count_ = count;
        if (pcutils::debugLogEnabled()) {
            pcutils::debugLog("restore", "rebuilt collection with " + std::to_string(count) + " entries");
        }
        return result;
    }

    // Entry-wise equality; capacity, policy and metadata are not compared
    bool operator==(const OrderedBoundedMap& other) const {
        if (this == &other || root_ == other.root_) return true;
        if (count_ != other.count_) return false;

        TreeCursor<K, V, KeyLess> mine(root_, std::nullopt, std::nullopt, tree_.keyLess());
        TreeCursor<K, V, KeyLess> theirs(other.root_, std::nullopt, std::nullopt, tree_.keyLess());
        ValueEqual valueEqual;
        while (mine.hasNext() && theirs.hasNext()) {
            const Node* a = mine.next();
            const Node* b = theirs.next();
            if (tree_.compareKeys(a->key, b->key) != 0) return false;
            if (!valueEqual(a->value, b->value)) return false;
        }
        return !mine.hasNext() && !theirs.hasNext();
    }

    bool operator!=(const OrderedBoundedMap& other) const { return !(*this == other); }

private:
    Tree tree_;
    ValueLess valueLess_;
    NodePtr root_;
    size_t count_;
    std::optional<size_t> capacity_;
    OverflowPolicy policy_;
    std::optional<M> metadata_;
    MutationListener listener_;

    static std::optional<size_t> checkedCapacity(std::optional<int64_t> capacity) {
        if (!capacity) return std::nullopt;
        if (*capacity <= 0) {
            throw InvalidCapacityError("capacity must be a positive integer, got " +
                                       std::to_string(*capacity));
        }
        return static_cast<size_t>(*capacity);
    }

    void checkRange(const std::optional<K>& min, const std::optional<K>& max) const {
        if (min && max && tree_.keyLess()(*max, *min)) {
            throw InvalidRangeError("range minimum is greater than its maximum");
        }
    }

    // Applies one insert to a working version, enforcing the capacity policy
    std::optional<V> put(NodePtr& root, size_t& count, const K& key, const V& value,
                         bool& evicted) const {
        if (capacity_ && count >= *capacity_ && tree_.find(root, key) == nullptr) {
            if (policy_ == OverflowPolicy::Reject) {
                if (pcutils::debugLogEnabled()) {
                    pcutils::debugLog("insert", "rejected new key, collection is at capacity " +
                                                std::to_string(*capacity_));
                }
                throw CapacityExceededError("cannot insert new key; maximum size of " +
                                            std::to_string(*capacity_) + " reached");
            }
            root = tree_.dissocMin(root);
            --count;
            evicted = true;
            if (pcutils::debugLogEnabled()) {
                pcutils::debugLog("evict", "dropped smallest key to stay within capacity " +
                                           std::to_string(*capacity_));
            }
        }

        bool inserted = false;
        std::optional<V> previous;
        root = tree_.assoc(root, key, value, inserted, previous);
        if (inserted) ++count;
        return previous;
    }

    void applyUpdate(std::vector<Entry> ordered) {
        if (ordered.empty()) return;

        const KeyLess& less = tree_.keyLess();
        std::stable_sort(ordered.begin(), ordered.end(),
                         [&less](const Entry& a, const Entry& b) { return less(a.first, b.first); });

        NodePtr root = root_;
        size_t count = count_;
        bool evicted = false;
        try {
            for (const Entry& entry : ordered) {
                put(root, count, entry.first, entry.second, evicted);
            }
        } catch (const std::exception& e) {
            if (pcutils::debugLogEnabled()) {
                pcutils::debugLog("update", std::string("rolled back: ") + e.what());
            }
            throw;
        }
        publish(std::move(root), count, evicted, MutationKind::Update);
    }

    void commit(NodePtr root, size_t count) {
        root_ = std::move(root);
        count_ = count;
    }

    // Commits a new version and reports it. The listener sees the new
    // version; if it throws, the previous version is put back.
    void publish(NodePtr root, size_t count, bool evicted, MutationKind kind) {
        NodePtr previousRoot = root_;
        size_t previousCount = count_;
        commit(std::move(root), count);
        try {
            if (evicted) notify(MutationKind::Evict);
            notify(kind);
        } catch (const std::exception& e) {
            logListenerFailure(kind, e);
            commit(std::move(previousRoot), previousCount);
            throw;
        }
    }

    // Exchanges entries, capacity, policy and metadata with `other`
    void swapState(OrderedBoundedMap& other) {
        std::swap(root_, other.root_);
        std::swap(count_, other.count_);
        std::swap(capacity_, other.capacity_);
        std::swap(policy_, other.policy_);
        std::swap(metadata_, other.metadata_);
    }

    static void logListenerFailure(MutationKind kind, const std::exception& e) {
        if (pcutils::debugLogEnabled()) {
            pcutils::debugLog("listener", std::string("undoing ") + mutationKindName(kind) +
                                          ": " + e.what());
        }
    }

    void notify(MutationKind kind) const {
        if (listener_) listener_(kind);
    }
};

#endif // ORDERED_BOUNDED_MAP_HPP
