#ifndef ORDMAP_ORDERED_MAP_HPP
#define ORDMAP_ORDERED_MAP_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "debug_log.hpp"
#include "map_types.hpp"
#include "tree_engine.hpp"
#include "value_identity.hpp"

namespace ordmap {

template <typename K, typename V, typename Compare>
struct Popped;

// OrderedMap - immutable ordered map backed by a persistent balanced tree.
//
// Every operation that looks like a mutation returns a new map and leaves
// the receiver untouched; unchanged subtrees are shared between the two.
// Copying a map is O(1). Maps may be shared freely between threads as long
// as K and V themselves are safe to read concurrently.
//
// Compare is a three-way comparator: cmp(a, b) < 0, == 0 or > 0.
template <typename K, typename V, typename Compare = ThreeWayCompare<K>>
class OrderedMap {
    template <typename, typename, typename>
    friend class OrderedMap;

public:
    using key_type = K;
    using mapped_type = V;
    using Engine = TreeEngine<K, V>;
    using Node = TreeNode<K, V>;
    using Ptr = NodePtr<K, V>;
    using Binding = std::pair<K, V>;

    // In-order iterator. Valid while the map it came from is alive.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<const K&, const V&>;
        using reference = value_type;
        using pointer = void;
        using difference_type = std::ptrdiff_t;

        const_iterator() = default;
        explicit const_iterator(const Node* root) { pushLeft(root); }

        reference operator*() const {
            const Node* node = stack_.back();
            return reference(node->key, node->value);
        }

        const_iterator& operator++() {
            const Node* node = stack_.back();
            stack_.pop_back();
            pushLeft(node->right.get());
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator old = *this;
            ++*this;
            return old;
        }

        friend bool operator==(const const_iterator& a, const const_iterator& b) noexcept {
            if (a.stack_.empty() || b.stack_.empty()) return a.stack_.empty() == b.stack_.empty();
            return a.stack_.back() == b.stack_.back();
        }
        friend bool operator!=(const const_iterator& a, const const_iterator& b) noexcept { return !(a == b); }

    private:
        void pushLeft(const Node* node) {
            while (node) {
                stack_.push_back(node);
                node = node->left.get();
            }
        }

        std::vector<const Node*> stack_;
    };

    // Construction

    OrderedMap() : root_(), count_(0), cmp_() {}
    explicit OrderedMap(Compare cmp) : root_(), count_(0), cmp_(std::move(cmp)) {}

    static OrderedMap empty() { return OrderedMap(); }
    static OrderedMap empty(Compare cmp) { return OrderedMap(std::move(cmp)); }

    static OrderedMap singleton(const K& key, const V& data) {
        return OrderedMap(Engine::singleton(key, data), 1, Compare());
    }

    static OrderedMap singleton(const K& key, const V& data, Compare cmp) {
        return OrderedMap(Engine::singleton(key, data), 1, std::move(cmp));
    }

    // Later bindings for a repeated key win.
    template <typename Range>
    static OrderedMap ofAlist(const Range& bindings) {
        OrderedMap result;
        for (const auto& kv : bindings) {
            result = result.set(kv.first, kv.second);
        }
        return result;
    }

    static OrderedMap ofAlist(std::initializer_list<Binding> bindings) {
        OrderedMap result;
        for (const Binding& kv : bindings) {
            result = result.set(kv.first, kv.second);
        }
        return result;
    }

    // Adding and removing

    // Binds key to data, replacing any existing binding. Same behaviour as
    // set; the name documents that the caller expects key to be fresh.
    OrderedMap addExn(const K& key, const V& data) const { return set(key, data); }

    OrderedMap set(const K& key, const V& data) const {
        bool inserted = false;
        Ptr root = Engine::add(root_, key, data, cmp_, inserted);
        if (root == root_) return *this;
        return OrderedMap(std::move(root), inserted ? count_ + 1 : count_, cmp_);
    }

    // For multimaps (V a sequence such as std::vector<T>): puts data in
    // front of the bucket bound to key, creating the bucket if needed.
    template <typename T>
    OrderedMap addMulti(const K& key, const T& data) const {
        return change(key, [&data](std::optional<V> bucket) {
            if (!bucket) return std::optional<V>(V(1, data));
            bucket->insert(bucket->begin(), data);
            return bucket;
        });
    }

    // Returns *this when key is absent.
    OrderedMap remove(const K& key) const {
        Ptr root = Engine::remove(root_, key, cmp_);
        if (root == root_) return *this;
        return OrderedMap(std::move(root), count_ - 1, cmp_);
    }

    // General update: f maps the current binding (or nullopt) to the new
    // one; nullopt removes the key.
    template <typename F>
    OrderedMap change(const K& key, F&& f) const {
        int delta = 0;
        Ptr root = Engine::update(root_, key, f, cmp_, delta);
        if (root == root_) return *this;
        return OrderedMap(std::move(root), count_ + delta, cmp_);
    }

    // f maps the current binding (or nullopt) to the new value.
    template <typename F>
    OrderedMap update(const K& key, F&& f) const {
        return change(key, [&f](std::optional<V> current) { return std::optional<V>(f(std::move(current))); });
    }

    // Queries

    bool isEmpty() const noexcept { return !root_; }
    std::size_t length() const noexcept { return count_; }
    std::size_t size() const noexcept { return count_; }

    bool mem(const K& key) const { return Engine::find(root_, key, cmp_) != nullptr; }

    std::optional<V> find(const K& key) const {
        const Node* node = Engine::find(root_, key, cmp_);
        if (!node) return std::nullopt;
        return node->value;
    }

    // Precondition: key is bound. Throws std::out_of_range otherwise.
    const V& findExn(const K& key) const {
        const Node* node = Engine::find(root_, key, cmp_);
        if (!node) {
            ORDMAP_DEBUG_LOG("findExn", "absent key in map of " << count_ << " bindings");
            throw std::out_of_range("findExn: key not bound in map");
        }
        return node->value;
    }

    // The bucket bound to key, or an empty one.
    V findMulti(const K& key) const {
        const Node* node = Engine::find(root_, key, cmp_);
        return node ? node->value : V();
    }

    std::optional<Binding> minBinding() const { return bindingOf(Engine::findMin(root_)); }
    std::optional<Binding> maxBinding() const { return bindingOf(Engine::findMax(root_)); }

    // Least binding whose key satisfies pred; pred must be monotone in the
    // key order.
    template <typename Pred>
    std::optional<Binding> findFirst(Pred&& pred) const {
        return bindingOf(Engine::findFirst(root_, pred));
    }

    // Root introspection: the binding stored at the top of the tree. Which
    // binding that is depends only on the tree shape.
    std::optional<K> rootKey() const {
        if (!root_) return std::nullopt;
        return root_->key;
    }

    std::optional<Binding> rootBinding() const { return bindingOf(root_.get()); }

    std::optional<K> chooseKey() const { return rootKey(); }
    std::optional<Binding> choose() const { return rootBinding(); }

    // Precondition: the map is not empty. Throws std::runtime_error otherwise.
    Binding chooseExn() const {
        if (!root_) {
            ORDMAP_DEBUG_LOG("chooseExn", "called on empty map");
            throw std::runtime_error("chooseExn() called on empty map");
        }
        return Binding(root_->key, root_->value);
    }

    std::optional<Binding> onlyBinding() const {
        Classification<K, V> c = classify();
        return c.binding;
    }

    bool isSingleton() const { return classify().isOne(); }

    Classification<K, V> classify() const {
        if (!root_) return Classification<K, V>{Cardinality::Zero, std::nullopt};
        typename Engine::Split parts = Engine::split(root_, root_->key, cmp_);
        if (parts.found && !parts.left && !parts.right) {
            return Classification<K, V>{Cardinality::One, Binding(parts.found->key, parts.found->value)};
        }
        return Classification<K, V>{Cardinality::Many, std::nullopt};
    }

    // The value bound to key together with the map without key.
    std::optional<std::pair<V, OrderedMap>> findAndRemove(const K& key) const {
        std::optional<V> found;
        int delta = 0;
        Ptr root = Engine::update(
            root_, key,
            [&found](std::optional<V> current) {
                found = std::move(current);
                return std::optional<V>();
            },
            cmp_, delta);
        if (!found) return std::nullopt;
        return std::make_pair(std::move(*found), OrderedMap(std::move(root), count_ - 1, cmp_));
    }

    // Removes the binding chosen by choose().
    std::optional<Popped<K, V, Compare>> pop() const {
        if (!root_) return std::nullopt;
        return Popped<K, V, Compare>{root_->key, root_->value, remove(root_->key)};
    }

    std::optional<Popped<K, V, Compare>> popMinBinding() const {
        const Node* min = Engine::findMin(root_);
        if (!min) return std::nullopt;
        return Popped<K, V, Compare>{min->key, min->value, remove(min->key)};
    }

    // Transforms. Callbacks run in ascending key order.

    template <typename F>
    auto map(F&& f) const -> OrderedMap<K, std::decay_t<std::invoke_result_t<F&, const V&>>, Compare> {
        using W = std::decay_t<std::invoke_result_t<F&, const V&>>;
        NodePtr<K, W> root = Engine::template mapi<W>(root_, [&f](const K&, const V& data) { return f(data); });
        return OrderedMap<K, W, Compare>(std::move(root), count_, cmp_);
    }

    template <typename F>
    auto mapi(F&& f) const -> OrderedMap<K, std::decay_t<std::invoke_result_t<F&, const K&, const V&>>, Compare> {
        using W = std::decay_t<std::invoke_result_t<F&, const K&, const V&>>;
        NodePtr<K, W> root = Engine::template mapi<W>(root_, f);
        return OrderedMap<K, W, Compare>(std::move(root), count_, cmp_);
    }

    // map with f : V -> V. Returns *this when f hands back every value
    // unchanged (see ValueIdentity).
    template <typename F>
    OrderedMap mapEndo(F&& f) const {
        Ptr root = Engine::mapEndo(root_, [&f](const K&, const V& data) { return f(data); });
        if (root == root_) return *this;
        return OrderedMap(std::move(root), count_, cmp_);
    }

    // f(key, data) returns std::optional<W>; nullopt drops the binding.
    template <typename F>
    auto filterMapi(F&& f) const
        -> OrderedMap<K, typename std::decay_t<std::invoke_result_t<F&, const K&, const V&>>::value_type, Compare> {
        using W = typename std::decay_t<std::invoke_result_t<F&, const K&, const V&>>::value_type;
        std::size_t count = 0;
        NodePtr<K, W> root = Engine::template filterMap<W>(root_, f, count);
        return OrderedMap<K, W, Compare>(std::move(root), count, cmp_);
    }

    // (bindings satisfying pred, the others)
    template <typename Pred>
    std::pair<OrderedMap, OrderedMap> partition(Pred&& pred) const {
        std::size_t trueCount = 0;
        std::pair<Ptr, Ptr> parts = Engine::partition(root_, pred, trueCount);
        return std::make_pair(OrderedMap(std::move(parts.first), trueCount, cmp_),
                              OrderedMap(std::move(parts.second), count_ - trueCount, cmp_));
    }

    // Traversal in ascending key order

    template <typename F>
    void iter(F&& f) const {
        Engine::iter(root_, [&f](const K&, const V& data) { f(data); });
    }

    template <typename F>
    void iteri(F&& f) const {
        Engine::iter(root_, f);
    }

    template <typename Pred>
    bool existsi(Pred&& pred) const {
        return Engine::exists(root_, pred);
    }

    template <typename Pred>
    bool forAlli(Pred&& pred) const {
        return Engine::forAll(root_, pred);
    }

    // f(key, data, acc) -> acc
    template <typename Acc, typename F>
    Acc fold(Acc init, F&& f) const {
        return Engine::fold(root_, std::move(init), f);
    }

    std::vector<Binding> toAlist() const {
        std::vector<Binding> result;
        result.reserve(count_);
        Engine::iter(root_, [&result](const K& key, const V& data) { result.emplace_back(key, data); });
        return result;
    }

    std::vector<V> data() const {
        std::vector<V> result;
        result.reserve(count_);
        Engine::iter(root_, [&result](const K&, const V& data) { result.push_back(data); });
        return result;
    }

    const_iterator begin() const { return const_iterator(root_.get()); }
    const_iterator end() const { return const_iterator(); }

    // Two-map algebra

    // For every key of either map calls f(key, MergeCase) and keeps the
    // binding when f returns a value. f returns std::optional<R>.
    template <typename V2, typename F>
    auto merge(const OrderedMap<K, V2, Compare>& other, F&& f) const
        -> OrderedMap<K, typename std::decay_t<std::invoke_result_t<F&, const K&, const MergeCase<V, V2>&>>::value_type,
                      Compare> {
        using R = typename std::decay_t<std::invoke_result_t<F&, const K&, const MergeCase<V, V2>&>>::value_type;
        std::size_t count = 0;
        NodePtr<K, R> root = mergeTrees<R>(root_, other.root_, f, cmp_, count);
        return OrderedMap<K, R, Compare>(std::move(root), count, cmp_);
    }

    // merge with a map of the same type that returns *this when nothing
    // changed: every Left/Both key was kept with its own left value (per
    // ValueIdentity) and no Right-only key was added.
    template <typename F>
    OrderedMap mergeEndo(const OrderedMap& other, F&& f) const {
        bool changed = false;
        OrderedMap merged = merge(other, [&f, &changed](const K& key, const MergeCase<V, V>& side) {
            std::optional<V> result = f(key, side);
            if (side.hasLeft()) {
                if (!result || !sameValue(side.leftValue(), *result)) changed = true;
            } else if (result) {
                changed = true;
            }
            return result;
        });
        if (!changed) return *this;
        ORDMAP_DEBUG_LOG("mergeEndo", "rebuilt map: " << count_ << " -> " << merged.count_ << " bindings");
        return merged;
    }

    // Union; keys bound on both sides get f(key, left, right), which
    // returns std::optional<V> (nullopt drops the key).
    template <typename F>
    OrderedMap unionWith(const OrderedMap& other, F&& f) const {
        if (!other.root_) return *this;
        if (!root_) return other;
        return merge(other, [&f](const K& key, const MergeCase<V, V>& side) -> std::optional<V> {
            switch (side.side()) {
            case MergeSide::Left:
                return side.leftValue();
            case MergeSide::Right:
                return side.rightValue();
            case MergeSide::Both:
                break;
            }
            return f(key, side.leftValue(), side.rightValue());
        });
    }

    // Union where conflicts are always resolved to combine(key, left, right).
    template <typename F>
    OrderedMap mergeSkewed(const OrderedMap& other, F&& combine) const {
        return unionWith(other, [&combine](const K& key, const V& l, const V& r) {
            return std::optional<V>(combine(key, l, r));
        });
    }

    // Visits every key of either map with its MergeCase, in key order.
    template <typename V2, typename F>
    void iter2(const OrderedMap<K, V2, Compare>& other, F&& f) const {
        auto visit = [&f](const K& key, const MergeCase<V, V2>& side) {
            f(key, side);
            return std::optional<bool>();
        };
        std::size_t count = 0;
        mergeTrees<bool>(root_, other.root_, visit, cmp_, count);
    }

    // Keys whose presence or data differ between *this and other, in key
    // order. dataEqual(left, right) decides when both sides agree.
    template <typename Eq>
    std::vector<DiffEntry<K, V>> symmetricDiff(const OrderedMap& other, Eq&& dataEqual) const {
        std::vector<DiffEntry<K, V>> diff;
        iter2(other, [&diff, &dataEqual](const K& key, const MergeCase<V, V>& side) {
            switch (side.side()) {
            case MergeSide::Left:
                diff.emplace_back(key, DiffValue<V>(OnlyLeft<V>{side.leftValue()}));
                break;
            case MergeSide::Right:
                diff.emplace_back(key, DiffValue<V>(OnlyRight<V>{side.rightValue()}));
                break;
            case MergeSide::Both:
                if (!dataEqual(side.leftValue(), side.rightValue())) {
                    diff.emplace_back(key, DiffValue<V>(Unequal<V>{side.leftValue(), side.rightValue()}));
                }
                break;
            }
        });
        return diff;
    }

    // Comparison

    // Same keys in the same order with dataEqual data.
    template <typename Eq>
    bool equal(const OrderedMap& other, Eq&& dataEqual) const {
        if (root_ == other.root_) return true;
        if (count_ != other.count_) return false;
        const_iterator a = begin();
        const_iterator b = other.begin();
        for (; a != end(); ++a, ++b) {
            if (cmp_((*a).first, (*b).first) != 0) return false;
            if (!dataEqual((*a).second, (*b).second)) return false;
        }
        return true;
    }

    // Lexicographic over bindings; dataCompare is three-way.
    template <typename C>
    int compare(const OrderedMap& other, C&& dataCompare) const {
        if (root_ == other.root_) return 0;
        const_iterator a = begin();
        const_iterator b = other.begin();
        for (;;) {
            bool aDone = a == end();
            bool bDone = b == other.end();
            if (aDone || bDone) return aDone == bDone ? 0 : (aDone ? -1 : 1);
            int c = cmp_((*a).first, (*b).first);
            if (c != 0) return c;
            c = dataCompare((*a).second, (*b).second);
            if (c != 0) return c;
            ++a;
            ++b;
        }
    }

    friend bool operator==(const OrderedMap& a, const OrderedMap& b) { return a.equal(b, std::equal_to<V>()); }
    friend bool operator!=(const OrderedMap& a, const OrderedMap& b) { return !(a == b); }

    // Physical identity: both handles share one tree.
    bool isSame(const OrderedMap& other) const noexcept { return root_ == other.root_; }

    const Ptr& root() const noexcept { return root_; }
    const Compare& keyCompare() const noexcept { return cmp_; }

private:
    OrderedMap(Ptr root, std::size_t count, Compare cmp)
        : root_(std::move(root)), count_(count), cmp_(std::move(cmp)) {}

    static std::optional<Binding> bindingOf(const Node* node) {
        if (!node) return std::nullopt;
        return Binding(node->key, node->value);
    }

    Ptr root_;
    std::size_t count_;
    Compare cmp_;
};

// Result of pop and popMinBinding.
template <typename K, typename V, typename Compare>
struct Popped {
    K key;
    V value;
    OrderedMap<K, V, Compare> rest;
};

} // namespace ordmap

#endif // ORDMAP_ORDERED_MAP_HPP
