#ifndef ORDMAP_TREE_ENGINE_HPP
#define ORDMAP_TREE_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <utility>

#include "map_types.hpp"
#include "tree_node.hpp"
#include "value_identity.hpp"

namespace ordmap {

// TreeEngine - persistent height-balanced binary search tree.
//
// All operations take trees by handle and return new handles; no node is
// ever modified in place. Sibling heights differ by at most 2, which keeps
// every search path O(log n). Operations that turn out to change nothing
// (removing an absent key, re-adding an identical value, an update that
// returns its input) hand back the input handle itself, so callers can
// detect "no change" by comparing handles.
//
// Comparing operations are templated on the comparator, a callable
// returning <0, 0 or >0 for (a, b).
template <typename K, typename V>
class TreeEngine {
public:
    using Node = TreeNode<K, V>;
    using Ptr = NodePtr<K, V>;

    struct Split {
        Ptr left;   // keys below the split key
        Ptr found;  // node holding the split key, if present
        Ptr right;  // keys above the split key
    };

    static int height(const Ptr& t) noexcept { return t ? t->height : 0; }

    // Builds a node from two subtrees already balanced against each other.
    static Ptr create(const Ptr& l, const K& k, const V& v, const Ptr& r) {
        int hl = height(l);
        int hr = height(r);
        return Ptr(new Node(l, k, v, r, hl >= hr ? hl + 1 : hr + 1));
    }

    static Ptr singleton(const K& k, const V& v) {
        return create(Ptr(), k, v, Ptr());
    }

    // Like create, but restores the balance invariant with one single or
    // double rotation. Subtree heights may differ by up to 3.
    static Ptr balance(const Ptr& l, const K& k, const V& v, const Ptr& r) {
        int hl = height(l);
        int hr = height(r);
        if (hl > hr + 2) {
            const Ptr& ll = l->left;
            const Ptr& lr = l->right;
            if (height(ll) >= height(lr)) {
                return create(ll, l->key, l->value, create(lr, k, v, r));
            }
            return create(create(ll, l->key, l->value, lr->left), lr->key, lr->value,
                          create(lr->right, k, v, r));
        }
        if (hr > hl + 2) {
            const Ptr& rl = r->left;
            const Ptr& rr = r->right;
            if (height(rr) >= height(rl)) {
                return create(create(l, k, v, rl), r->key, r->value, rr);
            }
            return create(create(l, k, v, rl->left), rl->key, rl->value,
                          create(rl->right, r->key, r->value, rr));
        }
        return create(l, k, v, r);
    }

    // Lookup

    template <typename Compare>
    static const Node* find(const Ptr& t, const K& k, const Compare& cmp) {
        const Node* node = t.get();
        while (node) {
            int c = cmp(k, node->key);
            if (c == 0) return node;
            node = c < 0 ? node->left.get() : node->right.get();
        }
        return nullptr;
    }

    static const Node* findMin(const Ptr& t) noexcept {
        const Node* node = t.get();
        while (node && node->left) node = node->left.get();
        return node;
    }

    static const Node* findMax(const Ptr& t) noexcept {
        const Node* node = t.get();
        while (node && node->right) node = node->right.get();
        return node;
    }

    // Least binding whose key satisfies pred, where pred is monotone over
    // the key order (false ... false true ... true). One root-to-leaf descent.
    template <typename Pred>
    static const Node* findFirst(const Ptr& t, Pred&& pred) {
        const Node* found = nullptr;
        const Node* node = t.get();
        while (node) {
            if (pred(node->key)) {
                found = node;
                node = node->left.get();
            } else {
                node = node->right.get();
            }
        }
        return found;
    }

    // Insertion and removal

    template <typename Compare>
    static Ptr add(const Ptr& t, const K& k, const V& v, const Compare& cmp, bool& inserted) {
        if (!t) {
            inserted = true;
            return singleton(k, v);
        }
        int c = cmp(k, t->key);
        if (c == 0) {
            inserted = false;
            if (sameValue(t->value, v)) return t;
            return Ptr(new Node(t->left, k, v, t->right, t->height));
        }
        if (c < 0) {
            Ptr l = add(t->left, k, v, cmp, inserted);
            if (l == t->left) return t;
            return balance(l, t->key, t->value, t->right);
        }
        Ptr r = add(t->right, k, v, cmp, inserted);
        if (r == t->right) return t;
        return balance(t->left, t->key, t->value, r);
    }

    template <typename Compare>
    static Ptr remove(const Ptr& t, const K& k, const Compare& cmp) {
        if (!t) return t;
        int c = cmp(k, t->key);
        if (c == 0) return mergeSiblings(t->left, t->right);
        if (c < 0) {
            Ptr l = remove(t->left, k, cmp);
            if (l == t->left) return t;
            return balance(l, t->key, t->value, t->right);
        }
        Ptr r = remove(t->right, k, cmp);
        if (r == t->right) return t;
        return balance(t->left, t->key, t->value, r);
    }

    // Precondition: t is not empty.
    static Ptr removeMinBinding(const Ptr& t) {
        if (!t->left) return t->right;
        return balance(removeMinBinding(t->left), t->key, t->value, t->right);
    }

    // Rebinds k to f(current value). f maps std::optional<V> to
    // std::optional<V>; nullopt removes the binding. delta receives the
    // change in element count (-1, 0 or +1).
    template <typename Compare, typename F>
    static Ptr update(const Ptr& t, const K& k, F&& f, const Compare& cmp, int& delta) {
        if (!t) {
            std::optional<V> data = f(std::optional<V>());
            if (!data) return t;
            delta = 1;
            return singleton(k, *data);
        }
        int c = cmp(k, t->key);
        if (c == 0) {
            std::optional<V> data = f(std::optional<V>(t->value));
            if (!data) {
                delta = -1;
                return mergeSiblings(t->left, t->right);
            }
            if (sameValue(t->value, *data)) return t;
            return Ptr(new Node(t->left, k, *data, t->right, t->height));
        }
        if (c < 0) {
            Ptr l = update(t->left, k, f, cmp, delta);
            if (l == t->left) return t;
            return balance(l, t->key, t->value, t->right);
        }
        Ptr r = update(t->right, k, f, cmp, delta);
        if (r == t->right) return t;
        return balance(t->left, t->key, t->value, r);
    }

    // Joining and splitting

    static Ptr addMinBinding(const K& k, const V& v, const Ptr& t) {
        if (!t) return singleton(k, v);
        return balance(addMinBinding(k, v, t->left), t->key, t->value, t->right);
    }

    static Ptr addMaxBinding(const K& k, const V& v, const Ptr& t) {
        if (!t) return singleton(k, v);
        return balance(t->left, t->key, t->value, addMaxBinding(k, v, t->right));
    }

    // Every key of l is below k, every key of r above it. Heights arbitrary.
    static Ptr join(const Ptr& l, const K& k, const V& v, const Ptr& r) {
        if (!l) return addMinBinding(k, v, r);
        if (!r) return addMaxBinding(k, v, l);
        if (l->height > r->height + 2) {
            return balance(l->left, l->key, l->value, join(l->right, k, v, r));
        }
        if (r->height > l->height + 2) {
            return balance(join(l, k, v, r->left), r->key, r->value, r->right);
        }
        return create(l, k, v, r);
    }

    // Every key of l is below every key of r. Heights arbitrary.
    static Ptr concat(const Ptr& l, const Ptr& r) {
        if (!l) return r;
        if (!r) return l;
        const Node* min = findMin(r);
        return join(l, min->key, min->value, removeMinBinding(r));
    }

    static Ptr concatOrJoin(const Ptr& l, const K& k, const std::optional<V>& v, const Ptr& r) {
        if (v) return join(l, k, *v, r);
        return concat(l, r);
    }

    template <typename Compare>
    static Split split(const Ptr& t, const K& k, const Compare& cmp) {
        if (!t) return Split();
        int c = cmp(k, t->key);
        if (c == 0) return Split{t->left, t, t->right};
        if (c < 0) {
            Split s = split(t->left, k, cmp);
            s.right = join(s.right, t->key, t->value, t->right);
            return s;
        }
        Split s = split(t->right, k, cmp);
        s.left = join(t->left, t->key, t->value, s.left);
        return s;
    }

    // Whole-tree transforms. Callbacks run in key order.

    template <typename W, typename F>
    static NodePtr<K, W> mapi(const Ptr& t, F&& f) {
        if (!t) return NodePtr<K, W>();
        NodePtr<K, W> l = mapi<W>(t->left, f);
        W data = f(t->key, t->value);
        NodePtr<K, W> r = mapi<W>(t->right, f);
        return NodePtr<K, W>(new TreeNode<K, W>(std::move(l), t->key, std::move(data), std::move(r), t->height));
    }

    // mapi with V -> V that returns t itself for every subtree on which f
    // produced only identical values.
    template <typename F>
    static Ptr mapEndo(const Ptr& t, F&& f) {
        if (!t) return t;
        Ptr l = mapEndo(t->left, f);
        V data = f(t->key, t->value);
        Ptr r = mapEndo(t->right, f);
        if (l == t->left && r == t->right && sameValue(t->value, data)) return t;
        return Ptr(new Node(std::move(l), t->key, std::move(data), std::move(r), t->height));
    }

    // f returns std::optional<W>; nullopt drops the binding. count receives
    // the number of bindings kept.
    template <typename W, typename F>
    static NodePtr<K, W> filterMap(const Ptr& t, F&& f, std::size_t& count) {
        if (!t) return NodePtr<K, W>();
        NodePtr<K, W> l = filterMap<W>(t->left, f, count);
        std::optional<W> data = f(t->key, t->value);
        NodePtr<K, W> r = filterMap<W>(t->right, f, count);
        if (data) ++count;
        return TreeEngine<K, W>::concatOrJoin(l, t->key, data, r);
    }

    // Splits t by pred into (satisfying, rest). A side that keeps a whole
    // subtree shares it. trueCount receives the size of the first result.
    template <typename Pred>
    static std::pair<Ptr, Ptr> partition(const Ptr& t, Pred&& pred, std::size_t& trueCount) {
        if (!t) return std::pair<Ptr, Ptr>();
        std::pair<Ptr, Ptr> l = partition(t->left, pred, trueCount);
        bool keep = pred(t->key, t->value);
        std::pair<Ptr, Ptr> r = partition(t->right, pred, trueCount);
        if (keep) {
            ++trueCount;
            Ptr yes = (l.first == t->left && r.first == t->right)
                          ? t
                          : join(l.first, t->key, t->value, r.first);
            return std::pair<Ptr, Ptr>(std::move(yes), concat(l.second, r.second));
        }
        Ptr no = (l.second == t->left && r.second == t->right)
                     ? t
                     : join(l.second, t->key, t->value, r.second);
        return std::pair<Ptr, Ptr>(concat(l.first, r.first), std::move(no));
    }

    // Traversal

    template <typename F>
    static void iter(const Ptr& t, F&& f) {
        if (!t) return;
        iter(t->left, f);
        f(t->key, t->value);
        iter(t->right, f);
    }

    template <typename Acc, typename F>
    static Acc fold(const Ptr& t, Acc acc, F&& f) {
        if (!t) return acc;
        acc = fold(t->left, std::move(acc), f);
        acc = f(t->key, t->value, std::move(acc));
        return fold(t->right, std::move(acc), f);
    }

    template <typename Pred>
    static bool exists(const Ptr& t, Pred&& pred) {
        if (!t) return false;
        return exists(t->left, pred) || pred(t->key, t->value) || exists(t->right, pred);
    }

    template <typename Pred>
    static bool forAll(const Ptr& t, Pred&& pred) {
        if (!t) return true;
        return forAll(t->left, pred) && pred(t->key, t->value) && forAll(t->right, pred);
    }

    static std::size_t cardinal(const Ptr& t) noexcept {
        if (!t) return 0;
        return cardinal(t->left) + 1 + cardinal(t->right);
    }

    // Checks ordering and the height invariant. Used by tests.
    template <typename Compare>
    static bool isValid(const Ptr& t, const Compare& cmp) {
        return checkSubtree(t, cmp, nullptr, nullptr) >= 0;
    }

private:
    // Concatenates adjacent siblings, whose heights differ by at most 2.
    static Ptr mergeSiblings(const Ptr& l, const Ptr& r) {
        if (!l) return r;
        if (!r) return l;
        const Node* min = findMin(r);
        return balance(l, min->key, min->value, removeMinBinding(r));
    }

    // Returns the subtree height, or -1 if an invariant is broken.
    template <typename Compare>
    static int checkSubtree(const Ptr& t, const Compare& cmp, const K* lo, const K* hi) {
        if (!t) return 0;
        if (lo && cmp(*lo, t->key) >= 0) return -1;
        if (hi && cmp(t->key, *hi) >= 0) return -1;
        int hl = checkSubtree(t->left, cmp, lo, &t->key);
        int hr = checkSubtree(t->right, cmp, &t->key, hi);
        if (hl < 0 || hr < 0) return -1;
        if (hl > hr + 2 || hr > hl + 2) return -1;
        int h = (hl >= hr ? hl : hr) + 1;
        return h == t->height ? h : -1;
    }
};

// Walks two trees in lock-step by key order. For every key of either tree,
// calls f(key, MergeCase) and keeps the binding when f returns a value.
// Callbacks run in ascending key order. count receives the result size.
template <typename R, typename K, typename V1, typename V2, typename Compare, typename F>
NodePtr<K, R> mergeTrees(const NodePtr<K, V1>& s1, const NodePtr<K, V2>& s2, F& f, const Compare& cmp,
                         std::size_t& count) {
    using Left = TreeEngine<K, V1>;
    using Right = TreeEngine<K, V2>;
    using Result = TreeEngine<K, R>;
    using Case = MergeCase<V1, V2>;

    if (!s1 && !s2) return NodePtr<K, R>();

    if (s1 && s1->height >= Right::height(s2)) {
        typename Right::Split sp = Right::split(s2, s1->key, cmp);
        NodePtr<K, R> l = mergeTrees<R>(s1->left, sp.left, f, cmp, count);
        std::optional<R> data = sp.found ? f(s1->key, Case::both(s1->value, sp.found->value))
                                         : f(s1->key, Case::left(s1->value));
        NodePtr<K, R> r = mergeTrees<R>(s1->right, sp.right, f, cmp, count);
        if (data) ++count;
        return Result::concatOrJoin(l, s1->key, data, r);
    }

    typename Left::Split sp = Left::split(s1, s2->key, cmp);
    NodePtr<K, R> l = mergeTrees<R>(sp.left, s2->left, f, cmp, count);
    std::optional<R> data = sp.found ? f(s2->key, Case::both(sp.found->value, s2->value))
                                     : f(s2->key, Case::right(s2->value));
    NodePtr<K, R> r = mergeTrees<R>(sp.right, s2->right, f, cmp, count);
    if (data) ++count;
    return Result::concatOrJoin(l, s2->key, data, r);
}

} // namespace ordmap

#endif // ORDMAP_TREE_ENGINE_HPP
