#pragma once

#include <optional>
#include <utility>
#include <variant>

namespace ordmap {

// Default key order: three-way comparison derived from operator<.
template <typename K>
struct ThreeWayCompare {
    int operator()(const K& a, const K& b) const {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }
};

enum class MergeSide { Left, Right, Both };

// MergeCase - where a key was found when walking two maps together.
// Holds references into the trees being merged; valid only for the
// duration of the callback that receives it.
template <typename V1, typename V2>
class MergeCase {
public:
    static MergeCase left(const V1& v) { return MergeCase(MergeSide::Left, &v, nullptr); }
    static MergeCase right(const V2& v) { return MergeCase(MergeSide::Right, nullptr, &v); }
    static MergeCase both(const V1& l, const V2& r) { return MergeCase(MergeSide::Both, &l, &r); }

    MergeSide side() const noexcept { return side_; }
    bool isLeft() const noexcept { return side_ == MergeSide::Left; }
    bool isRight() const noexcept { return side_ == MergeSide::Right; }
    bool isBoth() const noexcept { return side_ == MergeSide::Both; }

    bool hasLeft() const noexcept { return left_ != nullptr; }
    bool hasRight() const noexcept { return right_ != nullptr; }

    // Precondition: hasLeft() / hasRight().
    const V1& leftValue() const noexcept { return *left_; }
    const V2& rightValue() const noexcept { return *right_; }

private:
    MergeCase(MergeSide side, const V1* l, const V2* r) : side_(side), left_(l), right_(r) {}

    MergeSide side_;
    const V1* left_;
    const V2* right_;
};

// Symmetric difference entries. Keys bound to equal data on both sides are
// never reported.
template <typename V>
struct OnlyLeft {
    V value;
};

template <typename V>
struct OnlyRight {
    V value;
};

template <typename V>
struct Unequal {
    V left;
    V right;
};

template <typename V>
using DiffValue = std::variant<OnlyLeft<V>, OnlyRight<V>, Unequal<V>>;

template <typename K, typename V>
using DiffEntry = std::pair<K, DiffValue<V>>;

// Result of OrderedMap::classify.
enum class Cardinality { Zero, One, Many };

template <typename K, typename V>
struct Classification {
    Cardinality kind;
    std::optional<std::pair<K, V>> binding;  // set iff kind == One

    bool isZero() const noexcept { return kind == Cardinality::Zero; }
    bool isOne() const noexcept { return kind == Cardinality::One; }
    bool isMany() const noexcept { return kind == Cardinality::Many; }
};

} // namespace ordmap
