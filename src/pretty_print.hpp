#pragma once

#include <ostream>
#include <variant>
#include <vector>

#include "map_types.hpp"
#include "ordered_map.hpp"

namespace ordmap {

// Printer that forwards to operator<<.
struct StreamPrinter {
    template <typename T>
    void operator()(std::ostream& os, const T& x) const {
        os << x;
    }
};

namespace detail {

constexpr const char* kMapsTo = " ↦ ";

template <typename K, typename V, typename PK, typename PV>
void ppBinding(std::ostream& os, const K& key, const V& data, PK& ppKey, PV& ppVal) {
    ppKey(os, key);
    os << kMapsTo;
    ppVal(os, data);
}

} // namespace detail

// Writes m as "[k1 ↦ v1, k2 ↦ v2]" using the given printers, which are
// called as printer(os, x). Stream errors are left in os for the caller.
template <typename K, typename V, typename Compare, typename PK, typename PV>
void pp(std::ostream& os, const OrderedMap<K, V, Compare>& m, PK&& ppKey, PV&& ppVal) {
    os << '[';
    bool first = true;
    m.iteri([&](const K& key, const V& data) {
        if (!first) os << ", ";
        first = false;
        detail::ppBinding(os, key, data, ppKey, ppVal);
    });
    os << ']';
}

template <typename K, typename V, typename Compare>
void pp(std::ostream& os, const OrderedMap<K, V, Compare>& m) {
    pp(os, m, StreamPrinter(), StreamPrinter());
}

// Writes the symmetric difference of x and y:
//   [-- [k ↦ v]; ++ [k ↦ v]; [k ↦ <ppDiffVal(left, right)>]];
// "--" marks keys only in x, "++" keys only in y. Writes nothing when
// the maps agree.
template <typename K, typename V, typename Compare, typename Eq, typename PK, typename PV, typename PD>
void ppDiff(std::ostream& os, const OrderedMap<K, V, Compare>& x, const OrderedMap<K, V, Compare>& y,
            Eq&& dataEqual, PK&& ppKey, PV&& ppVal, PD&& ppDiffVal) {
    std::vector<DiffEntry<K, V>> diff = x.symmetricDiff(y, dataEqual);
    if (diff.empty()) return;

    os << '[';
    bool first = true;
    for (const DiffEntry<K, V>& entry : diff) {
        if (!first) os << "; ";
        first = false;
        const K& key = entry.first;
        if (const OnlyLeft<V>* l = std::get_if<OnlyLeft<V>>(&entry.second)) {
            os << "-- [";
            detail::ppBinding(os, key, l->value, ppKey, ppVal);
            os << ']';
        } else if (const OnlyRight<V>* r = std::get_if<OnlyRight<V>>(&entry.second)) {
            os << "++ [";
            detail::ppBinding(os, key, r->value, ppKey, ppVal);
            os << ']';
        } else {
            const Unequal<V>& u = std::get<Unequal<V>>(entry.second);
            os << '[';
            ppKey(os, key);
            os << detail::kMapsTo;
            ppDiffVal(os, u.left, u.right);
            os << ']';
        }
    }
    os << "]; ";
}

} // namespace ordmap
