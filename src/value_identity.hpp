#pragma once

#include <memory>
#include <string>
#include <type_traits>

namespace ordmap {

namespace detail {

// Types whose operator== compares every observable part of the value, so
// two equal values cannot be told apart. Floating point is excluded
// (0.0 == -0.0), as is any user type, whose == may compare only a key.
template <typename V, typename = void>
struct ExactEquality : std::false_type {};

template <typename V>
struct ExactEquality<V, std::enable_if_t<std::is_integral<V>::value || std::is_enum<V>::value>>
    : std::true_type {};

template <typename C, typename A>
struct ExactEquality<std::basic_string<C, std::char_traits<C>, A>> : std::true_type {};

// Everything else counts as changed, so a produced value always replaces
// the stored one.
template <typename V, bool = ExactEquality<V>::value>
struct DefaultIdentity {
    static bool same(const V&, const V&) noexcept { return false; }
};

template <typename V>
struct DefaultIdentity<V, true> {
    static bool same(const V& a, const V& b) { return a == b; }
};

} // namespace detail

// ValueIdentity - decides whether a produced value is the very value that
// was passed in. Used by add/update/mapEndo/mergeEndo to hand back the
// original tree when nothing changed. Specialise it for handle-like types.
template <typename V>
struct ValueIdentity : detail::DefaultIdentity<V> {};

template <typename T>
struct ValueIdentity<std::shared_ptr<T>> {
    static bool same(const std::shared_ptr<T>& a, const std::shared_ptr<T>& b) noexcept {
        return a.get() == b.get();
    }
};

template <typename T>
struct ValueIdentity<T*> {
    static bool same(T* a, T* b) noexcept { return a == b; }
};

template <typename V>
inline bool sameValue(const V& a, const V& b) {
    return ValueIdentity<V>::same(a, b);
}

} // namespace ordmap
