#ifndef ORDMAP_PY_ORDERED_MAP_HPP
#define ORDMAP_PY_ORDERED_MAP_HPP

#include <pybind11/pybind11.h>

#include <optional>
#include <ostream>
#include <string>

#include "map_types.hpp"
#include "ordered_map.hpp"
#include "value_identity.hpp"

namespace py = pybind11;

namespace ordmap {

// Key order for Python objects, by Python rich comparison (== then <).
// Propagates Python errors as py::error_already_set.
struct PyKeyCompare {
    int operator()(const py::object& k1, const py::object& k2) const;
};

// Python values are references: a value is unchanged only if it is the
// same object.
template <>
struct ValueIdentity<py::object> {
    static bool same(const py::object& a, const py::object& b) noexcept { return a.is(b); }
};

using PyOrderedMap = OrderedMap<py::object, py::object, PyKeyCompare>;
using PyMergeCase = MergeCase<py::object, py::object>;

// Python utility functions
namespace pyutils {

    // Python ==, for data comparisons.
    bool objectsEqual(const py::object& a, const py::object& b);

    // Three-way comparison by Python == and <.
    int compareObjects(const py::object& a, const py::object& b);

    // Python truthiness of a callback result.
    bool isTrue(const py::object& obj);

    // Callbacks signal "no binding" by returning None.
    inline std::optional<py::object> toOptional(py::object result) {
        if (result.is_none()) return std::nullopt;
        return result;
    }

    inline py::object fromOptional(const std::optional<py::object>& value) {
        return value ? *value : py::none();
    }

    // ("Left", v) | ("Right", v) | ("Both", v1, v2)
    py::tuple mergeCaseToPy(const PyMergeCase& side);

    // ("Left", v) | ("Right", v) | ("Unequal", v1, v2)
    py::tuple diffValueToPy(const DiffValue<py::object>& diff);

    // "Zero" | ("One", k, v) | "Many"
    py::object classificationToPy(const Classification<py::object, py::object>& c);

    std::string reprOf(const py::handle& obj);

    // Writes printer(obj) to os, or repr(obj) when printer is None.
    void writeWith(std::ostream& os, const py::object& printer, const py::object& obj);

} // namespace pyutils

// Conversion
PyOrderedMap fromDict(const py::dict& d);
PyOrderedMap fromItems(const py::iterable& items);
py::list itemsList(const PyOrderedMap& m);
py::list keysList(const PyOrderedMap& m);
py::list valuesList(const PyOrderedMap& m);

// String representation
std::string repr(const PyOrderedMap& m);

} // namespace ordmap

#endif // ORDMAP_PY_ORDERED_MAP_HPP
