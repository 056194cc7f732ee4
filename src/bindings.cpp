#include <pybind11/pybind11.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "debug_log.hpp"
#include "pretty_print.hpp"
#include "py_ordered_map.hpp"

namespace py = pybind11;
using ordmap::PyMergeCase;
using ordmap::PyOrderedMap;
namespace pyutils = ordmap::pyutils;

namespace {

py::object bindingToPy(const std::optional<PyOrderedMap::Binding>& binding) {
    if (!binding) return py::none();
    return py::make_tuple(binding->first, binding->second);
}

py::object poppedToPy(const std::optional<ordmap::Popped<py::object, py::object, ordmap::PyKeyCompare>>& popped) {
    if (!popped) return py::none();
    return py::make_tuple(popped->key, popped->value, popped->rest);
}

// data_equal=None means Python ==.
bool callEqual(const py::object& dataEqual, const py::object& a, const py::object& b) {
    if (dataEqual.is_none()) return pyutils::objectsEqual(a, b);
    return pyutils::isTrue(dataEqual(a, b));
}

} // namespace

PYBIND11_MODULE(pyordmap, m) {
    m.doc() = "Persistent ordered map with merge and diff algebra, implemented in C++";

    ORDMAP_DEBUG_LOG("pyordmap", "module initialised");

    m.def("set_debug_log", &ordmap::setDebugLogPath,
          py::arg("path"),
          "Write the debug log to path. An empty path turns logging off.");

    py::class_<PyOrderedMap>(m, "OrderedMap")
        .def(py::init<>(),
             "Create an empty OrderedMap")

        // Construction
        .def_static("empty", []() { return PyOrderedMap::empty(); },
                    "Return the empty map.")

        .def_static("singleton",
                    [](py::object key, py::object data) { return PyOrderedMap::singleton(key, data); },
                    py::arg("key"), py::arg("data"),
                    "Return a map with exactly one binding.")

        .def_static("of_alist", &ordmap::fromItems,
                    py::arg("items"),
                    "Create an OrderedMap from an iterable of (key, value) pairs.\n\n"
                    "Later pairs win when a key repeats.")

        .def_static("from_dict", &ordmap::fromDict,
                    py::arg("dict"),
                    "Create an OrderedMap from a dictionary.")

        // Adding and removing
        .def("add_exn", &PyOrderedMap::addExn,
             py::arg("key"), py::arg("data"),
             "Bind key to data, returning new map.\n\n"
             "Intended for keys not yet bound; an existing binding is replaced,\n"
             "exactly as set() does.")

        .def("set", &PyOrderedMap::set,
             py::arg("key"), py::arg("data"),
             "Bind key to data, replacing any existing binding.\n\n"
             "Returns:\n"
             "    A new OrderedMap (self if key was already bound to data)\n\n"
             "Complexity: O(log n)")

        .def("add_multi",
             [](const PyOrderedMap& self, py::object key, py::object data) {
                 return self.change(key, [&data](std::optional<py::object> bucket) -> std::optional<py::object> {
                     py::list items;
                     items.append(data);
                     if (bucket) {
                         for (auto item : *bucket) items.append(item);
                     }
                     return py::object(std::move(items));
                 });
             },
             py::arg("key"), py::arg("data"),
             "Prepend data to the list bound to key (starting [data] if unbound).")

        .def("remove", &PyOrderedMap::remove,
             py::arg("key"),
             "Remove key, returning new map (self if key is absent).\n\n"
             "Complexity: O(log n)")

        .def("change",
             [](const PyOrderedMap& self, py::object key, py::function f) {
                 return self.change(key, [&f](std::optional<py::object> current) {
                     return pyutils::toOptional(f(pyutils::fromOptional(current)));
                 });
             },
             py::arg("key"), py::arg("f"),
             "Rebind key to f(current), where current is None when key is unbound.\n\n"
             "Returning None from f removes the key.")

        .def("update",
             [](const PyOrderedMap& self, py::object key, py::function f) {
                 return self.update(key, [&f](std::optional<py::object> current) {
                     return py::object(f(pyutils::fromOptional(current)));
                 });
             },
             py::arg("key"), py::arg("f"),
             "Rebind key to f(current), where current is None when key is unbound.")

        // Lookup
        .def("find",
             [](const PyOrderedMap& self, py::object key) { return pyutils::fromOptional(self.find(key)); },
             py::arg("key"),
             "Return the value bound to key, or None.")

        .def("find_exn",
             [](const PyOrderedMap& self, py::object key) -> py::object {
                 try {
                     return self.findExn(key);
                 } catch (const std::out_of_range&) {
                     throw py::key_error(pyutils::reprOf(key));
                 }
             },
             py::arg("key"),
             "Return the value bound to key.\n\n"
             "Raises:\n"
             "    KeyError: If key is not bound")

        .def("find_multi",
             [](const PyOrderedMap& self, py::object key) -> py::list {
                 std::optional<py::object> bucket = self.find(key);
                 if (!bucket) return py::list();
                 return py::list(*bucket);
             },
             py::arg("key"),
             "Return the list bound to key, or [] when key is unbound.")

        .def("find_and_remove",
             [](const PyOrderedMap& self, py::object key) -> py::object {
                 auto found = self.findAndRemove(key);
                 if (!found) return py::none();
                 return py::make_tuple(found->first, found->second);
             },
             py::arg("key"),
             "Return (value, map without key), or None when key is unbound.")

        .def("mem", &PyOrderedMap::mem,
             py::arg("key"),
             "Check if key is bound.")

        .def("min_binding",
             [](const PyOrderedMap& self) { return bindingToPy(self.minBinding()); },
             "Return (key, value) for the least key, or None.")

        .def("max_binding",
             [](const PyOrderedMap& self) { return bindingToPy(self.maxBinding()); },
             "Return (key, value) for the greatest key, or None.")

        .def("choose_key",
             [](const PyOrderedMap& self) { return pyutils::fromOptional(self.chooseKey()); },
             "Return some key of the map, or None when empty.")

        .def("choose",
             [](const PyOrderedMap& self) { return bindingToPy(self.choose()); },
             "Return some (key, value) of the map, or None when empty.")

        .def("choose_exn",
             [](const PyOrderedMap& self) {
                 PyOrderedMap::Binding binding = self.chooseExn();
                 return py::make_tuple(binding.first, binding.second);
             },
             "Return some (key, value) of the map.\n\n"
             "Raises:\n"
             "    RuntimeError: If the map is empty")

        .def("pop",
             [](const PyOrderedMap& self) { return poppedToPy(self.pop()); },
             "Return (key, value, rest) for the binding choose() picks, or None.")

        .def("pop_min_binding",
             [](const PyOrderedMap& self) { return poppedToPy(self.popMinBinding()); },
             "Return (key, value, rest) for the least key, or None.")

        .def("only_binding",
             [](const PyOrderedMap& self) { return bindingToPy(self.onlyBinding()); },
             "Return (key, value) if the map has exactly one binding, else None.")

        .def("classify",
             [](const PyOrderedMap& self) { return pyutils::classificationToPy(self.classify()); },
             "Return 'Zero', ('One', key, value) or 'Many'.")

        .def("is_singleton", &PyOrderedMap::isSingleton,
             "True if the map has exactly one binding.")

        .def("is_empty", &PyOrderedMap::isEmpty,
             "True if the map has no bindings.")

        .def("length", &PyOrderedMap::length,
             "Return the number of bindings.")

        // Transforms
        .def("map",
             [](const PyOrderedMap& self, py::function f) {
                 return self.map([&f](const py::object& data) { return py::object(f(data)); });
             },
             py::arg("f"),
             "Return a map with every value replaced by f(value).")

        .def("mapi",
             [](const PyOrderedMap& self, py::function f) {
                 return self.mapi([&f](const py::object& key, const py::object& data) {
                     return py::object(f(key, data));
                 });
             },
             py::arg("f"),
             "Return a map with every value replaced by f(key, value).")

        .def("map_endo",
             [](const PyOrderedMap& self, py::function f) {
                 return self.mapEndo([&f](const py::object& data) { return py::object(f(data)); });
             },
             py::arg("f"),
             "Like map(), but returns self when f returns every value itself.")

        .def("filter_mapi",
             [](const PyOrderedMap& self, py::function f) {
                 return self.filterMapi([&f](const py::object& key, const py::object& data) {
                     return pyutils::toOptional(f(key, data));
                 });
             },
             py::arg("f"),
             "Return a map of f(key, value) for every binding where it is not None.")

        .def("partition",
             [](const PyOrderedMap& self, py::function f) {
                 auto parts = self.partition([&f](const py::object& key, const py::object& data) {
                     return pyutils::isTrue(f(key, data));
                 });
                 return py::make_tuple(parts.first, parts.second);
             },
             py::arg("f"),
             "Return (bindings where f(key, value) is true, the others).")

        // Traversal
        .def("iter",
             [](const PyOrderedMap& self, py::function f) {
                 self.iter([&f](const py::object& data) { f(data); });
             },
             py::arg("f"),
             "Call f(value) for every binding in key order.")

        .def("iteri",
             [](const PyOrderedMap& self, py::function f) {
                 self.iteri([&f](const py::object& key, const py::object& data) { f(key, data); });
             },
             py::arg("f"),
             "Call f(key, value) for every binding in key order.")

        .def("existsi",
             [](const PyOrderedMap& self, py::function f) {
                 return self.existsi([&f](const py::object& key, const py::object& data) {
                     return pyutils::isTrue(f(key, data));
                 });
             },
             py::arg("f"),
             "True if f(key, value) holds for some binding.")

        .def("for_alli",
             [](const PyOrderedMap& self, py::function f) {
                 return self.forAlli([&f](const py::object& key, const py::object& data) {
                     return pyutils::isTrue(f(key, data));
                 });
             },
             py::arg("f"),
             "True if f(key, value) holds for every binding.")

        .def("fold",
             [](const PyOrderedMap& self, py::object init, py::function f) {
                 return self.fold(init, [&f](const py::object& key, const py::object& data, py::object acc) {
                     return py::object(f(key, data, acc));
                 });
             },
             py::arg("init"), py::arg("f"),
             "Fold f(key, value, acc) over the bindings in key order.")

        .def("to_alist", &ordmap::itemsList,
             "Return the list of (key, value) tuples in key order.")

        .def("keys", &ordmap::keysList,
             "Return the list of keys in order.")

        .def("data", &ordmap::valuesList,
             "Return the list of values in key order.")

        // Two-map algebra
        .def("merge",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::function f) {
                 return self.merge(other, [&f](const py::object& key, const PyMergeCase& side) {
                     return pyutils::toOptional(f(key, pyutils::mergeCaseToPy(side)));
                 });
             },
             py::arg("other"), py::arg("f"),
             "Merge two maps key by key.\n\n"
             "Args:\n"
             "    other: The right-hand map\n"
             "    f: Called as f(key, side) for every key of either map, where side is\n"
             "       ('Left', v), ('Right', v) or ('Both', v1, v2). The key is kept with\n"
             "       the returned value unless it is None.\n\n"
             "Returns:\n"
             "    A new OrderedMap")

        .def("merge_endo",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::function f) {
                 return self.mergeEndo(other, [&f](const py::object& key, const PyMergeCase& side) {
                     return pyutils::toOptional(f(key, pyutils::mergeCaseToPy(side)));
                 });
             },
             py::arg("other"), py::arg("f"),
             "Like merge(), but returns self when f keeps every left value as the\n"
             "same object and adds no right-only key.")

        .def("merge_skewed",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::function combine) {
                 return self.mergeSkewed(other, [&combine](const py::object& key, const py::object& l,
                                                           const py::object& r) {
                     return py::object(combine(key, l, r));
                 });
             },
             py::arg("other"), py::arg("combine"),
             "Union where keys bound on both sides get combine(key, left, right).")

        .def("union",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::function f) {
                 return self.unionWith(other, [&f](const py::object& key, const py::object& l,
                                                   const py::object& r) {
                     return pyutils::toOptional(f(key, l, r));
                 });
             },
             py::arg("other"), py::arg("f"),
             "Union where keys bound on both sides get f(key, left, right);\n"
             "returning None drops the key.")

        .def("symmetric_diff",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::object dataEqual) {
                 auto diff = self.symmetricDiff(other, [&dataEqual](const py::object& a, const py::object& b) {
                     return callEqual(dataEqual, a, b);
                 });
                 py::list result;
                 for (const auto& entry : diff) {
                     result.append(py::make_tuple(entry.first, pyutils::diffValueToPy(entry.second)));
                 }
                 return result;
             },
             py::arg("other"), py::arg("data_equal") = py::none(),
             "Return [(key, diff)] for keys whose presence or value differs, in key\n"
             "order. diff is ('Left', v), ('Right', v) or ('Unequal', v1, v2).\n"
             "data_equal defaults to ==.")

        // Rendering
        .def("pp",
             [](const PyOrderedMap& self, py::object keyPrinter, py::object valuePrinter) {
                 std::ostringstream oss;
                 ordmap::pp(
                     oss, self,
                     [&keyPrinter](std::ostream& os, const py::object& key) { pyutils::writeWith(os, keyPrinter, key); },
                     [&valuePrinter](std::ostream& os, const py::object& data) {
                         pyutils::writeWith(os, valuePrinter, data);
                     });
                 return oss.str();
             },
             py::arg("key_printer") = py::none(), py::arg("value_printer") = py::none(),
             "Render as '[k1 ↦ v1, k2 ↦ v2]'. Printers default to repr().")

        .def("pp_diff",
             [](const PyOrderedMap& self, const PyOrderedMap& other, py::object dataEqual, py::object keyPrinter,
                py::object valuePrinter, py::object diffPrinter) {
                 std::ostringstream oss;
                 ordmap::ppDiff(
                     oss, self, other,
                     [&dataEqual](const py::object& a, const py::object& b) { return callEqual(dataEqual, a, b); },
                     [&keyPrinter](std::ostream& os, const py::object& key) { pyutils::writeWith(os, keyPrinter, key); },
                     [&valuePrinter](std::ostream& os, const py::object& data) {
                         pyutils::writeWith(os, valuePrinter, data);
                     },
                     [&diffPrinter, &valuePrinter](std::ostream& os, const py::object& l, const py::object& r) {
                         if (diffPrinter.is_none()) {
                             pyutils::writeWith(os, valuePrinter, l);
                             os << " -> ";
                             pyutils::writeWith(os, valuePrinter, r);
                         } else {
                             os << py::str(diffPrinter(l, r)).cast<std::string>();
                         }
                     });
                 return oss.str();
             },
             py::arg("other"), py::arg("data_equal") = py::none(), py::arg("key_printer") = py::none(),
             py::arg("value_printer") = py::none(), py::arg("diff_printer") = py::none(),
             "Render the symmetric diff of self and other; '' when they agree.\n\n"
             "Keys only in self are tagged '--', keys only in other '++'.")

        // Identity and comparison
        .def("is_same", &PyOrderedMap::isSame,
             py::arg("other"),
             "True if both maps share the same tree (physical identity).")

        .def("compare",
             [](const PyOrderedMap& self, const PyOrderedMap& other) {
                 return self.compare(other, pyutils::compareObjects);
             },
             py::arg("other"),
             "Three-way comparison of the bindings in key order.")

        // Python protocols
        .def("__getitem__",
             [](const PyOrderedMap& self, py::object key) -> py::object {
                 std::optional<py::object> data = self.find(key);
                 if (!data) throw py::key_error(pyutils::reprOf(key));
                 return *data;
             },
             py::arg("key"),
             "Get item using bracket notation. Raises KeyError if not found.")

        .def("__contains__", &PyOrderedMap::mem,
             py::arg("key"))

        .def("__len__", &PyOrderedMap::length)

        .def("__bool__", [](const PyOrderedMap& self) { return !self.isEmpty(); })

        .def("__iter__",
             [](const PyOrderedMap& self) -> py::iterator { return py::iter(ordmap::keysList(self)); },
             "Iterate over keys in ascending order.")

        .def("__eq__",
             [](const PyOrderedMap& self, py::object other) -> bool {
                 if (!py::isinstance<PyOrderedMap>(other)) {
                     return false;
                 }
                 return self.equal(other.cast<const PyOrderedMap&>(), pyutils::objectsEqual);
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyOrderedMap& self, py::object other) -> bool {
                 if (!py::isinstance<PyOrderedMap>(other)) {
                     return true;
                 }
                 return !self.equal(other.cast<const PyOrderedMap&>(), pyutils::objectsEqual);
             },
             py::arg("other"))

        .def("__repr__", &ordmap::repr,
             "String representation of the map.")

        // Pickle support
        .def(py::pickle(
            [](const PyOrderedMap& self) { // __getstate__
                return ordmap::itemsList(self);
            },
            [](py::list items) { // __setstate__
                return ordmap::fromItems(items);
            }
        ));
}
