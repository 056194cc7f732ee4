#include "py_ordered_map.hpp"

#include <sstream>

namespace ordmap {

int PyKeyCompare::operator()(const py::object& k1, const py::object& k2) const {
    // Fast path: same object
    if (k1.is(k2)) return 0;

    int eq = PyObject_RichCompareBool(k1.ptr(), k2.ptr(), Py_EQ);
    if (eq == -1) throw py::error_already_set();
    if (eq == 1) return 0;

    int lt = PyObject_RichCompareBool(k1.ptr(), k2.ptr(), Py_LT);
    if (lt == -1) throw py::error_already_set();
    return lt ? -1 : 1;
}

namespace pyutils {

bool objectsEqual(const py::object& a, const py::object& b) {
    int eq = PyObject_RichCompareBool(a.ptr(), b.ptr(), Py_EQ);
    if (eq == -1) throw py::error_already_set();
    return eq == 1;
}

int compareObjects(const py::object& a, const py::object& b) {
    return PyKeyCompare()(a, b);
}

bool isTrue(const py::object& obj) {
    int truth = PyObject_IsTrue(obj.ptr());
    if (truth == -1) throw py::error_already_set();
    return truth == 1;
}

py::tuple mergeCaseToPy(const PyMergeCase& side) {
    switch (side.side()) {
    case MergeSide::Left:
        return py::make_tuple("Left", side.leftValue());
    case MergeSide::Right:
        return py::make_tuple("Right", side.rightValue());
    case MergeSide::Both:
        break;
    }
    return py::make_tuple("Both", side.leftValue(), side.rightValue());
}

py::tuple diffValueToPy(const DiffValue<py::object>& diff) {
    if (const OnlyLeft<py::object>* l = std::get_if<OnlyLeft<py::object>>(&diff)) {
        return py::make_tuple("Left", l->value);
    }
    if (const OnlyRight<py::object>* r = std::get_if<OnlyRight<py::object>>(&diff)) {
        return py::make_tuple("Right", r->value);
    }
    const Unequal<py::object>& u = std::get<Unequal<py::object>>(diff);
    return py::make_tuple("Unequal", u.left, u.right);
}

py::object classificationToPy(const Classification<py::object, py::object>& c) {
    switch (c.kind) {
    case Cardinality::Zero:
        return py::str("Zero");
    case Cardinality::One:
        return py::make_tuple("One", c.binding->first, c.binding->second);
    case Cardinality::Many:
        break;
    }
    return py::str("Many");
}

std::string reprOf(const py::handle& obj) {
    return py::repr(obj).cast<std::string>();
}

void writeWith(std::ostream& os, const py::object& printer, const py::object& obj) {
    if (printer.is_none()) {
        os << reprOf(obj);
    } else {
        os << py::str(printer(obj)).cast<std::string>();
    }
}

} // namespace pyutils

// Conversion

PyOrderedMap fromDict(const py::dict& d) {
    PyOrderedMap result;
    for (auto item : d) {
        result = result.set(
            py::reinterpret_borrow<py::object>(item.first),
            py::reinterpret_borrow<py::object>(item.second)
        );
    }
    return result;
}

PyOrderedMap fromItems(const py::iterable& items) {
    PyOrderedMap result;
    for (auto item : items) {
        py::object pair = py::reinterpret_borrow<py::object>(item);
        if (!py::isinstance<py::sequence>(pair) || py::len(pair) != 2) {
            throw py::value_error("expected (key, value) pairs");
        }
        py::object key = pair[py::int_(0)];
        py::object data = pair[py::int_(1)];
        result = result.set(key, data);
    }
    return result;
}

py::list itemsList(const PyOrderedMap& m) {
    py::list result;
    m.iteri([&result](const py::object& key, const py::object& data) {
        result.append(py::make_tuple(key, data));
    });
    return result;
}

py::list keysList(const PyOrderedMap& m) {
    py::list result;
    m.iteri([&result](const py::object& key, const py::object&) { result.append(key); });
    return result;
}

py::list valuesList(const PyOrderedMap& m) {
    py::list result;
    m.iter([&result](const py::object& data) { result.append(data); });
    return result;
}

// String representation

std::string repr(const PyOrderedMap& m) {
    std::ostringstream oss;
    oss << "OrderedMap({";

    std::size_t i = 0;
    for (auto it = m.begin(); it != m.end(); ++it) {
        if (i > 0) oss << ", ";
        oss << pyutils::reprOf((*it).first) << ": " << pyutils::reprOf((*it).second);

        if (i >= 10 && m.length() > 12) {
            oss << ", ... (" << (m.length() - 11) << " more)";
            break;
        }
        i++;
    }

    oss << "})";
    return oss.str();
}

} // namespace ordmap
