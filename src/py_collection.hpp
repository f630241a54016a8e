#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ordered_bounded_map.hpp"

namespace py = pybind11;

// Python utility functions
namespace pcutils {
    inline const char* typeName(const py::object& obj) {
        return Py_TYPE(obj.ptr())->tp_name;
    }
}

// Strict weak order over Python objects using rich comparison.
// A TypeError from mixed types becomes UnorderableError.
struct PyObjectLess {
    bool operator()(const py::object& a, const py::object& b) const {
        int lt = PyObject_RichCompareBool(a.ptr(), b.ptr(), Py_LT);
        if (lt == -1) {
            if (PyErr_ExceptionMatches(PyExc_TypeError)) {
                PyErr_Clear();
                throw UnorderableError(std::string("cannot order '") + pcutils::typeName(a) +
                                       "' and '" + pcutils::typeName(b) + "'");
            }
            throw py::error_already_set();
        }
        return lt == 1;
    }
};

struct PyObjectEqual {
    bool operator()(const py::object& a, const py::object& b) const {
        // Fast path: same object
        if (a.is(b)) return true;

        int eq = PyObject_RichCompareBool(a.ptr(), b.ptr(), Py_EQ);
        if (eq == -1) throw py::error_already_set();
        return eq == 1;
    }
};

struct PyCollectionTraits {
    using KeyLess = PyObjectLess;
    using ValueLess = PyObjectLess;
    using ValueEqual = PyObjectEqual;
};

using PyCollection = OrderedBoundedMap<py::object, py::object, py::object, PyCollectionTraits>;

namespace pcutils {
    inline py::object toPython(const py::object& obj) { return obj; }

    inline py::object toPython(const std::pair<py::object, py::object>& item) {
        return py::make_tuple(item.first, item.second);
    }
}

// Python iterator over one of the collection's views
template <typename View>
class PyViewIterator {
public:
    explicit PyViewIterator(const View& view) : it_(view.begin()), end_(view.end()) {}

    PyViewIterator& iter() { return *this; }

    py::object next() {
        if (it_ == end_) {
            throw py::stop_iteration();
        }
        py::object result = pcutils::toPython(*it_);
        ++it_;
        return result;
    }

private:
    typename View::iterator it_;
    typename View::iterator end_;
};

/**
 * PyView - Reusable Python view over a collection snapshot
 *
 * Every __iter__ starts a fresh pass over the same snapshot, so a view can
 * be iterated, measured and searched any number of times. Later changes to
 * the collection are not reflected.
 */
template <typename View>
class PyView {
public:
    using Iterator = PyViewIterator<View>;

    // `size` is passed when known up front (unbounded views)
    explicit PyView(View view, std::optional<size_t> size = std::nullopt)
        : view_(std::move(view)), size_(size) {}

    Iterator iter() const { return Iterator(view_); }

    size_t len() const {
        if (!size_) {
            size_t count = 0;
            for (auto it = view_.begin(); it != view_.end(); ++it) {
                ++count;
            }
            size_ = count;
        }
        return *size_;
    }

    bool contains(const py::object& item) const {
        PyObjectEqual equal;
        for (auto it = view_.begin(); it != view_.end(); ++it) {
            if (equal(pcutils::toPython(*it), item)) return true;
        }
        return false;
    }

    // Positional access in key order; negative indexes count from the end
    py::object getItem(py::ssize_t index) const {
        py::ssize_t length = static_cast<py::ssize_t>(len());
        if (index < 0) index += length;
        if (index < 0 || index >= length) {
            throw py::index_error("view index out of range");
        }

        auto it = view_.begin();
        for (py::ssize_t i = 0; i < index; ++i) {
            ++it;
        }
        return pcutils::toPython(*it);
    }

private:
    View view_;
    mutable std::optional<size_t> size_;
};

using KeyIterator = PyViewIterator<PyCollection::KeyView>;
using ValueIterator = PyViewIterator<PyCollection::ValueView>;
using ItemIterator = PyViewIterator<PyCollection::ItemView>;

using KeysView = PyView<PyCollection::KeyView>;
using ValuesView = PyView<PyCollection::ValueView>;
using ItemsView = PyView<PyCollection::ItemView>;

// Collects (key, value) pairs from a Collection, a dict, or anything with items()
std::vector<PyCollection::Entry> entriesFromMapping(const py::object& other);

std::string collectionRepr(const PyCollection& collection);

// Wraps a Python callable as a mutation listener. Bound methods keep only
// a weak reference to their instance.
PyCollection::MutationListener makeListener(const py::object& callback);

// Pickle state: (items, capacity, overflow, metadata)
py::tuple collectionGetState(const PyCollection& collection);
PyCollection collectionSetState(const py::tuple& state);

inline std::optional<py::object> optionalArg(const py::object& arg) {
    if (arg.is_none()) return std::nullopt;
    return arg;
}

inline py::object fromOptional(const std::optional<py::object>& value) {
    return value ? *value : py::none();
}
