#include "py_collection.hpp"
#include <sstream>

std::vector<PyCollection::Entry> entriesFromMapping(const py::object& other) {
    std::vector<PyCollection::Entry> entries;

    if (py::isinstance<PyCollection>(other)) {
        const PyCollection& collection = other.cast<const PyCollection&>();
        entries.reserve(collection.size());
        for (const auto& item : collection.items()) {
            entries.push_back(item);
        }
    }
    else if (py::isinstance<py::dict>(other)) {
        py::dict d = other.cast<py::dict>();
        entries.reserve(d.size());
        for (auto item : d) {
            entries.emplace_back(py::reinterpret_borrow<py::object>(item.first),
                                 py::reinterpret_borrow<py::object>(item.second));
        }
    }
    else if (py::hasattr(other, "items")) {
        py::object items = other.attr("items")();
        for (auto item : items) {
            py::tuple pair = item.cast<py::tuple>();
            py::object key = pair[0];
            py::object value = pair[1];
            entries.emplace_back(key, value);
        }
    }
    else {
        throw py::type_error("Cannot update Collection with non-mapping type");
    }

    return entries;
}

std::string collectionRepr(const PyCollection& collection) {
    std::ostringstream oss;
    oss << "Collection({";

    size_t i = 0;
    for (const auto& item : collection.items()) {
        if (i > 0) oss << ", ";

        oss << py::repr(item.first).cast<std::string>() << ": "
            << py::repr(item.second).cast<std::string>();

        if (i >= 10 && collection.size() > 12) {
            oss << ", ... (" << (collection.size() - 11) << " more)";
            break;
        }
        i++;
    }

    oss << "}";
    if (collection.capacity()) {
        oss << ", capacity=" << *collection.capacity();
    }
    oss << ")";
    return oss.str();
}

PyCollection::MutationListener makeListener(const py::object& callback) {
    if (!PyCallable_Check(callback.ptr())) {
        throw py::type_error(std::string("listener must be callable, not '") +
                             pcutils::typeName(callback) + "'");
    }

    // Bound Python methods: call the function on a weakly held instance
    if (PyMethod_Check(callback.ptr())) {
        py::object func = callback.attr("__func__");
        py::object instance = callback.attr("__self__");
        py::weakref owner(instance);
        return [func, owner](MutationKind kind) {
            py::object target = owner();
            if (target.is_none()) return;
            func(target, mutationKindName(kind));
        };
    }

    py::function fn = py::reinterpret_borrow<py::function>(callback);
    return [fn](MutationKind kind) {
        fn(mutationKindName(kind));
    };
}

py::tuple collectionGetState(const PyCollection& collection) {
    PyCollection::State state = collection.state();

    py::list items;
    for (const auto& entry : state.entries) {
        items.append(py::make_tuple(entry.first, entry.second));
    }

    py::object capacity = state.capacity ? py::object(py::int_(*state.capacity)) : py::none();
    return py::make_tuple(items, capacity, overflowPolicyName(state.policy),
                          fromOptional(state.metadata));
}

PyCollection collectionSetState(const py::tuple& t) {
    if (t.size() != 4) {
        throw std::runtime_error("Invalid Collection state: expected 4 fields");
    }

    PyCollection::State state;
    for (auto item : t[0].cast<py::list>()) {
        py::tuple pair = item.cast<py::tuple>();
        py::object key = pair[0];
        py::object value = pair[1];
        state.entries.emplace_back(key, value);
    }
    if (!t[1].is_none()) {
        state.capacity = t[1].cast<int64_t>();
    }
    state.policy = parseOverflowPolicy(t[2].cast<std::string>());
    py::object metadata = t[3];
    state.metadata = optionalArg(metadata);

    return PyCollection::fromState(state);
}
