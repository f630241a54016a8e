#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "py_collection.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pycollection, m) {
    m.doc() = "Bounded ordered collection backed by a persistent red-black tree";

    // Error hierarchy: every collection failure derives from CollectionError
    auto& base = py::register_exception<CollectionError>(m, "CollectionError");
    py::register_exception<InvalidCapacityError>(m, "InvalidCapacityError", base.ptr());
    py::register_exception<CapacityExceededError>(m, "CapacityExceededError", base.ptr());
    py::register_exception<KeyNotFoundError>(m, "KeyNotFoundError", base.ptr());
    py::register_exception<EmptyCollectionError>(m, "EmptyCollectionError", base.ptr());
    py::register_exception<InvalidRangeError>(m, "InvalidRangeError", base.ptr());
    py::register_exception<UnorderableError>(m, "UnorderableError", base.ptr());

    // Expose iterators as Python iterators
    py::class_<KeyIterator>(m, "KeyIterator")
        .def("__iter__", &KeyIterator::iter, py::return_value_policy::reference_internal)
        .def("__next__", &KeyIterator::next);

    py::class_<ValueIterator>(m, "ValueIterator")
        .def("__iter__", &ValueIterator::iter, py::return_value_policy::reference_internal)
        .def("__next__", &ValueIterator::next);

    py::class_<ItemIterator>(m, "ItemIterator")
        .def("__iter__", &ItemIterator::iter, py::return_value_policy::reference_internal)
        .def("__next__", &ItemIterator::next);

    // Reusable views returned by keys()/values()/items() and the iter* ranges
    py::class_<KeysView>(m, "KeysView")
        .def("__iter__", &KeysView::iter)
        .def("__len__", &KeysView::len)
        .def("__contains__", &KeysView::contains, py::arg("key"))
        .def("__getitem__", &KeysView::getItem, py::arg("index"));

    py::class_<ValuesView>(m, "ValuesView")
        .def("__iter__", &ValuesView::iter)
        .def("__len__", &ValuesView::len)
        .def("__contains__", &ValuesView::contains, py::arg("value"))
        .def("__getitem__", &ValuesView::getItem, py::arg("index"));

    py::class_<ItemsView>(m, "ItemsView")
        .def("__iter__", &ItemsView::iter)
        .def("__len__", &ItemsView::len)
        .def("__contains__", &ItemsView::contains, py::arg("item"))
        .def("__getitem__", &ItemsView::getItem, py::arg("index"));

    py::class_<PyCollection>(m, "Collection")
        .def(py::init([](std::optional<int64_t> capacity, py::object metadata,
                         const std::string& overflow) {
                 return PyCollection(capacity, optionalArg(metadata),
                                     parseOverflowPolicy(overflow));
             }),
             py::arg("capacity") = py::none(),
             py::arg("metadata") = py::none(),
             py::arg("overflow") = "reject",
             "Create an empty Collection.\n\n"
             "Args:\n"
             "    capacity: Maximum number of entries, or None for unbounded\n"
             "    metadata: Opaque object stored alongside the entries\n"
             "    overflow: 'reject' (default) or 'evict-min-key'\n\n"
             "Raises:\n"
             "    InvalidCapacityError: if capacity is not positive")

        // Core methods
        .def("insert",
             [](PyCollection& self, py::object key, py::object value) -> py::object {
                 return fromOptional(self.insert(key, value));
             },
             py::arg("key"), py::arg("value"),
             "Insert or overwrite a single key-value pair.\n\n"
             "Args:\n"
             "    key: The key (must be orderable against the other keys)\n"
             "    value: The value to store\n\n"
             "Returns:\n"
             "    The previous value at key, or None\n\n"
             "Raises:\n"
             "    CapacityExceededError: if a new key would exceed the capacity\n"
             "    under the 'reject' policy")

        .def("update",
             [](PyCollection& self, py::object other) {
                 self.update(entriesFromMapping(other));
             },
             py::arg("other"),
             "Insert every pair of a mapping in ascending key order.\n\n"
             "Either every pair is applied or, on failure, none is.\n\n"
             "Args:\n"
             "    other: A dict, Collection, or any object with items()")

        .def("pop",
             [](PyCollection& self, py::object key) -> py::object {
                 return self.pop(key);
             },
             py::arg("key"),
             "Remove key and return its value.\n\n"
             "Raises:\n"
             "    KeyNotFoundError: if key is not present")

        .def("pop",
             [](PyCollection& self, py::object key, py::object default_val) -> py::object {
                 return self.pop(key, default_val);
             },
             py::arg("key"), py::arg("default"),
             "Remove key and return its value, or default if key is not present.")

        .def("popitem",
             [](PyCollection& self) -> py::tuple {
                 auto entry = self.popItem();
                 return py::make_tuple(entry.first, entry.second);
             },
             "Remove and return the (key, value) pair with the smallest key.\n\n"
             "Raises:\n"
             "    EmptyCollectionError: if the collection is empty")

        .def("setdefault",
             [](PyCollection& self, py::object key, py::object default_val) -> py::object {
                 return self.setDefault(key, default_val);
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Return the value at key, inserting default first if key is absent.")

        .def("clear", &PyCollection::clear,
             "Remove all entries. Capacity and metadata are kept.")

        .def("get",
             [](const PyCollection& self, py::object key, py::object default_val) -> py::object {
                 return self.get(key, default_val);
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Get value for key, or default if not found.")

        .def("has_key",
             [](const PyCollection& self, py::object key) { return self.contains(key); },
             py::arg("key"),
             "Check if key exists in the collection.")

        // Ordered iteration
        .def("keys",
             [](const PyCollection& self) { return KeysView(self.keys(), self.size()); },
             "Return a reusable view of the keys in ascending order.\n\n"
             "The view is a snapshot: later changes to the collection are not reflected.")

        .def("values",
             [](const PyCollection& self) { return ValuesView(self.values(), self.size()); },
             "Return a reusable view of the values in ascending key order.")

        .def("items",
             [](const PyCollection& self) { return ItemsView(self.items(), self.size()); },
             "Return a reusable view of (key, value) tuples in ascending key order.")

        .def("iterkeys",
             [](const PyCollection& self, py::object min, py::object max) {
                 return KeysView(self.iterKeys(optionalArg(min), optionalArg(max)));
             },
             py::arg("min") = py::none(), py::arg("max") = py::none(),
             "Return a reusable view of the keys in [min, max].\n\n"
             "Args:\n"
             "    min: Lowest key to return, or None for no lower bound\n"
             "    max: Highest key to return, or None for no upper bound\n\n"
             "Raises:\n"
             "    InvalidRangeError: if min > max")

        .def("itervalues",
             [](const PyCollection& self, py::object min, py::object max) {
                 return ValuesView(self.iterValues(optionalArg(min), optionalArg(max)));
             },
             py::arg("min") = py::none(), py::arg("max") = py::none(),
             "Return a reusable view of the values whose keys lie in [min, max].")

        .def("iteritems",
             [](const PyCollection& self, py::object min, py::object max) {
                 return ItemsView(self.iterItems(optionalArg(min), optionalArg(max)));
             },
             py::arg("min") = py::none(), py::arg("max") = py::none(),
             "Return a reusable view of (key, value) tuples whose keys lie in [min, max].")

        .def("byValue",
             [](const PyCollection& self, py::object min) -> py::list {
                 py::list result;
                 for (const auto& entry : self.byValue(optionalArg(min))) {
                     result.append(py::make_tuple(entry.first, entry.second));
                 }
                 return result;
             },
             py::arg("min") = py::none(),
             "Return (key, value) tuples with value >= min, by ascending value.\n\n"
             "Equal values are ordered by key.\n\n"
             "Raises:\n"
             "    UnorderableError: if the values cannot be compared")

        .def("maxKey",
             [](const PyCollection& self, py::object max) -> py::object {
                 return self.maxKey(optionalArg(max));
             },
             py::arg("max") = py::none(),
             "Return the largest key <= max (or the largest key if max is None).\n\n"
             "Raises:\n"
             "    EmptyCollectionError: if no key qualifies")

        .def("minKey",
             [](const PyCollection& self, py::object min) -> py::object {
                 return self.minKey(optionalArg(min));
             },
             py::arg("min") = py::none(),
             "Return the smallest key >= min (or the smallest key if min is None).\n\n"
             "Raises:\n"
             "    EmptyCollectionError: if no key qualifies")

        // Python protocols
        .def("__getitem__",
             [](const PyCollection& self, py::object key) -> py::object {
                 auto value = self.get(key);
                 if (!value) {
                     throw py::key_error(py::str(key));
                 }
                 return *value;
             },
             py::arg("key"),
             "Get item using bracket notation. Raises KeyError if not found.")

        .def("__setitem__",
             [](PyCollection& self, py::object key, py::object value) {
                 self.insert(key, value);
             },
             py::arg("key"), py::arg("value"))

        .def("__delitem__",
             [](PyCollection& self, py::object key) {
                 if (!self.contains(key)) {
                     throw py::key_error(py::str(key));
                 }
                 self.pop(key);
             },
             py::arg("key"),
             "Delete item using bracket notation. Raises KeyError if not found.")

        .def("__contains__",
             [](const PyCollection& self, py::object key) { return self.contains(key); },
             py::arg("key"))

        .def("__len__", &PyCollection::size,
             "Return number of entries in the collection.")

        .def("__iter__",
             [](const PyCollection& self) { return KeyIterator(self.keys()); },
             "Iterate over keys in ascending order.")

        .def("__eq__",
             [](const PyCollection& self, py::object other) -> py::object {
                 if (!py::isinstance<PyCollection>(other)) {
                     return py::reinterpret_borrow<py::object>(Py_NotImplemented);
                 }
                 return py::bool_(self == other.cast<const PyCollection&>());
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyCollection& self, py::object other) -> py::object {
                 if (!py::isinstance<PyCollection>(other)) {
                     return py::reinterpret_borrow<py::object>(Py_NotImplemented);
                 }
                 return py::bool_(self != other.cast<const PyCollection&>());
             },
             py::arg("other"))

        .def("__repr__", &collectionRepr)

        // Size and health
        .def_property_readonly("size", &PyCollection::size,
             "Number of entries in the collection.")

        .def_property_readonly("capacity",
             [](const PyCollection& self) -> py::object {
                 auto capacity = self.capacity();
                 return capacity ? py::object(py::int_(*capacity)) : py::none();
             },
             "Maximum number of entries, or None if unbounded.")

        .def_property_readonly("usage",
             [](const PyCollection& self) -> py::object {
                 auto usage = self.usage();
                 return usage ? py::object(py::float_(*usage)) : py::none();
             },
             "Fraction of capacity in use, or None if unbounded.")

        .def_property_readonly("status",
             [](const PyCollection& self) {
                 return std::string(healthStatusName(self.status()));
             },
             "Health level: HEALTHY, ACCEPTABLE, ALERT, WARNING or CRITICAL.")

        .def_property_readonly("overflow",
             [](const PyCollection& self) {
                 return std::string(overflowPolicyName(self.overflowPolicy()));
             },
             "Overflow policy: 'reject' or 'evict-min-key'.")

        .def_property("metadata",
             [](const PyCollection& self) { return fromOptional(self.metadata()); },
             [](PyCollection& self, py::object metadata) {
                 self.setMetadata(optionalArg(metadata));
             },
             "Opaque object attached to the collection.")

        .def("set_listener",
             [](PyCollection& self, py::object callback) {
                 if (callback.is_none()) {
                     self.setMutationListener(nullptr);
                     return;
                 }
                 self.setMutationListener(makeListener(callback));
             },
             py::arg("callback"),
             "Register a callable invoked with the mutation kind after every change.\n\n"
             "If the callable raises, the change is undone and the exception propagates.\n"
             "A bound method is held through a weak reference to its instance, so an\n"
             "owner that keeps the collection as an attribute can still be collected;\n"
             "once the owner is gone the listener does nothing. Any other callable is\n"
             "held strongly and must not refer back to the collection.\n\n"
             "Args:\n"
             "    callback: Callable taking one str argument, or None to remove it")

        // Pickle support
        .def(py::pickle(
            [](const PyCollection& c) { // __getstate__
                return collectionGetState(c);
            },
            [](py::tuple state) { // __setstate__
                return collectionSetState(state);
            }
        ));

    m.attr("__version__") = "1.0.0";
}
