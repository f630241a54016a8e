#pragma once

#include <stdexcept>
#include <string>

// Failure categories raised by OrderedBoundedMap
enum class ErrorKind {
    InvalidCapacity,
    CapacityExceeded,
    KeyNotFound,
    EmptyCollection,
    InvalidRange,
    Unorderable
};

const char* errorKindName(ErrorKind kind);

/**
 * CollectionError - Base class for all collection failures
 *
 * Every error is raised synchronously at the point of violation, and the
 * collection is left exactly as it was before the failing call.
 */
class CollectionError : public std::runtime_error {
public:
    CollectionError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidCapacityError : public CollectionError {
public:
    explicit InvalidCapacityError(const std::string& message)
        : CollectionError(ErrorKind::InvalidCapacity, message) {}
};

class CapacityExceededError : public CollectionError {
public:
    explicit CapacityExceededError(const std::string& message)
        : CollectionError(ErrorKind::CapacityExceeded, message) {}
};

class KeyNotFoundError : public CollectionError {
public:
    explicit KeyNotFoundError(const std::string& message)
        : CollectionError(ErrorKind::KeyNotFound, message) {}
};

class EmptyCollectionError : public CollectionError {
public:
    explicit EmptyCollectionError(const std::string& message)
        : CollectionError(ErrorKind::EmptyCollection, message) {}
};

class InvalidRangeError : public CollectionError {
public:
    explicit InvalidRangeError(const std::string& message)
        : CollectionError(ErrorKind::InvalidRange, message) {}
};

// Raised when keys or values cannot be compared with each other
class UnorderableError : public CollectionError {
public:
    explicit UnorderableError(const std::string& message)
        : CollectionError(ErrorKind::Unorderable, message) {}
};
