#include "collection_errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCapacity:  return "InvalidCapacity";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::KeyNotFound:      return "KeyNotFound";
        case ErrorKind::EmptyCollection:  return "EmptyCollection";
        case ErrorKind::InvalidRange:     return "InvalidRange";
        case ErrorKind::Unorderable:      return "Unorderable";
    }
    return "Unknown";
}

CollectionError::CollectionError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message), kind_(kind) {}
