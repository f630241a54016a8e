#include "collection_policy.hpp"
#include <stdexcept>

const char* overflowPolicyName(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::Reject:      return "reject";
        case OverflowPolicy::EvictMinKey: return "evict-min-key";
    }
    return "unknown";
}

OverflowPolicy parseOverflowPolicy(const std::string& name) {
    if (name == "reject") return OverflowPolicy::Reject;
    if (name == "evict-min-key") return OverflowPolicy::EvictMinKey;
    throw std::invalid_argument("Unknown overflow policy '" + name +
                                "' (expected 'reject' or 'evict-min-key')");
}

const char* mutationKindName(MutationKind kind) {
    switch (kind) {
        case MutationKind::Insert:     return "insert";
        case MutationKind::Update:     return "update";
        case MutationKind::Pop:        return "pop";
        case MutationKind::PopItem:    return "popitem";
        case MutationKind::SetDefault: return "setdefault";
        case MutationKind::Clear:      return "clear";
        case MutationKind::Evict:      return "evict";
        case MutationKind::Metadata:   return "metadata";
        case MutationKind::Restore:    return "restore";
    }
    return "unknown";
}
