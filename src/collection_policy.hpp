#pragma once

#include <string>

// What insert does when a new key arrives at a full collection
enum class OverflowPolicy {
    Reject,       // fail with CapacityExceededError
    EvictMinKey   // drop the entry with the smallest key, then insert
};

// Reported to the mutation listener after every state change
enum class MutationKind {
    Insert,
    Update,
    Pop,
    PopItem,
    SetDefault,
    Clear,
    Evict,
    Metadata,
    Restore
};

const char* overflowPolicyName(OverflowPolicy policy);

// Accepts "reject" and "evict-min-key"; throws std::invalid_argument otherwise
OverflowPolicy parseOverflowPolicy(const std::string& name);

const char* mutationKindName(MutationKind kind);
