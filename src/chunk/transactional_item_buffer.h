#pragma once

#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "chunk_error.h"

namespace RemoteChunk {

/**
 * Identity of the caller's write transaction. The default value (0) means
 * "no transaction".
 */
struct TransactionId {
    uint64_t value = 0;

    bool valid() const { return value != 0; }

    bool operator==(const TransactionId& other) const { return value == other.value; }
    bool operator!=(const TransactionId& other) const { return value != other.value; }

    template <typename H>
    friend H AbslHashValue(H h, const TransactionId& id) {
        return H::combine(std::move(h), id.value);
    }
};

inline std::ostream& operator<<(std::ostream& os, const TransactionId& id) {
    return os << "txn#" << id.value;
}

/**
 * Staging area for items not yet dispatched, one list per open transaction.
 * Lists are created on first write and must be released by the owner when
 * the transaction commits (after flush) or rolls back (clear).
 */
template<typename T>
class TransactionalItemBuffer {
public:
    // Create-if-absent; repeated calls within a transaction return the same list.
    std::vector<T>& Bind(TransactionId txn) {
        RequireTransaction(txn);
        return buffers_[txn];
    }

    bool IsBound(TransactionId txn) const { return buffers_.contains(txn); }

    std::vector<T>& Get(TransactionId txn) {
        auto it = buffers_.find(txn);
        if (it == buffers_.end()) {
            throw BufferStateError("Processed items not bound to transaction.");
        }
        return it->second;
    }

    const std::vector<T>& Get(TransactionId txn) const {
        auto it = buffers_.find(txn);
        if (it == buffers_.end()) {
            throw BufferStateError("Processed items not bound to transaction.");
        }
        return it->second;
    }

    void Append(TransactionId txn, T item) {
        Bind(txn).push_back(std::move(item));
    }

    // Detach the staged items; the (now empty) list stays bound until Release.
    std::vector<T> Take(TransactionId txn) {
        return std::exchange(Get(txn), std::vector<T>{});
    }

    // Drop the list without dispatching it. No-op if nothing is bound.
    void Release(TransactionId txn) { buffers_.erase(txn); }

    // Drop every staged list; nothing staged in one step attempt reaches the next.
    void ReleaseAll() { buffers_.clear(); }

    size_t BoundCount() const { return buffers_.size(); }

private:
    static void RequireTransaction(TransactionId txn) {
        if (!txn.valid()) {
            throw BufferStateError("No transaction context: items can only be buffered inside a transaction");
        }
    }

    absl::flat_hash_map<TransactionId, std::vector<T>> buffers_;
};

} // namespace RemoteChunk
