#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"

namespace RemoteChunk {

/**
 * Key/value checkpoint store handed to the item-stream hooks by the step
 * engine. Durable persistence is the engine's job; this only holds values.
 */
class ExecutionContext {
public:
    void PutLong(const std::string& key, uint64_t value) { values_[key] = value; }

    std::optional<uint64_t> GetLong(const std::string& key) const;

    bool ContainsKey(const std::string& key) const { return values_.contains(key); }
    void Remove(const std::string& key) { values_.erase(key); }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    absl::flat_hash_map<std::string, uint64_t> values_;
};

} // namespace RemoteChunk
