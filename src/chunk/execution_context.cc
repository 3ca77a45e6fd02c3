#include "execution_context.h"

namespace RemoteChunk {

std::optional<uint64_t> ExecutionContext::GetLong(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace RemoteChunk
