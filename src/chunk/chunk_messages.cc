#include "chunk_messages.h"

namespace RemoteChunk {

const char* ChunkStatusName(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::CONTINUABLE:
            return "CONTINUABLE";
        case ChunkStatus::FINISHED:
            return "FINISHED";
        case ChunkStatus::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, ChunkStatus status) {
    return os << ChunkStatusName(status);
}

} // namespace RemoteChunk
