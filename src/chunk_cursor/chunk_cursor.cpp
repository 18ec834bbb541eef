#include <algorithm>

#include "./chunk_cursor.hpp"

ChunkCursor::ChunkCursor(std::string_view buffer_, unsigned long long chunk_size_) :
    buffer {buffer_},
    chunk_size {chunk_size_ == 0 ? UPLOAD_CHUNK_SIZE : chunk_size_},
    current_offset {0} {}

bool ChunkCursor::has_next() const {
    return current_offset < buffer.size();
}

chunk_t ChunkCursor::next() {
    if (!has_next()) {
        return chunk_t { current_offset, std::string_view() };
    }
    const auto size = std::min<unsigned long long>(chunk_size, buffer.size() - current_offset);
    chunk_t chunk { current_offset, buffer.substr(current_offset, size) };
    current_offset += size;
    return chunk;
}

unsigned long long ChunkCursor::offset() const {
    return current_offset;
}

unsigned long long ChunkCursor::length() const {
    return buffer.size();
}

int ChunkCursor::percent() const {
    if (buffer.empty()) {
        return 100;
    }
    return (int) (current_offset * 100 / buffer.size());
}
