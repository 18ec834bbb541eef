#pragma once

#include <string>
#include <string_view>

// fixed upload chunk size of the session upload protocol
#define UPLOAD_CHUNK_SIZE (5ULL * 1024 * 1024)

struct chunk_t {
    unsigned long long offset;
    std::string_view data;
};

// Walks a buffer from offset 0 to its end in fixed-size chunks.
// The cursor does not own the buffer, it must outlive the cursor.
class ChunkCursor {
  public:
    ChunkCursor(std::string_view buffer_, unsigned long long chunk_size_ = UPLOAD_CHUNK_SIZE);

    bool has_next() const;
    // returns the chunk at the current offset and advances past it
    chunk_t next();
    unsigned long long offset() const;
    unsigned long long length() const;
    // integer percent of the buffer already consumed
    int percent() const;

  private:
    std::string_view buffer;
    unsigned long long chunk_size;
    unsigned long long current_offset;
};
