#pragma once

#include "nt_status.hpp"
#include "read.hpp"
#include "write.hpp"
#include "tree.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace smb2 {

// Largest payload carried by a single READ or WRITE exchange by default.
constexpr uint32_t DEFAULT_MAX_TRANSFER_SIZE = 32768;

// Builds a complete request for one chunk; supplied by the file handle so
// every chunk carries its tree, session and file ids.
using ReadRequestBuilder  = std::function<ReadRequest(uint32_t length, uint64_t offset)>;
using WriteRequestBuilder = std::function<WriteRequest(uint64_t offset,
                                                       std::vector<uint8_t> chunk)>;

struct ReadResult {
    std::vector<uint8_t> data;
    // First non-success status returned by any chunk (not the last), or success.
    Status               status;
};

// Splits logical reads and writes into sequential wire exchanges of at most
// max_transfer_size bytes. One request is outstanding at a time.
class ChunkedIo {
public:
    // Throws std::invalid_argument if max_transfer_size is zero.
    explicit ChunkedIo(uint32_t max_transfer_size = DEFAULT_MAX_TRANSFER_SIZE);

    uint32_t max_transfer_size() const { return max_transfer_size_; }

    // Issues ceil(total_bytes / max) READs at start_offset, start_offset + max, ...
    // Every response's buffer is appended, whatever its status; a failing
    // status does not end the loop but is reported in ReadResult::status.
    // total_bytes == 0 sends nothing.
    ReadResult read(Transport& transport, const ReadRequestBuilder& build,
                    uint64_t total_bytes, uint64_t start_offset) const;

    // Writes front-to-back slices of `data`. Stops at the first non-success
    // status and returns it; later slices are never sent. Returns success
    // without sending anything when size == 0.
    Status write(Transport& transport, const WriteRequestBuilder& build,
                 const uint8_t* data, size_t size, uint64_t start_offset) const;

private:
    uint32_t max_transfer_size_;
};

}  // namespace smb2
