#include "chunked_io.hpp"

#include <algorithm>
#include <stdexcept>

namespace smb2 {

ChunkedIo::ChunkedIo(uint32_t max_transfer_size)
    : max_transfer_size_(max_transfer_size) {
    if (max_transfer_size_ == 0)
        throw std::invalid_argument("ChunkedIo: max_transfer_size must be non-zero");
}

ReadResult ChunkedIo::read(Transport& transport, const ReadRequestBuilder& build,
                           uint64_t total_bytes, uint64_t start_offset) const {
    ReadResult result;
    uint64_t offset    = start_offset;
    uint64_t remaining = total_bytes;

    while (remaining > 0) {
        const uint32_t chunk = static_cast<uint32_t>(
            std::min<uint64_t>(remaining, max_transfer_size_));

        const auto request  = encode_read_request(build(chunk, offset));
        const auto response = decode_read_response(transport.send_recv(request));

        result.data.insert(result.data.end(),
                           response.buffer.begin(), response.buffer.end());
        const Status status = response.header.nt_status();
        if (!status.is_success() && result.status.is_success())
            result.status = status;

        offset    += chunk;
        remaining -= chunk;
    }
    return result;
}

Status ChunkedIo::write(Transport& transport, const WriteRequestBuilder& build,
                        const uint8_t* data, size_t size, uint64_t start_offset) const {
    Status status = interpret_status(NtStatus::STATUS_SUCCESS);
    size_t sent   = 0;

    while (sent < size) {
        const size_t chunk = std::min<size_t>(size - sent, max_transfer_size_);

        const auto request  = encode_write_request(
            build(start_offset + sent, std::vector<uint8_t>(data + sent, data + sent + chunk)));
        const auto response = decode_write_response(transport.send_recv(request));

        status = response.header.nt_status();
        if (!status.is_success())
            return status;

        sent += chunk;
    }
    return status;
}

}  // namespace smb2
