#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

constexpr uint16_t WRITE_REQUEST_STRUCT_SIZE  = 49;
constexpr uint16_t WRITE_RESPONSE_STRUCT_SIZE = 17;

// Write data follows the request's fixed fields: 64-byte header + 48.
constexpr uint16_t WRITE_REQUEST_DATA_OFFSET = 0x70;

// SMB2 WRITE Request (MS-SMB2 2.2.21)
// DataOffset and Length are derived from `buffer` when encoding.
struct WriteRequest {
    Header               header;
    uint64_t             write_offset{};
    FileId               file_id;
    uint32_t             channel{};
    uint32_t             remaining_bytes{};
    uint32_t             flags{};
    std::vector<uint8_t> buffer;

    bool operator==(const WriteRequest& o) const;
};

// SMB2 WRITE Response (MS-SMB2 2.2.22)
struct WriteResponse {
    Header   header;
    uint32_t count{};       // bytes written
    uint32_t remaining{};

    bool operator==(const WriteResponse& o) const;
};

WriteRequest make_write_request(const Header& header, const FileId& file_id,
                                uint64_t write_offset, std::vector<uint8_t> buffer);

// Throws std::invalid_argument if buffer does not fit a 32-bit Length.
std::vector<uint8_t> encode_write_request(const WriteRequest& r);
WriteRequest         decode_write_request(const std::vector<uint8_t>& data);

std::vector<uint8_t> encode_write_response(const WriteResponse& r);
WriteResponse        decode_write_response(const std::vector<uint8_t>& data);

}  // namespace smb2
