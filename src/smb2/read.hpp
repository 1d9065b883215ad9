#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

constexpr uint16_t READ_REQUEST_STRUCT_SIZE  = 49;
constexpr uint16_t READ_RESPONSE_STRUCT_SIZE = 17;

// Where the server is asked to place read data: right after the response's
// fixed fields (64-byte header + 16).
constexpr uint8_t READ_RESPONSE_DATA_OFFSET = 0x50;

// SMB2 READ Request (MS-SMB2 2.2.19)
struct ReadRequest {
    Header   header;
    uint8_t  padding{READ_RESPONSE_DATA_OFFSET};
    uint8_t  flags{};
    uint32_t read_length{};
    uint64_t offset{};
    FileId   file_id;
    uint32_t minimum_count{};
    uint32_t channel{};
    uint32_t remaining_bytes{};

    bool operator==(const ReadRequest& o) const;
};

// SMB2 READ Response (MS-SMB2 2.2.20)
// An error response decodes to an empty buffer; check header.nt_status().
struct ReadResponse {
    Header               header;
    uint32_t             data_remaining{};
    uint32_t             flags{};
    std::vector<uint8_t> buffer;

    bool operator==(const ReadResponse& o) const;
};

// Build a request in one step from a stamped header.
ReadRequest make_read_request(const Header& header, const FileId& file_id,
                              uint32_t read_length, uint64_t offset);

std::vector<uint8_t> encode_read_request(const ReadRequest& r);
ReadRequest          decode_read_request(const std::vector<uint8_t>& data);

std::vector<uint8_t> encode_read_response(const ReadResponse& r);
ReadResponse         decode_read_response(const std::vector<uint8_t>& data);

}  // namespace smb2
