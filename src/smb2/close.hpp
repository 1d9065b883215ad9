#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

constexpr uint16_t CLOSE_REQUEST_STRUCT_SIZE  = 24;
constexpr uint16_t CLOSE_RESPONSE_STRUCT_SIZE = 60;

// Ask the server to return final attributes in the response.
constexpr uint16_t CLOSE_FLAG_POSTQUERY_ATTRIB = 0x0001;

// SMB2 CLOSE Request (MS-SMB2 2.2.15)
struct CloseRequest {
    Header   header;
    uint16_t flags{};
    FileId   file_id;

    bool operator==(const CloseRequest& o) const;
};

// SMB2 CLOSE Response (MS-SMB2 2.2.16)
// Attribute fields are zero unless the request set POSTQUERY_ATTRIB.
struct CloseResponse {
    Header         header;
    uint16_t       flags{};
    FileTime       creation_time{};
    FileTime       last_access_time{};
    FileTime       last_write_time{};
    FileTime       change_time{};
    uint64_t       allocation_size{};
    uint64_t       end_of_file{};
    FileAttributes file_attributes;

    bool operator==(const CloseResponse& o) const;
};

CloseRequest make_close_request(const Header& header, const FileId& file_id);

std::vector<uint8_t> encode_close_request(const CloseRequest& r);
CloseRequest         decode_close_request(const std::vector<uint8_t>& data);

std::vector<uint8_t> encode_close_response(const CloseResponse& r);
CloseResponse        decode_close_response(const std::vector<uint8_t>& data);

}  // namespace smb2
