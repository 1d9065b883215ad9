#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

constexpr uint16_t ERROR_RESPONSE_STRUCT_SIZE = 9;

// SMB2 ERROR Response (MS-SMB2 2.2.2): what a server sends in place of a
// command's own body when the status has error severity.
struct ErrorResponse {
    Header               header;
    uint8_t              error_context_count{};
    std::vector<uint8_t> error_data;

    bool operator==(const ErrorResponse& o) const {
        return header == o.header && error_context_count == o.error_context_count &&
               error_data == o.error_data;
    }
};

std::vector<uint8_t> encode_error_response(const ErrorResponse& r);
ErrorResponse        decode_error_response(const std::vector<uint8_t>& data);

}  // namespace smb2
