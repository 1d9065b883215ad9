#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

constexpr uint16_t CREATE_RESPONSE_STRUCT_SIZE = 89;

// Create contexts, when present, follow the fixed fields (64 + 88).
constexpr uint32_t CREATE_RESPONSE_CONTEXTS_OFFSET = 0x98;

// CreateAction (MS-SMB2 2.2.14)
enum class CreateAction : uint32_t {
    FILE_SUPERSEDED  = 0,
    FILE_OPENED      = 1,
    FILE_CREATED     = 2,
    FILE_OVERWRITTEN = 3,
};

// SMB2 CREATE Response (MS-SMB2 2.2.14): the open result a File is built from.
// Create contexts are carried as opaque bytes.
struct CreateResponse {
    Header               header;
    uint8_t              oplock_level{};
    uint8_t              flags{};
    CreateAction         create_action{};
    FileTime             creation_time{};
    FileTime             last_access_time{};
    FileTime             last_write_time{};
    FileTime             change_time{};
    uint64_t             allocation_size{};
    uint64_t             end_of_file{};
    FileAttributes       file_attributes;
    FileId               file_id;
    std::vector<uint8_t> create_contexts;

    bool operator==(const CreateResponse& o) const;
};

std::vector<uint8_t> encode_create_response(const CreateResponse& r);
CreateResponse       decode_create_response(const std::vector<uint8_t>& data);

}  // namespace smb2
