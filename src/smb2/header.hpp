#pragma once

#include "bit_fields.hpp"
#include "nt_status.hpp"
#include "../wire/le_codec.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace smb2 {

// Sync header layout (MS-SMB2 2.2.1.2): 64 bytes, little-endian.
constexpr size_t   HEADER_SIZE        = 64;
constexpr uint16_t HEADER_STRUCT_SIZE = 64;
constexpr std::array<uint8_t, 4> PROTOCOL_ID = {0xFE, 'S', 'M', 'B'};

// Request-header defaults: one credit charged, one credit requested.
constexpr uint16_t DEFAULT_CREDIT_CHARGE = 1;
constexpr uint16_t DEFAULT_CREDITS       = 1;

enum class Command : uint16_t {
    NEGOTIATE       = 0x0000,
    SESSION_SETUP   = 0x0001,
    LOGOFF          = 0x0002,
    TREE_CONNECT    = 0x0003,
    TREE_DISCONNECT = 0x0004,
    CREATE          = 0x0005,
    CLOSE           = 0x0006,
    FLUSH           = 0x0007,
    READ            = 0x0008,
    WRITE           = 0x0009,
    LOCK            = 0x000A,
    IOCTL           = 0x000B,
    CANCEL          = 0x000C,
    ECHO            = 0x000D,
    QUERY_DIRECTORY = 0x000E,
    CHANGE_NOTIFY   = 0x000F,
    QUERY_INFO      = 0x0010,
    SET_INFO        = 0x0011,
    OPLOCK_BREAK    = 0x0012,
};

const char* command_name(Command c);

// SMB2_FILEID: persistent + volatile halves, assigned by the server on CREATE.
struct FileId {
    uint64_t persistent{};
    uint64_t volatile_{};

    bool operator==(const FileId& o) const {
        return persistent == o.persistent && volatile_ == o.volatile_;
    }
    bool operator!=(const FileId& o) const { return !(*this == o); }
};

// Raw Windows FILETIME (100 ns ticks since 1601-01-01 UTC).
using FileTime = uint64_t;

struct Header {
    uint16_t    credit_charge{};
    uint32_t    status{};          // NTSTATUS on responses; ChannelSequence on requests
    Command     command{};
    uint16_t    credits{};         // CreditRequest / CreditResponse
    HeaderFlags flags;
    uint32_t    next_command{};
    uint64_t    message_id{};
    uint32_t    process_id{};      // low half of AsyncId when flags.async_command
    uint32_t    tree_id{};         // high half of AsyncId when flags.async_command
    uint64_t    session_id{};
    std::array<uint8_t, 16> signature{};

    Status nt_status() const { return interpret_status(status); }

    bool is_response() const { return flags.server_to_redir; }

    // AsyncId overlays ProcessId/TreeId on async responses.
    uint64_t async_id() const {
        return (static_cast<uint64_t>(tree_id) << 32) | process_id;
    }

    bool operator==(const Header& o) const;
    bool operator!=(const Header& o) const { return !(*this == o); }
};

// Fresh request header for `cmd`; routing ids are left for the Tree to stamp.
Header make_request_header(Command cmd);

void   encode_header(LeEncoder& enc, const Header& h);

// Reads the 64-byte header at the decoder's cursor.
// Throws MalformedPacketError on truncation, bad protocol id or structure size.
Header decode_header(LeDecoder& dec);

inline void encode_file_id(LeEncoder& enc, const FileId& id) {
    enc.put_uint64(id.persistent);
    enc.put_uint64(id.volatile_);
}

inline FileId decode_file_id(LeDecoder& dec) {
    FileId id;
    id.persistent = dec.get_uint64();
    id.volatile_  = dec.get_uint64();
    return id;
}

// Reads a body's StructureSize and rejects any value other than `expected`.
void expect_struct_size(LeDecoder& dec, uint16_t expected, const char* body);

// Throws MalformedPacketError unless the decoded header carries `cmd`.
void expect_command(const Header& h, Command cmd);

// Copies the packet-relative region [offset, offset + length). The region
// must start at or after `fixed_end` (end of the body's fixed prefix) and lie
// inside the packet; an empty region is returned without checking `offset`.
std::vector<uint8_t> slice_region(const LeDecoder& dec, size_t offset, size_t length,
                                  size_t fixed_end, const char* what);

// Narrows a payload size to a 32-bit length field.
// Throws std::invalid_argument if it does not fit.
uint32_t length32(size_t n, const char* what);

// A non-success response whose body declares StructureSize 9 is an SMB2
// ERROR body instead of the command's own (MS-SMB2 3.2.5.1.5), whatever the
// status severity. Warnings such as STATUS_BUFFER_OVERFLOW may instead carry
// the full command body, which has a different StructureSize.
// Peeks without moving the cursor, which must sit at the body start.
bool is_error_body(const Header& h, const LeDecoder& dec);

}  // namespace smb2
