#pragma once

#include <cstdint>

namespace smb2 {

// Each bit field keeps the bits it does not name in `reserved`, so
// encode(decode(x)) == x for every raw value.

// SMB2 header Flags (MS-SMB2 2.2.1.1)
constexpr uint32_t FLAGS_SERVER_TO_REDIR    = 0x00000001;
constexpr uint32_t FLAGS_ASYNC_COMMAND      = 0x00000002;
constexpr uint32_t FLAGS_RELATED_OPERATIONS = 0x00000004;
constexpr uint32_t FLAGS_SIGNED             = 0x00000008;
constexpr uint32_t FLAGS_PRIORITY_MASK      = 0x00000070;
constexpr uint32_t FLAGS_PRIORITY_SHIFT     = 4;
constexpr uint32_t FLAGS_DFS_OPERATIONS     = 0x10000000;
constexpr uint32_t FLAGS_REPLAY_OPERATION   = 0x20000000;

struct HeaderFlags {
    bool     server_to_redir{};     // set on every response
    bool     async_command{};
    bool     related_operations{};
    bool     signed_{};
    uint8_t  priority{};            // 3-bit I/O priority, 0..7
    bool     dfs_operation{};
    bool     replay_operation{};
    uint32_t reserved{};            // unnamed bits, carried verbatim

    bool operator==(const HeaderFlags& o) const;
    bool operator!=(const HeaderFlags& o) const { return !(*this == o); }
};

HeaderFlags decode_header_flags(uint32_t raw);
uint32_t    encode_header_flags(const HeaderFlags& f);

// SecurityMode (NEGOTIATE / SESSION_SETUP)
constexpr uint16_t SECURITY_SIGNING_ENABLED  = 0x0001;
constexpr uint16_t SECURITY_SIGNING_REQUIRED = 0x0002;

struct SecurityMode {
    bool     signing_enabled{};
    bool     signing_required{};
    uint16_t reserved{};

    bool operator==(const SecurityMode& o) const;
    bool operator!=(const SecurityMode& o) const { return !(*this == o); }
};

SecurityMode decode_security_mode(uint16_t raw);
uint16_t     encode_security_mode(const SecurityMode& m);

// Capabilities (NEGOTIATE / SESSION_SETUP)
constexpr uint32_t CAP_DFS                = 0x00000001;
constexpr uint32_t CAP_LEASING            = 0x00000002;
constexpr uint32_t CAP_LARGE_MTU          = 0x00000004;
constexpr uint32_t CAP_MULTI_CHANNEL      = 0x00000008;
constexpr uint32_t CAP_PERSISTENT_HANDLES = 0x00000010;
constexpr uint32_t CAP_DIRECTORY_LEASING  = 0x00000020;
constexpr uint32_t CAP_ENCRYPTION         = 0x00000040;

struct Capabilities {
    bool     dfs{};
    bool     leasing{};
    bool     large_mtu{};
    bool     multi_channel{};
    bool     persistent_handles{};
    bool     directory_leasing{};
    bool     encryption{};
    uint32_t reserved{};

    bool operator==(const Capabilities& o) const;
    bool operator!=(const Capabilities& o) const { return !(*this == o); }
};

Capabilities decode_capabilities(uint32_t raw);
uint32_t     encode_capabilities(const Capabilities& c);

// File attributes (MS-FSCC 2.6)
constexpr uint32_t FILE_ATTRIBUTE_READONLY            = 0x00000001;
constexpr uint32_t FILE_ATTRIBUTE_HIDDEN              = 0x00000002;
constexpr uint32_t FILE_ATTRIBUTE_SYSTEM              = 0x00000004;
constexpr uint32_t FILE_ATTRIBUTE_DIRECTORY           = 0x00000010;
constexpr uint32_t FILE_ATTRIBUTE_ARCHIVE             = 0x00000020;
constexpr uint32_t FILE_ATTRIBUTE_NORMAL              = 0x00000080;
constexpr uint32_t FILE_ATTRIBUTE_TEMPORARY           = 0x00000100;
constexpr uint32_t FILE_ATTRIBUTE_SPARSE_FILE         = 0x00000200;
constexpr uint32_t FILE_ATTRIBUTE_REPARSE_POINT       = 0x00000400;
constexpr uint32_t FILE_ATTRIBUTE_COMPRESSED          = 0x00000800;
constexpr uint32_t FILE_ATTRIBUTE_OFFLINE             = 0x00001000;
constexpr uint32_t FILE_ATTRIBUTE_NOT_CONTENT_INDEXED = 0x00002000;
constexpr uint32_t FILE_ATTRIBUTE_ENCRYPTED           = 0x00004000;
constexpr uint32_t FILE_ATTRIBUTE_INTEGRITY_STREAM    = 0x00008000;
constexpr uint32_t FILE_ATTRIBUTE_NO_SCRUB_DATA       = 0x00020000;

struct FileAttributes {
    bool     read_only{};
    bool     hidden{};
    bool     system{};
    bool     directory{};
    bool     archive{};
    bool     normal{};
    bool     temporary{};
    bool     sparse_file{};
    bool     reparse_point{};
    bool     compressed{};
    bool     offline{};
    bool     not_content_indexed{};
    bool     encrypted{};
    bool     integrity_stream{};
    bool     no_scrub_data{};
    uint32_t reserved{};

    bool operator==(const FileAttributes& o) const;
    bool operator!=(const FileAttributes& o) const { return !(*this == o); }
};

FileAttributes decode_file_attributes(uint32_t raw);
uint32_t       encode_file_attributes(const FileAttributes& a);

}  // namespace smb2
