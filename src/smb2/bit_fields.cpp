#include "bit_fields.hpp"

#include <tuple>

namespace smb2 {

namespace {

inline bool test(uint32_t raw, uint32_t mask) { return (raw & mask) != 0; }
inline uint32_t bit(bool set, uint32_t mask) { return set ? mask : 0u; }

constexpr uint32_t HEADER_FLAGS_KNOWN =
    FLAGS_SERVER_TO_REDIR | FLAGS_ASYNC_COMMAND | FLAGS_RELATED_OPERATIONS |
    FLAGS_SIGNED | FLAGS_PRIORITY_MASK | FLAGS_DFS_OPERATIONS | FLAGS_REPLAY_OPERATION;

constexpr uint16_t SECURITY_MODE_KNOWN =
    SECURITY_SIGNING_ENABLED | SECURITY_SIGNING_REQUIRED;

constexpr uint32_t CAPABILITIES_KNOWN =
    CAP_DFS | CAP_LEASING | CAP_LARGE_MTU | CAP_MULTI_CHANNEL |
    CAP_PERSISTENT_HANDLES | CAP_DIRECTORY_LEASING | CAP_ENCRYPTION;

constexpr uint32_t FILE_ATTRIBUTES_KNOWN =
    FILE_ATTRIBUTE_READONLY | FILE_ATTRIBUTE_HIDDEN | FILE_ATTRIBUTE_SYSTEM |
    FILE_ATTRIBUTE_DIRECTORY | FILE_ATTRIBUTE_ARCHIVE | FILE_ATTRIBUTE_NORMAL |
    FILE_ATTRIBUTE_TEMPORARY | FILE_ATTRIBUTE_SPARSE_FILE |
    FILE_ATTRIBUTE_REPARSE_POINT | FILE_ATTRIBUTE_COMPRESSED |
    FILE_ATTRIBUTE_OFFLINE | FILE_ATTRIBUTE_NOT_CONTENT_INDEXED |
    FILE_ATTRIBUTE_ENCRYPTED | FILE_ATTRIBUTE_INTEGRITY_STREAM |
    FILE_ATTRIBUTE_NO_SCRUB_DATA;

}  // namespace

// ── HeaderFlags ──────────────────────────────────────────────────────────────

HeaderFlags decode_header_flags(uint32_t raw) {
    HeaderFlags f;
    f.server_to_redir    = test(raw, FLAGS_SERVER_TO_REDIR);
    f.async_command      = test(raw, FLAGS_ASYNC_COMMAND);
    f.related_operations = test(raw, FLAGS_RELATED_OPERATIONS);
    f.signed_            = test(raw, FLAGS_SIGNED);
    f.priority           = static_cast<uint8_t>((raw & FLAGS_PRIORITY_MASK) >> FLAGS_PRIORITY_SHIFT);
    f.dfs_operation      = test(raw, FLAGS_DFS_OPERATIONS);
    f.replay_operation   = test(raw, FLAGS_REPLAY_OPERATION);
    f.reserved           = raw & ~HEADER_FLAGS_KNOWN;
    return f;
}

uint32_t encode_header_flags(const HeaderFlags& f) {
    return bit(f.server_to_redir,    FLAGS_SERVER_TO_REDIR) |
           bit(f.async_command,      FLAGS_ASYNC_COMMAND) |
           bit(f.related_operations, FLAGS_RELATED_OPERATIONS) |
           bit(f.signed_,            FLAGS_SIGNED) |
           ((static_cast<uint32_t>(f.priority) << FLAGS_PRIORITY_SHIFT) & FLAGS_PRIORITY_MASK) |
           bit(f.dfs_operation,      FLAGS_DFS_OPERATIONS) |
           bit(f.replay_operation,   FLAGS_REPLAY_OPERATION) |
           (f.reserved & ~HEADER_FLAGS_KNOWN);
}

bool HeaderFlags::operator==(const HeaderFlags& o) const {
    return std::tie(server_to_redir, async_command, related_operations, signed_,
                    priority, dfs_operation, replay_operation, reserved) ==
           std::tie(o.server_to_redir, o.async_command, o.related_operations, o.signed_,
                    o.priority, o.dfs_operation, o.replay_operation, o.reserved);
}

// ── SecurityMode ─────────────────────────────────────────────────────────────

SecurityMode decode_security_mode(uint16_t raw) {
    SecurityMode m;
    m.signing_enabled  = test(raw, SECURITY_SIGNING_ENABLED);
    m.signing_required = test(raw, SECURITY_SIGNING_REQUIRED);
    m.reserved         = static_cast<uint16_t>(raw & ~SECURITY_MODE_KNOWN);
    return m;
}

uint16_t encode_security_mode(const SecurityMode& m) {
    return static_cast<uint16_t>(bit(m.signing_enabled,  SECURITY_SIGNING_ENABLED) |
                                 bit(m.signing_required, SECURITY_SIGNING_REQUIRED) |
                                 (m.reserved & ~SECURITY_MODE_KNOWN));
}

bool SecurityMode::operator==(const SecurityMode& o) const {
    return signing_enabled == o.signing_enabled &&
           signing_required == o.signing_required &&
           reserved == o.reserved;
}

// ── Capabilities ─────────────────────────────────────────────────────────────

Capabilities decode_capabilities(uint32_t raw) {
    Capabilities c;
    c.dfs                = test(raw, CAP_DFS);
    c.leasing            = test(raw, CAP_LEASING);
    c.large_mtu          = test(raw, CAP_LARGE_MTU);
    c.multi_channel      = test(raw, CAP_MULTI_CHANNEL);
    c.persistent_handles = test(raw, CAP_PERSISTENT_HANDLES);
    c.directory_leasing  = test(raw, CAP_DIRECTORY_LEASING);
    c.encryption         = test(raw, CAP_ENCRYPTION);
    c.reserved           = raw & ~CAPABILITIES_KNOWN;
    return c;
}

uint32_t encode_capabilities(const Capabilities& c) {
    return bit(c.dfs,                CAP_DFS) |
           bit(c.leasing,            CAP_LEASING) |
           bit(c.large_mtu,          CAP_LARGE_MTU) |
           bit(c.multi_channel,      CAP_MULTI_CHANNEL) |
           bit(c.persistent_handles, CAP_PERSISTENT_HANDLES) |
           bit(c.directory_leasing,  CAP_DIRECTORY_LEASING) |
           bit(c.encryption,         CAP_ENCRYPTION) |
           (c.reserved & ~CAPABILITIES_KNOWN);
}

bool Capabilities::operator==(const Capabilities& o) const {
    return std::tie(dfs, leasing, large_mtu, multi_channel, persistent_handles,
                    directory_leasing, encryption, reserved) ==
           std::tie(o.dfs, o.leasing, o.large_mtu, o.multi_channel, o.persistent_handles,
                    o.directory_leasing, o.encryption, o.reserved);
}

// ── FileAttributes ───────────────────────────────────────────────────────────

FileAttributes decode_file_attributes(uint32_t raw) {
    FileAttributes a;
    a.read_only           = test(raw, FILE_ATTRIBUTE_READONLY);
    a.hidden              = test(raw, FILE_ATTRIBUTE_HIDDEN);
    a.system              = test(raw, FILE_ATTRIBUTE_SYSTEM);
    a.directory           = test(raw, FILE_ATTRIBUTE_DIRECTORY);
    a.archive             = test(raw, FILE_ATTRIBUTE_ARCHIVE);
    a.normal              = test(raw, FILE_ATTRIBUTE_NORMAL);
    a.temporary           = test(raw, FILE_ATTRIBUTE_TEMPORARY);
    a.sparse_file         = test(raw, FILE_ATTRIBUTE_SPARSE_FILE);
    a.reparse_point       = test(raw, FILE_ATTRIBUTE_REPARSE_POINT);
    a.compressed          = test(raw, FILE_ATTRIBUTE_COMPRESSED);
    a.offline             = test(raw, FILE_ATTRIBUTE_OFFLINE);
    a.not_content_indexed = test(raw, FILE_ATTRIBUTE_NOT_CONTENT_INDEXED);
    a.encrypted           = test(raw, FILE_ATTRIBUTE_ENCRYPTED);
    a.integrity_stream    = test(raw, FILE_ATTRIBUTE_INTEGRITY_STREAM);
    a.no_scrub_data       = test(raw, FILE_ATTRIBUTE_NO_SCRUB_DATA);
    a.reserved            = raw & ~FILE_ATTRIBUTES_KNOWN;
    return a;
}

uint32_t encode_file_attributes(const FileAttributes& a) {
    return bit(a.read_only,           FILE_ATTRIBUTE_READONLY) |
           bit(a.hidden,              FILE_ATTRIBUTE_HIDDEN) |
           bit(a.system,              FILE_ATTRIBUTE_SYSTEM) |
           bit(a.directory,           FILE_ATTRIBUTE_DIRECTORY) |
           bit(a.archive,             FILE_ATTRIBUTE_ARCHIVE) |
           bit(a.normal,              FILE_ATTRIBUTE_NORMAL) |
           bit(a.temporary,           FILE_ATTRIBUTE_TEMPORARY) |
           bit(a.sparse_file,         FILE_ATTRIBUTE_SPARSE_FILE) |
           bit(a.reparse_point,       FILE_ATTRIBUTE_REPARSE_POINT) |
           bit(a.compressed,          FILE_ATTRIBUTE_COMPRESSED) |
           bit(a.offline,             FILE_ATTRIBUTE_OFFLINE) |
           bit(a.not_content_indexed, FILE_ATTRIBUTE_NOT_CONTENT_INDEXED) |
           bit(a.encrypted,           FILE_ATTRIBUTE_ENCRYPTED) |
           bit(a.integrity_stream,    FILE_ATTRIBUTE_INTEGRITY_STREAM) |
           bit(a.no_scrub_data,       FILE_ATTRIBUTE_NO_SCRUB_DATA) |
           (a.reserved & ~FILE_ATTRIBUTES_KNOWN);
}

bool FileAttributes::operator==(const FileAttributes& o) const {
    return encode_file_attributes(*this) == encode_file_attributes(o);
}

}  // namespace smb2
