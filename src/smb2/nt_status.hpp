#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace smb2 {

// NTSTATUS codes an SMB2 file client meets (MS-ERREF 2.3).
// The wire value is kept as a raw uint32 so unlisted codes survive decoding.
enum class NtStatus : uint32_t {
    STATUS_SUCCESS                   = 0x00000000,
    STATUS_PENDING                   = 0x00000103,
    STATUS_NOTIFY_ENUM_DIR           = 0x0000010C,
    STATUS_BUFFER_OVERFLOW           = 0x80000005,
    STATUS_NO_MORE_FILES             = 0x80000006,
    STATUS_STOPPED_ON_SYMLINK        = 0x8000002D,
    STATUS_UNSUCCESSFUL              = 0xC0000001,
    STATUS_NOT_IMPLEMENTED           = 0xC0000002,
    STATUS_INVALID_INFO_CLASS        = 0xC0000003,
    STATUS_INFO_LENGTH_MISMATCH      = 0xC0000004,
    STATUS_INVALID_HANDLE            = 0xC0000008,
    STATUS_INVALID_PARAMETER         = 0xC000000D,
    STATUS_NO_SUCH_DEVICE            = 0xC000000E,
    STATUS_NO_SUCH_FILE              = 0xC000000F,
    STATUS_INVALID_DEVICE_REQUEST    = 0xC0000010,
    STATUS_END_OF_FILE               = 0xC0000011,
    STATUS_MORE_PROCESSING_REQUIRED  = 0xC0000016,
    STATUS_NO_MEMORY                 = 0xC0000017,
    STATUS_ACCESS_DENIED             = 0xC0000022,
    STATUS_BUFFER_TOO_SMALL          = 0xC0000023,
    STATUS_OBJECT_TYPE_MISMATCH      = 0xC0000024,
    STATUS_OBJECT_NAME_INVALID       = 0xC0000033,
    STATUS_OBJECT_NAME_NOT_FOUND     = 0xC0000034,
    STATUS_OBJECT_NAME_COLLISION     = 0xC0000035,
    STATUS_OBJECT_PATH_INVALID       = 0xC0000039,
    STATUS_OBJECT_PATH_NOT_FOUND     = 0xC000003A,
    STATUS_OBJECT_PATH_SYNTAX_BAD    = 0xC000003B,
    STATUS_SHARING_VIOLATION         = 0xC0000043,
    STATUS_EA_TOO_LARGE              = 0xC0000050,
    STATUS_FILE_LOCK_CONFLICT        = 0xC0000054,
    STATUS_LOCK_NOT_GRANTED          = 0xC0000055,
    STATUS_DELETE_PENDING            = 0xC0000056,
    STATUS_PRIVILEGE_NOT_HELD        = 0xC0000061,
    STATUS_LOGON_FAILURE             = 0xC000006D,
    STATUS_ACCOUNT_RESTRICTION       = 0xC000006E,
    STATUS_PASSWORD_EXPIRED          = 0xC0000071,
    STATUS_ACCOUNT_DISABLED          = 0xC0000072,
    STATUS_INSUFFICIENT_RESOURCES    = 0xC000009A,
    STATUS_MEDIA_WRITE_PROTECTED     = 0xC00000A2,
    STATUS_FILE_IS_A_DIRECTORY       = 0xC00000BA,
    STATUS_NOT_SUPPORTED             = 0xC00000BB,
    STATUS_NETWORK_NAME_DELETED      = 0xC00000C9,
    STATUS_NETWORK_ACCESS_DENIED     = 0xC00000CA,
    STATUS_BAD_NETWORK_NAME          = 0xC00000CC,
    STATUS_REQUEST_NOT_ACCEPTED      = 0xC00000D0,
    STATUS_DIRECTORY_NOT_EMPTY       = 0xC0000101,
    STATUS_NOT_A_DIRECTORY           = 0xC0000103,
    STATUS_CANCELLED                 = 0xC0000120,
    STATUS_FILE_CLOSED               = 0xC0000128,
    STATUS_INVALID_LEVEL             = 0xC0000148,
    STATUS_PIPE_BROKEN               = 0xC000014B,
    STATUS_DISK_FULL                 = 0xC000007F,
    STATUS_IO_TIMEOUT                = 0xC00000B5,
    STATUS_USER_SESSION_DELETED      = 0xC0000203,
    STATUS_NOT_FOUND                 = 0xC0000225,
    STATUS_NETWORK_SESSION_EXPIRED   = 0xC000035C,
    STATUS_SMB_BAD_CLUSTER_DIALECT   = 0xC05D0001,
};

// NTSTATUS severity (top two bits).
enum class Severity : uint8_t {
    SUCCESS       = 0,
    INFORMATIONAL = 1,
    WARNING       = 2,
    ERROR         = 3,
};

// Interpreted header status. Exactly code 0 is success; every other code
// is a failure, named from the table above or "STATUS_UNKNOWN".
struct Status {
    uint32_t code{};

    // Symbolic name; stable across calls for a given code.
    const char* name() const;

    bool is_success() const { return code == 0; }
    bool is_known() const;

    Severity severity() const { return static_cast<Severity>(code >> 30); }
    bool is_error() const { return severity() == Severity::ERROR; }

    bool is(NtStatus s) const { return code == static_cast<uint32_t>(s); }

    bool operator==(const Status& o) const { return code == o.code; }
    bool operator!=(const Status& o) const { return code != o.code; }
};

// Map a raw header status to its symbolic value. Pure; never throws.
Status interpret_status(uint32_t raw);

inline Status interpret_status(NtStatus s) {
    return interpret_status(static_cast<uint32_t>(s));
}

// "STATUS_ACCESS_DENIED (0xc0000022)"
std::string to_string(const Status& s);

// Exception carrying a non-success status. Callers that prefer exceptions
// over returned Status values convert with check_status().
struct Smb2Error : std::runtime_error {
    Status status;

    Smb2Error(Status s, const std::string& op)
        : std::runtime_error(op + " failed, " + to_string(s)), status(s) {}

    bool is(NtStatus code) const { return status.is(code); }
};

// Throws Smb2Error unless `s` is success.
void check_status(const Status& s, const std::string& op);

}  // namespace smb2
