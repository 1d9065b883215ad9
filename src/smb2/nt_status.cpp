#include "nt_status.hpp"

#include <cstdio>

namespace smb2 {

static const char* const UNKNOWN_STATUS_NAME = "STATUS_UNKNOWN";

static const char* lookup_name(uint32_t code) {
    switch (static_cast<NtStatus>(code)) {
    case NtStatus::STATUS_SUCCESS:                  return "STATUS_SUCCESS";
    case NtStatus::STATUS_PENDING:                  return "STATUS_PENDING";
    case NtStatus::STATUS_NOTIFY_ENUM_DIR:          return "STATUS_NOTIFY_ENUM_DIR";
    case NtStatus::STATUS_BUFFER_OVERFLOW:          return "STATUS_BUFFER_OVERFLOW";
    case NtStatus::STATUS_NO_MORE_FILES:            return "STATUS_NO_MORE_FILES";
    case NtStatus::STATUS_STOPPED_ON_SYMLINK:       return "STATUS_STOPPED_ON_SYMLINK";
    case NtStatus::STATUS_UNSUCCESSFUL:             return "STATUS_UNSUCCESSFUL";
    case NtStatus::STATUS_NOT_IMPLEMENTED:          return "STATUS_NOT_IMPLEMENTED";
    case NtStatus::STATUS_INVALID_INFO_CLASS:       return "STATUS_INVALID_INFO_CLASS";
    case NtStatus::STATUS_INFO_LENGTH_MISMATCH:     return "STATUS_INFO_LENGTH_MISMATCH";
    case NtStatus::STATUS_INVALID_HANDLE:           return "STATUS_INVALID_HANDLE";
    case NtStatus::STATUS_INVALID_PARAMETER:        return "STATUS_INVALID_PARAMETER";
    case NtStatus::STATUS_NO_SUCH_DEVICE:           return "STATUS_NO_SUCH_DEVICE";
    case NtStatus::STATUS_NO_SUCH_FILE:             return "STATUS_NO_SUCH_FILE";
    case NtStatus::STATUS_INVALID_DEVICE_REQUEST:   return "STATUS_INVALID_DEVICE_REQUEST";
    case NtStatus::STATUS_END_OF_FILE:              return "STATUS_END_OF_FILE";
    case NtStatus::STATUS_MORE_PROCESSING_REQUIRED: return "STATUS_MORE_PROCESSING_REQUIRED";
    case NtStatus::STATUS_NO_MEMORY:                return "STATUS_NO_MEMORY";
    case NtStatus::STATUS_ACCESS_DENIED:            return "STATUS_ACCESS_DENIED";
    case NtStatus::STATUS_BUFFER_TOO_SMALL:         return "STATUS_BUFFER_TOO_SMALL";
    case NtStatus::STATUS_OBJECT_TYPE_MISMATCH:     return "STATUS_OBJECT_TYPE_MISMATCH";
    case NtStatus::STATUS_OBJECT_NAME_INVALID:      return "STATUS_OBJECT_NAME_INVALID";
    case NtStatus::STATUS_OBJECT_NAME_NOT_FOUND:    return "STATUS_OBJECT_NAME_NOT_FOUND";
    case NtStatus::STATUS_OBJECT_NAME_COLLISION:    return "STATUS_OBJECT_NAME_COLLISION";
    case NtStatus::STATUS_OBJECT_PATH_INVALID:      return "STATUS_OBJECT_PATH_INVALID";
    case NtStatus::STATUS_OBJECT_PATH_NOT_FOUND:    return "STATUS_OBJECT_PATH_NOT_FOUND";
    case NtStatus::STATUS_OBJECT_PATH_SYNTAX_BAD:   return "STATUS_OBJECT_PATH_SYNTAX_BAD";
    case NtStatus::STATUS_SHARING_VIOLATION:        return "STATUS_SHARING_VIOLATION";
    case NtStatus::STATUS_EA_TOO_LARGE:             return "STATUS_EA_TOO_LARGE";
    case NtStatus::STATUS_FILE_LOCK_CONFLICT:       return "STATUS_FILE_LOCK_CONFLICT";
    case NtStatus::STATUS_LOCK_NOT_GRANTED:         return "STATUS_LOCK_NOT_GRANTED";
    case NtStatus::STATUS_DELETE_PENDING:           return "STATUS_DELETE_PENDING";
    case NtStatus::STATUS_PRIVILEGE_NOT_HELD:       return "STATUS_PRIVILEGE_NOT_HELD";
    case NtStatus::STATUS_LOGON_FAILURE:            return "STATUS_LOGON_FAILURE";
    case NtStatus::STATUS_ACCOUNT_RESTRICTION:      return "STATUS_ACCOUNT_RESTRICTION";
    case NtStatus::STATUS_PASSWORD_EXPIRED:         return "STATUS_PASSWORD_EXPIRED";
    case NtStatus::STATUS_ACCOUNT_DISABLED:         return "STATUS_ACCOUNT_DISABLED";
    case NtStatus::STATUS_INSUFFICIENT_RESOURCES:   return "STATUS_INSUFFICIENT_RESOURCES";
    case NtStatus::STATUS_MEDIA_WRITE_PROTECTED:    return "STATUS_MEDIA_WRITE_PROTECTED";
    case NtStatus::STATUS_FILE_IS_A_DIRECTORY:      return "STATUS_FILE_IS_A_DIRECTORY";
    case NtStatus::STATUS_NOT_SUPPORTED:            return "STATUS_NOT_SUPPORTED";
    case NtStatus::STATUS_NETWORK_NAME_DELETED:     return "STATUS_NETWORK_NAME_DELETED";
    case NtStatus::STATUS_NETWORK_ACCESS_DENIED:    return "STATUS_NETWORK_ACCESS_DENIED";
    case NtStatus::STATUS_BAD_NETWORK_NAME:         return "STATUS_BAD_NETWORK_NAME";
    case NtStatus::STATUS_REQUEST_NOT_ACCEPTED:     return "STATUS_REQUEST_NOT_ACCEPTED";
    case NtStatus::STATUS_DIRECTORY_NOT_EMPTY:      return "STATUS_DIRECTORY_NOT_EMPTY";
    case NtStatus::STATUS_NOT_A_DIRECTORY:          return "STATUS_NOT_A_DIRECTORY";
    case NtStatus::STATUS_CANCELLED:                return "STATUS_CANCELLED";
    case NtStatus::STATUS_FILE_CLOSED:              return "STATUS_FILE_CLOSED";
    case NtStatus::STATUS_INVALID_LEVEL:            return "STATUS_INVALID_LEVEL";
    case NtStatus::STATUS_PIPE_BROKEN:              return "STATUS_PIPE_BROKEN";
    case NtStatus::STATUS_DISK_FULL:                return "STATUS_DISK_FULL";
    case NtStatus::STATUS_IO_TIMEOUT:               return "STATUS_IO_TIMEOUT";
    case NtStatus::STATUS_USER_SESSION_DELETED:     return "STATUS_USER_SESSION_DELETED";
    case NtStatus::STATUS_NOT_FOUND:                return "STATUS_NOT_FOUND";
    case NtStatus::STATUS_NETWORK_SESSION_EXPIRED:  return "STATUS_NETWORK_SESSION_EXPIRED";
    case NtStatus::STATUS_SMB_BAD_CLUSTER_DIALECT:  return "STATUS_SMB_BAD_CLUSTER_DIALECT";
    }
    return nullptr;
}

const char* Status::name() const {
    const char* n = lookup_name(code);
    return n ? n : UNKNOWN_STATUS_NAME;
}

bool Status::is_known() const {
    return lookup_name(code) != nullptr;
}

Status interpret_status(uint32_t raw) {
    return Status{raw};
}

std::string to_string(const Status& s) {
    char hex[16];
    std::snprintf(hex, sizeof(hex), "0x%08x", s.code);
    return std::string(s.name()) + " (" + hex + ")";
}

void check_status(const Status& s, const std::string& op) {
    if (!s.is_success())
        throw Smb2Error(s, op);
}

}  // namespace smb2
