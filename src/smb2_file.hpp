#pragma once

#include "smb2/bit_fields.hpp"
#include "smb2/chunked_io.hpp"
#include "smb2/create.hpp"
#include "smb2/header.hpp"
#include "smb2/nt_status.hpp"
#include "smb2/query_directory.hpp"
#include "smb2/tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace smb2 {

// A file opened on a remote share.
//
// Built from the CREATE response that opened it; holds the server-assigned
// file id and the metadata returned at open time. Every request is stamped
// by the owning Tree (tree id, session id) and then given this file's id.
//
// The Tree is not owned and must outlive the File. After close() the handle
// is invalid on the server; further I/O through it is the caller's error.
class File {
public:
    // Throws std::invalid_argument if `response` does not carry a success status.
    File(Tree& tree, const CreateResponse& response, std::string name,
         ChunkedIo io = ChunkedIo{});

    // Read `bytes` bytes (default: the size cached at open) from `offset`.
    std::vector<uint8_t> read(std::optional<uint64_t> bytes = std::nullopt,
                              uint64_t offset = 0);

    // As read(), also reporting the first failing status met along the way.
    ReadResult read_with_status(std::optional<uint64_t> bytes = std::nullopt,
                                uint64_t offset = 0);

    // Write `data` at `offset`; returns the status that ended the write.
    Status write(const uint8_t* data, size_t size, uint64_t offset = 0);

    Status write(const std::vector<uint8_t>& data, uint64_t offset = 0) {
        return write(data.data(), data.size(), offset);
    }

    // Write at the end of the file as it was at open time. The cached size
    // is not refreshed: if the file has grown since, the caller must reopen.
    Status append(const std::vector<uint8_t>& data);

    // Send CLOSE for this handle.
    Status close();

    // QUERY_DIRECTORY on this handle (which must be an open directory).
    // Returns the response as received; records are left packed.
    QueryDirectoryResponse query_directory(
            const std::u16string& pattern = u"*",
            FileInformationClass info_class = FileInformationClass::FileIdFullDirectoryInformation,
            uint8_t flags = 0,
            uint32_t output_buffer_length = DEFAULT_MAX_TRANSFER_SIZE);

    // ── Cached metadata ─────────────────────────────────────────────────────

    const FileAttributes& attributes()   const { return attributes_; }
    const FileId&         file_id()      const { return file_id_; }
    FileTime              created()      const { return created_; }
    FileTime              last_access()  const { return last_access_; }
    FileTime              last_change()  const { return last_change_; }
    FileTime              last_write()   const { return last_write_; }
    uint64_t              size()         const { return size_; }
    uint64_t              size_on_disk() const { return size_on_disk_; }
    const std::string&    name()         const { return name_; }
    Tree&                 tree()         const { return tree_; }

private:
    // Fresh header for `cmd`, stamped by the owning Tree. Callers then build
    // the body with this file's id.
    Header request_header(Command cmd) const;

    Tree&          tree_;
    ChunkedIo      io_;
    std::string    name_;
    FileAttributes attributes_;
    FileId         file_id_;
    FileTime       created_{};
    FileTime       last_access_{};
    FileTime       last_change_{};
    FileTime       last_write_{};
    uint64_t       size_{};
    uint64_t       size_on_disk_{};
};

}  // namespace smb2
