#include "smb2_file.hpp"
#include "smb2/close.hpp"
#include "smb2/read.hpp"
#include "smb2/write.hpp"

#include <stdexcept>
#include <utility>

namespace smb2 {

File::File(Tree& tree, const CreateResponse& response, std::string name, ChunkedIo io)
    : tree_(tree), io_(io), name_(std::move(name)) {
    const Status status = response.header.nt_status();
    if (!status.is_success())
        throw std::invalid_argument("File: CREATE response for '" + name_ +
                                    "' is not a successful open: " + to_string(status));

    attributes_   = response.file_attributes;
    file_id_      = response.file_id;
    created_      = response.creation_time;
    last_access_  = response.last_access_time;
    last_change_  = response.change_time;
    last_write_   = response.last_write_time;
    size_         = response.end_of_file;
    size_on_disk_ = response.allocation_size;
}

Header File::request_header(Command cmd) const {
    return tree_.stamp_common_header_fields(make_request_header(cmd));
}

// ── Data operations ──────────────────────────────────────────────────────────

std::vector<uint8_t> File::read(std::optional<uint64_t> bytes, uint64_t offset) {
    return read_with_status(bytes, offset).data;
}

ReadResult File::read_with_status(std::optional<uint64_t> bytes, uint64_t offset) {
    const ReadRequestBuilder build = [this](uint32_t length, uint64_t chunk_offset) {
        return make_read_request(request_header(Command::READ), file_id_, length, chunk_offset);
    };
    return io_.read(tree_.client(), build, bytes.value_or(size_), offset);
}

Status File::write(const uint8_t* data, size_t size, uint64_t offset) {
    const WriteRequestBuilder build = [this](uint64_t chunk_offset, std::vector<uint8_t> chunk) {
        return make_write_request(request_header(Command::WRITE), file_id_,
                                  chunk_offset, std::move(chunk));
    };
    return io_.write(tree_.client(), build, data, size, offset);
}

Status File::append(const std::vector<uint8_t>& data) {
    return write(data, size_);
}

Status File::close() {
    const auto request  = make_close_request(request_header(Command::CLOSE), file_id_);
    const auto raw      = tree_.client().send_recv(encode_close_request(request));
    const auto response = decode_close_response(raw);
    return response.header.nt_status();
}

// ── Directory listing ────────────────────────────────────────────────────────

QueryDirectoryResponse File::query_directory(const std::u16string& pattern,
                                             FileInformationClass info_class,
                                             uint8_t flags,
                                             uint32_t output_buffer_length) {
    auto request  = make_query_directory_request(request_header(Command::QUERY_DIRECTORY),
                                                 file_id_, pattern, info_class,
                                                 output_buffer_length);
    request.flags = flags;
    const auto raw = tree_.client().send_recv(encode_query_directory_request(request));
    return decode_query_directory_response(raw);
}

}  // namespace smb2
