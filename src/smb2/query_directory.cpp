#include "query_directory.hpp"

#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace smb2 {

static constexpr size_t QUERY_DIRECTORY_REQUEST_FIXED  = 32;
static constexpr size_t QUERY_DIRECTORY_RESPONSE_FIXED = 8;

bool QueryDirectoryRequest::operator==(const QueryDirectoryRequest& o) const {
    return std::tie(header, file_information_class, flags, file_index, file_id,
                    output_buffer_length, file_name) ==
           std::tie(o.header, o.file_information_class, o.flags, o.file_index, o.file_id,
                    o.output_buffer_length, o.file_name);
}

bool QueryDirectoryResponse::operator==(const QueryDirectoryResponse& o) const {
    return std::tie(header, output_buffer_offset, output_buffer_length, output_buffer) ==
           std::tie(o.header, o.output_buffer_offset, o.output_buffer_length, o.output_buffer);
}

QueryDirectoryRequest make_query_directory_request(const Header& header, const FileId& file_id,
                                                   std::u16string pattern,
                                                   FileInformationClass info_class,
                                                   uint32_t output_buffer_length) {
    QueryDirectoryRequest r;
    r.header                 = header;
    r.file_id                = file_id;
    r.file_name              = std::move(pattern);
    r.file_information_class = info_class;
    r.output_buffer_length   = output_buffer_length;
    return r;
}

QueryDirectoryResponse make_query_directory_response(const Header& header,
                                                     std::vector<uint8_t> output_buffer) {
    QueryDirectoryResponse r;
    r.header               = header;
    r.output_buffer_offset = QUERY_DIRECTORY_OUTPUT_OFFSET;
    r.output_buffer_length = length32(output_buffer.size(), "QUERY_DIRECTORY output");
    r.output_buffer        = std::move(output_buffer);
    return r;
}

// ── Request ──────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_query_directory_request(const QueryDirectoryRequest& r) {
    const size_t name_bytes = r.file_name.size() * 2;
    if (name_bytes > UINT16_MAX)
        throw std::invalid_argument("QUERY_DIRECTORY search pattern too long");

    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(QUERY_DIRECTORY_REQUEST_STRUCT_SIZE);
    enc.put_uint8(static_cast<uint8_t>(r.file_information_class));
    enc.put_uint8(r.flags);
    enc.put_uint32(r.file_index);
    encode_file_id(enc, r.file_id);
    enc.put_uint16(QUERY_DIRECTORY_NAME_OFFSET);
    enc.put_uint16(static_cast<uint16_t>(name_bytes));
    enc.put_uint32(r.output_buffer_length);
    if (r.file_name.empty()) {
        enc.put_uint8(0);  // Buffer placeholder
    } else {
        for (char16_t c : r.file_name)
            enc.put_uint16(static_cast<uint16_t>(c));
    }
    return enc.release();
}

QueryDirectoryRequest decode_query_directory_request(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    QueryDirectoryRequest r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::QUERY_DIRECTORY);
    expect_struct_size(dec, QUERY_DIRECTORY_REQUEST_STRUCT_SIZE, "QUERY_DIRECTORY request");
    r.file_information_class = static_cast<FileInformationClass>(dec.get_uint8());
    r.flags                  = dec.get_uint8();
    r.file_index             = dec.get_uint32();
    r.file_id                = decode_file_id(dec);
    const uint16_t name_offset = dec.get_uint16();
    const uint16_t name_length = dec.get_uint16();
    r.output_buffer_length   = dec.get_uint32();

    if (name_length % 2 != 0)
        throw MalformedPacketError("QUERY_DIRECTORY FileNameLength " +
                                   std::to_string(name_length) + " is not UTF-16");
    const auto raw = slice_region(dec, name_offset, name_length,
                                  HEADER_SIZE + QUERY_DIRECTORY_REQUEST_FIXED,
                                  "QUERY_DIRECTORY file name");
    r.file_name.reserve(raw.size() / 2);
    for (size_t i = 0; i < raw.size(); i += 2)
        r.file_name.push_back(static_cast<char16_t>(raw[i] | (raw[i + 1] << 8)));
    return r;
}

// ── Response ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_query_directory_response(const QueryDirectoryResponse& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(QUERY_DIRECTORY_RESPONSE_STRUCT_SIZE);
    enc.put_uint16(QUERY_DIRECTORY_OUTPUT_OFFSET);
    enc.put_uint32(length32(r.output_buffer.size(), "QUERY_DIRECTORY output"));
    enc.put_bytes(r.output_buffer);
    return enc.release();
}

QueryDirectoryResponse decode_query_directory_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    QueryDirectoryResponse r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::QUERY_DIRECTORY);
    if (is_error_body(r.header, dec))
        return r;
    expect_struct_size(dec, QUERY_DIRECTORY_RESPONSE_STRUCT_SIZE, "QUERY_DIRECTORY response");
    r.output_buffer_offset = dec.get_uint16();
    r.output_buffer_length = dec.get_uint32();
    r.output_buffer = slice_region(dec, r.output_buffer_offset, r.output_buffer_length,
                                   HEADER_SIZE + QUERY_DIRECTORY_RESPONSE_FIXED,
                                   "QUERY_DIRECTORY output");
    return r;
}

}  // namespace smb2
