#pragma once

#include "header.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace smb2 {

constexpr uint16_t QUERY_DIRECTORY_REQUEST_STRUCT_SIZE  = 33;
constexpr uint16_t QUERY_DIRECTORY_RESPONSE_STRUCT_SIZE = 9;

// The search pattern follows the request's fixed fields (64 + 32).
constexpr uint16_t QUERY_DIRECTORY_NAME_OFFSET = 0x60;
// Directory records follow the response's fixed fields (64 + 8).
constexpr uint16_t QUERY_DIRECTORY_OUTPUT_OFFSET = 0x48;

// FileInformationClass values valid for QUERY_DIRECTORY (MS-FSCC 2.4)
enum class FileInformationClass : uint8_t {
    FileDirectoryInformation       = 0x01,
    FileFullDirectoryInformation   = 0x02,
    FileBothDirectoryInformation   = 0x03,
    FileNamesInformation           = 0x0C,
    FileIdBothDirectoryInformation = 0x25,
    FileIdFullDirectoryInformation = 0x26,
};

constexpr uint8_t QUERY_DIRECTORY_RESTART_SCANS       = 0x01;
constexpr uint8_t QUERY_DIRECTORY_RETURN_SINGLE_ENTRY = 0x02;
constexpr uint8_t QUERY_DIRECTORY_INDEX_SPECIFIED     = 0x04;
constexpr uint8_t QUERY_DIRECTORY_REOPEN              = 0x10;

// SMB2 QUERY_DIRECTORY Request (MS-SMB2 2.2.33)
// `file_name` is the search pattern, sent as UTF-16LE.
struct QueryDirectoryRequest {
    Header               header;
    FileInformationClass file_information_class{FileInformationClass::FileIdFullDirectoryInformation};
    uint8_t              flags{};
    uint32_t             file_index{};
    FileId               file_id;
    uint32_t             output_buffer_length{};
    std::u16string       file_name;

    bool operator==(const QueryDirectoryRequest& o) const;
};

// SMB2 QUERY_DIRECTORY Response (MS-SMB2 2.2.34)
// `output_buffer` holds the packed directory records exactly as sent.
// The offset/length fields reflect the decoded packet; the encoder
// recomputes them from output_buffer.
struct QueryDirectoryResponse {
    static constexpr uint16_t struct_size = QUERY_DIRECTORY_RESPONSE_STRUCT_SIZE;

    Header               header;
    uint16_t             output_buffer_offset{};
    uint32_t             output_buffer_length{};
    std::vector<uint8_t> output_buffer;

    bool operator==(const QueryDirectoryResponse& o) const;
};

QueryDirectoryRequest make_query_directory_request(const Header& header, const FileId& file_id,
                                                   std::u16string pattern,
                                                   FileInformationClass info_class,
                                                   uint32_t output_buffer_length);

// Response value with offset/length matching what the encoder emits.
QueryDirectoryResponse make_query_directory_response(const Header& header,
                                                     std::vector<uint8_t> output_buffer);

std::vector<uint8_t>  encode_query_directory_request(const QueryDirectoryRequest& r);
QueryDirectoryRequest decode_query_directory_request(const std::vector<uint8_t>& data);

std::vector<uint8_t>   encode_query_directory_response(const QueryDirectoryResponse& r);
QueryDirectoryResponse decode_query_directory_response(const std::vector<uint8_t>& data);

}  // namespace smb2
