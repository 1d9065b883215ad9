#include "write.hpp"

#include <tuple>
#include <utility>

namespace smb2 {

static constexpr size_t WRITE_REQUEST_FIXED = 48;

bool WriteRequest::operator==(const WriteRequest& o) const {
    return std::tie(header, write_offset, file_id, channel, remaining_bytes, flags, buffer) ==
           std::tie(o.header, o.write_offset, o.file_id, o.channel, o.remaining_bytes,
                    o.flags, o.buffer);
}

bool WriteResponse::operator==(const WriteResponse& o) const {
    return header == o.header && count == o.count && remaining == o.remaining;
}

WriteRequest make_write_request(const Header& header, const FileId& file_id,
                                uint64_t write_offset, std::vector<uint8_t> buffer) {
    WriteRequest r;
    r.header       = header;
    r.file_id      = file_id;
    r.write_offset = write_offset;
    r.buffer       = std::move(buffer);
    return r;
}

// ── Request ──────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_write_request(const WriteRequest& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(WRITE_REQUEST_STRUCT_SIZE);
    enc.put_uint16(WRITE_REQUEST_DATA_OFFSET);
    enc.put_uint32(length32(r.buffer.size(), "WRITE data"));
    enc.put_uint64(r.write_offset);
    encode_file_id(enc, r.file_id);
    enc.put_uint32(r.channel);
    enc.put_uint32(r.remaining_bytes);
    enc.put_zeros(4);  // WriteChannelInfoOffset, WriteChannelInfoLength
    enc.put_uint32(r.flags);
    if (r.buffer.empty())
        enc.put_uint8(0);  // StructureSize 49 counts one Buffer byte
    else
        enc.put_bytes(r.buffer);
    return enc.release();
}

WriteRequest decode_write_request(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    WriteRequest r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::WRITE);
    expect_struct_size(dec, WRITE_REQUEST_STRUCT_SIZE, "WRITE request");
    const uint16_t data_offset = dec.get_uint16();
    const uint32_t length      = dec.get_uint32();
    r.write_offset             = dec.get_uint64();
    r.file_id                  = decode_file_id(dec);
    r.channel                  = dec.get_uint32();
    r.remaining_bytes          = dec.get_uint32();
    dec.skip(4);  // WriteChannelInfoOffset, WriteChannelInfoLength
    r.flags                    = dec.get_uint32();
    r.buffer = slice_region(dec, data_offset, length,
                            HEADER_SIZE + WRITE_REQUEST_FIXED, "WRITE data");
    return r;
}

// ── Response ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_write_response(const WriteResponse& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(WRITE_RESPONSE_STRUCT_SIZE);
    enc.put_zeros(2);  // Reserved
    enc.put_uint32(r.count);
    enc.put_uint32(r.remaining);
    enc.put_zeros(4);  // WriteChannelInfoOffset, WriteChannelInfoLength
    return enc.release();
}

WriteResponse decode_write_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    WriteResponse r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::WRITE);
    if (is_error_body(r.header, dec))
        return r;
    expect_struct_size(dec, WRITE_RESPONSE_STRUCT_SIZE, "WRITE response");
    dec.skip(2);  // Reserved
    r.count     = dec.get_uint32();
    r.remaining = dec.get_uint32();
    dec.skip(4);  // WriteChannelInfoOffset, WriteChannelInfoLength
    return r;
}

}  // namespace smb2
