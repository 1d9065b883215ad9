#include "read.hpp"

#include <tuple>

namespace smb2 {

// StructureSize(2) + fixed response fields; data may start no earlier.
static constexpr size_t READ_RESPONSE_FIXED = 16;

bool ReadRequest::operator==(const ReadRequest& o) const {
    return std::tie(header, padding, flags, read_length, offset, file_id,
                    minimum_count, channel, remaining_bytes) ==
           std::tie(o.header, o.padding, o.flags, o.read_length, o.offset, o.file_id,
                    o.minimum_count, o.channel, o.remaining_bytes);
}

bool ReadResponse::operator==(const ReadResponse& o) const {
    return std::tie(header, data_remaining, flags, buffer) ==
           std::tie(o.header, o.data_remaining, o.flags, o.buffer);
}

ReadRequest make_read_request(const Header& header, const FileId& file_id,
                              uint32_t read_length, uint64_t offset) {
    ReadRequest r;
    r.header      = header;
    r.file_id     = file_id;
    r.read_length = read_length;
    r.offset      = offset;
    return r;
}

// ── Request ──────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_read_request(const ReadRequest& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(READ_REQUEST_STRUCT_SIZE);
    enc.put_uint8(r.padding);
    enc.put_uint8(r.flags);
    enc.put_uint32(r.read_length);
    enc.put_uint64(r.offset);
    encode_file_id(enc, r.file_id);
    enc.put_uint32(r.minimum_count);
    enc.put_uint32(r.channel);
    enc.put_uint32(r.remaining_bytes);
    enc.put_zeros(4);  // ReadChannelInfoOffset, ReadChannelInfoLength
    enc.put_zeros(1);  // Buffer placeholder
    return enc.release();
}

ReadRequest decode_read_request(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    ReadRequest r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::READ);
    expect_struct_size(dec, READ_REQUEST_STRUCT_SIZE, "READ request");
    r.padding         = dec.get_uint8();
    r.flags           = dec.get_uint8();
    r.read_length     = dec.get_uint32();
    r.offset          = dec.get_uint64();
    r.file_id         = decode_file_id(dec);
    r.minimum_count   = dec.get_uint32();
    r.channel         = dec.get_uint32();
    r.remaining_bytes = dec.get_uint32();
    dec.skip(4);  // ReadChannelInfoOffset, ReadChannelInfoLength
    dec.skip(1);  // Buffer placeholder counted by StructureSize 49
    return r;
}

// ── Response ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_read_response(const ReadResponse& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(READ_RESPONSE_STRUCT_SIZE);
    enc.put_uint8(READ_RESPONSE_DATA_OFFSET);
    enc.put_zeros(1);  // Reserved
    enc.put_uint32(length32(r.buffer.size(), "READ data"));
    enc.put_uint32(r.data_remaining);
    enc.put_uint32(r.flags);
    enc.put_bytes(r.buffer);
    return enc.release();
}

ReadResponse decode_read_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    ReadResponse r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::READ);
    if (is_error_body(r.header, dec))
        return r;
    expect_struct_size(dec, READ_RESPONSE_STRUCT_SIZE, "READ response");
    const uint8_t data_offset  = dec.get_uint8();
    dec.skip(1);  // Reserved
    const uint32_t data_length = dec.get_uint32();
    r.data_remaining           = dec.get_uint32();
    r.flags                    = dec.get_uint32();
    r.buffer = slice_region(dec, data_offset, data_length,
                            HEADER_SIZE + READ_RESPONSE_FIXED, "READ data");
    return r;
}

}  // namespace smb2
