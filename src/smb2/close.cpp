#include "close.hpp"

#include <tuple>

namespace smb2 {

bool CloseRequest::operator==(const CloseRequest& o) const {
    return header == o.header && flags == o.flags && file_id == o.file_id;
}

bool CloseResponse::operator==(const CloseResponse& o) const {
    return std::tie(header, flags, creation_time, last_access_time, last_write_time,
                    change_time, allocation_size, end_of_file, file_attributes) ==
           std::tie(o.header, o.flags, o.creation_time, o.last_access_time, o.last_write_time,
                    o.change_time, o.allocation_size, o.end_of_file, o.file_attributes);
}

CloseRequest make_close_request(const Header& header, const FileId& file_id) {
    CloseRequest r;
    r.header  = header;
    r.file_id = file_id;
    return r;
}

std::vector<uint8_t> encode_close_request(const CloseRequest& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(CLOSE_REQUEST_STRUCT_SIZE);
    enc.put_uint16(r.flags);
    enc.put_zeros(4);  // Reserved
    encode_file_id(enc, r.file_id);
    return enc.release();
}

CloseRequest decode_close_request(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    CloseRequest r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::CLOSE);
    expect_struct_size(dec, CLOSE_REQUEST_STRUCT_SIZE, "CLOSE request");
    r.flags = dec.get_uint16();
    dec.skip(4);  // Reserved
    r.file_id = decode_file_id(dec);
    return r;
}

std::vector<uint8_t> encode_close_response(const CloseResponse& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(CLOSE_RESPONSE_STRUCT_SIZE);
    enc.put_uint16(r.flags);
    enc.put_zeros(4);  // Reserved
    enc.put_uint64(r.creation_time);
    enc.put_uint64(r.last_access_time);
    enc.put_uint64(r.last_write_time);
    enc.put_uint64(r.change_time);
    enc.put_uint64(r.allocation_size);
    enc.put_uint64(r.end_of_file);
    enc.put_uint32(encode_file_attributes(r.file_attributes));
    return enc.release();
}

CloseResponse decode_close_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    CloseResponse r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::CLOSE);
    if (is_error_body(r.header, dec))
        return r;
    expect_struct_size(dec, CLOSE_RESPONSE_STRUCT_SIZE, "CLOSE response");
    r.flags = dec.get_uint16();
    dec.skip(4);  // Reserved
    r.creation_time    = dec.get_uint64();
    r.last_access_time = dec.get_uint64();
    r.last_write_time  = dec.get_uint64();
    r.change_time      = dec.get_uint64();
    r.allocation_size  = dec.get_uint64();
    r.end_of_file      = dec.get_uint64();
    r.file_attributes  = decode_file_attributes(dec.get_uint32());
    return r;
}

}  // namespace smb2
