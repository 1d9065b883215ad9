#include "error_response.hpp"

namespace smb2 {

std::vector<uint8_t> encode_error_response(const ErrorResponse& r) {
    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(ERROR_RESPONSE_STRUCT_SIZE);
    enc.put_uint8(r.error_context_count);
    enc.put_zeros(1);  // Reserved
    enc.put_uint32(length32(r.error_data.size(), "ERROR data"));
    // ByteCount 0 still carries a one-byte ErrorData.
    if (r.error_data.empty())
        enc.put_uint8(0);
    else
        enc.put_bytes(r.error_data);
    return enc.release();
}

ErrorResponse decode_error_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    ErrorResponse r;
    r.header = decode_header(dec);
    expect_struct_size(dec, ERROR_RESPONSE_STRUCT_SIZE, "ERROR response");
    r.error_context_count = dec.get_uint8();
    dec.skip(1);  // Reserved
    const uint32_t byte_count = dec.get_uint32();
    r.error_data = dec.get_bytes(byte_count);
    return r;
}

}  // namespace smb2
