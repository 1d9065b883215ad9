#include "create.hpp"

#include <tuple>

namespace smb2 {

static constexpr size_t CREATE_RESPONSE_FIXED = 88;

bool CreateResponse::operator==(const CreateResponse& o) const {
    return std::tie(header, oplock_level, flags, create_action, creation_time,
                    last_access_time, last_write_time, change_time, allocation_size,
                    end_of_file, file_attributes, file_id, create_contexts) ==
           std::tie(o.header, o.oplock_level, o.flags, o.create_action, o.creation_time,
                    o.last_access_time, o.last_write_time, o.change_time, o.allocation_size,
                    o.end_of_file, o.file_attributes, o.file_id, o.create_contexts);
}

std::vector<uint8_t> encode_create_response(const CreateResponse& r) {
    const bool has_contexts = !r.create_contexts.empty();

    LeEncoder enc;
    encode_header(enc, r.header);
    enc.put_uint16(CREATE_RESPONSE_STRUCT_SIZE);
    enc.put_uint8(r.oplock_level);
    enc.put_uint8(r.flags);
    enc.put_uint32(static_cast<uint32_t>(r.create_action));
    enc.put_uint64(r.creation_time);
    enc.put_uint64(r.last_access_time);
    enc.put_uint64(r.last_write_time);
    enc.put_uint64(r.change_time);
    enc.put_uint64(r.allocation_size);
    enc.put_uint64(r.end_of_file);
    enc.put_uint32(encode_file_attributes(r.file_attributes));
    enc.put_zeros(4);  // Reserved2
    encode_file_id(enc, r.file_id);
    enc.put_uint32(has_contexts ? CREATE_RESPONSE_CONTEXTS_OFFSET : 0);
    enc.put_uint32(length32(r.create_contexts.size(), "CREATE contexts"));
    enc.put_bytes(r.create_contexts);
    return enc.release();
}

CreateResponse decode_create_response(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    CreateResponse r;
    r.header = decode_header(dec);
    expect_command(r.header, Command::CREATE);
    if (is_error_body(r.header, dec))
        return r;
    expect_struct_size(dec, CREATE_RESPONSE_STRUCT_SIZE, "CREATE response");
    r.oplock_level     = dec.get_uint8();
    r.flags            = dec.get_uint8();
    r.create_action    = static_cast<CreateAction>(dec.get_uint32());
    r.creation_time    = dec.get_uint64();
    r.last_access_time = dec.get_uint64();
    r.last_write_time  = dec.get_uint64();
    r.change_time      = dec.get_uint64();
    r.allocation_size  = dec.get_uint64();
    r.end_of_file      = dec.get_uint64();
    r.file_attributes  = decode_file_attributes(dec.get_uint32());
    dec.skip(4);  // Reserved2
    r.file_id          = decode_file_id(dec);
    const uint32_t contexts_offset = dec.get_uint32();
    const uint32_t contexts_length = dec.get_uint32();
    r.create_contexts = slice_region(dec, contexts_offset, contexts_length,
                                     HEADER_SIZE + CREATE_RESPONSE_FIXED, "CREATE contexts");
    return r;
}

}  // namespace smb2
