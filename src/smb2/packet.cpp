#include "packet.hpp"

#include <string>

namespace smb2 {

namespace {

struct PacketEncoder {
    std::vector<uint8_t> operator()(const ReadRequest& r)            const { return encode_read_request(r); }
    std::vector<uint8_t> operator()(const ReadResponse& r)           const { return encode_read_response(r); }
    std::vector<uint8_t> operator()(const WriteRequest& r)           const { return encode_write_request(r); }
    std::vector<uint8_t> operator()(const WriteResponse& r)          const { return encode_write_response(r); }
    std::vector<uint8_t> operator()(const CloseRequest& r)           const { return encode_close_request(r); }
    std::vector<uint8_t> operator()(const CloseResponse& r)          const { return encode_close_response(r); }
    std::vector<uint8_t> operator()(const QueryDirectoryRequest& r)  const { return encode_query_directory_request(r); }
    std::vector<uint8_t> operator()(const QueryDirectoryResponse& r) const { return encode_query_directory_response(r); }
    std::vector<uint8_t> operator()(const CreateResponse& r)         const { return encode_create_response(r); }
    std::vector<uint8_t> operator()(const ErrorResponse& r)          const { return encode_error_response(r); }
};

Packet decode_request(const Header& h, const std::vector<uint8_t>& data) {
    switch (h.command) {
    case Command::READ:            return decode_read_request(data);
    case Command::WRITE:           return decode_write_request(data);
    case Command::CLOSE:           return decode_close_request(data);
    case Command::QUERY_DIRECTORY: return decode_query_directory_request(data);
    default:
        throw MalformedPacketError(std::string("no request layout for ") +
                                   command_name(h.command));
    }
}

Packet decode_response(const Header& h, const std::vector<uint8_t>& data) {
    switch (h.command) {
    case Command::READ:            return decode_read_response(data);
    case Command::WRITE:           return decode_write_response(data);
    case Command::CLOSE:           return decode_close_response(data);
    case Command::QUERY_DIRECTORY: return decode_query_directory_response(data);
    case Command::CREATE:          return decode_create_response(data);
    default:
        throw MalformedPacketError(std::string("no response layout for ") +
                                   command_name(h.command));
    }
}

}  // namespace

std::vector<uint8_t> encode_packet(const Packet& p) {
    return std::visit(PacketEncoder{}, p);
}

Packet decode_packet(const std::vector<uint8_t>& data) {
    LeDecoder dec(data);
    const Header h = decode_header(dec);
    if (!h.is_response())
        return decode_request(h, data);
    if (is_error_body(h, dec))
        return decode_error_response(data);
    return decode_response(h, data);
}

const Header& packet_header(const Packet& p) {
    return std::visit([](const auto& body) -> const Header& { return body.header; }, p);
}

}  // namespace smb2
