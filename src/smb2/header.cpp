#include "header.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>

namespace smb2 {

static constexpr uint16_t ERROR_STRUCT_SIZE = 9;

const char* command_name(Command c) {
    switch (c) {
    case Command::NEGOTIATE:       return "NEGOTIATE";
    case Command::SESSION_SETUP:   return "SESSION_SETUP";
    case Command::LOGOFF:          return "LOGOFF";
    case Command::TREE_CONNECT:    return "TREE_CONNECT";
    case Command::TREE_DISCONNECT: return "TREE_DISCONNECT";
    case Command::CREATE:          return "CREATE";
    case Command::CLOSE:           return "CLOSE";
    case Command::FLUSH:           return "FLUSH";
    case Command::READ:            return "READ";
    case Command::WRITE:           return "WRITE";
    case Command::LOCK:            return "LOCK";
    case Command::IOCTL:           return "IOCTL";
    case Command::CANCEL:          return "CANCEL";
    case Command::ECHO:            return "ECHO";
    case Command::QUERY_DIRECTORY: return "QUERY_DIRECTORY";
    case Command::CHANGE_NOTIFY:   return "CHANGE_NOTIFY";
    case Command::QUERY_INFO:      return "QUERY_INFO";
    case Command::SET_INFO:        return "SET_INFO";
    case Command::OPLOCK_BREAK:    return "OPLOCK_BREAK";
    }
    return "UNKNOWN";
}

bool Header::operator==(const Header& o) const {
    return std::tie(credit_charge, status, command, credits, flags, next_command,
                    message_id, process_id, tree_id, session_id, signature) ==
           std::tie(o.credit_charge, o.status, o.command, o.credits, o.flags, o.next_command,
                    o.message_id, o.process_id, o.tree_id, o.session_id, o.signature);
}

Header make_request_header(Command cmd) {
    Header h;
    h.credit_charge = DEFAULT_CREDIT_CHARGE;
    h.command       = cmd;
    h.credits       = DEFAULT_CREDITS;
    return h;
}

void encode_header(LeEncoder& enc, const Header& h) {
    enc.put_bytes(PROTOCOL_ID.data(), PROTOCOL_ID.size());
    enc.put_uint16(HEADER_STRUCT_SIZE);
    enc.put_uint16(h.credit_charge);
    enc.put_uint32(h.status);
    enc.put_uint16(static_cast<uint16_t>(h.command));
    enc.put_uint16(h.credits);
    enc.put_uint32(encode_header_flags(h.flags));
    enc.put_uint32(h.next_command);
    enc.put_uint64(h.message_id);
    enc.put_uint32(h.process_id);
    enc.put_uint32(h.tree_id);
    enc.put_uint64(h.session_id);
    enc.put_bytes(h.signature.data(), h.signature.size());
}

Header decode_header(LeDecoder& dec) {
    if (dec.remaining() < HEADER_SIZE)
        throw MalformedPacketError("packet of " + std::to_string(dec.remaining()) +
                                   " bytes is shorter than the SMB2 header");

    const auto magic = dec.get_bytes(PROTOCOL_ID.size());
    if (!std::equal(magic.begin(), magic.end(), PROTOCOL_ID.begin()))
        throw MalformedPacketError("bad SMB2 protocol id");

    const uint16_t struct_size = dec.get_uint16();
    if (struct_size != HEADER_STRUCT_SIZE)
        throw MalformedPacketError("header StructureSize " + std::to_string(struct_size));

    Header h;
    h.credit_charge = dec.get_uint16();
    h.status        = dec.get_uint32();
    h.command       = static_cast<Command>(dec.get_uint16());
    h.credits       = dec.get_uint16();
    h.flags         = decode_header_flags(dec.get_uint32());
    h.next_command  = dec.get_uint32();
    h.message_id    = dec.get_uint64();
    h.process_id    = dec.get_uint32();
    h.tree_id       = dec.get_uint32();
    h.session_id    = dec.get_uint64();
    const auto sig  = dec.get_bytes(h.signature.size());
    std::copy(sig.begin(), sig.end(), h.signature.begin());
    return h;
}

void expect_struct_size(LeDecoder& dec, uint16_t expected, const char* body) {
    const uint16_t got = dec.get_uint16();
    if (got != expected)
        throw MalformedPacketError(std::string(body) + " StructureSize " +
                                   std::to_string(got) + ", expected " +
                                   std::to_string(expected));
}

void expect_command(const Header& h, Command cmd) {
    if (h.command != cmd)
        throw MalformedPacketError(std::string("expected ") + command_name(cmd) +
                                   ", got " + command_name(h.command));
}

std::vector<uint8_t> slice_region(const LeDecoder& dec, size_t offset, size_t length,
                                  size_t fixed_end, const char* what) {
    if (length == 0)
        return {};
    if (offset < fixed_end)
        throw MalformedPacketError(std::string(what) + " offset " + std::to_string(offset) +
                                   " overlaps fixed fields ending at " +
                                   std::to_string(fixed_end));
    return dec.slice(offset, length);
}

uint32_t length32(size_t n, const char* what) {
    if (n > UINT32_MAX)
        throw std::invalid_argument(std::string(what) + " of " + std::to_string(n) +
                                    " bytes exceeds a 32-bit length field");
    return static_cast<uint32_t>(n);
}

bool is_error_body(const Header& h, const LeDecoder& dec) {
    if (h.nt_status().is_success())
        return false;
    const auto raw = dec.slice(dec.position(), 2);
    const uint16_t struct_size = static_cast<uint16_t>(raw[0] | (raw[1] << 8));
    return struct_size == ERROR_STRUCT_SIZE;
}

}  // namespace smb2
