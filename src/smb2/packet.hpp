#pragma once

#include "header.hpp"
#include "read.hpp"
#include "write.hpp"
#include "close.hpp"
#include "query_directory.hpp"
#include "create.hpp"
#include "error_response.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace smb2 {

// Every body the codec understands, keyed on the wire by
// (header.command, header.flags.server_to_redir).
using Packet = std::variant<ReadRequest, ReadResponse,
                            WriteRequest, WriteResponse,
                            CloseRequest, CloseResponse,
                            QueryDirectoryRequest, QueryDirectoryResponse,
                            CreateResponse,
                            ErrorResponse>;

std::vector<uint8_t> encode_packet(const Packet& p);

// Decode the header, then dispatch to the matching body decoder.
// Error-severity responses with a StructureSize 9 body decode to ErrorResponse.
// Throws MalformedPacketError on structural violations or a command
// without a body layout.
Packet decode_packet(const std::vector<uint8_t>& data);

const Header& packet_header(const Packet& p);

}  // namespace smb2
