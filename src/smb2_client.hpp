#pragma once

// SMB2 client core: packet codec, status interpretation, chunked file I/O.
//
// A caller supplies a Transport (connected, negotiated and authenticated
// elsewhere) and a Tree for the share, decodes the CREATE response for an
// open, and works through File:
//
//   smb2::BasicTree tree(transport, tree_id, session_id);
//   smb2::File f(tree, smb2::decode_create_response(raw_create), "report.txt");
//   auto data = f.read();
//   f.append(more);
//   f.close();

#include "smb2/bit_fields.hpp"
#include "smb2/chunked_io.hpp"
#include "smb2/close.hpp"
#include "smb2/create.hpp"
#include "smb2/error_response.hpp"
#include "smb2/header.hpp"
#include "smb2/nt_status.hpp"
#include "smb2/packet.hpp"
#include "smb2/query_directory.hpp"
#include "smb2/read.hpp"
#include "smb2/tree.hpp"
#include "smb2/write.hpp"
#include "smb2_file.hpp"
#include "wire/le_codec.hpp"
