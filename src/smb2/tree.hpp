#pragma once

#include "header.hpp"

#include <cstdint>
#include <vector>

namespace smb2 {

// Exchanges one serialized request for its complete raw response.
// Synchronous, one response per request, no partial results. Message-id
// assignment and response correlation belong to the implementation, as do
// timeouts; failures are reported by throwing.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::vector<uint8_t> send_recv(const std::vector<uint8_t>& request) = 0;
};

// A connected share. Supplies the routing ids every request must carry and
// the transport used to reach the server.
class Tree {
public:
    virtual ~Tree() = default;

    // Returns `header` with tree id and session id filled in.
    virtual Header stamp_common_header_fields(Header header) const = 0;

    virtual Transport& client() = 0;
};

// Tree with fixed ids, for a share whose connect/session setup happened
// elsewhere. Does not own the transport.
class BasicTree : public Tree {
public:
    BasicTree(Transport& transport, uint32_t tree_id, uint64_t session_id)
        : transport_(transport), tree_id_(tree_id), session_id_(session_id) {}

    Header stamp_common_header_fields(Header header) const override;
    Transport& client() override { return transport_; }

    uint32_t tree_id()    const { return tree_id_; }
    uint64_t session_id() const { return session_id_; }

private:
    Transport& transport_;
    uint32_t   tree_id_;
    uint64_t   session_id_;
};

}  // namespace smb2
