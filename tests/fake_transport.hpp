#pragma once

#include "smb2/header.hpp"
#include "smb2/tree.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

// In-memory Transport: records each serialized request and answers it with
// whatever the test's handler returns.
class FakeTransport : public smb2::Transport {
public:
    using Handler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    explicit FakeTransport(Handler handler) : handler_(std::move(handler)) {}

    std::vector<uint8_t> send_recv(const std::vector<uint8_t>& request) override {
        requests.push_back(request);
        return handler_(request);
    }

    std::vector<std::vector<uint8_t>> requests;

private:
    Handler handler_;
};

// Response header mirroring a request, as a server would send it.
inline smb2::Header response_header_for(const smb2::Header& request, uint32_t status = 0) {
    smb2::Header h = request;
    h.flags.server_to_redir = true;
    h.status  = status;
    h.credits = 1;
    return h;
}

// Deterministic payload: byte i is (i * 7 + 3) mod 251.
inline std::vector<uint8_t> make_payload(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i)
        v[i] = static_cast<uint8_t>((i * 7 + 3) % 251);
    return v;
}
