#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thrown when a packet is structurally invalid: truncated buffer, bad magic,
// wrong declared structure size, or an offset/length outside the packet.
struct MalformedPacketError : std::runtime_error {
    explicit MalformedPacketError(const std::string& what)
        : std::runtime_error("malformed packet: " + what) {}
};

// Little-endian encoder: serializes values into a growing byte buffer.
// SMB2 fields are not padded individually; alignment is explicit via put_zeros().
class LeEncoder {
public:
    void put_uint8(uint8_t v) { buf_.push_back(v); }
    void put_uint16(uint16_t v);
    void put_uint32(uint32_t v);
    void put_uint64(uint64_t v);

    void put_bytes(const uint8_t* data, size_t size);
    void put_bytes(const std::vector<uint8_t>& data) {
        put_bytes(data.data(), data.size());
    }

    void put_zeros(size_t n) { buf_.insert(buf_.end(), n, 0); }

    size_t size() const { return buf_.size(); }

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// Little-endian decoder over a whole packet.
// Positions are absolute from the start of the packet, since SMB2 offsets
// are packet-relative. Throws MalformedPacketError on buffer underflow.
class LeDecoder {
public:
    LeDecoder(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}
    explicit LeDecoder(const std::vector<uint8_t>& v)
        : LeDecoder(v.data(), v.size()) {}

    uint8_t  get_uint8();
    uint16_t get_uint16();
    uint32_t get_uint32();
    uint64_t get_uint64();

    // Reads exactly n bytes at the cursor.
    std::vector<uint8_t> get_bytes(size_t n);

    void skip(size_t n);

    // Copies [offset, offset + length) without moving the cursor.
    std::vector<uint8_t> slice(size_t offset, size_t length) const;

    size_t position()  const { return offset_; }
    size_t size()      const { return size_; }
    size_t remaining() const { return size_ - offset_; }

private:
    void require(size_t n) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};
