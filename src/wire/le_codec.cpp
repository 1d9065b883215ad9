#include "le_codec.hpp"

// ── LeEncoder ───────────────────────────────────────────────────────────────

void LeEncoder::put_uint16(uint16_t v) {
    buf_.push_back(static_cast<uint8_t>( v        & 0xFF));
    buf_.push_back(static_cast<uint8_t>((v >>  8) & 0xFF));
}

void LeEncoder::put_uint32(uint32_t v) {
    buf_.push_back(static_cast<uint8_t>( v        & 0xFF));
    buf_.push_back(static_cast<uint8_t>((v >>  8) & 0xFF));
    buf_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void LeEncoder::put_uint64(uint64_t v) {
    put_uint32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
    put_uint32(static_cast<uint32_t>(v >> 32));
}

void LeEncoder::put_bytes(const uint8_t* data, size_t size) {
    buf_.insert(buf_.end(), data, data + size);
}

// ── LeDecoder ───────────────────────────────────────────────────────────────

void LeDecoder::require(size_t n) const {
    if (n > size_ - offset_)
        throw MalformedPacketError("need " + std::to_string(n) + " bytes at offset " +
                                   std::to_string(offset_) + ", packet is " +
                                   std::to_string(size_) + " bytes");
}

uint8_t LeDecoder::get_uint8() {
    require(1);
    return data_[offset_++];
}

uint16_t LeDecoder::get_uint16() {
    require(2);
    uint16_t v = static_cast<uint16_t>(
                   static_cast<uint16_t>(data_[offset_]) |
                  (static_cast<uint16_t>(data_[offset_ + 1]) << 8));
    offset_ += 2;
    return v;
}

uint32_t LeDecoder::get_uint32() {
    require(4);
    uint32_t v =  static_cast<uint32_t>(data_[offset_    ])        |
                 (static_cast<uint32_t>(data_[offset_ + 1]) <<  8) |
                 (static_cast<uint32_t>(data_[offset_ + 2]) << 16) |
                 (static_cast<uint32_t>(data_[offset_ + 3]) << 24);
    offset_ += 4;
    return v;
}

uint64_t LeDecoder::get_uint64() {
    uint64_t lo = get_uint32();
    uint64_t hi = get_uint32();
    return (hi << 32) | lo;
}

std::vector<uint8_t> LeDecoder::get_bytes(size_t n) {
    require(n);
    std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + n);
    offset_ += n;
    return result;
}

void LeDecoder::skip(size_t n) {
    require(n);
    offset_ += n;
}

std::vector<uint8_t> LeDecoder::slice(size_t offset, size_t length) const {
    if (offset > size_ || length > size_ - offset)
        throw MalformedPacketError("region [" + std::to_string(offset) + ", +" +
                                   std::to_string(length) + ") exceeds " +
                                   std::to_string(size_) + "-byte packet");
    return std::vector<uint8_t>(data_ + offset, data_ + offset + length);
}
