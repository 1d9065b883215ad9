#include "smb2/packet.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <variant>

using namespace smb2;

// ── Helpers ──────────────────────────────────────────────────────────────────

static uint16_t u16_at(const std::vector<uint8_t>& b, size_t off) {
    LeDecoder dec(b);
    dec.skip(off);
    return dec.get_uint16();
}

static uint32_t u32_at(const std::vector<uint8_t>& b, size_t off) {
    LeDecoder dec(b);
    dec.skip(off);
    return dec.get_uint32();
}

static uint64_t u64_at(const std::vector<uint8_t>& b, size_t off) {
    LeDecoder dec(b);
    dec.skip(off);
    return dec.get_uint64();
}

static Header request(Command cmd) {
    Header h = make_request_header(cmd);
    h.message_id = 42;
    h.process_id = 0xFEFF;
    h.tree_id    = 5;
    h.session_id = 0x0000040000000011ULL;
    return h;
}

static Header response(Command cmd, uint32_t status = 0) {
    Header h = request(cmd);
    h.flags.server_to_redir = true;
    h.status = status;
    return h;
}

static const FileId kFileId{0x1122334455667788ULL, 0x99AABBCCDDEEFF00ULL};

template <typename T>
static void expect_round_trip(const T& packet) {
    const auto bytes   = encode_packet(packet);
    const auto decoded = decode_packet(bytes);
    ASSERT_TRUE(std::holds_alternative<T>(decoded));
    EXPECT_TRUE(std::get<T>(decoded) == packet);
    // Canonical encodings are stable.
    EXPECT_EQ(encode_packet(decoded), bytes);
}

// ── Header ───────────────────────────────────────────────────────────────────

TEST(Header, Layout) {
    Header h = request(Command::WRITE);
    h.status        = 0xC0000022u;
    h.credit_charge = 2;
    h.credits       = 31;
    h.flags.signed_ = true;
    h.next_command  = 0x68;
    h.signature[0]  = 0xAB;
    h.signature[15] = 0xCD;

    LeEncoder enc;
    encode_header(enc, h);
    const auto b = enc.release();

    ASSERT_EQ(b.size(), HEADER_SIZE);
    EXPECT_EQ(b[0], 0xFE);
    EXPECT_EQ(b[1], 'S');
    EXPECT_EQ(b[2], 'M');
    EXPECT_EQ(b[3], 'B');
    EXPECT_EQ(u16_at(b, 4), 64u);                      // StructureSize
    EXPECT_EQ(u16_at(b, 6), 2u);                       // CreditCharge
    EXPECT_EQ(u32_at(b, 8), 0xC0000022u);              // Status
    EXPECT_EQ(u16_at(b, 12), 0x0009u);                 // Command WRITE
    EXPECT_EQ(u16_at(b, 14), 31u);                     // Credits
    EXPECT_EQ(u32_at(b, 16), FLAGS_SIGNED);            // Flags
    EXPECT_EQ(u32_at(b, 20), 0x68u);                   // NextCommand
    EXPECT_EQ(u64_at(b, 24), 42u);                     // MessageId
    EXPECT_EQ(u32_at(b, 32), 0xFEFFu);                 // ProcessId
    EXPECT_EQ(u32_at(b, 36), 5u);                      // TreeId
    EXPECT_EQ(u64_at(b, 40), 0x0000040000000011ULL);   // SessionId
    EXPECT_EQ(b[48], 0xAB);                            // Signature
    EXPECT_EQ(b[63], 0xCD);

    LeDecoder dec(b);
    EXPECT_EQ(decode_header(dec), h);
}

TEST(Header, AsyncIdOverlaysProcessAndTreeId) {
    Header h;
    h.flags.async_command = true;
    h.process_id = 0x00000007u;
    h.tree_id    = 0x00000001u;
    EXPECT_EQ(h.async_id(), 0x0000000100000007ULL);
}

TEST(Header, ShorterThanHeaderIsMalformed) {
    const auto full = encode_packet(make_close_request(request(Command::CLOSE), kFileId));
    for (size_t n : {size_t{0}, size_t{1}, size_t{4}, size_t{32}, HEADER_SIZE - 1}) {
        const std::vector<uint8_t> cut(full.begin(), full.begin() + static_cast<long>(n));
        EXPECT_THROW(decode_packet(cut), MalformedPacketError) << n;
    }
}

TEST(Header, BadProtocolIdIsMalformed) {
    auto b = encode_packet(make_close_request(request(Command::CLOSE), kFileId));
    b[0] = 0xFF;  // SMB1 magic
    EXPECT_THROW(decode_packet(b), MalformedPacketError);
}

TEST(Header, BadHeaderStructSizeIsMalformed) {
    auto b = encode_packet(make_close_request(request(Command::CLOSE), kFileId));
    b[4] = 0x41;
    EXPECT_THROW(decode_packet(b), MalformedPacketError);
}

TEST(Header, HeaderOnlyPacketIsMalformed) {
    LeEncoder enc;
    encode_header(enc, response(Command::READ));
    EXPECT_THROW(decode_packet(enc.bytes()), MalformedPacketError);
}

// ── READ ─────────────────────────────────────────────────────────────────────

TEST(ReadRequest, Layout) {
    const auto r = make_read_request(request(Command::READ), kFileId, 4096u, 0x100000000ULL);
    const auto b = encode_read_request(r);

    ASSERT_EQ(b.size(), HEADER_SIZE + 49u);
    EXPECT_EQ(u16_at(b, 64), 49u);                       // StructureSize
    EXPECT_EQ(b[66], READ_RESPONSE_DATA_OFFSET);         // Padding
    EXPECT_EQ(u32_at(b, 68), 4096u);                     // Length
    EXPECT_EQ(u64_at(b, 72), 0x100000000ULL);            // Offset
    EXPECT_EQ(u64_at(b, 80), kFileId.persistent);        // FileId
    EXPECT_EQ(u64_at(b, 88), kFileId.volatile_);
    EXPECT_EQ(b.back(), 0u);                             // Buffer placeholder
}

TEST(ReadRequest, MissingBufferByteIsMalformed) {
    auto b = encode_read_request(
        make_read_request(request(Command::READ), kFileId, 4096u, 0u));
    b.pop_back();
    EXPECT_THROW(decode_read_request(b), MalformedPacketError);
}

TEST(ReadRequest, RoundTrip) {
    auto r = make_read_request(request(Command::READ), kFileId, 32768u, 65536u);
    r.minimum_count   = 1;
    r.remaining_bytes = 7;
    expect_round_trip(r);
}

TEST(ReadResponse, RoundTripEmptySmallAndMaximum) {
    for (size_t n : {size_t{0}, size_t{1}, size_t{32768}}) {
        ReadResponse r;
        r.header = response(Command::READ);
        r.buffer.assign(n, 0x5A);
        r.data_remaining = 3;
        expect_round_trip(r);
    }
}

TEST(ReadResponse, DataAtDeclaredOffset) {
    ReadResponse r;
    r.header = response(Command::READ);
    r.buffer = {0x11, 0x22, 0x33};
    const auto b = encode_read_response(r);
    EXPECT_EQ(b[64 + 2], READ_RESPONSE_DATA_OFFSET);
    EXPECT_EQ(u32_at(b, 64 + 4), 3u);
    EXPECT_EQ(b[READ_RESPONSE_DATA_OFFSET], 0x11);
}

TEST(ReadResponse, DataPastEndIsMalformed) {
    ReadResponse r;
    r.header = response(Command::READ);
    r.buffer = {1, 2, 3, 4};
    auto b = encode_read_response(r);
    b.pop_back();
    EXPECT_THROW(decode_read_response(b), MalformedPacketError);
}

TEST(ReadResponse, DataOffsetInsideFixedFieldsIsMalformed) {
    ReadResponse r;
    r.header = response(Command::READ);
    r.buffer = {1, 2, 3, 4};
    auto b = encode_read_response(r);
    b[64 + 2] = 0x40;  // points back into the header
    EXPECT_THROW(decode_read_response(b), MalformedPacketError);
}

TEST(ReadResponse, WrongStructSizeIsMalformed) {
    ReadResponse r;
    r.header = response(Command::READ);
    auto b = encode_read_response(r);
    b[64] = 16;
    EXPECT_THROW(decode_read_response(b), MalformedPacketError);
}

TEST(ReadResponse, ErrorBodyYieldsEmptyBufferAndStatus) {
    ErrorResponse e;
    e.header = response(Command::READ, 0xC0000011u);  // STATUS_END_OF_FILE
    const auto b = encode_error_response(e);

    const auto r = decode_read_response(b);
    EXPECT_TRUE(r.buffer.empty());
    EXPECT_TRUE(r.header.nt_status().is(NtStatus::STATUS_END_OF_FILE));

    const auto p = decode_packet(b);
    ASSERT_TRUE(std::holds_alternative<ErrorResponse>(p));
    EXPECT_EQ(packet_header(p).status, 0xC0000011u);
}

TEST(ReadResponse, WarningErrorBodyYieldsEmptyBufferAndStatus) {
    ErrorResponse e;
    e.header = response(Command::READ, 0x80000005u);  // STATUS_BUFFER_OVERFLOW
    const auto b = encode_error_response(e);

    const auto r = decode_read_response(b);
    EXPECT_TRUE(r.buffer.empty());
    EXPECT_TRUE(r.header.nt_status().is(NtStatus::STATUS_BUFFER_OVERFLOW));
    EXPECT_TRUE(std::holds_alternative<ErrorResponse>(decode_packet(b)));
}

// ── WRITE ────────────────────────────────────────────────────────────────────

TEST(WriteRequest, LengthAndOffsetComeFromBuffer) {
    const std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF, 0x01};
    const auto r = make_write_request(request(Command::WRITE), kFileId, 1000u, data);
    const auto b = encode_write_request(r);

    ASSERT_EQ(b.size(), WRITE_REQUEST_DATA_OFFSET + data.size());
    EXPECT_EQ(u16_at(b, 64), 49u);                        // StructureSize
    EXPECT_EQ(u16_at(b, 66), WRITE_REQUEST_DATA_OFFSET);  // DataOffset
    EXPECT_EQ(u32_at(b, 68), data.size());                // Length
    EXPECT_EQ(u64_at(b, 72), 1000u);                      // Offset
    EXPECT_EQ(u64_at(b, 80), kFileId.persistent);         // FileId
    EXPECT_TRUE(std::equal(data.begin(), data.end(), b.begin() + WRITE_REQUEST_DATA_OFFSET));
}

TEST(WriteRequest, EmptyBufferKeepsPlaceholderByte) {
    const auto r = make_write_request(request(Command::WRITE), kFileId, 0u, {});
    const auto b = encode_write_request(r);
    EXPECT_EQ(b.size(), HEADER_SIZE + 49u);
    EXPECT_EQ(u32_at(b, 68), 0u);
    expect_round_trip(r);
}

TEST(WriteRequest, RoundTripMaximum) {
    auto r = make_write_request(request(Command::WRITE), kFileId, 7u,
                                std::vector<uint8_t>(32768, 0xC3));
    r.flags = 0x1;
    expect_round_trip(r);
}

TEST(WriteRequest, LengthPastEndIsMalformed) {
    auto b = encode_write_request(
        make_write_request(request(Command::WRITE), kFileId, 0u, {1, 2, 3}));
    b[68] = 200;  // Length
    EXPECT_THROW(decode_write_request(b), MalformedPacketError);
}

TEST(WriteResponse, RoundTrip) {
    WriteResponse r;
    r.header = response(Command::WRITE);
    r.count  = 32768;
    expect_round_trip(r);
}

TEST(WriteResponse, ErrorBodyCarriesStatus) {
    ErrorResponse e;
    e.header = response(Command::WRITE, 0xC000007Fu);  // STATUS_DISK_FULL
    const auto r = decode_write_response(encode_error_response(e));
    EXPECT_EQ(r.count, 0u);
    EXPECT_TRUE(r.header.nt_status().is(NtStatus::STATUS_DISK_FULL));
}

TEST(WriteResponse, WarningErrorBodyCarriesStatus) {
    ErrorResponse e;
    e.header = response(Command::WRITE, 0x80000005u);  // STATUS_BUFFER_OVERFLOW
    const auto r = decode_write_response(encode_error_response(e));
    EXPECT_EQ(r.count, 0u);
    EXPECT_TRUE(r.header.nt_status().is(NtStatus::STATUS_BUFFER_OVERFLOW));
}

TEST(CloseResponse, WarningErrorBodyCarriesStatus) {
    ErrorResponse e;
    e.header = response(Command::CLOSE, 0x8000002Du);  // STATUS_STOPPED_ON_SYMLINK
    const auto r = decode_close_response(encode_error_response(e));
    EXPECT_TRUE(r.header.nt_status().is(NtStatus::STATUS_STOPPED_ON_SYMLINK));
}

// ── CLOSE ────────────────────────────────────────────────────────────────────

TEST(CloseRequest, Layout) {
    const auto b = encode_close_request(make_close_request(request(Command::CLOSE), kFileId));
    ASSERT_EQ(b.size(), HEADER_SIZE + 24u);
    EXPECT_EQ(u16_at(b, 64), 24u);
    EXPECT_EQ(u64_at(b, 72), kFileId.persistent);
    EXPECT_EQ(u64_at(b, 80), kFileId.volatile_);
}

TEST(CloseRequest, RoundTrip) {
    auto r  = make_close_request(request(Command::CLOSE), kFileId);
    r.flags = CLOSE_FLAG_POSTQUERY_ATTRIB;
    expect_round_trip(r);
}

TEST(CloseResponse, RoundTrip) {
    CloseResponse r;
    r.header           = response(Command::CLOSE);
    r.flags            = CLOSE_FLAG_POSTQUERY_ATTRIB;
    r.creation_time    = 0x01D098C2ABBD29E8ULL;
    r.last_write_time  = 0x01D098C2ABBD29E9ULL;
    r.end_of_file      = 12345;
    r.allocation_size  = 16384;
    r.file_attributes  = decode_file_attributes(FILE_ATTRIBUTE_ARCHIVE);
    const auto b = encode_close_response(r);
    EXPECT_EQ(b.size(), HEADER_SIZE + 60u);
    expect_round_trip(r);
}

// ── CREATE ───────────────────────────────────────────────────────────────────

TEST(CreateResponse, RoundTripWithAndWithoutContexts) {
    CreateResponse r;
    r.header           = response(Command::CREATE);
    r.oplock_level     = 0x08;
    r.create_action    = CreateAction::FILE_OPENED;
    r.end_of_file      = 70000;
    r.allocation_size  = 73728;
    r.file_attributes  = decode_file_attributes(FILE_ATTRIBUTE_NORMAL);
    r.file_id          = kFileId;
    expect_round_trip(r);

    r.create_contexts = {0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x04, 0x00};
    const auto b = encode_create_response(r);
    EXPECT_EQ(u32_at(b, 64 + 80), CREATE_RESPONSE_CONTEXTS_OFFSET);
    EXPECT_EQ(u32_at(b, 64 + 84), 8u);
    expect_round_trip(r);
}

// ── QUERY_DIRECTORY request ──────────────────────────────────────────────────

TEST(QueryDirectoryRequest, PatternIsUtf16le) {
    const auto r = make_query_directory_request(request(Command::QUERY_DIRECTORY), kFileId,
                                                u"*.txt",
                                                FileInformationClass::FileNamesInformation,
                                                65536u);
    const auto b = encode_query_directory_request(r);
    EXPECT_EQ(u16_at(b, 64), 33u);
    EXPECT_EQ(b[66], 0x0C);
    EXPECT_EQ(u16_at(b, 88), QUERY_DIRECTORY_NAME_OFFSET);
    EXPECT_EQ(u16_at(b, 90), 10u);
    EXPECT_EQ(u32_at(b, 92), 65536u);
    EXPECT_EQ(b[96], '*');
    EXPECT_EQ(b[97], 0);
    EXPECT_EQ(b[98], '.');
    expect_round_trip(r);
}

TEST(QueryDirectoryRequest, OddNameLengthIsMalformed) {
    auto b = encode_query_directory_request(
        make_query_directory_request(request(Command::QUERY_DIRECTORY), kFileId, u"*",
                                     FileInformationClass::FileDirectoryInformation, 1024u));
    b[90] = 1;
    EXPECT_THROW(decode_query_directory_request(b), MalformedPacketError);
}

// ── ERROR / dispatch ─────────────────────────────────────────────────────────

TEST(ErrorResponse, RoundTrip) {
    ErrorResponse e;
    e.header = response(Command::CLOSE, 0xC0000008u);
    expect_round_trip(e);

    e.error_data = {1, 2, 3, 4};
    expect_round_trip(e);
}

TEST(DecodePacket, WarningStatusKeepsCommandBody) {
    // STATUS_BUFFER_OVERFLOW is a warning: the real body still follows.
    ReadResponse r;
    r.header = response(Command::READ, 0x80000005u);
    r.buffer = {9, 9, 9};
    expect_round_trip(r);
}

TEST(DecodePacket, CommandWithoutLayoutIsMalformed) {
    LeEncoder enc;
    encode_header(enc, request(Command::NEGOTIATE));
    enc.put_zeros(36);
    EXPECT_THROW(decode_packet(enc.bytes()), MalformedPacketError);
}

TEST(DecodePacket, SpecificDecoderRejectsOtherCommand) {
    const auto b = encode_close_request(make_close_request(request(Command::CLOSE), kFileId));
    EXPECT_THROW(decode_read_request(b), MalformedPacketError);
}
