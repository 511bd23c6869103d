#include <gtest/gtest.h>
#include "Frame.hpp"
#include <string>
#include <vector>

using namespace lantext;
using namespace std;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static vector<uint8_t> rawFrame(const string& json) {
    vector<uint8_t> bytes(LENGTH_PREFIX_SIZE);
    writeLengthPrefix(static_cast<uint32_t>(json.size()), bytes.data());
    bytes.insert(bytes.end(), json.begin(), json.end());
    return bytes;
}

static string payloadText(const Frame& frame) {
    auto payload = serializeFramePayload(frame);
    return string(payload.begin(), payload.end());
}

// -----------------------
// BASIC TESTS
// -----------------------
TEST(FrameTest, LengthPrefixIsBigEndian) {
    uint8_t buf[4];
    writeLengthPrefix(0x01020304, buf);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[1], 0x02);
    EXPECT_EQ(buf[2], 0x03);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(readLengthPrefix(buf), 0x01020304u);
}

TEST(FrameTest, TextMessageRoundTrip) {
    auto bytes = encodeFrame(makeTextMessage("alice", "hello bob"));
    EXPECT_EQ(readLengthPrefix(bytes.data()), bytes.size() - LENGTH_PREFIX_SIZE);

    size_t consumed = 0;
    Frame frame = decodeFrame(bytes, MAX_CONTROL_FRAME_SIZE, &consumed);
    EXPECT_EQ(consumed, bytes.size());
    EXPECT_EQ(frame.type, FrameType::TEXT_MESSAGE);
    EXPECT_EQ(frame.from, "alice");
    EXPECT_EQ(frame.message, "hello bob");
}

TEST(FrameTest, FileRequestFields) {
    Frame frame = decodeFrame(encodeFrame(makeFileRequest("a", "f1", "notes.txt", 12345)));
    EXPECT_EQ(frame.type, FrameType::FILE_REQUEST);
    EXPECT_EQ(frame.fileId, "f1");
    EXPECT_EQ(frame.filename, "notes.txt");
    EXPECT_EQ(frame.filesize, 12345u);
}

TEST(FrameTest, FileResponseMapsToAcceptOrReject) {
    Frame accept = makeFileResponse("b", "f1", true, "/tmp/out");
    Frame reject = makeFileResponse("b", "f1", false, "/tmp/out");
    EXPECT_EQ(accept.type, FrameType::FILE_ACCEPT);
    EXPECT_EQ(reject.type, FrameType::FILE_REJECT);

    EXPECT_EQ(decodeFrame(encodeFrame(accept)).savePath, "/tmp/out");
    EXPECT_EQ(payloadText(reject).find("save_path"), string::npos);
}

TEST(FrameTest, SavePathOmittedWhenEmpty) {
    EXPECT_EQ(payloadText(makeFileResponse("b", "f1", true)).find("save_path"), string::npos);
}

TEST(FrameTest, WireUsesSnakeCaseKeys) {
    string text = payloadText(makeFileChunk("a", "f9", 3));
    EXPECT_NE(text.find("\"type\":\"FILE_CHUNK\""), string::npos);
    EXPECT_NE(text.find("\"file_id\":\"f9\""), string::npos);
    EXPECT_NE(text.find("\"chunk_num\":3"), string::npos);

    text = payloadText(makePeerDiscovery("p1", 5000));
    EXPECT_NE(text.find("\"peer_id\":\"p1\""), string::npos);
    EXPECT_NE(text.find("\"port\":5000"), string::npos);
}

TEST(FrameTest, ChunkFrameCarriesRawSegment) {
    vector<uint8_t> data = {0x00, 0xFF, 0x10, 0x20, 0x30};
    auto bytes = encodeChunkFrame(makeFileChunk("a", "f1", 7), data.data(), data.size());

    size_t consumed = 0;
    Frame descriptor = decodeFrame(bytes, MAX_CONTROL_FRAME_SIZE, &consumed);
    EXPECT_EQ(descriptor.type, FrameType::FILE_CHUNK);
    EXPECT_EQ(descriptor.chunkNum, 7u);

    ASSERT_EQ(bytes.size(), consumed + LENGTH_PREFIX_SIZE + data.size());
    EXPECT_EQ(readLengthPrefix(bytes.data() + consumed), data.size());
    vector<uint8_t> segment(bytes.begin() + consumed + LENGTH_PREFIX_SIZE, bytes.end());
    EXPECT_EQ(segment, data);
}

TEST(FrameTest, FileCompleteAndErrorFields) {
    Frame complete = decodeFrame(encodeFrame(makeFileComplete("a", "f1", 13)));
    EXPECT_EQ(complete.totalChunks, 13u);

    Frame error = decodeFrame(encodeFrame(makeFileError("a", "f1", "disk full")));
    EXPECT_EQ(error.type, FrameType::FILE_ERROR);
    EXPECT_EQ(error.error, "disk full");
}

TEST(FrameTest, TypeNames) {
    EXPECT_EQ(frameTypeToString(FrameType::PEER_DISCOVERY), "PEER_DISCOVERY");
    auto parsed = frameTypeFromString("FILE_REJECT");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, FrameType::FILE_REJECT);
    EXPECT_FALSE(frameTypeFromString("PING").has_value());
}

TEST(FrameTest, OnlyChunksKeepConnectionOpen) {
    EXPECT_FALSE(isTerminalFrame(FrameType::FILE_CHUNK));
    EXPECT_TRUE(isTerminalFrame(FrameType::FILE_COMPLETE));
    EXPECT_TRUE(isTerminalFrame(FrameType::TEXT_MESSAGE));
    EXPECT_TRUE(isTerminalFrame(FrameType::FILE_ERROR));
}

// -----------------------
// MALFORMED INPUT
// -----------------------
TEST(FrameTest, TruncatedPrefixThrows) {
    vector<uint8_t> bytes = {0x00, 0x00};
    EXPECT_THROW(decodeFrame(bytes), MalformedFrame);
}

TEST(FrameTest, ShortPayloadThrows) {
    auto bytes = encodeFrame(makeTextMessage("a", "hello"));
    bytes.pop_back();
    EXPECT_THROW(decodeFrame(bytes), MalformedFrame);
}

TEST(FrameTest, OversizedDeclaredLengthThrows) {
    vector<uint8_t> bytes(LENGTH_PREFIX_SIZE + 10, 'x');
    writeLengthPrefix(5000, bytes.data());
    EXPECT_THROW(decodeFrame(bytes), MalformedFrame);
}

TEST(FrameTest, InvalidJsonThrows) {
    EXPECT_THROW(decodeFrame(rawFrame("{not json")), MalformedFrame);
    EXPECT_THROW(decodeFrame(rawFrame("[1,2,3]")), MalformedFrame);
}

TEST(FrameTest, MissingMandatoryFieldsThrow) {
    EXPECT_THROW(decodeFrame(rawFrame(R"({"from":"a","message":"x"})")), MalformedFrame);
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"TEXT_MESSAGE","message":"x"})")), MalformedFrame);
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"TEXT_MESSAGE","from":"a"})")), MalformedFrame);
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"FILE_REQUEST","from":"a","file_id":"f","filename":"n","filesize":"big"})")),
                 MalformedFrame);
}

TEST(FrameTest, UnknownTypeThrows) {
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"PING","from":"a"})")), MalformedFrame);
}

TEST(FrameTest, DiscoveryPortOutOfRangeThrows) {
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"PEER_DISCOVERY","from":"a","peer_id":"a","port":0})")),
                 MalformedFrame);
    EXPECT_THROW(decodeFrame(rawFrame(R"({"type":"PEER_DISCOVERY","from":"a","peer_id":"a","port":70000})")),
                 MalformedFrame);
}

TEST(FrameTest, InvalidUtf8IsReplacedOnEncode) {
    string text = "bad \xC3\x28 byte";
    EXPECT_NO_THROW({
        Frame frame = decodeFrame(encodeFrame(makeTextMessage("a", text)));
        EXPECT_NE(frame.message, text);
    });
}
