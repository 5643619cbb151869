#include <sys/socket.h>

#include <gtest/gtest.h>

#include "../src/channel/cache_channel.h"
#include "../src/common/errors.h"
#include "../src/common/wire_formats.h"
#include "test_helpers.h"

using namespace Rxcache;

namespace {

std::vector<Message> DrainDecoder(FrameDecoder& decoder) {
    std::vector<Message> out;
    while (auto m = decoder.Next()) {
        out.push_back(std::move(*m));
    }
    return out;
}

}  // namespace

TEST(FrameDecoderTest, ReassemblesFramesFedOneByteAtATime) {
    std::string stream = EncodeFrame(CacheWrite{"key-1", "{\"a\":1}"}) +
                         EncodeFrame(CacheWrite{"key-2", std::string(5000, 'p')}) +
                         EncodeFrame(Stop{});

    FrameDecoder decoder;
    std::vector<Message> messages;
    for (char c : stream) {
        decoder.Append(&c, 1);
        for (auto& m : DrainDecoder(decoder)) {
            messages.push_back(std::move(m));
        }
    }

    ASSERT_EQ(messages.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<CacheWrite>(messages[0]));
    EXPECT_EQ(std::get<CacheWrite>(messages[0]).key, "key-1");
    EXPECT_EQ(std::get<CacheWrite>(messages[0]).payload, "{\"a\":1}");
    EXPECT_EQ(std::get<CacheWrite>(messages[1]).payload.size(), 5000u);
    EXPECT_TRUE(std::holds_alternative<Stop>(messages[2]));
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, PartialFrameWaitsForMoreBytes) {
    std::string frame = EncodeFrame(CacheWrite{"k", "v"});
    FrameDecoder decoder;
    decoder.Append(frame.data(), frame.size() - 1);
    EXPECT_FALSE(decoder.Next().has_value());
    decoder.Append(frame.data() + frame.size() - 1, 1);
    EXPECT_TRUE(decoder.Next().has_value());
}

TEST(FrameDecoderTest, BadMagicIsProtocolError) {
    wire::FrameHeader header{0xdeadbeef, 4};
    std::string bytes(reinterpret_cast<const char*>(&header), sizeof(header));
    bytes += "abcd";
    FrameDecoder decoder;
    decoder.Append(bytes.data(), bytes.size());
    EXPECT_THROW(decoder.Next(), ChannelProtocolError);
}

TEST(FrameDecoderTest, OversizedLengthIsProtocolError) {
    wire::FrameHeader header{wire::FRAME_MAGIC, static_cast<uint32_t>(wire::MAX_FRAME_BODY_SIZE + 1)};
    FrameDecoder decoder;
    decoder.Append(reinterpret_cast<const char*>(&header), sizeof(header));
    EXPECT_THROW(decoder.Next(), ChannelProtocolError);
}

TEST(FrameDecoderTest, EmptyMessageHasNoKind) {
    // A zero-length protobuf body parses but carries neither CacheWrite nor Stop
    wire::FrameHeader header{wire::FRAME_MAGIC, 0};
    FrameDecoder decoder;
    decoder.Append(reinterpret_cast<const char*>(&header), sizeof(header));
    EXPECT_THROW(decoder.Next(), ChannelProtocolError);
}

TEST(ChannelProducerTest, SendsFramesOverSocket) {
    int sv[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    ChannelProducer producer{ScopedFd(sv[0])};
    ScopedFd reader(sv[1]);

    producer.Send(CacheWrite{"k1", "p1"});
    producer.Send(Stop{});
    producer.Close();
    EXPECT_EQ(producer.sent(), 2u);
    EXPECT_FALSE(producer.connected());

    FrameDecoder decoder;
    char buf[4096];
    ssize_t n;
    while ((n = read(reader.get(), buf, sizeof(buf))) > 0) {
        decoder.Append(buf, static_cast<size_t>(n));
    }
    auto messages = DrainDecoder(decoder);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(std::get<CacheWrite>(messages[0]).key, "k1");
    EXPECT_TRUE(std::holds_alternative<Stop>(messages[1]));
}

TEST(ChannelProducerTest, SendAfterCloseThrows) {
    ChannelProducer producer;
    EXPECT_THROW(producer.Send(Stop{}), ChannelError);
}

TEST(ChannelProducerTest, ConnectWithoutListenerThrows) {
    Rxcache::testing_util::TempDir dir;
    EXPECT_THROW(ChannelProducer::Connect(dir.File("nobody.sock")), ChannelError);
}

TEST(ChannelProducerTest, ConnectsToListeningSocket) {
    Rxcache::testing_util::TempDir dir;
    std::string path = dir.File("w.sock");
    ScopedFd listener = ListenOnChannel(path);
    ChannelProducer producer = ChannelProducer::Connect(path);
    EXPECT_TRUE(producer.connected());

    ScopedFd accepted(accept(listener.get(), nullptr, nullptr));
    ASSERT_TRUE(accepted.valid());
    producer.Send(CacheWrite{"k", "v"});
    producer.Close();

    FrameDecoder decoder;
    char buf[256];
    ssize_t n;
    while ((n = read(accepted.get(), buf, sizeof(buf))) > 0) {
        decoder.Append(buf, static_cast<size_t>(n));
    }
    auto messages = DrainDecoder(decoder);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(std::get<CacheWrite>(messages[0]).payload, "v");
}
