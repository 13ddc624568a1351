#include <set>
#include <gtest/gtest.h>
#include "Error.hpp"
#include "Session.hpp"
#include "TestUtil.hpp"

using namespace rtmpingest;
using namespace rtmpingest::rtmp;

namespace {
class SessionTest : public ::testing::Test
{
protected:
    SessionTest() : session_(config_, hooks_, sink_, out_)
    {
    }

    SessionResult feed(std::string_view bytes)
    {
        in_.append(bytes);
        session_.received(bytes.size());
        SessionResult r;
        do {
            r = session_.process(in_, ec_);
        } while(r == SessionResult::PROGRESS);
        return r;
    }

    // Decodes what the session wrote since the last call.
    std::vector<RtmpMessage> replies()
    {
        std::vector<RtmpMessage> messages;
        boost::system::error_code ec;
        RtmpMessage m;
        while(true) {
            ChunkResult r = replyDecoder_.readChunk(out_, m, ec);
            if(r == ChunkResult::MESSAGE) {
                if(m.h.type == TYPE_SET_CHUNK_SIZE) {
                    uint32_t size;
                    loadBE<uint32_t, 32>(m.payload.data(), size);
                    replyDecoder_.setChunkSize(size, ec);
                }
                messages.push_back(m);
            } else if(r != ChunkResult::CHUNK) {
                break;
            }
        }
        return messages;
    }

    static const AmfValue &info(const std::vector<AmfValue> &values)
    {
        return values.back();
    }

    void handshake()
    {
        ASSERT_EQ(feed(test::simpleC0C1()), SessionResult::NEED_MORE);
        ASSERT_EQ(feed(std::string(HANDSHAKE_SIZE, 'c')), SessionResult::NEED_MORE);
        ASSERT_EQ(session_.state(), SessionState::AWAITING_CONNECT);
        out_.clear();
    }

    void connect(double capsEx = 0.0)
    {
        handshake();
        ASSERT_EQ(feed(test::connectCommand("live", 1.0, capsEx)), SessionResult::NEED_MORE);
        ASSERT_EQ(session_.state(), SessionState::CONNECTED);
        replies();
    }

    uint32_t createStream(double tid)
    {
        feed(test::createStreamCommand(tid));
        auto messages = replies();
        EXPECT_EQ(messages.size(), 1u);
        if(messages.empty()) {
            return 0;
        }
        auto values = test::decodeAmf(messages[0].payload);
        EXPECT_EQ(values[0].string(), "_result");
        EXPECT_EQ(values[1].number(), tid);
        return static_cast<uint32_t>(values[3].number());
    }

    void publish()
    {
        connect();
        uint32_t sid = createStream(4.0);
        ASSERT_EQ(sid, 1u);
        feed(test::publishCommand(sid, "stream", "live", 5.0));
        ASSERT_EQ(session_.state(), SessionState::PUBLISHING);
        replies();
    }

    Config config_;
    test::ScriptedHooks hooks_;
    test::RecordingSink sink_;
    Buffer in_;
    Buffer out_;
    Session session_;
    ChunkDecoder replyDecoder_;
    boost::system::error_code ec_;
};
}

TEST_F(SessionTest, SimpleHandshakeAndConnect)
{
    feed(test::simpleC0C1());
    EXPECT_EQ(out_.readableSize(), 1 + 2 * HANDSHAKE_SIZE);
    EXPECT_EQ(session_.state(), SessionState::HANDSHAKING);
    feed(std::string(HANDSHAKE_SIZE, 'c'));
    EXPECT_EQ(session_.state(), SessionState::AWAITING_CONNECT);
    EXPECT_FALSE(session_.complexHandshake());
    out_.erase(1 + 2 * HANDSHAKE_SIZE);

    EXPECT_EQ(feed(test::connectCommand("live")), SessionResult::NEED_MORE);
    EXPECT_FALSE(ec_);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[0].h.type, TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE);
    EXPECT_EQ(messages[1].h.type, TYPE_SET_PEER_BANDWIDTH);
    EXPECT_EQ(messages[2].h.type, TYPE_SET_CHUNK_SIZE);
    EXPECT_EQ(messages[3].h.type, TYPE_INVOKE);
    uint32_t v;
    loadBE<uint32_t, 32>(messages[0].payload.data(), v);
    EXPECT_EQ(v, config_.windowAckSize);
    loadBE<uint32_t, 32>(messages[2].payload.data(), v);
    EXPECT_EQ(v, config_.initialWriteChunkSize);
    EXPECT_EQ(messages[1].payload.size(), 5u);
    EXPECT_EQ((uint8_t)messages[1].payload[4], config_.peerBandwidthLimit);

    auto values = test::decodeAmf(messages[3].payload);
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0].string(), "_result");
    EXPECT_EQ(values[1].number(), 1.0);
    EXPECT_EQ(values[2].getString("fmsVer"), "FMS/3,0,1,123");
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Connect.Success");

    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
    EXPECT_EQ(session_.app(), "live");
    EXPECT_EQ(session_.writeChunkSize(), config_.initialWriteChunkSize);
    ASSERT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(sink_.events[0].type, EventType::SESSION_OPENED);
    EXPECT_EQ(sink_.events[0].app, "live");
    ASSERT_TRUE(sink_.events[0].tcUrl);
    EXPECT_EQ(*sink_.events[0].tcUrl, "rtmp://localhost/live");
    EXPECT_EQ(hooks_.connects, std::vector<std::string>({ "live" }));
}

TEST_F(SessionTest, ComplexHandshake)
{
    feed(test::complexC0C1(HandshakeSchema::SCHEMA1));
    feed(std::string(HANDSHAKE_SIZE, 'c'));
    EXPECT_EQ(session_.state(), SessionState::AWAITING_CONNECT);
    EXPECT_TRUE(session_.complexHandshake());
}

TEST_F(SessionTest, MultiChunkVideo)
{
    publish();
    ASSERT_EQ(sink_.events.size(), 2u);
    EXPECT_EQ(sink_.events[1].type, EventType::PUBLISH_STARTED);
    EXPECT_EQ(sink_.events[1].sid, 1u);
    EXPECT_EQ(sink_.events[1].streamName, "stream");
    EXPECT_EQ(sink_.events[1].publishKind, "live");

    std::string payload(300, '\x17');
    std::string bytes = test::chunked(6, TYPE_VIDEO, 1, 0, payload);
    // first fragment alone emits nothing
    feed(std::string_view(bytes).substr(0, 12 + 128));
    EXPECT_EQ(sink_.events.size(), 2u);
    EXPECT_TRUE(session_.midMessage());
    feed(std::string_view(bytes).substr(12 + 128));
    ASSERT_EQ(sink_.events.size(), 3u);
    const Event &e = sink_.events[2];
    EXPECT_EQ(e.type, EventType::MEDIA);
    EXPECT_EQ(e.kind, MediaKind::VIDEO);
    EXPECT_EQ(e.sid, 1u);
    EXPECT_EQ(e.payload, payload);
    EXPECT_FALSE(session_.midMessage());
}

TEST_F(SessionTest, AudioAndMetadata)
{
    publish();
    feed(test::chunked(4, TYPE_DATA, 1, 0, test::amfBody({ AmfValue("@setDataFrame"), AmfValue("onMetaData") })));
    feed(test::chunked(4, TYPE_AUDIO, 1, 23, "\xaf\x01"));
    ASSERT_EQ(sink_.events.size(), 4u);
    EXPECT_EQ(sink_.events[2].type, EventType::META);
    EXPECT_EQ(sink_.events[3].type, EventType::MEDIA);
    EXPECT_EQ(sink_.events[3].kind, MediaKind::AUDIO);
    EXPECT_EQ(sink_.events[3].timestamp, 23u);
}

TEST_F(SessionTest, MediaBeforePublishIsDropped)
{
    connect();
    feed(test::chunked(6, TYPE_VIDEO, 1, 0, "frame"));
    EXPECT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, PublishBeforeConnect)
{
    handshake();
    EXPECT_EQ(feed(test::publishCommand(1, "stream", "live", 2.0)), SessionResult::NEED_MORE);
    EXPECT_FALSE(ec_);
    EXPECT_EQ(session_.state(), SessionState::AWAITING_CONNECT);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "_error");
    EXPECT_EQ(values[1].number(), 2.0);
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Call.BadVersion");
    EXPECT_TRUE(sink_.events.empty());
    EXPECT_EQ(sink_.closes, 0);

    // the connection goes on
    EXPECT_EQ(feed(test::connectCommand("live")), SessionResult::NEED_MORE);
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, SetChunkSizeWithBit31Closes)
{
    connect();
    EXPECT_EQ(feed(test::controlMessage(TYPE_SET_CHUNK_SIZE, test::u32BE(0x80000001))), SessionResult::ERROR);
    EXPECT_EQ(ec_, make_error_code(Error::invalid_chunk_size));
    EXPECT_EQ(out_.readableSize(), 0u);
    session_.close(ec_);
    EXPECT_EQ(session_.state(), SessionState::CLOSED);
    EXPECT_EQ(sink_.closes, 1);
    EXPECT_EQ(sink_.reason, make_error_code(Error::invalid_chunk_size));
    session_.close(Error::timeout);
    EXPECT_EQ(sink_.closes, 1);
}

TEST_F(SessionTest, SetChunkSizeChangesReads)
{
    connect();
    feed(test::controlMessage(TYPE_SET_CHUNK_SIZE, test::u32BE(4096)));
    feed(test::controlMessage(TYPE_SET_CHUNK_SIZE, test::u32BE(4096)));
    EXPECT_EQ(session_.readChunkSize(), 4096u);
    uint32_t sid = createStream(2.0);
    feed(test::publishCommand(sid, "big", "record"));
    std::string payload(3000, 'k');
    feed(test::chunked(6, TYPE_VIDEO, sid, 0, payload, 4096));
    ASSERT_EQ(sink_.events.size(), 3u);
    EXPECT_EQ(sink_.events[2].payload.size(), 3000u);
    EXPECT_EQ(session_.publishingType(), "record");
}

TEST_F(SessionTest, CreateStreamIsUnique)
{
    connect();
    std::set<uint32_t> ids;
    for(int i = 0; i < 10; i++) {
        uint32_t sid = createStream(2.0 + i);
        EXPECT_NE(sid, 0u);
        ids.insert(sid);
    }
    EXPECT_EQ(ids.size(), 10u);
}

TEST_F(SessionTest, ConnectRejectedByHook)
{
    hooks_.acceptConnect = false;
    hooks_.reason = "unknown app";
    handshake();
    EXPECT_EQ(feed(test::connectCommand("private")), SessionResult::ERROR);
    EXPECT_EQ(ec_, make_error_code(Error::hook_rejected));
    EXPECT_TRUE(isRecoverable(ec_));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "_error");
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Connect.Rejected");
    EXPECT_EQ(info(values).getString("description"), "unknown app");
    EXPECT_TRUE(sink_.events.empty());
}

TEST_F(SessionTest, PublishRejectedByHook)
{
    hooks_.acceptPublish = false;
    connect();
    uint32_t sid = createStream(2.0);
    feed(test::publishCommand(sid, "secret", "live"));
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].h.sid, sid);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "onStatus");
    EXPECT_EQ(info(values).getString("level"), "error");
    EXPECT_EQ(info(values).getString("code"), "NetStream.Publish.BadName");
    EXPECT_EQ(hooks_.publishes, std::vector<std::string>({ "live/secret/live" }));
    EXPECT_EQ(sink_.events.size(), 1u);
}

TEST_F(SessionTest, PublishRepliesStartAndStreamBegin)
{
    connect();
    uint32_t sid = createStream(2.0);
    feed(test::publishCommand(sid, "stream", "bogus"));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 2u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Publish.Start");
    EXPECT_EQ(messages[1].h.type, TYPE_EVENT);
    uint16_t event;
    uint32_t param;
    loadBE<uint16_t, 16>(messages[1].payload.data(), event);
    loadBE<uint32_t, 32>(messages[1].payload.data() + 2, param);
    EXPECT_EQ(event, EVENT_STREAM_BEGIN);
    EXPECT_EQ(param, sid);
    EXPECT_EQ(session_.publishingType(), "live");
    EXPECT_EQ(session_.publishingName(), "stream");
}

TEST_F(SessionTest, PublishOnUnknownStream)
{
    connect();
    feed(test::publishCommand(7, "stream", "live", 3.0));
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Publish.Failed");
}

TEST_F(SessionTest, DeleteStreamStopsPublishing)
{
    publish();
    feed(test::deleteStreamCommand(1));
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
    ASSERT_EQ(sink_.events.size(), 3u);
    EXPECT_EQ(sink_.events[2].type, EventType::PUBLISH_STOPPED);
    EXPECT_EQ(sink_.events[2].sid, 1u);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Unpublish.Success");

    // the stream id is gone
    feed(test::publishCommand(1, "stream", "live"));
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, StatusRepliesEchoTransactionId)
{
    connect();
    uint32_t sid = createStream(2.0);
    feed(test::publishCommand(sid, "stream", "live", 5.0));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 2u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "onStatus");
    EXPECT_EQ(values[1].number(), 5.0);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Publish.Start");

    feed(test::deleteStreamCommand(sid, 7.0));
    messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[1].number(), 7.0);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Unpublish.Success");
}

TEST_F(SessionTest, RejectedPublishEchoesTransactionId)
{
    hooks_.acceptPublish = false;
    connect();
    uint32_t sid = createStream(2.0);
    feed(test::publishCommand(sid, "secret", "live", 9.0));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[1].number(), 9.0);
    EXPECT_EQ(info(values).getString("code"), "NetStream.Publish.BadName");
}

TEST_F(SessionTest, DeleteStreamWithoutPublishIsAnswered)
{
    connect();
    uint32_t sid = createStream(2.0);
    feed(test::deleteStreamCommand(sid, 3.0));
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].h.sid, sid);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "onStatus");
    EXPECT_EQ(values[1].number(), 3.0);
    EXPECT_EQ(info(values).getString("code"), "NetStream.DeleteStream.Suceess");
    // no PublishStopped
    EXPECT_EQ(sink_.events.size(), 1u);
}

TEST_F(SessionTest, ReleaseStreamAndFCPublish)
{
    connect();
    feed(test::chunked(CID_OVER_CONNECTION, TYPE_INVOKE, 0, 0,
                       test::command("releaseStream", 2.0, { AmfValue::null(), AmfValue("stream") })));
    feed(test::chunked(CID_OVER_CONNECTION, TYPE_INVOKE, 0, 0,
                       test::command("FCPublish", 3.0, { AmfValue::null(), AmfValue("stream") })));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 2u);
    auto values = test::decodeAmf(messages[1].payload);
    EXPECT_EQ(values[0].string(), "_result");
    EXPECT_EQ(values[1].number(), 3.0);
}

TEST_F(SessionTest, UnknownCommand)
{
    connect();
    feed(test::chunked(CID_OVER_CONNECTION, TYPE_INVOKE, 0, 0, test::command("frobnicate", 9.0, {})));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "_error");
    EXPECT_EQ(values[1].number(), 9.0);
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Call.Failed");
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, MalformedCommandIsDropped)
{
    connect();
    std::string body = test::command("createStream", 2.0, {});
    body += std::string(1, static_cast<char>(AMF0_REFERENCE)) + std::string("\x00\x01", 2);
    EXPECT_EQ(feed(test::chunked(CID_OVER_CONNECTION, TYPE_INVOKE, 0, 0, body)), SessionResult::NEED_MORE);
    EXPECT_FALSE(ec_);
    EXPECT_TRUE(replies().empty());
    EXPECT_EQ(session_.state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, SecondConnectFails)
{
    connect();
    feed(test::connectCommand("live", 2.0));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Call.Failed");
    EXPECT_EQ(sink_.events.size(), 1u);
}

TEST_F(SessionTest, PingIsAnswered)
{
    connect();
    std::string body(2, '\0');
    storeBE<uint16_t, 16>(body.data(), EVENT_PING_REQUEST);
    body += test::u32BE(123456);
    feed(test::controlMessage(TYPE_EVENT, body));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    uint16_t event;
    uint32_t param;
    loadBE<uint16_t, 16>(messages[0].payload.data(), event);
    loadBE<uint32_t, 32>(messages[0].payload.data() + 2, param);
    EXPECT_EQ(event, EVENT_PING_RESPONSE);
    EXPECT_EQ(param, 123456u);
}

TEST_F(SessionTest, AcknowledgementAfterWindow)
{
    connect();
    feed(test::controlMessage(TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE, test::u32BE(1000)));
    EXPECT_EQ(session_.peerWindowAckSize(), 1000u);
    replies();
    // the handshake and connect bytes already crossed the window
    session_.received(1);
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].h.type, TYPE_ACKNOWLEDGEMENT);
    uint32_t sequence;
    loadBE<uint32_t, 32>(messages[0].payload.data(), sequence);
    EXPECT_EQ(sequence, session_.sequence());

    session_.received(999);
    EXPECT_TRUE(replies().empty());
    session_.received(1);
    EXPECT_EQ(replies().size(), 1u);
}

TEST_F(SessionTest, PeerBandwidthIsAnsweredWithWindowAck)
{
    connect();
    std::string body = test::u32BE(5000000) + std::string(1, '\x02');
    feed(test::controlMessage(TYPE_SET_PEER_BANDWIDTH, body));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].h.type, TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE);
    uint32_t size;
    loadBE<uint32_t, 32>(messages[0].payload.data(), size);
    EXPECT_EQ(size, 5000000u);
}

TEST_F(SessionTest, ReconnectRequest)
{
    connect(CAPS_EX_RECONNECT);
    EXPECT_TRUE(session_.requestReconnect("maintenance"));
    auto messages = replies();
    ASSERT_EQ(messages.size(), 1u);
    auto values = test::decodeAmf(messages[0].payload);
    EXPECT_EQ(values[0].string(), "onStatus");
    EXPECT_EQ(info(values).getString("code"), "NetConnection.Connect.ReconnectRequest");
}

TEST_F(SessionTest, NoReconnectWithoutCapability)
{
    connect();
    EXPECT_FALSE(session_.requestReconnect("maintenance"));
    EXPECT_TRUE(replies().empty());
}

TEST_F(SessionTest, Fmt3WithoutHeaderIsFatal)
{
    connect();
    EXPECT_EQ(feed(std::string(1, '\xc9') + "junk"), SessionResult::ERROR);
    EXPECT_EQ(ec_, make_error_code(Error::chunk_malformed));
    EXPECT_FALSE(isRecoverable(ec_));
}

TEST_F(SessionTest, AbortMessage)
{
    publish();
    std::string bytes = test::chunked(6, TYPE_VIDEO, 1, 0, std::string(300, 'x'));
    feed(std::string_view(bytes).substr(0, 12 + 128));
    EXPECT_TRUE(session_.midMessage());
    feed(test::controlMessage(TYPE_ABORT, test::u32BE(6)));
    EXPECT_FALSE(session_.midMessage());
    EXPECT_EQ(sink_.events.size(), 2u);
}
