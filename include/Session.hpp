#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/system/error_code.hpp>
#include "Amf0.hpp"
#include "Buffer.hpp"
#include "Chunk.hpp"
#include "Config.hpp"
#include "Event.hpp"
#include "Handshake.hpp"
#include "Hooks.hpp"
#include "Rtmp.hpp"

namespace rtmpingest {
enum class SessionState {
    HANDSHAKING,
    AWAITING_CONNECT,
    CONNECTED,
    PUBLISHING,
    CLOSED,
};

const char *toString(SessionState state);

enum class SessionResult {
    NEED_MORE, // the input holds no complete unit
    PROGRESS,  // a handshake step, a chunk or a message was processed
    ERROR,     // fatal, the connection must be closed
};

// Protocol side of one publisher connection: handshake, chunk codec, message
// dispatch and the command state machine. It reads from the caller's input
// buffer, writes replies to the output buffer given at construction and
// reports to an EventSink. It does no I/O itself.
class Session
{
public:
    Session(const Config &config, SessionHooks &hooks, EventSink &events, Buffer &output);

    // Processes one unit from in. Every message emits at most one event.
    SessionResult process(Buffer &in, boost::system::error_code &ec);

    // Counts bytes read from the transport, sends Acknowledgements when the
    // peer's window is crossed.
    void received(std::size_t bytes);

    // Queues a ReconnectRequest when the client announced support for it.
    bool requestReconnect(std::string_view description);

    // Moves to CLOSED and closes the event sink, once.
    void close(const boost::system::error_code &reason);

    // True while the decoder holds part of a chunk or a message.
    bool midMessage() const;

    SessionState state() const
    {
        return state_;
    }

    const std::string &app() const
    {
        return app_;
    }

    const std::optional<std::string> &tcUrl() const
    {
        return tcUrl_;
    }

    const std::string &publishingName() const
    {
        return publishingName_;
    }

    const std::string &publishingType() const
    {
        return publishingType_;
    }

    uint32_t publishingSid() const
    {
        return publishingSid_;
    }

    uint32_t readChunkSize() const
    {
        return decoder_.chunkSize();
    }

    uint32_t writeChunkSize() const
    {
        return encoder_.chunkSize();
    }

    uint32_t peerWindowAckSize() const
    {
        return peerWindow_;
    }

    uint32_t sequence() const
    {
        return sequence_;
    }

    bool complexHandshake() const
    {
        return handshake_.complex();
    }

    const rtmp::ChunkDecoder &decoder() const
    {
        return decoder_;
    }

private:
    bool onMessage(rtmp::RtmpMessage &m, boost::system::error_code &ec);
    bool onInvoke(rtmp::RtmpMessage &m, boost::system::error_code &ec);
    bool onConnect(double tid, const std::vector<rtmp::AmfValue> &args, boost::system::error_code &ec);
    void onCreateStream(double tid);
    void onPublish(uint32_t sid, double tid, const std::vector<rtmp::AmfValue> &args);
    void onDeleteStream(double tid, const std::vector<rtmp::AmfValue> &args);
    void onMedia(rtmp::RtmpMessage &m);
    void onData(rtmp::RtmpMessage &m);
    void rejectCommand(std::string_view command, double tid, std::string_view code);

private:
    const Config &config_;
    SessionHooks &hooks_;
    EventSink &events_;
    Buffer &output_;
    SessionState state_;
    rtmp::HandshakeServer handshake_;
    rtmp::ChunkDecoder decoder_;
    rtmp::ChunkEncoder encoder_;
    rtmp::MessageEncoder messages_;
    rtmp::RtmpMessage message_;
    std::string app_;
    std::optional<std::string> tcUrl_;
    std::string publishingName_;
    std::string publishingType_;
    uint32_t publishingSid_{ 0 };
    uint32_t streamIdCounter_{ 0 };
    std::set<uint32_t> streams_;
    bool reconnect_{ false };
    uint32_t peerWindow_;
    uint32_t sequence_{ 0 };
    uint32_t lastAck_{ 0 };
};
}
