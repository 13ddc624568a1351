#include <spdlog/spdlog.h>
#include "Session.hpp"
#include "Error.hpp"

namespace rtmpingest {
const char *toString(SessionState state)
{
    switch(state) {
    case SessionState::HANDSHAKING:
        return "Handshaking";
    case SessionState::AWAITING_CONNECT:
        return "AwaitingConnect";
    case SessionState::CONNECTED:
        return "Connected";
    case SessionState::PUBLISHING:
        return "Publishing";
    case SessionState::CLOSED:
        return "Closed";
    }
    return "Unknown";
}

Session::Session(const Config &config, SessionHooks &hooks, EventSink &events, Buffer &output)
    : config_(config),
      hooks_(hooks),
      events_(events),
      output_(output),
      state_(SessionState::HANDSHAKING),
      decoder_(config.initialReadChunkSize, config.maxChunkStreams),
      encoder_(rtmp::DEFAULT_CHUNK_SIZE),
      messages_(output, encoder_),
      peerWindow_(config.windowAckSize)
{
}

SessionResult Session::process(Buffer &in, boost::system::error_code &ec)
{
    if(state_ == SessionState::CLOSED) {
        return SessionResult::NEED_MORE;
    }
    if(state_ == SessionState::HANDSHAKING) {
        if(handshake_.handshake(in, output_, ec)) {
            if(handshake_.finished()) {
                SPDLOG_INFO("RTMP session {}, handshake done ({})", (void *)this,
                            handshake_.complex() ? "complex" : "simple");
                state_ = SessionState::AWAITING_CONNECT;
            }
            return SessionResult::PROGRESS;
        }
        return ec ? SessionResult::ERROR : SessionResult::NEED_MORE;
    }
    switch(decoder_.readChunk(in, message_, ec)) {
    case rtmp::ChunkResult::NEED_MORE:
        return SessionResult::NEED_MORE;
    case rtmp::ChunkResult::CHUNK:
        return SessionResult::PROGRESS;
    case rtmp::ChunkResult::MESSAGE:
        return onMessage(message_, ec) ? SessionResult::PROGRESS : SessionResult::ERROR;
    default:
        return SessionResult::ERROR;
    }
}

void Session::received(std::size_t bytes)
{
    sequence_ += static_cast<uint32_t>(bytes);
    if(state_ == SessionState::HANDSHAKING || state_ == SessionState::CLOSED || peerWindow_ == 0) {
        return;
    }
    if(static_cast<uint32_t>(sequence_ - lastAck_) >= peerWindow_) {
        SPDLOG_DEBUG("RTMP session {}, ack {}", (void *)this, sequence_);
        messages_.encodeAck(sequence_);
        lastAck_ = sequence_;
    }
}

bool Session::requestReconnect(std::string_view description)
{
    if(!reconnect_ || (state_ != SessionState::CONNECTED && state_ != SessionState::PUBLISHING)) {
        return false;
    }
    SPDLOG_INFO("RTMP session {}, send reconnect request", (void *)this);
    messages_.encodeReconnectRequest(description);
    return true;
}

void Session::close(const boost::system::error_code &reason)
{
    if(state_ == SessionState::CLOSED) {
        return;
    }
    SPDLOG_INFO("RTMP session {}, closed in state {}, reason {}", (void *)this, toString(state_), errorKind(reason));
    state_ = SessionState::CLOSED;
    events_.close(reason);
}

bool Session::midMessage() const
{
    return !decoder_.idle();
}

bool Session::onMessage(rtmp::RtmpMessage &m, boost::system::error_code &ec)
{
    ByteReader reader(m.payload);
    switch(m.h.type) {
    case rtmp::TYPE_SET_CHUNK_SIZE: {
        uint32_t size = 0;
        if(!reader.getBE<uint32_t, 32>(size)) {
            SPDLOG_ERROR("RTMP session {}, truncated set chunk size", (void *)this);
            ec = Error::invalid_chunk_size;
            return false;
        }
        if(!decoder_.setChunkSize(size, ec)) {
            return false;
        }
        SPDLOG_DEBUG("RTMP session {}, chunk size changed to {}", (void *)this, size);
        break;
    }
    case rtmp::TYPE_ABORT: {
        uint32_t cid = 0;
        if(reader.getBE<uint32_t, 32>(cid)) {
            decoder_.abort(cid);
        }
        break;
    }
    case rtmp::TYPE_ACKNOWLEDGEMENT: {
        uint32_t bytes = 0;
        if(reader.getBE<uint32_t, 32>(bytes)) {
            SPDLOG_DEBUG("RTMP session {}, bytes read by peer: {}", (void *)this, bytes);
        }
        break;
    }
    case rtmp::TYPE_EVENT: {
        uint16_t event = 0;
        uint32_t param = 0;
        if(reader.getBE<uint16_t, 16>(event) && reader.getBE<uint32_t, 32>(param)) {
            SPDLOG_DEBUG("RTMP session {}, event {}, param {}", (void *)this, event, param);
            if(event == rtmp::EVENT_PING_REQUEST) {
                messages_.encodePingResponse(param);
            }
        }
        break;
    }
    case rtmp::TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE: {
        uint32_t size = 0;
        if(reader.getBE<uint32_t, 32>(size)) {
            SPDLOG_DEBUG("RTMP session {}, winack {}", (void *)this, size);
            peerWindow_ = size;
        }
        break;
    }
    case rtmp::TYPE_SET_PEER_BANDWIDTH: {
        uint32_t size = 0;
        uint8_t limit = 0;
        if(reader.getBE<uint32_t, 32>(size) && reader.getBE<uint8_t, 8>(limit)) {
            SPDLOG_DEBUG("RTMP session {}, peer bw {}, limit {}", (void *)this, size, (int)limit);
            messages_.encodeWindowAck(size);
        }
        break;
    }
    case rtmp::TYPE_AUDIO:
    case rtmp::TYPE_VIDEO:
        onMedia(m);
        break;
    case rtmp::TYPE_DATA:
        onData(m);
        break;
    case rtmp::TYPE_INVOKE:
        return onInvoke(m, ec);
    case rtmp::TYPE_FLEX_STREAM:
    case rtmp::TYPE_FLEX_MESSAGE:
    case rtmp::TYPE_SHARED_OBJECT:
        SPDLOG_DEBUG("RTMP session {}, ignore AMF3/shared object message, type={}, size={}",
                     (void *)this, (int)m.h.type, m.payload.size());
        break;
    case rtmp::TYPE_AGGREGATE:
        SPDLOG_DEBUG("RTMP session {}, ignore aggregate message, size={}", (void *)this, m.payload.size());
        break;
    default:
        SPDLOG_DEBUG("RTMP session {}, ignore message type {}", (void *)this, (int)m.h.type);
        break;
    }
    return true;
}

bool Session::onInvoke(rtmp::RtmpMessage &m, boost::system::error_code &ec)
{
    rtmp::AmfDecoder decoder(m.payload);
    std::vector<rtmp::AmfValue> values;
    if(!decoder.getAll(values)) {
        SPDLOG_ERROR("RTMP session {}, drop command, {}: {}", (void *)this,
                     make_error_code(Error::amf0_decode).message(), decoder.error());
        return true;
    }
    if(values.size() < 2 || !values[0].isString() || !values[1].isNumber()) {
        SPDLOG_ERROR("RTMP session {}, drop command without name or transaction id", (void *)this);
        return true;
    }
    const std::string &command = values[0].string();
    double tid = values[1].number();
    SPDLOG_DEBUG("RTMP session {}, invoke cmd={}, trans_id={}", (void *)this, command, tid);
    bool connected = (state_ == SessionState::CONNECTED || state_ == SessionState::PUBLISHING);
    if(command == "connect") {
        return onConnect(tid, values, ec);
    } else if(command == "createStream") {
        if(!connected) {
            rejectCommand(command, tid, "NetConnection.Call.Failed");
        } else {
            onCreateStream(tid);
        }
    } else if(command == "releaseStream" || command == "FCPublish"
              || command == "FCUnpublish" || command == "getStreamLength") {
        if(!connected) {
            rejectCommand(command, tid, "NetConnection.Call.Failed");
        } else {
            messages_.encodeNullResult(tid);
        }
    } else if(command == "publish") {
        onPublish(m.h.sid, tid, values);
    } else if(command == "deleteStream") {
        onDeleteStream(tid, values);
    } else if(command == "closeStream" || command == "pause"
              || command == "receiveAudio" || command == "receiveVideo") {
        SPDLOG_DEBUG("RTMP session {}, ignore {}", (void *)this, command);
    } else if(command == "_result" || command == "_error" || command == "onStatus") {
    } else {
        SPDLOG_WARN("RTMP session {}, unknown command {}", (void *)this, command);
        messages_.encodeError(tid, "NetConnection.Call.Failed", "Unknown command " + command);
    }
    return true;
}

bool Session::onConnect(double tid, const std::vector<rtmp::AmfValue> &args, boost::system::error_code &ec)
{
    if(state_ != SessionState::AWAITING_CONNECT) {
        rejectCommand("connect", tid, "NetConnection.Call.Failed");
        return true;
    }
    if(args.size() < 3 || !args[2].isObject()) {
        SPDLOG_ERROR("RTMP session {}, drop connect without command object", (void *)this);
        return true;
    }
    const rtmp::AmfValue &obj = args[2];
    app_ = std::string(obj.getString("app"));
    const rtmp::AmfValue *tcUrl = obj.get("tcUrl");
    if(tcUrl && tcUrl->isString()) {
        tcUrl_ = tcUrl->string();
    }
    const rtmp::AmfValue *capsEx = obj.get("capsEx");
    if(capsEx && capsEx->isNumber()) {
        reconnect_ = (static_cast<uint32_t>(capsEx->number()) & rtmp::CAPS_EX_RECONNECT) != 0;
    }
    const rtmp::AmfValue *objectEncoding = obj.get("objectEncoding");
    if(objectEncoding && objectEncoding->isNumber() && objectEncoding->number() != 0) {
        SPDLOG_DEBUG("RTMP session {}, client asked objectEncoding {}, answer with AMF0",
                     (void *)this, objectEncoding->number());
    }
    SPDLOG_INFO("RTMP session {}, connect app={}, tcUrl={}", (void *)this, app_, tcUrl_ ? *tcUrl_ : "-");

    HookResult result = hooks_.onConnect(app_);
    if(!result.accepted) {
        SPDLOG_WARN("RTMP session {}, connect to {} rejected: {}", (void *)this, app_, result.reason);
        messages_.encodeConnectRejected(tid, result.reason.empty() ? "Connection rejected." : result.reason);
        ec = Error::hook_rejected;
        return false;
    }
    messages_.encodeWindowAck(config_.windowAckSize);
    messages_.encodePeerBandwidth(config_.peerBandwidth, config_.peerBandwidthLimit);
    messages_.encodeSetChunkSize(config_.initialWriteChunkSize);
    encoder_.setChunkSize(config_.initialWriteChunkSize);
    messages_.encodeConnectResult(tid);
    state_ = SessionState::CONNECTED;
    events_.push(Event::sessionOpened(app_, tcUrl_));
    return true;
}

void Session::onCreateStream(double tid)
{
    uint32_t sid = ++streamIdCounter_;
    streams_.insert(sid);
    SPDLOG_DEBUG("RTMP session {}, create stream {}", (void *)this, sid);
    messages_.encodeCreateStreamResult(tid, sid);
}

void Session::onPublish(uint32_t sid, double tid, const std::vector<rtmp::AmfValue> &args)
{
    if(state_ == SessionState::AWAITING_CONNECT) {
        rejectCommand("publish", tid, "NetConnection.Call.BadVersion");
        return;
    }
    if(state_ != SessionState::CONNECTED || streams_.count(sid) == 0) {
        rejectCommand("publish", tid, "NetStream.Publish.Failed");
        return;
    }
    if(args.size() < 4 || !args[3].isString() || args[3].string().empty()) {
        SPDLOG_WARN("RTMP session {}, publish without stream name", (void *)this);
        messages_.encodeOnStatus(sid, tid, "error", "NetStream.Publish.BadName", "Missing stream name.");
        return;
    }
    std::string name = args[3].string();
    std::string kind = "live";
    if(args.size() > 4 && args[4].isString()) {
        const std::string &type = args[4].string();
        if(type == "live" || type == "record" || type == "append") {
            kind = type;
        } else {
            SPDLOG_WARN("RTMP session {}, unknown publish type {}, use live", (void *)this, type);
        }
    }
    HookResult result = hooks_.onPublish(app_, name, kind);
    if(!result.accepted) {
        SPDLOG_WARN("RTMP session {}, publish {}/{} rejected: {}", (void *)this, app_, name, result.reason);
        messages_.encodeOnStatus(sid, tid, "error", "NetStream.Publish.BadName",
                                 result.reason.empty() ? "Publish rejected." : result.reason);
        return;
    }
    SPDLOG_INFO("RTMP session {}, publish {}/{}, sid={}, type={}", (void *)this, app_, name, sid, kind);
    messages_.encodeOnStatus(sid, tid, "status", "NetStream.Publish.Start", name + " is now published.");
    messages_.encodeStreamBegin(sid);
    state_ = SessionState::PUBLISHING;
    publishingSid_ = sid;
    publishingName_ = name;
    publishingType_ = kind;
    events_.push(Event::publishStarted(sid, std::move(name), std::move(kind)));
}

void Session::onDeleteStream(double tid, const std::vector<rtmp::AmfValue> &args)
{
    if(args.size() < 4 || !args[3].isNumber()) {
        SPDLOG_WARN("RTMP session {}, deleteStream without stream id", (void *)this);
        return;
    }
    uint32_t sid = static_cast<uint32_t>(args[3].number());
    SPDLOG_DEBUG("RTMP session {}, deleteStream {}", (void *)this, sid);
    if(state_ == SessionState::PUBLISHING && sid == publishingSid_) {
        SPDLOG_INFO("RTMP session {}, unpublish {}/{}", (void *)this, app_, publishingName_);
        messages_.encodeOnStatus(sid, tid, "status", "NetStream.Unpublish.Success",
                                 publishingName_ + " is now unpublished.");
        state_ = SessionState::CONNECTED;
        publishingSid_ = 0;
        publishingName_.clear();
        publishingType_.clear();
        events_.push(Event::publishStopped(sid));
    } else {
        // sic
        messages_.encodeOnStatus(sid, tid, "status", "NetStream.DeleteStream.Suceess", "");
    }
    streams_.erase(sid);
}

void Session::onMedia(rtmp::RtmpMessage &m)
{
    if(state_ != SessionState::PUBLISHING) {
        SPDLOG_DEBUG("RTMP session {}, drop media before publish, type={}", (void *)this, (int)m.h.type);
        return;
    }
    MediaKind kind = (m.h.type == rtmp::TYPE_AUDIO) ? MediaKind::AUDIO : MediaKind::VIDEO;
    events_.push(Event::media(m.h.sid, kind, m.h.timestamp, std::move(m.payload)));
}

void Session::onData(rtmp::RtmpMessage &m)
{
    if(state_ != SessionState::PUBLISHING) {
        SPDLOG_DEBUG("RTMP session {}, drop data message before publish", (void *)this);
        return;
    }
    events_.push(Event::meta(m.h.sid, m.h.timestamp, std::move(m.payload)));
}

void Session::rejectCommand(std::string_view command, double tid, std::string_view code)
{
    SPDLOG_WARN("RTMP session {}, {} not allowed in state {}", (void *)this, command, toString(state_));
    messages_.encodeError(tid, code, std::string(command) + " is not allowed in state " + toString(state_));
}
}
