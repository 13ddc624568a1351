#pragma once
#include <functional>
#include <memory>
#include <boost/asio.hpp>
#include "Config.hpp"
#include "EventChannel.hpp"
#include "Framer.hpp"
#include "Hooks.hpp"
#include "Session.hpp"

namespace rtmpingest {
// Drives one publisher connection: reads through the Framer, feeds the
// Session, flushes its replies, enforces the handshake and idle timeouts and
// pauses reading while the event channel is full.
class RtmpSession : public std::enable_shared_from_this<RtmpSession>
{
public:
    using CloseHandler = std::function<void(std::shared_ptr<RtmpSession>)>;

    RtmpSession(boost::asio::ip::tcp::socket socket, const Config &config, SessionHooks &hooks,
                std::shared_ptr<EventChannel> channel);

    // The handler runs once, after the channel was closed.
    void start(CloseHandler onClose);
    // Server initiated stop, safe to call from any thread.
    void stop();

private:
    void doRead();
    void onRead(const boost::system::error_code &ec, std::size_t length);
    void decode();
    void flush();
    void armIdleTimer();
    void stopSession(const boost::system::error_code &reason);
    void closeSession();

private:
    const Config &config_;
    Framer framer_;
    std::shared_ptr<EventChannel> channel_;
    Session session_;
    boost::asio::steady_timer handshakeTimer_;
    boost::asio::steady_timer idleTimer_;
    boost::asio::steady_timer flushTimer_;
    CloseHandler onClose_;
    boost::system::error_code reason_;
    bool handshaking_{ true };
    bool paused_{ false };
    bool stopping_{ false };
    bool closed_{ false };
};
}
