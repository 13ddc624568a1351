#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "Config.hpp"
#include "EventChannel.hpp"
#include "Hooks.hpp"
#include "RtmpSession.hpp"

namespace rtmpingest {
// Accepts publishers and runs one RtmpSession per connection. Each session
// gets its own event channel, drained by the consumer on a dedicated thread.
class RtmpServer
{
public:
    using ConsumerFn = std::function<void(std::shared_ptr<EventChannel>)>;

    RtmpServer(boost::asio::io_context &io, const Config &config, SessionHooks &hooks, ConsumerFn consumer);
    ~RtmpServer();

    // Throws boost::system::system_error when the address cannot be bound.
    void start(const std::string &ip, uint16_t port);
    void stop();

    uint16_t port() const;

    std::size_t sessions() const
    {
        return connections_.size();
    }

private:
    void doAccept();
    void onClosed(std::shared_ptr<RtmpSession> c);
    void reap();

private:
    struct Consumer {
        std::shared_ptr<EventChannel> channel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    struct Connection {
        std::shared_ptr<RtmpSession> session;
        Consumer consumer;
    };

    boost::asio::io_context &io_;
    const Config &config_;
    SessionHooks &hooks_;
    ConsumerFn consumer_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unordered_map<RtmpSession *, Connection> connections_;
    // consumers of closed sessions still draining their channel
    std::vector<Consumer> closing_;
};
}
