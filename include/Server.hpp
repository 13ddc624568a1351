#pragma once
#include <string>
#include <boost/asio.hpp>
#include "Config.hpp"

namespace rtmpingest {
// Example ingest server: accepts every publisher and logs its events.
class Server
{
public:
    explicit Server(const Config &config);
    ~Server();

    void run(const std::string &ip, uint16_t port);

    boost::asio::io_context &get_io_context();

private:
    const Config &config_;
    boost::asio::io_context io_context_;
};
}
