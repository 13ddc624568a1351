#pragma once
#include <functional>
#include <string_view>
#include <vector>
#include <boost/asio.hpp>
#include "Buffer.hpp"

namespace rtmpingest {
// Owns the socket of a connection with its read and write buffers. Reads
// append to in(), parsers consume from it directly. Writes are appended to
// out() and go to the socket on flush().
class Framer
{
public:
    using ReadHandler = std::function<void(const boost::system::error_code &, std::size_t)>;
    using FlushHandler = std::function<void(const boost::system::error_code &)>;

    Framer(boost::asio::ip::tcp::socket socket, uint32_t readBufferSize, uint32_t maxReadBufferSize);

    // Completes once at least n bytes are buffered. The size is the number
    // of bytes read from the socket by this call.
    void readExact(std::size_t n, ReadHandler handler);
    // Completes with whatever the next socket read returns.
    void readSome(ReadHandler handler);
    // First n buffered bytes, empty when fewer are buffered.
    std::string_view peek(std::size_t n) const;

    void writeAll(std::string_view bytes);
    // Completes when everything appended so far reached the socket.
    void flush(FlushHandler handler);

    bool reading() const
    {
        return reading_;
    }

    bool writing() const
    {
        return writing_;
    }

    Buffer &in()
    {
        return in_;
    }

    Buffer &out()
    {
        return out_;
    }

    boost::asio::ip::tcp::socket &socket()
    {
        return socket_;
    }

    std::string remote() const;

    void close();

private:
    void doRead(std::size_t atLeast, std::size_t total, ReadHandler handler);
    void doWrite();

private:
    boost::asio::ip::tcp::socket socket_;
    uint32_t readBufferSize_;
    uint32_t maxReadBufferSize_;
    Buffer in_;
    Buffer out_;
    Buffer outFlush_;
    bool reading_{ false };
    bool writing_{ false };
    std::vector<FlushHandler> flushHandlers_;
};
}
