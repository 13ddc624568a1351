#pragma once
#include <cstdint>
#include <string_view>
#include <boost/endian/buffers.hpp>

namespace rtmpingest {
template<class T, std::size_t n_bits>
inline void loadBE(const void *input, T &output)
{
    output = ((const boost::endian::endian_buffer<boost::endian::order::big, T, n_bits> *)input)->value();
}

template<class T, std::size_t n_bits>
inline void loadLE(const void *input, T &output)
{
    output = ((const boost::endian::endian_buffer<boost::endian::order::little, T, n_bits> *)input)->value();
}

template<class T, std::size_t n_bits>
inline void storeBE(void *output, T input)
{
    *((boost::endian::endian_buffer<boost::endian::order::big, T, n_bits> *)output) = input;
}

template<class T, std::size_t n_bits>
inline void storeLE(void *output, T input)
{
    *((boost::endian::endian_buffer<boost::endian::order::little, T, n_bits> *)output) = input;
}

// Bounds checked cursor over a byte view. Every get* returns false and
// leaves the cursor untouched when not enough bytes remain.
class ByteReader
{
public:
    explicit ByteReader(std::string_view data) : data_(data)
    {
    }

    template<class T, std::size_t n_bits>
    bool getBE(T &output)
    {
        if(data_.size() >= (n_bits / 8)) {
            loadBE<T, n_bits>((const void *)data_.data(), output);
            data_.remove_prefix(n_bits / 8);
            return true;
        }
        return false;
    }

    bool get(std::string_view &output, std::size_t length)
    {
        if(data_.size() >= length) {
            output = data_.substr(0, length);
            data_.remove_prefix(length);
            return true;
        }
        return false;
    }

    std::size_t remaining() const
    {
        return data_.size();
    }

private:
    std::string_view data_;
};
}
