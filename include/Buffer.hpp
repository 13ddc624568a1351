#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "Endian.hpp"

namespace rtmpingest {
// Contiguous byte queue with a read and a write cursor. Readers look at
// readBuffer()/readableSize() and erase() what they consumed; writers either
// append() or fill writeBuffer() and commit().
class Buffer
{
public:
    Buffer();
    explicit Buffer(uint32_t capacity);
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;
    Buffer(Buffer &&other) noexcept;
    Buffer &operator=(Buffer &&other) noexcept;
    ~Buffer();

    void clear();
    void swap(Buffer &other) noexcept;

    const uint8_t *readBuffer() const;
    uint32_t readableSize() const;
    std::string_view stringView() const;
    // View of the first n readable bytes, or an empty view when fewer are buffered.
    std::string_view peek(uint32_t n) const;
    void erase(uint32_t n);

    uint8_t *writeBuffer();
    uint32_t writableSize() const;
    uint32_t capacity() const;
    void commit(uint32_t n);

    void reserve(uint32_t n);
    void append(const uint8_t *data, uint32_t n);
    void append(std::string_view data);
    void append(const Buffer &other);

    template<class T, std::size_t n_bits>
    void putBE(T input)
    {
        reserve(n_bits / 8);
        storeBE<T, n_bits>(writeBuffer(), input);
        commit(n_bits / 8);
    }

    template<class T, std::size_t n_bits>
    void putLE(T input)
    {
        reserve(n_bits / 8);
        storeLE<T, n_bits>(writeBuffer(), input);
        commit(n_bits / 8);
    }

    void normalize();

private:
    uint8_t *start_;
    uint32_t capacity_;
    uint32_t readPos_;
    uint32_t writePos_;
};
}
