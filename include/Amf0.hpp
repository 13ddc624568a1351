#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "Buffer.hpp"

namespace rtmpingest::rtmp {
constexpr uint8_t AMF0_NUMBER = 0x00;
constexpr uint8_t AMF0_BOOLEAN = 0x01;
constexpr uint8_t AMF0_STRING = 0x02;
constexpr uint8_t AMF0_OBJECT = 0x03;
constexpr uint8_t AMF0_MOVIECLIP = 0x04;
constexpr uint8_t AMF0_NULL = 0x05;
constexpr uint8_t AMF0_UNDEFINED = 0x06;
constexpr uint8_t AMF0_REFERENCE = 0x07;
constexpr uint8_t AMF0_ECMA_ARRAY = 0x08;
constexpr uint8_t AMF0_OBJECT_END = 0x09;
constexpr uint8_t AMF0_STRICT_ARRAY = 0x0A;
constexpr uint8_t AMF0_DATE = 0x0B;
constexpr uint8_t AMF0_LONG_STRING = 0x0C;
constexpr uint8_t AMF0_UNSUPPORTED = 0x0D;
constexpr uint8_t AMF0_RECORDSET = 0x0E;
constexpr uint8_t AMF0_XML_DOCUMENT = 0x0F;
constexpr uint8_t AMF0_TYPED_OBJECT = 0x10;
constexpr uint8_t AMF0_AVMPLUS = 0x11;

struct AmfProperty;

class AmfValue
{
public:
    using Properties = std::vector<AmfProperty>;
    using Array = std::vector<AmfValue>;

    AmfValue();
    AmfValue(double n);
    AmfValue(bool b);
    AmfValue(std::string s);
    AmfValue(std::string_view s);
    AmfValue(const char *s);

    static AmfValue null();
    static AmfValue undefined();
    static AmfValue object();
    static AmfValue object(Properties properties);
    static AmfValue ecmaArray(Properties properties);
    static AmfValue strictArray(Array items);
    static AmfValue date(double ms, int16_t tz = 0);

    uint8_t type() const
    {
        return type_;
    }

    bool isNumber() const;
    bool isString() const;
    bool isObject() const;
    bool isNull() const;

    double number() const
    {
        return number_;
    }

    bool boolean() const
    {
        return boolean_;
    }

    int16_t timezone() const
    {
        return tz_;
    }

    const std::string &string() const
    {
        return string_;
    }

    const Properties &properties() const
    {
        return properties_;
    }

    const Array &array() const
    {
        return array_;
    }

    // Property lookup for objects and ECMA arrays, nullptr when absent.
    const AmfValue *get(std::string_view key) const;
    // String property or the fallback when absent or not a string.
    std::string_view getString(std::string_view key, std::string_view fallback = std::string_view()) const;
    void set(std::string key, AmfValue value);
    void push(AmfValue value);

    bool operator==(const AmfValue &o) const;
    bool operator!=(const AmfValue &o) const
    {
        return !(*this == o);
    }

    std::string toString() const;

private:
    friend class AmfDecoder;

    explicit AmfValue(uint8_t type, int);

    uint8_t type_;
    double number_{ 0 };
    bool boolean_{ false };
    int16_t tz_{ 0 };
    std::string string_;
    Properties properties_;
    Array array_;
};

struct AmfProperty {
    std::string key;
    AmfValue value;

    bool operator==(const AmfProperty &o) const
    {
        return key == o.key && value == o.value;
    }
};

class AmfDecoder
{
public:
    explicit AmfDecoder(std::string_view data);

    bool get(AmfValue &val);
    bool getAll(std::vector<AmfValue> &values);

    bool empty() const
    {
        return reader_.remaining() == 0;
    }

    // Human readable reason of the last failure, for logging.
    const std::string &error() const
    {
        return error_;
    }

private:
    bool get(AmfValue &val, int depth);
    bool getProperties(AmfValue::Properties &properties, int depth);
    bool getString(std::string &val);
    bool getLongString(std::string &val);
    bool fail(std::string reason);

private:
    ByteReader reader_;
    std::string error_;
};

class AmfEncoder
{
public:
    explicit AmfEncoder(Buffer &data);

    void put(const AmfValue &val);
    void putNumber(double val);
    void putString(std::string_view val);
    void putStringNoType(std::string_view val);
    void putLongString(std::string_view val);
    void putBool(bool val);
    void putNull();
    void putUndefined();
    void putDate(double ms, int16_t tz);
    void putObjectBegin();
    void putObjectValue(std::string_view k, std::string_view v);
    void putObjectValue(std::string_view k, double v);
    void putProperty(std::string_view k, const AmfValue &v);
    void putObjectEnd();

private:
    void putProperties(const AmfValue::Properties &properties);
    void putRaw(std::string_view v);

private:
    Buffer &data_;
};
}
