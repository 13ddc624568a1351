#include <cmath>
#include <cstring>
#include "Amf0.hpp"

namespace rtmpingest::rtmp {
constexpr int AMF0_MAX_DEPTH = 64;

AmfValue::AmfValue() : type_(AMF0_UNDEFINED)
{
}

AmfValue::AmfValue(uint8_t type, int) : type_(type)
{
}

AmfValue::AmfValue(double n) : type_(AMF0_NUMBER), number_(n)
{
}

AmfValue::AmfValue(bool b) : type_(AMF0_BOOLEAN), boolean_(b)
{
}

AmfValue::AmfValue(std::string s) : type_(AMF0_STRING), string_(std::move(s))
{
    if(string_.size() > 65535) {
        type_ = AMF0_LONG_STRING;
    }
}

AmfValue::AmfValue(std::string_view s) : AmfValue(std::string(s))
{
}

AmfValue::AmfValue(const char *s) : AmfValue(std::string(s))
{
}

AmfValue AmfValue::null()
{
    return AmfValue(AMF0_NULL, 0);
}

AmfValue AmfValue::undefined()
{
    return AmfValue(AMF0_UNDEFINED, 0);
}

AmfValue AmfValue::object()
{
    return AmfValue(AMF0_OBJECT, 0);
}

AmfValue AmfValue::object(Properties properties)
{
    AmfValue v(AMF0_OBJECT, 0);
    v.properties_ = std::move(properties);
    return v;
}

AmfValue AmfValue::ecmaArray(Properties properties)
{
    AmfValue v(AMF0_ECMA_ARRAY, 0);
    v.properties_ = std::move(properties);
    return v;
}

AmfValue AmfValue::strictArray(Array items)
{
    AmfValue v(AMF0_STRICT_ARRAY, 0);
    v.array_ = std::move(items);
    return v;
}

AmfValue AmfValue::date(double ms, int16_t tz)
{
    AmfValue v(AMF0_DATE, 0);
    v.number_ = ms;
    v.tz_ = tz;
    return v;
}

bool AmfValue::isNumber() const
{
    return type_ == AMF0_NUMBER;
}

bool AmfValue::isString() const
{
    return type_ == AMF0_STRING || type_ == AMF0_LONG_STRING;
}

// ECMA arrays are read the same way as objects
bool AmfValue::isObject() const
{
    return type_ == AMF0_OBJECT || type_ == AMF0_ECMA_ARRAY;
}

bool AmfValue::isNull() const
{
    return type_ == AMF0_NULL || type_ == AMF0_UNDEFINED;
}

const AmfValue *AmfValue::get(std::string_view key) const
{
    for(const auto &p : properties_) {
        if(p.key == key) {
            return &p.value;
        }
    }
    return nullptr;
}

std::string_view AmfValue::getString(std::string_view key, std::string_view fallback) const
{
    const AmfValue *v = get(key);
    if(v && v->isString()) {
        return v->string();
    }
    return fallback;
}

void AmfValue::set(std::string key, AmfValue value)
{
    for(auto &p : properties_) {
        if(p.key == key) {
            p.value = std::move(value);
            return;
        }
    }
    properties_.push_back(AmfProperty{ std::move(key), std::move(value) });
}

void AmfValue::push(AmfValue value)
{
    array_.push_back(std::move(value));
}

bool AmfValue::operator==(const AmfValue &o) const
{
    if(type_ != o.type_) {
        return false;
    }
    switch(type_) {
    case AMF0_NUMBER:
        return number_ == o.number_ || (std::isnan(number_) && std::isnan(o.number_));
    case AMF0_BOOLEAN:
        return boolean_ == o.boolean_;
    case AMF0_STRING:
    case AMF0_LONG_STRING:
    case AMF0_XML_DOCUMENT:
        return string_ == o.string_;
    case AMF0_DATE:
        return number_ == o.number_ && tz_ == o.tz_;
    case AMF0_OBJECT:
    case AMF0_ECMA_ARRAY:
        return properties_ == o.properties_;
    case AMF0_STRICT_ARRAY:
        return array_ == o.array_;
    default:
        return true;
    }
}

std::string AmfValue::toString() const
{
    switch(type_) {
    case AMF0_NUMBER:
        return std::to_string(number_);
    case AMF0_BOOLEAN:
        return boolean_ ? "true" : "false";
    case AMF0_STRING:
    case AMF0_LONG_STRING:
    case AMF0_XML_DOCUMENT:
        return string_;
    case AMF0_DATE:
        return std::to_string(number_) + ",tz=" + std::to_string(tz_);
    case AMF0_NULL:
        return "null";
    case AMF0_UNDEFINED:
        return "undefined";
    case AMF0_OBJECT:
    case AMF0_ECMA_ARRAY: {
        std::string s = "{";
        for(const auto &p : properties_) {
            if(s.size() > 1) {
                s += ", ";
            }
            s += p.key + "=" + p.value.toString();
        }
        return s + "}";
    }
    case AMF0_STRICT_ARRAY: {
        std::string s = "[";
        for(const auto &v : array_) {
            if(s.size() > 1) {
                s += ", ";
            }
            s += v.toString();
        }
        return s + "]";
    }
    default:
        return std::to_string(type_);
    }
}

AmfDecoder::AmfDecoder(std::string_view data) : reader_(data)
{
}

bool AmfDecoder::get(AmfValue &val)
{
    return get(val, 0);
}

bool AmfDecoder::getAll(std::vector<AmfValue> &values)
{
    while(!empty()) {
        AmfValue v;
        if(!get(v)) {
            return false;
        }
        values.push_back(std::move(v));
    }
    return true;
}

bool AmfDecoder::fail(std::string reason)
{
    error_ = std::move(reason);
    return false;
}

bool AmfDecoder::get(AmfValue &val, int depth)
{
    if(depth > AMF0_MAX_DEPTH) {
        return fail("nesting too deep");
    }
    uint8_t marker = 0;
    if(!reader_.getBE<uint8_t, 8>(marker)) {
        return fail("missing marker");
    }
    switch(marker) {
    case AMF0_NUMBER: {
        double n = 0;
        if(!reader_.getBE<double, 64>(n)) {
            return fail("truncated number");
        }
        val = AmfValue(n);
        return true;
    }
    case AMF0_BOOLEAN: {
        uint8_t b = 0;
        if(!reader_.getBE<uint8_t, 8>(b)) {
            return fail("truncated boolean");
        }
        val = AmfValue(b != 0);
        return true;
    }
    case AMF0_STRING: {
        std::string s;
        if(!getString(s)) {
            return false;
        }
        val = AmfValue(std::move(s));
        return true;
    }
    case AMF0_LONG_STRING: {
        std::string s;
        if(!getLongString(s)) {
            return false;
        }
        val = AmfValue(std::move(s));
        val.type_ = AMF0_LONG_STRING;
        return true;
    }
    case AMF0_XML_DOCUMENT: {
        std::string s;
        if(!getLongString(s)) {
            return false;
        }
        val = AmfValue(std::move(s));
        val.type_ = AMF0_XML_DOCUMENT;
        return true;
    }
    case AMF0_NULL:
        val = AmfValue::null();
        return true;
    case AMF0_UNDEFINED:
        val = AmfValue::undefined();
        return true;
    case AMF0_OBJECT: {
        val = AmfValue::object();
        return getProperties(val.properties_, depth);
    }
    case AMF0_TYPED_OBJECT: {
        // the class name is dropped, the body reads as a plain object
        std::string className;
        if(!getString(className)) {
            return false;
        }
        val = AmfValue::object();
        return getProperties(val.properties_, depth);
    }
    case AMF0_ECMA_ARRAY: {
        uint32_t count = 0;
        if(!reader_.getBE<uint32_t, 32>(count)) {
            return fail("truncated ecma array");
        }
        val = AmfValue::ecmaArray(AmfValue::Properties());
        return getProperties(val.properties_, depth);
    }
    case AMF0_STRICT_ARRAY: {
        uint32_t count = 0;
        if(!reader_.getBE<uint32_t, 32>(count)) {
            return fail("truncated strict array");
        }
        // every element takes at least its marker byte
        if(count > reader_.remaining()) {
            return fail("strict array count exceeds payload");
        }
        val = AmfValue::strictArray(AmfValue::Array());
        val.array_.reserve(count);
        for(uint32_t i = 0; i < count; i++) {
            AmfValue item;
            if(!get(item, depth + 1)) {
                return false;
            }
            val.array_.push_back(std::move(item));
        }
        return true;
    }
    case AMF0_DATE: {
        double ms = 0;
        int16_t tz = 0;
        if(!reader_.getBE<double, 64>(ms) || !reader_.getBE<int16_t, 16>(tz)) {
            return fail("truncated date");
        }
        val = AmfValue::date(ms, tz);
        return true;
    }
    case AMF0_REFERENCE:
        return fail("references are not supported");
    case AMF0_OBJECT_END:
        return fail("unexpected object end");
    case AMF0_MOVIECLIP:
    case AMF0_UNSUPPORTED:
    case AMF0_RECORDSET:
    case AMF0_AVMPLUS:
        return fail("unsupported marker " + std::to_string(marker));
    default:
        return fail("unknown marker " + std::to_string(marker));
    }
}

bool AmfDecoder::getProperties(AmfValue::Properties &properties, int depth)
{
    while(true) {
        std::string key;
        if(!getString(key)) {
            return false;
        }
        if(key.empty()) {
            std::string_view marker;
            if(reader_.get(marker, 1) && (uint8_t)marker[0] == AMF0_OBJECT_END) {
                return true;
            }
            return fail("missing object end");
        }
        AmfValue value;
        if(!get(value, depth + 1)) {
            return false;
        }
        properties.push_back(AmfProperty{ std::move(key), std::move(value) });
    }
}

bool AmfDecoder::getString(std::string &val)
{
    uint16_t len = 0;
    std::string_view s;
    if(!reader_.getBE<uint16_t, 16>(len) || !reader_.get(s, len)) {
        return fail("truncated string");
    }
    val.assign(s.data(), s.size());
    return true;
}

bool AmfDecoder::getLongString(std::string &val)
{
    uint32_t len = 0;
    std::string_view s;
    if(!reader_.getBE<uint32_t, 32>(len) || !reader_.get(s, len)) {
        return fail("truncated long string");
    }
    val.assign(s.data(), s.size());
    return true;
}

AmfEncoder::AmfEncoder(Buffer &data) : data_(data)
{
}

void AmfEncoder::put(const AmfValue &val)
{
    switch(val.type()) {
    case AMF0_NUMBER:
        putNumber(val.number());
        break;
    case AMF0_BOOLEAN:
        putBool(val.boolean());
        break;
    case AMF0_STRING:
        putString(val.string());
        break;
    case AMF0_LONG_STRING:
        putLongString(val.string());
        break;
    case AMF0_XML_DOCUMENT:
        data_.putBE<uint8_t, 8>(AMF0_XML_DOCUMENT);
        data_.putBE<uint32_t, 32>(val.string().size());
        putRaw(val.string());
        break;
    case AMF0_NULL:
        putNull();
        break;
    case AMF0_OBJECT:
        putObjectBegin();
        putProperties(val.properties());
        putObjectEnd();
        break;
    case AMF0_ECMA_ARRAY:
        data_.putBE<uint8_t, 8>(AMF0_ECMA_ARRAY);
        data_.putBE<uint32_t, 32>(val.properties().size());
        putProperties(val.properties());
        putObjectEnd();
        break;
    case AMF0_STRICT_ARRAY:
        data_.putBE<uint8_t, 8>(AMF0_STRICT_ARRAY);
        data_.putBE<uint32_t, 32>(val.array().size());
        for(const auto &item : val.array()) {
            put(item);
        }
        break;
    case AMF0_DATE:
        putDate(val.number(), val.timezone());
        break;
    default:
        putUndefined();
        break;
    }
}

void AmfEncoder::putNumber(double val)
{
    data_.putBE<uint8_t, 8>(AMF0_NUMBER);
    data_.putBE<double, 64>(val);
}

void AmfEncoder::putString(std::string_view val)
{
    if(val.size() > 65535) {
        return putLongString(val);
    } else {
        data_.putBE<uint8_t, 8>(AMF0_STRING);
        data_.putBE<uint16_t, 16>(val.size());
        putRaw(val);
    }
}

void AmfEncoder::putStringNoType(std::string_view val)
{
    data_.putBE<uint16_t, 16>(val.size());
    putRaw(val);
}

void AmfEncoder::putLongString(std::string_view val)
{
    data_.putBE<uint8_t, 8>(AMF0_LONG_STRING);
    data_.putBE<uint32_t, 32>(val.size());
    putRaw(val);
}

void AmfEncoder::putBool(bool val)
{
    data_.putBE<uint8_t, 8>(AMF0_BOOLEAN);
    data_.putBE<uint8_t, 8>((val ? 1 : 0));
}

void AmfEncoder::putNull()
{
    data_.putBE<uint8_t, 8>(AMF0_NULL);
}

void AmfEncoder::putUndefined()
{
    data_.putBE<uint8_t, 8>(AMF0_UNDEFINED);
}

void AmfEncoder::putDate(double ms, int16_t tz)
{
    data_.putBE<uint8_t, 8>(AMF0_DATE);
    data_.putBE<double, 64>(ms);
    data_.putBE<int16_t, 16>(tz);
}

void AmfEncoder::putObjectBegin()
{
    data_.putBE<uint8_t, 8>(AMF0_OBJECT);
}

void AmfEncoder::putObjectValue(std::string_view k, std::string_view v)
{
    putStringNoType(k);
    putString(v);
}

void AmfEncoder::putObjectValue(std::string_view k, double v)
{
    putStringNoType(k);
    putNumber(v);
}

void AmfEncoder::putProperty(std::string_view k, const AmfValue &v)
{
    putStringNoType(k);
    put(v);
}

void AmfEncoder::putObjectEnd()
{
    data_.putBE<uint16_t, 16>(0); // empty string
    data_.putBE<uint8_t, 8>(AMF0_OBJECT_END);
}

void AmfEncoder::putProperties(const AmfValue::Properties &properties)
{
    for(const auto &p : properties) {
        putProperty(p.key, p.value);
    }
}

void AmfEncoder::putRaw(std::string_view v)
{
    data_.append(v);
}
}
