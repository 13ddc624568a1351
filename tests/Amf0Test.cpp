#include <gtest/gtest.h>
#include "Amf0.hpp"
#include "TestUtil.hpp"

using namespace rtmpingest;
using namespace rtmpingest::rtmp;

namespace {
AmfValue decodeOne(std::string_view bytes)
{
    AmfDecoder decoder(bytes);
    AmfValue v;
    EXPECT_TRUE(decoder.get(v)) << decoder.error();
    EXPECT_TRUE(decoder.empty());
    return v;
}

AmfValue reencode(const AmfValue &v)
{
    return decodeOne(test::amfBody({ v }));
}
}

TEST(Amf0, Number)
{
    Buffer b;
    AmfEncoder encoder(b);
    encoder.putNumber(1.0);
    EXPECT_EQ(b.stringView(), std::string_view("\x00\x3f\xf0\x00\x00\x00\x00\x00\x00", 9));
    AmfValue v = decodeOne(b.stringView());
    ASSERT_TRUE(v.isNumber());
    EXPECT_EQ(v.number(), 1.0);
}

TEST(Amf0, String)
{
    Buffer b;
    AmfEncoder encoder(b);
    encoder.putString("connect");
    EXPECT_EQ(b.stringView(), std::string_view("\x02\x00\x07" "connect", 10));
    AmfValue v = decodeOne(b.stringView());
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(v.string(), "connect");
}

TEST(Amf0, LongString)
{
    std::string s(70000, 'l');
    AmfValue v = reencode(AmfValue(s));
    EXPECT_EQ(v.type(), AMF0_LONG_STRING);
    EXPECT_TRUE(v.isString());
    EXPECT_EQ(v.string(), s);
}

TEST(Amf0, ScalarValues)
{
    EXPECT_EQ(reencode(AmfValue(true)), AmfValue(true));
    EXPECT_EQ(reencode(AmfValue(false)), AmfValue(false));
    EXPECT_EQ(reencode(AmfValue::null()), AmfValue::null());
    EXPECT_EQ(reencode(AmfValue::undefined()), AmfValue::undefined());
    EXPECT_EQ(reencode(AmfValue::date(1500000000000.0, -60)), AmfValue::date(1500000000000.0, -60));
    EXPECT_NE(AmfValue(1.0), AmfValue("1"));
}

TEST(Amf0, ConnectResultObjects)
{
    AmfValue props = AmfValue::object();
    props.set("fmsVer", AmfValue("FMS/3,0,1,123"));
    props.set("capabilities", AmfValue(31.0));
    AmfValue info = AmfValue::object();
    info.set("level", AmfValue("status"));
    info.set("code", AmfValue("NetConnection.Connect.Success"));
    info.set("description", AmfValue("Connection succeeded."));
    info.set("objectEncoding", AmfValue(0.0));

    std::vector<AmfValue> values = test::decodeAmf(test::amfBody({ AmfValue("_result"), AmfValue(1.0), props, info }));
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0].string(), "_result");
    EXPECT_EQ(values[2], props);
    EXPECT_EQ(values[3], info);
    EXPECT_EQ(values[3].getString("code"), "NetConnection.Connect.Success");
    EXPECT_EQ(values[3].get("objectEncoding")->number(), 0.0);
    EXPECT_EQ(values[3].get("missing"), nullptr);
}

TEST(Amf0, PropertyOrderIsKept)
{
    AmfValue obj = AmfValue::object();
    obj.set("b", AmfValue(2.0));
    obj.set("a", AmfValue(1.0));
    obj.set("b", AmfValue(3.0));
    ASSERT_EQ(obj.properties().size(), 2u);
    EXPECT_EQ(obj.properties()[0].key, "b");
    EXPECT_EQ(obj.properties()[0].value.number(), 3.0);
    AmfValue decoded = reencode(obj);
    EXPECT_EQ(decoded.properties()[1].key, "a");
}

TEST(Amf0, EcmaArrayReadsLikeObject)
{
    // onMetaData as sent by encoders, with a count that does not match
    Buffer b;
    b.putBE<uint8_t, 8>(AMF0_ECMA_ARRAY);
    b.putBE<uint32_t, 32>(0);
    AmfEncoder encoder(b);
    encoder.putObjectValue("width", 1280.0);
    encoder.putObjectValue("encoder", "obs-output module");
    encoder.putObjectEnd();
    AmfValue v = decodeOne(b.stringView());
    EXPECT_EQ(v.type(), AMF0_ECMA_ARRAY);
    EXPECT_TRUE(v.isObject());
    EXPECT_EQ(v.get("width")->number(), 1280.0);
    EXPECT_EQ(v.getString("encoder"), "obs-output module");
}

TEST(Amf0, XmlDocumentKeepsItsMarker)
{
    std::string bytes("\x0f\x00\x00\x00\x05<a/>x", 10);
    AmfValue v = decodeOne(bytes);
    EXPECT_EQ(v.type(), AMF0_XML_DOCUMENT);
    EXPECT_EQ(v.string(), "<a/>x");
    Buffer b;
    AmfEncoder encoder(b);
    encoder.put(v);
    EXPECT_EQ(b.stringView(), bytes);
}

TEST(Amf0, StrictArray)
{
    AmfValue array = AmfValue::strictArray({ AmfValue(1.0), AmfValue("two"), AmfValue::null() });
    AmfValue v = reencode(array);
    ASSERT_EQ(v.array().size(), 3u);
    EXPECT_EQ(v, array);
}

TEST(Amf0, StrictArrayCountBeyondPayload)
{
    Buffer b;
    b.putBE<uint8_t, 8>(AMF0_STRICT_ARRAY);
    b.putBE<uint32_t, 32>(0xFFFFFFFF);
    b.putBE<uint8_t, 8>(AMF0_NULL);
    AmfDecoder decoder(b.stringView());
    AmfValue v;
    EXPECT_FALSE(decoder.get(v));
    EXPECT_FALSE(decoder.error().empty());
}

TEST(Amf0, TypedObjectReadsAsObject)
{
    Buffer b;
    b.putBE<uint8_t, 8>(AMF0_TYPED_OBJECT);
    AmfEncoder encoder(b);
    encoder.putStringNoType("flash.Custom");
    encoder.putObjectValue("k", "v");
    encoder.putObjectEnd();
    AmfValue v = decodeOne(b.stringView());
    EXPECT_EQ(v.type(), AMF0_OBJECT);
    EXPECT_EQ(v.getString("k"), "v");
}

TEST(Amf0, RejectsReferencesAndUnsupported)
{
    const uint8_t markers[] = { AMF0_REFERENCE, AMF0_MOVIECLIP, AMF0_UNSUPPORTED, AMF0_RECORDSET,
                                AMF0_AVMPLUS, AMF0_OBJECT_END, 0x42
                              };
    for(uint8_t marker : markers) {
        std::string bytes(1, static_cast<char>(marker));
        bytes += std::string(2, '\0');
        AmfDecoder decoder(bytes);
        AmfValue v;
        EXPECT_FALSE(decoder.get(v)) << "marker " << (int)marker;
    }
}

TEST(Amf0, Truncated)
{
    std::string bytes = test::amfBody({ AmfValue("publish"), AmfValue(5.0) });
    for(std::size_t n = 1; n < bytes.size(); n++) {
        if(n == 10) {
            // "publish" alone is a complete value
            continue;
        }
        std::vector<AmfValue> values;
        AmfDecoder decoder(std::string_view(bytes).substr(0, n));
        EXPECT_FALSE(decoder.getAll(values)) << "length " << n;
    }
}

TEST(Amf0, MissingObjectEnd)
{
    Buffer b;
    AmfEncoder encoder(b);
    encoder.putObjectBegin();
    encoder.putObjectValue("app", "live");
    encoder.putStringNoType("");
    b.putBE<uint8_t, 8>(AMF0_NULL);
    AmfDecoder decoder(b.stringView());
    AmfValue v;
    EXPECT_FALSE(decoder.get(v));
}

TEST(Amf0, NestingLimit)
{
    std::string bytes;
    for(int i = 0; i < 100; i++) {
        bytes += std::string(1, static_cast<char>(AMF0_OBJECT)) + std::string("\x00\x01k", 3);
    }
    AmfDecoder decoder(bytes);
    AmfValue v;
    EXPECT_FALSE(decoder.get(v));
    EXPECT_EQ(decoder.error(), "nesting too deep");
}

TEST(Amf0, ToString)
{
    AmfValue obj = AmfValue::object();
    obj.set("app", AmfValue("live"));
    obj.set("ok", AmfValue(true));
    EXPECT_EQ(obj.toString(), "{app=live, ok=true}");
    EXPECT_EQ(AmfValue::null().toString(), "null");
}
