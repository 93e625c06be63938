#include "atv_messages.h"
#include <gtest/gtest.h>

using Bytes = std::vector<uint8_t>;
using atv::polo::OuterMessage;
using atv::polo::PairingEncoding;
using atv::remote::RemoteMessage;

TEST(Varint, EncodesMultiByteValues) {
    Bytes out;
    put_varint(out, 300);
    EXPECT_EQ(out, (Bytes{ 0xAC, 0x02 }));

    uint64_t v = 0;
    EXPECT_EQ(get_varint(out.data(), out.size(), v), 2u);
    EXPECT_EQ(v, 300u);
    EXPECT_EQ(get_varint(out.data(), 1, v), 0u);
}

TEST(Framer, ReassemblesSplitMessages) {
    Bytes a = frame_message({ 0x01, 0x02, 0x03 });
    Bytes b = frame_message(Bytes(200, 0x7F));
    Bytes stream = a;
    stream.insert(stream.end(), b.begin(), b.end());

    Framer framer;
    std::vector<Bytes> out;
    ASSERT_TRUE(framer.push(Bytes(stream.begin(), stream.begin() + 2), out));
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(framer.has_partial());

    // ends inside the two-byte length prefix of 'b'
    ASSERT_TRUE(framer.push(Bytes(stream.begin() + 2, stream.begin() + 5), out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (Bytes{ 0x01, 0x02, 0x03 }));

    ASSERT_TRUE(framer.push(Bytes(stream.begin() + 5, stream.end()), out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1], Bytes(200, 0x7F));
    EXPECT_FALSE(framer.has_partial());
}

TEST(Framer, RejectsOversizedLength) {
    Bytes prefix;
    put_varint(prefix, 10 * 1024 * 1024);
    Framer framer;
    std::vector<Bytes> out;
    EXPECT_FALSE(framer.push(prefix, out));
}

TEST(PairingMessages, RequestLayout) {
    EXPECT_EQ(serialize_message(make_pairing_request("atv", "sp")),
              (Bytes{ 0x08, 0x02, 0x10, 0xC8, 0x01,
                      0x52, 0x09,
                      0x0A, 0x03, 'a', 't', 'v',
                      0x12, 0x02, 's', 'p' }));
}

TEST(PairingMessages, OptionAsksForHexInputRole) {
    EXPECT_EQ(serialize_message(make_pairing_option()),
              (Bytes{ 0x08, 0x02, 0x10, 0xC8, 0x01,
                      0xA2, 0x01, 0x08,
                      0x0A, 0x04, 0x08, 0x03, 0x10, 0x06,
                      0x18, 0x01 }));
}

TEST(PairingMessages, ConfigurationLayout) {
    EXPECT_EQ(serialize_message(make_pairing_configuration(PairingEncoding::ENCODING_TYPE_HEXADECIMAL)),
              (Bytes{ 0x08, 0x02, 0x10, 0xC8, 0x01,
                      0xF2, 0x01, 0x08,
                      0x0A, 0x04, 0x08, 0x03, 0x10, 0x06,
                      0x10, 0x01 }));
}

TEST(PairingMessages, SecretLayout) {
    EXPECT_EQ(serialize_message(make_pairing_secret({ 0xAA, 0xBB })),
              (Bytes{ 0x08, 0x02, 0x10, 0xC8, 0x01,
                      0xC2, 0x02, 0x04,
                      0x0A, 0x02, 0xAA, 0xBB }));
}

TEST(PairingMessages, ParsesDeviceStatus) {
    OuterMessage reply;
    ASSERT_TRUE(parse_message({ 0x08, 0x02, 0x10, 0x92, 0x03 }, reply));
    EXPECT_EQ(reply.status(), OuterMessage::STATUS_BAD_SECRET);

    OuterMessage truncated;
    EXPECT_FALSE(parse_message({ 0x08 }, truncated));
}

TEST(PairingMessages, PreferredEncodingFromDeviceOption) {
    // output_encodings { type: NUMERIC, symbol_length: 6 }
    OuterMessage reply;
    ASSERT_TRUE(parse_message({ 0x08, 0x02, 0x10, 0xC8, 0x01,
                                0xA2, 0x01, 0x08,
                                0x12, 0x04, 0x08, 0x02, 0x10, 0x06,
                                0x18, 0x01 }, reply));
    EXPECT_EQ(preferred_encoding(reply), PairingEncoding::ENCODING_TYPE_NUMERIC);

    EXPECT_EQ(preferred_encoding(make_pairing_option()), PairingEncoding::ENCODING_TYPE_HEXADECIMAL);

    OuterMessage bare;
    bare.set_status(OuterMessage::STATUS_OK);
    EXPECT_EQ(preferred_encoding(bare), PairingEncoding::ENCODING_TYPE_HEXADECIMAL);
}

TEST(RemoteMessages, KeyInjectPlayPause) {
    EXPECT_EQ(serialize_message(make_remote_key_inject(85)),
              (Bytes{ 0x52, 0x04, 0x08, 0x55, 0x10, 0x03 }));
}

TEST(RemoteMessages, SetActiveCarriesFeatures) {
    EXPECT_EQ(serialize_message(make_remote_set_active()),
              (Bytes{ 0x12, 0x03, 0x08, 0xE3, 0x04 }));
}

TEST(RemoteMessages, PingResponseEchoesValue) {
    EXPECT_EQ(serialize_message(make_remote_ping_response(7)),
              (Bytes{ 0x4A, 0x02, 0x08, 0x07 }));
}

TEST(RemoteMessages, ConfigureCarriesDeviceInfo) {
    RemoteMessage msg = make_remote_configure("pkg", "1.0");
    ASSERT_EQ(msg.payload_case(), RemoteMessage::kRemoteConfigure);
    EXPECT_EQ(msg.remote_configure().code1(), REMOTE_FEATURES);
    EXPECT_EQ(msg.remote_configure().device_info().package_name(), "pkg");
    EXPECT_EQ(msg.remote_configure().device_info().app_version(), "1.0");
}

TEST(RemoteMessages, DeviceMessagesSelectPayload) {
    RemoteMessage ping;
    ASSERT_TRUE(parse_message({ 0x42, 0x02, 0x08, 0x05 }, ping));
    EXPECT_EQ(ping.payload_case(), RemoteMessage::kRemotePingRequest);
    EXPECT_EQ(ping.remote_ping_request().val1(), 5);

    RemoteMessage start;
    ASSERT_TRUE(parse_message({ 0xC2, 0x02, 0x00 }, start));
    EXPECT_EQ(start.payload_case(), RemoteMessage::kRemoteStart);

    // field 50 is not one this client handles
    RemoteMessage other;
    ASSERT_TRUE(parse_message({ 0x92, 0x03, 0x00 }, other));
    EXPECT_EQ(other.payload_case(), RemoteMessage::PAYLOAD_NOT_SET);

    RemoteMessage broken;
    EXPECT_FALSE(parse_message({ 0x42, 0x09, 0x08 }, broken));
}
