#include "ASUtils.hpp"
#include "RaopClient.hpp"
#include "RaopRtp.hpp"
#include <gtest/gtest.h>
#include <cstring>
#include <openssl/evp.h>

using namespace AirStream;
using namespace AirStream::Raop;

namespace {
template <typename T> std::vector<uint8_t> wire(const T &pkt) {
    std::vector<uint8_t> out(sizeof(T));
    std::memcpy(out.data(), &pkt, sizeof(T));
    return out;
}
} // namespace

TEST(RaopPackets, AudioHeaderLayout) {
    std::vector<uint8_t> payload = {0xAA, 0xBB};
    auto packet = buildAudioPacket(0x1234, 0x01020304, 0xCAFEBABE, false, payload);
    std::vector<uint8_t> expected = {0x80, 0x60, 0x12, 0x34, 0x01, 0x02, 0x03,
                                     0x04, 0xCA, 0xFE, 0xBA, 0xBE, 0xAA, 0xBB};
    EXPECT_EQ(packet, expected);

    auto first = buildAudioPacket(1, 2, 3, true, payload);
    EXPECT_EQ(first[1], 0xE0);
}

TEST(RaopPackets, SyncPacketLayout) {
    Clock::NtpTime now = Clock::makeNtp(0x11223344u, 0x55667788u);
    auto bytes = wire(buildSyncPacket(50000, 11025, now, true));
    std::vector<uint8_t> expected = {0x90, 0xD4, 0x00, 0x07,             // header
                                     0x00, 0x00, 0x98, 0x3F,             // 50000 - 11025
                                     0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88,
                                     0x00, 0x00, 0xC3, 0x50};            // 50000
    EXPECT_EQ(bytes, expected);

    auto later = wire(buildSyncPacket(50000, 11025, now, false));
    EXPECT_EQ(later[0], 0x80);
}

TEST(RaopPackets, SyncLatencyWrapsAround) {
    RtpSyncPacket pkt = buildSyncPacket(100, 11025, 0, false);
    pkt.ntoh();
    EXPECT_EQ(pkt.rtpTimestampLatency, uint32_t(100) - 11025u);
    EXPECT_EQ(pkt.rtpTimestamp, 100u);
}

TEST(RaopPackets, TimingReplyEchoesRequest) {
    RtcpTimeSyncPacket request{};
    request.proto = 0x80;
    request.type = 0xD2;
    request.sequenceNumber = 7;
    request.ntpTransmitHi = 0xAABBCCDD;
    request.ntpTransmitLo = 0x01020304;

    Clock::NtpTime received = Clock::makeNtp(100, 1);
    Clock::NtpTime now = Clock::makeNtp(100, 2);
    RtcpTimeSyncPacket reply = buildTimingReply(request, received, now);
    EXPECT_EQ(reply.type, 0xD3);
    reply.ntoh();
    EXPECT_EQ(reply.sequenceNumber, 7);
    EXPECT_EQ(reply.ntpOriginateHi, 0xAABBCCDDu);
    EXPECT_EQ(reply.ntpOriginateLo, 0x01020304u);
    EXPECT_EQ(reply.ntpReceiveHi, 100u);
    EXPECT_EQ(reply.ntpReceiveLo, 1u);
    EXPECT_EQ(reply.ntpTransmitHi, 100u);
    EXPECT_EQ(reply.ntpTransmitLo, 2u);
}

TEST(RaopPackets, RetransmitReplyWrapsOriginal) {
    std::vector<uint8_t> original = {0x80, 0x60, 0x00, 0x05};
    auto reply = buildRetransmitReply(original);
    std::vector<uint8_t> expected = {0x80, 0xD6, 0x00, 0x01, 0x80, 0x60, 0x00, 0x05};
    EXPECT_EQ(reply, expected);
}

TEST(RaopPayload, PcmIsByteSwapped) {
    std::vector<uint8_t> pcm = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> expected = {0x02, 0x01, 0x04, 0x03};
    EXPECT_EQ(encodePcm(pcm), expected);
}

TEST(RaopPayload, AlacFullPacketHasNoSize) {
    std::vector<uint8_t> pcm(kFramesPerPacket * 4, 0);
    pcm[0] = 0x34; // left low
    pcm[1] = 0x92; // left high
    auto frame = encodeAlacRaw(pcm);
    // 23 header bits + 352 * 32 sample bits
    EXPECT_EQ(frame.size(), 1411u);
    EXPECT_EQ(frame[0], 0x20);
    EXPECT_EQ(frame[1], 0x00);
    EXPECT_EQ(frame[2], 0x02 | 0x01);
    // Remaining 7 bits of 0x92, then the first bit of 0x34
    EXPECT_EQ(frame[3], static_cast<uint8_t>((0x92 << 1) | (0x34 >> 7)));
}

TEST(RaopPayload, AlacShortPacketCarriesFrameCount) {
    std::vector<uint8_t> pcm(20 * 4, 0);
    auto frame = encodeAlacRaw(pcm);
    // 23 header bits + 32 size bits + 20 * 32 sample bits
    EXPECT_EQ(frame.size(), (23u + 32u + 20u * 32u + 7u) / 8u);
    EXPECT_EQ(frame[2], 0x10 | 0x02);
    // 32-bit count of 20 starts at bit 23, its low 7 bits lead byte 6
    EXPECT_EQ(frame[5], 0x00);
    EXPECT_EQ(frame[6], 20 << 1);
}

TEST(RaopCrypto, EncryptsWholeBlocksOnly) {
    std::array<uint8_t, kAesKeySize> key{};
    std::array<uint8_t, kAesBlockSize> iv{};
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(i);
        iv[i] = static_cast<uint8_t>(0xF0 + i);
    }
    AudioCryptor cryptor(key, iv);

    std::vector<uint8_t> data(40);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 3);
    }
    std::vector<uint8_t> original = data;
    ASSERT_TRUE(cryptor.encrypt(data.data(), data.size()));

    // Tail of 8 bytes goes out in clear
    EXPECT_TRUE(std::equal(data.begin() + 32, data.end(), original.begin() + 32));
    EXPECT_FALSE(std::equal(data.begin(), data.begin() + 32, original.begin()));

    // Decrypting the first 32 bytes with the same key and IV restores them
    Utils::EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    ASSERT_EQ(EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()), 1);
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);
    std::vector<uint8_t> plain(32);
    int len = 0;
    ASSERT_EQ(EVP_DecryptUpdate(ctx.get(), plain.data(), &len, data.data(), 32), 1);
    EXPECT_EQ(len, 32);
    EXPECT_TRUE(std::equal(plain.begin(), plain.end(), original.begin()));

    // Every packet starts again from the session IV
    std::vector<uint8_t> again = original;
    ASSERT_TRUE(cryptor.encrypt(again.data(), again.size()));
    EXPECT_EQ(again, data);
}

TEST(RaopCrypto, ShortPayloadUntouched) {
    AudioCryptor cryptor;
    std::vector<uint8_t> data = {1, 2, 3};
    ASSERT_TRUE(cryptor.encrypt(data.data(), data.size()));
    EXPECT_EQ(data, (std::vector<uint8_t>{1, 2, 3}));
}

TEST(RaopCrypto, MissingKeyFileThrows) {
    EXPECT_THROW(AudioCryptor::loadPublicKey("/nonexistent/receiver.pem"), std::runtime_error);
}

TEST(RaopSdp, PcmAnnounce) {
    SdpParams params;
    params.sessionId = "3413821438";
    params.localAddress = "192.168.1.10";
    params.remoteAddress = "192.168.1.20";
    std::string sdp = buildAnnounceSdp(params);
    EXPECT_EQ(sdp, "v=0\r\n"
                   "o=iTunes 3413821438 0 IN IP4 192.168.1.10\r\n"
                   "s=iTunes\r\n"
                   "c=IN IP4 192.168.1.20\r\n"
                   "t=0 0\r\n"
                   "m=audio 0 RTP/AVP 96\r\n"
                   "a=rtpmap:96 L16/44100/2\r\n");
}

TEST(RaopSdp, AlacAnnounceWithKey) {
    SdpParams params;
    params.codec = Codec::ALACRaw;
    params.rsaAesKey = "KEY";
    params.aesIv = "IV";
    std::string sdp = buildAnnounceSdp(params);
    EXPECT_NE(sdp.find("a=rtpmap:96 AppleLossless\r\n"), std::string::npos);
    EXPECT_NE(sdp.find("a=fmtp:96 352 0 16 40 10 14 2 255 0 0 44100\r\n"), std::string::npos);
    EXPECT_NE(sdp.find("a=rsaaeskey:KEY\r\na=aesiv:IV\r\n"), std::string::npos);
}

TEST(RaopRtsp, TransportHeader) {
    auto ports = parseTransportHeader(
        "RTP/AVP/UDP;unicast;mode=record;server_port=6000;control_port=6001;timing_port=6002");
    ASSERT_TRUE(ports.has_value());
    EXPECT_EQ(ports->server, 6000);
    EXPECT_EQ(ports->control, 6001);
    EXPECT_EQ(ports->timing, 6002);

    auto bare = parseTransportHeader("RTP/AVP/UDP;unicast;server_port=53561");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->control, 0);

    EXPECT_FALSE(parseTransportHeader("RTP/AVP/UDP;unicast;control_port=6001").has_value());
}

TEST(RaopRtsp, AudioLatency) {
    EXPECT_EQ(parseAudioLatency(std::string("11025")), 11025u);
    EXPECT_FALSE(parseAudioLatency(std::nullopt).has_value());
    EXPECT_FALSE(parseAudioLatency(std::string("abc")).has_value());
    EXPECT_FALSE(parseAudioLatency(std::string("12x")).has_value());
}

TEST(RaopAuth, DigestResponse) {
    auto challenge = parseAuthenticate("Digest realm=\"raop\", nonce=\"abc123\"");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->scheme, AuthChallenge::Scheme::Digest);
    EXPECT_EQ(challenge->realm, "raop");
    EXPECT_EQ(challenge->nonce, "abc123");

    std::string header = buildAuthorization(*challenge, "iTunes", "secret", "ANNOUNCE",
                                            "rtsp://1.2.3.4/1");
    std::string ha1 = Utils::md5Hex("iTunes:raop:secret");
    std::string ha2 = Utils::md5Hex("ANNOUNCE:rtsp://1.2.3.4/1");
    std::string response = Utils::md5Hex(ha1 + ":abc123:" + ha2);
    EXPECT_EQ(header, "Digest username=\"iTunes\", realm=\"raop\", nonce=\"abc123\", "
                      "uri=\"rtsp://1.2.3.4/1\", response=\"" + response + "\"");
}

TEST(RaopAuth, BasicCredentials) {
    auto challenge = parseAuthenticate("Basic realm=\"raop\"");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->scheme, AuthChallenge::Scheme::Basic);
    EXPECT_EQ(buildAuthorization(*challenge, "iTunes", "pw", "OPTIONS", "*"),
              "Basic aVR1bmVzOnB3");
}

TEST(RaopAuth, UnknownScheme) {
    EXPECT_FALSE(parseAuthenticate("Bearer token").has_value());
    EXPECT_FALSE(parseAuthenticate("Digest realm=\"raop\"").has_value());
}

TEST(RaopUtils, Base64AndMd5) {
    const uint8_t data[] = {'a', 'b'};
    EXPECT_EQ(Utils::base64Encode(data, 2), "YWI");
    EXPECT_EQ(Utils::base64Encode(data, 2, true), "YWI=");
    EXPECT_EQ(Utils::md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(Utils::clientInstanceId().size(), 16u);
}

TEST(RaopClientVolume, PercentToDecibels) {
    EXPECT_FLOAT_EQ(RaopClient::floatVolume(0), -144.0f);
    EXPECT_FLOAT_EQ(RaopClient::floatVolume(50), -15.0f);
    EXPECT_FLOAT_EQ(RaopClient::floatVolume(100), 0.0f);
    EXPECT_FLOAT_EQ(RaopClient::floatVolume(150), 0.0f);
    EXPECT_FLOAT_EQ(RaopClient::floatVolume(-5), -144.0f);
}

TEST(RaopSequence, ModularComparisons) {
    EXPECT_TRUE(Mod32_LT(0xFFFFFFF0u, 0x10u));
    EXPECT_FALSE(Mod32_LT(0x10u, 0xFFFFFFF0u));
    EXPECT_TRUE(Mod16_LE(0xFFFF, 0x0000));
}
