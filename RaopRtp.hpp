#ifndef AIRSTREAM_RAOP_RTP_HPP
#define AIRSTREAM_RAOP_RTP_HPP

#include "ASClock.hpp"
#include "ASUtils.hpp"
#include <boost/endian/conversion.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace AirStream {
namespace Raop {

constexpr uint32_t kFramesPerPacket = 352;
constexpr uint32_t kLatencyMin = 11025;
constexpr size_t kBacklogSize = 512;
constexpr size_t kAesKeySize = 16;
constexpr size_t kAesBlockSize = 16;

// RTP/RTCP
constexpr uint8_t kRtpVersionByte = 0x80;
constexpr uint8_t kRtpExtensionBit = 0x10;
constexpr uint8_t kRtpMarkerBit = 0x80;
constexpr size_t kRtpHeaderSize = 12;

enum class PayloadType : uint8_t {
    TimingRequest = 0x52,
    TimingReply = 0x53,
    Sync = 0x54,
    RetransmitRequest = 0x55,
    RetransmitReply = 0x56,
    Audio = 0x60
};

enum class Codec { PCM, ALACRaw };
enum class Crypto { Clear, RSA };

inline const char *CodecToString(Codec codec) {
    return codec == Codec::ALACRaw ? "ALAC" : "PCM";
}

// Modular Arithmetic Helpers
inline bool Mod32_LT(uint32_t a, uint32_t b) { return (int32_t)(a - b) < 0; }
inline bool Mod32_LE(uint32_t a, uint32_t b) { return (int32_t)(a - b) <= 0; }
inline bool Mod16_LT(uint16_t a, uint16_t b) { return (int16_t)(a - b) < 0; }
inline bool Mod16_LE(uint16_t a, uint16_t b) { return (int16_t)(a - b) <= 0; }

#pragma pack(push, 1)

struct RtpAudioHeader {
    uint8_t proto;          // 0x80
    uint8_t type;           // 0x60, marker set on first packet
    uint16_t sequenceNumber;
    uint32_t timestamp;
    uint32_t ssrc;

    void hton() {
        sequenceNumber = boost::endian::native_to_big(sequenceNumber);
        timestamp = boost::endian::native_to_big(timestamp);
        ssrc = boost::endian::native_to_big(ssrc);
    }
    void ntoh() {
        sequenceNumber = boost::endian::big_to_native(sequenceNumber);
        timestamp = boost::endian::big_to_native(timestamp);
        ssrc = boost::endian::big_to_native(ssrc);
    }
};
static_assert(sizeof(RtpAudioHeader) == kRtpHeaderSize, "Incorrect RtpAudioHeader size");

// Sent on the control port: maps an RTP timestamp onto NTP time
struct RtpSyncPacket {
    uint8_t proto;            // 0x80, extension bit set on the first one
    uint8_t type;             // 0xD4
    uint16_t sequenceNumber;  // always 7
    uint32_t rtpTimestampLatency; // rtp time now minus latency
    uint32_t ntpHi;
    uint32_t ntpLo;
    uint32_t rtpTimestamp;    // rtp time now

    void hton() {
        sequenceNumber = boost::endian::native_to_big(sequenceNumber);
        rtpTimestampLatency = boost::endian::native_to_big(rtpTimestampLatency);
        ntpHi = boost::endian::native_to_big(ntpHi);
        ntpLo = boost::endian::native_to_big(ntpLo);
        rtpTimestamp = boost::endian::native_to_big(rtpTimestamp);
    }
    void ntoh() {
        sequenceNumber = boost::endian::big_to_native(sequenceNumber);
        rtpTimestampLatency = boost::endian::big_to_native(rtpTimestampLatency);
        ntpHi = boost::endian::big_to_native(ntpHi);
        ntpLo = boost::endian::big_to_native(ntpLo);
        rtpTimestamp = boost::endian::big_to_native(rtpTimestamp);
    }
};
static_assert(sizeof(RtpSyncPacket) == 20, "Incorrect RtpSyncPacket size");

// Timing request (0xD2) from the receiver and our reply (0xD3)
struct RtcpTimeSyncPacket {
    uint8_t proto;
    uint8_t type;
    uint16_t sequenceNumber;
    uint32_t padding;
    uint32_t ntpOriginateHi; // T1: request transmit time, copied into the reply
    uint32_t ntpOriginateLo;
    uint32_t ntpReceiveHi;   // T2
    uint32_t ntpReceiveLo;
    uint32_t ntpTransmitHi;  // T3
    uint32_t ntpTransmitLo;

    void hton() {
        sequenceNumber = boost::endian::native_to_big(sequenceNumber);
        ntpOriginateHi = boost::endian::native_to_big(ntpOriginateHi);
        ntpOriginateLo = boost::endian::native_to_big(ntpOriginateLo);
        ntpReceiveHi = boost::endian::native_to_big(ntpReceiveHi);
        ntpReceiveLo = boost::endian::native_to_big(ntpReceiveLo);
        ntpTransmitHi = boost::endian::native_to_big(ntpTransmitHi);
        ntpTransmitLo = boost::endian::native_to_big(ntpTransmitLo);
    }
    void ntoh() {
        sequenceNumber = boost::endian::big_to_native(sequenceNumber);
        ntpOriginateHi = boost::endian::big_to_native(ntpOriginateHi);
        ntpOriginateLo = boost::endian::big_to_native(ntpOriginateLo);
        ntpReceiveHi = boost::endian::big_to_native(ntpReceiveHi);
        ntpReceiveLo = boost::endian::big_to_native(ntpReceiveLo);
        ntpTransmitHi = boost::endian::big_to_native(ntpTransmitHi);
        ntpTransmitLo = boost::endian::big_to_native(ntpTransmitLo);
    }
};
static_assert(sizeof(RtcpTimeSyncPacket) == 32, "Incorrect RtcpTimeSyncPacket size");

struct RtcpRetransmitRequestPacket {
    uint8_t proto;
    uint8_t type;        // 0xD5
    uint16_t sequenceNumber;
    uint16_t seqStart;
    uint16_t seqCount;

    void ntoh() {
        sequenceNumber = boost::endian::big_to_native(sequenceNumber);
        seqStart = boost::endian::big_to_native(seqStart);
        seqCount = boost::endian::big_to_native(seqCount);
    }
};
static_assert(sizeof(RtcpRetransmitRequestPacket) == 8,
              "Incorrect RtcpRetransmitRequestPacket size");

#pragma pack(pop)

// --- Packet builders ---
// Inputs are in host order; the packets come back ready for the wire.

std::vector<uint8_t> buildAudioPacket(uint16_t seq, uint32_t timestamp, uint32_t ssrc,
                                      bool first, std::span<const uint8_t> payload);

RtpSyncPacket buildSyncPacket(uint32_t rtpNow, uint32_t latency, Clock::NtpTime now,
                              bool first);

RtcpTimeSyncPacket buildTimingReply(const RtcpTimeSyncPacket &request,
                                    Clock::NtpTime receivedAt, Clock::NtpTime now);

// Retransmit reply: 0x80 0xD6 0x00 0x01 followed by the original packet
std::vector<uint8_t> buildRetransmitReply(std::span<const uint8_t> original);

// --- Payload encoding ---

// Little-endian 16-bit interleaved PCM to big-endian L16
std::vector<uint8_t> encodePcm(std::span<const uint8_t> pcm);

// Uncompressed ALAC frame for 16-bit stereo. The "has size" flag and a 32-bit
// frame count are written when the chunk is not a full packet.
std::vector<uint8_t> encodeAlacRaw(std::span<const uint8_t> pcm,
                                   uint32_t framesPerPacket = kFramesPerPacket);

// AES-128-CBC session cipher. Only whole 16-byte blocks are encrypted; any
// trailing partial block goes out in clear. Every packet restarts from the
// session IV.
class AudioCryptor {
public:
    // Random key and IV
    AudioCryptor();
    AudioCryptor(const std::array<uint8_t, kAesKeySize> &key,
                 const std::array<uint8_t, kAesBlockSize> &iv);

    bool encrypt(uint8_t *data, size_t size) const;

    // RSA-OAEP wrapped session key for the rsaaeskey SDP attribute
    std::vector<uint8_t> wrapKey(EVP_PKEY *publicKey) const;

    const std::array<uint8_t, kAesKeySize> &key() const { return key_; }
    const std::array<uint8_t, kAesBlockSize> &iv() const { return iv_; }

    // Throws std::runtime_error if the PEM public key can not be loaded
    static Utils::EvpPkeyPtr loadPublicKey(const std::string &pemPath);

private:
    std::array<uint8_t, kAesKeySize> key_{};
    std::array<uint8_t, kAesBlockSize> iv_{};
};

// --- RTSP helpers ---

struct SdpParams {
    std::string sessionId;
    std::string localAddress;
    std::string remoteAddress;
    Codec codec = Codec::PCM;
    uint32_t framesPerPacket = kFramesPerPacket;
    uint32_t sampleRate = Clock::kDefaultSampleRate;
    uint8_t sampleSize = 16;
    uint8_t channels = 2;
    std::string rsaAesKey; // base64, empty when clear
    std::string aesIv;     // base64, empty when clear
};

std::string buildAnnounceSdp(const SdpParams &params);

struct TransportPorts {
    uint16_t server = 0;
    uint16_t control = 0;
    uint16_t timing = 0;
};

// Reads server_port, control_port and timing_port from a SETUP response
std::optional<TransportPorts> parseTransportHeader(const std::string &value);

// Reads the Audio-Latency header value, nullopt if absent or not a number
std::optional<uint32_t> parseAudioLatency(const std::optional<std::string> &value);

struct AuthChallenge {
    enum class Scheme { Basic, Digest };
    Scheme scheme = Scheme::Digest;
    std::string realm;
    std::string nonce;
};

std::optional<AuthChallenge> parseAuthenticate(const std::string &value);

std::string buildAuthorization(const AuthChallenge &challenge, const std::string &user,
                               const std::string &password, const std::string &method,
                               const std::string &uri);

} // namespace Raop
} // namespace AirStream

#endif // AIRSTREAM_RAOP_RTP_HPP
