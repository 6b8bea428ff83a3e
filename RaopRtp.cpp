#include "RaopRtp.hpp"
#include "logger.hpp"
#include <cstring>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <sstream>
#include <stdexcept>

namespace AirStream {
namespace Raop {

namespace {

// MSB-first bit packer for the ALAC frame
class BitWriter {
public:
    explicit BitWriter(std::vector<uint8_t> &out) : out_(out) {}

    void write(uint32_t value, int bits) {
        for (int i = bits - 1; i >= 0; --i) {
            if (bitPos_ == 0) {
                out_.push_back(0);
            }
            if ((value >> i) & 1u) {
                out_.back() |= static_cast<uint8_t>(0x80u >> bitPos_);
            }
            bitPos_ = (bitPos_ + 1) & 7;
        }
    }

private:
    std::vector<uint8_t> &out_;
    int bitPos_ = 0;
};

std::string attribute(const std::string &value, const std::string &name) {
    std::string key = name + "=";
    size_t pos = value.find(key);
    while (pos != std::string::npos) {
        // Match whole keys only ("port=" must not hit "server_port=")
        if (pos == 0 || value[pos - 1] == ';' || value[pos - 1] == ' ' ||
            value[pos - 1] == ',') {
            break;
        }
        pos = value.find(key, pos + 1);
    }
    if (pos == std::string::npos) {
        return {};
    }
    pos += key.size();
    size_t end = value.find_first_of(";,", pos);
    std::string out = value.substr(pos, end == std::string::npos ? std::string::npos
                                                                 : end - pos);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::optional<uint16_t> parsePort(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        unsigned long port = std::stoul(text);
        if (port == 0 || port > 0xFFFF) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(port);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

} // namespace

std::vector<uint8_t> buildAudioPacket(uint16_t seq, uint32_t timestamp, uint32_t ssrc,
                                      bool first, std::span<const uint8_t> payload) {
    RtpAudioHeader header{};
    header.proto = kRtpVersionByte;
    header.type = static_cast<uint8_t>(PayloadType::Audio) | (first ? kRtpMarkerBit : 0);
    header.sequenceNumber = seq;
    header.timestamp = timestamp;
    header.ssrc = ssrc;
    header.hton();

    std::vector<uint8_t> packet(sizeof(header) + payload.size());
    std::memcpy(packet.data(), &header, sizeof(header));
    if (!payload.empty()) {
        std::memcpy(packet.data() + sizeof(header), payload.data(), payload.size());
    }
    return packet;
}

RtpSyncPacket buildSyncPacket(uint32_t rtpNow, uint32_t latency, Clock::NtpTime now,
                              bool first) {
    RtpSyncPacket pkt{};
    pkt.proto = kRtpVersionByte | (first ? kRtpExtensionBit : 0);
    pkt.type = static_cast<uint8_t>(PayloadType::Sync) | kRtpMarkerBit;
    pkt.sequenceNumber = 7;
    pkt.rtpTimestampLatency = rtpNow - latency;
    pkt.ntpHi = Clock::ntpSeconds(now);
    pkt.ntpLo = Clock::ntpFraction(now);
    pkt.rtpTimestamp = rtpNow;
    pkt.hton();
    return pkt;
}

RtcpTimeSyncPacket buildTimingReply(const RtcpTimeSyncPacket &request,
                                    Clock::NtpTime receivedAt, Clock::NtpTime now) {
    RtcpTimeSyncPacket reply{};
    reply.proto = request.proto;
    reply.type = static_cast<uint8_t>(PayloadType::TimingReply) | kRtpMarkerBit;
    reply.sequenceNumber = request.sequenceNumber;
    reply.ntpOriginateHi = request.ntpTransmitHi;
    reply.ntpOriginateLo = request.ntpTransmitLo;
    reply.ntpReceiveHi = Clock::ntpSeconds(receivedAt);
    reply.ntpReceiveLo = Clock::ntpFraction(receivedAt);
    reply.ntpTransmitHi = Clock::ntpSeconds(now);
    reply.ntpTransmitLo = Clock::ntpFraction(now);
    reply.hton();
    return reply;
}

std::vector<uint8_t> buildRetransmitReply(std::span<const uint8_t> original) {
    std::vector<uint8_t> reply;
    reply.reserve(4 + original.size());
    reply.push_back(kRtpVersionByte);
    reply.push_back(static_cast<uint8_t>(PayloadType::RetransmitReply) | kRtpMarkerBit);
    reply.push_back(0x00);
    reply.push_back(0x01);
    reply.insert(reply.end(), original.begin(), original.end());
    return reply;
}

std::vector<uint8_t> encodePcm(std::span<const uint8_t> pcm) {
    std::vector<uint8_t> out(pcm.size() & ~size_t(1));
    for (size_t i = 0; i + 1 < pcm.size(); i += 2) {
        out[i] = pcm[i + 1];
        out[i + 1] = pcm[i];
    }
    return out;
}

std::vector<uint8_t> encodeAlacRaw(std::span<const uint8_t> pcm, uint32_t framesPerPacket) {
    const uint32_t frames = static_cast<uint32_t>(pcm.size() / 4);
    const bool hasSize = frames != framesPerPacket;

    std::vector<uint8_t> out;
    out.reserve(8 + frames * 4 + 1);
    BitWriter bits(out);

    bits.write(1, 3); // channels - 1: stereo
    bits.write(0, 4);
    bits.write(0, 8);
    bits.write(0, 4);
    bits.write(hasSize ? 1 : 0, 1);
    bits.write(0, 2); // no wasted bytes
    bits.write(1, 1); // not compressed
    if (hasSize) {
        bits.write(frames, 32);
    }

    for (uint32_t i = 0; i < frames; ++i) {
        const uint8_t *frame = pcm.data() + i * 4;
        // Little-endian in, most significant byte first out
        bits.write(frame[1], 8);
        bits.write(frame[0], 8);
        bits.write(frame[3], 8);
        bits.write(frame[2], 8);
    }
    return out;
}

AudioCryptor::AudioCryptor() {
    auto key = Utils::randomBytes(kAesKeySize);
    auto iv = Utils::randomBytes(kAesBlockSize);
    std::copy(key.begin(), key.end(), key_.begin());
    std::copy(iv.begin(), iv.end(), iv_.begin());
}

AudioCryptor::AudioCryptor(const std::array<uint8_t, kAesKeySize> &key,
                           const std::array<uint8_t, kAesBlockSize> &iv)
    : key_(key), iv_(iv) {}

bool AudioCryptor::encrypt(uint8_t *data, size_t size) const {
    const size_t whole = size - (size % kAesBlockSize);
    if (whole == 0) {
        return true;
    }

    Utils::EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        LOG_ERROR("Failed to allocate cipher context");
        return false;
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key_.data(),
                           iv_.data()) != 1) {
        LOG_ERROR("EVP_EncryptInit_ex failed");
        return false;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    int outLen = 0;
    if (EVP_EncryptUpdate(ctx.get(), data, &outLen, data, static_cast<int>(whole)) != 1 ||
        static_cast<size_t>(outLen) != whole) {
        LOG_ERROR("EVP_EncryptUpdate failed");
        return false;
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), data + outLen, &finalLen) != 1) {
        LOG_ERROR("EVP_EncryptFinal_ex failed");
        return false;
    }
    return true;
}

std::vector<uint8_t> AudioCryptor::wrapKey(EVP_PKEY *publicKey) const {
    Utils::EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(publicKey, nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != 1) {
        throw std::runtime_error("Failed to set up RSA-OAEP encryption");
    }

    size_t outLen = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLen, key_.data(), key_.size()) != 1) {
        throw std::runtime_error("Failed to size RSA-OAEP output");
    }
    std::vector<uint8_t> out(outLen);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outLen, key_.data(), key_.size()) != 1) {
        throw std::runtime_error("RSA-OAEP encryption of the session key failed");
    }
    out.resize(outLen);
    return out;
}

Utils::EvpPkeyPtr AudioCryptor::loadPublicKey(const std::string &pemPath) {
    Utils::BioPtr bio(BIO_new_file(pemPath.c_str(), "r"));
    if (!bio) {
        throw std::runtime_error("Cannot open RSA key file: " + pemPath);
    }
    Utils::EvpPkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw std::runtime_error("Not a PEM public key: " + pemPath);
    }
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        throw std::runtime_error("Not an RSA public key: " + pemPath);
    }
    return key;
}

std::string buildAnnounceSdp(const SdpParams &params) {
    std::ostringstream sdp;
    sdp << "v=0\r\n"
        << "o=iTunes " << params.sessionId << " 0 IN IP4 " << params.localAddress << "\r\n"
        << "s=iTunes\r\n"
        << "c=IN IP4 " << params.remoteAddress << "\r\n"
        << "t=0 0\r\n"
        << "m=audio 0 RTP/AVP 96\r\n";

    if (params.codec == Codec::ALACRaw) {
        sdp << "a=rtpmap:96 AppleLossless\r\n"
            << "a=fmtp:96 " << params.framesPerPacket << " 0 "
            << static_cast<int>(params.sampleSize) << " 40 10 14 "
            << static_cast<int>(params.channels) << " 255 0 0 " << params.sampleRate
            << "\r\n";
    } else {
        sdp << "a=rtpmap:96 L16/" << params.sampleRate << "/"
            << static_cast<int>(params.channels) << "\r\n";
    }

    if (!params.rsaAesKey.empty()) {
        sdp << "a=rsaaeskey:" << params.rsaAesKey << "\r\n"
            << "a=aesiv:" << params.aesIv << "\r\n";
    }
    return sdp.str();
}

std::optional<TransportPorts> parseTransportHeader(const std::string &value) {
    TransportPorts ports;
    auto server = parsePort(attribute(value, "server_port"));
    if (!server) {
        return std::nullopt;
    }
    ports.server = *server;
    ports.control = parsePort(attribute(value, "control_port")).value_or(0);
    ports.timing = parsePort(attribute(value, "timing_port")).value_or(0);
    return ports;
}

std::optional<uint32_t> parseAudioLatency(const std::optional<std::string> &value) {
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        unsigned long latency = std::stoul(*value, &used);
        if (used != value->size()) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(latency);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<AuthChallenge> parseAuthenticate(const std::string &value) {
    AuthChallenge challenge;
    if (value.rfind("Digest", 0) == 0) {
        challenge.scheme = AuthChallenge::Scheme::Digest;
        std::string params = value.substr(6);
        challenge.realm = attribute(params, "realm");
        challenge.nonce = attribute(params, "nonce");
        if (challenge.nonce.empty()) {
            return std::nullopt;
        }
        return challenge;
    }
    if (value.rfind("Basic", 0) == 0) {
        challenge.scheme = AuthChallenge::Scheme::Basic;
        challenge.realm = attribute(value.substr(5), "realm");
        return challenge;
    }
    return std::nullopt;
}

std::string buildAuthorization(const AuthChallenge &challenge, const std::string &user,
                               const std::string &password, const std::string &method,
                               const std::string &uri) {
    if (challenge.scheme == AuthChallenge::Scheme::Basic) {
        std::string credentials = user + ":" + password;
        return "Basic " +
               Utils::base64Encode(reinterpret_cast<const uint8_t *>(credentials.data()),
                                   credentials.size(), true);
    }

    std::string ha1 = Utils::md5Hex(user + ":" + challenge.realm + ":" + password);
    std::string ha2 = Utils::md5Hex(method + ":" + uri);
    std::string response = Utils::md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);

    std::ostringstream out;
    out << "Digest username=\"" << user << "\", realm=\"" << challenge.realm
        << "\", nonce=\"" << challenge.nonce << "\", uri=\"" << uri
        << "\", response=\"" << response << "\"";
    return out.str();
}

} // namespace Raop
} // namespace AirStream
