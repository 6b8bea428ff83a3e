#include "ASUtils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstring>
#include <ifaddrs.h>
#include <linux/if.h>
#include <linux/if_packet.h>
#include <netinet/in.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace AirStream {
namespace Utils {

std::string base64Encode(const uint8_t *data, size_t size, bool padding) {
    if (size == 0) {
        return {};
    }
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                  data, static_cast<int>(size));
    out.resize(static_cast<size_t>(written));
    if (!padding) {
        while (!out.empty() && out.back() == '=') {
            out.pop_back();
        }
    }
    return out;
}

std::string hexString(const uint8_t *data, size_t size, bool upperCase) {
    static const char lower[] = "0123456789abcdef";
    static const char upper[] = "0123456789ABCDEF";
    const char *digits = upperCase ? upper : lower;

    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string md5Hex(const std::string &input) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    return hexString(digest, digestLen);
}

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::array<uint8_t, 6> getPrimaryMacAddress() {
    std::array<uint8_t, 6> macOut{};
    struct ifaddrs *iaList = nullptr;

    if (getifaddrs(&iaList) != 0) {
        LOG_WARN("getifaddrs failed, no MAC address available");
        return macOut;
    }

    for (const struct ifaddrs *ia = iaList; ia; ia = ia->ifa_next) {
        if (!(ia->ifa_flags & IFF_UP)) continue;
        if (ia->ifa_flags & IFF_LOOPBACK) continue;
        if (!ia->ifa_addr) continue;
        if (ia->ifa_addr->sa_family != AF_PACKET) continue;

        const auto *sll = reinterpret_cast<const struct sockaddr_ll *>(ia->ifa_addr);
        if (sll->sll_halen != 6) continue;

        std::copy(sll->sll_addr, sll->sll_addr + 6, macOut.data());
        break;
    }
    freeifaddrs(iaList);
    return macOut;
}

std::string clientInstanceId() {
    auto mac = getPrimaryMacAddress();
    std::array<uint8_t, 8> id{};
    std::copy(mac.begin(), mac.end(), id.begin() + 2);
    if (std::all_of(mac.begin(), mac.end(), [](uint8_t b) { return b == 0; })) {
        auto random = randomBytes(id.size());
        std::copy(random.begin(), random.end(), id.begin());
    }
    return hexString(id.data(), id.size(), true);
}

} // namespace Utils
} // namespace AirStream
