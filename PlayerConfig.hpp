#pragma once

#include "ASClock.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace AirStream {

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct PlayerConfig {
    std::string serverAddress;
    std::string filename;
    std::string ntpFile;    // write the current NTP here and exit
    uint16_t port = 5000;
    int volume = 50;        // percent
    int64_t latency = -1;   // frames, negative selects the default
    bool alac = false;
    uint64_t waitMs = 0;
    Clock::NtpTime start = 0;
    std::string startFile;
    bool encrypt = false;
    std::string password;
    std::string secret;
    std::string rsaKeyPath;
    int debug = 0;
    bool interactive = false;
    bool help = false;

    // Requested latency in frames, msToTicks(1000, 44100) unless set
    uint32_t requestedLatency() const;
};

/**
 * @brief Parses the command line.
 *
 * Throws ConfigError on unknown options, bad values or missing positionals.
 * With --help (or --ntp-file) the positionals are not required.
 */
PlayerConfig parseCommandLine(int argc, const char *const argv[]);

std::string usage(const std::string &program);

// Single decimal NTP value. Throws std::runtime_error if the file can not be
// opened or does not hold a number.
Clock::NtpTime readStartTimeFile(const std::string &path);

// Writes `ntp` as one decimal value. Throws std::runtime_error on failure.
void writeNtpFile(const std::string &path, Clock::NtpTime ntp);

} // namespace AirStream
