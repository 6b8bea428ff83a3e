#include "PlayerConfig.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace AirStream {

namespace {

po::options_description makeOptions() {
    po::options_description options("Options");
    // clang-format off
    options.add_options()
        ("help,h", "show this help")
        ("ntp-file", po::value<std::string>(), "write the current NTP to FILE and exit")
        ("port,p", po::value<uint16_t>()->default_value(5000), "receiver port")
        ("volume,v", po::value<int>()->default_value(50), "volume, 0-100")
        ("latency,l", po::value<int64_t>(), "latency in frames")
        ("alac,a", po::bool_switch(), "send uncompressed ALAC instead of PCM")
        ("wait,w", po::value<uint64_t>()->default_value(0), "start after WAIT milliseconds")
        ("start,n", po::value<Clock::NtpTime>()->default_value(0), "start at NTP START + WAIT")
        ("start-file", po::value<std::string>(), "start at the NTP read from FILE + WAIT")
        ("encrypt,e", po::bool_switch(), "encrypt the audio stream")
        ("rsa-key", po::value<std::string>(), "receiver RSA public key (PEM), used with --encrypt")
        ("password", po::value<std::string>(), "receiver password")
        ("secret,s", po::value<std::string>(), "Apple TV secret")
        ("debug,d", po::value<int>()->default_value(0), "debug level, 0 = info")
        ("interactive,i", po::bool_switch(),
         "interactive commands: 'p' pause, 'r' (re)start, 's' stop, 'q' quit");
    // clang-format on
    return options;
}

po::options_description makePositionals() {
    po::options_description hidden;
    hidden.add_options()
        ("server_address", po::value<std::string>(), "receiver address")
        ("filename", po::value<std::string>(), "raw 16-bit stereo 44.1 kHz PCM file");
    return hidden;
}

template <typename T>
void assignIf(const po::variables_map &vm, const char *name, T &target) {
    if (vm.count(name)) {
        target = vm[name].as<T>();
    }
}

} // namespace

uint32_t PlayerConfig::requestedLatency() const {
    if (latency < 0) {
        return static_cast<uint32_t>(Clock::msToTicks(1000, Clock::kDefaultSampleRate));
    }
    return static_cast<uint32_t>(latency);
}

PlayerConfig parseCommandLine(int argc, const char *const argv[]) {
    po::options_description all;
    all.add(makeOptions()).add(makePositionals());

    po::positional_options_description positional;
    positional.add("server_address", 1).add("filename", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error &e) {
        throw ConfigError(e.what());
    }

    PlayerConfig config;
    config.help = vm.count("help") > 0;
    if (config.help) {
        return config;
    }

    assignIf(vm, "ntp-file", config.ntpFile);
    assignIf(vm, "server_address", config.serverAddress);
    assignIf(vm, "filename", config.filename);
    assignIf(vm, "port", config.port);
    assignIf(vm, "volume", config.volume);
    assignIf(vm, "latency", config.latency);
    assignIf(vm, "wait", config.waitMs);
    assignIf(vm, "start", config.start);
    assignIf(vm, "start-file", config.startFile);
    assignIf(vm, "rsa-key", config.rsaKeyPath);
    assignIf(vm, "password", config.password);
    assignIf(vm, "secret", config.secret);
    assignIf(vm, "debug", config.debug);
    config.alac = vm["alac"].as<bool>();
    config.encrypt = vm["encrypt"].as<bool>();
    config.interactive = vm["interactive"].as<bool>();

    if (!config.ntpFile.empty()) {
        return config;
    }
    if (config.serverAddress.empty() || config.filename.empty()) {
        throw ConfigError("server_address and filename are required");
    }
    if (config.volume < 0 || config.volume > 100) {
        throw ConfigError("volume must be between 0 and 100");
    }
    if (config.encrypt && config.rsaKeyPath.empty()) {
        throw ConfigError("--encrypt needs --rsa-key");
    }
    return config;
}

std::string usage(const std::string &program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options] server_address filename\n"
       << "Stream raw PCM audio to an AirPlay (RAOP) receiver.\n\n"
       << makeOptions();
    return os.str();
}

Clock::NtpTime readStartTimeFile(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open start time file: " + path);
    }
    std::string text;
    in >> text;
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid start time in " + path);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range &) {
        throw std::runtime_error("Start time out of range in " + path);
    }
}

void writeNtpFile(const std::string &path, Clock::NtpTime ntp) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open NTP file: " + path);
    }
    out << ntp;
    if (!out) {
        throw std::runtime_error("Cannot write NTP file: " + path);
    }
}

} // namespace AirStream
