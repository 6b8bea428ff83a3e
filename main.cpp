#include "ASClock.hpp"
#include "PlayerApp.hpp"
#include "PlayerConfig.hpp"
#include "logger.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    using namespace AirStream;

    PlayerConfig config;
    try {
        config = parseCommandLine(argc, argv);
    } catch (const ConfigError &e) {
        LOG_ERROR("{}", e.what());
        std::cerr << usage(argv[0]);
        return 1;
    }
    if (config.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    Clock::SystemClock clock;
    try {
        PlayerApp app(config, clock, [&clock](const PlayerConfig &cfg) {
            return PlayerApp::makeRaopClient(cfg, clock);
        });
        return app.run();
    } catch (const std::exception &e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
}
