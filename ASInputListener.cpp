#include "ASInputListener.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace AirStream {
namespace Playback {

TerminalKeySource::TerminalKeySource() {
    if (!isatty(STDIN_FILENO)) {
        LOG_WARN("stdin is not a terminal, keys are read line-buffered");
        return;
    }
    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        LOG_WARN("tcgetattr failed: {}", std::strerror(errno));
        return;
    }

    struct termios raw = original_termios_;
    // Disable canonical mode and echo
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        LOG_WARN("tcsetattr failed: {}", std::strerror(errno));
        return;
    }
    terminal_configured_ = true;
}

TerminalKeySource::~TerminalKeySource() {
    if (terminal_configured_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original_termios_);
        terminal_configured_ = false;
    }
}

std::optional<char> TerminalKeySource::nextKey(std::chrono::milliseconds timeout) {
    if (end_of_input_) {
        return std::nullopt;
    }

    struct pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;

    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno != EINTR) {
            LOG_WARN("poll on stdin failed: {}", std::strerror(errno));
            end_of_input_ = true;
        }
        return std::nullopt;
    }
    if (ready == 0) {
        return std::nullopt;
    }
    if (!(pfd.revents & POLLIN)) {
        // POLLHUP, POLLERR or POLLNVAL with nothing left to read
        end_of_input_ = true;
        return std::nullopt;
    }

    char c;
    ssize_t n = read(STDIN_FILENO, &c, 1);
    if (n == 1) {
        return c;
    }
    if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        end_of_input_ = true;
    }
    return std::nullopt;
}

InputListener::InputListener(IKeySource &keys, CommandQueue &queue)
    : keys_(keys), queue_(queue) {}

InputListener::~InputListener() { stop(); }

std::optional<Command> InputListener::decodeKey(char key) {
    switch (key) {
        case 'p': case 'P': return Command::Pause;
        case 'r': case 'R': return Command::Restart;
        case 's': case 'S': return Command::Stop;
        case 'q': case 'Q': return Command::Quit;
        default: return std::nullopt;
    }
}

void InputListener::start() {
    if (thread_.joinable()) {
        return;
    }
    should_stop_ = false;
    running_ = true;
    thread_ = std::thread(&InputListener::listenLoop, this);
    LOG_INFO("Interactive mode: p = pause, r = restart, s = stop, q = quit");
}

void InputListener::stop() {
    should_stop_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void InputListener::listenLoop() {
    while (!should_stop_) {
        std::optional<char> key = keys_.nextKey(kPollTimeout);
        if (!key) {
            if (keys_.endOfInput()) {
                LOG_DEBUG("Key input closed, interactive control ends");
                break;
            }
            continue;
        }

        std::optional<Command> command = decodeKey(*key);
        if (!command) {
            LOG_VERBOSE("Ignoring key {}", static_cast<int>(*key));
            continue;
        }

        if (!queue_.push(*command)) {
            LOG_WARN("Command queue full, dropping '{}'", CommandToString(*command));
            continue;
        }
        LOG_DEBUG("Queued '{}'", CommandToString(*command));

        // Nothing more to listen for once the session is going down
        if (*command == Command::Stop || *command == Command::Quit) {
            break;
        }
    }
    running_ = false;
}

} // namespace Playback
} // namespace AirStream
