#pragma once

#include "ASCommandQueue.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <termios.h>
#include <thread>

namespace AirStream {
namespace Playback {

/**
 * Source of single key presses.
 */
class IKeySource {
public:
    virtual ~IKeySource() = default;

    /**
     * @brief Waits up to `timeout` for one key.
     * @return the key, or nullopt when nothing arrived in time.
     */
    virtual std::optional<char> nextKey(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief True once the source can never produce another key,
     *        e.g. stdin reached end of file.
     */
    virtual bool endOfInput() const { return false; }
};

// Reads keys from stdin with the terminal in non-canonical, no-echo mode.
// The previous terminal settings come back when the object is destroyed.
class TerminalKeySource : public IKeySource {
public:
    TerminalKeySource();
    ~TerminalKeySource() override;

    TerminalKeySource(const TerminalKeySource &) = delete;
    TerminalKeySource &operator=(const TerminalKeySource &) = delete;

    std::optional<char> nextKey(std::chrono::milliseconds timeout) override;
    bool endOfInput() const override { return end_of_input_; }

private:
    struct termios original_termios_{};
    bool terminal_configured_ = false;
    bool end_of_input_ = false;
};

class InputListener {
public:
    static constexpr std::chrono::milliseconds kPollTimeout{100};

    InputListener(IKeySource &keys, CommandQueue &queue);
    ~InputListener();

    InputListener(const InputListener &) = delete;
    InputListener &operator=(const InputListener &) = delete;

    void start();
    void stop();

    bool running() const { return running_.load(); }

    // p/r/s/q in either case; anything else is ignored
    static std::optional<Command> decodeKey(char key);

private:
    void listenLoop();

    IKeySource &keys_;
    CommandQueue &queue_;
    std::thread thread_;
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> running_{false};
};

} // namespace Playback
} // namespace AirStream
