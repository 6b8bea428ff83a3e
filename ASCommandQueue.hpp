#ifndef AIRSTREAM_COMMAND_QUEUE_HPP
#define AIRSTREAM_COMMAND_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace AirStream {
namespace Playback {

enum class Command { Pause, Restart, Stop, Quit };

inline const char *CommandToString(Command command) {
    switch (command) {
        case Command::Pause: return "pause";
        case Command::Restart: return "restart";
        case Command::Stop: return "stop";
        case Command::Quit: return "quit";
        default: return "unknown";
    }
}

// Bounded hand-off from the input thread to the streaming loop
class CommandQueue {
  public:
    static constexpr size_t kDefaultCapacity = 16;

    explicit CommandQueue(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    CommandQueue(const CommandQueue &) = delete;
    CommandQueue &operator=(const CommandQueue &) = delete;

    // Returns false when the queue is full; the command is dropped
    bool push(Command command) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(command);
        return true;
    }

    std::optional<Command> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        Command command = queue_.front();
        queue_.pop_front();
        return command;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

  private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Command> queue_;
};

} // namespace Playback
} // namespace AirStream

#endif // AIRSTREAM_COMMAND_QUEUE_HPP
