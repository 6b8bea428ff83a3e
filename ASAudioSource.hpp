#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace AirStream {
namespace Playback {

// Raw interleaved little-endian PCM
class IAudioSource {
  public:
    virtual ~IAudioSource() = default;

    // Fills up to `size` bytes, returns how many were read (0 at end)
    virtual size_t read(uint8_t *buffer, size_t size) = 0;
};

class FileSource : public IAudioSource {
  public:
    // Throws std::runtime_error if the file can not be opened
    explicit FileSource(const std::string &path);

    size_t read(uint8_t *buffer, size_t size) override;

    const std::string &path() const { return path_; }

  private:
    std::string path_;
    std::ifstream file_;
};

} // namespace Playback
} // namespace AirStream
