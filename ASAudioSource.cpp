#include "ASAudioSource.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace AirStream {
namespace Playback {

FileSource::FileSource(const std::string &path)
    : path_(path), file_(path, std::ios::in | std::ios::binary) {
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open audio file: " + path);
    }
    LOG_DEBUG("Opened audio file {}", path);
}

size_t FileSource::read(uint8_t *buffer, size_t size) {
    if (!file_.good()) {
        return 0;
    }
    file_.read(reinterpret_cast<char *>(buffer), static_cast<std::streamsize>(size));
    return static_cast<size_t>(file_.gcount());
}

} // namespace Playback
} // namespace AirStream
