#pragma once

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace AirStream {
namespace RTSP {

inline std::string trim_whitespace(const std::string &s) {
  auto start = std::find_if_not(
      s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) {
               return std::isspace(ch);
             }).base();
  return (start < end ? std::string(start, end) : std::string());
}

// Header names are case-insensitive; receivers disagree on "CSeq"/"Cseq"
struct HeaderNameLess {
  bool operator()(const std::string &a, const std::string &b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
          return std::tolower(x) < std::tolower(y);
        });
  }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

inline bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

class RTSPMessage {
public:
  // Largest response body accepted from a receiver
  static constexpr size_t kMaxContentLength = 64 * 1024;

  // Request parts
  std::string method;
  std::string uri;
  std::string version = "RTSP/1.0";

  // Response parts
  int statusCode = 0;       // e.g., 200, 401
  std::string reasonPhrase; // e.g., "OK", "Unauthorized"

  // Common parts
  HeaderMap headers;
  std::vector<char> payload;
  int cseq = 0;

private:
  size_t parsedContentLength_ = 0;

public:
  RTSPMessage() = default;

  static RTSPMessage request(const std::string &method, const std::string &uri) {
    RTSPMessage msg;
    msg.method = method;
    msg.uri = uri;
    return msg;
  }

  void clear() {
    method.clear();
    uri.clear();
    version = "RTSP/1.0";
    statusCode = 0;
    reasonPhrase.clear();
    headers.clear();
    payload.clear();
    cseq = 0;
    parsedContentLength_ = 0;
  }

  std::optional<std::string> header(const std::string &name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void setBody(const std::string &contentType, const std::string &body) {
    headers["Content-Type"] = contentType;
    payload.assign(body.begin(), body.end());
  }

  std::string body() const { return std::string(payload.begin(), payload.end()); }

  bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

  // --- Parsing Methods ---

  // Parses the status line and header fields of a response.
  // Input should contain everything up to the blank line.
  bool parseResponseHeader(const std::string &headers_part) {
    clear();
    std::istringstream iss(headers_part);
    std::string line;

    // Status line, e.g. "RTSP/1.0 401 Unauthorized"
    if (!std::getline(iss, line)) {
      LOG_ERROR("Empty headers part.");
      return false;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    std::istringstream statusLineStream(line);
    if (!(statusLineStream >> version >> statusCode)) {
      LOG_ERROR("Invalid RTSP response line format: {}", line);
      return false;
    }
    std::getline(statusLineStream, reasonPhrase);
    reasonPhrase = trim_whitespace(reasonPhrase);

    if (version.find("RTSP/") != 0) {
      LOG_ERROR("Invalid RTSP version: {}", version);
      return false;
    }

    while (std::getline(iss, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        break;
      }

      size_t colonPos = line.find(':');
      if (colonPos == std::string::npos) {
        LOG_WARN("Malformed header line (no colon): {}", line);
        continue;
      }

      std::string headerName = trim_whitespace(line.substr(0, colonPos));
      std::string headerValue = trim_whitespace(line.substr(colonPos + 1));
      if (headerName.empty()) {
        continue;
      }
      headers[headerName] = headerValue;

      if (iequals(headerName, "CSeq")) {
        try {
          cseq = std::stoi(headerValue);
        } catch (const std::exception &e) {
          LOG_ERROR("Invalid CSeq value '{}': {}", headerValue, e.what());
          return false;
        }
      } else if (iequals(headerName, "Content-Length")) {
        try {
          parsedContentLength_ = std::stoull(headerValue);
        } catch (const std::exception &e) {
          LOG_ERROR("Invalid Content-Length value '{}': {}", headerValue,
                    e.what());
          return false;
        }
        if (parsedContentLength_ > kMaxContentLength) {
          LOG_ERROR("Content-Length {} exceeds the {} byte limit",
                    parsedContentLength_, kMaxContentLength);
          return false;
        }
      }
    }
    return true;
  }

  bool parseBody(const std::vector<char> &body_data) {
    if (body_data.size() != parsedContentLength_) {
      LOG_WARN("Body size mismatch. Expected {} bytes, got {} bytes.",
               parsedContentLength_, body_data.size());
    }
    payload = body_data;
    return true;
  }

  // Parses a complete response held in one buffer
  bool parseResponse(const std::vector<char> &raw_message) {
    clear();

    const char *header_separator = "\r\n\r\n";
    const size_t separator_len = 4;

    auto separator_it =
        std::search(raw_message.begin(), raw_message.end(), header_separator,
                    header_separator + separator_len);
    if (separator_it == raw_message.end()) {
      LOG_ERROR("Header separator (\\r\\n\\r\\n) not found in message.");
      return false;
    }

    std::string headers_part(raw_message.begin(), separator_it);
    if (!parseResponseHeader(headers_part)) {
      LOG_ERROR("Failed to parse headers section.");
      return false;
    }

    auto body_start_it = separator_it + separator_len;
    size_t body_size = std::distance(body_start_it, raw_message.end());
    if (body_size != parsedContentLength_) {
      LOG_WARN("Actual body size ({}) does not match Content-Length "
               "header ({}).",
               body_size, parsedContentLength_);
    }
    payload.assign(body_start_it, raw_message.end());
    return true;
  }

  size_t getExpectedContentLength() const { return parsedContentLength_; }

  // --- Construction Method ---

  std::vector<char> constructRequest() {
    std::ostringstream oss;

    oss << method << " " << uri << " " << version << "\r\n";

    headers["CSeq"] = std::to_string(cseq);
    if (!payload.empty()) {
      headers["Content-Length"] = std::to_string(payload.size());
    } else {
      headers.erase("Content-Length");
    }
    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }
    oss << "\r\n";

    std::string header_str = oss.str();

    std::vector<char> request_vec;
    request_vec.reserve(header_str.length() + payload.size());
    request_vec.insert(request_vec.end(), header_str.begin(), header_str.end());
    request_vec.insert(request_vec.end(), payload.begin(), payload.end());

    return request_vec;
  }

  // --- Utility Method ---

  void print() const {
    if (!method.empty()) {
      LOG_DEBUG("--- RTSP Request ---");
      LOG_DEBUG("{} {} {}", method, uri, version);
    } else if (statusCode != 0) {
      LOG_DEBUG("--- RTSP Response ---");
      LOG_DEBUG("{} {} {}", version, statusCode, reasonPhrase);
    } else {
      LOG_DEBUG("--- RTSP Message (Undetermined Type) ---");
    }

    for (const auto &[key, value] : headers) {
      LOG_DEBUG("{}: {}", key, value);
    }

    if (!payload.empty()) {
      LOG_DEBUG("Content-Length: {} (Actual)", payload.size());
      LOG_DEBUG("{:16xL128}", payload);
    } else {
      LOG_DEBUG("Payload: (empty)");
    }
    LOG_DEBUG("----------------");
  }
};

} // namespace RTSP
} // namespace AirStream
