#pragma once

#include <cstdint>
#include <string>

namespace slatewatch::core {

/// How the live feed reaches the watcher.
enum class Transport : std::uint8_t {
  Udp,   // RTP over UDP
  File,  // local media file, decoded by decodebin
  Test,  // generated test pattern
};

enum class Container : std::uint8_t {
  MpegTs,
  RawVideo,
};

enum class Codec : std::uint8_t {
  H264,
  H265,
};

/// Transport kind + address of one video feed, plus its liveness policy.
struct SourceDescriptor {
  Transport transport{Transport::Udp};
  std::string address{"0.0.0.0"};  // bind address for udp, path for file
  std::uint32_t port{5000};
  Container container{Container::MpegTs};
  Codec codec{Codec::H264};
  std::uint32_t stall_timeout_ms{5000};
  std::uint32_t max_reconnect_attempts{5};
  std::uint32_t reconnect_backoff_ms{500};

  bool operator==(const SourceDescriptor&) const = default;
};

}  // namespace slatewatch::core
