/* @file MjpegSplitter.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// Booth headers
#include "io/MjpegSplitter.hpp"

using namespace booth::io;

namespace {

  constexpr unsigned char kMarker = 0xFF;
  constexpr unsigned char kSoi = 0xD8;
  constexpr unsigned char kEoi = 0xD9;

  // index of the first `FF <tag>` at or after \p from, or npos
  std::size_t findMarker(const std::vector<unsigned char>& buf, std::size_t from, unsigned char tag) {
    for (std::size_t i = from; i + 1 < buf.size(); ++i)
      if (buf[i] == kMarker && buf[i + 1] == tag)
        return i;
    return static_cast<std::size_t>(-1);
  }

} // namespace

std::vector<MjpegSplitter::Frame> MjpegSplitter::feed(const unsigned char* data, std::size_t len) {
  constexpr std::size_t npos = static_cast<std::size_t>(-1);

  buffer_.insert(buffer_.end(), data, data + len);
  std::vector<Frame> frames;

  std::size_t consumed = 0;
  while (true) {
    std::size_t soi = findMarker(buffer_, consumed, kSoi);
    if (soi == npos) {
      // keep a trailing 0xFF, it may be the first half of the next SOI
      consumed = buffer_.empty() ? 0 : buffer_.size() - (buffer_.back() == kMarker ? 1 : 0);
      break;
    }
    std::size_t eoi = findMarker(buffer_, soi + 2, kEoi);
    if (eoi == npos) {
      consumed = soi;
      break;
    }
    frames.emplace_back(buffer_.begin() + static_cast<std::ptrdiff_t>(soi),
                        buffer_.begin() + static_cast<std::ptrdiff_t>(eoi + 2));
    consumed = eoi + 2;
  }

  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
  if (buffer_.size() > maxBuffered_)
    buffer_.clear();
  return frames;
}
