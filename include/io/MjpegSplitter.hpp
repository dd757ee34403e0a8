#pragma once
/** @file  MjpegSplitter.hpp
 *  @brief Cuts a raw MJPEG byte stream into complete JPEG frames (SOI..EOI).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstddef>
#include <vector>

namespace booth {
  namespace io {

    /**
 * @class MjpegSplitter
 * @brief Accumulates arbitrary chunks; `feed()` returns every frame completed so far.
 *
 *  * Bytes before the first SOI marker are discarded.
 *  * An incomplete trailing frame stays buffered for the next chunk.
 *  * The buffer is capped; a runaway frame without EOI is dropped.
 */
    class MjpegSplitter {
    public:
      using Frame = std::vector<unsigned char>;

      explicit MjpegSplitter(std::size_t maxBuffered = 8 * 1024 * 1024) : maxBuffered_(maxBuffered) {}

      std::vector<Frame> feed(const unsigned char* data, std::size_t len);
      std::vector<Frame> feed(const std::vector<unsigned char>& chunk) {
        return feed(chunk.data(), chunk.size());
      }

      std::size_t buffered() const { return buffer_.size(); }

    private:
      std::vector<unsigned char> buffer_;
      std::size_t maxBuffered_;
    };

  } // namespace io
} // namespace booth
