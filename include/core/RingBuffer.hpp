#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, mutex-protected FIFO shared between producer threads and one consumer.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace booth {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue.
 *
 *  * `push()` never blocks: returns false when full (caller decides to drop).
 *  * `tryPop()` is non-blocking, `popFor()` waits up to a timeout.
 *  * Any number of producers, intended for a single consumer.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

      bool push(T value) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (count_ == slots_.size())
            return false;
          slots_[(head_ + count_) % slots_.size()] = std::move(value);
          ++count_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return count_ > 0; });
        return popLocked();
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

      /// Wake a consumer blocked in popFor() (used on shutdown).
      void wakeAll() { cv_.notify_all(); }

    private:
      std::optional<T> popLocked() {
        if (count_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace booth
