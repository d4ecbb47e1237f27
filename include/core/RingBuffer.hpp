#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, lock-protected FIFO used between producers and the log worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace pledge {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed capacity; a push into a full buffer overwrites the oldest entry.
 *
 *  * `push()` never blocks on the consumer.
 *  * `drain()` waits up to \p timeout for data, then hands over everything queued.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

      /// @returns false if an older entry had to be dropped to make room.
      bool push(T item) {
        bool kept = true;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (items_.size() == capacity_) {
            items_.pop_front();
            ++dropped_;
            kept = false;
          }
          items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return kept;
      }

      std::vector<T> drain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || woken_; });
        woken_ = false;
        std::vector<T> out(std::make_move_iterator(items_.begin()),
                           std::make_move_iterator(items_.end()));
        items_.clear();
        return out;
      }

      /// Release a consumer blocked in `drain()`.
      void wake() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          woken_ = true;
        }
        cv_.notify_all();
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
      }

      std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      const std::size_t capacity_;
      std::deque<T> items_;
      std::size_t dropped_{ 0 };
      bool woken_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace pledge
