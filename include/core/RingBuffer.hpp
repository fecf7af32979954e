#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded FIFO shared between Logger producers and its worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace salvage {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity queue; when full the oldest entry is overwritten.
 *
 *  * `push()` never blocks the producer.
 *  * `drain()` waits up to \p timeout for data, then takes everything queued.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

      /// @returns false if an old entry had to be dropped to make room.
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

      /// Release a worker blocked in `drain()`.
      void wake() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          woken_ = true;
        }
        cv_.notify_all();
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
} // namespace salvage
