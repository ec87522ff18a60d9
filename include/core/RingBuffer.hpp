#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue used by Logger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tempo {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO; `tryPush()` never blocks, `pop()` waits.
 *
 *  * A full buffer rejects new items instead of stalling the producer.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

      /// @returns false when the buffer is full (the item is dropped).
      bool tryPush(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size())
            return false;
          slots_[(head_ + size_) % slots_.size()] = std::move(item);
          ++size_;
        }
        cv_.notify_one();
        return true;
      }

      /// Waits up to \p timeout for an item.
      std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return size_ > 0; }))
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return item;
      }

      bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_ == 0;
      }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace tempo
