#pragma once

#include <array>
#include <atomic>

namespace virgo {

/**
 * @brief Lock-free SPSC ring buffer
 *
 * One producer thread pushes, one consumer thread pops. Fixed capacity of
 * Size - 1 entries; a full queue rejects the push instead of blocking.
 *
 * @tparam T Trivially copyable payload
 * @tparam Size Power of 2 for fast modulo
 */
template <typename T, int Size>
class LockFreeQueue {
    static_assert(Size > 1 && (Size & (Size - 1)) == 0, "Size must be a power of 2");

  public:
    static constexpr int kQueueSize = Size;

    LockFreeQueue() {
        writeIndex_.store(0, std::memory_order_relaxed);
        readIndex_.store(0, std::memory_order_relaxed);
    }

    /**
     * @brief Push an entry (producer thread)
     * @return false if the queue is full and the entry was dropped
     */
    bool push(const T& entry) {
        int writeIdx = writeIndex_.load(std::memory_order_relaxed);
        int readIdx = readIndex_.load(std::memory_order_acquire);

        int nextWrite = (writeIdx + 1) & (Size - 1);
        if (nextWrite == readIdx) {
            return false;
        }

        buffer_[static_cast<size_t>(writeIdx)] = entry;
        writeIndex_.store(nextWrite, std::memory_order_release);
        return true;
    }

    /**
     * @brief Pop an entry (consumer thread)
     * @return false if the queue is empty
     */
    bool pop(T& entry) {
        int writeIdx = writeIndex_.load(std::memory_order_acquire);
        int readIdx = readIndex_.load(std::memory_order_relaxed);

        if (readIdx == writeIdx) {
            return false;
        }

        entry = buffer_[static_cast<size_t>(readIdx)];
        readIndex_.store((readIdx + 1) & (Size - 1), std::memory_order_release);
        return true;
    }

    bool hasPending() const {
        return writeIndex_.load(std::memory_order_acquire) !=
               readIndex_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Drop everything pending (consumer thread, or when neither side is active)
     */
    void clear() {
        readIndex_.store(writeIndex_.load(std::memory_order_acquire), std::memory_order_release);
    }

  private:
    std::array<T, static_cast<size_t>(Size)> buffer_{};
    std::atomic<int> writeIndex_{0};
    std::atomic<int> readIndex_{0};
};

}  // namespace virgo
