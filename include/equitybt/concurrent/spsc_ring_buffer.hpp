// spsc_ring_buffer.hpp
// Lock-free single-producer/single-consumer ring buffer
// Carries progress updates from a running backtest to an observer thread

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace equitybt {

// ============================================================================
// SPSC Ring Buffer with Publish Statistics
// ============================================================================

template<typename T, size_t Size>
class SpscRingBuffer {
    static_assert((Size & (Size - 1)) == 0, "Size must be power of 2");

private:
    std::unique_ptr<std::array<T, Size>> buffer_;

    std::atomic<std::uint64_t> write_sequence_{0};
    std::atomic<std::uint64_t> read_sequence_{0};
    std::atomic<std::uint64_t> cached_read_sequence_{0};
    std::atomic<std::uint64_t> cached_write_sequence_{0};

    std::atomic<std::uint64_t> total_published_{0};
    std::atomic<std::uint64_t> total_consumed_{0};
    std::atomic<std::uint64_t> dropped_{0};

    static constexpr uint64_t MASK = Size - 1;

public:
    SpscRingBuffer() : buffer_(std::make_unique<std::array<T, Size>>()) {}

    SpscRingBuffer(const SpscRingBuffer&) = delete;
    SpscRingBuffer& operator=(const SpscRingBuffer&) = delete;

    // Never blocks the producer; a full buffer drops the item and counts it
    bool try_publish(const T& item) {
        const uint64_t current_write = write_sequence_.load(std::memory_order_relaxed);
        const uint64_t next_write = current_write + 1;

        uint64_t cached_read = cached_read_sequence_.load(std::memory_order_relaxed);
        if (next_write > cached_read + Size) {
            cached_read = read_sequence_.load(std::memory_order_acquire);
            cached_read_sequence_.store(cached_read, std::memory_order_relaxed);

            if (next_write > cached_read + Size) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
        }

        (*buffer_)[current_write & MASK] = item;
        write_sequence_.store(next_write, std::memory_order_release);
        total_published_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    std::optional<T> try_consume() {
        const uint64_t current_read = read_sequence_.load(std::memory_order_relaxed);

        uint64_t cached_write = cached_write_sequence_.load(std::memory_order_relaxed);
        if (current_read >= cached_write) {
            cached_write = write_sequence_.load(std::memory_order_acquire);
            cached_write_sequence_.store(cached_write, std::memory_order_relaxed);

            if (current_read >= cached_write) {
                return std::nullopt;
            }
        }

        T item = (*buffer_)[current_read & MASK];
        read_sequence_.store(current_read + 1, std::memory_order_release);
        total_consumed_.fetch_add(1, std::memory_order_relaxed);
        return item;
    }

    bool empty() const {
        return read_sequence_.load(std::memory_order_acquire) >=
               write_sequence_.load(std::memory_order_acquire);
    }

    size_t size() const {
        const uint64_t write = write_sequence_.load(std::memory_order_acquire);
        const uint64_t read = read_sequence_.load(std::memory_order_acquire);
        return write >= read ? write - read : 0;
    }

    constexpr size_t capacity() const { return Size; }

    struct BufferStats {
        uint64_t total_published;
        uint64_t total_consumed;
        uint64_t dropped;
        size_t current_size;
    };

    BufferStats getStats() const {
        return {
            total_published_.load(std::memory_order_relaxed),
            total_consumed_.load(std::memory_order_relaxed),
            dropped_.load(std::memory_order_relaxed),
            size()
        };
    }
};

} // namespace equitybt
