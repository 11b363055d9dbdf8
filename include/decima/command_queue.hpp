#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>

namespace decima
{

// Lock-free SPSC (single-producer single-consumer) ring of closures.
// A worker thread posts results as closures; the owning thread drains them
// and applies them to state only it touches.  One queue per producer.
class CommandQueue
{
   public:
    using Command = std::function<void()>;

    static constexpr std::size_t DEFAULT_CAPACITY = 64;

    // One slot is reserved to tell full from empty, so `capacity - 1`
    // commands fit.  Throws std::invalid_argument for capacity < 2.
    explicit CommandQueue(std::size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity), slots_(capacity >= 2 ? new Command[capacity] : nullptr)
    {
        if (capacity_ < 2)
            throw std::invalid_argument("CommandQueue capacity must be at least 2");
    }

    CommandQueue(const CommandQueue&)            = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Producer side.  Returns false when full.
    bool push(Command cmd)
    {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) % capacity_;
        if (next == tail_.load(std::memory_order_acquire))
            return false;

        slots_[head] = std::move(cmd);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side.  Returns false when empty.
    bool pop(Command& out)
    {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false;

        out = std::move(slots_[tail]);
        slots_[tail] = nullptr;
        tail_.store((tail + 1) % capacity_, std::memory_order_release);
        return true;
    }

    // Consumer side: run every pending command in FIFO order.
    std::size_t drain()
    {
        std::size_t count = 0;
        Command     cmd;
        while (pop(cmd))
        {
            if (cmd)
                cmd();
            ++count;
        }
        return count;
    }

    bool empty() const
    {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    std::size_t capacity() const { return capacity_; }

   private:
    const std::size_t          capacity_;
    std::unique_ptr<Command[]> slots_;

    // Separate cache lines for producer and consumer indices.
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

}   // namespace decima
