#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

namespace tabswitch
{

// Lock-free SPSC (Single-Producer Single-Consumer) ring buffer of deferred
// tasks. The host drains it once per frame; the tab switcher posts match
// recomputations to it so typing never blocks on scoring.
class CommandQueue
{
   public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    using Task = std::function<void()>;

    explicit CommandQueue(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity < 2 ? 2 : capacity), buffer_(new Slot[capacity_])
    {
    }

    ~CommandQueue() { delete[] buffer_; }

    CommandQueue(const CommandQueue&)            = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Producer side: enqueue a task. Returns false if the queue is full.
    bool push(Task task)
    {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) % capacity_;

        if (next == tail_.load(std::memory_order_acquire))
        {
            return false;   // Full
        }

        buffer_[head].task = std::move(task);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side: dequeue a task. Returns false if the queue is empty.
    bool pop(Task& out)
    {
        const size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire))
        {
            return false;   // Empty
        }

        out = std::move(buffer_[tail].task);
        tail_.store((tail + 1) % capacity_, std::memory_order_release);
        return true;
    }

    // Consumer side: run the tasks that were queued when drain() started.
    // Tasks queued by those tasks wait for the next drain.
    size_t drain()
    {
        size_t pending = size();
        size_t count   = 0;
        Task   task;
        while (count < pending && pop(task))
        {
            if (task)
            {
                task();
            }
            ++count;
        }
        return count;
    }

    bool empty() const
    {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t size() const
    {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (head + capacity_ - tail) % capacity_;
    }

    // Usable slots (one slot is kept free to tell full from empty).
    size_t capacity() const { return capacity_ - 1; }

    // A scheduler that posts to this queue, running the task immediately if
    // the queue is full so no work is lost.
    std::function<void(Task)> scheduler()
    {
        return [this](Task task)
        {
            if (!push(task))
            {
                task();
            }
        };
    }

   private:
    struct Slot
    {
        Task task;
    };

    const size_t capacity_;
    Slot*        buffer_;

    // Cache-line aligned to avoid false sharing
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

}   // namespace tabswitch
