#ifndef RANGELOADER_BOUNDED_QUEUE_HPP
#define RANGELOADER_BOUNDED_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

#include <rangeloader/deadline.hpp>
#include <rangeloader/enums.hpp>

namespace rangeloader
{
    // Fixed-capacity multi-producer / multi-consumer queue with a closing signal.
    // Once closed, pushes are refused while pops keep draining what is left.
    template <class T>
    class BoundedQueue
    {
    public:
        explicit BoundedQueue(std::size_t capacity)
            : m_capacity(capacity)
        {
            if (capacity == 0)
                throw std::invalid_argument("queue capacity must be positive");
        }

        BoundedQueue(const BoundedQueue&) = delete;
        BoundedQueue& operator=(const BoundedQueue&) = delete;

        // Blocks while the queue is full, at most until `deadline`.
        QueueStatus push_until(T value, const deadline_t& deadline)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            auto has_room = [this] { return m_closed || m_items.size() < m_capacity; };
            if (deadline)
            {
                if (!m_not_full.wait_until(lock, *deadline, has_room))
                    return QueueStatus::kTIMEOUT;
            }
            else
            {
                m_not_full.wait(lock, has_room);
            }

            if (m_closed)
                return QueueStatus::kCLOSED;

            m_items.push_back(std::move(value));
            lock.unlock();
            m_not_empty.notify_one();
            return QueueStatus::kOK;
        }

        QueueStatus push(T value)
        {
            return push_until(std::move(value), std::nullopt);
        }

        // Blocks until an item is available. Returns false once closed and drained.
        bool pop(T& value)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });
            if (m_items.empty())
                return false;

            value = std::move(m_items.front());
            m_items.pop_front();
            lock.unlock();
            m_not_full.notify_one();
            return true;
        }

        void close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_not_empty.notify_all();
            m_not_full.notify_all();
        }

        bool closed() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_closed;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

        std::size_t capacity() const noexcept
        {
            return m_capacity;
        }

    private:
        const std::size_t m_capacity;
        mutable std::mutex m_mutex;
        std::condition_variable m_not_full;
        std::condition_variable m_not_empty;
        std::deque<T> m_items;
        bool m_closed = false;
    };
}

#endif
