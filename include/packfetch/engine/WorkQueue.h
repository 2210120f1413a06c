/**
 * @file WorkQueue.h
 * @brief Bounded, closable multi-producer/multi-consumer queue
 */

#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>

#include <deque>
#include <optional>

namespace PackFetch {

/**
 * @class WorkQueue
 * @brief Blocking FIFO used to hand identifiers to worker threads
 *
 * push() blocks while the queue is full; pop() blocks while it is empty.
 * After close(), push() is rejected and pop() drains the remaining items
 * before returning std::nullopt.
 */
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @return false if the queue was closed before the item could be added
     */
    bool push(T item) {
        QMutexLocker locker(&m_mutex);
        while (m_items.size() >= m_capacity && !m_closed) {
            m_notFull.wait(&m_mutex);
        }
        if (m_closed) {
            return false;
        }
        m_items.push_back(std::move(item));
        m_notEmpty.wakeOne();
        return true;
    }

    /**
     * @return Next item, or std::nullopt once closed and drained
     */
    std::optional<T> pop() {
        QMutexLocker locker(&m_mutex);
        while (m_items.empty() && !m_closed) {
            m_notEmpty.wait(&m_mutex);
        }
        if (m_items.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        m_notFull.wakeOne();
        return item;
    }

    void close() {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    /**
     * @brief Close and discard anything not yet dequeued
     */
    void abandon() {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_items.clear();
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

private:
    const size_t m_capacity;
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QWaitCondition m_notFull;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace PackFetch
