// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Bounded Buffer: fixed-capacity FIFO between poller threads and poll() callers

#ifndef LOOM_BOUNDED_BUFFER_HPP
#define LOOM_BOUNDED_BUFFER_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include "rxcpp/rx.hpp"

namespace Loom::Pollers {

    enum class PopStatus {
        ITEM,        // an item was removed
        CLOSED,      // closed and drained, nothing will ever arrive
        INTERRUPTED  // the caller's interrupt fired first
    };

    /**
     * @brief Producers block while full, consumers block while empty.
     *
     * close() is one-way: pushes start failing immediately, while items already
     * queued can still be popped. Every blocked thread is woken by close().
     */
    template <typename T>
    class BoundedBuffer {
    public:
        explicit BoundedBuffer(size_t capacity) : cap(capacity), state(std::make_shared<State>()) {
            if (capacity == 0) {
                throw std::invalid_argument("BoundedBuffer capacity must be at least 1");
            }
        }

        BoundedBuffer(const BoundedBuffer&) = delete;
        BoundedBuffer& operator=(const BoundedBuffer&) = delete;

        // false when the buffer is closed; the item is dropped
        bool push(T item) {
            std::unique_lock<std::mutex> lock(state->mtx);
            state->notFull.wait(lock, [this] { return state->closed || state->items.size() < cap; });
            if (state->closed) return false;

            state->items.push_back(std::move(item));
            lock.unlock();
            state->notEmpty.notify_one();
            return true;
        }

        std::optional<T> pop() {
            std::unique_lock<std::mutex> lock(state->mtx);
            state->notEmpty.wait(lock, [this] { return state->closed || !state->items.empty(); });
            if (state->items.empty()) return std::nullopt;

            return takeFront(lock);
        }

        /**
         * @brief pop() that gives up when the interrupt subscription is unsubscribed.
         * An interrupt that has already fired wins over a queued item, so an
         * interrupted call never removes anything.
         */
        PopStatus pop(std::optional<T>& out, rxcpp::composite_subscription interrupt) {
            // Registered before locking: an already-fired interrupt runs the
            // callback right here, and it takes the lock itself. The callback
            // holds the state, not the buffer: an interrupt fired from another
            // thread can still be running it after this call returned.
            std::shared_ptr<State> shared = state;
            auto wakeup = interrupt.add(rxcpp::make_subscription([shared] {
                { std::lock_guard<std::mutex> guard(shared->mtx); }
                shared->notEmpty.notify_all();
            }));

            PopStatus status;
            {
                std::unique_lock<std::mutex> lock(state->mtx);
                state->notEmpty.wait(lock, [&] {
                    return !interrupt.is_subscribed() || state->closed || !state->items.empty();
                });

                if (!interrupt.is_subscribed()) {
                    status = PopStatus::INTERRUPTED;
                } else if (state->items.empty()) {
                    status = PopStatus::CLOSED;
                } else {
                    out.emplace(takeFront(lock));
                    status = PopStatus::ITEM;
                }
            }

            interrupt.remove(wakeup);
            return status;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(state->mtx);
                if (state->closed) return;
                state->closed = true;
            }
            state->notFull.notify_all();
            state->notEmpty.notify_all();
        }

        bool isClosed() const {
            std::lock_guard<std::mutex> lock(state->mtx);
            return state->closed;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(state->mtx);
            return state->items.size();
        }

        size_t capacity() const noexcept { return cap; }

    private:
        struct State {
            std::mutex mtx;
            std::condition_variable notFull;
            std::condition_variable notEmpty;
            std::deque<T> items;
            bool closed = false;
        };

        // Caller holds the lock; it is released before waking a producer.
        T takeFront(std::unique_lock<std::mutex>& lock) {
            T item = std::move(state->items.front());
            state->items.pop_front();
            lock.unlock();
            state->notFull.notify_one();
            return item;
        }

        const size_t cap;
        const std::shared_ptr<State> state;
    };
}

#endif // LOOM_BOUNDED_BUFFER_HPP
