/**
 * @file WaitQueue.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __RECURSUM_UTIL_WAIT_QUEUE_HH__
#define __RECURSUM_UTIL_WAIT_QUEUE_HH__

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>
#include <type_traits>

namespace recursum::util {

/**
 * Blocking FIFO channel.
 *
 * With a size limit set, put() blocks while the queue is full until space
 * frees up, the deadline passes, or the queue is closed or cancelled.
 *
 * close() stops producers; consumers keep draining what is queued and then
 * see end-of-stream. cancel() stops everybody immediately.
 */
template <typename T, typename Alloc = std::allocator<T>, template <typename, typename> class Q = std::deque>
class WaitQueue
{
public:
    using Clock = std::chrono::steady_clock;
    using Mutex = std::timed_mutex;
    using Lock = std::unique_lock<Mutex>;
    using Value = T;
    using ReturnType = std::optional<Value>;
    using Queue = Q<Value, Alloc>;

    enum class Status
    {
        OK,
        TimedOut,
        Full,
        Closed,
        Cancelled
    };

    bool put(Value t)
    {
        return doPut(std::move(t), nullptr) == Status::OK;
    }

    bool put(Value t, const Clock::time_point &deadline)
    {
        return doPut(std::move(t), &deadline) == Status::OK;
    }

    template <typename Rep, typename Period>
    bool put(Value t, const std::chrono::duration<Rep, Period> &tmo)
    {
        const auto deadline = Clock::now() + tmo;
        return doPut(std::move(t), &deadline) == Status::OK;
    }

    ReturnType get()
    {
        return doGet(nullptr);
    }

    template <typename Rep, typename Period>
    ReturnType get(const std::chrono::duration<Rep, Period> &tmo)
    {
        auto deadline = Clock::now() + tmo;
        return doGet(&deadline);
    }

    ReturnType get(const Clock::time_point &deadline)
    {
        return doGet(&deadline);
    }

    ReturnType tryGet()
    {
        const auto op = [this]() -> ReturnType {
            if (done_ || q_.empty())
                return { };

            auto t = std::move(q_.front());
            q_.pop_front();
            return t;
        };

        auto t = tryOp(op);

        if (t)
            notFull_.notify_one();

        return t;
    }

    void close() noexcept
    {
        {
            std::lock_guard lk(mtx_);
            closed_ = true;
        }

        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void cancel() noexcept
    {
        {
            std::lock_guard lk(mtx_);
            done_ = true;
        }

        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void setSizeLimit(size_t limit)
    {
        {
            std::lock_guard lk(mtx_);
            sizeLimit_ = limit ? limit : 1;
        }

        notFull_.notify_all();
    }

    size_t sizeLimit() const noexcept
    {
        return sizeLimit_;
    }

    size_t size() const
    {
        std::lock_guard lk(mtx_);
        return q_.size();
    }

    bool done() const noexcept
    {
        return done_;
    }

    bool closed() const noexcept
    {
        return closed_;
    }

    bool drained() const
    {
        std::lock_guard lk(mtx_);
        return closed_ && q_.empty();
    }

private:
    ReturnType doGet(const Clock::time_point *deadline)
    {
        const auto ready = [this]{ return done_ || closed_ || !q_.empty(); };

        const auto op = [this]() -> ReturnType {
            if (done_ || q_.empty())
                return { };

            auto t = std::move(q_.front());
            q_.pop_front();
            return t;
        };

        auto t = doWithCondition(notEmpty_, ready, op, deadline);

        if (t && *t)
        {
            notFull_.notify_one();
            return std::move(*t);
        }

        return { };
    }

    Status doPut(Value t, const Clock::time_point *deadline)
    {
        const auto ready = [this]{ return done_ || closed_ || q_.size() < sizeLimit_; };

        const auto op = [this, &t]() -> Status {
            if (done_)
                return Status::Cancelled;

            if (closed_)
                return Status::Closed;

            q_.push_back(std::move(t));

            return Status::OK;
        };

        bool timedOut{ };
        const auto status = doWithCondition(notFull_, ready, op, deadline, &timedOut);

        if (!status)
            return timedOut ? Status::Full : Status::TimedOut;

        if (*status == Status::OK)
            notEmpty_.notify_one();

        return *status;
    }

    bool lockUntil(Lock &lk, const Clock::time_point *deadline)
    {
        if (!deadline)
        {
            lk.lock();
            return true;
        }

        return lk.try_lock_until(*deadline);
    }

    // runs op under the lock once ready() holds. returns nullopt if the
    // lock could not be taken in time, or if ready() timed out (in which
    // case *timedOut is set).
    auto doWithCondition(
        std::condition_variable_any &cond,
        const auto &ready,
        const auto &op,
        const Clock::time_point *deadline,
        bool *timedOut = nullptr)
        -> std::optional<std::invoke_result_t<decltype(op)>>
    {
        Lock lk(mtx_, std::defer_lock_t{ });

        if (!lockUntil(lk, deadline))
            return { };

        if (!deadline)
        {
            cond.wait(lk, ready);
        }
        else if (!cond.wait_until(lk, *deadline, ready))
        {
            if (timedOut)
                *timedOut = true;

            return { };
        }

        return op();
    }

    auto tryOp(const auto &op)
        -> std::invoke_result_t<decltype(op)>
    {
        Lock lk(mtx_, std::defer_lock_t{ });

        if (!lk.try_lock())
            return { };

        return op();
    }

    mutable Mutex mtx_;
    std::condition_variable_any notEmpty_;
    std::condition_variable_any notFull_;
    Queue q_;
    std::atomic<size_t> sizeLimit_{std::numeric_limits<size_t>::max()};
    std::atomic_bool closed_{ };
    std::atomic_bool done_{ };
};

}

#endif
