/**
 * @file OrderedCollector.cc
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

#include <algorithm>

#include <spdlog/spdlog.h>

#include <recursum/util/OrderedCollector.hh>

namespace recursum::util {

OrderedCollector::OrderedCollector(Sink sink):
    sink_(std::move(sink))
{
}

void OrderedCollector::deliver(ResultItem item)
{
    auto lk = std::unique_lock(mtx_);

    if (cancelled_ || error_)
        return;

    if (item.index < next_)
    {
        throw std::logic_error(fmt::format(
            "collector: result {} ('{}') is behind the emission front ({})"
            , item.index
            , item.path
            , next_));
    }

    if (expected_ && item.index >= *expected_)
    {
        throw std::logic_error(fmt::format(
            "collector: result {} ('{}') is past the end of the run ({})"
            , item.index
            , item.path
            , *expected_));
    }

    const auto index = item.index;

    if (!window_.emplace(index, std::move(item)).second)
        throw std::logic_error(fmt::format("collector: duplicate result {}", index));

    maxPending_ = std::max(maxPending_, window_.size());

    for (auto iter = window_.find(next_); iter != end(window_); iter = window_.find(next_))
    {
        try
        {
            if (sink_)
                sink_(iter->second);
        }
        catch (...)
        {
            spdlog::debug("collector: sink failed at index {}.", next_);
            error_ = std::current_exception();
            break;
        }

        window_.erase(iter);
        ++next_;
    }

    if (doneLocked())
    {
        lk.unlock();
        cond_.notify_all();
    }
}

void OrderedCollector::setExpected(uint64_t total)
{
    {
        std::lock_guard lk(mtx_);

        if (total < next_)
        {
            throw std::logic_error(fmt::format(
                "collector: expected count {} is below emitted count {}"
                , total
                , next_));
        }

        expected_ = total;
    }

    cond_.notify_all();
}

bool OrderedCollector::wait(const Clock::time_point &deadline)
{
    auto lk = std::unique_lock(mtx_);

    cond_.wait_until(lk, deadline, [this] { return doneLocked(); });

    return completeLocked();
}

void OrderedCollector::cancel() noexcept
{
    {
        std::lock_guard lk(mtx_);
        cancelled_ = true;
    }

    cond_.notify_all();
}

bool OrderedCollector::complete() const
{
    std::lock_guard lk(mtx_);
    return completeLocked();
}

uint64_t OrderedCollector::emitted() const
{
    std::lock_guard lk(mtx_);
    return next_;
}

size_t OrderedCollector::pending() const
{
    std::lock_guard lk(mtx_);
    return window_.size();
}

size_t OrderedCollector::maxPending() const
{
    std::lock_guard lk(mtx_);
    return maxPending_;
}

std::optional<uint64_t> OrderedCollector::expected() const
{
    std::lock_guard lk(mtx_);
    return expected_;
}

std::exception_ptr OrderedCollector::error() const
{
    std::lock_guard lk(mtx_);
    return error_;
}

bool OrderedCollector::completeLocked() const noexcept
{
    return expected_ && next_ == *expected_ && !error_;
}

bool OrderedCollector::doneLocked() const noexcept
{
    return completeLocked() || cancelled_ || error_;
}

}
