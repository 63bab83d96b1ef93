/**
 * @file OrderedCollector.hh
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

#ifndef __RECURSUM_UTIL_ORDERED_COLLECTOR_HH__
#define __RECURSUM_UTIL_ORDERED_COLLECTOR_HH__

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

#include "Util.hh"

namespace recursum::util {

/**
 * Reorder buffer between the hashers and the output sink.
 *
 * Results arrive in completion order from any number of threads and leave
 * through the sink in index order, starting at 0, with no gaps. Results
 * that arrive ahead of the next index wait in the pending window.
 *
 * The sink runs under the collector lock, so it is never entered
 * concurrently.
 */
class OrderedCollector
{
public:
    using Clock = std::chrono::steady_clock;
    using Sink = std::function<void(const ResultItem &)>;

    explicit OrderedCollector(Sink sink);

    OrderedCollector(const OrderedCollector &) = delete;
    OrderedCollector &operator=(const OrderedCollector &) = delete;

    void deliver(ResultItem item);

    // the source is done: exactly `total` results make a complete run.
    void setExpected(uint64_t total);

    // wait until complete, failed or cancelled. true if complete.
    bool wait(const Clock::time_point &deadline);

    void cancel() noexcept;

    bool complete() const;
    uint64_t emitted() const;
    size_t pending() const;
    size_t maxPending() const;
    std::optional<uint64_t> expected() const;

    // a sink failure, if any; emission stops at the first one.
    std::exception_ptr error() const;

private:
    bool completeLocked() const noexcept;
    bool doneLocked() const noexcept;

    Sink sink_;

    mutable std::mutex mtx_;
    std::condition_variable cond_;

    std::map<uint64_t, ResultItem> window_;
    uint64_t next_{ };
    size_t maxPending_{ };
    std::optional<uint64_t> expected_{ };
    std::exception_ptr error_{ };
    bool cancelled_{ };
};

}

#endif
