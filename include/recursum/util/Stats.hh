/**
 * @file Stats.hh
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

#ifndef __RECURSUM_UTIL_STATS_HH__
#define __RECURSUM_UTIL_STATS_HH__

#include <atomic>
#include <chrono>
#include <cstdint>

namespace recursum::util {

struct Stats
{
    // paths pushed onto the dispatch queue.
    std::atomic_uint64_t queuedCount{ };
    // results handed to the collector, including failures.
    std::atomic_uint64_t fileCount{ };
    std::atomic_uint64_t byteCount{ };
    std::atomic_uint64_t errorCount{ };
    // directories the walk could not read.
    std::atomic_uint64_t skippedCount{ };
};

struct BandwidthMonitor
{
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;

    struct Sample
    {
        Clock::time_point time{ };
        uint64_t value{ };
    };

    BandwidthMonitor():
        prevSample_{Clock::now(), 0}
    {
    }

    double update(uint64_t value)
    {
        const auto now = Clock::now();
        const auto dt = Duration(now - prevSample_.time).count();

        if (dt <= 0.0 || value < prevSample_.value)
            return avg_;

        const auto rate = static_cast<double>(value - prevSample_.value) / dt;

        avg_ = primed_ ? .8 * avg_ + .2 * rate : rate;
        primed_ = true;

        prevSample_ = {now, value};

        return avg_;
    }

    Sample prevSample_{ };
    double avg_{ };
    bool primed_{ };
};

}

#endif
