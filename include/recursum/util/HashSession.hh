/**
 * @file HashSession.hh
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

#ifndef __RECURSUM_UTIL_HASH_SESSION_HH__
#define __RECURSUM_UTIL_HASH_SESSION_HH__

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>

#include "OrderedCollector.hh"
#include "PathSource.hh"
#include "Stats.hh"
#include "ThreadExecutor.hh"
#include "Util.hh"

namespace recursum::util {

/**
 * One hashing run: path source -> dispatch queue -> hashers -> ordered
 * collector -> sink.
 */
class HashSession
{
public:
    using Clock = std::chrono::steady_clock;
    using Sink = OrderedCollector::Sink;

    struct Summary
    {
        uint64_t produced{ };
        uint64_t emitted{ };
        uint64_t errors{ };
        uint64_t bytes{ };
        uint64_t skipped{ };
        uint64_t unprocessed{ };
        double elapsedSec{ };
        bool complete{ };
    };

    HashSession(SessionConfig conf, Sink sink);
    HashSession(SessionConfig conf, std::shared_ptr<PathSource> source, DigestFactory factory, Sink sink);

    ~HashSession() noexcept;

    HashSession(const HashSession &) = delete;
    HashSession &operator=(const HashSession &) = delete;

    static std::shared_ptr<PathSource> makeSource(const SessionConfig &conf);

    void start();

    // false once every result has been emitted. rethrows source and sink
    // failures, after cancelling the run.
    bool runOnce();

    void cancel() noexcept;

    bool finished() const;

    Summary summary() const;

    const Stats &stats() const noexcept;
    const DispatchQueue &queue() const noexcept;
    const OrderedCollector &collector() const noexcept;

private:
    void fail(std::exception_ptr err) noexcept;
    void rethrowFailures();

    SessionConfig conf_;
    Stats stats_;
    DispatchQueue queue_;
    OrderedCollector collector_;
    std::shared_ptr<PathSource> source_;
    DigestFactory factory_;

    Clock::time_point startTime_{ };
    Clock::time_point endTime_{ };
    bool started_{ };
    bool finished_{ };

    std::mutex failureMtx_;
    std::exception_ptr failure_{ };

    // declared last: threads are joined before anything they touch goes away.
    ThreadExecutor hashExec_;
    ThreadExecutor sourceExec_;
};

}

#endif
