/**
 * @file PathSource.hh
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

#ifndef __RECURSUM_UTIL_PATH_SOURCE_HH__
#define __RECURSUM_UTIL_PATH_SOURCE_HH__

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <unistd.h>

#include "Stats.hh"
#include "Util.hh"

namespace recursum::util {

/**
 * Produces the ordered stream of paths to hash.
 *
 * Every path goes through emit(), which assigns the next index and pushes
 * the item onto the dispatch queue, blocking while the queue is full. When
 * the source runs dry it closes the queue and reports the item count.
 */
class PathSource
{
public:
    using FinishCallback = std::function<void(uint64_t total)>;

    virtual ~PathSource() = default;

    void bind(DispatchQueue &queue, FinishCallback onFinish, Stats *stats = nullptr);

    // returns false once the source is exhausted, stopped or failed.
    bool runOnce(std::stop_token stopToken);

    // dispatch queue size limit this source wants.
    virtual size_t queueCapacity(size_t workerCount, double factor) const = 0;

    uint64_t produced() const noexcept;
    bool finished() const noexcept;
    std::exception_ptr error() const;

protected:
    // produce at least one item, or return false when there is nothing left.
    virtual bool produce(std::stop_token stopToken) = 0;

    bool emit(std::string path, std::stop_token stopToken);

    Stats *stats() const noexcept;

private:
    void finish();

    DispatchQueue *queue_{ };
    FinishCallback onFinish_{ };
    Stats *stats_{ };

    std::atomic_uint64_t next_{ };
    std::atomic_bool stopped_{ };
    std::atomic_bool finished_{ };

    mutable std::mutex errorMtx_;
    std::exception_ptr error_{ };
};

class ExplicitList: public PathSource
{
public:
    explicit ExplicitList(std::vector<std::string> paths);

    size_t queueCapacity(size_t workerCount, double factor) const override;

protected:
    bool produce(std::stop_token stopToken) override;

private:
    std::vector<std::string> paths_;
    size_t pos_{ };
};

class StdinStream: public PathSource
{
public:
    explicit StdinStream(int fd = STDIN_FILENO);

    size_t queueCapacity(size_t workerCount, double factor) const override;

protected:
    bool produce(std::stop_token stopToken) override;

private:
    bool readMore();
    std::optional<std::string> nextLine();

    int fd_{ };
    std::string pending_{ };
    // start of the unconsumed part of pending_.
    size_t pendingPos_{ };
    std::vector<char> buf_{ };
    bool eof_{ };
};

}

#endif
