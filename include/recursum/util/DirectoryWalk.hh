/**
 * @file DirectoryWalk.hh
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

#ifndef __RECURSUM_UTIL_DIRECTORY_WALK_HH__
#define __RECURSUM_UTIL_DIRECTORY_WALK_HH__

#include <filesystem>
#include <functional>
#include <future>
#include <optional>
#include <stop_token>
#include <system_error>
#include <vector>

#include "PathSource.hh"
#include "TaskPool.hh"

namespace recursum::util {

/**
 * Depth-first walk of a directory tree, emitting regular files only.
 *
 * Entries of a directory are visited in file name order, and a
 * subdirectory is walked in full before its next sibling. Symlinks are
 * neither emitted nor followed.
 *
 * Directory listings are read by a pool of walker threads, a few
 * subdirectories ahead of the walk at each level. The walk itself, and so
 * the index assignment, stays on the source thread.
 */
class DirectoryWalk: public PathSource
{
public:
    struct Entry
    {
        std::filesystem::path path;
        bool isDir{ };
    };

    struct Listing
    {
        std::vector<Entry> entries;
        std::error_code error{ };
        // entries dropped because they could not be stat'ed.
        size_t skipped{ };
    };

    using Lister = std::function<Listing(const std::filesystem::path &, std::stop_token)>;

    /**
     * @param lister reads one directory; defaults to listDirectory(). Runs
     *      on walker threads.
     */
    DirectoryWalk(std::filesystem::path root, size_t walkerCount, Lister lister = { });

    size_t queueCapacity(size_t workerCount, double factor) const override;

    static Listing listDirectory(const std::filesystem::path &dir, std::stop_token stopToken = { });

protected:
    bool produce(std::stop_token stopToken) override;

private:
    struct Frame
    {
        std::vector<Entry> entries;
        std::vector<std::future<Listing>> listings;
        size_t pos{ };
        size_t prefetchPos{ };
        size_t inflight{ };
    };

    void pushFrame(std::vector<Entry> entries);
    void prefetch(Frame &frame);
    std::optional<Listing> awaitListing(Frame &frame, size_t idx, std::stop_token stopToken);
    void skipDirectory(const std::filesystem::path &dir, const std::error_code &ec);
    void countSkipped(const Listing &listing);

    std::filesystem::path root_;
    size_t readAhead_{ };
    Lister lister_;
    TaskPool pool_;
    std::vector<Frame> stack_;
    bool started_{ };
};

}

#endif
