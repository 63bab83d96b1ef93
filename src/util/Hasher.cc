/**
 * @file Hasher.cc
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

#include <chrono>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <recursum/util/Hasher.hh>

namespace recursum::util {

Hasher::Hasher(DispatchQueue &queue, DigestFactory factory, Callback cb, Stats *stats):
    queue_(&queue),
    factory_(std::move(factory)),
    cb_(std::move(cb)),
    stats_(stats)
{
}

bool Hasher::runOnce(std::stop_token stopToken)
{
    using namespace std::chrono_literals;

    using Clock = std::chrono::steady_clock;

    while (auto item = queue_->get(Clock::now() + 10ms))
    {
        auto result = hashFile(std::move(*item));

        if (cb_)
            cb_(std::move(result));

        if (stopToken.stop_requested())
            return false;
    }

    return !stopToken.stop_requested() && !queue_->done() && !queue_->drained();
}

ResultItem Hasher::hashFile(PathItem item)
{
    auto result = ResultItem{
            .index = item.index,
            .path = std::move(item.path)
        };

    auto sw = spdlog::stopwatch{ };

    try
    {
        auto fd = ScopedFd::open(result.path);
        auto digest = factory_();

        result.size = hash(fd.get(), *digest);
        result.outcome = digest->finalize();

        spdlog::debug("hashed {} '{}' ({} bytes) - {:.06f} sec"
            , result.index
            , result.path
            , result.size
            , sw.elapsed().count());
    }
    catch (const std::system_error &e)
    {
        spdlog::debug("hash {} '{}' failed: {}", result.index, result.path, e.what());
        result.outcome = FileError{e.code(), e.what()};
    }
    catch (const std::exception &e)
    {
        spdlog::warn("hash {} '{}' failed: {}", result.index, result.path, e.what());
        result.outcome = FileError{std::make_error_code(std::errc::io_error), e.what()};
    }

    if (stats_)
    {
        ++stats_->fileCount;
        stats_->byteCount += result.size;

        if (!result.ok())
            ++stats_->errorCount;
    }

    return result;
}

uint64_t Hasher::hash(int fd, Digest &digest)
{
    if (buf_.empty())
        buf_.resize(ReadSize);

    auto offset = uint64_t{ };

    while (true)
    {
        const auto len = readChunk(fd, buf_.data(), buf_.size(), offset);

        if (!len)
            break;

        digest.update(buf_.data(), len);
        offset += len;

        if (len < buf_.size())
            break;
    }

    return offset;
}

}
