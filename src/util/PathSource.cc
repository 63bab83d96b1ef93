/**
 * @file PathSource.cc
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
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>

#include <poll.h>

#include <spdlog/spdlog.h>

#include <recursum/util/PathSource.hh>

namespace recursum::util {

void PathSource::bind(DispatchQueue &queue, FinishCallback onFinish, Stats *stats)
{
    queue_ = &queue;
    onFinish_ = std::move(onFinish);
    stats_ = stats;
}

bool PathSource::runOnce(std::stop_token stopToken)
{
    if (!queue_)
        throw std::logic_error("PathSource::runOnce: source is not bound to a queue.");

    if (finished_ || stopped_)
        return false;

    try
    {
        if (produce(stopToken))
            return true;

        if (stopToken.stop_requested() || stopped_)
        {
            spdlog::debug("path source: stopped after {} items.", produced());
            return false;
        }

        finish();
    }
    catch (...)
    {
        {
            std::lock_guard lk(errorMtx_);
            error_ = std::current_exception();
        }

        stopped_ = true;
    }

    return false;
}

uint64_t PathSource::produced() const noexcept
{
    return next_;
}

bool PathSource::finished() const noexcept
{
    return finished_;
}

std::exception_ptr PathSource::error() const
{
    std::lock_guard lk(errorMtx_);
    return error_;
}

bool PathSource::emit(std::string path, std::stop_token stopToken)
{
    using namespace std::chrono_literals;

    const auto index = next_.load();

    // keep trying to push this path onto the queue. a full queue means the
    // hashers are behind, and we don't want to discover any further ahead.
    while (!stopToken.stop_requested())
    {
        if (queue_->put({index, path}, 100ms))
        {
            ++next_;

            if (stats_)
                ++stats_->queuedCount;

            return true;
        }

        if (queue_->done())
            break;

        if (queue_->closed())
            throw std::logic_error("dispatch queue closed while the source is still producing.");
    }

    stopped_ = true;

    return false;
}

Stats *PathSource::stats() const noexcept
{
    return stats_;
}

void PathSource::finish()
{
    const auto total = produced();

    spdlog::debug("path source: finished, {} items.", total);

    // the total has to be known before the hashers can see the queue drain.
    if (onFinish_)
        onFinish_(total);

    finished_ = true;
    queue_->close();
}

////////////////////////////////////////////////////////////////////////////////
// ExplicitList

ExplicitList::ExplicitList(std::vector<std::string> paths):
    paths_(std::move(paths))
{
}

size_t ExplicitList::queueCapacity(size_t, double) const
{
    return std::max(size_t{1}, paths_.size());
}

bool ExplicitList::produce(std::stop_token stopToken)
{
    if (pos_ >= paths_.size())
        return false;

    return emit(paths_[pos_++], stopToken);
}

////////////////////////////////////////////////////////////////////////////////
// StdinStream

StdinStream::StdinStream(int fd):
    fd_(fd)
{
}

size_t StdinStream::queueCapacity(size_t, double) const
{
    // the upstream writer must never block on us.
    return std::numeric_limits<size_t>::max();
}

bool StdinStream::produce(std::stop_token stopToken)
{
    while (!stopToken.stop_requested())
    {
        if (auto line = nextLine())
            return emit(std::move(*line), stopToken);

        if (eof_)
            return false;

        if (!readMore())
            return true;
    }

    return false;
}

std::optional<std::string> StdinStream::nextLine()
{
    while (pendingPos_ < pending_.size())
    {
        auto nl = pending_.find('\n', pendingPos_);

        if (nl == std::string::npos)
        {
            if (!eof_)
                return { };

            // unterminated last line.
            nl = pending_.size();
        }

        auto line = pending_.substr(pendingPos_, nl - pendingPos_);
        pendingPos_ = std::min(nl + 1, pending_.size());

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (!line.empty())
            return line;
    }

    return { };
}

bool StdinStream::readMore()
{
    // poll with a timeout so a quiet upstream doesn't keep us from seeing a
    // stop request.
    auto pfd = pollfd{fd_, POLLIN, 0};
    const auto stat = ::poll(&pfd, 1, 100);

    if (stat < 0)
    {
        if (errno == EINTR)
            return false;

        throw SourceError(fmt::format("stdin: poll: {}", std::strerror(errno)));
    }

    if (!stat)
        return false;

    if (buf_.empty())
        buf_.resize(1u << 16);

    const auto len = ::read(fd_, buf_.data(), buf_.size());

    if (len < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return false;

        throw SourceError(fmt::format("stdin: read: {}", std::strerror(errno)));
    }

    if (!len)
    {
        spdlog::debug("stdin: end of input.");
        eof_ = true;
        return true;
    }

    // drop consumed lines once per read, not once per line.
    pending_.erase(0, pendingPos_);
    pendingPos_ = 0;

    pending_.append(buf_.data(), static_cast<size_t>(len));

    return true;
}

}
