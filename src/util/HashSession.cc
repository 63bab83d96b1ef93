/**
 * @file HashSession.cc
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

#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include <recursum/util/DirectoryWalk.hh>
#include <recursum/util/Hasher.hh>
#include <recursum/util/HashSession.hh>

namespace recursum::util {

namespace {

// ThreadExecutor runnable owning a share of the source.
struct SourceRunner
{
    std::shared_ptr<PathSource> source;

    bool runOnce(std::stop_token stopToken)
    {
        return source->runOnce(stopToken);
    }
};

}

HashSession::HashSession(SessionConfig conf, Sink sink):
    HashSession(
        conf,
        makeSource(conf),
        makeDigestFactory(conf.algorithm, conf.digestLength),
        std::move(sink))
{
}

HashSession::HashSession(SessionConfig conf, std::shared_ptr<PathSource> source, DigestFactory factory, Sink sink):
    conf_(std::move(conf)),
    collector_(std::move(sink)),
    source_(std::move(source)),
    factory_(std::move(factory))
{
    if (!source_)
        throw std::invalid_argument("HashSession: no path source.");

    if (!factory_)
        throw std::invalid_argument("HashSession: no digest factory.");

    if (!conf_.workerCount)
        throw std::invalid_argument("HashSession: worker count must be at least 1.");
}

HashSession::~HashSession() noexcept
{
    cancel();
}

std::shared_ptr<PathSource> HashSession::makeSource(const SessionConfig &conf)
{
    switch (conf.mode)
    {
        case InputMode::Directory:
            if (conf.inputs.size() != 1)
                throw std::invalid_argument("directory input takes exactly one root.");

            return std::make_shared<DirectoryWalk>(conf.inputs.front(), conf.walkerCount);
        case InputMode::Stdin:
            return std::make_shared<StdinStream>();
        case InputMode::Files:
            return std::make_shared<ExplicitList>(conf.inputs);
    }

    throw std::invalid_argument("HashSession: bad input mode.");
}

void HashSession::start()
{
    if (started_)
        throw std::logic_error("HashSession: already started.");

    started_ = true;
    startTime_ = Clock::now();

    const auto capacity = source_->queueCapacity(conf_.workerCount, conf_.bufferFactor);
    queue_.setSizeLimit(capacity);

    source_->bind(
        queue_,
        [this](uint64_t total) { collector_.setExpected(total); },
        &stats_);

    for (size_t i = 0; i < conf_.workerCount; ++i)
    {
        hashExec_.add(Hasher{
            queue_,
            factory_,
            [this](ResultItem result) {
                try {
                    collector_.deliver(std::move(result));
                } catch (...) {
                    fail(std::current_exception());
                }
            },
            &stats_});
    }
    sourceExec_.add(SourceRunner{source_});

    spdlog::info("hash session: {} hashers, dispatch queue limit {}"
        , conf_.workerCount
        , capacity == std::numeric_limits<size_t>::max() ?
            std::string{"none"} : std::to_string(capacity));
}

bool HashSession::runOnce()
{
    using namespace std::chrono_literals;

    if (!started_)
        throw std::logic_error("HashSession: not started.");

    if (finished_)
        return false;

    collector_.wait(Clock::now() + 50ms);

    rethrowFailures();

    hashExec_.runOnce();
    sourceExec_.runOnce();

    if (!collector_.complete())
    {
        // every hasher died: nobody is left to finish the run.
        if (hashExec_.empty())
        {
            cancel();
            throw std::runtime_error("hash session: all hashers exited early.");
        }

        return true;
    }

    // queue is closed and drained, the hashers are on their way out.
    sourceExec_.waitFinished();
    hashExec_.waitFinished();

    finished_ = true;
    endTime_ = Clock::now();

    spdlog::info("hash session: complete, {} results.", collector_.emitted());

    return false;
}

void HashSession::cancel() noexcept
{
    if (finished_)
        return;

    if (started_)
        spdlog::debug("hash session: cancelling.");

    sourceExec_.cancel();
    queue_.cancel();
    hashExec_.cancel();
    collector_.cancel();

    sourceExec_.waitFinished();
    hashExec_.waitFinished();

    finished_ = true;

    if (started_)
        endTime_ = Clock::now();
}

bool HashSession::finished() const
{
    return finished_;
}

HashSession::Summary HashSession::summary() const
{
    const auto end = finished_ ? endTime_ : Clock::now();
    const auto produced = source_->produced();
    const auto emitted = collector_.emitted();

    return {
        .produced = produced,
        .emitted = emitted,
        .errors = stats_.errorCount,
        .bytes = stats_.byteCount,
        .skipped = stats_.skippedCount,
        .unprocessed = produced > emitted ? produced - emitted : 0,
        .elapsedSec = started_ ? std::chrono::duration<double>(end - startTime_).count() : 0.0,
        .complete = collector_.complete()
    };
}

const Stats &HashSession::stats() const noexcept
{
    return stats_;
}

const DispatchQueue &HashSession::queue() const noexcept
{
    return queue_;
}

const OrderedCollector &HashSession::collector() const noexcept
{
    return collector_;
}

void HashSession::fail(std::exception_ptr err) noexcept
{
    {
        std::lock_guard lk(failureMtx_);

        if (!failure_)
            failure_ = std::move(err);
    }

    collector_.cancel();
}

void HashSession::rethrowFailures()
{
    auto failure = [this] {
            std::lock_guard lk(failureMtx_);
            return failure_;
        }();

    if (failure)
    {
        cancel();
        std::rethrow_exception(failure);
    }

    if (auto err = source_->error())
    {
        cancel();
        std::rethrow_exception(err);
    }

    if (auto err = collector_.error())
    {
        cancel();
        std::rethrow_exception(err);
    }
}

}
