/**
 * @file DirectoryWalk.cc
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
#include <chrono>

#include <spdlog/spdlog.h>

#include <recursum/util/DirectoryWalk.hh>

namespace fs = std::filesystem;

namespace recursum::util {

DirectoryWalk::DirectoryWalk(fs::path root, size_t walkerCount, Lister lister):
    root_(std::move(root)),
    readAhead_(std::max(size_t{1}, walkerCount)),
    lister_(lister ? std::move(lister) : Lister{listDirectory}),
    pool_(std::max(size_t{1}, walkerCount), "walker pool")
{
    auto ec = std::error_code{ };

    if (!fs::is_directory(root_, ec))
    {
        throw SourceError(fmt::format("walk root '{}' is not a directory{}"
            , root_.string()
            , ec ? fmt::format(" ({})", ec.message()) : std::string{ }));
    }
}

size_t DirectoryWalk::queueCapacity(size_t workerCount, double factor) const
{
    return util::queueCapacity(workerCount, factor);
}

DirectoryWalk::Listing DirectoryWalk::listDirectory(const fs::path &dir, std::stop_token stopToken)
{
    auto listing = Listing{ };
    auto &ec = listing.error;

    for (auto iter = fs::directory_iterator(dir, ec);
        !ec && iter != fs::directory_iterator{ } && !stopToken.stop_requested();
        iter.increment(ec))
    {
        auto statusEc = std::error_code{ };
        const auto status = iter->symlink_status(statusEc);

        if (statusEc)
        {
            // most likely deleted out from under us.
            spdlog::warn("walk: skipping '{}': {}", iter->path().string(), statusEc.message());
            ++listing.skipped;
            continue;
        }

        if (fs::is_regular_file(status))
            listing.entries.push_back({iter->path(), false});
        else if (fs::is_directory(status))
            listing.entries.push_back({iter->path(), true});
    }

    std::sort(
        begin(listing.entries),
        end(listing.entries),
        [](const auto &a, const auto &b) {
            return a.path.filename().native() < b.path.filename().native();
        });

    return listing;
}

bool DirectoryWalk::produce(std::stop_token stopToken)
{
    if (!started_)
    {
        started_ = true;

        auto listing = lister_(root_, stopToken);

        if (listing.error)
        {
            throw SourceError(fmt::format("cannot read walk root '{}': {}"
                , root_.string()
                , listing.error.message()));
        }

        spdlog::info("walk: {} ({} walkers)", root_.string(), pool_.size());

        countSkipped(listing);
        pushFrame(std::move(listing.entries));
    }

    while (!stack_.empty() && !stopToken.stop_requested())
    {
        auto &frame = stack_.back();

        if (frame.pos >= frame.entries.size())
        {
            stack_.pop_back();
            continue;
        }

        prefetch(frame);

        const auto idx = frame.pos++;
        const auto &entry = frame.entries[idx];

        if (!entry.isDir)
            return emit(entry.path.string(), stopToken);

        auto listing = awaitListing(frame, idx, stopToken);

        if (!listing)
            return false;

        if (listing->error)
            skipDirectory(entry.path, listing->error);

        countSkipped(*listing);

        // invalidates frame.
        if (!listing->entries.empty())
            pushFrame(std::move(listing->entries));
    }

    return false;
}

void DirectoryWalk::pushFrame(std::vector<Entry> entries)
{
    auto frame = Frame{ };
    frame.listings.resize(entries.size());
    frame.entries = std::move(entries);

    stack_.push_back(std::move(frame));
}

void DirectoryWalk::prefetch(Frame &frame)
{
    while (frame.inflight < readAhead_ && frame.prefetchPos < frame.entries.size())
    {
        const auto idx = frame.prefetchPos++;
        const auto &entry = frame.entries[idx];

        if (!entry.isDir)
            continue;

        auto future = pool_.launch(
            [&lister = lister_](std::stop_token token, fs::path dir) {
                return lister(dir, token);
            },
            entry.path);

        // a cancelled pool leaves the future invalid; the walk lists the
        // directory itself when it gets there.
        if (future)
            frame.listings[idx] = std::move(*future);

        ++frame.inflight;
    }
}

std::optional<DirectoryWalk::Listing> DirectoryWalk::awaitListing(Frame &frame, size_t idx, std::stop_token stopToken)
{
    using namespace std::chrono_literals;

    auto future = std::move(frame.listings[idx]);

    if (idx < frame.prefetchPos && frame.inflight)
        --frame.inflight;

    if (!future.valid())
        return lister_(frame.entries[idx].path, stopToken);

    while (future.wait_for(50ms) != std::future_status::ready)
    {
        if (stopToken.stop_requested())
            return { };
    }

    return future.get();
}

void DirectoryWalk::skipDirectory(const fs::path &dir, const std::error_code &ec)
{
    spdlog::warn("walk: skipping directory '{}': {}", dir.string(), ec.message());

    if (auto s = stats())
        ++s->skippedCount;
}

void DirectoryWalk::countSkipped(const Listing &listing)
{
    if (!listing.skipped)
        return;

    if (auto s = stats())
        s->skippedCount += listing.skipped;
}

}
