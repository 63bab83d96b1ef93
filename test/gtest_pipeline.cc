/* @file gtest_pipeline.cc
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

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include <recursum/util/DirectoryWalk.hh>
#include <recursum/util/Hasher.hh>
#include <recursum/util/OrderedCollector.hh>
#include <recursum/util/PathSource.hh>
#include <recursum/util/ThreadExecutor.hh>
#include <recursum/util/Util.hh>

#include "TestUtil.hh"

namespace fs = std::filesystem;

using namespace recursum::util;
using namespace std::chrono_literals;

using recursum::test::TempDir;
using recursum::test::digestOf;
using recursum::test::eventually;
using recursum::test::pipeWith;

namespace {

ResultItem result(uint64_t index)
{
    return ResultItem{index, fmt::format("file{}", index), fmt::format("{:08x}", index), index};
}

struct SourceRunner
{
    std::shared_ptr<PathSource> source;

    bool runOnce(std::stop_token stopToken)
    {
        return source->runOnce(stopToken);
    }
};

// runs the source to the end on this thread. returns the reported total.
std::optional<uint64_t> runSource(PathSource &source, DispatchQueue &q, Stats *stats = nullptr)
{
    auto total = std::optional<uint64_t>{ };

    source.bind(q, [&total](uint64_t n) { total = n; }, stats);

    while (source.runOnce({ }))
        ;

    return total;
}

std::vector<PathItem> drain(DispatchQueue &q)
{
    std::vector<PathItem> items;

    while (auto item = q.get(1s))
        items.push_back(std::move(*item));

    return items;
}

std::vector<std::string> paths(const std::vector<PathItem> &items)
{
    std::vector<std::string> v;

    for (size_t i = 0; i < items.size(); ++i)
    {
        EXPECT_EQ(items[i].index, i);
        v.push_back(items[i].path);
    }

    return v;
}

}

////////////////////////////////////////////////////////////////////////////////
// OrderedCollector

TEST(ordered_collector, in_order)
{
    std::vector<uint64_t> seen;
    auto collector = OrderedCollector{[&seen](const ResultItem &r) { seen.push_back(r.index); }};

    collector.deliver(result(0));
    collector.deliver(result(1));

    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(collector.emitted(), 2u);
    EXPECT_EQ(collector.pending(), 0u);
    EXPECT_FALSE(collector.complete());
}

TEST(ordered_collector, out_of_order_waits_for_gap)
{
    std::vector<uint64_t> seen;
    auto collector = OrderedCollector{[&seen](const ResultItem &r) { seen.push_back(r.index); }};

    collector.deliver(result(2));
    collector.deliver(result(1));

    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(collector.pending(), 2u);
    EXPECT_EQ(collector.emitted(), 0u);

    collector.deliver(result(0));

    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 1, 2}));
    EXPECT_EQ(collector.pending(), 0u);
    EXPECT_EQ(collector.maxPending(), 2u);
}

TEST(ordered_collector, complete_after_expected)
{
    auto collector = OrderedCollector{nullptr};

    collector.deliver(result(1));
    collector.setExpected(2);

    EXPECT_FALSE(collector.complete());
    EXPECT_FALSE(collector.wait(std::chrono::steady_clock::now() + 10ms));

    collector.deliver(result(0));

    EXPECT_TRUE(collector.complete());
    EXPECT_TRUE(collector.wait(std::chrono::steady_clock::now() + 10ms));
    EXPECT_EQ(collector.expected(), 2u);
}

TEST(ordered_collector, empty_run)
{
    auto collector = OrderedCollector{nullptr};

    EXPECT_FALSE(collector.expected());

    collector.setExpected(0);

    EXPECT_TRUE(collector.complete());
    EXPECT_EQ(collector.emitted(), 0u);
}

TEST(ordered_collector, expected_below_emitted_throws)
{
    auto collector = OrderedCollector{nullptr};

    collector.deliver(result(0));
    collector.deliver(result(1));

    EXPECT_THROW(collector.setExpected(1), std::logic_error);
}

TEST(ordered_collector, duplicate_throws)
{
    auto collector = OrderedCollector{nullptr};

    collector.deliver(result(3));
    EXPECT_THROW(collector.deliver(result(3)), std::logic_error);
}

TEST(ordered_collector, stale_throws)
{
    auto collector = OrderedCollector{nullptr};

    collector.deliver(result(0));
    EXPECT_THROW(collector.deliver(result(0)), std::logic_error);
}

TEST(ordered_collector, past_expected_throws)
{
    auto collector = OrderedCollector{nullptr};

    collector.setExpected(2);
    EXPECT_THROW(collector.deliver(result(2)), std::logic_error);
}

TEST(ordered_collector, sink_failure_stops_emission)
{
    std::vector<uint64_t> seen;
    auto collector = OrderedCollector{
        [&seen](const ResultItem &r) {
            if (r.index == 1)
                throw std::runtime_error("sink full");

            seen.push_back(r.index);
        }};

    collector.deliver(result(2));
    collector.deliver(result(1));
    collector.deliver(result(0));

    EXPECT_EQ(seen, (std::vector<uint64_t>{0}));
    EXPECT_EQ(collector.emitted(), 1u);
    ASSERT_TRUE(collector.error());
    EXPECT_THROW(std::rethrow_exception(collector.error()), std::runtime_error);

    collector.setExpected(3);
    EXPECT_FALSE(collector.wait(std::chrono::steady_clock::now() + 1s));
    EXPECT_FALSE(collector.complete());

    // ignored from here on.
    EXPECT_NO_THROW(collector.deliver(result(3)));
}

TEST(ordered_collector, cancel_releases_wait)
{
    auto collector = OrderedCollector{nullptr};

    auto waiter = std::thread([&collector] {
        EXPECT_FALSE(collector.wait(std::chrono::steady_clock::now() + 10s));
    });

    std::this_thread::sleep_for(20ms);
    collector.cancel();
    waiter.join();

    // stays released, and nothing gets through after.
    EXPECT_FALSE(collector.wait(std::chrono::steady_clock::now() + 10s));
    EXPECT_FALSE(collector.complete());
    EXPECT_NO_THROW(collector.deliver(result(0)));
    EXPECT_EQ(collector.emitted(), 0u);
}

TEST(ordered_collector, concurrent_delivery)
{
    constexpr auto Count = 2000u;
    constexpr auto Threads = 8u;

    std::vector<uint64_t> order(Count);
    std::iota(begin(order), end(order), 0u);
    std::shuffle(begin(order), end(order), std::mt19937{1234});

    auto next = uint64_t{ };
    auto inOrder = true;

    auto collector = OrderedCollector{
        [&next, &inOrder](const ResultItem &r) {
            inOrder = inOrder && r.index == next;
            ++next;
        }};

    std::vector<std::thread> threads;

    for (auto t = 0u; t < Threads; ++t)
    {
        threads.emplace_back([&collector, &order, t] {
            for (auto i = t; i < Count; i += Threads)
                collector.deliver(result(order[i]));
        });
    }

    for (auto &thd : threads)
        thd.join();

    collector.setExpected(Count);

    EXPECT_TRUE(inOrder);
    EXPECT_EQ(next, Count);
    EXPECT_TRUE(collector.complete());
    EXPECT_EQ(collector.pending(), 0u);
    EXPECT_LE(collector.maxPending(), Count);
}

////////////////////////////////////////////////////////////////////////////////
// ExplicitList

TEST(explicit_list, emits_in_argument_order)
{
    auto q = DispatchQueue{ };
    auto source = ExplicitList{{"b", "a", "c", "a"}};
    Stats stats;

    EXPECT_EQ(source.queueCapacity(8, 3.0), 4u);

    const auto total = runSource(source, q, &stats);

    EXPECT_EQ(total, 4u);
    EXPECT_TRUE(source.finished());
    EXPECT_EQ(source.produced(), 4u);
    EXPECT_EQ(stats.queuedCount.load(), 4u);
    EXPECT_TRUE(q.closed());

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{"b", "a", "c", "a"}));
}

TEST(explicit_list, empty)
{
    auto q = DispatchQueue{ };
    auto source = ExplicitList{{ }};

    EXPECT_EQ(source.queueCapacity(1, 1.0), 1u);
    EXPECT_EQ(runSource(source, q), 0u);
    EXPECT_TRUE(q.drained());
}

TEST(explicit_list, unbound_throws)
{
    auto source = ExplicitList{{"a"}};

    EXPECT_THROW(source.runOnce({ }), std::logic_error);
}

////////////////////////////////////////////////////////////////////////////////
// StdinStream

TEST(stdin_stream, lines)
{
    auto fd = pipeWith("a\n\nb\r\n  c d\nlast");
    auto q = DispatchQueue{ };
    auto source = StdinStream{fd.get()};

    EXPECT_EQ(source.queueCapacity(1, 1.0), std::numeric_limits<size_t>::max());

    EXPECT_EQ(runSource(source, q), 4u);
    EXPECT_FALSE(source.error());

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{"a", "b", "  c d", "last"}));
}

TEST(stdin_stream, empty_input)
{
    auto fd = pipeWith("");
    auto q = DispatchQueue{ };
    auto source = StdinStream{fd.get()};

    EXPECT_EQ(runSource(source, q), 0u);
    EXPECT_TRUE(q.drained());
}

TEST(stdin_stream, large_input)
{
    std::string input;
    std::vector<std::string> expected;

    // spans several reads.
    for (auto i = 0; i < 5000; ++i)
    {
        expected.push_back(fmt::format("dir/some/longer/path/name{:06}", i));
        input += expected.back() + '\n';
    }

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    auto rd = ScopedFd{fds[0]};
    auto writer = std::thread([wr = ScopedFd{fds[1]}, &input] {
        for (size_t off = 0; off < input.size(); )
        {
            const auto len = ::write(wr.get(), input.data() + off, input.size() - off);

            if (len <= 0)
                break;

            off += static_cast<size_t>(len);
        }
    });

    auto q = DispatchQueue{ };
    auto source = StdinStream{rd.get()};

    EXPECT_EQ(runSource(source, q), expected.size());
    writer.join();

    EXPECT_EQ(paths(drain(q)), expected);
}

TEST(stdin_stream, lines_split_across_reads)
{
    using namespace std::chrono_literals;

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    auto rd = ScopedFd{fds[0]};
    auto writer = std::thread([wr = ScopedFd{fds[1]}] {
        for (const std::string part : {"a/b\nc/", "d\r\n\nlong/", "er/name\ne", "\nf"})
        {
            ASSERT_EQ(::write(wr.get(), part.data(), part.size()), static_cast<ssize_t>(part.size()));
            std::this_thread::sleep_for(20ms);
        }
    });

    auto q = DispatchQueue{ };
    auto source = StdinStream{rd.get()};

    EXPECT_EQ(runSource(source, q), 5u);
    writer.join();

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{
            "a/b", "c/d", "long/er/name", "e", "f"
        }));
}

TEST(stdin_stream, bad_fd_is_source_error)
{
    auto q = DispatchQueue{ };
    auto source = StdinStream{65535};

    EXPECT_FALSE(runSource(source, q));

    ASSERT_TRUE(source.error());
    EXPECT_THROW(std::rethrow_exception(source.error()), SourceError);
    EXPECT_FALSE(source.finished());
    EXPECT_FALSE(q.closed());
}

TEST(stdin_stream, stop_while_idle)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    // write end stays open: no input, no eof.
    auto rd = ScopedFd{fds[0]};
    auto wr = ScopedFd{fds[1]};

    auto q = DispatchQueue{ };
    auto source = std::make_shared<StdinStream>(rd.get());
    source->bind(q, nullptr);

    auto exec = ThreadExecutor{ };
    exec.add(SourceRunner{source});

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(exec.finished());

    exec.cancel();

    EXPECT_TRUE(eventually([&exec] { return exec.finished(); }));
    EXPECT_FALSE(source->finished());
}

////////////////////////////////////////////////////////////////////////////////
// DirectoryWalk

TEST(directory_walk, depth_first_name_order)
{
    TempDir tmp;
    const auto &root = tmp.path();

    tmp.write("f.txt", "f");
    tmp.write("b/d/e.txt", "e");
    tmp.write("b/c.txt", "c");
    tmp.write("a.txt", "a");
    tmp.mkdir("empty");

    auto q = DispatchQueue{ };
    auto walk = DirectoryWalk{root, 2};

    EXPECT_EQ(runSource(walk, q), 4u);

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{
            (root / "a.txt").string(),
            (root / "b" / "c.txt").string(),
            (root / "b" / "d" / "e.txt").string(),
            (root / "f.txt").string()
        }));
}

TEST(directory_walk, symlinks_excluded)
{
    TempDir tmp;
    const auto &root = tmp.path();

    tmp.write("a.txt", "a");
    tmp.write("sub/b.txt", "b");

    fs::create_symlink(root / "a.txt", root / "link");
    fs::create_directory_symlink(root / "sub", root / "dlink");
    fs::create_symlink(root / "missing", root / "dangling");

    auto q = DispatchQueue{ };
    auto walk = DirectoryWalk{root, 1};

    EXPECT_EQ(runSource(walk, q), 2u);

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{
            (root / "a.txt").string(),
            (root / "sub" / "b.txt").string()
        }));
}

TEST(directory_walk, order_independent_of_walkers)
{
    TempDir tmp;
    const auto &root = tmp.path();

    std::vector<std::string> expected;

    for (auto d = 0; d < 8; ++d)
    {
        for (auto f = 0; f < 10; ++f)
            expected.push_back(tmp.write(fmt::format("d{}/f{}", d, f), "x").string());

        expected.push_back(tmp.write(fmt::format("d{}/inner/g.txt", d), "g").string());
    }

    expected.push_back(tmp.write("top.txt", "t").string());

    for (const auto walkers : {1u, 3u, 16u})
    {
        auto q = DispatchQueue{ };
        auto walk = DirectoryWalk{root, walkers};

        EXPECT_EQ(runSource(walk, q), expected.size());
        EXPECT_EQ(paths(drain(q)), expected) << walkers << " walkers";
    }
}

TEST(directory_walk, empty_root)
{
    TempDir tmp;

    auto q = DispatchQueue{ };
    auto walk = DirectoryWalk{tmp.path(), 1};

    EXPECT_EQ(runSource(walk, q), 0u);
    EXPECT_TRUE(q.drained());
}

TEST(directory_walk, bad_root_throws)
{
    TempDir tmp;
    const auto file = tmp.write("a.txt", "a");

    EXPECT_THROW(DirectoryWalk(tmp.path() / "missing", 1), SourceError);
    EXPECT_THROW(DirectoryWalk(file, 1), SourceError);
}

TEST(directory_walk, list_directory)
{
    TempDir tmp;

    tmp.write("z", "z");
    tmp.write("y/x", "x");
    fs::create_symlink(tmp.path() / "z", tmp.path() / "a");

    const auto listing = DirectoryWalk::listDirectory(tmp.path());

    EXPECT_FALSE(listing.error);
    EXPECT_EQ(listing.skipped, 0u);
    ASSERT_EQ(listing.entries.size(), 2u);

    EXPECT_EQ(listing.entries[0].path.filename().string(), "y");
    EXPECT_TRUE(listing.entries[0].isDir);
    EXPECT_EQ(listing.entries[1].path.filename().string(), "z");
    EXPECT_FALSE(listing.entries[1].isDir);

    const auto missing = DirectoryWalk::listDirectory(tmp.path() / "missing");

    EXPECT_EQ(missing.error, std::errc::no_such_file_or_directory);
    EXPECT_TRUE(missing.entries.empty());
}

TEST(directory_walk, unreadable_directory_skipped)
{
    if (::geteuid() == 0)
        GTEST_SKIP() << "permissions do not apply to root";

    TempDir tmp;
    const auto &root = tmp.path();

    tmp.write("a.txt", "a");
    tmp.write("locked/hidden.txt", "h");
    tmp.write("z.txt", "z");

    fs::permissions(root / "locked", fs::perms::none);

    auto q = DispatchQueue{ };
    auto walk = DirectoryWalk{root, 2};
    Stats stats;

    EXPECT_EQ(runSource(walk, q, &stats), 2u);
    EXPECT_EQ(stats.skippedCount.load(), 1u);

    EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{
            (root / "a.txt").string(),
            (root / "z.txt").string()
        }));

    fs::permissions(root / "locked", fs::perms::owner_all);
}

TEST(directory_walk, vanished_entries_counted)
{
    TempDir tmp;
    const auto &root = tmp.path();

    tmp.write("a.txt", "a");
    tmp.write("gone.txt", "g");
    tmp.write("sub/b.txt", "b");
    tmp.write("sub/gone.txt", "g");
    tmp.write("sub/inner/gone.txt", "g");

    // Drops "gone.txt" the way a listing drops an entry deleted between
    // readdir and stat.
    auto lister = [](const fs::path &dir, std::stop_token token) {
            auto listing = DirectoryWalk::listDirectory(dir, token);
            const auto removed = std::erase_if(listing.entries, [](const auto &e) {
                    return e.path.filename() == "gone.txt";
                });

            listing.skipped += removed;
            return listing;
        };

    for (const auto walkers : {1u, 4u})
    {
        auto q = DispatchQueue{ };
        auto walk = DirectoryWalk{root, walkers, lister};
        Stats stats;

        EXPECT_EQ(runSource(walk, q, &stats), 2u);
        EXPECT_EQ(stats.skippedCount.load(), 3u) << walkers << " walkers";

        EXPECT_EQ(paths(drain(q)), (std::vector<std::string>{
                (root / "a.txt").string(),
                (root / "sub" / "b.txt").string()
            }));
    }
}

TEST(directory_walk, backpressure)
{
    constexpr auto Capacity = 4u;
    constexpr auto FileCount = 20u;

    TempDir tmp;

    for (auto i = 0u; i < FileCount; ++i)
        tmp.write(fmt::format("f{:02}", i), "x");

    auto q = DispatchQueue{ };
    q.setSizeLimit(Capacity);

    auto total = std::atomic<int64_t>{-1};
    auto walk = std::make_shared<DirectoryWalk>(tmp.path(), 2);
    walk->bind(q, [&total](uint64_t n) { total = static_cast<int64_t>(n); });

    auto exec = ThreadExecutor{ };
    exec.add(SourceRunner{walk});

    ASSERT_TRUE(eventually([&q] { return q.size() == Capacity; }));

    // nobody is consuming: the walk stalls at the limit.
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(q.size(), Capacity);
    EXPECT_EQ(walk->produced(), Capacity);
    EXPECT_FALSE(walk->finished());

    std::vector<PathItem> items;

    while (auto item = q.get(5s))
    {
        EXPECT_LE(q.size(), Capacity);
        items.push_back(std::move(*item));
    }

    EXPECT_EQ(paths(items).size(), FileCount);
    EXPECT_TRUE(walk->finished());
    EXPECT_EQ(total.load(), int64_t{FileCount});
}

////////////////////////////////////////////////////////////////////////////////
// Hasher

TEST(hasher, hash_file)
{
    TempDir tmp;
    const auto file = tmp.write("data", "hello world");

    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh3_128), nullptr};

    const auto r = hasher.hashFile({7, file.string()});

    EXPECT_EQ(r.index, 7u);
    EXPECT_EQ(r.path, file.string());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.digest(), digestOf("hello world"));
    EXPECT_EQ(r.size, 11u);
}

TEST(hasher, multi_chunk_file)
{
    TempDir tmp;

    std::string content(ReadSize * 2 + 123, '\0');

    for (size_t i = 0; i < content.size(); ++i)
        content[i] = static_cast<char>(i * 31 + 7);

    const auto file = tmp.write("big", content);

    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh64), nullptr};

    const auto r = hasher.hashFile({0, file.string()});

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.digest(), digestOf(content, Algorithm::Xxh64));
    EXPECT_EQ(r.size, content.size());
}

TEST(hasher, empty_file)
{
    TempDir tmp;
    const auto file = tmp.write("empty", "");

    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh32), nullptr};

    const auto r = hasher.hashFile({0, file.string()});

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.digest(), "02cc5d05");
    EXPECT_EQ(r.size, 0u);
}

TEST(hasher, missing_file)
{
    TempDir tmp;
    const auto file = tmp.path() / "missing";

    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh3_128), nullptr};

    const auto r = hasher.hashFile({3, file.string()});

    EXPECT_EQ(r.index, 3u);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, std::errc::no_such_file_or_directory);
    EXPECT_NE(r.error().reason.find("open"), std::string::npos);
}

TEST(hasher, directory_is_file_error)
{
    TempDir tmp;

    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh3_128), nullptr};

    const auto r = hasher.hashFile({0, tmp.path().string()});

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, std::errc::is_a_directory);
}

TEST(hasher, drains_queue)
{
    TempDir tmp;
    const auto a = tmp.write("a", "aaa");
    const auto b = tmp.write("b", "bbbb");

    auto q = DispatchQueue{ };
    ASSERT_TRUE(q.put({0, a.string()}));
    ASSERT_TRUE(q.put({1, (tmp.path() / "missing").string()}));
    ASSERT_TRUE(q.put({2, b.string()}));
    q.close();

    std::vector<ResultItem> results;
    Stats stats;

    auto hasher = Hasher{
        q,
        makeDigestFactory(Algorithm::Xxh3_64),
        [&results](ResultItem r) { results.push_back(std::move(r)); },
        &stats};

    while (hasher.runOnce({ }))
        ;

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].digest(), digestOf("aaa", Algorithm::Xxh3_64));
    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(results[2].digest(), digestOf("bbbb", Algorithm::Xxh3_64));

    EXPECT_EQ(stats.fileCount.load(), 3u);
    EXPECT_EQ(stats.errorCount.load(), 1u);
    EXPECT_EQ(stats.byteCount.load(), 7u);
}

TEST(hasher, keeps_waiting_on_open_queue)
{
    auto q = DispatchQueue{ };
    auto hasher = Hasher{q, makeDigestFactory(Algorithm::Xxh3_64), nullptr};

    EXPECT_TRUE(hasher.runOnce({ }));

    q.cancel();

    EXPECT_FALSE(hasher.runOnce({ }));
}
