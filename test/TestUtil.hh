/**
 * @file TestUtil.hh
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

#ifndef __RECURSUM_TEST_UTIL_HH__
#define __RECURSUM_TEST_UTIL_HH__

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <stdlib.h>
#include <unistd.h>

#include <recursum/util/Digest.hh>
#include <recursum/util/ScopedFd.hh>

namespace recursum::test {

namespace fs = std::filesystem;

class TempDir
{
public:
    TempDir()
    {
        auto tmpl = (fs::temp_directory_path() / "recursum_gtest.XXXXXX").string();

        if (!::mkdtemp(tmpl.data()))
            throw std::system_error(errno, std::system_category(), "mkdtemp");

        path_ = tmpl;
    }

    ~TempDir() noexcept
    {
        auto ec = std::error_code{ };
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const noexcept
    {
        return path_;
    }

    fs::path write(const std::string &rel, const std::string &content) const
    {
        const auto p = path_ / rel;
        fs::create_directories(p.parent_path());

        std::ofstream out(p, std::ios::binary);
        out << content;

        return p;
    }

    fs::path mkdir(const std::string &rel) const
    {
        const auto p = path_ / rel;
        fs::create_directories(p);
        return p;
    }

private:
    fs::path path_;
};

// read end of a pipe that yields `data`, then end of file.
inline util::ScopedFd pipeWith(const std::string &data)
{
    int fds[2];

    if (::pipe(fds))
        throw std::system_error(errno, std::system_category(), "pipe");

    auto rd = util::ScopedFd{fds[0]};
    auto wr = util::ScopedFd{fds[1]};

    for (size_t off = 0; off < data.size(); )
    {
        const auto len = ::write(wr.get(), data.data() + off, data.size() - off);

        if (len < 0)
            throw std::system_error(errno, std::system_category(), "write");

        off += static_cast<size_t>(len);
    }

    return rd;
}

inline std::string digestOf(const std::string &content, util::Algorithm algorithm = util::Algorithm::Xxh3_128)
{
    auto digest = util::makeDigest(algorithm);
    digest->update(content.data(), content.size());
    return digest->finalize();
}

// wait for pred(), up to tmo.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds tmo = std::chrono::seconds(5))
{
    using namespace std::chrono_literals;

    const auto deadline = std::chrono::steady_clock::now() + tmo;

    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;

        std::this_thread::sleep_for(1ms);
    }

    return true;
}

}

#endif
