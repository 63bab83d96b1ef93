/**
 * @file Util.cc
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
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <limits>
#include <thread>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include <recursum/util/Util.hh>

namespace fs = std::filesystem;

namespace recursum::util {

size_t readChunk(int fd, void *data, size_t dlen, size_t fileOffset)
{
    auto buf = reinterpret_cast<uint8_t *>(data);

    for (size_t offset = 0; offset < dlen; )
    {
        auto len = ::pread(fd, buf + offset, dlen - offset, static_cast<off_t>(fileOffset + offset));

        if (len < 0)
        {
            if (errno == EINTR)
                continue;

            throw std::system_error(errno, std::system_category(), "read");
        }

        if (!len)
            return offset;

        offset += static_cast<size_t>(len);
    }

    return dlen;
}

size_t parseSize(const std::string &str)
{
    auto sz = size_t{ };
    const auto *end = str.data() + str.size();

    // from_chars takes no sign and no leading whitespace.
    const auto [ptr, ec] = std::from_chars(str.data(), end, sz);

    if (ec != std::errc{ } || ptr != end || !sz)
        throw std::invalid_argument(fmt::format("expected a positive integer: '{}'", str));

    return sz;
}

double parseFactor(const std::string &str)
{
    size_t pos{ };
    double factor{ };

    if (!str.empty() && !std::isspace(static_cast<unsigned char>(str.front())))
    {
        try {
            factor = std::stod(str, &pos);
        } catch (const std::logic_error &) {
            pos = 0;
        }
    }

    if (!pos || pos != str.size() || !std::isfinite(factor) || factor <= 0.0)
        throw std::invalid_argument(fmt::format("expected a positive number: '{}'", str));

    return factor;
}

std::string parseSeparator(const std::string &str)
{
    if (str == "\\t")
        return "\t";

    if (str == "\\0")
        return std::string(1, '\0');

    return str;
}

size_t defaultConcurrency() noexcept
{
    return std::max(1u, std::thread::hardware_concurrency());
}

size_t queueCapacity(size_t workerCount, double factor)
{
    const auto cap = std::ceil(static_cast<double>(workerCount) * factor);

    if (cap >= static_cast<double>(std::numeric_limits<size_t>::max()))
        return std::numeric_limits<size_t>::max();

    return std::max(size_t{1}, static_cast<size_t>(cap));
}

InputMode resolveInputMode(const std::vector<std::string> &inputs)
{
    if (inputs.empty())
        throw std::invalid_argument("no input given");

    if (inputs.size() > 1)
        return InputMode::Files;

    const auto &input = inputs.front();

    if (input == "-")
        return InputMode::Stdin;

    auto ec = std::error_code{ };
    const auto status = fs::status(input, ec);

    if (fs::is_directory(status))
        return InputMode::Directory;

    if (!fs::exists(status))
    {
        throw SourceError(fmt::format(
            "input '{}' is not a directory, a file, or '-' for stdin{}"
            , input
            , ec ? fmt::format(" ({})", ec.message()) : std::string{ }));
    }

    return InputMode::Files;
}

}
