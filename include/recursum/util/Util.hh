/**
 * @file Util.hh
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

#ifndef __RECURSUM_UTIL_HH__
#define __RECURSUM_UTIL_HH__

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "Digest.hh"
#include "ScopedFd.hh"
#include "WaitQueue.hh"

namespace recursum::util {

constexpr auto ReadSize = size_t{1u << 18};
constexpr auto DefaultBufferFactor = 3.0;

constexpr auto DefaultSeparator = "\t";
constexpr auto CompatibleSeparator = "  ";

struct PathItem
{
    uint64_t index{ };
    std::string path;
};

struct FileError
{
    std::error_code code{ };
    std::string reason{ };
};

struct ResultItem
{
    uint64_t index{ };
    std::string path;
    std::variant<std::string, FileError> outcome{ };
    uint64_t size{ };

    bool ok() const noexcept
    {
        return std::holds_alternative<std::string>(outcome);
    }

    const std::string &digest() const
    {
        return std::get<std::string>(outcome);
    }

    const FileError &error() const
    {
        return std::get<FileError>(outcome);
    }
};

// the path source cannot go on: missing root, broken stdin.
class SourceError: public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class InputMode
{
    Files,
    Directory,
    Stdin
};

struct SessionConfig
{
    InputMode mode{InputMode::Files};
    std::vector<std::string> inputs{ };
    size_t workerCount{1};
    size_t walkerCount{1};
    double bufferFactor{DefaultBufferFactor};
    std::optional<size_t> digestLength{ };
    Algorithm algorithm{Algorithm::Xxh3_128};
    std::string separator{DefaultSeparator};
    bool hashFirst{ };
    bool quiet{ };
};

using DispatchQueue = WaitQueue<PathItem>;

size_t readChunk(int fd, void *data, size_t dlen, size_t fileOffset);

size_t parseSize(const std::string &str);
double parseFactor(const std::string &str);
std::string parseSeparator(const std::string &str);

size_t defaultConcurrency() noexcept;
size_t queueCapacity(size_t workerCount, double factor);

InputMode resolveInputMode(const std::vector<std::string> &inputs);

}

#endif
