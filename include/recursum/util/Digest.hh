/**
 * @file Digest.hh
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

#ifndef __RECURSUM_UTIL_DIGEST_HH__
#define __RECURSUM_UTIL_DIGEST_HH__

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace recursum::util {

enum class Algorithm
{
    Xxh3_128,
    Xxh3_64,
    Xxh64,
    Xxh32
};

/**
 * Streaming content digest. One instance hashes exactly one file.
 */
class Digest
{
public:
    virtual ~Digest() = default;

    virtual void update(const void *data, size_t len) = 0;

    // lowercase hex of the canonical digest bytes.
    virtual std::string finalize() = 0;
};

using DigestPtr = std::unique_ptr<Digest>;
using DigestFactory = std::function<DigestPtr()>;

Algorithm parseAlgorithm(std::string_view name);
std::string_view algorithmName(Algorithm algorithm) noexcept;

// full digest length, in hex chars.
size_t digestLength(Algorithm algorithm) noexcept;

DigestPtr makeDigest(Algorithm algorithm);

// digests from the factory are cut to maxLength hex chars, if given.
// lengths past the natural digest length leave it whole.
DigestFactory makeDigestFactory(Algorithm algorithm, std::optional<size_t> maxLength = { });

std::string toHex(const uint8_t *data, size_t len);

}

#endif
