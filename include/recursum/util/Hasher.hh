/**
 * @file Hasher.hh
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

#ifndef __RECURSUM_UTIL_HASHER_HH__
#define __RECURSUM_UTIL_HASHER_HH__

#include <functional>
#include <stop_token>
#include <vector>

#include "Stats.hh"
#include "Util.hh"

namespace recursum::util {

/**
 * Hashing worker. Pulls paths off the dispatch queue and hands one result
 * per path to the callback, in whatever order they finish. A file that
 * can't be opened or read yields a result carrying the error.
 */
class Hasher
{
public:
    using Callback = std::function<void(ResultItem)>;

    Hasher(DispatchQueue &queue, DigestFactory factory, Callback cb, Stats *stats = nullptr);

    // false once the queue is drained or cancelled.
    bool runOnce(std::stop_token stopToken);

    ResultItem hashFile(PathItem item);

private:
    uint64_t hash(int fd, Digest &digest);

    DispatchQueue *queue_{ };
    DigestFactory factory_{ };
    Callback cb_{ };
    Stats *stats_{ };
    std::vector<uint8_t> buf_{ };
};

}

#endif
