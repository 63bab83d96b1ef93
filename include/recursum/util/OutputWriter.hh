/**
 * @file OutputWriter.hh
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

#ifndef __RECURSUM_UTIL_OUTPUT_WRITER_HH__
#define __RECURSUM_UTIL_OUTPUT_WRITER_HH__

#include <ostream>
#include <string>

#include "Util.hh"

namespace recursum::util {

/**
 * One line per result: `path<sep>digest`, or `digest<sep>path` in
 * compatible mode. Failures print `<ERROR: reason>` where the digest goes.
 */
class OutputWriter
{
public:
    struct Format
    {
        std::string separator{DefaultSeparator};
        bool hashFirst{ };
    };

    OutputWriter(std::ostream &out, Format format);

    void write(const ResultItem &item);
    void flush();

    std::string format(const ResultItem &item) const;

    uint64_t lineCount() const noexcept;

private:
    std::ostream *out_{ };
    Format format_{ };
    uint64_t lineCount_{ };
};

}

#endif
