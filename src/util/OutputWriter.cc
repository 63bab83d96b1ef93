/**
 * @file OutputWriter.cc
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

#include <spdlog/spdlog.h>

#include <recursum/util/OutputWriter.hh>

namespace recursum::util {

OutputWriter::OutputWriter(std::ostream &out, Format format):
    out_(&out),
    format_(std::move(format))
{
}

std::string OutputWriter::format(const ResultItem &item) const
{
    const auto digest = item.ok() ?
        item.digest() :
        fmt::format("<ERROR: {}>", item.error().reason);

    if (format_.hashFirst)
        return fmt::format("{}{}{}", digest, format_.separator, item.path);

    return fmt::format("{}{}{}", item.path, format_.separator, digest);
}

void OutputWriter::write(const ResultItem &item)
{
    *out_ << format(item) << '\n';

    if (!*out_)
        throw std::system_error(std::make_error_code(std::errc::io_error), "output write");

    ++lineCount_;
}

void OutputWriter::flush()
{
    out_->flush();

    if (!*out_)
        throw std::system_error(std::make_error_code(std::errc::io_error), "output flush");
}

uint64_t OutputWriter::lineCount() const noexcept
{
    return lineCount_;
}

}
