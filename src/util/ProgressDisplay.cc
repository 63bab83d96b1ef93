/**
 * @file ProgressDisplay.cc
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

#include <array>
#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>

#include <recursum/util/ProgressDisplay.hh>

namespace recursum::ui {

namespace io {

std::ostream &operator<<(std::ostream &stream, const HumanBytes &b)
{
    static constexpr std::array Units = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

    auto value = static_cast<double>(b.bytes);
    size_t unit = 0;

    while (value >= 1024.0 && unit + 1 < Units.size())
    {
        value /= 1024.0;
        ++unit;
    }

    if (!unit)
        return stream << b.bytes << " B";

    return stream << fmt::format("{:.2f} {}", value, Units[unit]);
}

std::ostream &operator<<(std::ostream &stream, const HumanDuration &d)
{
    using namespace std::chrono;
    using namespace std::chrono_literals;

    const auto dur = duration<double>{d.sec};

    if (dur < 1min)
        return stream << fmt::format("{:.2f} s", dur.count());

    const auto h = duration_cast<hours>(dur);
    const auto m = duration_cast<minutes>(dur - h);
    const auto s = duration_cast<seconds>(dur - h - m);

    if (h > hours::zero())
        stream << h.count() << " h ";

    return stream << m.count() << " m " << s.count() << " s";
}

}

ProgressDisplay::ProgressDisplay(const util::Stats &stats, std::ostream &out, bool interactive):
    stats_(&stats),
    out_(&out),
    interactive_(interactive)
{
    if (interactive_)
        *out_ << term::CursorInvisible{ } << std::flush;
}

ProgressDisplay::~ProgressDisplay() noexcept
{
    if (interactive_)
    {
        clear();
        *out_ << term::CursorVisible{ } << std::flush;
    }
}

void ProgressDisplay::update()
{
    using namespace std::chrono_literals;

    if (!interactive_)
        return;

    const auto now = Clock::now();

    if (now < nextUpdate_)
        return;

    nextUpdate_ = now + 100ms;

    const auto bytes = stats_->byteCount.load();
    const auto rate = bw_.update(bytes);
    const auto elapsed = std::chrono::duration<double>(now - start_).count();

    whirly_.tick();

    *out_ << term::CursorCol{1} << term::EraseLine{ }
        << whirly_.get() << ' '
        << stats_->fileCount.load() << " files | "
        << io::HumanBytes{bytes} << " | "
        << io::HumanDuration{elapsed} << " | "
        << io::HumanBytes{static_cast<uint64_t>(rate)} << "/s"
        << std::flush;

    drawn_ = true;
}

void ProgressDisplay::finish(const Summary &summary)
{
    clear();

    *out_ << summaryLine(summary) << '\n' << std::flush;
}

std::string ProgressDisplay::summaryLine(const Summary &summary)
{
    const auto rate = summary.elapsedSec > 0.0 ?
        static_cast<uint64_t>(std::floor(static_cast<double>(summary.bytes) / summary.elapsedSec)) :
        uint64_t{ };

    std::ostringstream line;

    line << summary.files << " files (" << io::HumanBytes{summary.bytes} << ") hashed in "
        << io::HumanDuration{summary.elapsedSec}
        << " (" << io::HumanBytes{rate} << "/s)";

    if (summary.errors)
        line << ", " << summary.errors << " unreadable";

    if (summary.skipped)
        line << ", " << summary.skipped << " entries skipped";

    return line.str();
}

void ProgressDisplay::clear()
{
    if (!drawn_)
        return;

    *out_ << term::CursorCol{1} << term::EraseLine{ } << std::flush;
    drawn_ = false;
}

}
