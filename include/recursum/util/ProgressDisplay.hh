/**
 * @file ProgressDisplay.hh
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

#ifndef __RECURSUM_UTIL_PROGRESS_DISPLAY_HH__
#define __RECURSUM_UTIL_PROGRESS_DISPLAY_HH__

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include "Stats.hh"

namespace recursum::ui {

namespace term {

struct CursorInvisible { };
struct CursorVisible { };
struct CursorCol { size_t col{ }; };
struct EraseLine { };

inline std::ostream &operator<<(std::ostream &s, const CursorInvisible &)
{
    return s << "\x1b[?25l";
}

inline std::ostream &operator<<(std::ostream &s, const CursorVisible &)
{
    return s << "\x1b[?25h";
}

inline std::ostream &operator<<(std::ostream &s, const CursorCol &c)
{
    return s << "\x1b[" << c.col << 'G';
}

inline std::ostream &operator<<(std::ostream &s, const EraseLine &)
{
    return s << "\x1b[2K";
}

}

namespace io {

struct HumanBytes { uint64_t bytes{ }; };
struct HumanDuration { double sec{ }; };

std::ostream &operator<<(std::ostream &stream, const HumanBytes &b);
std::ostream &operator<<(std::ostream &stream, const HumanDuration &d);

struct WhirlyState
{
public:
    static constexpr const char Chars[] = "|/-\\";

    void tick() noexcept
    {
        if (++idx_ >= sizeof(Chars) - 1)
            idx_ = 0;
    }

    char get() const noexcept
    {
        return Chars[idx_];
    }

private:
    size_t idx_{ };
};

}

/**
 * Side-channel progress: a spinner line redrawn in place (interactive
 * terminals only) and a summary line at the end. Reads counters only, so
 * it has no bearing on what goes to stdout.
 */
class ProgressDisplay
{
public:
    using Clock = std::chrono::steady_clock;

    struct Summary
    {
        uint64_t files{ };
        uint64_t bytes{ };
        uint64_t errors{ };
        uint64_t skipped{ };
        double elapsedSec{ };
    };

    ProgressDisplay(const util::Stats &stats, std::ostream &out, bool interactive);
    ~ProgressDisplay() noexcept;

    ProgressDisplay(const ProgressDisplay &) = delete;
    ProgressDisplay &operator=(const ProgressDisplay &) = delete;

    // redraw the status line, at most every 100ms.
    void update();

    // clear the status line and print the summary.
    void finish(const Summary &summary);

    static std::string summaryLine(const Summary &summary);

private:
    void clear();

    const util::Stats *stats_{ };
    std::ostream *out_{ };
    bool interactive_{ };
    bool drawn_{ };

    Clock::time_point start_{Clock::now()};
    Clock::time_point nextUpdate_{ };
    util::BandwidthMonitor bw_{ };
    io::WhirlyState whirly_{ };
};

}

#endif
