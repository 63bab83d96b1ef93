/* @file recursum.cc
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

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <getopt.h>
#include <libgen.h>
#include <unistd.h>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <recursum/util/HashSession.hh>
#include <recursum/util/OutputWriter.hh>
#include <recursum/util/ProgressDisplay.hh>
#include <recursum/util/Util.hh>
#include <recursum/util/Version.hh>

namespace {

using recursum::util::SessionConfig;

volatile sig_atomic_t done_;

void handleSigint(int)
{
    if (done_)
    {
        static constexpr char msg[] = "recursum: interrupted twice - exiting NOW\n";
        [[maybe_unused]] auto len = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        std::_Exit(2);
    }

    done_ = 1;
}

void handleSigpipe(int)
{
    done_ = 1;
}

void installSigHandlers()
{
    struct sigaction action{ };

    action.sa_handler = handleSigint;
    sigaction(SIGINT, &action, nullptr);

    action.sa_handler = handleSigpipe;
    sigaction(SIGPIPE, &action, nullptr);
}

void initLogging()
{
    // stdout carries the results, keep log messages off of it.
    auto logger = spdlog::stderr_color_mt("recursum");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);

    spdlog::cfg::load_env_levels();
}

struct Options
{
    SessionConfig config;
    unsigned verbosity{ };
};

Options parseOptions(int argc, char **argv)
{
    using namespace recursum;

    static constexpr const char *shortOpts = "a:b:cd:hqs:t:vw:";
    static constexpr struct option longOpts[] = {
        {"algorithm", required_argument, nullptr, 'a'},
        {"buffer-factor", required_argument, nullptr, 'b'},
        {"compatible", no_argument, nullptr, 'c'},
        {"digest-length", required_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {"quiet", no_argument, nullptr, 'q'},
        {"separator", required_argument, nullptr, 's'},
        {"threads", required_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'},
        {"walkers", required_argument, nullptr, 'w'},
        {nullptr, 0, nullptr, 0}
    };

    const auto usage = [argv] {
            std::cerr << fmt::format(
                "usage: {} [-a <algorithm>][-b <factor>][-c][-d <length>][-h][-q][-s <separator>][-t <threads>][-v][-w <walkers>] <input>...\n"
                , ::basename(argv[0]));
        };

    const auto help = [argv] {
            std::cout << fmt::format(
                "usage: {} OPTIONS <input>...\n"
                "  hash lots of files fast, in parallel. output order follows input order.\n"
                "  <input> is one or more file names, one directory name (every file below it\n"
                "  is hashed, depth first), or '-' to read file names from stdin, one per line.\n"
                "  OPTIONS:\n"
                "   -a | --algorithm <name>\n"
                "       digest algorithm: xxh3-128 (default), xxh3-64, xxh64, xxh32.\n"
                "   -b | --buffer-factor <factor>\n"
                "       paths queued per hashing thread when walking a directory (default: {}).\n"
                "   -c | --compatible\n"
                "       print the digest first, md5sum style. the default separator becomes two spaces.\n"
                "   -d | --digest-length <length>\n"
                "       maximum length of output digests, in hex chars.\n"
                "   -h | --help\n"
                "       show this help.\n"
                "   -q | --quiet\n"
                "       no progress display or summary.\n"
                "   -s | --separator <separator>\n"
                "       separator between path and digest (default: tab).\n"
                "       '\\t' for tab and '\\0' for null, which can't be mixed with other chars.\n"
                "   -t | --threads <count>\n"
                "       hashing threads (default: {}).\n"
                "   -v | --verbose\n"
                "       more log output on stderr, repeat for more still.\n"
                "   -w | --walkers <count>\n"
                "       directory listing threads, if <input> is a directory (default: {}).\n"
                , ::basename(argv[0])
                , util::DefaultBufferFactor
                , util::defaultConcurrency()
                , util::defaultConcurrency());
        };

    auto opts = Options{ };
    auto &conf = opts.config;
    auto separator = std::optional<std::string>{ };

    conf.workerCount = util::defaultConcurrency();
    conf.walkerCount = util::defaultConcurrency();

    int c = 0;

    try
    {
        while ((c = getopt_long(argc, argv, shortOpts, longOpts, 0)) >= 0)
        {
            switch (c)
            {
                case 'a':
                    conf.algorithm = util::parseAlgorithm(optarg);
                    break;
                case 'b':
                    conf.bufferFactor = util::parseFactor(optarg);
                    break;
                case 'c':
                    conf.hashFirst = true;
                    break;
                case 'd':
                    conf.digestLength = util::parseSize(optarg);
                    break;
                case 'h':
                    help();
                    std::exit(0);
                case 'q':
                    conf.quiet = true;
                    break;
                case 's':
                    separator = util::parseSeparator(optarg);
                    break;
                case 't':
                    conf.workerCount = util::parseSize(optarg);
                    break;
                case 'v':
                    ++opts.verbosity;
                    break;
                case 'w':
                    conf.walkerCount = util::parseSize(optarg);
                    break;
                case '?':
                    usage();
                    std::exit(1);
                default:
                    break;
            }
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << fmt::format("invalid value for option -{}: {}\n"
            , static_cast<char>(c)
            , e.what());
        usage();
        std::exit(1);
    }

    if (optind >= argc)
    {
        std::cerr << "missing required argument: <input>\n";
        usage();
        std::exit(1);
    }

    conf.inputs.assign(argv + optind, argv + argc);

    conf.separator = separator.value_or(conf.hashFirst ?
        util::CompatibleSeparator : util::DefaultSeparator);

    if (opts.verbosity == 1)
        spdlog::set_level(spdlog::level::info);
    else if (opts.verbosity > 1)
        spdlog::set_level(spdlog::level::debug);

    conf.mode = util::resolveInputMode(conf.inputs);

    return opts;
}

int run(const Options &opts)
{
    using namespace recursum;

    const auto &conf = opts.config;

    spdlog::info("inputs ({}), {} digests, {} hashers"
        , conf.inputs.size()
        , util::algorithmName(conf.algorithm)
        , conf.workerCount);

    auto out = util::OutputWriter{
            std::cout,
            {.separator = conf.separator, .hashFirst = conf.hashFirst}
        };

    auto session = util::HashSession{
            conf,
            [&out](const util::ResultItem &item) { out.write(item); }
        };

    auto progress = ui::ProgressDisplay{
            session.stats(),
            std::cerr,
            !conf.quiet && ::isatty(STDERR_FILENO)
        };

    installSigHandlers();

    session.start();

    while (!done_ && session.runOnce())
        progress.update();

    if (done_)
        session.cancel();

    out.flush();

    const auto summary = session.summary();
    // a signal that lands after the last result interrupts nothing.
    const auto interrupted = done_ && !summary.complete;

    if (!conf.quiet)
    {
        progress.finish({
            .files = summary.emitted,
            .bytes = summary.bytes,
            .errors = summary.errors,
            .skipped = summary.skipped,
            .elapsedSec = summary.elapsedSec
        });
    }

    if (interrupted)
    {
        spdlog::warn("interrupted: {} of {} queued files not processed."
            , summary.unprocessed
            , summary.produced);

        return 1;
    }

    return 0;
}

}

int main(int argc, char **argv)
{
    initLogging();

    spdlog::debug("recursum build {}", recursum::util::versionString());

    try {
        return run(parseOptions(argc, argv));
    } catch (const std::exception &ex) {
        std::cout.flush();
        spdlog::error("{}", ex.what());
        return 1;
    }
}
