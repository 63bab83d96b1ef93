/**
 * @file Digest.cc
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

#include <memory>
#include <new>
#include <stdexcept>

#include <xxhash.h>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/bin_to_hex.h>

#include <recursum/util/Digest.hh>

namespace recursum::util {

namespace {

struct Xxh3StateDeleter
{
    void operator()(XXH3_state_t *state) const noexcept
    {
        XXH3_freeState(state);
    }
};

struct Xxh64StateDeleter
{
    void operator()(XXH64_state_t *state) const noexcept
    {
        XXH64_freeState(state);
    }
};

struct Xxh32StateDeleter
{
    void operator()(XXH32_state_t *state) const noexcept
    {
        XXH32_freeState(state);
    }
};

template <typename State, typename Deleter>
auto checkedState(State *state)
{
    if (!state)
        throw std::bad_alloc();

    return std::unique_ptr<State, Deleter>(state);
}

void checkStatus(XXH_errorcode stat, const char *what)
{
    if (stat != XXH_OK)
        throw std::runtime_error(fmt::format("xxhash: {} failed", what));
}

class Xxh3_128Digest: public Digest
{
public:
    Xxh3_128Digest():
        state_(checkedState<XXH3_state_t, Xxh3StateDeleter>(XXH3_createState()))
    {
        checkStatus(XXH3_128bits_reset(state_.get()), "XXH3_128bits_reset");
    }

    void update(const void *data, size_t len) override
    {
        checkStatus(XXH3_128bits_update(state_.get(), data, len), "XXH3_128bits_update");
    }

    std::string finalize() override
    {
        auto canonical = XXH128_canonical_t{ };
        XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(state_.get()));

        return toHex(canonical.digest, sizeof(canonical.digest));
    }

private:
    std::unique_ptr<XXH3_state_t, Xxh3StateDeleter> state_;
};

class Xxh3_64Digest: public Digest
{
public:
    Xxh3_64Digest():
        state_(checkedState<XXH3_state_t, Xxh3StateDeleter>(XXH3_createState()))
    {
        checkStatus(XXH3_64bits_reset(state_.get()), "XXH3_64bits_reset");
    }

    void update(const void *data, size_t len) override
    {
        checkStatus(XXH3_64bits_update(state_.get(), data, len), "XXH3_64bits_update");
    }

    std::string finalize() override
    {
        auto canonical = XXH64_canonical_t{ };
        XXH64_canonicalFromHash(&canonical, XXH3_64bits_digest(state_.get()));

        return toHex(canonical.digest, sizeof(canonical.digest));
    }

private:
    std::unique_ptr<XXH3_state_t, Xxh3StateDeleter> state_;
};

class Xxh64Digest: public Digest
{
public:
    Xxh64Digest():
        state_(checkedState<XXH64_state_t, Xxh64StateDeleter>(XXH64_createState()))
    {
        checkStatus(XXH64_reset(state_.get(), 0), "XXH64_reset");
    }

    void update(const void *data, size_t len) override
    {
        checkStatus(XXH64_update(state_.get(), data, len), "XXH64_update");
    }

    std::string finalize() override
    {
        auto canonical = XXH64_canonical_t{ };
        XXH64_canonicalFromHash(&canonical, XXH64_digest(state_.get()));

        return toHex(canonical.digest, sizeof(canonical.digest));
    }

private:
    std::unique_ptr<XXH64_state_t, Xxh64StateDeleter> state_;
};

class Xxh32Digest: public Digest
{
public:
    Xxh32Digest():
        state_(checkedState<XXH32_state_t, Xxh32StateDeleter>(XXH32_createState()))
    {
        checkStatus(XXH32_reset(state_.get(), 0), "XXH32_reset");
    }

    void update(const void *data, size_t len) override
    {
        checkStatus(XXH32_update(state_.get(), data, len), "XXH32_update");
    }

    std::string finalize() override
    {
        auto canonical = XXH32_canonical_t{ };
        XXH32_canonicalFromHash(&canonical, XXH32_digest(state_.get()));

        return toHex(canonical.digest, sizeof(canonical.digest));
    }

private:
    std::unique_ptr<XXH32_state_t, Xxh32StateDeleter> state_;
};

class TruncatedDigest: public Digest
{
public:
    TruncatedDigest(DigestPtr inner, size_t maxLength):
        inner_(std::move(inner)),
        maxLength_(maxLength)
    {
    }

    void update(const void *data, size_t len) override
    {
        inner_->update(data, len);
    }

    std::string finalize() override
    {
        auto hex = inner_->finalize();

        if (hex.size() > maxLength_)
            hex.resize(maxLength_);

        return hex;
    }

private:
    DigestPtr inner_;
    size_t maxLength_{ };
};

struct AlgorithmName
{
    Algorithm algorithm;
    std::string_view name;
};

constexpr AlgorithmName AlgorithmNames[] = {
    {Algorithm::Xxh3_128, "xxh3-128"},
    {Algorithm::Xxh3_64, "xxh3-64"},
    {Algorithm::Xxh64, "xxh64"},
    {Algorithm::Xxh32, "xxh32"},
};

} // namespace

Algorithm parseAlgorithm(std::string_view name)
{
    for (const auto &entry : AlgorithmNames)
    {
        if (entry.name == name)
            return entry.algorithm;
    }

    throw std::invalid_argument(fmt::format(
        "unknown digest algorithm '{}' (xxh3-128, xxh3-64, xxh64, xxh32)"
        , name));
}

std::string_view algorithmName(Algorithm algorithm) noexcept
{
    for (const auto &entry : AlgorithmNames)
    {
        if (entry.algorithm == algorithm)
            return entry.name;
    }

    return "unknown";
}

size_t digestLength(Algorithm algorithm) noexcept
{
    switch (algorithm)
    {
        case Algorithm::Xxh3_128:
            return 32;
        case Algorithm::Xxh3_64:
        case Algorithm::Xxh64:
            return 16;
        case Algorithm::Xxh32:
            return 8;
    }

    return 0;
}

DigestPtr makeDigest(Algorithm algorithm)
{
    switch (algorithm)
    {
        case Algorithm::Xxh3_128:
            return std::make_unique<Xxh3_128Digest>();
        case Algorithm::Xxh3_64:
            return std::make_unique<Xxh3_64Digest>();
        case Algorithm::Xxh64:
            return std::make_unique<Xxh64Digest>();
        case Algorithm::Xxh32:
            return std::make_unique<Xxh32Digest>();
    }

    throw std::invalid_argument("makeDigest: bad algorithm");
}

DigestFactory makeDigestFactory(Algorithm algorithm, std::optional<size_t> maxLength)
{
    if (!maxLength || *maxLength >= digestLength(algorithm))
    {
        if (maxLength)
        {
            spdlog::debug("digest length {} >= {} length {}, not truncating."
                , *maxLength
                , algorithmName(algorithm)
                , digestLength(algorithm));
        }

        return [algorithm] { return makeDigest(algorithm); };
    }

    return [algorithm, len = *maxLength]() -> DigestPtr {
            return std::make_unique<TruncatedDigest>(makeDigest(algorithm), len);
        };
}

std::string toHex(const uint8_t *data, size_t len)
{
    return fmt::format("{:spn}", spdlog::to_hex(data, data + len));
}

}
