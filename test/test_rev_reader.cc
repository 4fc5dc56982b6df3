/**
 * Copyright (c) 2020, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file test_rev_reader.cc
 */

#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "input_source.hh"
#include "rev_reader.hh"

static std::vector<std::string>
all_spans(const std::string& data, char delim, size_t skip, size_t capacity)
{
    string_input_source src(data);
    rev_reader rr(src, delim, skip, capacity);
    std::vector<std::string> retval;

    for (auto span = rr.next_span(); span; span = rr.next_span()) {
        retval.emplace_back(span.value());
    }

    return retval;
}

static std::string
rejoin(const std::vector<std::string>& spans, const std::string& delim)
{
    std::string retval;

    for (auto iter = spans.rbegin(); iter != spans.rend(); ++iter) {
        if (iter != spans.rbegin()) {
            retval.append(delim);
        }
        retval.append(*iter);
    }

    return retval;
}

TEST_CASE("rev_reader spans")
{
    auto spans = all_spans("first\nsecond\nthird", '\n', 1, 1024);

    REQUIRE(spans.size() == 3);
    CHECK(spans[0] == "third");
    CHECK(spans[1] == "second");
    CHECK(spans[2] == "first");
}

TEST_CASE("rev_reader small buffer")
{
    for (size_t cap = 1; cap <= 7; cap++) {
        auto spans = all_spans("first\nsecond\nthird", '\n', 1, cap);

        REQUIRE(spans.size() == 3);
        CHECK(spans[0] == "third");
        CHECK(spans[1] == "second");
        CHECK(spans[2] == "first");
    }
}

TEST_CASE("rev_reader delimiters at the edges")
{
    SUBCASE("leading")
    {
        auto spans = all_spans("\nabc", '\n', 1, 2);

        REQUIRE(spans.size() == 2);
        CHECK(spans[0] == "abc");
        CHECK(spans[1] == "");
    }

    SUBCASE("trailing")
    {
        auto spans = all_spans("abc\n", '\n', 1, 2);

        REQUIRE(spans.size() == 2);
        CHECK(spans[0] == "");
        CHECK(spans[1] == "abc");
    }

    SUBCASE("consecutive")
    {
        auto spans = all_spans("a\n\n\nb", '\n', 1, 3);

        REQUIRE(spans.size() == 4);
        CHECK(spans[0] == "b");
        CHECK(spans[1] == "");
        CHECK(spans[2] == "");
        CHECK(spans[3] == "a");
    }

    SUBCASE("only a delimiter")
    {
        auto spans = all_spans("\n", '\n', 1, 16);

        REQUIRE(spans.size() == 2);
        CHECK(spans[0] == "");
        CHECK(spans[1] == "");
    }
}

TEST_CASE("rev_reader empty source")
{
    string_input_source src("");
    rev_reader rr(src, '\n', 1, 16);

    CHECK_FALSE(rr.next_span().has_value());
    CHECK_FALSE(rr.next_span().has_value());
}

TEST_CASE("rev_reader stays exhausted")
{
    string_input_source src("one\ntwo");
    rev_reader rr(src, '\n', 1, 16);

    CHECK(rr.next_span().value() == "two");
    CHECK(rr.next_span().value() == "one");
    CHECK_FALSE(rr.next_span().has_value());
    CHECK_FALSE(rr.next_span().has_value());
}

TEST_CASE("rev_reader multi-byte terminator split across blocks")
{
    for (size_t cap = 1; cap <= 6; cap++) {
        CAPTURE(cap);

        auto spans = all_spans("a\r\nbb\r\nccc", '\r', 2, cap);

        REQUIRE(spans.size() == 3);
        CHECK(spans[0] == "ccc");
        CHECK(spans[1] == "bb");
        CHECK(spans[2] == "a");
    }
}

static std::vector<std::string>
all_terminated_spans(const std::string& data,
                     const std::string& terminator,
                     size_t capacity)
{
    string_input_source src(data);
    rev_reader rr(src, terminator, capacity);
    std::vector<std::string> retval;

    for (auto span = rr.next_span(); span; span = rr.next_span()) {
        retval.emplace_back(span.value());
    }

    return retval;
}

TEST_CASE("rev_reader terminator splits only on the whole sequence")
{
    for (size_t cap = 1; cap <= 10; cap++) {
        CAPTURE(cap);

        auto spans = all_terminated_spans("a\rb\r\n\r\nc", "\r\n", cap);

        REQUIRE(spans.size() == 3);
        CHECK(spans[0] == "c");
        CHECK(spans[1] == "");
        CHECK(spans[2] == "a\rb");
    }
}

TEST_CASE("rev_reader terminator with repeated first bytes")
{
    for (size_t cap = 1; cap <= 8; cap++) {
        CAPTURE(cap);

        auto spans = all_terminated_spans("x\r\r\r\ny\r", "\r\n", cap);

        REQUIRE(spans.size() == 2);
        CHECK(spans[0] == "y\r");
        CHECK(spans[1] == "x\r\r");
    }
}

TEST_CASE("rev_reader single byte terminator")
{
    auto spans = all_terminated_spans("first\nsecond", "\n", 3);

    REQUIRE(spans.size() == 2);
    CHECK(spans[0] == "second");
    CHECK(spans[1] == "first");
}

TEST_CASE("rev_reader rejoin reproduces the source")
{
    static const std::vector<std::string> LF_SAMPLES = {
        "",
        "x",
        "\n",
        "\n\n",
        "line one\nline two\n\nnext entry\n",
        "\nleading and trailing\n",
        "-info:<1> 2020-01-13 20:08:18.476 UTC [A]: B\n\n"
        "-warning:<1> 2020-01-13 20:09:18.476 UTC [A]: C\nD\n",
    };

    for (const auto& sample : LF_SAMPLES) {
        for (size_t cap = 1; cap <= sample.size() + 1; cap++) {
            CAPTURE(sample);
            CAPTURE(cap);
            CHECK(rejoin(all_spans(sample, '\n', 1, cap), "\n") == sample);
        }
    }

    static const std::vector<std::string> CRLF_SAMPLES = {
        "\r\n",
        "a\r\n\r\nb",
        "first\r\nsecond\r\n\r\nthird\r\n",
    };

    for (const auto& sample : CRLF_SAMPLES) {
        for (size_t cap = 1; cap <= sample.size() + 1; cap++) {
            CAPTURE(sample);
            CAPTURE(cap);
            CHECK(rejoin(all_spans(sample, '\r', 2, cap), "\r\n") == sample);
            CHECK(rejoin(all_terminated_spans(sample, "\r\n", cap), "\r\n")
                  == sample);
        }
    }
}

TEST_CASE("rev_reader reads only what it needs")
{
    string_input_source src(std::string(100, 'a') + "\nlast");
    rev_reader rr(src, '\n', 1, 10);

    CHECK(rr.next_span().value() == "last");
    CHECK(src.get_read_count() == 1);
}

TEST_CASE("rev_reader degenerate arguments")
{
    string_input_source src("abc");

    CHECK_THROWS_AS(rev_reader(src, '\n', 1, 0), std::invalid_argument);

    string_input_source pipe_src("abc", "<pipe>", false);

    CHECK_THROWS_AS(rev_reader(pipe_src, '\n', 1, 16), std::invalid_argument);
    CHECK_THROWS_AS(rev_reader(src, std::string_view(), 16),
                    std::invalid_argument);
}
