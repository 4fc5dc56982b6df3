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
 * @file test_log_entry.cc
 */

#include <string>

#include "base/time_util.hh"
#include "config.h"
#include "doctest/doctest.h"
#include "log_entry.hh"

static const char* SINGLE_LINE
    = "-info:<16866> 2020-01-13 20:08:18.476 UTC [Category]: Contents of "
      "single line entry\n\n";

TEST_CASE("log_entry level")
{
    static const struct {
        const char* le_text;
        std::optional<log_level_t> le_level;
    } CASES[] = {
        {"-debug:<1> x", LEVEL_DEBUG},
        {"-info:<1> x", LEVEL_INFO},
        {"-warning:<1> x", LEVEL_WARNING},
        {"-critical:<1> x", LEVEL_CRITICAL},
        {"-fatal:<1> x", LEVEL_FATAL},
        {"-Info:<1> x", std::nullopt},
        {"-xyz:<1> x", std::nullopt},
        {"no dash at all", std::nullopt},
        {"ends with a dash -", std::nullopt},
        {"prefix -warning:<1>", LEVEL_WARNING},
    };

    for (const auto& tc : CASES) {
        auto entry = log_entry::from_contents(tc.le_text);

        CAPTURE(tc.le_text);
        CHECK(entry.get_level() == tc.le_level);
    }
}

TEST_CASE("log_entry timestamp")
{
    auto entry = log_entry::from_contents(SINGLE_LINE);
    auto tv = entry.get_timestamp();

    REQUIRE(tv.has_value());
    CHECK(tv->tv_sec == 1578946098);
    CHECK(tv->tv_usec == 476000);
}

TEST_CASE("log_entry bad timestamps")
{
    static const char* CASES[] = {
        "-info:<1> 2020-13-13 20:08:18.476 UTC",
        "-info:<1> 2020-02-30 20:08:18.476 UTC",
        "-info:<1> 2019-02-29 20:08:18.476 UTC",
        "-info:<1> 2020-01-13 24:08:18.476 UTC",
        "-info:<1> 2020-01-13 20:60:18.476 UTC",
        "-info:<1> 2020-01-13 20:08:60.476 UTC",
        "-info:<1> 2020-01-13 20:08:18.47",
        "-info:<1> 2020-01-13T20:08:18.476 UTC",
        "-info:<1> 2020-0a-13 20:08:18.476 UTC",
        "-info:<1>2020-01-13 20:08:18.476 UTC",
        "-info:<1> 1969-12-31 23:59:59.999 UTC",
        "no marker 2020-01-13 20:08:18.476",
        "-info:<1>",
    };

    for (const auto* text : CASES) {
        auto entry = log_entry::from_contents(text);

        CAPTURE(text);
        CHECK_FALSE(entry.get_timestamp().has_value());
    }
}

TEST_CASE("log_entry leap day")
{
    auto entry = log_entry::from_contents(
        "-info:<1> 2020-02-29 00:00:00.000 UTC [A]: leap");

    CHECK(entry.get_timestamp().has_value());
}

TEST_CASE("log_entry timestamp before 1970")
{
    auto entry = log_entry::from_contents(
        "-info:<1> 1969-12-31 23:00:00.250 UTC [A]: old");

    REQUIRE(entry.get_timestamp().has_value());
    CHECK(entry.get_timestamp()->tv_sec == -3600);
    CHECK(entry.get_timestamp()->tv_usec == 250000);

    auto newer = log_entry::from_contents(
        "-info:<1> 1970-01-01 00:00:00.000 UTC [A]: new");

    CHECK(entry.get_timestamp().value() < newer.get_timestamp().value());
}

TEST_CASE("log_entry fields follow the contents")
{
    auto entry = log_entry::from_contents(SINGLE_LINE);

    CHECK(entry.get_level() == LEVEL_INFO);
    CHECK(entry.get_level() == LEVEL_INFO);
    auto first_time = entry.get_timestamp();
    REQUIRE(first_time.has_value());
    CHECK(entry.get_timestamp()->tv_sec == first_time->tv_sec);

    entry.set_contents(
        "-fatal:<2> 2021-06-01 10:00:00.000 UTC [Other]: replaced\n\n");
    CHECK(entry.get_level() == LEVEL_FATAL);
    REQUIRE(entry.get_timestamp().has_value());
    CHECK(entry.get_timestamp()->tv_sec == 1622541600);

    entry.get_writable_contents() = "no header";
    CHECK_FALSE(entry.get_level().has_value());
    CHECK_FALSE(entry.get_timestamp().has_value());

    entry.clear();
    entry.append("-debug:<3> 2020-01-01 00:00:00.000");
    CHECK(entry.get_level() == LEVEL_DEBUG);
    CHECK(entry.get_timestamp()->tv_sec == 1577836800);
}

TEST_CASE("log_entry copy")
{
    auto entry = log_entry::from_contents(SINGLE_LINE, 3);
    CHECK(entry.get_level() == LEVEL_INFO);

    auto copy = entry.copy();
    entry.set_contents("-fatal:<1> gone");

    CHECK(copy.get_contents() == SINGLE_LINE);
    CHECK(copy.get_source_index() == 3);
    CHECK(copy.get_level() == LEVEL_INFO);
    CHECK(entry.get_level() == LEVEL_FATAL);
}

TEST_CASE("log_entry contains")
{
    auto entry = log_entry::from_contents(SINGLE_LINE);

    CHECK(entry.contains("single line"));
    CHECK_FALSE(entry.contains("Single Line"));
    CHECK(entry.contains(""));
}
