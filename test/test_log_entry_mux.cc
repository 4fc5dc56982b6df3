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
 * @file test_log_entry_mux.cc
 */

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "input_source.hh"
#include "log_entry_mux.hh"
#include "log_entry_reader.hh"
#include "riolog_test_util.hh"

static std::vector<std::unique_ptr<log_entry_reader>>
make_inputs(const std::vector<std::vector<std::string>>& inputs, bool reverse)
{
    std::vector<std::unique_ptr<log_entry_reader>> retval;

    for (size_t lpc = 0; lpc < inputs.size(); lpc++) {
        auto contents = inputs[lpc];

        if (reverse) {
            std::reverse(contents.begin(), contents.end());
        }
        retval.emplace_back(
            std::make_unique<vector_entry_reader>(std::move(contents), lpc));
    }

    return retval;
}

static const std::vector<std::vector<std::string>> TWO_INPUTS = {
    {
        make_header("info", "20:00:00", "B"),
        make_header("info", "21:00:00", "B"),
    },
    {
        make_header("info", "20:30:00", "B"),
        make_header("info", "21:30:00", "B"),
    },
};

TEST_CASE("log_entry_mux forward")
{
    log_entry_mux mux(make_inputs(TWO_INPUTS, false), direction_t::forward);

    CHECK(mux.current() == nullptr);

    auto entries = read_all(mux);

    REQUIRE(entries.size() == 4);
    CHECK(entry_time(entries[0]) == "20:00");
    CHECK(entries[0].get_source_index() == 0);
    CHECK(entry_time(entries[1]) == "20:30");
    CHECK(entries[1].get_source_index() == 1);
    CHECK(entry_time(entries[2]) == "21:00");
    CHECK(entries[2].get_source_index() == 0);
    CHECK(entry_time(entries[3]) == "21:30");
    CHECK(entries[3].get_source_index() == 1);
    CHECK(mux.live_count() == 0);
}

TEST_CASE("log_entry_mux reverse")
{
    log_entry_mux mux(make_inputs(TWO_INPUTS, true), direction_t::reverse);
    auto entries = read_all(mux);

    REQUIRE(entries.size() == 4);
    CHECK(entry_time(entries[0]) == "21:30");
    CHECK(entries[0].get_source_index() == 1);
    CHECK(entry_time(entries[1]) == "21:00");
    CHECK(entries[1].get_source_index() == 0);
    CHECK(entry_time(entries[2]) == "20:30");
    CHECK(entries[2].get_source_index() == 1);
    CHECK(entry_time(entries[3]) == "20:00");
    CHECK(entries[3].get_source_index() == 0);
}

TEST_CASE("log_entry_mux single input")
{
    std::vector<std::vector<std::string>> one = {{
        make_header("info", "22:00:00", "out of order"),
        make_header("info", "20:00:00", "is kept"),
        "no header",
    }};
    log_entry_mux mux(make_inputs(one, false), direction_t::forward);
    auto entries = read_all(mux);

    REQUIRE(entries.size() == 3);
    CHECK(entries[0].get_contents() == one[0][0]);
    CHECK(entries[1].get_contents() == one[0][1]);
    CHECK(entries[2].get_contents() == one[0][2]);
}

TEST_CASE("log_entry_mux empty inputs")
{
    SUBCASE("no inputs")
    {
        log_entry_mux mux({}, direction_t::forward);

        mux.advance();
        CHECK(mux.current() == nullptr);
        mux.advance();
        CHECK(mux.current() == nullptr);
    }

    SUBCASE("one empty input")
    {
        auto inputs = TWO_INPUTS;

        inputs.insert(inputs.begin() + 1, std::vector<std::string>{});

        log_entry_mux mux(make_inputs(inputs, false), direction_t::forward);
        auto entries = read_all(mux);

        REQUIRE(entries.size() == 4);
        CHECK(entries[1].get_source_index() == 2);
        CHECK(entry_time(entries[3]) == "21:30");
    }
}

TEST_CASE("log_entry_mux uneven inputs")
{
    std::vector<std::vector<std::string>> inputs = {
        {
            make_header("info", "20:00:00", "a"),
        },
        {
            make_header("info", "19:00:00", "b"),
            make_header("info", "21:00:00", "b"),
            make_header("info", "23:00:00", "b"),
        },
        {
            make_header("info", "22:00:00", "c"),
        },
    };
    log_entry_mux mux(make_inputs(inputs, false), direction_t::forward);
    auto entries = read_all(mux);

    REQUIRE(entries.size() == 5);
    CHECK(entry_time(entries[0]) == "19:00");
    CHECK(entry_time(entries[1]) == "20:00");
    CHECK(entry_time(entries[2]) == "21:00");
    CHECK(entry_time(entries[3]) == "22:00");
    CHECK(entry_time(entries[4]) == "23:00");
}

TEST_CASE("log_entry_mux entries without a timestamp")
{
    std::vector<std::vector<std::string>> inputs = {
        {
            make_header("info", "20:00:00", "a"),
        },
        {
            "no header here",
        },
    };

    SUBCASE("forward")
    {
        log_entry_mux mux(make_inputs(inputs, false), direction_t::forward);
        auto entries = read_all(mux);

        REQUIRE(entries.size() == 2);
        CHECK(entries[0].get_contents() == "no header here");
        CHECK(entries[1].get_source_index() == 0);
    }

    SUBCASE("reverse")
    {
        log_entry_mux mux(make_inputs(inputs, true), direction_t::reverse);
        auto entries = read_all(mux);

        REQUIRE(entries.size() == 2);
        CHECK(entries[0].get_source_index() == 0);
        CHECK(entries[1].get_contents() == "no header here");
    }
}

TEST_CASE("log_entry_mux ties")
{
    std::vector<std::vector<std::string>> inputs = {
        {make_header("info", "20:00:00", "first")},
        {make_header("info", "20:00:00", "second")},
    };
    log_entry_mux mux(make_inputs(inputs, false), direction_t::forward);
    auto entries = read_all(mux);

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].get_source_index() == 0);
    CHECK(entries[1].get_source_index() == 1);
}

TEST_CASE("log_entry_mux only advances the selected input")
{
    auto first = std::make_unique<vector_entry_reader>(
        std::vector<std::string>{make_header("info", "20:00:00", "a"),
                                 make_header("info", "20:10:00", "a")},
        0);
    auto second = std::make_unique<vector_entry_reader>(
        std::vector<std::string>{make_header("info", "21:00:00", "b")}, 1);
    auto* second_ptr = second.get();
    std::vector<std::unique_ptr<log_entry_reader>> readers;

    readers.emplace_back(std::move(first));
    readers.emplace_back(std::move(second));

    log_entry_mux mux(std::move(readers), direction_t::forward);

    mux.advance();
    mux.advance();
    CHECK(entry_time(*mux.current()) == "20:10");
    CHECK(second_ptr->ver_advance_count == 1);
}

static std::string
two_entries(const char* first, const char* second)
{
    return make_header("info", first, "B") + "\n\n"
        + make_header("info", second, "B") + "\n\n";
}

TEST_CASE("log_entry_mux read failure while priming")
{
    string_input_source good(two_entries("20:00:00", "21:00:00"));
    failing_input_source bad(two_entries("20:30:00", "21:30:00"), 0);
    std::vector<std::unique_ptr<log_entry_reader>> readers;

    readers.emplace_back(
        std::make_unique<forward_entry_reader>(good, "\n", 0, 16));
    readers.emplace_back(
        std::make_unique<forward_entry_reader>(bad, "\n", 1, 16));

    log_entry_mux mux(std::move(readers), direction_t::forward);

    CHECK_THROWS_AS(mux.advance(), input_source::error);
}

TEST_CASE("log_entry_mux read failure after some entries")
{
    string_input_source good(two_entries("20:00:00", "21:00:00"));
    failing_input_source bad(two_entries("20:30:00", "21:30:00"), 1);
    std::vector<std::unique_ptr<log_entry_reader>> readers;

    readers.emplace_back(
        std::make_unique<forward_entry_reader>(good, "\n", 0, 1024));
    readers.emplace_back(
        std::make_unique<forward_entry_reader>(bad, "\n", 1, 1024));

    log_entry_mux mux(std::move(readers), direction_t::forward);

    mux.advance();
    REQUIRE(mux.current() != nullptr);
    CHECK(entry_time(*mux.current()) == "20:00");
    mux.advance();
    REQUIRE(mux.current() != nullptr);
    CHECK(entry_time(*mux.current()) == "20:30");
    mux.advance();
    REQUIRE(mux.current() != nullptr);
    CHECK(entry_time(*mux.current()) == "21:00");
    mux.advance();
    REQUIRE(mux.current() != nullptr);
    CHECK(entry_time(*mux.current()) == "21:30");
    // the failing source is only read again for the entry after 21:30
    CHECK_THROWS_AS(mux.advance(), input_source::error);
}
