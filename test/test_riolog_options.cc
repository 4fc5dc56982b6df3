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
 * @file test_riolog_options.cc
 */

#include <algorithm>
#include <string>
#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "log_timestamp.hh"
#include "riolog.options.hh"

static void
parse_args(CLI::App& app, std::vector<std::string> args)
{
    std::reverse(args.begin(), args.end());
    app.parse(args);
}

TEST_CASE("parse_date_time")
{
    auto full = riolog::parse_date_time("2020-01-10 18:33:19.244");
    REQUIRE(full.has_value());
    CHECK(full->tv_sec == 1578681199);
    CHECK(full->tv_usec == 244000);

    auto secs = riolog::parse_date_time("2020-01-10 18:33:19");
    REQUIRE(secs.has_value());
    CHECK(secs->tv_sec == 1578681199);
    CHECK(secs->tv_usec == 0);

    auto mins = riolog::parse_date_time("2020-01-10 18:33");
    REQUIRE(mins.has_value());
    CHECK(mins->tv_sec == 1578681180);

    auto day = riolog::parse_date_time("2020-01-10");
    REQUIRE(day.has_value());
    CHECK(day->tv_sec == 1578614400);

    auto before_epoch = riolog::parse_date_time("1969-12-31 23:00");
    REQUIRE(before_epoch.has_value());
    CHECK(before_epoch->tv_sec == -3600);

    CHECK_FALSE(riolog::parse_date_time("").has_value());
    CHECK_FALSE(riolog::parse_date_time("2020-01-10 18").has_value());
    CHECK_FALSE(riolog::parse_date_time("2020-01-10T18:33").has_value());
    CHECK_FALSE(riolog::parse_date_time("2020-01-10 18:33:19.2").has_value());
    CHECK_FALSE(
        riolog::parse_date_time("2020-01-10 18:33:19.2445").has_value());
    CHECK_FALSE(riolog::parse_date_time("2020-01-10 ").has_value());
    CHECK_FALSE(riolog::parse_date_time("2020-02-30").has_value());
    CHECK_FALSE(riolog::parse_date_time("yesterday").has_value());
}

TEST_CASE("format_timestamp")
{
    auto tv = riolog::parse_date_time("2020-01-10 18:33:19.244");

    CHECK(riolog::format_timestamp(tv.value()) == "2020-01-10 18:33:19.244");

    tv = riolog::parse_date_time("1955-11-05 06:15:00.125");
    CHECK(riolog::format_timestamp(tv.value()) == "1955-11-05 06:15:00.125");
}

TEST_CASE("parse_bool_arg")
{
    for (const auto* value : {"yes", "true", "on", "YES", "True"}) {
        CHECK(riolog::parse_bool_arg(value) == true);
    }
    for (const auto* value : {"no", "false", "off", "Off"}) {
        CHECK(riolog::parse_bool_arg(value) == false);
    }
    CHECK_FALSE(riolog::parse_bool_arg("1").has_value());
    CHECK_FALSE(riolog::parse_bool_arg("").has_value());
}

TEST_CASE("parse_level_arg")
{
    CHECK(riolog::parse_level_arg("debug") == LEVEL_DEBUG);
    CHECK(riolog::parse_level_arg("Warning") == LEVEL_WARNING);
    CHECK(riolog::parse_level_arg("FATAL") == LEVEL_FATAL);
    CHECK_FALSE(riolog::parse_level_arg("warn").has_value());
    CHECK_FALSE(riolog::parse_level_arg("").has_value());
}

TEST_CASE("command line defaults")
{
    riolog::options opts;
    CLI::App app;

    riolog::setup_cli(app, opts);
    parse_args(app, {});

    CHECK(opts.reads_stdin());
    CHECK(opts.o_formatting);
    CHECK_FALSE(opts.o_reverse);
    CHECK(opts.o_filter.empty());
    CHECK(opts.color_enabled(true));
    CHECK_FALSE(opts.color_enabled(false));
    CHECK_FALSE(opts.needs_pipeline(false));
    CHECK(opts.needs_pipeline(true));
    CHECK(opts.o_buffer_size == 1024 * 1024);
    CHECK(opts.o_pager);
    CHECK_FALSE(opts.o_wrap);
    CHECK(opts.use_pager(true));
    CHECK_FALSE(opts.use_pager(false));
    CHECK(opts.pager_command(false)
          == std::vector<std::string>{
              "less", "--quit-if-one-screen", "--chop-long-lines"});
    CHECK(opts.pager_command(true)
          == std::vector<std::string>{"less",
                                      "--quit-if-one-screen",
                                      "--RAW-CONTROL-CHARS",
                                      "--chop-long-lines"});
}

TEST_CASE("command line pager")
{
    SUBCASE("disabled")
    {
        riolog::options opts;
        CLI::App app;

        riolog::setup_cli(app, opts);
        parse_args(app, {"--pager", "off"});

        CHECK_FALSE(opts.o_pager);
        CHECK_FALSE(opts.use_pager(true));
    }

    SUBCASE("wrap")
    {
        riolog::options opts;
        CLI::App app;

        riolog::setup_cli(app, opts);
        parse_args(app, {"-w"});

        CHECK(opts.o_wrap);
        CHECK(opts.pager_command(true)
              == std::vector<std::string>{
                  "less", "--quit-if-one-screen", "--RAW-CONTROL-CHARS"});
    }

    SUBCASE("long wrap with output file")
    {
        riolog::options opts;
        CLI::App app;

        riolog::setup_cli(app, opts);
        parse_args(app, {"--wrap", "--pager", "on", "-o", "out.log"});

        CHECK(opts.o_wrap);
        CHECK(opts.o_pager);
        CHECK_FALSE(opts.use_pager(true));
    }
}

TEST_CASE("command line options")
{
    riolog::options opts;
    CLI::App app;

    riolog::setup_cli(app, opts);
    parse_args(app,
               {"-c",
                "off",
                "--formatting",
                "no",
                "-r",
                "-o",
                "out.log",
                "-S",
                "2020-01-01 20:30",
                "-U",
                "2020-01-01",
                "-L",
                "Critical",
                "-C",
                "needle",
                "-b",
                "4096",
                "a.log",
                "b.log"});

    CHECK(opts.o_color == false);
    CHECK_FALSE(opts.o_formatting);
    CHECK(opts.o_reverse);
    CHECK(opts.o_output == "out.log");
    REQUIRE(opts.o_filter.fo_since.has_value());
    CHECK(opts.o_filter.fo_since->tv_sec == 1577910600);
    REQUIRE(opts.o_filter.fo_until.has_value());
    CHECK(opts.o_filter.fo_until->tv_sec == 1577836800);
    CHECK(opts.o_filter.fo_min_level == LEVEL_CRITICAL);
    CHECK(opts.o_filter.fo_contains == std::string("needle"));
    CHECK(opts.o_buffer_size == 4096);
    CHECK(opts.o_files == std::vector<std::string>{"a.log", "b.log"});
    CHECK_FALSE(opts.reads_stdin());
    CHECK(opts.needs_pipeline(false));

    auto popts = opts.to_pipeline_options();
    CHECK(popts.po_direction == direction_t::reverse);
    CHECK(popts.po_buffer_capacity == 4096);
}

TEST_CASE("command line output disables color")
{
    riolog::options opts;
    CLI::App app;

    riolog::setup_cli(app, opts);
    parse_args(app, {"-o", "out.log", "only.log"});

    CHECK_FALSE(opts.color_enabled(true));
    CHECK_FALSE(opts.needs_pipeline(false));
}

TEST_CASE("command line stdin dash")
{
    riolog::options opts;
    CLI::App app;

    riolog::setup_cli(app, opts);
    parse_args(app, {"-"});

    CHECK(opts.reads_stdin());
    CHECK_FALSE(opts.needs_pipeline(false));

    opts.o_reverse = true;
    CHECK(opts.needs_pipeline(false));
}

TEST_CASE("command line rejects bad values")
{
    static const std::vector<std::vector<std::string>> BAD_ARGS = {
        {"-c", "maybe"},
        {"--formatting", "2"},
        {"-S", "2020-13-01"},
        {"-U", "tomorrow"},
        {"-L", "verbose"},
        {"-b", "0"},
        {"--pager", "maybe"},
    };

    for (const auto& args : BAD_ARGS) {
        riolog::options opts;
        CLI::App app;

        riolog::setup_cli(app, opts);
        CAPTURE(args[0]);
        CHECK_THROWS_AS(parse_args(app, args), CLI::ParseError);
    }
}
