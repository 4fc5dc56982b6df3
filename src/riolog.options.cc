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
 * @file riolog.options.cc
 */

#include <strings.h>

#include "riolog.options.hh"

#include "config.h"
#include "fmt/format.h"
#include "log_timestamp.hh"

namespace riolog {

static const char* TRUE_VALUES[] = {"yes", "true", "on"};
static const char* FALSE_VALUES[] = {"no", "false", "off"};

std::optional<bool>
parse_bool_arg(const std::string& value)
{
    for (const auto* tv : TRUE_VALUES) {
        if (strcasecmp(value.c_str(), tv) == 0) {
            return true;
        }
    }
    for (const auto* fv : FALSE_VALUES) {
        if (strcasecmp(value.c_str(), fv) == 0) {
            return false;
        }
    }

    return std::nullopt;
}

std::optional<log_level_t>
parse_level_arg(const std::string& value)
{
    return string2level(value.c_str(), value.size());
}

bool
options::color_enabled(bool stdout_is_tty) const
{
    if (this->o_color) {
        return this->o_color.value();
    }

    return this->o_output.empty() && stdout_is_tty;
}

bool
options::reads_stdin() const
{
    return this->o_files.empty()
        || (this->o_files.size() == 1 && this->o_files.front() == "-");
}

bool
options::needs_pipeline(bool color) const
{
    if (color || this->o_reverse || !this->o_filter.empty()) {
        return true;
    }
    if (this->reads_stdin()) {
        return false;
    }

    return this->o_files.size() > 1;
}

bool
options::use_pager(bool stdout_is_tty) const
{
    return this->o_pager && this->o_output.empty() && stdout_is_tty;
}

std::vector<std::string>
options::pager_command(bool color) const
{
    std::vector<std::string> retval = {"less", "--quit-if-one-screen"};

    if (color) {
        retval.emplace_back("--RAW-CONTROL-CHARS");
    }
    if (!this->o_wrap) {
        retval.emplace_back("--chop-long-lines");
    }

    return retval;
}

pipeline_options
options::to_pipeline_options() const
{
    pipeline_options retval;

    retval.po_filter = this->o_filter;
    retval.po_direction
        = this->o_reverse ? direction_t::reverse : direction_t::forward;
    retval.po_buffer_capacity = this->o_buffer_size;

    return retval;
}

void
setup_cli(CLI::App& app, options& opts)
{
    auto bool_validator = [](const std::string& value) -> std::string {
        if (parse_bool_arg(value)) {
            return std::string();
        }
        return fmt::format(
            FMT_STRING("expecting one of yes/true/on/no/false/off, got '{}'"),
            value);
    };
    auto date_validator = [](const std::string& value) -> std::string {
        if (parse_date_time(value)) {
            return std::string();
        }
        return fmt::format(
            FMT_STRING("expecting a date and time like "
                       "'2020-01-10 18:33:19.244', '2020-01-10 18:33:19', "
                       "'2020-01-10 18:33' or '2020-01-10', got '{}'"),
            value);
    };
    auto level_validator = [](const std::string& value) -> std::string {
        if (parse_level_arg(value)) {
            return std::string();
        }
        return fmt::format(FMT_STRING("expecting one of debug, info, warning, "
                                      "critical or fatal, got '{}'"),
                           value);
    };

    app.add_option("file",
                   opts.o_files,
                   "Log files to read.  With no FILE, or when FILE is -, "
                   "read the standard input.")
        ->type_name("FILE");
    app.add_option("-c,--color",
                   "Turn colors on or off.  Default: on when writing to a "
                   "terminal and -o is not given.")
        ->type_name("BOOL")
        ->check(bool_validator)
        ->each([&opts](const std::string& value) {
            opts.o_color = parse_bool_arg(value);
        });
    app.add_option("--formatting",
                   "Turn the expansion of escapes like '\\n' on or off.  "
                   "Default: on.")
        ->type_name("BOOL")
        ->check(bool_validator)
        ->each([&opts](const std::string& value) {
            opts.o_formatting = parse_bool_arg(value).value_or(true);
        });
    app.add_option("--pager",
                   "Turn showing the log in less(1) on or off.  Default: on "
                   "when writing to a terminal.")
        ->type_name("BOOL")
        ->check(bool_validator)
        ->each([&opts](const std::string& value) {
            opts.o_pager = parse_bool_arg(value).value_or(true);
        });
    app.add_flag("-w,--wrap",
                 opts.o_wrap,
                 "Wrap long lines in the pager instead of chopping them.");
    app.add_flag("-r,--reverse",
                 opts.o_reverse,
                 "Show the newest entries first.");
    app.add_option("-o,--output",
                   opts.o_output,
                   "Write the log to the given file.")
        ->type_name("FILE");
    app.add_option("-S,--since",
                   "Only show entries at or after the given date and time.")
        ->type_name("DATE_TIME")
        ->check(date_validator)
        ->each([&opts](const std::string& value) {
            opts.o_filter.fo_since = parse_date_time(value);
        });
    app.add_option("-U,--until",
                   "Only show entries before the given date and time.")
        ->type_name("DATE_TIME")
        ->check(date_validator)
        ->each([&opts](const std::string& value) {
            opts.o_filter.fo_until = parse_date_time(value);
        });
    app.add_option("-L,--level",
                   "Only show entries with the given level or higher.")
        ->type_name("NAME")
        ->check(level_validator)
        ->each([&opts](const std::string& value) {
            opts.o_filter.fo_min_level = parse_level_arg(value);
        });
    app.add_option("-C,--contains",
                   "Only show entries that contain the given string.  The "
                   "search is case-sensitive.")
        ->type_name("STRING")
        ->each([&opts](const std::string& value) {
            opts.o_filter.fo_contains = value;
        });
    app.add_option("-b,--buffer-size",
                   opts.o_buffer_size,
                   "The size of the buffer used to read files in reverse.")
        ->type_name("BYTES")
        ->check(CLI::PositiveNumber);
    app.add_option("-d",
                   opts.o_debug_log,
                   "Write debug messages to the given file.")
        ->type_name("FILE");
    app.set_version_flag("-V,--version");
    app.footer(fmt::format(FMT_STRING("Version: {}"), VCS_PACKAGE_STRING));
}

}  // namespace riolog
