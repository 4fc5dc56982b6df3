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
 * @file riolog.options.hh
 */

#ifndef riolog_options_hh
#define riolog_options_hh

#include <optional>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"
#include "line_reader.hh"
#include "log_filter.hh"
#include "log_pipeline.hh"

namespace riolog {

struct options {
    std::vector<std::string> o_files;
    /** Set when the user asked for color, or no color, explicitly. */
    std::optional<bool> o_color;
    bool o_formatting{true};
    bool o_pager{true};
    /** Let the pager wrap long lines instead of chopping them. */
    bool o_wrap{false};
    bool o_reverse{false};
    std::string o_output;
    filter_options o_filter;
    size_t o_buffer_size{line_reader::DEFAULT_BUFFER_SIZE};
    std::string o_debug_log;

    /**
     * @param stdout_is_tty True if the output would go to a terminal.
     * @return True if colors should be used.
     */
    bool color_enabled(bool stdout_is_tty) const;

    /** @return True if the input comes from the standard input. */
    bool reads_stdin() const;

    /**
     * @return True if the entries need to be framed rather than copied
     *   as-is to the output.
     */
    bool needs_pipeline(bool color) const;

    /**
     * @param stdout_is_tty True if the output would go to a terminal.
     * @return True if the output should be shown in a pager.
     */
    bool use_pager(bool stdout_is_tty) const;

    /** @return The less(1) command line used to show the output. */
    std::vector<std::string> pager_command(bool color) const;

    pipeline_options to_pipeline_options() const;
};

std::optional<bool> parse_bool_arg(const std::string& value);

std::optional<log_level_t> parse_level_arg(const std::string& value);

/**
 * Register the command-line options with the given app.  The values are
 * checked and stored in the given options as they are parsed.
 */
void setup_cli(CLI::App& app, options& opts);

}  // namespace riolog

#endif
