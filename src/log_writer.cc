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
 * @file log_writer.cc
 */

#include <memory>

#include <errno.h>
#include <string.h>

#include "log_writer.hh"

#include "base/ansi_colors.hh"
#include "base/riolog_log.hh"
#include "config.h"
#include "fmt/format.h"

const size_t log_writer::IO_BUFFER_SIZE = 1024 * 1024;

static const char* LEVEL_COLORS[] = {
    ANSI_COLOR(ANSI_WHITE),
    ANSI_BRIGHT_COLOR(ANSI_WHITE),
    ANSI_COLOR(ANSI_YELLOW),
    ANSI_COLOR(ANSI_RED),
    ANSI_BRIGHT_COLOR(ANSI_RED),
};

const char*
level_color(log_level_t level)
{
    require_lt(level, LEVEL__MAX);

    return LEVEL_COLORS[level];
}

log_writer::error::error(int err, std::string msg)
    : e_err(err), e_msg(std::move(msg))
{
}

log_writer::log_writer(FILE* out, options opts)
    : lw_out(out), lw_options(std::move(opts))
{
}

void
log_writer::write(std::string_view sv)
{
    if (sv.empty()) {
        return;
    }

    if (fwrite(sv.data(), 1, sv.size(), this->lw_out) != sv.size()) {
        auto err = errno;

        throw error(err,
                    fmt::format(FMT_STRING("unable to write output: {}"),
                                strerror(err)));
    }
}

void
log_writer::flush()
{
    if (fflush(this->lw_out) == EOF) {
        auto err = errno;

        throw error(err,
                    fmt::format(FMT_STRING("unable to flush output: {}"),
                                strerror(err)));
    }
}

void
log_writer::write_expanded(std::string_view sv,
                           std::string_view eol,
                           std::string_view after_eol)
{
    size_t run_start = 0;

    for (size_t lpc = 0; lpc < sv.size(); lpc++) {
        auto ch = sv[lpc];

        if (!this->lw_pending_escape) {
            if (ch == '\\') {
                this->write(sv.substr(run_start, lpc - run_start));
                this->lw_pending_escape = true;
            }
            continue;
        }

        this->lw_pending_escape = false;
        switch (ch) {
            case '0':
                this->write(std::string_view("\0", 1));
                break;
            case 'n':
                this->write(eol);
                this->write(after_eol);
                break;
            case 'r':
                break;
            case 't':
                this->write("\t");
                break;
            case '?':
            case '\'':
            case '"':
            case '\\':
                this->write(sv.substr(lpc, 1));
                break;
            default:
                this->write("\\");
                this->write(sv.substr(lpc, 1));
                break;
        }
        run_start = lpc + 1;
    }

    if (!this->lw_pending_escape && run_start < sv.size()) {
        this->write(sv.substr(run_start));
    }
}

void
log_writer::write_entry(const log_entry& entry)
{
    const auto& opts = this->lw_options;
    std::string_view color;

    if (opts.wo_source_names.size() > 1) {
        if (opts.wo_color) {
            this->write(ANSI_COLOR(ANSI_CYAN));
        }
        this->write(opts.wo_source_names.at(entry.get_source_index()));
        this->write(": ");
        if (opts.wo_color) {
            this->write(ANSI_NORM);
        }
    }

    if (opts.wo_color) {
        auto level = entry.get_level();

        if (level) {
            color = level_color(level.value());
        }
        this->write(color);
    }

    if (opts.wo_formatting) {
        std::string eol;

        if (opts.wo_color) {
            eol = ANSI_NORM;
        }
        eol.append(opts.wo_eol);
        this->lw_pending_escape = false;
        this->write_expanded(entry.get_contents(), eol, color);
        this->lw_pending_escape = false;
    } else {
        this->write(entry.get_contents());
    }

    if (opts.wo_color) {
        this->write(ANSI_NORM);
    }
}

void
log_writer::copy_raw(input_source& src)
{
    auto buffer = std::make_unique<char[]>(IO_BUFFER_SIZE);

    this->lw_pending_escape = false;
    for (;;) {
        auto rc = src.read(buffer.get(), IO_BUFFER_SIZE);

        if (rc == 0) {
            break;
        }

        std::string_view chunk(buffer.get(), rc);

        if (this->lw_options.wo_formatting) {
            this->write_expanded(chunk, this->lw_options.wo_eol, "");
        } else {
            this->write(chunk);
        }
    }
    this->lw_pending_escape = false;
    log_debug("copied %s without framing", src.get_name().c_str());
}
