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
 * @file log_timestamp.cc
 */

#include "log_timestamp.hh"

#include "base/time_util.hh"
#include "config.h"
#include "ptimec.hh"

namespace riolog {

static bool
parse_date(struct exttm* tm, const char* str, off_t& off, ssize_t len)
{
    return ptime_Y(tm, str, off, len) && ptime_char('-', str, off, len)
        && ptime_m(tm, str, off, len) && ptime_char('-', str, off, len)
        && ptime_d(tm, str, off, len);
}

static std::optional<struct timeval>
finish(const struct exttm& tm)
{
    if (!tm.valid_mday()) {
        return std::nullopt;
    }

    return tm.to_timeval();
}

std::optional<struct timeval>
parse_entry_timestamp(const char* str, size_t len)
{
    struct exttm tm;
    off_t off = 0;

    if (len < ENTRY_TIMESTAMP_LEN) {
        return std::nullopt;
    }
    len = ENTRY_TIMESTAMP_LEN;

    if (!(parse_date(&tm, str, off, len) && ptime_char(' ', str, off, len)
          && ptime_H(&tm, str, off, len) && ptime_char(':', str, off, len)
          && ptime_M(&tm, str, off, len) && ptime_char(':', str, off, len)
          && ptime_S(&tm, str, off, len) && ptime_char('.', str, off, len)
          && ptime_L(&tm, str, off, len)))
    {
        return std::nullopt;
    }

    return finish(tm);
}

std::optional<struct timeval>
parse_date_time(std::string_view sv)
{
    struct exttm tm;
    const auto* str = sv.data();
    ssize_t len = sv.size();
    off_t off = 0;

    if (!parse_date(&tm, str, off, len)) {
        return std::nullopt;
    }
    if (off == len) {
        return finish(tm);
    }

    if (!(ptime_char(' ', str, off, len) && ptime_H(&tm, str, off, len)
          && ptime_char(':', str, off, len) && ptime_M(&tm, str, off, len)))
    {
        return std::nullopt;
    }
    if (off == len) {
        return finish(tm);
    }

    if (!(ptime_char(':', str, off, len) && ptime_S(&tm, str, off, len))) {
        return std::nullopt;
    }
    if (off == len) {
        return finish(tm);
    }

    if (!(ptime_char('.', str, off, len) && ptime_L(&tm, str, off, len))
        || off != len)
    {
        return std::nullopt;
    }

    return finish(tm);
}

std::string
format_timestamp(const struct timeval& tv)
{
    return to_rfc3339_string(tv);
}

}  // namespace riolog
