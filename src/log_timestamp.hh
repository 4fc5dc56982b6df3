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
 * @file log_timestamp.hh
 */

#ifndef riolog_log_timestamp_hh
#define riolog_log_timestamp_hh

#include <optional>
#include <string>
#include <string_view>

#include <sys/time.h>

namespace riolog {

/** The width of "YYYY-MM-DD HH:MM:SS.mmm" in an entry header. */
constexpr size_t ENTRY_TIMESTAMP_LEN = 23;

/**
 * Parse the fixed-width timestamp found in an entry header.  Only the first
 * ENTRY_TIMESTAMP_LEN bytes are examined.
 *
 * @return The time or nullopt if the text is too short or not a valid date.
 */
std::optional<struct timeval> parse_entry_timestamp(const char* str,
                                                    size_t len);

/**
 * Parse a date and time given by the user.  The accepted forms are:
 *
 *   YYYY-MM-DD HH:MM:SS.mmm
 *   YYYY-MM-DD HH:MM:SS
 *   YYYY-MM-DD HH:MM
 *   YYYY-MM-DD
 *
 * Missing fields are zero.
 */
std::optional<struct timeval> parse_date_time(std::string_view str);

std::string format_timestamp(const struct timeval& tv);

}  // namespace riolog

#endif
