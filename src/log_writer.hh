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
 * @file log_writer.hh
 */

#ifndef riolog_log_writer_hh
#define riolog_log_writer_hh

#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include <stdio.h>

#include "eol.hh"
#include "input_source.hh"
#include "log_entry.hh"

/**
 * Writes log entries, or the raw bytes of a source, to a stdio stream.
 */
class log_writer {
public:
    static const size_t IO_BUFFER_SIZE;

    class error : public std::exception {
    public:
        error(int err, std::string msg);

        const char* what() const noexcept override
        {
            return this->e_msg.c_str();
        }

        int e_err;
        std::string e_msg;
    };

    struct options {
        /** Color entries by level and the source prefix. */
        bool wo_color{false};
        /** Expand backslash escapes like "\n" into the characters. */
        bool wo_formatting{true};
        std::string wo_eol{riolog::eol::PLATFORM};
        /**
         * The names of the sources, indexed by source index.  Entries are
         * prefixed with the name when there is more than one.
         */
        std::vector<std::string> wo_source_names;
    };

    log_writer(FILE* out, options opts);

    log_writer(const log_writer&) = delete;
    log_writer& operator=(const log_writer&) = delete;

    /**
     * @throws error If writing to the stream failed.
     */
    void write_entry(const log_entry& entry);

    /**
     * Copy the remaining bytes of a source to the stream without framing
     * them into entries.
     *
     * @throws error If writing to the stream failed.
     * @throws input_source::error If reading the source failed.
     */
    void copy_raw(input_source& src);

    void flush();

private:
    void write(std::string_view sv);
    void write_expanded(std::string_view sv,
                        std::string_view eol,
                        std::string_view after_eol);

    FILE* lw_out;
    options lw_options;
    bool lw_pending_escape{false};
};

/**
 * @return The escape sequence used for entries with the given level.
 */
const char* level_color(log_level_t level);

#endif
