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
 * @file rev_reader.cc
 */

#include <algorithm>
#include <stdexcept>

#include <unistd.h>

#include "rev_reader.hh"

#include "base/riolog_log.hh"
#include "config.h"
#include "fmt/format.h"

rev_reader::rev_reader(input_source& src,
                       char delim,
                       size_t skip_len,
                       size_t capacity)
    : rr_source(src), rr_delim(delim), rr_skip_len(skip_len),
      rr_capacity(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("reverse buffer capacity must be positive");
    }
    if (!src.is_seekable()) {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("cannot read '{}' in reverse, it is not "
                                   "seekable"),
                        src.get_name()));
    }

    this->rr_buffer = std::make_unique<char[]>(capacity);
}

static char
first_byte(std::string_view terminator)
{
    if (terminator.empty()) {
        throw std::invalid_argument("the terminator must not be empty");
    }

    return terminator.front();
}

rev_reader::rev_reader(input_source& src,
                       std::string_view terminator,
                       size_t capacity)
    : rev_reader(src, first_byte(terminator), terminator.size(), capacity)
{
    this->rr_terminator = std::string(terminator);
}

bool
rev_reader::terminator_at(size_t delim_index) const
{
    const auto* buf = this->rr_buffer.get();

    for (size_t lpc = 1; lpc < this->rr_terminator.size(); lpc++) {
        auto pos = delim_index + lpc;
        char ch;

        if (pos < this->rr_scan_end) {
            ch = buf[pos];
        } else {
            // the bytes after rr_scan_end are the front of rr_partial
            auto partial_pos = pos - this->rr_scan_end;

            if (partial_pos >= this->rr_partial.size()) {
                return false;
            }
            ch = this->rr_partial[partial_pos];
        }
        if (ch != this->rr_terminator[lpc]) {
            return false;
        }
    }

    return true;
}

bool
rev_reader::load_prev_block()
{
    if (this->rr_offset == -1) {
        this->rr_offset = this->rr_source.seek(0, SEEK_END);
        log_debug("scanning %s backward from offset %lld",
                  this->rr_source.get_name().c_str(),
                  (long long) this->rr_offset);
    }
    if (this->rr_offset == 0) {
        return false;
    }

    auto amount = std::min((file_off_t) this->rr_capacity, this->rr_offset);

    this->rr_offset -= amount;
    this->rr_source.seek(this->rr_offset, SEEK_SET);
    this->rr_source.read_fully(this->rr_buffer.get(), amount);
    this->rr_scan_end = amount;
    log_trace("loaded %lld bytes at offset %lld",
              (long long) amount,
              (long long) this->rr_offset);

    return true;
}

std::optional<std::string>
rev_reader::next_span()
{
    if (this->rr_exhausted) {
        return std::nullopt;
    }

    for (;;) {
        if (this->rr_scan_end == 0) {
            auto was_empty = this->rr_offset == -1;

            if (!this->load_prev_block()) {
                this->rr_exhausted = true;
                if (was_empty) {
                    return std::nullopt;
                }

                std::string retval;

                retval.swap(this->rr_partial);
                return retval;
            }
        }

        const auto* buf = this->rr_buffer.get();
        auto lpc = this->rr_scan_end;
        for (;;) {
            while (lpc > 0 && buf[lpc - 1] != this->rr_delim) {
                lpc -= 1;
            }
            if (lpc == 0 || this->terminator_at(lpc - 1)) {
                break;
            }
            lpc -= 1;
        }

        if (lpc == 0) {
            this->rr_partial.insert(0, buf, this->rr_scan_end);
            this->rr_scan_end = 0;
            continue;
        }

        auto delim_index = lpc - 1;
        auto content_start = delim_index + this->rr_skip_len;

        if (content_start <= this->rr_scan_end) {
            this->rr_partial.insert(
                0, &buf[content_start], this->rr_scan_end - content_start);
        } else {
            // the rest of the delimiter was in the block loaded before this
            auto overflow = std::min(content_start - this->rr_scan_end,
                                     this->rr_partial.size());

            this->rr_partial.erase(0, overflow);
        }
        this->rr_scan_end = delim_index;

        std::string retval;

        retval.swap(this->rr_partial);
        return retval;
    }
}
