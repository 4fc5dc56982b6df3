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
 * @file log_filter.hh
 */

#ifndef riolog_log_filter_hh
#define riolog_log_filter_hh

#include <memory>
#include <optional>
#include <string>

#include <sys/time.h>

#include "direction.hh"
#include "log_entry_reader.hh"
#include "log_level.hh"

struct filter_options {
    /** Entries before this time are dropped. */
    std::optional<struct timeval> fo_since;
    /** Entries at or after this time are dropped. */
    std::optional<struct timeval> fo_until;
    std::optional<log_level_t> fo_min_level;
    std::optional<std::string> fo_contains;

    bool empty() const
    {
        return !this->fo_since && !this->fo_until && !this->fo_min_level
            && !this->fo_contains;
    }
};

/**
 * Passes through the entries of another reader that fall in a time window,
 * have a minimum level, and contain a string.  The time window is applied
 * under the assumption that the input is ordered in the given direction: the
 * entries that come before the window are skipped and the first entry after
 * the window ends the sequence without reading any further.
 */
class filtered_entry_reader : public log_entry_reader {
public:
    filtered_entry_reader(std::unique_ptr<log_entry_reader> inner,
                          filter_options opts,
                          direction_t dir);

    void advance() override;

    const log_entry* current() const override;

    bool is_stopped() const { return this->fer_stopped; }

private:
    bool before_window(const struct timeval& tv) const;
    bool after_window(const struct timeval& tv) const;
    bool matches(const log_entry& entry) const;

    std::unique_ptr<log_entry_reader> fer_inner;
    filter_options fer_options;
    direction_t fer_direction;
    bool fer_skipping{true};
    bool fer_stopped{false};
};

#endif
