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
 * @file log_filter.cc
 */

#include "log_filter.hh"

#include "base/riolog_log.hh"
#include "base/time_util.hh"
#include "config.h"
#include "log_timestamp.hh"

filtered_entry_reader::filtered_entry_reader(
    std::unique_ptr<log_entry_reader> inner,
    filter_options opts,
    direction_t dir)
    : fer_inner(std::move(inner)), fer_options(std::move(opts)),
      fer_direction(dir)
{
    require(this->fer_inner != nullptr);
}

bool
filtered_entry_reader::before_window(const struct timeval& tv) const
{
    const auto& opts = this->fer_options;

    if (this->fer_direction == direction_t::forward) {
        return opts.fo_since && tv < opts.fo_since.value();
    }
    return opts.fo_until && tv >= opts.fo_until.value();
}

bool
filtered_entry_reader::after_window(const struct timeval& tv) const
{
    const auto& opts = this->fer_options;

    if (this->fer_direction == direction_t::forward) {
        return opts.fo_until && tv >= opts.fo_until.value();
    }
    return opts.fo_since && tv < opts.fo_since.value();
}

bool
filtered_entry_reader::matches(const log_entry& entry) const
{
    if (this->fer_options.fo_min_level) {
        auto level = entry.get_level();

        if (level && level.value() < this->fer_options.fo_min_level.value()) {
            return false;
        }
    }

    if (this->fer_options.fo_contains
        && !entry.contains(this->fer_options.fo_contains.value()))
    {
        return false;
    }

    return true;
}

void
filtered_entry_reader::advance()
{
    if (this->fer_stopped) {
        return;
    }

    for (;;) {
        this->fer_inner->advance();

        const auto* entry = this->fer_inner->current();
        if (entry == nullptr) {
            return;
        }

        auto tv = entry->get_timestamp();
        if (tv) {
            if (this->fer_skipping) {
                if (this->before_window(tv.value())) {
                    continue;
                }
                this->fer_skipping = false;
            }
            if (this->after_window(tv.value())) {
                log_debug("entry at %s is past the time window, stopping",
                          riolog::format_timestamp(tv.value()).c_str());
                this->fer_stopped = true;
                return;
            }
        }

        if (this->matches(*entry)) {
            return;
        }
    }
}

const log_entry*
filtered_entry_reader::current() const
{
    if (this->fer_stopped) {
        return nullptr;
    }

    return this->fer_inner->current();
}
