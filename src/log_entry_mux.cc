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
 * @file log_entry_mux.cc
 */

#include <algorithm>

#include "log_entry_mux.hh"

#include "base/riolog_log.hh"
#include "base/time_util.hh"
#include "config.h"

log_entry_mux::log_entry_mux(
    std::vector<std::unique_ptr<log_entry_reader>> readers, direction_t dir)
    : lem_readers(std::move(readers)), lem_direction(dir)
{
}

bool
log_entry_mux::comes_before(const log_entry& lhs, const log_entry& rhs) const
{
    auto lhs_time = lhs.get_timestamp();
    auto rhs_time = rhs.get_timestamp();

    if (this->lem_direction == direction_t::forward) {
        return lhs_time < rhs_time;
    }
    return rhs_time < lhs_time;
}

void
log_entry_mux::advance()
{
    if (this->lem_current) {
        auto index = this->lem_current.value();
        auto& reader = this->lem_readers[index];

        reader->advance();
        if (reader->current() == nullptr) {
            log_debug("merge input %zu is finished, %zu remaining",
                      index,
                      this->lem_readers.size() - 1);
            this->lem_readers.erase(this->lem_readers.begin() + index);
        }
        this->lem_current = std::nullopt;
    } else if (!this->lem_primed) {
        for (auto& reader : this->lem_readers) {
            reader->advance();
        }
        this->lem_readers.erase(
            std::remove_if(this->lem_readers.begin(),
                           this->lem_readers.end(),
                           [](const auto& reader) {
                               return reader->current() == nullptr;
                           }),
            this->lem_readers.end());
        this->lem_primed = true;
        log_debug("merging %zu inputs", this->lem_readers.size());
    }

    auto iter = std::min_element(
        this->lem_readers.begin(),
        this->lem_readers.end(),
        [this](const auto& lhs, const auto& rhs) {
            return this->comes_before(*lhs->current(), *rhs->current());
        });
    if (iter != this->lem_readers.end()) {
        this->lem_current = std::distance(this->lem_readers.begin(), iter);
    }
}

const log_entry*
log_entry_mux::current() const
{
    if (!this->lem_current) {
        return nullptr;
    }

    return this->lem_readers[this->lem_current.value()]->current();
}
