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
 * @file log_entry.cc
 */

#include "log_entry.hh"

#include "config.h"
#include "log_timestamp.hh"

log_entry
log_entry::from_contents(std::string contents, size_t source_index)
{
    log_entry retval;

    retval.le_contents = std::move(contents);
    retval.le_source_index = source_index;

    return retval;
}

log_entry
log_entry::copy() const
{
    auto retval = from_contents(this->le_contents, this->le_source_index);

    retval.le_level_valid = this->le_level_valid;
    retval.le_level = this->le_level;
    retval.le_timestamp_valid = this->le_timestamp_valid;
    retval.le_timestamp = this->le_timestamp;

    return retval;
}

std::optional<log_level_t>
log_entry::get_level() const
{
    if (!this->le_level_valid) {
        const auto& str = this->le_contents;
        auto dash = str.find('-');

        if (dash == std::string::npos || dash + 1 >= str.size()) {
            this->le_level = std::nullopt;
        } else {
            this->le_level = abbrev2level(str[dash + 1]);
        }
        this->le_level_valid = true;
    }

    return this->le_level;
}

std::optional<struct timeval>
log_entry::get_timestamp() const
{
    if (!this->le_timestamp_valid) {
        const auto& str = this->le_contents;
        auto gt = str.find('>');

        if (gt == std::string::npos || gt + 2 > str.size()) {
            this->le_timestamp = std::nullopt;
        } else {
            auto start = gt + 2;

            this->le_timestamp = riolog::parse_entry_timestamp(
                &str[start], str.size() - start);
        }
        this->le_timestamp_valid = true;
    }

    return this->le_timestamp;
}
