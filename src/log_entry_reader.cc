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
 * @file log_entry_reader.cc
 */

#include "log_entry_reader.hh"

#include "base/riolog_log.hh"
#include "config.h"
#include "eol.hh"

static std::string_view
checked_eol(std::string_view eol)
{
    riolog::eol::validate(eol, "log_entry_reader");

    return eol;
}

forward_entry_reader::forward_entry_reader(input_source& src,
                                           std::string_view eol,
                                           size_t source_index,
                                           size_t capacity)
    : fer_reader(src, capacity), fer_eol(checked_eol(eol))
{
    this->fer_entry.set_source_index(source_index);
}

void
forward_entry_reader::advance()
{
    auto last = this->fer_eol.back();
    auto eol_len = this->fer_eol.size();
    auto& contents = this->fer_entry.get_writable_contents();

    contents.clear();
    for (;;) {
        auto rc = this->fer_reader.read_until(last, contents);

        if (rc == 0) {
            break;
        }
        if (rc <= eol_len && contents.back() == last) {
            if (contents.size() > eol_len) {
                break;
            }
            // blank lines before the first entry
            contents.clear();
        }
    }
}

const log_entry*
forward_entry_reader::current() const
{
    if (this->fer_entry.empty()) {
        return nullptr;
    }

    return &this->fer_entry;
}

reverse_entry_reader::reverse_entry_reader(input_source& src,
                                           std::string_view eol,
                                           size_t source_index,
                                           size_t capacity)
    : rer_eol(checked_eol(eol)),
      rer_reader(src, eol, capacity)
{
    this->rer_entry.set_source_index(source_index);
}

void
reverse_entry_reader::advance()
{
    this->rer_spans.clear();
    for (;;) {
        auto span = this->rer_reader.next_span();

        if (!span) {
            break;
        }
        if (span->empty()) {
            if (this->rer_spans.empty()) {
                continue;
            }
            break;
        }
        this->rer_spans.emplace_back(std::move(span.value()));
    }

    auto& contents = this->rer_entry.get_writable_contents();

    contents.clear();
    if (this->rer_spans.empty()) {
        return;
    }

    for (auto iter = this->rer_spans.rbegin(); iter != this->rer_spans.rend();
         ++iter)
    {
        if (iter != this->rer_spans.rbegin()) {
            contents.append(this->rer_eol);
        }
        contents.append(*iter);
    }
    contents.append(this->rer_eol);
    contents.append(this->rer_eol);
}

const log_entry*
reverse_entry_reader::current() const
{
    if (this->rer_entry.empty()) {
        return nullptr;
    }

    return &this->rer_entry;
}
