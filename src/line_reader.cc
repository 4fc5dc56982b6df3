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
 * @file line_reader.cc
 */

#include <stdexcept>

#include <string.h>

#include "line_reader.hh"

#include "base/riolog_log.hh"
#include "config.h"

const size_t line_reader::DEFAULT_BUFFER_SIZE = 1024 * 1024;

line_reader::line_reader(input_source& src, size_t capacity)
    : lr_source(src), lr_capacity(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("line buffer capacity must be positive");
    }

    this->lr_buffer = std::make_unique<char[]>(capacity);
}

bool
line_reader::fill()
{
    if (this->lr_eof) {
        return false;
    }

    this->lr_start = 0;
    this->lr_end = this->lr_source.read(this->lr_buffer.get(),
                                        this->lr_capacity);
    if (this->lr_end == 0) {
        this->lr_eof = true;
        return false;
    }

    return true;
}

size_t
line_reader::read_until(char delim, std::string& dst)
{
    size_t retval = 0;

    for (;;) {
        if (this->lr_start == this->lr_end && !this->fill()) {
            break;
        }

        const auto* start = &this->lr_buffer[this->lr_start];
        auto avail = this->lr_end - this->lr_start;
        const auto* hit = (const char*) memchr(start, delim, avail);
        auto amount = hit == nullptr ? avail : (size_t) (hit - start) + 1;

        dst.append(start, amount);
        this->lr_start += amount;
        retval += amount;
        if (hit != nullptr) {
            break;
        }
    }

    return retval;
}
