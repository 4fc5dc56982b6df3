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
 * @file line_reader.hh
 */

#ifndef riolog_line_reader_hh
#define riolog_line_reader_hh

#include <memory>
#include <string>

#include <sys/types.h>

#include "input_source.hh"

/**
 * Buffered forward reader that hands out the bytes of an input_source one
 * delimited piece at a time.
 */
class line_reader {
public:
    static const size_t DEFAULT_BUFFER_SIZE;

    explicit line_reader(input_source& src,
                         size_t capacity = DEFAULT_BUFFER_SIZE);

    line_reader(const line_reader&) = delete;
    line_reader& operator=(const line_reader&) = delete;

    /**
     * Append the bytes up to and including the next delimiter to the given
     * string.  At the end of the source, the remaining bytes are appended
     * without a delimiter.
     *
     * @param delim The byte that ends a piece.
     * @param dst The string to append to.
     * @return The number of bytes appended, zero at the end of the source.
     * @throws input_source::error If the read failed.
     */
    size_t read_until(char delim, std::string& dst);

    bool is_at_end() const
    {
        return this->lr_eof && this->lr_start == this->lr_end;
    }

private:
    bool fill();

    input_source& lr_source;
    std::unique_ptr<char[]> lr_buffer;
    size_t lr_capacity;
    size_t lr_start{0};
    size_t lr_end{0};
    bool lr_eof{false};
};

#endif
