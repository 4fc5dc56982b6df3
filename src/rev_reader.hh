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
 * @file rev_reader.hh
 */

#ifndef riolog_rev_reader_hh
#define riolog_rev_reader_hh

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "input_source.hh"

/**
 * Scans a seekable input_source backward from its end, producing the bytes
 * between successive delimiters.  Only a single block of the source is held
 * in memory at a time.
 */
class rev_reader {
public:
    /**
     * @param src The source to scan, must be seekable.
     * @param delim The byte that separates spans.
     * @param skip_len The number of bytes, starting at the delimiter, that
     *   are dropped from the front of the following span.
     * @param capacity The size of the scratch buffer.
     * @throws std::invalid_argument If the capacity is zero or the source
     *   cannot seek.
     */
    rev_reader(input_source& src, char delim, size_t skip_len, size_t capacity);

    /**
     * Split on a multi-byte terminator.  The spans are delimited by its
     * first byte, but only where the remaining bytes of the terminator
     * follow, other occurrences of the first byte are kept as content.
     *
     * @param src The source to scan, must be seekable.
     * @param terminator The byte sequence that separates spans.
     * @param capacity The size of the scratch buffer.
     * @throws std::invalid_argument If the terminator is empty, the capacity
     *   is zero or the source cannot seek.
     */
    rev_reader(input_source& src, std::string_view terminator, size_t capacity);

    rev_reader(const rev_reader&) = delete;
    rev_reader& operator=(const rev_reader&) = delete;

    /**
     * @return The span preceding the previously returned one or nullopt
     *   once the start of the source has been passed.
     * @throws input_source::error If a seek or read failed.
     */
    std::optional<std::string> next_span();

private:
    bool load_prev_block();
    bool terminator_at(size_t delim_index) const;

    input_source& rr_source;
    char rr_delim;
    size_t rr_skip_len;
    /** Empty when any occurrence of the delimiter ends a span. */
    std::string rr_terminator;
    size_t rr_capacity;
    std::unique_ptr<char[]> rr_buffer;

    /** The offset in the source of the first byte in the buffer. */
    file_off_t rr_offset{-1};
    /** The number of bytes at the front of the buffer not yet scanned. */
    size_t rr_scan_end{0};
    std::string rr_partial;
    bool rr_exhausted{false};
};

#endif
