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
 * @file log_entry_reader.hh
 */

#ifndef riolog_log_entry_reader_hh
#define riolog_log_entry_reader_hh

#include <string>
#include <string_view>
#include <vector>

#include "input_source.hh"
#include "line_reader.hh"
#include "log_entry.hh"
#include "rev_reader.hh"

/**
 * A lazy sequence of log entries.  The entry returned by current() is owned
 * by the reader and is only valid until the next call to advance().
 */
class log_entry_reader {
public:
    virtual ~log_entry_reader() = default;

    /**
     * Move to the next entry in the sequence.
     *
     * @throws input_source::error If reading the underlying source failed.
     */
    virtual void advance() = 0;

    /**
     * @return The current entry or nullptr if advance() has not been called
     *   yet or the sequence is exhausted.
     */
    virtual const log_entry* current() const = 0;
};

/**
 * Frames the entries of a source from its start to its end.  Entries are
 * separated by a blank line, which is kept at the end of the entry.
 */
class forward_entry_reader : public log_entry_reader {
public:
    forward_entry_reader(input_source& src,
                         std::string_view eol,
                         size_t source_index = 0,
                         size_t capacity = line_reader::DEFAULT_BUFFER_SIZE);

    void advance() override;

    const log_entry* current() const override;

private:
    line_reader fer_reader;
    std::string fer_eol;
    log_entry fer_entry;
};

/**
 * Frames the entries of a seekable source from its end to its start.  Each
 * entry is given two line terminators at the end so that it has the same
 * layout as an entry read by a forward_entry_reader.
 */
class reverse_entry_reader : public log_entry_reader {
public:
    reverse_entry_reader(input_source& src,
                         std::string_view eol,
                         size_t source_index = 0,
                         size_t capacity = line_reader::DEFAULT_BUFFER_SIZE);

    void advance() override;

    const log_entry* current() const override;

private:
    std::string rer_eol;
    rev_reader rer_reader;
    std::vector<std::string> rer_spans;
    log_entry rer_entry;
};

#endif
