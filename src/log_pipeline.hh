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
 * @file log_pipeline.hh
 */

#ifndef riolog_log_pipeline_hh
#define riolog_log_pipeline_hh

#include <memory>
#include <string>
#include <vector>

#include "direction.hh"
#include "eol.hh"
#include "input_source.hh"
#include "line_reader.hh"
#include "log_entry_reader.hh"
#include "log_filter.hh"

struct pipeline_options {
    filter_options po_filter;
    direction_t po_direction{direction_t::forward};
    std::string po_eol{riolog::eol::PLATFORM};
    size_t po_buffer_capacity{line_reader::DEFAULT_BUFFER_SIZE};
};

/**
 * The entries of a set of sources, framed, filtered and merged into a
 * single ordered sequence.  The source index of each entry is the position
 * of its source in the vector given to the constructor.
 */
class log_pipeline : public log_entry_reader {
public:
    /**
     * @throws std::invalid_argument If the options are degenerate or a
     *   source that cannot seek is to be read in reverse or merged.
     */
    log_pipeline(std::vector<std::unique_ptr<input_source>> sources,
                 pipeline_options opts);

    void advance() override { this->lp_reader->advance(); }

    const log_entry* current() const override
    {
        return this->lp_reader->current();
    }

    size_t source_count() const { return this->lp_sources.size(); }

    const input_source& get_source(size_t index) const
    {
        return *this->lp_sources.at(index);
    }

    const pipeline_options& get_options() const { return this->lp_options; }

private:
    std::unique_ptr<log_entry_reader> create_reader(size_t index);

    std::vector<std::unique_ptr<input_source>> lp_sources;
    pipeline_options lp_options;
    std::unique_ptr<log_entry_reader> lp_reader;
};

#endif
