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
 * @file log_pipeline.cc
 */

#include <stdexcept>

#include "log_pipeline.hh"

#include "base/riolog_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "log_entry_mux.hh"

log_pipeline::log_pipeline(std::vector<std::unique_ptr<input_source>> sources,
                           pipeline_options opts)
    : lp_sources(std::move(sources)), lp_options(std::move(opts))
{
    riolog::eol::validate(this->lp_options.po_eol, "log_pipeline");
    if (this->lp_options.po_buffer_capacity == 0) {
        throw std::invalid_argument("buffer capacity must be positive");
    }

    for (const auto& src : this->lp_sources) {
        if (src->is_seekable()) {
            continue;
        }
        if (this->lp_options.po_direction == direction_t::reverse) {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("'{}' cannot be read in reverse since it is not "
                           "seekable"),
                src->get_name()));
        }
        if (this->lp_sources.size() > 1) {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("'{}' cannot be merged with other files since it "
                           "is not seekable"),
                src->get_name()));
        }
    }

    std::vector<std::unique_ptr<log_entry_reader>> readers;

    for (size_t lpc = 0; lpc < this->lp_sources.size(); lpc++) {
        readers.emplace_back(this->create_reader(lpc));
    }

    if (readers.size() == 1) {
        this->lp_reader = std::move(readers.front());
    } else {
        this->lp_reader = std::make_unique<log_entry_mux>(
            std::move(readers), this->lp_options.po_direction);
    }

    log_info("pipeline: %zu source(s); direction=%s; filtered=%d",
             this->lp_sources.size(),
             direction_name(this->lp_options.po_direction),
             !this->lp_options.po_filter.empty());
}

std::unique_ptr<log_entry_reader>
log_pipeline::create_reader(size_t index)
{
    auto& src = *this->lp_sources[index];
    const auto& opts = this->lp_options;
    std::unique_ptr<log_entry_reader> retval;

    if (opts.po_direction == direction_t::forward) {
        retval = std::make_unique<forward_entry_reader>(
            src, opts.po_eol, index, opts.po_buffer_capacity);
    } else {
        retval = std::make_unique<reverse_entry_reader>(
            src, opts.po_eol, index, opts.po_buffer_capacity);
    }

    log_debug("  source %zu: %s", index, src.get_name().c_str());
    if (opts.po_filter.empty()) {
        return retval;
    }

    return std::make_unique<filtered_entry_reader>(
        std::move(retval), opts.po_filter, opts.po_direction);
}
