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
 * @file log_entry_mux.hh
 */

#ifndef riolog_log_entry_mux_hh
#define riolog_log_entry_mux_hh

#include <memory>
#include <optional>
#include <vector>

#include "direction.hh"
#include "log_entry_reader.hh"

/**
 * Merges the entries of several readers, each already ordered in the given
 * direction, into a single ordered sequence.  Entries without a timestamp
 * are ordered before all others when going forward and after all others in
 * reverse.
 */
class log_entry_mux : public log_entry_reader {
public:
    log_entry_mux(std::vector<std::unique_ptr<log_entry_reader>> readers,
                  direction_t dir);

    void advance() override;

    const log_entry* current() const override;

    /** @return The number of readers that still have entries. */
    size_t live_count() const { return this->lem_readers.size(); }

private:
    bool comes_before(const log_entry& lhs, const log_entry& rhs) const;

    std::vector<std::unique_ptr<log_entry_reader>> lem_readers;
    direction_t lem_direction;
    std::optional<size_t> lem_current;
    bool lem_primed{false};
};

#endif
