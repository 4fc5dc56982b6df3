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
 * @file log_entry.hh
 */

#ifndef riolog_log_entry_hh
#define riolog_log_entry_hh

#include <optional>
#include <string>
#include <string_view>

#include <sys/time.h>

#include "log_level.hh"

/**
 * The raw bytes of a single log entry along with the fields derived from
 * them.  Readers reuse one instance for every entry they produce, so the
 * derived fields are cached until the contents are next changed.
 */
class log_entry {
public:
    static log_entry from_contents(std::string contents,
                                   size_t source_index = 0);

    log_entry() = default;

    log_entry(const log_entry&) = delete;
    log_entry& operator=(const log_entry&) = delete;

    log_entry(log_entry&&) = default;
    log_entry& operator=(log_entry&&) = default;

    /** @return A detached copy of this entry that can outlive the reader. */
    log_entry copy() const;

    const std::string& get_contents() const { return this->le_contents; }

    /**
     * Access the contents for modification, any cached fields are
     * discarded.
     */
    std::string& get_writable_contents()
    {
        this->invalidate();
        return this->le_contents;
    }

    void set_contents(std::string contents)
    {
        this->invalidate();
        this->le_contents = std::move(contents);
    }

    void append(std::string_view sv)
    {
        this->invalidate();
        this->le_contents.append(sv.data(), sv.size());
    }

    void clear()
    {
        this->invalidate();
        this->le_contents.clear();
    }

    bool empty() const { return this->le_contents.empty(); }

    size_t size() const { return this->le_contents.size(); }

    size_t get_source_index() const { return this->le_source_index; }

    void set_source_index(size_t index) { this->le_source_index = index; }

    /**
     * @return The level named by the character after the first '-' or
     *   nullopt if there is no such level.
     */
    std::optional<log_level_t> get_level() const;

    /**
     * @return The time that starts two bytes after the first '>' or nullopt
     *   if it is missing or malformed.
     */
    std::optional<struct timeval> get_timestamp() const;

    bool contains(std::string_view needle) const
    {
        return this->le_contents.find(needle.data(), 0, needle.size())
            != std::string::npos;
    }

private:
    void invalidate()
    {
        this->le_level_valid = false;
        this->le_timestamp_valid = false;
    }

    std::string le_contents;
    size_t le_source_index{0};

    mutable bool le_level_valid{false};
    mutable std::optional<log_level_t> le_level;
    mutable bool le_timestamp_valid{false};
    mutable std::optional<struct timeval> le_timestamp;
};

#endif
