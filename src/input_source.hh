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
 * @file input_source.hh
 */

#ifndef riolog_input_source_hh
#define riolog_input_source_hh

#include <exception>
#include <memory>
#include <string>

#include <stdint.h>
#include <sys/types.h>

#include "base/auto_fd.hh"

using file_off_t = int64_t;
using file_ssize_t = int64_t;

/**
 * A source of raw log bytes.  Reads are sequential from the current offset,
 * seekable sources can also be repositioned.
 */
class input_source {
public:
    class error : public std::exception {
    public:
        error(int err, std::string msg);

        const char* what() const noexcept override
        {
            return this->e_msg.c_str();
        }

        int e_err;
        std::string e_msg;
    };

    virtual ~input_source() = default;

    input_source(const input_source&) = delete;
    input_source& operator=(const input_source&) = delete;

    /** @return The name used in messages and when prefixing output. */
    const std::string& get_name() const { return this->is_name; }

    virtual bool is_seekable() const = 0;

    /**
     * Read up to len bytes from the current offset.
     *
     * @return The number of bytes read, zero at the end of the source.
     * @throws error If the underlying read failed.
     */
    virtual size_t read(char* buf, size_t len) = 0;

    /**
     * Reposition the read offset, see lseek(2).
     *
     * @return The new offset from the start of the source.
     * @throws error If the source cannot seek or the seek failed.
     */
    virtual file_off_t seek(file_off_t off, int whence) = 0;

    /**
     * Read exactly len bytes, a short read is an error.
     */
    void read_fully(char* buf, size_t len);

protected:
    explicit input_source(std::string name) : is_name(std::move(name)) {}

    std::string is_name;
};

/**
 * An input_source backed by a file descriptor, like a regular file or the
 * standard input.
 */
class fd_input_source : public input_source {
public:
    /**
     * Open a file for reading.
     *
     * @throws error If the file could not be opened.
     */
    static std::unique_ptr<fd_input_source> open(const std::string& path);

    fd_input_source(std::string name, auto_fd fd);

    bool is_seekable() const override { return this->fis_seekable; }

    size_t read(char* buf, size_t len) override;

    file_off_t seek(file_off_t off, int whence) override;

    int get_fd() const { return this->fis_fd.get(); }

private:
    auto_fd fis_fd;
    bool fis_seekable{false};
};

/**
 * An input_source that serves bytes held in memory.
 */
class string_input_source : public input_source {
public:
    explicit string_input_source(std::string data,
                                 std::string name = "<string>",
                                 bool seekable = true)
        : input_source(std::move(name)), sis_data(std::move(data)),
          sis_seekable(seekable)
    {
    }

    bool is_seekable() const override { return this->sis_seekable; }

    size_t read(char* buf, size_t len) override;

    file_off_t seek(file_off_t off, int whence) override;

    /** @return The number of read() calls, including ones at the end. */
    size_t get_read_count() const { return this->sis_read_count; }

private:
    std::string sis_data;
    file_off_t sis_offset{0};
    bool sis_seekable;
    size_t sis_read_count{0};
};

#endif
