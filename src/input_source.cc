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
 * @file input_source.cc
 */

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "input_source.hh"

#include "base/riolog_log.hh"
#include "config.h"
#include "fmt/format.h"

input_source::error::error(int err, std::string msg)
    : e_err(err), e_msg(std::move(msg))
{
}

void
input_source::read_fully(char* buf, size_t len)
{
    size_t total = 0;

    while (total < len) {
        auto rc = this->read(&buf[total], len - total);

        if (rc == 0) {
            throw error(EIO,
                        fmt::format(FMT_STRING("short read from {}: expected "
                                               "{} bytes, got {}"),
                                    this->is_name,
                                    len,
                                    total));
        }
        total += rc;
    }
}

std::unique_ptr<fd_input_source>
fd_input_source::open(const std::string& path)
{
    auto_fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));

    if (fd == -1) {
        auto err = errno;

        log_error("unable to open %s -- %s", path.c_str(), strerror(err));
        throw error(err,
                    fmt::format(FMT_STRING("cannot open file '{}': {}"),
                                path,
                                strerror(err)));
    }

    return std::make_unique<fd_input_source>(path, std::move(fd));
}

fd_input_source::fd_input_source(std::string name, auto_fd fd)
    : input_source(std::move(name)), fis_fd(std::move(fd))
{
    struct stat st;

    if (fstat(this->fis_fd, &st) == 0) {
        this->fis_seekable = S_ISREG(st.st_mode);
    }
    log_debug("input %s: fd=%d seekable=%d",
              this->is_name.c_str(),
              this->fis_fd.get(),
              this->fis_seekable);
}

size_t
fd_input_source::read(char* buf, size_t len)
{
    for (;;) {
        auto rc = ::read(this->fis_fd, buf, len);

        if (rc >= 0) {
            return rc;
        }
        if (errno == EINTR) {
            continue;
        }

        auto err = errno;
        log_error("read from %s failed -- %s",
                  this->is_name.c_str(),
                  strerror(err));
        throw error(err,
                    fmt::format(FMT_STRING("unable to read from '{}': {}"),
                                this->is_name,
                                strerror(err)));
    }
}

file_off_t
fd_input_source::seek(file_off_t off, int whence)
{
    if (!this->fis_seekable) {
        throw error(ESPIPE,
                    fmt::format(FMT_STRING("cannot seek in '{}'"),
                                this->is_name));
    }

    auto rc = lseek(this->fis_fd, off, whence);
    if (rc == -1) {
        auto err = errno;
        log_error("seek in %s failed -- %s",
                  this->is_name.c_str(),
                  strerror(err));
        throw error(err,
                    fmt::format(FMT_STRING("unable to seek in '{}': {}"),
                                this->is_name,
                                strerror(err)));
    }

    return rc;
}

size_t
string_input_source::read(char* buf, size_t len)
{
    this->sis_read_count += 1;

    auto avail = (file_off_t) this->sis_data.size() - this->sis_offset;
    if (avail <= 0) {
        return 0;
    }

    auto amount = std::min((file_off_t) len, avail);
    memcpy(buf, &this->sis_data[this->sis_offset], amount);
    this->sis_offset += amount;

    return amount;
}

file_off_t
string_input_source::seek(file_off_t off, int whence)
{
    if (!this->sis_seekable) {
        throw error(ESPIPE,
                    fmt::format(FMT_STRING("cannot seek in '{}'"),
                                this->is_name));
    }

    file_off_t base = 0;
    switch (whence) {
        case SEEK_SET:
            break;
        case SEEK_CUR:
            base = this->sis_offset;
            break;
        case SEEK_END:
            base = this->sis_data.size();
            break;
        default:
            throw error(EINVAL, "invalid seek origin");
    }

    if (base + off < 0) {
        throw error(EINVAL,
                    fmt::format(FMT_STRING("seek before the start of '{}'"),
                                this->is_name));
    }
    this->sis_offset = base + off;

    return this->sis_offset;
}
