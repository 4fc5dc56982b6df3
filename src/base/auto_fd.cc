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
 * @file auto_fd.cc
 */

#include "auto_fd.hh"

#include <fcntl.h>
#include <unistd.h>

#include "config.h"
#include "riolog_log.hh"

int
auto_fd::pipe(auto_fd* af)
{
    int retval, fd[2];

    require(af != nullptr);

    if ((retval = ::pipe(fd)) == 0) {
        af[0] = fd[0];
        af[1] = fd[1];
    }

    return retval;
}

auto_fd
auto_fd::dup_of(int fd)
{
    if (fd == -1) {
        return auto_fd{};
    }

    auto_fd retval(::dup(fd));

    if (retval.has_value()) {
        retval.close_on_exec();
    }

    return retval;
}

auto_fd::auto_fd(int fd) : af_fd(fd)
{
    require(fd >= -1);
}

auto_fd::auto_fd(auto_fd&& af) noexcept : af_fd(af.release()) {}

auto_fd::~auto_fd()
{
    this->reset();
}

void
auto_fd::reset(int fd)
{
    require(fd >= -1);

    if (this->af_fd != fd) {
        if (this->af_fd != -1) {
            switch (this->af_fd) {
                case STDIN_FILENO:
                case STDOUT_FILENO:
                case STDERR_FILENO:
                    break;
                default:
                    close(this->af_fd);
                    break;
            }
        }
        this->af_fd = fd;
    }
}

void
auto_fd::close_on_exec() const
{
    if (this->af_fd == -1) {
        return;
    }
    log_perror(fcntl(this->af_fd, F_SETFD, FD_CLOEXEC));
}

auto_fd&
auto_fd::operator=(int fd)
{
    require(fd >= -1);

    this->reset(fd);
    return *this;
}
