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
 * @file test_auto_fd.cc
 */

#include <assert.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <utility>

#include "base/auto_fd.hh"
#include "config.h"

int
main(int argc, char* argv[])
{
    int retval = EXIT_SUCCESS;
    auto_fd fd1, fd2;
    int tmp;

    assert(fd1 == -1);
    assert(!fd1.has_value());
    tmp = open("/dev/null", O_RDONLY);
    assert(tmp != -1);
    fd1 = tmp;
    fd1 = tmp;
    assert(fcntl(tmp, F_GETFL) >= 0);
    fd1 = std::move(fd2);
    assert(fcntl(tmp, F_GETFL) == -1);
    assert(errno == EBADF);
    assert(fd1 == -1);

    {
        auto_fd inner(open("/dev/null", O_RDONLY));

        tmp = inner.get();
        assert(inner.has_value());

        auto_fd moved(std::move(inner));

        assert(inner == -1);
        assert(moved == tmp);
    }
    assert(fcntl(tmp, F_GETFL) == -1);

    {
        auto_fd dup_fd = auto_fd::dup_of(STDOUT_FILENO);

        assert(dup_fd != -1);
        assert(dup_fd != STDOUT_FILENO);
        assert(fcntl(dup_fd, F_GETFD) & FD_CLOEXEC);
        tmp = dup_fd;
    }
    assert(fcntl(tmp, F_GETFL) == -1);
    assert(auto_fd::dup_of(-1) == -1);
    assert(auto_fd::dup_of(1 << 20) == -1);

    {
        auto_fd pi[2];
        char buf[8];

        assert(auto_fd::pipe(pi) == 0);
        assert(write(pi[1], "abc", 3) == 3);
        pi[1].reset();
        assert(read(pi[0], buf, sizeof(buf)) == 3);
        assert(memcmp(buf, "abc", 3) == 0);
        assert(read(pi[0], buf, sizeof(buf)) == 0);
    }

    fd1 = STDOUT_FILENO;
    fd1.reset();
    assert(fcntl(STDOUT_FILENO, F_GETFL) >= 0);

    fd1 = STDERR_FILENO;
    assert(fd1.release() == STDERR_FILENO);
    assert(fd1 == -1);

    return retval;
}
