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
 * @file pager.cc
 */


#include <system_error>

#include <errno.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include "pager.hh"

#include "base/auto_fd.hh"
#include "base/riolog_log.hh"
#include "config.h"

pager::pager(std::vector<std::string> args)
{
    auto_fd in_pipe[2];

    require(!args.empty());

    if (auto_fd::pipe(in_pipe) == -1) {
        auto err = errno;

        log_error("unable to create the pager pipe -- %s", strerror(err));
        throw std::system_error(
            err, std::generic_category(), "unable to create a pipe");
    }
    in_pipe[1].close_on_exec();

    auto child = riolog::pid::from_fork();

    if (child.in_child()) {
        std::vector<char*> argv;

        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        in_pipe[0].reset();
        for (auto& arg : args) {
            argv.emplace_back(arg.data());
        }
        argv.emplace_back(nullptr);
        execvp(argv[0], argv.data());
        fprintf(stderr,
                "error: could not exec pager -- %s:%s\n",
                argv[0],
                strerror(errno));
        _exit(127);
    }

    this->p_child = std::move(child);
    in_pipe[0].reset();

    this->p_output = fdopen(in_pipe[1], "w");
    if (this->p_output == nullptr) {
        auto err = errno;

        log_error("unable to open the pager pipe -- %s", strerror(err));
        throw std::system_error(
            err, std::generic_category(), "unable to open the pager pipe");
    }
    in_pipe[1].release();

    log_info("started pager %s: pid=%d", args[0].c_str(), this->p_child.in());
}

pager::~pager()
{
    this->wait_for_exit();
}

int
pager::close_output()
{
    if (this->p_output == nullptr) {
        return 0;
    }

    auto retval = fclose(this->p_output);

    this->p_output = nullptr;

    return retval;
}

int
pager::wait_for_exit()
{
    if (this->close_output() == EOF && errno != EPIPE) {
        log_error("unable to close the pager pipe -- %s", strerror(errno));
    }

    if (this->p_child.in() == -1) {
        return 0;
    }

    auto finished = std::move(this->p_child).wait_for_child();

    if (!finished.was_normal_exit()) {
        log_warning("pager %d did not exit normally", finished.in());
        return -1;
    }

    log_debug("pager %d exited with status %d",
              finished.in(),
              finished.exit_status());

    return finished.exit_status();
}
