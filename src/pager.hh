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
 * @file pager.hh
 */


#ifndef riolog_pager_hh
#define riolog_pager_hh

#include <string>
#include <vector>

#include <stdio.h>

#include "base/auto_pid.hh"

/**
 * A pager process, like less(1), that is fed through a pipe connected to
 * its standard input.  The pager shares the terminal with this process.
 */
class pager {
public:
    /**
     * Start the pager.
     *
     * @param args The command, searched for in PATH, and its arguments.
     * @throws std::system_error If the pipe or the process could not be
     *   created.
     */
    explicit pager(std::vector<std::string> args);

    pager(const pager&) = delete;
    pager& operator=(const pager&) = delete;

    /** Closes the pipe and waits for the pager, if not done already. */
    ~pager();

    /** @return The stream that feeds the pager. */
    FILE* get_output() const { return this->p_output; }

    /**
     * Close the pipe so the pager sees the end of its input.
     *
     * @return 0 on success, otherwise EOF with errno set like fclose(3).
     */
    int close_output();

    /**
     * Close the pipe, if needed, and wait for the user to quit the pager.
     *
     * @return The exit status of the pager, -1 if it did not exit
     *   normally, or 0 if it was already waited for.
     */
    int wait_for_exit();

private:
    FILE* p_output{nullptr};
    auto_pid<process_state::running> p_child{-1};
};

#endif
