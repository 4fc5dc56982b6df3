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
 * @file riolog.cc
 */

#include <memory>
#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "base/auto_fd.hh"
#include "base/riolog_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "input_source.hh"
#include "log_pipeline.hh"
#include "log_writer.hh"
#include "pager.hh"
#include "riolog.options.hh"

static char OUTPUT_BUFFER[1024 * 1024];

static std::unique_ptr<input_source>
open_stdin()
{
    auto fd = auto_fd::dup_of(STDIN_FILENO);

    if (fd == -1) {
        auto err = errno;
        throw input_source::error(
            err,
            fmt::format(FMT_STRING("unable to use the standard input: {}"),
                        strerror(err)));
    }

    return std::make_unique<fd_input_source>("<stdin>", std::move(fd));
}

static void
write_log(FILE* out, const riolog::options& opts, bool color)
{
    log_writer::options wopts;

    wopts.wo_color = color;
    wopts.wo_formatting = opts.o_formatting;

    if (!opts.needs_pipeline(color)) {
        log_writer writer(out, wopts);
        std::unique_ptr<input_source> src;

        if (opts.reads_stdin()) {
            src = open_stdin();
        } else {
            src = fd_input_source::open(opts.o_files.front());
        }
        writer.copy_raw(*src);
        writer.flush();
        return;
    }

    std::vector<std::unique_ptr<input_source>> sources;

    if (opts.reads_stdin()) {
        sources.emplace_back(open_stdin());
    } else {
        for (const auto& path : opts.o_files) {
            sources.emplace_back(fd_input_source::open(path));
        }
        if (opts.o_files.size() > 1) {
            wopts.wo_source_names = opts.o_files;
        }
    }

    log_pipeline pipeline(std::move(sources), opts.to_pipeline_options());
    log_writer writer(out, wopts);

    for (pipeline.advance(); pipeline.current() != nullptr;
         pipeline.advance())
    {
        writer.write_entry(*pipeline.current());
    }
    writer.flush();
}

int
main(int argc, char* argv[])
{
    riolog::options opts;
    CLI::App app{"Filter and view RIO logs"};

    riolog::setup_cli(app, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        fmt::print(FMT_STRING("{}\n"), app.help());
        return EXIT_SUCCESS;
    } catch (const CLI::CallForVersion& e) {
        fmt::print(FMT_STRING("{}\n"), VCS_PACKAGE_STRING);
        return EXIT_SUCCESS;
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!opts.o_debug_log.empty()) {
        if (!log_open(opts.o_debug_log)) {
            fmt::print(stderr,
                       FMT_STRING("error: unable to open debug log '{}': {}\n"),
                       opts.o_debug_log,
                       strerror(errno));
            return EXIT_FAILURE;
        }
        riolog_log_level = riolog_log_level_t::TRACE;
    }
    log_argv(argc, argv);
    log_host_info();

    signal(SIGPIPE, SIG_IGN);

    auto stdout_is_tty = isatty(STDOUT_FILENO) == 1;
    auto color = opts.color_enabled(stdout_is_tty);
    auto retval = EXIT_SUCCESS;
    std::unique_ptr<pager> pgr;
    FILE* out = stdout;

    try {
        if (!opts.o_output.empty()) {
            out = fopen(opts.o_output.c_str(), "we");
            if (out == nullptr) {
                auto err = errno;
                throw log_writer::error(
                    err,
                    fmt::format(FMT_STRING("cannot create file '{}': {}"),
                                opts.o_output,
                                strerror(err)));
            }
        } else if (opts.use_pager(stdout_is_tty)) {
            pgr = std::make_unique<pager>(opts.pager_command(color));
            out = pgr->get_output();
        }
        setvbuf(out, OUTPUT_BUFFER, _IOFBF, sizeof(OUTPUT_BUFFER));

        write_log(out, opts, color);
    } catch (const log_writer::error& e) {
        if (e.e_err == EPIPE) {
            log_info("output pipe closed by the reader");
        } else {
            log_error("%s", e.what());
            fmt::print(stderr, FMT_STRING("error: {}\n"), e.what());
            retval = EXIT_FAILURE;
        }
    } catch (const input_source::error& e) {
        log_error("%s", e.what());
        fmt::print(stderr, FMT_STRING("error: {}\n"), e.what());
        retval = EXIT_FAILURE;
    } catch (const std::invalid_argument& e) {
        log_error("%s", e.what());
        fmt::print(stderr, FMT_STRING("error: {}\n"), e.what());
        retval = EXIT_FAILURE;
    } catch (const std::system_error& e) {
        log_error("%s", e.what());
        fmt::print(stderr, FMT_STRING("error: {}\n"), e.what());
        retval = EXIT_FAILURE;
    }

    if (pgr) {
        if (pgr->close_output() != 0 && errno != EPIPE
            && retval == EXIT_SUCCESS)
        {
            fmt::print(stderr,
                       FMT_STRING("error: unable to write to the pager: {}\n"),
                       strerror(errno));
            retval = EXIT_FAILURE;
        }

        auto status = pgr->wait_for_exit();
        if (status != 0 && retval == EXIT_SUCCESS) {
            log_error("pager failed with status %d", status);
            retval = EXIT_FAILURE;
        }
    } else if (out != stdout && out != nullptr) {
        if (fclose(out) != 0 && retval == EXIT_SUCCESS) {
            fmt::print(stderr,
                       FMT_STRING("error: unable to write '{}': {}\n"),
                       opts.o_output,
                       strerror(errno));
            retval = EXIT_FAILURE;
        }
    } else if (fflush(stdout) != 0 && errno != EPIPE) {
        retval = EXIT_FAILURE;
    }

    log_info("exiting with status %d", retval);
    log_close();

    return retval;
}
