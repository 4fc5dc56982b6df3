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
 * @file time_util.tests.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "time_util.hh"

TEST_CASE("to_rfc3339_string")
{
    CHECK(riolog::to_rfc3339_string(1578946098, 476)
          == "2020-01-13 20:08:18.476");
    CHECK(riolog::to_rfc3339_string(0, 0, 'T') == "1970-01-01T00:00:00.000");

    struct timeval tv = {1582934400, 5000};

    CHECK(riolog::to_rfc3339_string(tv) == "2020-02-29 00:00:00.005");
    CHECK(riolog::to_rfc3339_string(-3600, 0) == "1969-12-31 23:00:00.000");

    char small[8];

    CHECK(riolog::strftime_rfc3339(small, sizeof(small), 0, 0) == -1);
}

TEST_CASE("tm2sec")
{
    struct tm tm;

    memset(&tm, 0, sizeof(tm));
    tm.tm_year = 120;
    tm.tm_mon = 0;
    tm.tm_mday = 1;
    CHECK(tm2sec(&tm) == 1577836800);

    tm.tm_mon = 2;
    tm.tm_mday = 1;
    CHECK(tm2sec(&tm) == 1583020800);

    tm.tm_year = 69;
    tm.tm_mon = 11;
    tm.tm_mday = 31;
    tm.tm_hour = 23;
    tm.tm_min = 59;
    tm.tm_sec = 59;
    CHECK(tm2sec(&tm) == -1);

    tm.tm_hour = 23;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    CHECK(tm2sec(&tm) == -3600);

    memset(&tm, 0, sizeof(tm));
    tm.tm_year = 0;
    tm.tm_mon = 0;
    tm.tm_mday = 1;
    CHECK(tm2sec(&tm) == -2208988800LL);

    tm.tm_year = -1900;
    CHECK(tm2sec(&tm) == -62167219200LL);

    struct tm back;

    secs2tm(1583020800, &back);
    CHECK(back.tm_year == 120);
    CHECK(back.tm_mon == 2);
    CHECK(back.tm_mday == 1);

    secs2tm(-3600, &back);
    CHECK(back.tm_year == 69);
    CHECK(back.tm_mon == 11);
    CHECK(back.tm_mday == 31);
    CHECK(back.tm_hour == 23);

    secs2tm(-2208988800LL, &back);
    CHECK(back.tm_year == 0);
    CHECK(back.tm_mon == 0);
    CHECK(back.tm_mday == 1);
}

TEST_CASE("exttm::valid_mday")
{
    struct exttm tm;

    tm.et_tm.tm_year = 120;
    tm.et_tm.tm_mon = 1;
    tm.et_tm.tm_mday = 29;
    CHECK(tm.valid_mday());

    tm.et_tm.tm_year = 119;
    CHECK_FALSE(tm.valid_mday());

    tm.et_tm.tm_year = 100;
    CHECK(tm.valid_mday());

    tm.et_tm.tm_mon = 3;
    tm.et_tm.tm_mday = 31;
    CHECK_FALSE(tm.valid_mday());

    tm.et_tm.tm_mon = 11;
    CHECK(tm.valid_mday());
}

TEST_CASE("timeval ordering")
{
    struct timeval a = {10, 500};
    struct timeval b = {10, 600};
    struct timeval c = {11, 0};

    CHECK(a < b);
    CHECK(b < c);
    CHECK_FALSE(b < a);
    CHECK_FALSE(a < a);
    CHECK(c >= b);
    CHECK(a >= a);
    CHECK_FALSE(a >= b);
}
