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
 * @file ptimec.hh
 */

#ifndef riolog_ptimec_hh
#define riolog_ptimec_hh

#include <ctype.h>
#include <inttypes.h>
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <time.h>

#include "base/time_util.hh"

#define PTIME_CONSUME(amount, block) \
    if ((off_inout + (amount)) > len) { \
        return false; \
    } \
\
    block \
\
        off_inout \
        += (amount);

inline bool
ptime_digits(const char* str, off_t off, size_t count)
{
    for (size_t lpc = 0; lpc < count; lpc++) {
        if (!isdigit((unsigned char) str[off + lpc])) {
            return false;
        }
    }

    return true;
}

inline bool
ptime_Y(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(4, {
        if (!ptime_digits(str, off_inout, 4)) {
            return false;
        }
        dst->et_tm.tm_year = ((str[off_inout + 0] - '0') * 1000
                              + (str[off_inout + 1] - '0') * 100
                              + (str[off_inout + 2] - '0') * 10
                              + (str[off_inout + 3] - '0') * 1)
            - 1900;

        if (dst->et_tm.tm_year < 0 || dst->et_tm.tm_year > 1100) {
            return false;
        }

        dst->et_flags |= ETF_YEAR_SET;
    });

    return true;
}

inline bool
ptime_m(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(2, {
        if (!ptime_digits(str, off_inout, 2)) {
            return false;
        }
        dst->et_tm.tm_mon
            = (str[off_inout] - '0') * 10 + (str[off_inout + 1] - '0') - 1;
    });

    if (dst->et_tm.tm_mon >= 0 && dst->et_tm.tm_mon <= 11) {
        dst->et_flags |= ETF_MONTH_SET;
        return true;
    }

    return false;
}

inline bool
ptime_d(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(2, {
        if (!ptime_digits(str, off_inout, 2)) {
            return false;
        }
        dst->et_tm.tm_mday
            = (str[off_inout] - '0') * 10 + (str[off_inout + 1] - '0');
    });

    if (dst->et_tm.tm_mday >= 1 && dst->et_tm.tm_mday <= 31) {
        dst->et_flags |= ETF_DAY_SET;
        return true;
    }
    return false;
}

inline bool
ptime_H(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(2, {
        if (!ptime_digits(str, off_inout, 2)) {
            return false;
        }
        dst->et_tm.tm_hour
            = (str[off_inout] - '0') * 10 + (str[off_inout + 1] - '0');
        dst->et_flags |= ETF_HOUR_SET;
    });

    return (dst->et_tm.tm_hour >= 0 && dst->et_tm.tm_hour <= 23);
}

inline bool
ptime_M(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(2, {
        if (!ptime_digits(str, off_inout, 2)) {
            return false;
        }
        dst->et_tm.tm_min
            = (str[off_inout] - '0') * 10 + (str[off_inout + 1] - '0');
        dst->et_flags |= ETF_MINUTE_SET;
    });

    return (dst->et_tm.tm_min >= 0 && dst->et_tm.tm_min <= 59);
}

inline bool
ptime_S(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(2, {
        if (!ptime_digits(str, off_inout, 2)) {
            return false;
        }
        dst->et_tm.tm_sec
            = (str[off_inout] - '0') * 10 + (str[off_inout + 1] - '0');
        if (dst->et_tm.tm_sec < 0 || dst->et_tm.tm_sec >= 60) {
            return false;
        }
        dst->et_flags |= ETF_SECOND_SET;
    });

    return true;
}

/**
 * Parse exactly three digits of milliseconds.
 */
inline bool
ptime_L(struct exttm* dst, const char* str, off_t& off_inout, ssize_t len)
{
    int ms = 0;

    PTIME_CONSUME(3, {
        if (!ptime_digits(str, off_inout, 3)) {
            return false;
        }
        ms = ((str[off_inout] - '0') * 100 + (str[off_inout + 1] - '0') * 10
              + (str[off_inout + 2] - '0'));
    });

    dst->et_flags |= ETF_MILLIS_SET;
    dst->et_nsec = ms * 1000000;
    return true;
}

inline bool
ptime_char(char val, const char* str, off_t& off_inout, ssize_t len)
{
    PTIME_CONSUME(1, {
        if (str[off_inout] != val) {
            return false;
        }
    });

    return true;
}

#endif
