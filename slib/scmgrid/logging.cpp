/*
 * SCMGrid: Gridded Runs of a Single Column Model
 * Copyright (c) 2026 by the SCMGrid developers
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>
#include <scmgrid/logging.hpp>

namespace scmgrid {

static std::mutex log_mutex;

static void vlog(char const *logger, char const *level,
    char const *format, va_list arglist)
{
    char msg[2048];
    vsnprintf(msg, sizeof(msg), format, arglist);

    auto const now(boost::posix_time::second_clock::local_time());
    auto const ymd(now.date().year_month_day());
    auto const tod(now.time_of_day());
    std::string const stamp((boost::format("%04d-%02d-%02d %02d:%02d:%02d")
        % (int)ymd.year % (int)ymd.month.as_number() % (int)ymd.day
        % tod.hours() % tod.minutes() % tod.seconds()).str());

    std::lock_guard<std::mutex> lock(log_mutex);
    fprintf(stdout, "[%s] (%s) %s %s\n", stamp.c_str(), logger, level, msg);
    fflush(stdout);
}

void log_info(char const *logger, char const *format, ...)
{
    va_list arglist;
    va_start(arglist, format);
    vlog(logger, "INFO", format, arglist);
    va_end(arglist);
}

void log_warning(char const *logger, char const *format, ...)
{
    va_list arglist;
    va_start(arglist, format);
    vlog(logger, "WARNING", format, arglist);
    va_end(arglist);
}

void log_error(char const *logger, char const *format, ...)
{
    va_list arglist;
    va_start(arglist, format);
    vlog(logger, "ERROR", format, arglist);
    va_end(arglist);
}

}
