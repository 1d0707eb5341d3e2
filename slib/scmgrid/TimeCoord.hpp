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

#pragma once

#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <scmgrid/Dataset.hpp>

namespace scmgrid {

/** Seconds since 1970-01-01 00:00:00 */
double epoch_seconds(boost::posix_time::ptime const &t);

/** eg: 2009-04-06T01:00:00 */
std::string iso_timestamp(boost::posix_time::ptime const &t);

/** eg: 20090406_010000; used in file and directory names */
std::string file_timestamp(boost::posix_time::ptime const &t);

/** Parses "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS" */
boost::posix_time::ptime parse_time(std::string const &str);

/** Decodes time values with CF units of the form
<seconds|minutes|hours|days> since YYYY-MM-DD[ T]HH:MM:SS */
std::vector<boost::posix_time::ptime> decode_cf_time(
    std::vector<double> const &values,
    std::string const &units);

/** Time as the single column model wants it: three coordinates
along the time dimension. */
struct ModelTime {
    /** YYYYMMDD of the reference date (constant) */
    std::vector<double> date;
    /** Seconds since midnight of the reference date (constant) */
    std::vector<double> second;
    /** Whole seconds since the first time point */
    std::vector<double> time;
};

/** Converts absolute times to model form.  Each time is rounded to
the nearest second (ties to even) before the first time point is
subtracted. */
ModelTime to_model_time(
    std::vector<boost::posix_time::ptime> const &abs_times,
    boost::posix_time::ptime const &ref);

/** Replaces the CF time coordinate of a dataset with the model's
time, date and second coordinates. */
void to_model_form(Dataset &ds, boost::posix_time::ptime const &ref);

/** Rebases a relative time coordinate (units "seconds", counted from
the run start) to absolute time: units "seconds since <ref>".
Raises if the coordinate is already absolute. */
void rebase_time(Variable &time, boost::posix_time::ptime const &ref);

/** Time points of ds starting at ref.  At most nsteps points are
kept if nsteps > 0.  Raises if no time point lies at or after ref. */
Dataset select_time_window(Dataset const &ds,
    boost::posix_time::ptime const &ref, int nsteps);

}
