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
#include <boost/date_time/posix_time/posix_time.hpp>

namespace scmgrid {

/** Static configuration of a gridded job, read from the [default]
section of an INI file. */
struct JobConfig {
    /** Reference time of the job; also names its files */
    boost::posix_time::ptime start_time;

    int xsize;
    int ysize;
    int row_height;

    /** Names of the column and row coordinates in the forcing input */
    std::string xname;
    std::string yname;

    std::string input_directory;
    /** Forcing file name; {time:FMT} is replaced by start_time
    formatted with strftime(FMT). */
    std::string input_file_pattern;

    /** Static model inputs, linked into every run directory */
    std::string template_directory;
    std::string work_directory;
    std::string output_directory;

    /** Number of forcing time points used; <=0 means all */
    int forcing_num_steps;

    JobConfig() : xsize(0), ysize(0), row_height(1), forcing_num_steps(0) {}

    /** eg: 20090406_010000 */
    std::string timestamp() const;

    /** eg: 2009-04-06T01:00:00 */
    std::string iso_start_time() const;

    /** Full path of the forcing input file */
    std::string input_file() const;

    /** Raises a configuration error if any value is missing or invalid. */
    void validate() const;
};

JobConfig read_job_config(std::string const &fname);

/** Expands {time:FMT} fields of a file name pattern */
std::string expand_time_pattern(std::string const &pattern,
    boost::posix_time::ptime const &t);

}
