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
#include <ibmisc/enum.hpp>

namespace scmgrid {

BOOST_ENUM_VALUES( LaunchStatus, int,
    (OK)                (0)
    (NOT_FOUND)         (1)     // Executable does not exist
    (NOT_EXECUTABLE)    (2)     // Exists but may not be executed
    (LAUNCH_FAILED)     (3)     // Any other OS error
)

struct ProcessResult {
    LaunchStatus launch;
    int launch_errno;       // errno of a failed launch, else 0
    int exit_status;        // Valid if launch == OK; 128+signal if killed
    std::string out;        // Captured stdout
    std::string err;        // Captured stderr

    ProcessResult() : launch(LaunchStatus::OK), launch_errno(0), exit_status(0) {}
};

/** Runs a program to completion and captures its output.
@param cwd Working directory of the child process
@param exe Path of the program, relative to cwd unless absolute
@param args Arguments, not including argv[0] */
ProcessResult run_process(
    std::string const &cwd,
    std::string const &exe,
    std::vector<std::string> const &args = {});

}
