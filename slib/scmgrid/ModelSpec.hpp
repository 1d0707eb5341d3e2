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

namespace scmgrid {

/** Describes the files and program of a single column model. */
struct ModelSpec {
    std::string name;

    /** Program run in the cell's run directory, with no arguments */
    std::string executable;

    /** Forcing file written into the run directory */
    std::string input_fname;

    /** Files that must exist (and be non-empty) after a run */
    std::vector<std::string> expected_files;

    /** Subset of expected_files moved to the output directory */
    std::vector<std::string> archive_files;

    /** Vertical and auxiliary level dimensions, in the order they
    follow time in the assembled grid. */
    std::vector<std::string> level_dims;
};

}
