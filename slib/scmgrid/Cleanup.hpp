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
#include <scmgrid/Dataset.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/ModelSpec.hpp>

namespace scmgrid {

/** Receipt for a grid file that was written completely.  Only
write_grid() can make one. */
class WrittenGrid {
    std::string _fname;

    explicit WrittenGrid(std::string const &fname) : _fname(fname) {}

    friend WrittenGrid write_grid(std::string const &fname, Dataset const &grid);
public:
    std::string const &fname() const { return _fname; }
};

/** Writes the assembled grid: NetCDF-4, time unlimited. */
WrittenGrid write_grid(std::string const &fname, Dataset const &grid);

/** Removes intermediate per-cell files once their data are safely
in the grid file. */
class CleanupCoordinator {
    JobConfig const &config;
    ModelSpec const &model;

public:
    CleanupCoordinator(JobConfig const &_config, ModelSpec const &_model)
        : config(_config), model(_model) {}

    /** Deletes the run directory and the archived output files of
    each cell.  Files that do not exist are skipped.
    @return Number of files and directories removed */
    long cleanup(WrittenGrid const &receipt, std::vector<Cell> const &cells) const;
};

}
