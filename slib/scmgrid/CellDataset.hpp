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
#include <scmgrid/DropList.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/ModelSpec.hpp>

namespace scmgrid {

/** The grid's column and row coordinates, as found in the forcing
input.  Used to label cell output, which carries no position. */
struct CoordinateTemplates {
    std::string xname;
    std::string yname;
    Variable x;
    Variable y;

    double x_value(Cell const &cell) const { return x.data.at(cell.x_global); }
    double y_value(Cell const &cell) const { return y.data.at(cell.y_global); }

    /** Sets scalar row and column coordinates of a cell dataset */
    void label(Dataset &ds, Cell const &cell) const;
};

/** Reads the x and y coordinates of the forcing input.  Their
lengths must match xsize and ysize of the configuration. */
CoordinateTemplates load_coordinate_templates(JobConfig const &config);

/** Where a cell's output files are archived:
<output_directory>/<base>.<timestamp>.y####x####.<ext> */
std::vector<std::string> archived_paths(
    JobConfig const &config, ModelSpec const &model, Cell const &cell);

/** Where a cell's model runs: <work_directory>/<timestamp>.y####x#### */
std::string run_directory_path(JobConfig const &config, Cell const &cell);

/** Where a failed run directory is kept: <output_directory>/failed.<timestamp>.y####x#### */
std::string failed_run_path(JobConfig const &config, Cell const &cell);

/** Loads and merges the archived output files of a cell, then labels
it with its coordinates. */
Dataset load_cell_dataset(
    std::vector<std::string> const &paths,
    Cell const &cell,
    CoordinateTemplates const &templates,
    DropList const &drop);

}
