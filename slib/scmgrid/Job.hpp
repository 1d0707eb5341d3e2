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
#include <boost/optional.hpp>
#include <scmgrid/Dataset.hpp>
#include <scmgrid/DropList.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/ModelSpec.hpp>
#include <scmgrid/CellDataset.hpp>
#include <scmgrid/CellRunner.hpp>
#include <scmgrid/TileAssembler.hpp>

namespace scmgrid {

extern std::string const version;

/** Run policy, set on the command line */
struct JobOptions {
    int num_workers;
    /** Keep the run directories of failed cells in the output directory */
    bool archive_failed_runs;
    /** Delete per-cell files once the grid file is written */
    bool delete_cell_files;
    /** One tile per cell, instead of bands of row_height rows */
    bool decompose_cells;
    std::string drop_list_fname;

    JobOptions() : num_workers(1), archive_failed_runs(false),
        delete_cell_files(false), decompose_cells(false),
        drop_list_fname("dropvars.txt") {}
};

struct TileResult {
    int tile_id;
    /** Empty when only post-processing */
    std::vector<RunResult> runs;
    /** Absent if no cell of the tile produced output */
    boost::optional<TileDataset> tile;

    TileResult() : tile_id(-1) {}
};

struct JobSummary {
    long ncells;
    long ncells_failed;
    long ntiles;
    long ntiles_failed;
    std::string output_fname;
    long nremoved;          // Cell files deleted after writing

    JobSummary() : ncells(0), ncells_failed(0), ntiles(0), ntiles_failed(0), nremoved(0) {}
};

/** A gridded run of a single column model */
class Job {
    JobConfig const config;
    ModelSpec const &model;
    JobOptions const opts;

    std::vector<Tile> tiles;
    CoordinateTemplates templates;
    DropList drop;

public:
    Job(JobConfig const &_config, ModelSpec const &_model, JobOptions const &_opts);

    /** Runs the model on every cell, then assembles and writes the grid.
    Raises if no cell produced output. */
    JobSummary run();

    /** Assembles the grid from cell files archived by an earlier run. */
    JobSummary post_process();

    /** <output_directory>/scm_out.<timestamp>.nc */
    std::string output_fname() const;

protected:
    TileResult run_tile(Dataset const &forcing, Tile const &tile) const;
    TileResult pp_tile(Tile const &tile) const;

    /** Loads a cell's archived output; absent if it cannot be read */
    boost::optional<Dataset> load_cell(Cell const &cell) const;

    JobSummary finish(std::vector<TileResult> const &results,
        std::vector<int> const &failed_tiles) const;
};

}
