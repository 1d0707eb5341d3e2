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
#include <ibmisc/enum.hpp>
#include <scmgrid/Dataset.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/ModelSpec.hpp>

namespace scmgrid {

/** States of a single cell run:
<pre>INIT -> STAGED -> EXECUTED -> VERIFIED -> ARCHIVED -> CLEANED
  any of the above -> FAILED -> CLEANED</pre> */
BOOST_ENUM_VALUES( CellState, int,
    (INIT)      (0)
    (STAGED)    (1)
    (EXECUTED)  (2)
    (VERIFIED)  (3)
    (ARCHIVED)  (4)
    (FAILED)    (5)
    (CLEANED)   (6)
)

BOOST_ENUM_VALUES( FailureKind, int,
    (NONE)                  (0)
    (TEMPLATE_MISSING)      (1)     // Stage: no template directory
    (STAGE_IO)              (2)     // Stage: could not build run directory
    (EXEC_NOT_FOUND)        (3)
    (EXEC_NOT_EXECUTABLE)   (4)
    (EXEC_LAUNCH)           (5)     // Other OS error launching the model
    (EXEC_NONZERO_EXIT)     (6)
    (OUTPUT_MISSING)        (7)     // Verify: expected file missing or empty
    (ARCHIVE_PERMISSION)    (8)
    (ARCHIVE_DESTINATION)   (9)     // Output directory does not exist
    (ARCHIVE_IO)            (10)
)

/** What happens to a run directory once the run is over */
BOOST_ENUM_VALUES( CleanupAction, int,
    (DELETE)    (0)
    (RELOCATE)  (1)     // Keep it in the output directory
)

/** Terminal transition table:
<pre>
succeeded  archive_failed_runs  action
---------  -------------------  --------
true       any                  DELETE
false      false                DELETE
false      true                 RELOCATE
</pre> */
CleanupAction cleanup_action(bool succeeded, bool archive_failed_runs);

/** A failed run kept for inspection */
struct ArchiveRecord {
    /** Where the run directory was moved to; empty if relocation failed */
    std::string run_directory;
    std::string out;    // Captured stdout of the model
    std::string err;    // Captured stderr of the model
};

/** Outcome of one cell run */
struct RunResult {
    Cell cell;

    /** ARCHIVED on success; otherwise the last state reached before failing */
    CellState reached;
    /** Always CLEANED once run_cell() returns */
    CellState state;

    FailureKind failure;
    std::string message;

    /** Archived output files; absent if the run failed */
    boost::optional<std::vector<std::string>> archived;

    boost::optional<ArchiveRecord> archive_record;

    RunResult(Cell const &_cell)
        : cell(_cell), reached(CellState::INIT), state(CellState::INIT),
        failure(FailureKind::NONE) {}

    bool ok() const { return (bool)archived; }
};

/** Runs the single column model once per cell of a tile. */
class CellRunner {
    JobConfig const &config;
    ModelSpec const &model;

    /** Forcing for the tile, already in model time form */
    Dataset const &tile_input;
    Tile const &tile;

    bool archive_failed_runs;

public:
    CellRunner(
        JobConfig const &_config,
        ModelSpec const &_model,
        Dataset const &_tile_input,
        Tile const &_tile,
        bool _archive_failed_runs);

    /** Stages, runs, verifies and archives the model for one cell,
    then cleans up its run directory.  Never throws: failures are
    logged and returned. */
    RunResult run_cell(Cell const &cell) const;

    /** Forcing of one cell, as written to the model input file */
    Dataset cell_input(Cell const &cell) const;

    /** <work_directory>/<timestamp>.y####x#### */
    std::string run_directory(Cell const &cell) const;

protected:
    void stage(Cell const &cell, std::string const &run_dir) const;
    void execute(std::string const &run_dir,
        std::string &out, std::string &err) const;
    void verify(std::string const &run_dir) const;
    std::vector<std::string> archive(Cell const &cell, std::string const &run_dir) const;
    void cleanup(Cell const &cell, std::string const &run_dir, RunResult &result,
        std::string const &out, std::string const &err) const;
};

}
