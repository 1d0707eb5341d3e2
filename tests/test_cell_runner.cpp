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

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <gtest/gtest.h>
#include <scmgrid/error.hpp>
#include <scmgrid/CellDataset.hpp>
#include <scmgrid/CellRunner.hpp>
#include <scmgrid/Process.hpp>
#include <scmgrid/openifs/ModelSpec_OpenIFS.hpp>
#include "job_fixture.hpp"

using namespace scmgrid;
namespace fs = boost::filesystem;

class CellRunnerTest : public JobFixture {
protected:
    ModelSpec const &model;

    CellRunnerTest() : model(openifs::openifs_scm()) {}

    /** Runs one cell of a 2x2 grid, with the row's tile */
    RunResult run(Cell const &cell, bool archive_failed_runs)
    {
        Dataset const forcing(model_forcing());
        std::vector<Tile> const tiles(decompose_by_rows(config.xsize, config.ysize, 1));
        Tile const &tile(tiles[cell.y_global]);
        Dataset const tile_input(forcing
            .isel_range("lat", tile.y0, tile.nrows)
            .isel_range("lon", tile.x0, tile.ncols));
        CellRunner const runner(config, model, tile_input, tile, archive_failed_runs);
        return runner.run_cell(cell);
    }
};

TEST_F(CellRunnerTest, cleanup_table)
{
    EXPECT_EQ(CleanupAction::DELETE, cleanup_action(true, false).index());
    EXPECT_EQ(CleanupAction::DELETE, cleanup_action(true, true).index());
    EXPECT_EQ(CleanupAction::DELETE, cleanup_action(false, false).index());
    EXPECT_EQ(CleanupAction::RELOCATE, cleanup_action(false, true).index());
}

TEST_F(CellRunnerTest, process)
{
    ProcessResult res(run_process(config.template_directory, "./master1c.exe"));
    // No scm_in.nc in the template directory
    EXPECT_EQ(LaunchStatus::OK, res.launch.index());
    EXPECT_EQ(2, res.exit_status);
    EXPECT_NE(std::string::npos, res.err.find("cannot read scm_in.nc"));

    ProcessResult none(run_process(config.template_directory, "./no_such_program"));
    EXPECT_EQ(LaunchStatus::NOT_FOUND, none.launch.index());
}

TEST_F(CellRunnerTest, cell_input)
{
    write_forcing(2, 2);
    Dataset const forcing(model_forcing());
    std::vector<Tile> const tiles(decompose_by_rows(2, 2, 1));
    Dataset const tile_input(forcing.isel_range("lat", 1, 1));
    CellRunner const runner(config, model, tile_input, tiles[1], false);

    Dataset const ds(runner.cell_input(Cell(1,1)));
    EXPECT_EQ(-5., ds.var("lat").scalar());
    EXPECT_EQ(90., ds.var("lon").scalar());
    EXPECT_EQ((std::vector<double>{101., 102., 103.}), ds.var("t").data);
    EXPECT_EQ((std::vector<double>{0., 3600., 7200.}), ds.var("time").data);
    EXPECT_EQ(NC_INT, ds.var("date").nctype);

    EXPECT_THROW(runner.cell_input(Cell(0,0)), scmgrid::Exception);
    EXPECT_EQ((fs::path(config.work_directory) / "20090406_010000.y0001x0001").string(),
        runner.run_directory(Cell(1,1)));
}

TEST_F(CellRunnerTest, success)
{
    write_forcing(2, 2);
    Cell const cell(1,0);
    RunResult const res(run(cell, false));

    EXPECT_TRUE(res.ok());
    EXPECT_EQ(FailureKind::NONE, res.failure.index());
    EXPECT_EQ(CellState::ARCHIVED, res.reached.index());
    EXPECT_EQ(CellState::CLEANED, res.state.index());
    ASSERT_EQ(3, res.archived->size());
    EXPECT_EQ(archived_paths(config, model, cell), *res.archived);
    EXPECT_EQ((fs::path(config.output_directory) / "diagvar.20090406_010000.y0000x0001.nc").string(),
        (*res.archived)[0]);
    for (auto const &path : *res.archived) EXPECT_TRUE(fs::is_regular_file(path));

    // Run directory removed
    EXPECT_FALSE(fs::exists(run_directory_path(config, cell)));
    EXPECT_FALSE((bool)res.archive_record);

    Dataset const diag(read_dataset((*res.archived)[0]));
    EXPECT_EQ((std::vector<double>{2., 4., 6.}), diag.var("flux").data);
}

TEST_F(CellRunnerTest, output_missing)
{
    write_forcing(2, 2, {{Cell(0,1), 1}});
    Cell const cell(0,1);
    RunResult const res(run(cell, false));

    EXPECT_FALSE(res.ok());
    EXPECT_EQ(FailureKind::OUTPUT_MISSING, res.failure.index());
    EXPECT_EQ(CellState::EXECUTED, res.reached.index());
    EXPECT_EQ(CellState::CLEANED, res.state.index());
    EXPECT_NE(std::string::npos, res.message.find("diagvar2.nc\" missing or empty"));

    EXPECT_FALSE(fs::exists(run_directory_path(config, cell)));
    EXPECT_FALSE(fs::exists(failed_run_path(config, cell)));
    for (auto const &path : archived_paths(config, model, cell))
        EXPECT_FALSE(fs::exists(path));
}

TEST_F(CellRunnerTest, archive_failed_run)
{
    write_forcing(2, 2, {{Cell(0,1), 1}});
    Cell const cell(0,1);
    RunResult const res(run(cell, true));

    EXPECT_EQ(FailureKind::OUTPUT_MISSING, res.failure.index());
    ASSERT_TRUE((bool)res.archive_record);
    std::string const failed(failed_run_path(config, cell));
    EXPECT_EQ(failed, res.archive_record->run_directory);
    EXPECT_NE(std::string::npos, res.archive_record->out.find("fake_scm: mode=1"));

    EXPECT_FALSE(fs::exists(run_directory_path(config, cell)));
    EXPECT_TRUE(fs::is_directory(failed));
    EXPECT_TRUE(fs::is_regular_file(fs::path(failed) / "stdout.txt"));
    EXPECT_TRUE(fs::is_regular_file(fs::path(failed) / "stderr.txt"));
    EXPECT_TRUE(fs::exists(fs::path(failed) / "scm_in.nc"));
}

TEST_F(CellRunnerTest, nonzero_exit)
{
    write_forcing(2, 2, {{Cell(1,1), 2}});
    RunResult const res(run(Cell(1,1), false));

    EXPECT_EQ(FailureKind::EXEC_NONZERO_EXIT, res.failure.index());
    EXPECT_EQ(CellState::STAGED, res.reached.index());
    EXPECT_EQ("SCM exited with non-zero status [3].", res.message);
}

TEST_F(CellRunnerTest, executable_missing)
{
    write_forcing(2, 2);
    fs::remove(fs::path(config.template_directory) / "master1c.exe");
    RunResult const res(run(Cell(0,0), false));

    EXPECT_EQ(FailureKind::EXEC_NOT_FOUND, res.failure.index());
    EXPECT_NE(std::string::npos, res.message.find("Cannot locate executable master1c.exe"));
}

TEST_F(CellRunnerTest, not_executable)
{
    write_forcing(2, 2);
    fs::path const exe(fs::path(config.template_directory) / "master1c.exe");
    fs::remove(exe);
    {
        fs::ofstream out(exe);
        out << "not a program\n";
    }
    fs::permissions(exe, fs::owner_read | fs::owner_write);
    RunResult const res(run(Cell(0,0), false));

    EXPECT_EQ(FailureKind::EXEC_NOT_EXECUTABLE, res.failure.index());
}

TEST_F(CellRunnerTest, template_missing)
{
    write_forcing(2, 2);
    fs::remove_all(config.template_directory);
    RunResult const res(run(Cell(0,0), false));

    EXPECT_EQ(FailureKind::TEMPLATE_MISSING, res.failure.index());
    EXPECT_EQ(CellState::INIT, res.reached.index());
}

TEST_F(CellRunnerTest, archive_destination)
{
    write_forcing(2, 2);
    fs::remove_all(config.output_directory);
    RunResult const res(run(Cell(0,0), false));

    EXPECT_EQ(FailureKind::ARCHIVE_DESTINATION, res.failure.index());
    EXPECT_EQ(CellState::VERIFIED, res.reached.index());
    EXPECT_NE(std::string::npos, res.message.find("it may not exist"));
    EXPECT_FALSE(fs::exists(run_directory_path(config, Cell(0,0))));
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
