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
#include <boost/algorithm/string.hpp>
#include <scmgrid/error.hpp>
#include <scmgrid/logging.hpp>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/TimeCoord.hpp>
#include <scmgrid/TaskScheduler.hpp>
#include <scmgrid/GridAssembler.hpp>
#include <scmgrid/Cleanup.hpp>
#include <scmgrid/Job.hpp>

namespace fs = boost::filesystem;

namespace scmgrid {

std::string const version = "0.3.0";

Job::Job(JobConfig const &_config, ModelSpec const &_model, JobOptions const &_opts)
: config(_config), model(_model), opts(_opts)
{
    config.validate();
    if (opts.num_workers < 1) (*scmgrid_error)(-1,
        "The number of workers must be positive: %d", opts.num_workers);

    tiles = (opts.decompose_cells
        ? decompose_by_cells(config.xsize, config.ysize)
        : decompose_by_rows(config.xsize, config.ysize, config.row_height));
    templates = load_coordinate_templates(config);
    drop = read_drop_list(opts.drop_list_fname);
    if (drop) log_info("PP", "dropping %ld variables listed in %s",
        (long)drop->size(), opts.drop_list_fname.c_str());
}

std::string Job::output_fname() const
{
    return (fs::path(config.output_directory) /
        ("scm_out." + config.timestamp() + ".nc")).string();
}

boost::optional<Dataset> Job::load_cell(Cell const &cell) const
{
    std::vector<std::string> const paths(archived_paths(config, model, cell));
    for (auto const &path : paths) {
        boost::system::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            log_error("PP", "The input files \"%s\" cannot be read, do they exist?",
                boost::algorithm::join(paths, ", ").c_str());
            return boost::none;
        }
    }

    try {
        return load_cell_dataset(paths, cell, templates, drop);
    } catch(scmgrid::Exception const &) {
        log_error("PP", "Cannot load output of cell %s", cell.id().c_str());
        return boost::none;
    }
}

// ----------------------------------------------------------------
TileResult Job::run_tile(Dataset const &forcing, Tile const &tile) const
{
    TileResult ret;
    ret.tile_id = tile.id;

    Dataset const tile_input(forcing
        .isel_range(config.yname, tile.y0, tile.nrows)
        .isel_range(config.xname, tile.x0, tile.ncols));
    CellRunner const runner(config, model, tile_input, tile, opts.archive_failed_runs);

    std::vector<CellOutput> outputs;
    for (auto const &cell : tile.cells()) {
        ret.runs.push_back(runner.run_cell(cell));
        boost::optional<Dataset> ds;
        if (ret.runs.back().ok()) ds = load_cell(cell);
        outputs.push_back(CellOutput(cell, std::move(ds)));
    }

    int nok = 0;
    for (auto const &out : outputs) if (out.second) ++nok;
    log_info("RUN", "tile #%d: %d of %ld cells completed", tile.id, nok, (long)tile.size());

    ret.tile = TileAssembler(templates).assemble(tile, outputs);
    return ret;
}

TileResult Job::pp_tile(Tile const &tile) const
{
    TileResult ret;
    ret.tile_id = tile.id;

    std::vector<CellOutput> outputs;
    for (auto const &cell : tile.cells())
        outputs.push_back(CellOutput(cell, load_cell(cell)));

    ret.tile = TileAssembler(templates).assemble(tile, outputs);
    return ret;
}

// ----------------------------------------------------------------
JobSummary Job::finish(
    std::vector<TileResult> const &results,
    std::vector<int> const &failed_tiles) const
{
    JobSummary summary;
    summary.ntiles = tiles.size();

    std::vector<TileDataset> tile_dss;
    std::vector<Cell> all_cells;
    for (auto const &tile : tiles) {
        for (auto const &cell : tile.cells()) all_cells.push_back(cell);
        summary.ncells += tile.size();
    }

    std::vector<int> missing(failed_tiles);
    for (auto const &result : results) {
        if (result.tile) {
            tile_dss.push_back(*result.tile);
            summary.ncells_failed += result.tile->nfilled;
        } else {
            missing.push_back(result.tile_id);
        }
    }
    for (int id : missing) {
        ++summary.ntiles_failed;
        summary.ncells_failed += tiles[id].size();
    }

    if (summary.ncells_failed > 0) log_warning("PP",
        "%ld of %ld cells failed, %ld of %ld tiles have no output",
        summary.ncells_failed, summary.ncells, summary.ntiles_failed, summary.ntiles);

    // Tiles without output keep their place in the grid as missing values
    if (tile_dss.size() > 0) {
        TileAssembler const tile_assembler(templates);
        Dataset const like(tile_dss[0].ds);
        for (int id : missing)
            tile_dss.push_back(tile_assembler.missing_tile(tiles[id], like));
    }

    GridAssembler const assembler(config.xname, config.yname,
        model.level_dims, config.start_time);
    Dataset const grid(assembler.assemble(tile_dss));
    tile_dss.clear();

    summary.output_fname = output_fname();
    WrittenGrid const receipt(write_grid(summary.output_fname, grid));

    if (opts.delete_cell_files) {
        CleanupCoordinator const cleaner(config, model);
        summary.nremoved = cleaner.cleanup(receipt, all_cells);
    }
    return summary;
}

JobSummary Job::run()
{
    log_info("RUN", "BEGIN run of %s: %dx%d grid, %ld tiles, %d workers",
        model.name.c_str(), config.xsize, config.ysize,
        (long)tiles.size(), opts.num_workers);

    boost::system::error_code ec;
    fs::create_directories(config.work_directory, ec);
    if (ec) (*scmgrid_error)(-1, "Cannot create work directory %s: %s",
        config.work_directory.c_str(), ec.message().c_str());

    Dataset forcing(read_dataset(config.input_file()));
    for (auto const &dim : {std::make_pair(config.xname, config.xsize),
        std::make_pair(config.yname, config.ysize)})
    {
        if (!forcing.has_dim(dim.first) || forcing.dim_size(dim.first) != dim.second)
            (*scmgrid_error)(-1,
                "Forcing input %s: dimension %s must have length %d",
                config.input_file().c_str(), dim.first.c_str(), dim.second);
    }
    forcing = select_time_window(forcing, config.start_time, config.forcing_num_steps);
    to_model_form(forcing, config.start_time);

    TaskScheduler<TileResult> const scheduler(opts.num_workers);
    auto outcome(scheduler.run(tiles,
        [this, &forcing](Tile const &tile) { return run_tile(forcing, tile); }));

    std::vector<TileResult> results;
    for (auto &ii : outcome.results) results.push_back(std::move(ii.second));
    JobSummary const summary(finish(results, outcome.failed_tiles));

    log_info("RUN", "END run: %ld of %ld cells succeeded, output in %s",
        summary.ncells - summary.ncells_failed, summary.ncells,
        summary.output_fname.c_str());
    return summary;
}

JobSummary Job::post_process()
{
    log_info("PP", "BEGIN post-processing of %s: %dx%d grid, %ld tiles, %d workers",
        config.timestamp().c_str(), config.xsize, config.ysize,
        (long)tiles.size(), opts.num_workers);

    TaskScheduler<TileResult> const scheduler(opts.num_workers);
    auto outcome(scheduler.run(tiles,
        [this](Tile const &tile) { return pp_tile(tile); }));

    std::vector<TileResult> results;
    for (auto &ii : outcome.results) results.push_back(std::move(ii.second));
    JobSummary const summary(finish(results, outcome.failed_tiles));

    log_info("PP", "END post-processing, output in %s", summary.output_fname.c_str());
    return summary;
}

}
