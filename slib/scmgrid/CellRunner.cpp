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

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <netcdf>
#include <scmgrid/error.hpp>
#include <scmgrid/logging.hpp>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/CellDataset.hpp>
#include <scmgrid/Process.hpp>
#include <scmgrid/CellRunner.hpp>

namespace fs = boost::filesystem;

namespace scmgrid {

namespace {

/** Stops a cell run at the current stage */
class CellRunError : public std::runtime_error {
public:
    FailureKind kind;

    CellRunError(FailureKind _kind, std::string const &msg)
        : std::runtime_error(msg), kind(_kind) {}
};

/** rename(), falling back to copy-and-delete across file systems */
void move_file(fs::path const &src, fs::path const &dest)
{
    boost::system::error_code ec;
    fs::rename(src, dest, ec);
    if (!ec) return;
    if (ec.value() != EXDEV) throw fs::filesystem_error("move", src, dest, ec);

    fs::copy_file(src, dest, fs::copy_options::overwrite_existing);
    fs::remove(src);
}

void move_directory(fs::path const &src, fs::path const &dest)
{
    boost::system::error_code ec;
    fs::rename(src, dest, ec);
    if (!ec) return;
    if (ec.value() != EXDEV) throw fs::filesystem_error("move", src, dest, ec);

    fs::create_directories(dest);
    for (fs::directory_iterator ii(src); ii != fs::directory_iterator(); ++ii) {
        fs::path const target(dest / ii->path().filename());
        if (fs::is_symlink(ii->symlink_status()))
            fs::copy_symlink(ii->path(), target);
        else if (fs::is_directory(ii->status()))
            move_directory(ii->path(), target);
        else
            fs::copy_file(ii->path(), target, fs::copy_options::overwrite_existing);
    }
    fs::remove_all(src);
}

void write_text(fs::path const &fname, std::string const &text)
{
    fs::ofstream out(fname, std::ios::binary);
    out << text;
    if (!out) throw std::runtime_error("Cannot write " + fname.string());
}

}   // namespace (anonymous)

// ----------------------------------------------------------------
CleanupAction cleanup_action(bool succeeded, bool archive_failed_runs)
{
    if (succeeded) return CleanupAction::DELETE;
    return (archive_failed_runs ? CleanupAction::RELOCATE : CleanupAction::DELETE);
}

CellRunner::CellRunner(
    JobConfig const &_config,
    ModelSpec const &_model,
    Dataset const &_tile_input,
    Tile const &_tile,
    bool _archive_failed_runs)
: config(_config), model(_model), tile_input(_tile_input), tile(_tile),
    archive_failed_runs(_archive_failed_runs)
{}

std::string CellRunner::run_directory(Cell const &cell) const
{
    return run_directory_path(config, cell);
}

Dataset CellRunner::cell_input(Cell const &cell) const
{
    if (!tile.contains(cell)) (*scmgrid_error)(-1,
        "Cell %s is not part of tile %d", cell.id().c_str(), tile.id);

    return tile_input
        .isel(config.yname, cell.y_global - tile.y0)
        .isel(config.xname, cell.x_global - tile.x0);
}

// ----------------------------------------------------------------
void CellRunner::stage(Cell const &cell, std::string const &run_dir) const
{
    fs::path const template_dir(config.template_directory);
    if (!fs::is_directory(template_dir)) throw CellRunError(FailureKind::TEMPLATE_MISSING,
        (boost::format("Cannot find the template directory: %s") % template_dir.string()).str());

    fs::path const rdir(run_dir);
    fs::remove_all(rdir);       // Left over from an earlier attempt
    fs::create_directories(rdir);

    fs::path const abs_template(fs::absolute(template_dir));
    for (fs::directory_iterator ii(abs_template); ii != fs::directory_iterator(); ++ii) {
        fs::create_symlink(ii->path(), rdir / ii->path().filename());
    }

    std::string const input_fname((rdir / model.input_fname).string());
    try {
        write_dataset(input_fname, cell_input(cell),
            NcWriteOptions(netCDF::NcFile::classic, {"time"}));
    } catch(scmgrid::Exception const &) {
        throw CellRunError(FailureKind::STAGE_IO,
            "Failed to write model input file " + input_fname);
    }
}

void CellRunner::execute(std::string const &run_dir,
    std::string &out, std::string &err) const
{
    ProcessResult proc(run_process(run_dir, "./" + model.executable));
    out = std::move(proc.out);
    err = std::move(proc.err);

    switch(proc.launch.index()) {
        case LaunchStatus::OK :
            break;
        case LaunchStatus::NOT_FOUND :
            throw CellRunError(FailureKind::EXEC_NOT_FOUND, (boost::format(
                "Cannot locate executable %s in the template directory: %s")
                % model.executable % config.template_directory).str());
        case LaunchStatus::NOT_EXECUTABLE :
            throw CellRunError(FailureKind::EXEC_NOT_EXECUTABLE, (boost::format(
                "Cannot execute the %s program, check the file has the "
                "executable bit set in: %s")
                % model.executable % config.template_directory).str());
        default :
            throw CellRunError(FailureKind::EXEC_LAUNCH, (boost::format(
                "Failed to run the executable %s (%s), check the program "
                "to ensure it is working")
                % model.executable % strerror(proc.launch_errno)).str());
    }

    if (proc.exit_status != 0) throw CellRunError(FailureKind::EXEC_NONZERO_EXIT,
        (boost::format("SCM exited with non-zero status [%d].") % proc.exit_status).str());
}

void CellRunner::verify(std::string const &run_dir) const
{
    for (auto const &fname : model.expected_files) {
        fs::path const path(fs::path(run_dir) / fname);
        boost::system::error_code ec;
        if (!fs::is_regular_file(path, ec) || fs::file_size(path, ec) == 0 || ec) {
            throw CellRunError(FailureKind::OUTPUT_MISSING, (boost::format(
                "SCM run did not complete correctly, \"%s\" missing or empty.")
                % path.string()).str());
        }
    }
}

std::vector<std::string> CellRunner::archive(
    Cell const &cell, std::string const &run_dir) const
{
    std::vector<std::string> const targets(archived_paths(config, model, cell));
    std::vector<std::string> archived;
    for (size_t i=0; i<model.archive_files.size(); ++i) {
        try {
            move_file(fs::path(run_dir) / model.archive_files[i], targets[i]);
        } catch(fs::filesystem_error const &exp) {
            // A failed cell leaves no output behind
            for (auto const &path : archived) {
                boost::system::error_code ec;
                fs::remove(path, ec);
            }

            int const code = exp.code().value();
            if (code == EACCES || code == EPERM || code == EROFS)
                throw CellRunError(FailureKind::ARCHIVE_PERMISSION, (boost::format(
                    "Cannot archive data to \"%s\", permission denied.")
                    % config.output_directory).str());
            if (code == ENOENT || code == ENOTDIR)
                throw CellRunError(FailureKind::ARCHIVE_DESTINATION, (boost::format(
                    "Cannot archive data to \"%s\", it may not exist.")
                    % config.output_directory).str());
            throw CellRunError(FailureKind::ARCHIVE_IO, (boost::format(
                "Cannot archive data to \"%s\": %s")
                % config.output_directory % exp.what()).str());
        }
        archived.push_back(targets[i]);
    }
    return archived;
}

void CellRunner::cleanup(Cell const &cell, std::string const &run_dir,
    RunResult &result, std::string const &out, std::string const &err) const
{
    boost::system::error_code ec;
    if (!fs::exists(run_dir, ec)) {
        result.state = CellState::CLEANED;
        return;
    }

    switch(cleanup_action(result.ok(), archive_failed_runs).index()) {
        case CleanupAction::DELETE :
            fs::remove_all(run_dir, ec);
            if (ec) log_warning("RUN", "Cannot remove run directory %s: %s",
                run_dir.c_str(), ec.message().c_str());
        break;
        case CleanupAction::RELOCATE : {
            ArchiveRecord record;
            record.out = out;
            record.err = err;
            std::string const dest(failed_run_path(config, cell));
            try {
                write_text(fs::path(run_dir) / "stdout.txt", out);
                write_text(fs::path(run_dir) / "stderr.txt", err);
                fs::remove_all(dest);
                move_directory(run_dir, dest);
                record.run_directory = dest;
            } catch(std::exception const &exp) {
                log_warning("RUN", "Cannot archive failed run directory %s to %s: %s",
                    run_dir.c_str(), dest.c_str(), exp.what());
            }
            result.archive_record = record;
        } break;
    }
    result.state = CellState::CLEANED;
}

// ----------------------------------------------------------------
RunResult CellRunner::run_cell(Cell const &cell) const
{
    RunResult result(cell);
    std::string const run_dir(run_directory(cell));
    std::string out, err;

    try {
        try {
            stage(cell, run_dir);
            result.reached = CellState::STAGED;

            execute(run_dir, out, err);
            result.reached = CellState::EXECUTED;

            verify(run_dir);
            result.reached = CellState::VERIFIED;

            std::vector<std::string> archived(archive(cell, run_dir));
            result.reached = CellState::ARCHIVED;
            result.archived = archived;
        } catch(fs::filesystem_error const &exp) {
            throw CellRunError(FailureKind::STAGE_IO, exp.what());
        } catch(netCDF::exceptions::NcException const &exp) {
            throw CellRunError(FailureKind::STAGE_IO, exp.what());
        } catch(scmgrid::Exception const &) {
            throw CellRunError(FailureKind::STAGE_IO,
                "Failed to prepare input for cell " + cell.id());
        }
    } catch(CellRunError const &exp) {
        result.state = CellState::FAILED;
        result.failure = exp.kind;
        result.message = exp.what();
    }

    if (result.ok()) {
        log_info("RUN", "Run completed successfully for cell: %s.", cell.id().c_str());
    } else {
        log_error("RUN", "Run failed for cell: %s (%s: %s).",
            cell.id().c_str(), result.failure.str(), result.message.c_str());
    }

    try {
        cleanup(cell, run_dir, result, out, err);
    } catch(std::exception const &exp) {
        log_warning("RUN", "Cleanup of cell %s failed: %s", cell.id().c_str(), exp.what());
        result.state = CellState::CLEANED;
    }
    return result;
}

}
