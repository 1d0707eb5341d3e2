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
#include <scmgrid/logging.hpp>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/CellDataset.hpp>
#include <scmgrid/Cleanup.hpp>

namespace fs = boost::filesystem;

namespace scmgrid {

WrittenGrid write_grid(std::string const &fname, Dataset const &grid)
{
    write_dataset(fname, grid, NcWriteOptions(netCDF::NcFile::nc4, {"time"}));
    log_info("PP", "wrote grid file %s", fname.c_str());
    return WrittenGrid(fname);
}

long CleanupCoordinator::cleanup(
    WrittenGrid const &receipt, std::vector<Cell> const &cells) const
{
    long nremoved = 0;
    for (auto const &cell : cells) {
        std::vector<std::string> paths(archived_paths(config, model, cell));
        paths.push_back(run_directory_path(config, cell));

        for (auto const &path : paths) {
            boost::system::error_code ec;
            if (!fs::exists(path, ec)) continue;
            fs::remove_all(path, ec);
            if (ec) log_warning("PP", "Cannot remove %s: %s",
                path.c_str(), ec.message().c_str());
            else ++nremoved;
        }
    }
    log_info("PP", "removed %ld cell files (data now in %s)",
        nremoved, receipt.fname().c_str());
    return nremoved;
}

}
