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
#include <scmgrid/error.hpp>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/CellDataset.hpp>

namespace fs = boost::filesystem;

namespace scmgrid {

void CoordinateTemplates::label(Dataset &ds, Cell const &cell) const
{
    ds.set_scalar_coord(yname, y_value(cell), y.atts);
    ds.set_scalar_coord(xname, x_value(cell), x.atts);
}

static Variable load_template(JobConfig const &config,
    std::string const &vname, int size)
{
    Variable var(read_variable(config.input_file(), vname));
    if (var.rank() != 1 || (int)var.data.size() != size) (*scmgrid_error)(-1,
        "Failed to extract template coordinates, check grid dimensions "
        "in configuration match those in the files (%s has %ld values, expected %d)",
        vname.c_str(), (long)var.data.size(), size);
    var.dims.clear();
    var.is_coord = true;
    return var;
}

CoordinateTemplates load_coordinate_templates(JobConfig const &config)
{
    CoordinateTemplates ret;
    ret.xname = config.xname;
    ret.yname = config.yname;
    ret.x = load_template(config, config.xname, config.xsize);
    ret.y = load_template(config, config.yname, config.ysize);
    return ret;
}

std::vector<std::string> archived_paths(
    JobConfig const &config, ModelSpec const &model, Cell const &cell)
{
    std::vector<std::string> ret;
    for (auto const &fname : model.archive_files) {
        fs::path const path(fname);
        ret.push_back((fs::path(config.output_directory) /
            (path.stem().string() + "." + config.timestamp() + "."
            + cell.id() + path.extension().string())).string());
    }
    return ret;
}

std::string run_directory_path(JobConfig const &config, Cell const &cell)
{
    return (fs::path(config.work_directory) /
        (config.timestamp() + "." + cell.id())).string();
}

std::string failed_run_path(JobConfig const &config, Cell const &cell)
{
    return (fs::path(config.output_directory) /
        ("failed." + config.timestamp() + "." + cell.id())).string();
}

Dataset load_cell_dataset(
    std::vector<std::string> const &paths,
    Cell const &cell,
    CoordinateTemplates const &templates,
    DropList const &drop)
{
    Dataset ds;
    for (auto const &path : paths) ds.merge(read_dataset(path, drop));
    templates.label(ds, cell);
    return ds;
}

}
