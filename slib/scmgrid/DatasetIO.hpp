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

#include <mutex>
#include <string>
#include <vector>
#include <netcdf>
#include <scmgrid/Dataset.hpp>
#include <scmgrid/DropList.hpp>

namespace scmgrid {

/** The NetCDF library is not thread safe.  All file access made on
behalf of worker threads holds this lock. */
std::mutex &netcdf_mutex();

/** Serialization options for write_dataset() */
struct NcWriteOptions {
    netCDF::NcFile::FileFormat format;

    /** Dimensions written as unlimited (record) dimensions, eg: time */
    std::vector<std::string> unlimited_dims;

    NcWriteOptions() : format(netCDF::NcFile::nc4) {}

    NcWriteOptions(netCDF::NcFile::FileFormat _format,
        std::vector<std::string> const &_unlimited_dims)
    : format(_format), unlimited_dims(_unlimited_dims) {}
};

/** Loads a whole NetCDF file into memory and closes it.
Character variables are skipped.  _FillValue and missing_value
become NaN; scale_factor and add_offset are applied.
@param drop Variables not to load */
Dataset read_dataset(std::string const &fname, DropList const &drop = DropList());

/** Loads a single variable */
Variable read_variable(std::string const &fname, std::string const &vname);

/** Writes a dataset, replacing any existing file.  A partially
written file is removed if writing fails. */
void write_dataset(std::string const &fname, Dataset const &ds,
    NcWriteOptions const &opts = NcWriteOptions());

}
