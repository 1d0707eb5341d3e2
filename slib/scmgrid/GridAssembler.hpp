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
#include <boost/date_time/posix_time/posix_time.hpp>
#include <scmgrid/Dataset.hpp>
#include <scmgrid/TileAssembler.hpp>

namespace scmgrid {

/** Merges tile datasets, arriving in any order, into the dataset of
the whole grid. */
class GridAssembler {
    std::string xname;
    std::string yname;
    std::vector<std::string> level_dims;
    boost::posix_time::ptime ref;

public:
    /** @param _level_dims Dimensions that follow time in the output
    @param _ref Start of the run, to which output times are relative */
    GridAssembler(
        std::string const &_xname,
        std::string const &_yname,
        std::vector<std::string> const &_level_dims,
        boost::posix_time::ptime const &_ref)
    : xname(_xname), yname(_yname), level_dims(_level_dims), ref(_ref) {}

    /** Tiles are ordered by their largest row coordinate value (then
    their smallest column coordinate value), concatenated, time is
    made absolute and dimensions are put in canonical order.
    Raises if there are no tiles. */
    Dataset assemble(std::vector<TileDataset> const &tiles) const;

    /** time, level dimensions, any other dimensions, row, column */
    std::vector<std::string> canonical_order(Dataset const &ds) const;
};

}
