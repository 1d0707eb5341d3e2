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

namespace scmgrid {

/** Variables to exclude when loading cell output: either present
with N entries, or absent (nothing is dropped). */
typedef boost::optional<std::vector<std::string>> DropList;

/** Reads a plain-text drop list, one variable name per line.
@return An absent DropList if the file does not exist. */
DropList read_drop_list(std::string const &fname);

}
