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

#include <algorithm>
#include <boost/format.hpp>
#include <scmgrid/error.hpp>
#include <scmgrid/Grid.hpp>

namespace scmgrid {

std::string Cell::id() const
{
    return (boost::format("y%04dx%04d") % y_global % x_global).str();
}

std::vector<Cell> Tile::cells() const
{
    std::vector<Cell> ret;
    ret.reserve(size());
    for (int j=y0; j<y0+nrows; ++j) {
    for (int i=x0; i<x0+ncols; ++i) {
        ret.push_back(Cell(i, j));
    }}
    return ret;
}

std::vector<Tile> decompose_by_rows(int xsize, int ysize, int row_height)
{
    if (xsize <= 0 || ysize <= 0) (*scmgrid_error)(-1,
        "Grid dimensions must be positive: xsize=%d ysize=%d", xsize, ysize);
    if (row_height <= 0) (*scmgrid_error)(-1,
        "Tile row height must be positive: row_height=%d", row_height);

    std::vector<Tile> tiles;
    tiles.reserve((ysize + row_height - 1) / row_height);
    for (int y0=0; y0 < ysize; y0 += row_height) {
        int const nrows = std::min(row_height, ysize - y0);
        tiles.push_back(Tile((int)tiles.size(), 0, y0, xsize, nrows));
    }
    return tiles;
}

std::vector<Tile> decompose_by_cells(int xsize, int ysize)
{
    if (xsize <= 0 || ysize <= 0) (*scmgrid_error)(-1,
        "Grid dimensions must be positive: xsize=%d ysize=%d", xsize, ysize);

    std::vector<Tile> tiles;
    tiles.reserve((size_t)xsize * ysize);
    for (int j=0; j<ysize; ++j) {
    for (int i=0; i<xsize; ++i) {
        tiles.push_back(Tile((int)tiles.size(), i, j, 1, 1));
    }}
    return tiles;
}

}   // namespace scmgrid
