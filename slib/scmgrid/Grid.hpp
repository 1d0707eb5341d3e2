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
#include <iostream>

namespace scmgrid {

/** One independently runnable column of the grid.
(0,0) is the first column of the first row of the forcing input. */
struct Cell {
    int x_global;
    int y_global;

    Cell(int _x_global, int _y_global)
        : x_global(_x_global), y_global(_y_global) {}

    /** Identifier used in file and directory names, eg: y0003x0012 */
    std::string id() const;

    /** Row-major ordering */
    bool operator<(Cell const &rhs) const
    {
        if (y_global != rhs.y_global) return y_global < rhs.y_global;
        return x_global < rhs.x_global;
    }

    bool operator==(Cell const &rhs) const
        { return (x_global == rhs.x_global) && (y_global == rhs.y_global); }
};

/** A rectangle of grid cells; the unit of work handed to one worker.
decompose_by_rows() produces bands of full rows. */
class Tile {
public:
    int const id;       // Position in decomposition order, base=0
    int const x0;
    int const y0;       // First grid row of the tile
    int const ncols;
    int const nrows;

    Tile(int _id, int _x0, int _y0, int _ncols, int _nrows)
        : id(_id), x0(_x0), y0(_y0), ncols(_ncols), nrows(_nrows) {}

    size_t size() const { return (size_t)nrows * ncols; }

    /** Cells of the tile, in row-major order. */
    std::vector<Cell> cells() const;

    bool contains(Cell const &cell) const
    {
        return (cell.y_global >= y0 && cell.y_global < y0 + nrows
            && cell.x_global >= x0 && cell.x_global < x0 + ncols);
    }
};

/** Splits the ysize rows of the grid into bands of row_height rows
(the last band may be shorter).  Tile ids follow band order.
Throws (configuration error) unless all arguments are positive. */
std::vector<Tile> decompose_by_rows(int xsize, int ysize, int row_height);

/** One tile per cell, in row-major order. */
std::vector<Tile> decompose_by_cells(int xsize, int ysize);

}   // namespace scmgrid

inline std::ostream &operator<<(std::ostream &out, scmgrid::Cell const &cell)
    { return out << cell.id(); }

inline std::ostream &operator<<(std::ostream &out, scmgrid::Tile const &tile)
    { return out << "Tile(" << tile.id << ": y=" << tile.y0 << "-" << (tile.y0 + tile.nrows - 1)
        << " x=" << tile.x0 << "-" << (tile.x0 + tile.ncols - 1) << ")"; }
