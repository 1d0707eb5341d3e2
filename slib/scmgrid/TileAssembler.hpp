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

#include <map>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include <scmgrid/Dataset.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/CellDataset.hpp>

namespace scmgrid {

/** The assembled output of one tile */
struct TileDataset {
    int tile_id;
    double max_y;       // Largest row coordinate value in the tile
    double min_x;       // Smallest column coordinate value in the tile
    int nfilled;        // Failed cells replaced by missing values
    Dataset ds;

    TileDataset() : tile_id(-1), max_y(0), min_x(0), nfilled(0) {}
};

/** A cell and its loaded output; absent if the cell failed */
typedef std::pair<Cell, boost::optional<Dataset>> CellOutput;

/** Merges the cell datasets of a tile into one dataset, dimensioned
(yname, xname, ...) with cells in ascending grid order. */
class TileAssembler {
    CoordinateTemplates const &templates;

public:
    TileAssembler(CoordinateTemplates const &_templates)
        : templates(_templates) {}

    /** @param cells Outputs of the tile's cells, in any order.  Cells
        of the tile not listed are treated as failed.
    @return The tile dataset; absent if no cell succeeded. */
    boost::optional<TileDataset> assemble(
        Tile const &tile,
        std::vector<CellOutput> const &cells) const;

    /** Missing values for every cell of a tile that produced nothing.
    @param like Output of any other tile, giving the shape of a cell. */
    TileDataset missing_tile(Tile const &tile, Dataset const &like) const;

protected:
    /** Fills cells of tile absent from found with missing values
    shaped like proto, then concatenates along x and y. */
    TileDataset join(
        Tile const &tile,
        std::map<Cell, Dataset const *> found,
        Dataset const &proto) const;
};

}
