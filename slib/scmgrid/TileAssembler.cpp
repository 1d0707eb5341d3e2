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
#include <cmath>
#include <limits>
#include <map>
#include <scmgrid/error.hpp>
#include <scmgrid/logging.hpp>
#include <scmgrid/TileAssembler.hpp>

namespace scmgrid {

boost::optional<TileDataset> TileAssembler::assemble(
    Tile const &tile,
    std::vector<CellOutput> const &cells) const
{
    // Index the successful cells by (y, x)
    std::map<Cell, Dataset const *> found;
    for (auto const &ii : cells) {
        Cell const &cell(ii.first);
        if (!tile.contains(cell)) (*scmgrid_error)(-1,
            "Cell %s is not part of tile %d", cell.id().c_str(), tile.id);
        if (found.find(cell) != found.end()) (*scmgrid_error)(-1,
            "Cell %s appears twice in tile %d", cell.id().c_str(), tile.id);
        found.insert(std::make_pair(cell, ii.second ? &*ii.second : nullptr));
    }

    Dataset const *proto = nullptr;
    for (auto const &ii : found) {
        if (ii.second) {
            proto = ii.second;
            break;
        }
    }
    if (!proto) {
        log_error("PP", "No cell of tile #%d has output, the tile is missing", tile.id);
        return boost::none;
    }

    TileDataset ret(join(tile, found, *proto));
    if (ret.nfilled > 0) log_warning("PP",
        "tile #%d: %d of %ld cells failed, filled with missing values",
        tile.id, ret.nfilled, (long)tile.size());
    log_info("PP", "processing of tile #%d completed", tile.id);
    return ret;
}

TileDataset TileAssembler::missing_tile(Tile const &tile, Dataset const &like) const
{
    // Reduce like to the shape of a single cell
    Dataset cell(like);
    if (cell.has_dim(templates.yname)) cell = cell.isel(templates.yname, 0);
    if (cell.has_dim(templates.xname)) cell = cell.isel(templates.xname, 0);

    TileDataset ret(join(tile, std::map<Cell, Dataset const *>(), cell));
    log_warning("PP", "tile #%d has no output, filled with missing values", tile.id);
    return ret;
}

TileDataset TileAssembler::join(
    Tile const &tile,
    std::map<Cell, Dataset const *> found,
    Dataset const &proto) const
{
    // Missing-value placeholders for failed cells
    Dataset const blank(proto.filled_like(std::numeric_limits<double>::quiet_NaN()));
    std::vector<Dataset> placeholders;
    placeholders.reserve(tile.size());
    TileDataset ret;
    ret.tile_id = tile.id;
    for (auto const &cell : tile.cells()) {
        auto ii(found.find(cell));
        if (ii != found.end() && ii->second) continue;
        placeholders.push_back(blank);
        templates.label(placeholders.back(), cell);
        found[cell] = &placeholders.back();
        ++ret.nfilled;
    }

    // std::map<Cell,...> iterates in row-major order
    std::vector<Dataset> rows;
    std::vector<Dataset const *> row_parts;
    int row_y = -1;
    for (auto const &ii : found) {
        if (ii.first.y_global != row_y && row_parts.size() > 0) {
            rows.push_back(Dataset::concat(row_parts, templates.xname));
            row_parts.clear();
        }
        row_y = ii.first.y_global;
        row_parts.push_back(ii.second);
    }
    rows.push_back(Dataset::concat(row_parts, templates.xname));

    if (rows.size() == 1) {
        ret.ds = std::move(rows[0]);
    } else {
        std::vector<Dataset const *> parts;
        for (auto const &row : rows) parts.push_back(&row);
        ret.ds = Dataset::concat(parts, templates.yname);
    }

    ret.max_y = ret.ds.max_value(templates.yname);
    ret.min_x = std::numeric_limits<double>::infinity();
    for (double val : ret.ds.var(templates.xname).data)
        if (!std::isnan(val)) ret.min_x = std::min(ret.min_x, val);
    return ret;
}

}
