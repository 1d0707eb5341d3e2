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
#include <scmgrid/error.hpp>
#include <scmgrid/logging.hpp>
#include <scmgrid/TimeCoord.hpp>
#include <scmgrid/GridAssembler.hpp>

namespace scmgrid {

std::vector<std::string> GridAssembler::canonical_order(Dataset const &ds) const
{
    std::vector<std::string> order;
    if (ds.has_dim("time")) order.push_back("time");
    for (auto const &d : level_dims)
        if (ds.has_dim(d)) order.push_back(d);
    for (auto const &d : ds.dim_names()) {
        if (d == "time" || d == xname || d == yname) continue;
        if (std::find(level_dims.begin(), level_dims.end(), d) != level_dims.end()) continue;
        order.push_back(d);
    }
    if (ds.has_dim(yname)) order.push_back(yname);
    if (ds.has_dim(xname)) order.push_back(xname);
    return order;
}

Dataset GridAssembler::assemble(std::vector<TileDataset> const &tiles) const
{
    if (tiles.size() == 0) (*scmgrid_error)(-1,
        "No tile produced any output, the grid cannot be assembled");

    std::vector<TileDataset const *> sorted;
    for (auto const &tile : tiles) sorted.push_back(&tile);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](TileDataset const *a, TileDataset const *b) -> bool {
            if (a->max_y != b->max_y) return a->max_y < b->max_y;
            return a->min_x < b->min_x;
        });

    // Tiles sharing rows are first joined along the row
    std::vector<Dataset> bands;
    std::vector<Dataset const *> band_parts;
    for (size_t i=0; i<sorted.size(); ++i) {
        band_parts.push_back(&sorted[i]->ds);
        if (i+1 == sorted.size() || sorted[i+1]->max_y != sorted[i]->max_y) {
            bands.push_back(band_parts.size() == 1
                ? *band_parts[0] : Dataset::concat(band_parts, xname));
            band_parts.clear();
        }
    }

    std::vector<Dataset const *> parts;
    for (auto const &band : bands) parts.push_back(&band);
    Dataset grid(Dataset::concat(parts, yname));
    bands.clear();

    if (grid.has_var("time")) rebase_time(grid.var("time"), ref);

    Dataset ret(grid.transposed(canonical_order(grid)));
    log_info("PP", "assembled %ld tiles into a %ldx%ld grid",
        (long)tiles.size(),
        (long)(ret.has_dim(yname) ? ret.dim_size(yname) : 1),
        (long)(ret.has_dim(xname) ? ret.dim_size(xname) : 1));
    return ret;
}

}
