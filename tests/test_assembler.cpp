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
#include <random>
#include <gtest/gtest.h>
#include <scmgrid/error.hpp>
#include <scmgrid/TileAssembler.hpp>
#include <scmgrid/GridAssembler.hpp>
#include <scmgrid/TimeCoord.hpp>

using namespace scmgrid;

class AssemblerTest : public ::testing::Test {
protected:
    CoordinateTemplates templates;
    std::vector<std::string> const level_dims;
    boost::posix_time::ptime const ref;

    AssemblerTest() :
        level_dims({"nlev"}),
        ref(parse_time("2009-04-06T01:00:00"))
    {
        set_templates(3, {-10., 0., 10.});
    }

    void set_templates(int xsize, std::vector<double> const &lat)
    {
        templates.xname = "lon";
        templates.yname = "lat";
        std::vector<double> lon;
        for (int i=0; i<xsize; ++i) lon.push_back(90. * i);
        templates.x = Variable({}, lon, NC_DOUBLE, true);
        templates.y = Variable({}, lat, NC_DOUBLE, true);
        templates.y.atts["units"] = "degrees_north";
    }

    /** Output of one cell: v(time, nlev) = 100*y + x + 10*k */
    Dataset cell_output(Cell const &cell)
    {
        Dataset ds;
        ds.add_dim("time", 2);
        ds.add_dim("nlev", 2);
        Variable time({"time"}, {0., 3600.}, NC_INT, true);
        time.atts["units"] = "seconds";
        ds.add_var("time", std::move(time));
        double const val = 100. * cell.y_global + cell.x_global;
        ds.add_var("v", Variable({"time", "nlev"}, {val, val+10., val, val+10.}));
        templates.label(ds, cell);
        return ds;
    }

    std::vector<CellOutput> outputs(Tile const &tile, std::vector<Cell> const &failed = {})
    {
        std::vector<CellOutput> ret;
        for (auto const &cell : tile.cells()) {
            boost::optional<Dataset> ds;
            if (std::find(failed.begin(), failed.end(), cell) == failed.end())
                ds = cell_output(cell);
            ret.push_back(CellOutput(cell, std::move(ds)));
        }
        return ret;
    }

    void expect_same(Dataset const &a, Dataset const &b)
    {
        ASSERT_EQ(a.var_names(), b.var_names());
        EXPECT_EQ(a.dim_names(), b.dim_names());
        for (auto const &vname : a.var_names())
            EXPECT_TRUE(equal_values(a.var(vname), b.var(vname))) << vname;
    }

    /** Value of v at (time=0, nlev=0, lat=j, lon=i) in a grid dataset */
    double grid_value(Dataset const &grid, int j, int i)
    {
        long const nx = grid.dim_size("lon");
        return grid.var("v").data[j*nx + i];
    }
};

// ------------------------------------------------------------
TEST_F(AssemblerTest, tile_order_independent)
{
    Tile const tile(0, 0, 0, 3, 2);
    TileAssembler const assembler(templates);

    std::vector<CellOutput> outs(outputs(tile));
    auto const sorted(assembler.assemble(tile, outs));
    ASSERT_TRUE((bool)sorted);

    std::mt19937 rng(17);
    for (int i=0; i<5; ++i) {
        std::shuffle(outs.begin(), outs.end(), rng);
        auto const shuffled(assembler.assemble(tile, outs));
        ASSERT_TRUE((bool)shuffled);
        expect_same(sorted->ds, shuffled->ds);
    }

    Dataset const &ds(sorted->ds);
    EXPECT_EQ((std::vector<std::string>{"lat", "lon", "time", "nlev"}), ds.var("v").dims);
    EXPECT_EQ((std::vector<double>{-10., 0.}), ds.var("lat").data);
    EXPECT_EQ((std::vector<double>{0., 90., 180.}), ds.var("lon").data);
    // v(lat=1, lon=2, time=0, nlev=1)
    EXPECT_EQ(112., ds.var("v").data[((1*3 + 2)*2 + 0)*2 + 1]);
    EXPECT_EQ(0., sorted->max_y);
    EXPECT_EQ(0., sorted->min_x);
    EXPECT_EQ(0, sorted->nfilled);
}

TEST_F(AssemblerTest, tile_single_row)
{
    Tile const tile(2, 0, 2, 3, 1);
    auto const res(TileAssembler(templates).assemble(tile, outputs(tile)));
    ASSERT_TRUE((bool)res);
    EXPECT_EQ(2, res->tile_id);
    EXPECT_EQ((std::vector<std::string>{"lon", "time", "nlev"}), res->ds.var("v").dims);
    EXPECT_EQ(10., res->ds.var("lat").scalar());
    EXPECT_EQ(10., res->max_y);
}

TEST_F(AssemblerTest, tile_failed_cells)
{
    Tile const tile(0, 0, 0, 3, 2);
    auto const res(TileAssembler(templates).assemble(tile,
        outputs(tile, {Cell(1,0), Cell(2,1)})));
    ASSERT_TRUE((bool)res);
    EXPECT_EQ(2, res->nfilled);

    Dataset const &ds(res->ds);
    EXPECT_EQ((std::vector<double>{0., 90., 180.}), ds.var("lon").data);
    EXPECT_EQ((std::vector<double>{-10., 0.}), ds.var("lat").data);
    std::vector<double> const &v(ds.var("v").data);
    EXPECT_TRUE(std::isnan(v[(0*3 + 1)*4]));
    EXPECT_TRUE(std::isnan(v[(1*3 + 2)*4]));
    EXPECT_EQ(0., v[0]);
    EXPECT_EQ(101., v[(1*3 + 1)*4]);
}

TEST_F(AssemblerTest, tile_all_failed)
{
    Tile const tile(0, 0, 0, 3, 1);
    auto const res(TileAssembler(templates).assemble(tile, outputs(tile, tile.cells())));
    EXPECT_FALSE((bool)res);
}

TEST_F(AssemblerTest, tile_foreign_cell)
{
    Tile const tile(0, 0, 0, 3, 1);
    std::vector<CellOutput> outs(outputs(tile));
    outs.push_back(CellOutput(Cell(0,2), cell_output(Cell(0,2))));
    EXPECT_THROW(TileAssembler(templates).assemble(tile, outs), scmgrid::Exception);
}

// ------------------------------------------------------------
TEST_F(AssemblerTest, grid_order_independent)
{
    std::vector<Tile> const tiles(decompose_by_rows(3, 3, 1));
    TileAssembler const tassembler(templates);
    std::vector<TileDataset> tds;
    for (auto const &tile : tiles) tds.push_back(*tassembler.assemble(tile, outputs(tile)));

    GridAssembler const assembler("lon", "lat", level_dims, ref);
    Dataset const grid(assembler.assemble(tds));

    std::reverse(tds.begin(), tds.end());
    expect_same(grid, assembler.assemble(tds));
    std::swap(tds[0], tds[1]);
    expect_same(grid, assembler.assemble(tds));

    EXPECT_EQ((std::vector<std::string>{"time", "nlev", "lat", "lon"}), grid.var("v").dims);
    EXPECT_EQ((std::vector<double>{-10., 0., 10.}), grid.var("lat").data);
    for (int j=0; j<3; ++j)
    for (int i=0; i<3; ++i)
        EXPECT_EQ(100.*j + i, grid_value(grid, j, i));

    Variable const &time(grid.var("time"));
    EXPECT_EQ("seconds since 2009-04-06T01:00:00", time.att("units"));
    EXPECT_EQ((std::vector<double>{0., 3600.}), time.data);
}

TEST_F(AssemblerTest, grid_by_value)
{
    // Latitude decreasing with row index: tiles end up in increasing latitude
    set_templates(2, {10., 0., -10.});
    std::vector<Tile> const tiles(decompose_by_rows(2, 3, 2));
    TileAssembler const tassembler(templates);
    std::vector<TileDataset> tds;
    for (auto const &tile : tiles) tds.push_back(*tassembler.assemble(tile, outputs(tile)));
    EXPECT_EQ(10., tds[0].max_y);
    EXPECT_EQ(-10., tds[1].max_y);

    Dataset const grid(GridAssembler("lon", "lat", level_dims, ref).assemble(tds));
    EXPECT_EQ((std::vector<double>{-10., 10., 0.}), grid.var("lat").data);
    EXPECT_EQ(200., grid_value(grid, 0, 0));
    EXPECT_EQ(1., grid_value(grid, 1, 1));
}

TEST_F(AssemblerTest, grid_of_cells)
{
    std::vector<Tile> const tiles(decompose_by_cells(3, 2));
    TileAssembler const tassembler(templates);
    std::vector<TileDataset> tds;
    for (auto const &tile : tiles) tds.push_back(*tassembler.assemble(tile, outputs(tile)));
    std::reverse(tds.begin(), tds.end());

    Dataset const grid(GridAssembler("lon", "lat", level_dims, ref).assemble(tds));
    EXPECT_EQ((std::vector<double>{-10., 0.}), grid.var("lat").data);
    EXPECT_EQ((std::vector<double>{0., 90., 180.}), grid.var("lon").data);
    for (int j=0; j<2; ++j)
    for (int i=0; i<3; ++i)
        EXPECT_EQ(100.*j + i, grid_value(grid, j, i));
}

TEST_F(AssemblerTest, grid_of_cells_missing_tile)
{
    std::vector<Tile> const tiles(decompose_by_cells(3, 2));
    TileAssembler const tassembler(templates);
    std::vector<TileDataset> tds;
    for (auto const &tile : tiles) {
        if (tile.contains(Cell(1,0))) continue;
        tds.push_back(*tassembler.assemble(tile, outputs(tile)));
    }
    Dataset const like(tds.back().ds);
    tds.push_back(tassembler.missing_tile(tiles[1], like));
    EXPECT_EQ(1, tds.back().nfilled);
    EXPECT_EQ(-10., tds.back().max_y);
    EXPECT_EQ(90., tds.back().min_x);

    Dataset const grid(GridAssembler("lon", "lat", level_dims, ref).assemble(tds));
    EXPECT_EQ((std::vector<double>{0., 90., 180.}), grid.var("lon").data);
    for (int j=0; j<2; ++j)
    for (int i=0; i<3; ++i) {
        if (j == 0 && i == 1) EXPECT_TRUE(std::isnan(grid_value(grid, j, i)));
        else EXPECT_EQ(100.*j + i, grid_value(grid, j, i));
    }
}

TEST_F(AssemblerTest, grid_missing_band)
{
    std::vector<Tile> const tiles(decompose_by_rows(3, 3, 2));
    TileAssembler const tassembler(templates);
    std::vector<TileDataset> tds;
    tds.push_back(*tassembler.assemble(tiles[1], outputs(tiles[1])));
    tds.push_back(tassembler.missing_tile(tiles[0], tds[0].ds));
    EXPECT_EQ(6, tds[1].nfilled);

    Dataset const grid(GridAssembler("lon", "lat", level_dims, ref).assemble(tds));
    EXPECT_EQ((std::vector<double>{-10., 0., 10.}), grid.var("lat").data);
    EXPECT_TRUE(std::isnan(grid_value(grid, 1, 2)));
    EXPECT_EQ(201., grid_value(grid, 2, 1));
}

TEST_F(AssemblerTest, grid_empty)
{
    GridAssembler const assembler("lon", "lat", level_dims, ref);
    EXPECT_THROW(assembler.assemble({}), scmgrid::Exception);
}

TEST_F(AssemblerTest, canonical_order)
{
    Dataset ds;
    for (auto const &d : {"lat", "lon", "nlevs", "time", "other", "nlev"}) ds.add_dim(d, 1);
    GridAssembler const assembler("lon", "lat",
        {"nlev", "nlevp1", "nlevs"}, ref);
    EXPECT_EQ((std::vector<std::string>{"time", "nlev", "nlevs", "other", "lat", "lon"}),
        assembler.canonical_order(ds));
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
