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

#include <cmath>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <gtest/gtest.h>
#include <netcdf>
#include <scmgrid/error.hpp>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/DropList.hpp>

using namespace scmgrid;
namespace fs = boost::filesystem;

class DatasetIOTest : public ::testing::Test {
protected:
    fs::path tmpdir;

    DatasetIOTest()
    {
        tmpdir = fs::temp_directory_path() / fs::unique_path("scmgrid-io-%%%%-%%%%");
        fs::create_directories(tmpdir);
    }

    virtual ~DatasetIOTest()
    {
        boost::system::error_code ec;
        fs::remove_all(tmpdir, ec);
    }

    std::string tmpfile(std::string const &name)
        { return (tmpdir / name).string(); }

    Dataset make_dataset()
    {
        Dataset ds;
        ds.add_dim("time", 2);
        ds.add_dim("nlev", 3);

        Variable time({"time"}, {0., 3600.}, NC_INT, true);
        time.atts["units"] = "seconds";
        ds.add_var("time", std::move(time));

        Variable t({"time", "nlev"}, {1.5, 2.5, 3.5, 4.5, std::nan(""), 6.5}, NC_FLOAT);
        t.atts["units"] = "K";
        t.atts["long_name"] = "Temperature";
        ds.add_var("t", std::move(t));

        ds.add_var("q", Variable({"time"}, {0.25, 0.5}));
        ds.set_scalar_coord("lat", 51.5, {{"units", "degrees_north"}});
        ds.atts["title"] = "test";
        return ds;
    }
};

TEST_F(DatasetIOTest, round_trip)
{
    std::string const fname(tmpfile("rt.nc"));
    Dataset const ds(make_dataset());
    write_dataset(fname, ds, NcWriteOptions(netCDF::NcFile::nc4, {"time"}));

    Dataset const back(read_dataset(fname));
    EXPECT_EQ(ds.var_names(), back.var_names());
    EXPECT_EQ(2, back.dim_size("time"));
    EXPECT_EQ("test", back.atts.at("title"));

    Variable const &t(back.var("t"));
    EXPECT_EQ(NC_FLOAT, t.nctype);
    EXPECT_EQ("K", t.att("units"));
    EXPECT_EQ("", t.att("coordinates"));
    EXPECT_TRUE(std::isnan(t.data[4]));
    EXPECT_EQ(6.5, t.data[5]);
    EXPECT_TRUE(equal_values(ds.var("t"), t));

    EXPECT_EQ(NC_INT, back.var("time").nctype);
    EXPECT_TRUE(back.var("time").is_coord);
    EXPECT_FALSE(back.var("q").is_coord);

    // Scalar coordinate found through the "coordinates" attribute
    EXPECT_TRUE(back.var("lat").is_coord);
    EXPECT_EQ(51.5, back.var("lat").scalar());
    EXPECT_EQ("degrees_north", back.var("lat").att("units"));
}

TEST_F(DatasetIOTest, unlimited_classic)
{
    std::string const fname(tmpfile("classic.nc"));
    write_dataset(fname, make_dataset(), NcWriteOptions(netCDF::NcFile::classic, {"time"}));

    netCDF::NcFile nc(fname, netCDF::NcFile::read);
    EXPECT_TRUE(nc.getDim("time").isUnlimited());
    EXPECT_FALSE(nc.getDim("nlev").isUnlimited());
    int format;
    nc_inq_format(nc.getId(), &format);
    EXPECT_EQ(NC_FORMAT_CLASSIC, format);
    nc.close();

    Variable const q(read_variable(fname, "q"));
    EXPECT_EQ((std::vector<double>{0.25, 0.5}), q.data);
    EXPECT_THROW(read_variable(fname, "nope"), scmgrid::Exception);
}

TEST_F(DatasetIOTest, drop_list)
{
    std::string const fname(tmpfile("drop.nc"));
    write_dataset(fname, make_dataset());

    std::string const drop_fname(tmpfile("dropvars.txt"));
    {
        fs::ofstream out(drop_fname);
        out << "t\n\n  nlev_var  \nq\n";
    }
    DropList const drop(read_drop_list(drop_fname));
    ASSERT_TRUE((bool)drop);
    EXPECT_EQ((std::vector<std::string>{"t", "nlev_var", "q"}), *drop);

    Dataset const back(read_dataset(fname, drop));
    EXPECT_FALSE(back.has_var("t"));
    EXPECT_FALSE(back.has_var("q"));
    EXPECT_TRUE(back.has_var("time"));
    EXPECT_FALSE(back.has_dim("nlev"));
}

TEST_F(DatasetIOTest, missing_file)
{
    EXPECT_THROW(read_dataset(tmpfile("nothere.nc")), scmgrid::Exception);
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
