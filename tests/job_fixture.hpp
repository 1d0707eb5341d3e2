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
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <scmgrid/DatasetIO.hpp>
#include <scmgrid/Grid.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/TimeCoord.hpp>

/** Sets up the directories and forcing input of a small job, with
fake_scm standing in for the model.  Forcing at cell (x,y) and time
index i is t = 100*y + x + i. */
class JobFixture : public ::testing::Test {
protected:
    boost::filesystem::path tmpdir;
    scmgrid::JobConfig config;

    JobFixture()
    {
        namespace fs = boost::filesystem;
        tmpdir = fs::temp_directory_path() / fs::unique_path("scmgrid-job-%%%%-%%%%");
        fs::create_directories(tmpdir);

        config.start_time = scmgrid::parse_time("2009-04-06T01:00:00");
        config.xname = "lon";
        config.yname = "lat";
        config.row_height = 1;
        config.input_directory = (tmpdir / "input").string();
        config.input_file_pattern = "forcing.{time:%Y%m%d}.nc";
        config.template_directory = (tmpdir / "template").string();
        config.work_directory = (tmpdir / "work").string();
        config.output_directory = (tmpdir / "output").string();

        fs::create_directories(config.input_directory);
        fs::create_directories(config.template_directory);
        fs::create_directories(config.output_directory);
        fs::create_symlink(FAKE_SCM_EXE,
            fs::path(config.template_directory) / "master1c.exe");
    }

    virtual ~JobFixture()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(tmpdir, ec);
    }

    /** Writes the forcing input file.
    @param modes fake_scm mode of selected cells (default 0) */
    void write_forcing(int xsize, int ysize,
        std::map<scmgrid::Cell, int> const &modes = {})
    {
        using namespace scmgrid;
        config.xsize = xsize;
        config.ysize = ysize;
        int const ntime = 3;

        Dataset ds;
        ds.add_dim("time", ntime);
        ds.add_dim("lat", ysize);
        ds.add_dim("lon", xsize);

        Variable time({"time"}, {0., 1., 2.}, NC_DOUBLE, true);
        time.atts["units"] = "hours since 2009-04-06 01:00:00";
        ds.add_var("time", std::move(time));

        std::vector<double> lat, lon;
        for (int j=0; j<ysize; ++j) lat.push_back(-10. + 5.*j);
        for (int i=0; i<xsize; ++i) lon.push_back(90. * i);
        Variable vlat({"lat"}, lat, NC_DOUBLE, true);
        vlat.atts["units"] = "degrees_north";
        ds.add_var("lat", std::move(vlat));
        ds.add_var("lon", Variable({"lon"}, lon, NC_DOUBLE, true));

        std::vector<double> t, mode;
        for (int k=0; k<ntime; ++k)
        for (int j=0; j<ysize; ++j)
        for (int i=0; i<xsize; ++i)
            t.push_back(100.*j + i + k);
        for (int j=0; j<ysize; ++j)
        for (int i=0; i<xsize; ++i) {
            auto ii(modes.find(Cell(i,j)));
            mode.push_back(ii == modes.end() ? 0 : ii->second);
        }
        ds.add_var("t", Variable({"time", "lat", "lon"}, t, NC_FLOAT));
        ds.add_var("mode", Variable({"lat", "lon"}, mode, NC_INT));

        write_dataset(config.input_file(), ds,
            NcWriteOptions(netCDF::NcFile::nc4, {"time"}));
    }

    /** Forcing in model time form, as the job hands it to workers */
    scmgrid::Dataset model_forcing() const
    {
        scmgrid::Dataset forcing(scmgrid::read_dataset(config.input_file()));
        scmgrid::to_model_form(forcing, config.start_time);
        return forcing;
    }
};
