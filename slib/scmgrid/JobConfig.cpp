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

#include <ctime>
#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <scmgrid/error.hpp>
#include <scmgrid/TimeCoord.hpp>
#include <scmgrid/JobConfig.hpp>

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace scmgrid {

std::string JobConfig::timestamp() const
    { return file_timestamp(start_time); }

std::string JobConfig::iso_start_time() const
    { return iso_timestamp(start_time); }

std::string JobConfig::input_file() const
{
    return (fs::path(input_directory)
        / expand_time_pattern(input_file_pattern, start_time)).string();
}

std::string expand_time_pattern(std::string const &pattern,
    boost::posix_time::ptime const &t)
{
    std::tm const tm(boost::posix_time::to_tm(t));
    std::string ret;
    size_t pos = 0;
    for (;;) {
        size_t const begin = pattern.find("{time", pos);
        if (begin == std::string::npos) break;
        size_t const end = pattern.find('}', begin);
        if (end == std::string::npos) (*scmgrid_error)(-1,
            "Unterminated {time} field in file name pattern: %s", pattern.c_str());

        ret.append(pattern, pos, begin - pos);
        std::string fmt(pattern.substr(begin + 5, end - begin - 5));
        if (fmt.size() > 0 && fmt[0] == ':') fmt = fmt.substr(1);
        else if (fmt.size() > 0) (*scmgrid_error)(-1,
            "Invalid {time} field in file name pattern: %s", pattern.c_str());
        else fmt = "%Y-%m-%d %H:%M:%S";

        char buf[256];
        size_t const len = strftime(buf, sizeof(buf), fmt.c_str(), &tm);
        ret.append(buf, len);
        pos = end + 1;
    }
    ret.append(pattern, pos, std::string::npos);
    return ret;
}

void JobConfig::validate() const
{
    if (start_time.is_special())
        (*scmgrid_error)(-1, "Configuration: start_time is not set");
    if (xsize <= 0 || ysize <= 0) (*scmgrid_error)(-1,
        "Configuration: xsize and ysize must be positive (%d, %d)", xsize, ysize);
    if (row_height <= 0) (*scmgrid_error)(-1,
        "Configuration: row_height must be positive (%d)", row_height);

    std::pair<char const *, std::string const *> const required[] = {
        {"xname", &xname}, {"yname", &yname},
        {"input_directory", &input_directory},
        {"input_file_pattern", &input_file_pattern},
        {"template_directory", &template_directory},
        {"work_directory", &work_directory},
        {"output_directory", &output_directory}};
    for (auto const &ii : required) {
        if (ii.second->empty()) (*scmgrid_error)(-1,
            "Configuration: %s is not set", ii.first);
    }
    if (xname == yname) (*scmgrid_error)(-1,
        "Configuration: xname and yname must differ (%s)", xname.c_str());
}

JobConfig read_job_config(std::string const &fname)
{
    pt::ptree tree;
    try {
        pt::read_ini(fname, tree);
    } catch(pt::ini_parser_error const &exp) {
        (*scmgrid_error)(-1, "Cannot read configuration file %s: %s",
            fname.c_str(), exp.what());
    }

    JobConfig config;
    try {
        pt::ptree const &sec(tree.get_child("default"));
        config.start_time = parse_time(sec.get<std::string>("start_time"));
        config.xsize = sec.get<int>("xsize");
        config.ysize = sec.get<int>("ysize");
        config.row_height = sec.get<int>("row_height", 1);
        config.xname = sec.get<std::string>("xname");
        config.yname = sec.get<std::string>("yname");
        config.input_directory = sec.get<std::string>("input_directory");
        config.input_file_pattern = sec.get<std::string>("input_file_pattern");
        config.template_directory = sec.get<std::string>("template_directory");
        config.work_directory = sec.get<std::string>("work_directory");
        config.output_directory = sec.get<std::string>("output_directory");
        config.forcing_num_steps = sec.get<int>("forcing_num_steps", 0);
    } catch(pt::ptree_error const &exp) {
        (*scmgrid_error)(-1, "Configuration file %s: %s", fname.c_str(), exp.what());
    }

    config.validate();
    return config;
}

}
