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

#include <fstream>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <scmgrid/DropList.hpp>
#include <scmgrid/logging.hpp>

namespace scmgrid {

DropList read_drop_list(std::string const &fname)
{
    boost::system::error_code ec;
    if (!boost::filesystem::is_regular_file(fname, ec)) return DropList();

    std::ifstream fin(fname.c_str());
    if (!fin) {
        log_warning("PP", "cannot read drop list %s, no variables will be dropped",
            fname.c_str());
        return DropList();
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(fin, line)) {
        boost::algorithm::trim(line);
        if (line.size() > 0) names.push_back(line);
    }
    return DropList(std::move(names));
}

}
