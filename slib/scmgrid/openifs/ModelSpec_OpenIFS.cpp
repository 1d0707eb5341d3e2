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

#include <scmgrid/openifs/ModelSpec_OpenIFS.hpp>

namespace scmgrid {
namespace openifs {

static ModelSpec make_openifs_scm()
{
    ModelSpec spec;
    spec.name = "openifs";
    spec.executable = "master1c.exe";
    spec.input_fname = "scm_in.nc";
    spec.expected_files = {"onecol.r", "progvar.nc", "diagvar.nc", "diagvar2.nc"};
    spec.archive_files = {"diagvar.nc", "diagvar2.nc", "progvar.nc"};
    spec.level_dims = {"nlev", "nlevp1", "nlevs", "norg", "ntiles", "ncextr"};
    return spec;
}

ModelSpec const &openifs_scm()
{
    static ModelSpec const spec(make_openifs_scm());
    return spec;
}

}}
