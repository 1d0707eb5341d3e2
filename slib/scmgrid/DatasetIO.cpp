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
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <ibmisc/netcdf.hpp>
#include <scmgrid/error.hpp>
#include <scmgrid/DatasetIO.hpp>

using namespace netCDF;

namespace scmgrid {

std::mutex &netcdf_mutex()
{
    static std::mutex mutex;
    return mutex;
}

// ================================================================
// Reading

template<class NcAttT>
static void read_text_atts(
    std::map<std::string, std::string> &out,
    std::multimap<std::string, NcAttT> const &atts)
{
    for (auto const &ii : atts) {
        NcAttT const &att(ii.second);
        if (att.getType().getId() != NC_CHAR) continue;
        std::string val;
        att.getValues(val);
        out[ii.first] = val;
    }
}

template<class NcAttT>
static void read_text_atts(
    std::map<std::string, std::string> &out,
    std::map<std::string, NcAttT> const &atts)
{
    for (auto const &ii : atts) {
        NcAttT const &att(ii.second);
        if (att.getType().getId() != NC_CHAR) continue;
        std::string val;
        att.getValues(val);
        out[ii.first] = val;
    }
}

/** Reads a numeric attribute of length 1, if present */
static bool read_num_att(NcVar const &ncvar, std::string const &name, double &val)
{
    auto atts(ncvar.getAtts());
    auto ii(atts.find(name));
    if (ii == atts.end()) return false;
    NcVarAtt const &att(ii->second);
    nc_type const type = att.getType().getId();
    if (type == NC_CHAR || type == NC_STRING) return false;
    if (att.getAttLength() != 1) return false;
    att.getValues(&val);
    return true;
}

static Variable read_ncvar(NcVar const &ncvar)
{
    Variable var;
    var.nctype = ncvar.getType().getId();

    size_t n = 1;
    for (NcDim const &dim : ncvar.getDims()) {
        var.dims.push_back(dim.getName());
        n *= dim.getSize();
    }
    var.data.resize(n);
    if (n > 0) ncvar.getVar(&var.data[0]);

    read_text_atts(var.atts, ncvar.getAtts());

    // Decode missing values and packing
    double fill;
    if (read_num_att(ncvar, "_FillValue", fill)) {
        for (double &val : var.data) if (val == fill) val = std::nan("");
    }
    if (read_num_att(ncvar, "missing_value", fill)) {
        for (double &val : var.data) if (val == fill) val = std::nan("");
    }
    double scale = 1.0, offset = 0.0;
    bool const has_scale = read_num_att(ncvar, "scale_factor", scale);
    bool const has_offset = read_num_att(ncvar, "add_offset", offset);
    if (has_scale || has_offset) {
        for (double &val : var.data) val = val * scale + offset;
        var.nctype = NC_DOUBLE;
    }

    var.is_coord = (var.rank() == 1 && var.dims[0] == ncvar.getName());
    return var;
}

template<class NcThingT>
static bool by_id(NcThingT const &a, NcThingT const &b)
    { return a.getId() < b.getId(); }

Dataset read_dataset(std::string const &fname, DropList const &drop)
{
    std::lock_guard<std::mutex> lock(netcdf_mutex());

    Dataset ds;
    try {
        ibmisc::NcIO ncio(fname, NcFile::read);
        NcFile &nc(*ncio.nc);

        std::vector<NcDim> ncdims;
        for (auto const &ii : nc.getDims()) ncdims.push_back(ii.second);
        std::sort(ncdims.begin(), ncdims.end(), &by_id<NcDim>);
        for (NcDim const &dim : ncdims) ds.add_dim(dim.getName(), dim.getSize());

        std::vector<NcVar> ncvars;
        for (auto const &ii : nc.getVars()) ncvars.push_back(ii.second);
        std::sort(ncvars.begin(), ncvars.end(), &by_id<NcVar>);

        std::vector<std::string> aux_coords;
        for (NcVar const &ncvar : ncvars) {
            std::string const vname(ncvar.getName());
            if (drop && std::find(drop->begin(), drop->end(), vname) != drop->end())
                continue;
            nc_type const type = ncvar.getType().getId();
            if (type == NC_CHAR || type == NC_STRING) continue;

            Variable &var(ds.add_var(vname, read_ncvar(ncvar)));

            // CF: non-dimension coordinates are named by data variables
            auto ii(var.atts.find("coordinates"));
            if (ii != var.atts.end()) {
                std::vector<std::string> names;
                boost::algorithm::split(names, ii->second,
                    boost::algorithm::is_space(), boost::algorithm::token_compress_on);
                aux_coords.insert(aux_coords.end(), names.begin(), names.end());
                var.atts.erase(ii);
            }
        }
        for (auto const &name : aux_coords) {
            if (ds.has_var(name)) ds.var(name).is_coord = true;
        }

        read_text_atts(ds.atts, nc.getAtts());
        ncio.close();
    } catch(exceptions::NcException const &exp) {
        (*scmgrid_error)(-1, "Failed to read %s: %s", fname.c_str(), exp.what());
    }

    ds.prune_dims();
    return ds;
}

Variable read_variable(std::string const &fname, std::string const &vname)
{
    std::lock_guard<std::mutex> lock(netcdf_mutex());

    Variable var;
    bool found = false;
    try {
        ibmisc::NcIO ncio(fname, NcFile::read);
        NcVar ncvar(ncio.nc->getVar(vname));
        if (!ncvar.isNull()) {
            var = read_ncvar(ncvar);
            found = true;
        }
        ncio.close();
    } catch(exceptions::NcException const &exp) {
        (*scmgrid_error)(-1, "Failed to read %s from %s: %s",
            vname.c_str(), fname.c_str(), exp.what());
    }
    if (!found) (*scmgrid_error)(-1,
        "Variable %s not found in %s", vname.c_str(), fname.c_str());
    return var;
}

// ================================================================
// Writing

/** Formats without 64-bit or unsigned integers */
static bool is_classic(NcFile::FileFormat format)
{
    return (format == NcFile::classic || format == NcFile::classic64
        || format == NcFile::nc4classic);
}

static NcType write_type(nc_type type, bool has_nan, NcFile::FileFormat format)
{
    bool const classic = is_classic(format);
    switch(type) {
        case NC_BYTE :
            return (has_nan ? NcType(ncDouble) : NcType(ncByte));
        case NC_SHORT :
            return (has_nan ? NcType(ncDouble) : NcType(ncShort));
        case NC_INT :
            return (has_nan ? NcType(ncDouble) : NcType(ncInt));
        case NC_INT64 :
            if (has_nan) return ncDouble;
            return (classic ? NcType(ncInt) : NcType(ncInt64));
        case NC_UBYTE :
        case NC_USHORT :
        case NC_UINT :
            if (has_nan) return ncDouble;
            return (classic ? NcType(ncInt) : NcType(ncUint));
        case NC_FLOAT :
            return ncFloat;
        default :
            return ncDouble;
    }
}

static double fill_value(NcType const &type)
{
    return (type.getId() == NC_FLOAT ? (double)NC_FILL_FLOAT : NC_FILL_DOUBLE);
}

void write_dataset(std::string const &fname, Dataset const &ds,
    NcWriteOptions const &opts)
{
    std::lock_guard<std::mutex> lock(netcdf_mutex());

    // Non-dimension coordinates, listed in each data variable's
    // "coordinates" attribute.
    std::vector<std::string> aux_coords;
    for (auto const &vname : ds.var_names()) {
        Variable const &var(ds.var(vname));
        if (var.is_coord && !(var.rank() == 1 && var.dims[0] == vname))
            aux_coords.push_back(vname);
    }

    try {
        NcFile nc(fname, NcFile::replace, opts.format);

        std::map<std::string, NcDim> ncdims;
        for (auto const &dname : ds.dim_names()) {
            bool const unlimited = (std::find(opts.unlimited_dims.begin(),
                opts.unlimited_dims.end(), dname) != opts.unlimited_dims.end());
            ncdims.insert(std::make_pair(dname, (unlimited
                ? nc.addDim(dname) : nc.addDim(dname, ds.dim_size(dname)))));
        }

        // ----------- Define
        std::vector<NcVar> ncvars;
        std::vector<bool> has_nans;
        for (auto const &vname : ds.var_names()) {
            Variable const &var(ds.var(vname));
            bool const has_nan = std::any_of(var.data.begin(), var.data.end(),
                [](double val) { return std::isnan(val); });
            NcType const type(write_type(var.nctype, has_nan, opts.format));

            std::vector<NcDim> vdims;
            for (auto const &d : var.dims) vdims.push_back(ncdims.at(d));
            NcVar ncvar(nc.addVar(vname, type, vdims));

            for (auto const &att : var.atts) ncvar.putAtt(att.first, att.second);
            if (has_nan) ncvar.putAtt("_FillValue", type, fill_value(type));

            if (!var.is_coord && var.atts.find("coordinates") == var.atts.end()) {
                std::vector<std::string> names;
                for (auto const &cname : aux_coords) {
                    bool inside = true;
                    for (auto const &d : ds.var(cname).dims)
                        inside = inside && (var.axis(d) >= 0);
                    if (inside) names.push_back(cname);
                }
                if (names.size() > 0)
                    ncvar.putAtt("coordinates", boost::algorithm::join(names, " "));
            }

            ncvars.push_back(ncvar);
            has_nans.push_back(has_nan);
        }
        for (auto const &att : ds.atts) nc.putAtt(att.first, att.second);

        int const err = nc_enddef(nc.getId());
        if (err != NC_NOERR && err != NC_ENOTINDEFINE) (*scmgrid_error)(-1,
            "Failed to leave define mode in %s: %s", fname.c_str(), nc_strerror(err));

        // ----------- Write
        for (size_t i=0; i<ncvars.size(); ++i) {
            Variable const &var(ds.var(ds.var_names()[i]));
            if (var.data.size() == 0) continue;

            std::vector<double> buf(var.data);
            if (has_nans[i]) {
                double const fill = fill_value(ncvars[i].getType());
                for (double &val : buf) if (std::isnan(val)) val = fill;
            }

            if (var.rank() == 0) {
                ncvars[i].putVar(&buf[0]);
            } else {
                std::vector<long> const shape(ds.shape(var));
                std::vector<size_t> start(var.rank(), 0);
                std::vector<size_t> count(shape.begin(), shape.end());
                ncvars[i].putVar(start, count, &buf[0]);
            }
        }
        nc.close();
    } catch(exceptions::NcException const &exp) {
        // Only a partial file of our own is removed
        boost::system::error_code ec;
        if (boost::filesystem::is_regular_file(fname, ec))
            boost::filesystem::remove(fname, ec);
        (*scmgrid_error)(-1, "Failed to write %s: %s", fname.c_str(), exp.what());
    }
}

}
