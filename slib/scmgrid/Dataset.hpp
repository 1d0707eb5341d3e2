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
#include <string>
#include <vector>
#include <netcdf.h>

namespace scmgrid {

/** One labeled array.  Data are stored row-major as double, whatever
the type they will be written as; missing values are NaN. */
struct Variable {
    std::vector<std::string> dims;
    std::vector<double> data;

    /** NetCDF type to use when this variable is written */
    nc_type nctype;

    /** Text attributes (units, long_name, ...) */
    std::map<std::string, std::string> atts;

    /** Coordinates are kept (not stacked) by Dataset::concat() when
    they are identical in all parts. */
    bool is_coord;

    Variable() : nctype(NC_DOUBLE), is_coord(false) {}

    Variable(std::vector<std::string> const &_dims,
        std::vector<double> _data,
        nc_type _nctype = NC_DOUBLE,
        bool _is_coord = false)
    : dims(_dims), data(std::move(_data)), nctype(_nctype), is_coord(_is_coord) {}

    size_t rank() const { return dims.size(); }

    /** @return Position of dim in dims, or -1 if absent */
    int axis(std::string const &dim) const;

    /** Value of a variable holding exactly one element */
    double scalar() const;

    std::string att(std::string const &name, std::string const &dflt = "") const;
};

/** True if a and b have the same dimensions and values (NaN equals NaN). */
bool equal_values(Variable const &a, Variable const &b);

/** In-memory equivalent of a NetCDF file: ordered dimensions, ordered
variables and text global attributes. */
class Dataset {
    std::vector<std::string> _dim_order;
    std::map<std::string, long> _dims;
    std::vector<std::string> _var_order;
    std::map<std::string, Variable> _vars;

public:
    std::map<std::string, std::string> atts;

    // ------------- Dimensions
    std::vector<std::string> const &dim_names() const
        { return _dim_order; }
    bool has_dim(std::string const &name) const
        { return _dims.find(name) != _dims.end(); }
    long dim_size(std::string const &name) const;

    /** Adds a dimension; re-adding one with the same size is a no-op. */
    void add_dim(std::string const &name, long size);

    /** Removes dimensions no variable uses */
    void prune_dims();

    std::vector<long> shape(Variable const &var) const;

    // ------------- Variables
    std::vector<std::string> const &var_names() const
        { return _var_order; }
    bool has_var(std::string const &name) const
        { return _vars.find(name) != _vars.end(); }
    size_t nvars() const { return _var_order.size(); }

    Variable &var(std::string const &name);
    Variable const &var(std::string const &name) const;

    /** Adds (or replaces) a variable.  Its dimensions must already
    exist and its data must fit them. */
    Variable &add_var(std::string const &name, Variable &&var);

    /** Sets a 0-dimensional coordinate, eg latitude of a single column. */
    void set_scalar_coord(std::string const &name, double value,
        std::map<std::string, std::string> const &atts = {});

    void erase_var(std::string const &name);

    /** Erases the named variables; names not present are ignored. */
    void drop_vars(std::vector<std::string> const &names);

    /** Adds variables of other to this.  Variables present in both
    must be identical. */
    void merge(Dataset const &other);

    // ------------- Selection and reshaping
    /** Selects one index along dim, which is removed.  A coordinate
    named dim becomes a scalar coordinate. */
    Dataset isel(std::string const &dim, long index) const;

    /** Selects [begin, begin+count) along dim. */
    Dataset isel_range(std::string const &dim, long begin, long count) const;

    /** Same structure; coordinates copied, data variables set to fill. */
    Dataset filled_like(double fill) const;

    /** Reorders the dimensions of every variable to follow order,
    which must name every dimension of the dataset. */
    Dataset transposed(std::vector<std::string> const &order) const;

    /** Largest (non-NaN) value of a variable */
    double max_value(std::string const &name) const;

    /** Concatenates datasets along dim.
     - A variable named dim, or holding dim in any part, is concatenated
       along dim; parts missing dim count as length one.
     - Coordinates identical in all parts are kept as they are.
     - Any other variable is stacked along a new leading dimension dim.
    All parts must hold the same variables. */
    static Dataset concat(
        std::vector<Dataset const *> const &parts,
        std::string const &dim);
};

}   // namespace scmgrid
