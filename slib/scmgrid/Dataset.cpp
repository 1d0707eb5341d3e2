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
#include <numeric>
#include <scmgrid/error.hpp>
#include <scmgrid/Dataset.hpp>

namespace scmgrid {

// ================================================================
// Flat-array helpers; all arrays are row-major.

static long product(std::vector<long> const &shape, size_t begin, size_t end)
{
    long ret = 1;
    for (size_t i=begin; i<end; ++i) ret *= shape[i];
    return ret;
}

/** Copies [begin, begin+count) along axis ax */
static std::vector<double> slice_axis(
    std::vector<double> const &data,
    std::vector<long> const &shape,
    int ax, long begin, long count)
{
    long const outer = product(shape, 0, ax);
    long const len = shape[ax];
    long const inner = product(shape, ax+1, shape.size());

    std::vector<double> ret;
    ret.reserve(outer * count * inner);
    for (long o=0; o<outer; ++o) {
        auto const b(data.begin() + (o*len + begin)*inner);
        ret.insert(ret.end(), b, b + count*inner);
    }
    return ret;
}

/** New axis k is old axis perm[k] */
static std::vector<double> permute(
    std::vector<double> const &data,
    std::vector<long> const &shape,
    std::vector<int> const &perm)
{
    size_t const rank = shape.size();
    std::vector<long> old_strides(rank, 1);
    for (int k=(int)rank-2; k>=0; --k)
        old_strides[k] = old_strides[k+1] * shape[k+1];

    std::vector<long> new_shape(rank);
    std::vector<long> strides(rank);    // Old stride of each new axis
    for (size_t k=0; k<rank; ++k) {
        new_shape[k] = shape[perm[k]];
        strides[k] = old_strides[perm[k]];
    }

    std::vector<double> ret(data.size());
    std::vector<long> ix(rank, 0);
    for (size_t n=0; n<ret.size(); ++n) {
        long off = 0;
        for (size_t k=0; k<rank; ++k) off += ix[k] * strides[k];
        ret[n] = data[off];

        // Increment multi-index, last axis fastest
        for (int k=(int)rank-1; k>=0; --k) {
            if (++ix[k] < new_shape[k]) break;
            ix[k] = 0;
        }
    }
    return ret;
}

static bool is_integral(nc_type type)
{
    switch(type) {
        case NC_BYTE :
        case NC_SHORT :
        case NC_INT :
        case NC_UBYTE :
        case NC_USHORT :
        case NC_UINT :
        case NC_INT64 :
        case NC_UINT64 :
            return true;
        default :
            return false;
    }
}

// ================================================================
int Variable::axis(std::string const &dim) const
{
    for (size_t i=0; i<dims.size(); ++i)
        if (dims[i] == dim) return i;
    return -1;
}

double Variable::scalar() const
{
    if (data.size() != 1) (*scmgrid_error)(-1,
        "Variable has %ld values, expected a scalar", (long)data.size());
    return data[0];
}

std::string Variable::att(std::string const &name, std::string const &dflt) const
{
    auto ii(atts.find(name));
    return (ii == atts.end() ? dflt : ii->second);
}

bool equal_values(Variable const &a, Variable const &b)
{
    if (a.dims != b.dims) return false;
    if (a.data.size() != b.data.size()) return false;
    for (size_t i=0; i<a.data.size(); ++i) {
        double const va = a.data[i];
        double const vb = b.data[i];
        if (std::isnan(va) && std::isnan(vb)) continue;
        if (va != vb) return false;
    }
    return true;
}

// ================================================================
long Dataset::dim_size(std::string const &name) const
{
    auto ii(_dims.find(name));
    if (ii == _dims.end()) (*scmgrid_error)(-1,
        "No dimension named %s", name.c_str());
    return ii->second;
}

void Dataset::add_dim(std::string const &name, long size)
{
    auto ii(_dims.find(name));
    if (ii != _dims.end()) {
        if (ii->second != size) (*scmgrid_error)(-1,
            "Dimension %s already has size %ld, cannot change it to %ld",
            name.c_str(), ii->second, size);
        return;
    }
    _dims.insert(std::make_pair(name, size));
    _dim_order.push_back(name);
}

void Dataset::prune_dims()
{
    std::vector<std::string> used;
    for (auto const &vname : _var_order) {
        for (auto const &d : _vars.at(vname).dims) used.push_back(d);
    }

    std::vector<std::string> order;
    for (auto const &d : _dim_order) {
        if (std::find(used.begin(), used.end(), d) != used.end()) {
            order.push_back(d);
        } else {
            _dims.erase(d);
        }
    }
    _dim_order = std::move(order);
}

std::vector<long> Dataset::shape(Variable const &var) const
{
    std::vector<long> ret;
    ret.reserve(var.rank());
    for (auto const &d : var.dims) ret.push_back(dim_size(d));
    return ret;
}

Variable &Dataset::var(std::string const &name)
{
    auto ii(_vars.find(name));
    if (ii == _vars.end()) (*scmgrid_error)(-1,
        "No variable named %s", name.c_str());
    return ii->second;
}

Variable const &Dataset::var(std::string const &name) const
{
    auto ii(_vars.find(name));
    if (ii == _vars.end()) (*scmgrid_error)(-1,
        "No variable named %s", name.c_str());
    return ii->second;
}

Variable &Dataset::add_var(std::string const &name, Variable &&var)
{
    long const n = product(shape(var), 0, var.rank());
    if ((long)var.data.size() != n) (*scmgrid_error)(-1,
        "Variable %s holds %ld values but its dimensions need %ld",
        name.c_str(), (long)var.data.size(), n);

    auto ii(_vars.find(name));
    if (ii == _vars.end()) {
        _var_order.push_back(name);
        ii = _vars.insert(std::make_pair(name, std::move(var))).first;
    } else {
        ii->second = std::move(var);
    }
    return ii->second;
}

void Dataset::set_scalar_coord(std::string const &name, double value,
    std::map<std::string, std::string> const &atts)
{
    Variable v({}, {value}, NC_DOUBLE, true);
    v.atts = atts;
    add_var(name, std::move(v));
}

void Dataset::erase_var(std::string const &name)
{
    if (_vars.erase(name) == 0) return;
    _var_order.erase(std::find(_var_order.begin(), _var_order.end(), name));
}

void Dataset::drop_vars(std::vector<std::string> const &names)
{
    for (auto const &name : names) erase_var(name);
    prune_dims();
}

void Dataset::merge(Dataset const &other)
{
    for (auto const &d : other._dim_order) add_dim(d, other._dims.at(d));
    for (auto const &vname : other._var_order) {
        Variable const &ov(other._vars.at(vname));
        if (has_var(vname)) {
            if (!equal_values(var(vname), ov)) (*scmgrid_error)(-1,
                "Cannot merge datasets: variable %s differs between them",
                vname.c_str());
            continue;
        }
        add_var(vname, Variable(ov));
    }
    for (auto const &att : other.atts) atts.insert(att);
}

// ----------------------------------------------------------------
Dataset Dataset::isel(std::string const &dim, long index) const
{
    long const n = dim_size(dim);
    if (index < 0 || index >= n) (*scmgrid_error)(-1,
        "Index %ld out of range for dimension %s of size %ld",
        index, dim.c_str(), n);

    Dataset ret;
    ret.atts = atts;
    for (auto const &d : _dim_order)
        if (d != dim) ret.add_dim(d, _dims.at(d));

    for (auto const &vname : _var_order) {
        Variable const &v(_vars.at(vname));
        int const ax = v.axis(dim);
        if (ax < 0) {
            ret.add_var(vname, Variable(v));
            continue;
        }
        Variable nv(v.dims, slice_axis(v.data, shape(v), ax, index, 1),
            v.nctype, v.is_coord);
        nv.atts = v.atts;
        nv.dims.erase(nv.dims.begin() + ax);
        ret.add_var(vname, std::move(nv));
    }
    return ret;
}

Dataset Dataset::isel_range(std::string const &dim, long begin, long count) const
{
    long const n = dim_size(dim);
    if (begin < 0 || count < 0 || begin + count > n) (*scmgrid_error)(-1,
        "Range [%ld, %ld) out of range for dimension %s of size %ld",
        begin, begin+count, dim.c_str(), n);

    Dataset ret;
    ret.atts = atts;
    for (auto const &d : _dim_order)
        ret.add_dim(d, (d == dim ? count : _dims.at(d)));

    for (auto const &vname : _var_order) {
        Variable const &v(_vars.at(vname));
        int const ax = v.axis(dim);
        if (ax < 0) {
            ret.add_var(vname, Variable(v));
            continue;
        }
        Variable nv(v.dims, slice_axis(v.data, shape(v), ax, begin, count),
            v.nctype, v.is_coord);
        nv.atts = v.atts;
        ret.add_var(vname, std::move(nv));
    }
    return ret;
}

Dataset Dataset::filled_like(double fill) const
{
    Dataset ret(*this);
    for (auto &vname : ret._var_order) {
        Variable &v(ret._vars.at(vname));
        if (v.is_coord) continue;
        std::fill(v.data.begin(), v.data.end(), fill);
        if (std::isnan(fill) && is_integral(v.nctype)) v.nctype = NC_DOUBLE;
    }
    return ret;
}

Dataset Dataset::transposed(std::vector<std::string> const &order) const
{
    auto position([&order](std::string const &d) -> long {
        auto ii(std::find(order.begin(), order.end(), d));
        return (ii == order.end() ? -1 : ii - order.begin());
    });

    Dataset ret;
    ret.atts = atts;
    for (auto const &d : order) {
        if (!has_dim(d)) continue;
        ret.add_dim(d, _dims.at(d));
    }
    for (auto const &d : _dim_order) {
        if (position(d) < 0) (*scmgrid_error)(-1,
            "Dimension %s missing from transpose order", d.c_str());
    }

    for (auto const &vname : _var_order) {
        Variable const &v(_vars.at(vname));
        std::vector<int> perm(v.rank());
        std::iota(perm.begin(), perm.end(), 0);
        std::stable_sort(perm.begin(), perm.end(),
            [&v, &position](int a, int b)
            { return position(v.dims[a]) < position(v.dims[b]); });

        Variable nv;
        nv.nctype = v.nctype;
        nv.is_coord = v.is_coord;
        nv.atts = v.atts;
        for (int k : perm) nv.dims.push_back(v.dims[k]);
        nv.data = permute(v.data, shape(v), perm);
        ret.add_var(vname, std::move(nv));
    }
    return ret;
}

double Dataset::max_value(std::string const &name) const
{
    double ret = -std::numeric_limits<double>::infinity();
    for (double val : var(name).data) {
        if (!std::isnan(val) && val > ret) ret = val;
    }
    return ret;
}

// ----------------------------------------------------------------
Dataset Dataset::concat(
    std::vector<Dataset const *> const &parts,
    std::string const &dim)
{
    if (parts.size() == 0) (*scmgrid_error)(-1,
        "Cannot concatenate zero datasets along %s", dim.c_str());
    Dataset const &first(*parts[0]);

    // Length of each part along dim
    std::vector<long> lens;
    long total = 0;
    for (Dataset const *p : parts) {
        lens.push_back(p->has_dim(dim) ? p->dim_size(dim) : 1);
        total += lens.back();
    }

    // All other dimensions must agree
    Dataset ret;
    ret.atts = first.atts;
    if (!first.has_dim(dim)) ret.add_dim(dim, total);
    for (auto const &d : first._dim_order)
        ret.add_dim(d, (d == dim ? total : first._dims.at(d)));
    for (size_t i=1; i<parts.size(); ++i) {
        for (auto const &d : parts[i]->_dim_order) {
            if (d == dim) continue;
            if (!first.has_dim(d) || first.dim_size(d) != parts[i]->dim_size(d))
                (*scmgrid_error)(-1,
                    "Cannot concatenate along %s: dimension %s differs in part %ld",
                    dim.c_str(), d.c_str(), (long)i);
        }
        if (parts[i]->_var_order.size() != first._var_order.size())
            (*scmgrid_error)(-1,
                "Cannot concatenate along %s: part %ld has %ld variables, part 0 has %ld",
                dim.c_str(), (long)i, (long)parts[i]->_var_order.size(),
                (long)first._var_order.size());
    }

    for (auto const &vname : first._var_order) {
        std::vector<Variable const *> vs;
        for (size_t i=0; i<parts.size(); ++i) {
            if (!parts[i]->has_var(vname)) (*scmgrid_error)(-1,
                "Cannot concatenate along %s: variable %s missing from part %ld",
                dim.c_str(), vname.c_str(), (long)i);
            vs.push_back(&parts[i]->var(vname));
        }

        // Find the axis along which to concatenate
        Variable const *with_dim = nullptr;
        for (Variable const *v : vs) {
            if (v->axis(dim) >= 0) {
                with_dim = v;
                break;
            }
        }

        Variable const &v0(*vs[0]);
        if (!with_dim && vname != dim && v0.is_coord) {
            bool same = true;
            for (Variable const *v : vs) same = same && equal_values(v0, *v);
            if (same) {
                ret.add_var(vname, Variable(v0));
                continue;
            }
        }

        Variable nv;
        nv.nctype = v0.nctype;
        nv.is_coord = v0.is_coord;
        nv.atts = v0.atts;
        int ax;
        if (with_dim) {
            nv.dims = with_dim->dims;
            ax = with_dim->axis(dim);
        } else {
            nv.dims.push_back(dim);
            nv.dims.insert(nv.dims.end(), v0.dims.begin(), v0.dims.end());
            ax = 0;
        }
        std::vector<std::string> dims_without(nv.dims);
        dims_without.erase(dims_without.begin() + ax);

        std::vector<long> const nshape(ret.shape(nv));
        long const outer = product(nshape, 0, ax);
        long const inner = product(nshape, ax+1, nshape.size());

        for (size_t i=0; i<vs.size(); ++i) {
            bool const has = (vs[i]->axis(dim) >= 0);
            if ((has && vs[i]->dims != nv.dims) || (!has && vs[i]->dims != dims_without))
                (*scmgrid_error)(-1,
                    "Cannot concatenate variable %s along %s: dimensions differ in part %ld",
                    vname.c_str(), dim.c_str(), (long)i);
            if (nv.nctype != vs[i]->nctype) nv.nctype = NC_DOUBLE;
        }

        nv.data.reserve(outer * total * inner);
        for (long o=0; o<outer; ++o) {
            for (size_t i=0; i<vs.size(); ++i) {
                Variable const &v(*vs[i]);
                if (v.axis(dim) >= 0) {
                    auto const b(v.data.begin() + o*lens[i]*inner);
                    nv.data.insert(nv.data.end(), b, b + lens[i]*inner);
                } else {
                    // Broadcast along dim
                    auto const b(v.data.begin() + o*inner);
                    for (long k=0; k<lens[i]; ++k)
                        nv.data.insert(nv.data.end(), b, b + inner);
                }
            }
        }
        ret.add_var(vname, std::move(nv));
    }
    return ret;
}

}   // namespace scmgrid
