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
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <scmgrid/error.hpp>
#include <scmgrid/TimeCoord.hpp>

using namespace boost::posix_time;
using namespace boost::gregorian;

namespace scmgrid {

static ptime const epoch(date(1970,1,1));

double epoch_seconds(ptime const &t)
{
    time_duration const dt(t - epoch);
    return (double)dt.ticks() / (double)time_duration::ticks_per_second();
}

std::string iso_timestamp(ptime const &t)
{
    date const d(t.date());
    time_duration const tod(t.time_of_day());
    return (boost::format("%04d-%02d-%02dT%02d:%02d:%02d")
        % (int)d.year() % (int)d.month() % (int)d.day()
        % tod.hours() % tod.minutes() % tod.seconds()).str();
}

std::string file_timestamp(ptime const &t)
{
    date const d(t.date());
    time_duration const tod(t.time_of_day());
    return (boost::format("%04d%02d%02d_%02d%02d%02d")
        % (int)d.year() % (int)d.month() % (int)d.day()
        % tod.hours() % tod.minutes() % tod.seconds()).str();
}

ptime parse_time(std::string const &_str)
{
    std::string str(boost::algorithm::trim_copy(_str));
    if (str.size() > 0 && str[str.size()-1] == 'Z') str.resize(str.size()-1);
    std::replace(str.begin(), str.end(), 'T', ' ');
    // A bare date means midnight
    if (str.find(' ') == std::string::npos) str += " 00:00:00";

    ptime ret;
    try {
        ret = time_from_string(str);
    } catch(std::exception const &exp) {
        (*scmgrid_error)(-1, "Invalid time \"%s\": %s", _str.c_str(), exp.what());
    }
    if (ret.is_special()) (*scmgrid_error)(-1, "Invalid time \"%s\"", _str.c_str());
    return ret;
}

std::vector<ptime> decode_cf_time(
    std::vector<double> const &values,
    std::string const &units)
{
    size_t const since = units.find(" since ");
    if (since == std::string::npos) (*scmgrid_error)(-1,
        "Time units must be of the form \"<unit> since <time>\": \"%s\"", units.c_str());

    std::string const unit(boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(units.substr(0, since))));
    double factor = 1.;
    if (unit == "seconds" || unit == "second" || unit == "s") factor = 1.;
    else if (unit == "minutes" || unit == "minute") factor = 60.;
    else if (unit == "hours" || unit == "hour" || unit == "h") factor = 3600.;
    else if (unit == "days" || unit == "day" || unit == "d") factor = 86400.;
    else (*scmgrid_error)(-1, "Unsupported time unit: \"%s\"", unit.c_str());

    ptime const base(parse_time(units.substr(since + 7)));

    std::vector<ptime> ret;
    ret.reserve(values.size());
    for (double val : values) {
        if (std::isnan(val)) (*scmgrid_error)(-1, "Missing value in time coordinate");
        ret.push_back(base + milliseconds((long)std::llround(val * factor * 1000.)));
    }
    return ret;
}

ModelTime to_model_time(
    std::vector<ptime> const &abs_times,
    ptime const &ref)
{
    int const n = abs_times.size();
    date const ref_date(ref.date());
    int const date_val = ref_date.year() * 10000 + ref_date.month() * 100 + ref_date.day();
    int const second_val = ref.time_of_day().total_seconds();

    ModelTime ret;
    ret.date.assign(n, date_val);
    ret.second.assign(n, second_val);
    ret.time.reserve(n);
    if (n == 0) return ret;

    // nearbyint() honors the default (ties to even) rounding mode
    double const t0 = std::nearbyint(epoch_seconds(abs_times[0]));
    for (auto const &t : abs_times)
        ret.time.push_back(std::nearbyint(epoch_seconds(t)) - t0);
    return ret;
}

void to_model_form(Dataset &ds, ptime const &ref)
{
    if (!ds.has_var("time")) (*scmgrid_error)(-1, "Dataset has no time coordinate");
    Variable const &time(ds.var("time"));
    if (time.rank() != 1 || time.dims[0] != "time") (*scmgrid_error)(-1,
        "The time coordinate must be one-dimensional along time");

    ModelTime mt(to_model_time(
        decode_cf_time(time.data, time.att("units")), ref));

    Variable vtime({"time"}, std::move(mt.time), NC_INT, true);
    vtime.atts["units"] = "seconds";
    vtime.atts["long_name"] = "Time";

    Variable vdate({"time"}, std::move(mt.date), NC_INT, true);
    vdate.atts["units"] = "yyyymmdd";
    vdate.atts["long_name"] = "Date";

    Variable vsecond({"time"}, std::move(mt.second), NC_INT, true);
    vsecond.atts["units"] = "seconds";
    vsecond.atts["long_name"] = "Second";

    ds.add_var("time", std::move(vtime));
    ds.add_var("date", std::move(vdate));
    ds.add_var("second", std::move(vsecond));
}

void rebase_time(Variable &time, ptime const &ref)
{
    std::string const units(time.att("units"));
    if (units.find(" since ") != std::string::npos) (*scmgrid_error)(-1,
        "Time is already absolute (units \"%s\"), it cannot be rebased", units.c_str());
    if (units != "" && units != "seconds" && units != "s") (*scmgrid_error)(-1,
        "Relative time must be in seconds, not \"%s\"", units.c_str());

    time.atts["units"] = "seconds since " + iso_timestamp(ref);
    time.atts["standard_name"] = "time";
    time.atts["calendar"] = "standard";
    time.atts["axis"] = "T";
    time.atts.erase("long_name");
}

Dataset select_time_window(Dataset const &ds, ptime const &ref, int nsteps)
{
    Variable const &time(ds.var("time"));
    std::vector<ptime> const times(decode_cf_time(time.data, time.att("units")));

    long begin = 0;
    while (begin < (long)times.size() && times[begin] < ref) ++begin;
    if (begin == (long)times.size()) (*scmgrid_error)(-1,
        "No forcing data at or after %s", iso_timestamp(ref).c_str());

    long count = times.size() - begin;
    if (nsteps > 0) {
        if (nsteps > count) (*scmgrid_error)(-1,
            "Requested %d forcing time steps, only %ld available from %s",
            nsteps, count, iso_timestamp(ref).c_str());
        count = nsteps;
    }
    return ds.isel_range("time", begin, count);
}

}
