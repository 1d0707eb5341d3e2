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

#ifndef SCMGRID_ERROR_HPP
#define SCMGRID_ERROR_HPP

#include <everytrace.hpp>

/** @defgroup scmgrid scmgrid.hpp
@brief Basic stuff common to all scmgrid */
namespace scmgrid {

typedef everytrace::Exception Exception;

typedef void (*error_ptr) (int retcode, char const *format, ...);

/** Prints the message to stderr and throws scmgrid::Exception.
    User or other library can change if needed. */
extern error_ptr scmgrid_error;

}   // namespace
/** @} */

#endif // Guard
