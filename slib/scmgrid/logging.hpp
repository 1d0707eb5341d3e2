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

namespace scmgrid {

/** Log lines look like:
<pre>[2009-04-06 01:00:00] (RUN) INFO Run completed successfully for cell: y0000x0001.</pre>
Each call writes exactly one line, so lines from different
worker threads never interleave. */
void log_info(char const *logger, char const *format, ...)
    __attribute__ ((format (printf, 2, 3)));
void log_warning(char const *logger, char const *format, ...)
    __attribute__ ((format (printf, 2, 3)));
void log_error(char const *logger, char const *format, ...)
    __attribute__ ((format (printf, 2, 3)));

}
