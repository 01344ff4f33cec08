/* num.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SIGHTLINE_NUM_HPP
#define SIGHTLINE_NUM_HPP

/** \file num.hpp
 * Random number generation for test and benchmark maps.
 */

namespace sightline {

/// Return a random integer from `[0, max]`.
int rand_int(int max);

/// Seed the default random number generator with the given value.
void seed_rand(int seed);

class Grid_Map;

/// Turn num_walls random cells into walls, never the one at keep_open.
void scatter_walls(Grid_Map& map, int num_walls, int keep_open_x, int keep_open_y);

}

#endif
