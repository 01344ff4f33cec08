/* fov.hpp

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

#ifndef SIGHTLINE_FOV_HPP
#define SIGHTLINE_FOV_HPP

#include <vector>
#include "map.hpp"

namespace sightline {

/**
 * Compute the cells visible from origin within radius cells.
 *
 * Casts Bresenham rays from the origin to every cell on the border of the
 * square [origin - radius, origin + radius] clipped to the map. A ray marks
 * the cells it passes that lie within radius of the origin and stops at the
 * first opaque cell, which is marked too. A second pass then reveals opaque
 * cells the rays missed whose origin-facing side borders a visible
 * transparent cell, so wall faces seen at an angle don't come out ragged.
 *
 * A radius below 1 gives just the origin. When the clipped square is only
 * one cell wide or tall, the result is empty. When include_walls is false,
 * opaque cells are left out of the result.
 *
 * The origin must be inside the map, otherwise the program dies.
 *
 * The result has no duplicates and is in row-major order.
 *
 * See http://www.roguebasin.com/index.php?title=Comparative_study_of_field_of_view_algorithms_for_2D_grid_based_worlds
 */
std::vector<Vec2i> field_of_view(
    const Map& map,
    const Vec2i& origin,
    int radius,
    bool include_walls);

std::vector<Vec2i> field_of_view(
    const Map& map,
    int x,
    int y,
    int radius,
    bool include_walls);

}

#endif
