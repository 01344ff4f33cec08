/* map.hpp

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

#ifndef SIGHTLINE_MAP_HPP
#define SIGHTLINE_MAP_HPP

/** \file map.hpp
 * Read-only grid queries consumed by the field of view and the default path
 * graph.
 *
 * Both are borrowed for the duration of a single call. The caller must not
 * modify the map while a query runs.
 */

#include "vec.hpp"
#include "axis_box.hpp"

namespace sightline {

/// Opacity of the cells of a rectangular grid.
class Map {
 public:
  virtual ~Map() {}

  /// Width and height of the grid, both positive.
  virtual Vec2i dimensions() const = 0;

  /// Whether the cell blocks line of sight. Only called with in-bounds cells.
  virtual bool is_opaque(int x, int y) const = 0;
};

/// Walkability of the cells of a rectangular grid.
class Walk_Map {
 public:
  virtual ~Walk_Map() {}

  virtual Vec2i dimensions() const = 0;

  /// Only called with in-bounds cells.
  virtual bool is_walkable(int x, int y) const = 0;
};

/// Whether pos lies in the grid [0, dimensions).
inline bool in_bounds(const Vec2i& dimensions, const Vec2i& pos) {
  return ARecti(dimensions).contains(pos);
}

}

#endif
