/* grid_map.hpp

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

#ifndef SIGHTLINE_GRID_MAP_HPP
#define SIGHTLINE_GRID_MAP_HPP

/** \file grid_map.hpp
 * Dense in-memory grid map and its text format.
 */

#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "map.hpp"
#include "path.hpp"

namespace sightline {

/**
 * Rectangular map storing transparency and walkability for every cell.
 *
 * Starts out fully transparent and walkable. Keeps the result of the last
 * compute_fov call around for lookups and rendering.
 */
class Grid_Map : public Map, public Walk_Map {
 public:
  Grid_Map(int width, int height);

  virtual Vec2i dimensions() const { return Vec2i(width, height); }
  virtual bool is_opaque(int x, int y) const { return !transparent[index(x, y)]; }
  virtual bool is_walkable(int x, int y) const { return walkable[index(x, y)]; }

  bool contains(const Vec2i& pos) const { return in_bounds(dimensions(), pos); }

  bool is_transparent(int x, int y) const { return transparent[index(x, y)]; }
  void set_transparent(int x, int y, bool is_transparent);
  void set_walkable(int x, int y, bool is_walkable);

  /// Make a cell both opaque and unwalkable.
  void set_wall(int x, int y);

  /// Put walls on the line from one point to another.
  void build_wall(const Vec2i& from, const Vec2i& to);

  /// Replace the stored vision with a fresh field of view.
  void compute_fov(const Vec2i& origin, int radius, bool include_walls = true);
  bool is_in_fov(int x, int y) const { return vision[index(x, y)]; }
  bool has_fov() const { return bool(last_origin_); }

  /// The origin of the last compute_fov, if there was one.
  const boost::optional<Vec2i>& last_origin() const { return last_origin_; }

  const boost::optional<Vec2i>& spawn_point() const { return spawn_point_; }
  void set_spawn_point(const Vec2i& pos);
 private:
  size_t index(int x, int y) const;

  int width;
  int height;
  std::vector<bool> transparent;
  std::vector<bool> walkable;
  std::vector<bool> vision;
  boost::optional<Vec2i> last_origin_;
  boost::optional<Vec2i> spawn_point_;
};

class Map_Format_Exception : public std::exception {
 public:
  Map_Format_Exception(const std::string& msg) : msg(msg) {}
  virtual ~Map_Format_Exception() throw() {}

  virtual const char* what() const throw() { return msg.c_str(); }
 private:
  std::string msg;
};

/**
 * Read a map from text.
 *
 * Each line is a row of cells. '#' is a wall, 'x' is floor with the map's
 * spawn point, anything else is floor. All rows must be the same length.
 * Trailing empty lines are ignored.
 *
 * Throws Map_Format_Exception on an empty map or rows of unequal length.
 */
Grid_Map parse_grid_map(std::istream& is);

/**
 * Draw the map as framed ASCII art.
 *
 * Without a computed field of view, walls are '#' and floor '.'. With one,
 * seen floor is ' ', seen walls '#' and unseen cells '?'. The field of view
 * origin is '*' and path cells are 'o'.
 */
void render_grid_map(std::ostream& out, const Grid_Map& map, const Path& path = Path());

std::ostream& operator<<(std::ostream& out, const Grid_Map& map);

}

#endif
