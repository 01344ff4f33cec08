/* grid_map.cpp

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

#include "grid_map.hpp"
#include "alg.hpp"
#include "core.hpp"
#include "fov.hpp"
#include "line.hpp"
#include <algorithm>

using namespace std;

namespace sightline {

Grid_Map::Grid_Map(int width, int height)
  : width(width)
  , height(height) {
  if (width <= 0 || height <= 0)
    die("Width and height should be > 0, got %s", Vec2i(width, height));
  transparent.assign(width * height, true);
  walkable.assign(width * height, true);
  vision.assign(width * height, false);
}

size_t Grid_Map::index(int x, int y) const {
  if (!contains(Vec2i(x, y)))
    die("Cell %s is outside the map bounds <0, 0> to %s", Vec2i(x, y), dimensions());
  return x + y * width;
}

void Grid_Map::set_transparent(int x, int y, bool is_transparent) {
  transparent[index(x, y)] = is_transparent;
}

void Grid_Map::set_walkable(int x, int y, bool is_walkable) {
  walkable[index(x, y)] = is_walkable;
}

void Grid_Map::set_wall(int x, int y) {
  set_transparent(x, y, false);
  set_walkable(x, y, false);
}

void Grid_Map::build_wall(const Vec2i& from, const Vec2i& to) {
  line(from, to, [&](const Vec2i& pos) { set_wall(pos[0], pos[1]); });
}

void Grid_Map::compute_fov(const Vec2i& origin, int radius, bool include_walls) {
  fill(vision.begin(), vision.end(), false);
  for (auto& pos : field_of_view(*this, origin, radius, include_walls))
    vision[index(pos[0], pos[1])] = true;
  last_origin_ = origin;
}

void Grid_Map::set_spawn_point(const Vec2i& pos) {
  ASSERT(contains(pos));
  spawn_point_ = pos;
}

Grid_Map parse_grid_map(istream& is) {
  vector<string> rows;
  string text;
  while (getline(is, text)) {
    if (!text.empty() && text[text.size() - 1] == '\r')
      text.erase(text.size() - 1);
    rows.push_back(text);
  }

  while (!rows.empty() && rows.back().empty())
    rows.pop_back();
  if (rows.empty())
    throw Map_Format_Exception("Map is empty");
  for (size_t y = 1; y < rows.size(); y++) {
    if (rows[y].size() != rows[0].size())
      throw Map_Format_Exception(format(
          "Line %s has %s cells, expected %s", y + 1, rows[y].size(), rows[0].size()));
  }

  Grid_Map result(rows[0].size(), rows.size());
  for (size_t y = 0; y < rows.size(); y++) {
    for (size_t x = 0; x < rows[y].size(); x++) {
      switch (rows[y][x]) {
        case '#':
          result.set_wall(x, y);
          break;
        case 'x':
          result.set_spawn_point(Vec2i(x, y));
          break;
      }
    }
  }
  return result;
}

void render_grid_map(ostream& out, const Grid_Map& map, const Path& path) {
  auto dim = map.dimensions();
  string border = "+" + string(dim[0], '-') + "+\n";

  out << border;
  for (int y = 0; y < dim[1]; y++) {
    out << '|';
    for (int x = 0; x < dim[0]; x++) {
      Vec2i pos(x, y);
      bool wall = map.is_opaque(x, y) || !map.is_walkable(x, y);
      char tile;
      if (map.last_origin() && *map.last_origin() == pos)
        tile = '*';
      else if (range_contains(path, pos))
        tile = 'o';
      else if (!map.has_fov())
        tile = wall ? '#' : '.';
      else if (map.is_in_fov(x, y))
        tile = wall ? '#' : ' ';
      else
        tile = '?';
      out << tile;
    }
    out << "|\n";
  }
  out << border;
}

ostream& operator<<(ostream& out, const Grid_Map& map) {
  render_grid_map(out, map);
  return out;
}

}
