/* query.cpp

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

#include "config.hpp"
#include <sightline.hpp>
#include <fstream>
#include <iostream>

using namespace std;
using namespace sightline;

static Grid_Map load_map(const string& path) {
  ifstream in(path.c_str());
  if (!in)
    die("Can't open map file '%s'", path);
  try {
    return parse_grid_map(in);
  } catch (Map_Format_Exception& e) {
    die("Bad map file '%s': %s", path, e.what());
    // Won't get here.
    throw;
  }
}

int main(int argc, char* argv[]) {
  parse_command_line(argc, argv);

  Grid_Map map = load_map(g_config.map_file);

  auto origin = g_config.from ? g_config.from : map.spawn_point();
  if ((g_config.fov || g_config.to) && !origin)
    die("No --from given and map '%s' has no spawn point", g_config.map_file);

  if (g_config.fov) {
    map.compute_fov(*origin, g_config.radius, g_config.walls);
    int count = 0;
    auto dim = map.dimensions();
    for (int y = 0; y < dim[1]; y++)
      for (int x = 0; x < dim[0]; x++)
        count += map.is_in_fov(x, y);
    log_print("%s cells visible from %s with radius %s\n", count, *origin, g_config.radius);
  }

  Path path;
  if (g_config.to) {
    auto found = astar_path_four_way(map, *origin, *g_config.to);
    if (found) {
      path = *found;
      log_print("Path from %s to %s takes %s steps\n", *origin, *g_config.to, path.size() - 1);
    } else {
      log_print("No path from %s to %s\n", *origin, *g_config.to);
    }
  }

  render_grid_map(cout, map, path);
  return 0;
}
