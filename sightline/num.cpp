/* num.cpp

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

#include "num.hpp"
#include "grid_map.hpp"
#include <random>

using namespace std;

namespace sightline {

static mt19937 g_rng(42);

int rand_int(int max) {
  return uniform_int_distribution<int>(0, max)(g_rng);
}

void seed_rand(int seed) {
  g_rng.seed(seed);
}

void scatter_walls(Grid_Map& map, int num_walls, int keep_open_x, int keep_open_y) {
  auto dim = map.dimensions();
  for (int i = 0; i < num_walls; i++)
    map.set_wall(rand_int(dim[0] - 1), rand_int(dim[1] - 1));
  map.set_transparent(keep_open_x, keep_open_y, true);
  map.set_walkable(keep_open_x, keep_open_y, true);
}

}
