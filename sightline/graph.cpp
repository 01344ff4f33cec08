/* graph.cpp

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

#include "graph.hpp"
#include <array>

using namespace std;

namespace sightline {

static bool is_even(const Vec2i& pos) {
  return (pos[0] + pos[1]) % 2 == 0;
}

float Four_Way_Graph::cost(const Vec2i& a, const Vec2i& b) const {
  const float nudge = 0.001f;
  bool even = is_even(a);
  if ((even && b[0] != a[0]) || (!even && b[1] != a[1]))
    return 1.0f + nudge;
  return 1.0f;
}

float Four_Way_Graph::heuristic(const Vec2i& a, const Vec2i& b) const {
  return manhattan_length(a - b);
}

vector<Vec2i> Four_Way_Graph::neighbors(const Vec2i& pos) const {
  const int x = pos[0], y = pos[1];
  const array<Vec2i, 4> even_dirs{{Vec2i(x, y + 1), Vec2i(x, y - 1), Vec2i(x - 1, y), Vec2i(x + 1, y)}};
  const array<Vec2i, 4> odd_dirs{{Vec2i(x + 1, y), Vec2i(x - 1, y), Vec2i(x, y - 1), Vec2i(x, y + 1)}};
  auto dim = dimensions();

  vector<Vec2i> result;
  result.reserve(4);
  for (auto& next : is_even(pos) ? even_dirs : odd_dirs) {
    if (in_bounds(dim, next) && is_walkable(next[0], next[1]))
      result.push_back(next);
  }
  return result;
}

}
