/* line.cpp

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

#include "line.hpp"
#include "core.hpp"

namespace sightline {

Octant Octant::from_points(const Vec2i& start, const Vec2i& end) {
  int dx = end[0] - start[0];
  int dy = end[1] - start[1];
  int index = 0;

  if (dy < 0) {
    dx = -dx;
    dy = -dy;
    index += 4;
  }

  if (dx < 0) {
    int tmp = dx;
    dx = dy;
    dy = -tmp;
    index += 2;
  }

  if (dx < dy)
    index += 1;

  return Octant(index);
}

Vec2i Octant::to_octant0(const Vec2i& p) const {
  switch (index_) {
    case 0: return Vec2i(p[0], p[1]);
    case 1: return Vec2i(p[1], p[0]);
    case 2: return Vec2i(p[1], -p[0]);
    case 3: return Vec2i(-p[0], p[1]);
    case 4: return Vec2i(-p[0], -p[1]);
    case 5: return Vec2i(-p[1], -p[0]);
    case 6: return Vec2i(-p[1], p[0]);
    case 7: return Vec2i(p[0], -p[1]);
  }
  die("Bad octant %s", index_);
  return p;
}

Vec2i Octant::from_octant0(const Vec2i& p) const {
  switch (index_) {
    case 0: return Vec2i(p[0], p[1]);
    case 1: return Vec2i(p[1], p[0]);
    case 2: return Vec2i(-p[1], p[0]);
    case 3: return Vec2i(-p[0], p[1]);
    case 4: return Vec2i(-p[0], -p[1]);
    case 5: return Vec2i(-p[1], -p[0]);
    case 6: return Vec2i(p[1], -p[0]);
    case 7: return Vec2i(p[0], -p[1]);
  }
  die("Bad octant %s", index_);
  return p;
}

Line_Iterator::Line_Iterator(const Vec2i& start, const Vec2i& end)
  : octant(Octant::from_points(start, end))
  , end_pt(end)
  , current(start) {
  auto p0 = octant.to_octant0(start);
  auto p1 = octant.to_octant0(end);
  x = p0[0];
  y = p0[1];
  dx = p1[0] - p0[0];
  dy = p1[1] - p0[1];
  diff = dy - dx;
  remaining = dx + 1;
}

Line_Iterator& Line_Iterator::operator++() {
  ASSERT(remaining > 0);
  if (--remaining == 0)
    return *this;

  if (diff >= 0) {
    y += 1;
    diff -= dx;
  }
  diff += dy;
  x += 1;

  // Land exactly on the end point regardless of accumulated error.
  current = remaining == 1 ? end_pt : octant.from_octant0(Vec2i(x, y));
  return *this;
}

void line(
    const Vec2i& p0,
    const Vec2i& p1,
    std::function<void(const Vec2i&)> fn) {
  for (auto& p : Line(p0, p1))
    fn(p);
}

std::vector<Vec2i> line_points(const Vec2i& p0, const Vec2i& p1) {
  Line points(p0, p1);
  std::vector<Vec2i> result;
  result.reserve(points.size());
  result.insert(result.end(), points.begin(), points.end());
  return result;
}

}
