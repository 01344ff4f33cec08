/* fov.cpp

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

#include "fov.hpp"
#include "line.hpp"
#include "core.hpp"
#include <algorithm>

using namespace std;

namespace sightline {

namespace {

/// Visibility bookkeeping for one query, confined to the clipped window.
///
/// Positions are local to the window, (0, 0) being its min corner.
class Fov_Window {
 public:
  Fov_Window(const Map& map, const ARecti& box, const Vec2i& origin, int radius)
    : map(map)
    , box(box)
    , origin(origin - box.min())
    , radius_sq(radius * radius)
    , visible(box.volume(), false) {
    visible[index(this->origin)] = true;
  }

  int width() const { return box.dim()[0]; }
  int height() const { return box.dim()[1]; }
  const Vec2i& local_origin() const { return origin; }

  bool is_visible(const Vec2i& pos) const { return visible[index(pos)]; }

  bool is_opaque(const Vec2i& pos) const {
    return map.is_opaque(pos[0] + box.min()[0], pos[1] + box.min()[1]);
  }

  void cast_ray(const Vec2i& dest) {
    Line ray(origin, dest);
    auto i = ray.begin();
    // The origin is already visible.
    for (++i; i != ray.end(); ++i) {
      auto& pos = *i;
      // Zero radius_sq means no range limit.
      if ((pos - origin).abs_sq() <= radius_sq || radius_sq == 0)
        visible[index(pos)] = true;
      if (is_opaque(pos))
        return;
    }
  }

  /// Reveal the opaque cells in [lo, hi] that face a visible transparent
  /// cell one step back towards the origin, delta being that step.
  void post_process(const Vec2i& lo, const Vec2i& hi, const Vec2i& delta) {
    for (int x = lo[0]; x <= hi[0]; x++) {
      for (int y = lo[1]; y <= hi[1]; y++) {
        Vec2i pos(x, y);
        if (!is_opaque(pos) || is_visible(pos))
          continue;
        Vec2i along_x(x + delta[0], y);
        Vec2i along_y(x, y + delta[1]);
        if ((!is_opaque(along_x) && is_visible(along_x)) ||
            (!is_opaque(along_y) && is_visible(along_y)))
          visible[index(pos)] = true;
      }
    }
  }

  vector<Vec2i> collect(bool include_walls) const {
    vector<Vec2i> result;
    for (int y = 0; y < height(); y++) {
      for (int x = 0; x < width(); x++) {
        Vec2i pos(x, y);
        if (!is_visible(pos))
          continue;
        if (!include_walls && is_opaque(pos))
          continue;
        result.push_back(pos + box.min());
      }
    }
    return result;
  }
 private:
  size_t index(const Vec2i& pos) const {
    return pos[0] + pos[1] * width();
  }

  const Map& map;
  ARecti box;
  Vec2i origin;
  int radius_sq;
  vector<bool> visible;
};

}

vector<Vec2i> field_of_view(
    const Map& map,
    const Vec2i& origin,
    int radius,
    bool include_walls) {
  auto dim = map.dimensions();
  if (!in_bounds(dim, origin))
    die("Field of view origin %s is outside the map bounds <0, 0> to %s", origin, dim);

  if (radius < 1)
    return vector<Vec2i>{origin};

  // No cell of the map is further away than this, and it keeps the window
  // and squared distance arithmetic from overflowing.
  radius = min(radius, dim[0] + dim[1]);

  ARecti box = ARecti(origin - Vec2i(radius, radius), Vec2i(2 * radius + 1, 2 * radius + 1))
    .intersection(ARecti(dim));

  // No area to check.
  if (box.dim()[0] <= 1 || box.dim()[1] <= 1)
    return vector<Vec2i>();

  Fov_Window window(map, box, origin, radius);
  const int max_x = window.width() - 1;
  const int max_y = window.height() - 1;
  const Vec2i o = window.local_origin();

  for (int x = 0; x <= max_x; x++) {
    window.cast_ray(Vec2i(x, 0));
    window.cast_ray(Vec2i(x, max_y));
  }
  for (int y = 1; y < max_y; y++) {
    window.cast_ray(Vec2i(0, y));
    window.cast_ray(Vec2i(max_x, y));
  }

  // SE
  window.post_process(Vec2i(o[0] + 1, o[1] + 1), Vec2i(max_x, max_y), Vec2i(-1, -1));
  // SW
  window.post_process(Vec2i(0, o[1] + 1), Vec2i(o[0] - 1, max_y), Vec2i(1, -1));
  // NW
  window.post_process(Vec2i(0, 0), Vec2i(o[0] - 1, o[1] - 1), Vec2i(1, 1));
  // NE
  window.post_process(Vec2i(o[0] + 1, 0), Vec2i(max_x, o[1] - 1), Vec2i(-1, 1));

  return window.collect(include_walls);
}

vector<Vec2i> field_of_view(
    const Map& map,
    int x,
    int y,
    int radius,
    bool include_walls) {
  return field_of_view(map, Vec2i(x, y), radius, include_walls);
}

}
