/* line.hpp

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

#ifndef SIGHTLINE_LINE_HPP
#define SIGHTLINE_LINE_HPP

/** \file line.hpp
 * Bresenham line rasterization.
 */

#include <cstddef>
#include <functional>
#include <iterator>
#include <vector>
#include "vec.hpp"

namespace sightline {

/**
 * One of the eight symmetric sectors a line direction can fall into.
 *
 * Octant 0 covers directions with dx >= dy >= 0. The other octants are
 * mapped into it by swapping and negating coordinates, so the stepping loop
 * only needs to handle the octant 0 case.
 */
class Octant {
 public:
  Octant(int index = 0) : index_(index) {}

  static Octant from_points(const Vec2i& start, const Vec2i& end);

  Vec2i to_octant0(const Vec2i& p) const;
  Vec2i from_octant0(const Vec2i& p) const;

  int index() const { return index_; }
 private:
  int index_;
};

/// Input iterator over the points of a Bresenham line.
class Line_Iterator {
 public:
  typedef std::input_iterator_tag iterator_category;
  typedef Vec2i value_type;
  typedef std::ptrdiff_t difference_type;
  typedef const Vec2i* pointer;
  typedef const Vec2i& reference;

  /// The past-the-end iterator.
  Line_Iterator() : x(0), y(0), dx(0), dy(0), diff(0), remaining(0) {}

  Line_Iterator(const Vec2i& start, const Vec2i& end);

  const Vec2i& operator*() const { return current; }
  const Vec2i* operator->() const { return &current; }

  Line_Iterator& operator++();

  Line_Iterator operator++(int) {
    Line_Iterator result(*this);
    ++(*this);
    return result;
  }

  bool operator==(const Line_Iterator& rhs) const { return remaining == rhs.remaining; }
  bool operator!=(const Line_Iterator& rhs) const { return !(*this == rhs); }

  /// Number of points left including the current one.
  int size() const { return remaining; }
 private:
  Octant octant;
  Vec2i end_pt;
  int x, y;
  int dx, dy;
  int diff;
  int remaining;
  Vec2i current;
};

/**
 * The integer points on the line from start to end, both included.
 *
 * Yields exactly max(|dx|, |dy|) + 1 points, starting with start and ending
 * with end. Works for any pair of points; bounds checking is up to the
 * caller.
 */
class Line {
 public:
  typedef Line_Iterator iterator;
  typedef Line_Iterator const_iterator;

  Line(const Vec2i& start, const Vec2i& end) : start_pt(start), end_pt(end) {}

  Line_Iterator begin() const { return Line_Iterator(start_pt, end_pt); }
  Line_Iterator end() const { return Line_Iterator(); }

  size_t size() const { return chebyshev_length(end_pt - start_pt) + 1; }
 private:
  Vec2i start_pt;
  Vec2i end_pt;
};

/// Call fn for each point on the line from p0 to p1.
void line(
    const Vec2i& p0,
    const Vec2i& p1,
    std::function<void(const Vec2i&)> fn);

std::vector<Vec2i> line_points(const Vec2i& p0, const Vec2i& p1);

}

#endif
