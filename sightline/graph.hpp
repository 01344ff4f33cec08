/* graph.hpp

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

#ifndef SIGHTLINE_GRAPH_HPP
#define SIGHTLINE_GRAPH_HPP

/** \file graph.hpp
 * Movement graphs over grid cells for path finding.
 */

#include <vector>
#include "map.hpp"

namespace sightline {

/// The grid movement rules path finding runs on.
class Graph {
 public:
  virtual ~Graph() {}

  virtual Vec2i dimensions() const = 0;

  virtual bool is_walkable(int x, int y) const = 0;

  /// Cost of stepping from a to its neighbor b.
  virtual float cost(const Vec2i& a, const Vec2i& b) const = 0;

  /// Estimated cost from a to b. Must never overestimate the real cost for
  /// the found paths to be the shortest ones.
  virtual float heuristic(const Vec2i& a, const Vec2i& b) const = 0;

  /// The in-bounds walkable cells reachable from pos in one step.
  virtual std::vector<Vec2i> neighbors(const Vec2i& pos) const = 0;
};

/**
 * Orthogonal movement with unit step costs over a walkability map.
 *
 * Steps get a 0.001 extra cost and neighbors come in an order that both
 * alternate with the parity of x + y, which makes the search prefer
 * staircase-like paths over ones that run straight and then turn once. See
 * https://www.redblobgames.com/pathfinding/a-star/implementation.html#troubleshooting-ugly-path
 */
class Four_Way_Graph : public Graph {
 public:
  Four_Way_Graph(const Walk_Map& map) : map(map) {}

  virtual Vec2i dimensions() const { return map.dimensions(); }

  virtual bool is_walkable(int x, int y) const { return map.is_walkable(x, y); }

  virtual float cost(const Vec2i& a, const Vec2i& b) const;

  /// Manhattan distance.
  virtual float heuristic(const Vec2i& a, const Vec2i& b) const;

  virtual std::vector<Vec2i> neighbors(const Vec2i& pos) const;
 private:
  const Walk_Map& map;
};

}

#endif
