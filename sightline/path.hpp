/* path.hpp

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

#ifndef SIGHTLINE_PATH_HPP
#define SIGHTLINE_PATH_HPP

/** \file path.hpp
 * A* path finding.
 */

#include <vector>
#include <boost/optional.hpp>
#include "graph.hpp"

namespace sightline {

/// Cells to walk through, origin and destination included.
typedef std::vector<Vec2i> Path;

/**
 * Find the cheapest path from one cell to another with A*.
 *
 * Returns boost::none when to can't be reached from from. A path from a
 * cell to itself is just that cell. Otherwise the path starts with from, ends
 * with to, and each step goes to one of the graph's neighbors of the
 * previous cell.
 *
 * Both ends and every neighbor the graph lists must be inside the graph,
 * otherwise the program dies.
 *
 * Based on
 * https://www.redblobgames.com/pathfinding/a-star/implementation.html
 */
boost::optional<Path> astar_path(const Graph& graph, const Vec2i& from, const Vec2i& to);

/// A* over the orthogonal moves of a walkability map, see Four_Way_Graph.
boost::optional<Path> astar_path_four_way(const Walk_Map& map, const Vec2i& from, const Vec2i& to);

}

#endif
