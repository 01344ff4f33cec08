/* path.cpp

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

#include "path.hpp"
#include "core.hpp"
#include <algorithm>
#include <functional>
#include <limits>
#include <queue>

using namespace std;

namespace sightline {

namespace {

struct State {
  float priority;
  Vec2i pos;

  // Reversed so that std::priority_queue pops the lowest priority first.
  bool operator<(const State& rhs) const {
    return priority > rhs.priority;
  }
};

/// Flat per-cell storage indexed by x + y * width.
template<class T>
class Cell_Array {
public:
  Cell_Array(const Vec2i& dim, const T& init)
    : width(dim[0]), data(dim[0] * dim[1], init) {}

  int index(const Vec2i& pos) const { return pos[0] + pos[1] * width; }

  Vec2i pos(int index) const { return Vec2i(index % width, index / width); }

  T& operator[](const Vec2i& pos) { return data[index(pos)]; }
  const T& operator[](const Vec2i& pos) const { return data[index(pos)]; }
private:
  int width;
  vector<T> data;
};

}

/// Guess at the frontier size so the heap doesn't start out reallocating.
/// Never more than the number of cells in the graph.
static size_t rough_capacity(const Vec2i& dim, const Vec2i& a, const Vec2i& b) {
  size_t distance = chebyshev_length(a - b);
  return min(distance * distance, size_t(dim[0]) * size_t(dim[1]));
}

boost::optional<Path> astar_path(const Graph& graph, const Vec2i& from, const Vec2i& to) {
  auto dim = graph.dimensions();
  if (!in_bounds(dim, from))
    die("Path origin %s is outside the graph bounds <0, 0> to %s", from, dim);
  if (!in_bounds(dim, to))
    die("Path destination %s is outside the graph bounds <0, 0> to %s", to, dim);

  const float unreached = numeric_limits<float>::infinity();
  Cell_Array<float> cost_so_far(dim, unreached);
  Cell_Array<int> came_from(dim, -1);

  vector<State> storage;
  storage.reserve(rough_capacity(dim, from, to));
  priority_queue<State> frontier(less<State>(), std::move(storage));

  frontier.push(State{0.0f, from});
  cost_so_far[from] = 0.0f;

  while (!frontier.empty()) {
    auto current = frontier.top().pos;
    frontier.pop();

    if (current == to)
      break;

    for (auto& next : graph.neighbors(current)) {
      if (!in_bounds(dim, next))
        die("Graph neighbor %s of %s is outside the graph bounds <0, 0> to %s", next, current, dim);
      float new_cost = cost_so_far[current] + graph.cost(current, next);
      if (new_cost < cost_so_far[next]) {
        cost_so_far[next] = new_cost;
        came_from[next] = came_from.index(current);
        frontier.push(State{new_cost + graph.heuristic(next, to), next});
      }
    }
  }

  if (cost_so_far[to] == unreached)
    return boost::none;

  Path result;
  for (auto pos = to; pos != from; pos = came_from.pos(came_from[pos])) {
    ASSERT(came_from[pos] != -1);
    result.push_back(pos);
  }
  result.push_back(from);
  reverse(result.begin(), result.end());
  return result;
}

boost::optional<Path> astar_path_four_way(const Walk_Map& map, const Vec2i& from, const Vec2i& to) {
  return astar_path(Four_Way_Graph(map), from, to);
}

}
