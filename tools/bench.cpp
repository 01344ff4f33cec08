/* bench.cpp

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

#include <sightline.hpp>
#include <sightline/debug.hpp>
#include <boost/program_options.hpp>
#include <iostream>

using namespace std;
using namespace sightline;
using namespace boost::program_options;

const int fov_map_size = 45;
const Vec2i fov_origin(22, 22);
const int random_walls = 10;

static int g_iterations;
static int g_seed;

static void parse_bench_options(int argc, char* argv[]) {
  try {
    options_description desc("Options");
    desc.add_options()
        ("help", "Show this message")
        ("iterations", value<int>(&g_iterations)->default_value(1000), "Runs per workload")
        ("seed", value<int>(&g_seed)->default_value(42), "Random wall placement seed")
        ;
    variables_map vm;
    store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help")) {
      cout << desc << "\n";
      exit(0);
    }
    notify(vm);
  } catch (exception& e) {
    die(e.what());
  }
}

static void bench_fov(const char* label, const Grid_Map& map, int radius) {
  size_t cells = 0;
  {
    Print_Time timer(label, g_iterations);
    for (int i = 0; i < g_iterations; i++)
      cells += field_of_view(map, fov_origin, radius, true).size();
  }
  log_print("  %s cells per run\n", cells / g_iterations);
}

static void bench_astar(const char* label, const Grid_Map& map, const Vec2i& from, const Vec2i& to) {
  size_t steps = 0;
  {
    Print_Time timer(label, g_iterations);
    for (int i = 0; i < g_iterations; i++) {
      auto path = astar_path_four_way(map, from, to);
      if (path)
        steps += path->size();
    }
  }
  log_print("  %s cells per path\n", steps / g_iterations);
}

int main(int argc, char* argv[]) {
  parse_bench_options(argc, argv);
  if (g_iterations <= 0)
    die("--iterations must be positive, got %s", g_iterations);
  if (SDL_Init(SDL_INIT_TIMER) < 0)
    die("SDL_Init failed: %s", SDL_GetError());
  seed_rand(g_seed);

  Grid_Map open_map(fov_map_size, fov_map_size);
  Grid_Map walled_map(fov_map_size, fov_map_size);
  scatter_walls(walled_map, random_walls, fov_origin[0], fov_origin[1]);

  bench_fov("fov radius 12", open_map, 12);
  bench_fov("fov radius 24", open_map, 24);
  bench_fov("fov radius 12 with walls", walled_map, 12);
  bench_fov("fov radius 24 with walls", walled_map, 24);

  Grid_Map maze(20, 20);
  maze.build_wall(Vec2i(0, 3), Vec2i(3, 3));
  maze.build_wall(Vec2i(3, 3), Vec2i(3, 10));
  bench_astar("astar around a wall", maze, Vec2i(1, 4), Vec2i(10, 4));

  SDL_Quit();
  return 0;
}
