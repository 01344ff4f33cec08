#include <sightline/fov.hpp>
#include <sightline/grid_map.hpp>
#include <sightline/num.hpp>
#include <sightline/alg.hpp>
#define BOOST_TEST_MODULE fov
#include <boost/test/unit_test.hpp>
#include <climits>
#include <cstdio>
#include <deque>
#include <functional>
#include <set>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

using namespace sightline;
using namespace std;

/// Run fn in a child process and return whether it exited with status 1, the
/// way die() ends the program.
static bool exits_with_failure(const function<void()>& fn) {
  fflush(stdout);
  fflush(stderr);
  pid_t pid = fork();
  if (pid == 0) {
    if (!freopen("/dev/null", "w", stderr))
      _exit(2);
    fn();
    _exit(0);
  }
  int status = 0;
  if (pid < 0 || waitpid(pid, &status, 0) != pid)
    return false;
  return WIFEXITED(status) && WEXITSTATUS(status) == 1;
}

static bool is_king_connected(const vector<Vec2i>& cells, const Vec2i& start) {
  set<Vec2i> unvisited(cells.begin(), cells.end());
  if (!unvisited.erase(start))
    return false;
  deque<Vec2i> edge{start};
  while (!edge.empty()) {
    auto pos = edge.front();
    edge.pop_front();
    for (int dy = -1; dy <= 1; dy++) {
      for (int dx = -1; dx <= 1; dx++) {
        auto next = pos + Vec2i(dx, dy);
        if (unvisited.erase(next))
          edge.push_back(next);
      }
    }
  }
  return unvisited.empty();
}

static Grid_Map random_map(int width, int height, int walls, int seed) {
  seed_rand(seed);
  Grid_Map map(width, height);
  scatter_walls(map, walls, width / 2, height / 2);
  return map;
}

BOOST_AUTO_TEST_CASE( zero_radius_sees_only_origin ) {
  Grid_Map map(10, 10);
  for (int radius : {0, -1, -20}) {
    auto fov = field_of_view(map, 4, 7, radius, true);
    BOOST_REQUIRE_EQUAL(fov.size(), 1u);
    BOOST_CHECK(fov[0] == Vec2i(4, 7));
  }
}

BOOST_AUTO_TEST_CASE( degenerate_window_is_empty ) {
  Grid_Map column(1, 10);
  BOOST_CHECK(field_of_view(column, 0, 5, 3, true).empty());

  Grid_Map row(10, 1);
  BOOST_CHECK(field_of_view(row, 5, 0, 3, true).empty());

  // Zero radius still gives the origin.
  BOOST_CHECK_EQUAL(field_of_view(row, 5, 0, 0, true).size(), 1u);
}

BOOST_AUTO_TEST_CASE( radius_clips_open_area ) {
  Grid_Map map(20, 20);
  const Vec2i origin(10, 10);
  auto fov = field_of_view(map, origin, 3, true);

  for (auto& pos : fov)
    BOOST_CHECK_LE((pos - origin).abs_sq(), 9);
  BOOST_CHECK(range_contains(fov, Vec2i(13, 10)));
  BOOST_CHECK(range_contains(fov, Vec2i(12, 12)));
  BOOST_CHECK(!range_contains(fov, Vec2i(13, 11)));
  BOOST_CHECK(!range_contains(fov, Vec2i(13, 13)));
}

BOOST_AUTO_TEST_CASE( rays_stop_at_walls ) {
  Grid_Map map(10, 3);
  map.set_wall(5, 1);
  auto fov = field_of_view(map, 2, 1, 9, true);

  BOOST_CHECK(range_contains(fov, Vec2i(4, 1)));
  BOOST_CHECK(range_contains(fov, Vec2i(5, 1)));
  for (int x = 6; x < 10; x++)
    BOOST_CHECK(!range_contains(fov, Vec2i(x, 1)));
}

BOOST_AUTO_TEST_CASE( wall_faces_are_revealed ) {
  Grid_Map map(10, 10);
  for (int x = 1; x < 10; x++)
    map.set_wall(x, 3);
  for (int y = 0; y < 10; y++)
    map.set_wall(9, y);

  auto fov = field_of_view(map, 3, 2, 10, true);

  // The whole face of the wall below the origin.
  for (int x = 1; x < 9; x++)
    BOOST_CHECK_MESSAGE(range_contains(fov, Vec2i(x, 3)), "wall " << Vec2i(x, 3) << " not seen");
  for (int x = 0; x < 10; x++)
    BOOST_CHECK(range_contains(fov, Vec2i(x, 2)));
  // Nothing behind it.
  for (int y = 4; y < 10; y++)
    for (int x = 3; x < 9; x++)
      BOOST_CHECK(!range_contains(fov, Vec2i(x, y)));

  auto floor = field_of_view(map, 3, 2, 10, false);
  BOOST_CHECK(!range_contains(floor, Vec2i(5, 3)));
  BOOST_CHECK(!range_contains(floor, Vec2i(9, 2)));
  BOOST_CHECK(range_contains(floor, Vec2i(8, 2)));
}

BOOST_AUTO_TEST_CASE( results_on_random_maps ) {
  for (int seed = 1; seed <= 20; seed++) {
    auto map = random_map(23, 17, 60, seed);
    const Vec2i origin(11, 8);
    for (int radius = 1; radius < 14; radius += 3) {
      auto fov = field_of_view(map, origin, radius, true);
      BOOST_CHECK(range_contains(fov, origin));

      set<Vec2i> unique(fov.begin(), fov.end());
      BOOST_CHECK_EQUAL(unique.size(), fov.size());

      for (auto& pos : fov) {
        BOOST_CHECK(map.contains(pos));
        // Cells past the radius only show up as revealed wall faces.
        BOOST_CHECK((pos - origin).abs_sq() <= radius * radius || map.is_opaque(pos[0], pos[1]));
      }

      auto floor = field_of_view(map, origin, radius, false);
      for (auto& pos : floor)
        BOOST_CHECK(!map.is_opaque(pos[0], pos[1]));
      // Dropping walls only filters, it never changes what is seen.
      size_t walls = 0;
      for (auto& pos : fov)
        walls += map.is_opaque(pos[0], pos[1]);
      BOOST_CHECK_EQUAL(floor.size() + walls, fov.size());
    }
  }
}

BOOST_AUTO_TEST_CASE( origin_at_map_edge ) {
  auto map = random_map(12, 12, 20, 7);
  map.set_transparent(0, 0, true);
  auto fov = field_of_view(map, 0, 0, 5, true);
  BOOST_CHECK(range_contains(fov, Vec2i(0, 0)));
  for (auto& pos : fov)
    BOOST_CHECK(map.contains(pos));
}

BOOST_AUTO_TEST_CASE( large_open_area ) {
  Grid_Map map(45, 45);
  const Vec2i origin(22, 22);
  auto fov = field_of_view(map, origin, 24, true);

  BOOST_CHECK(is_king_connected(fov, origin));
  for (int dy = -1; dy <= 1; dy++)
    for (int dx = -1; dx <= 1; dx++)
      BOOST_CHECK(range_contains(fov, origin + Vec2i(dx, dy)));
  // The corners are further away than the radius.
  BOOST_CHECK(!range_contains(fov, Vec2i(0, 0)));
  BOOST_CHECK(!range_contains(fov, Vec2i(44, 44)));
}

BOOST_AUTO_TEST_CASE( large_area_with_walls ) {
  auto map = random_map(45, 45, 10, 42);
  const Vec2i origin(22, 22);
  auto fov = field_of_view(map, origin, 24, true);
  BOOST_CHECK(is_king_connected(fov, origin));
}

BOOST_AUTO_TEST_CASE( huge_radius_sees_whole_map ) {
  Grid_Map map(20, 20);
  for (int radius : {30, 46341, 70000, INT_MAX}) {
    auto fov = field_of_view(map, Vec2i(10, 10), radius, true);
    BOOST_CHECK_EQUAL(fov.size(), 400u);
  }

  map.set_wall(12, 10);
  auto near = field_of_view(map, Vec2i(10, 10), 25, true);
  auto far = field_of_view(map, Vec2i(10, 10), INT_MAX, true);
  BOOST_CHECK_EQUAL_COLLECTIONS(near.begin(), near.end(), far.begin(), far.end());
  BOOST_CHECK(!range_contains(far, Vec2i(19, 10)));
}

BOOST_AUTO_TEST_CASE( origin_out_of_bounds_dies ) {
  Grid_Map map(8, 6);
  BOOST_CHECK(exits_with_failure([&] { field_of_view(map, Vec2i(8, 0), 3, true); }));
  BOOST_CHECK(exits_with_failure([&] { field_of_view(map, -1, 2, 3, true); }));
  BOOST_CHECK(exits_with_failure([&] { field_of_view(map, Vec2i(2, 6), 0, true); }));
  BOOST_CHECK(!exits_with_failure([&] { field_of_view(map, Vec2i(7, 5), 3, true); }));
}
