#include <sightline/grid_map.hpp>
#define BOOST_TEST_MODULE grid_map
#include <boost/test/unit_test.hpp>
#include <sstream>

using namespace sightline;
using namespace std;

static Grid_Map parse(const string& text) {
  istringstream in(text);
  return parse_grid_map(in);
}

static string render(const Grid_Map& map, const Path& path = Path()) {
  ostringstream out;
  render_grid_map(out, map, path);
  return out.str();
}

BOOST_AUTO_TEST_CASE( parse_map ) {
  auto map = parse("#.x\n...\n");
  BOOST_CHECK(map.dimensions() == Vec2i(3, 2));
  BOOST_CHECK(map.is_opaque(0, 0));
  BOOST_CHECK(!map.is_walkable(0, 0));
  BOOST_CHECK(!map.is_opaque(1, 0));
  BOOST_CHECK(map.is_walkable(2, 0));
  BOOST_CHECK(map.is_transparent(2, 1));
  BOOST_REQUIRE(map.spawn_point());
  BOOST_CHECK(*map.spawn_point() == Vec2i(2, 0));
  BOOST_CHECK(!map.has_fov());
}

BOOST_AUTO_TEST_CASE( parse_line_endings ) {
  auto map = parse("#.\r\n.x\r\n\r\n\n");
  BOOST_CHECK(map.dimensions() == Vec2i(2, 2));
  BOOST_CHECK(map.is_opaque(0, 0));
  BOOST_REQUIRE(map.spawn_point());
  BOOST_CHECK(*map.spawn_point() == Vec2i(1, 1));

  // No newline at the end of the last row.
  BOOST_CHECK(parse("...\n...").dimensions() == Vec2i(3, 2));
  BOOST_CHECK(!parse("...").spawn_point());
}

BOOST_AUTO_TEST_CASE( parse_errors ) {
  BOOST_CHECK_THROW(parse(""), Map_Format_Exception);
  BOOST_CHECK_THROW(parse("\n\n"), Map_Format_Exception);
  BOOST_CHECK_THROW(parse("..\n...\n"), Map_Format_Exception);
  BOOST_CHECK_THROW(parse("...\n\n...\n"), Map_Format_Exception);
}

BOOST_AUTO_TEST_CASE( build_wall ) {
  Grid_Map map(5, 5);
  map.build_wall(Vec2i(0, 0), Vec2i(4, 4));
  for (int i = 0; i < 5; i++) {
    BOOST_CHECK(map.is_opaque(i, i));
    BOOST_CHECK(!map.is_walkable(i, i));
  }
  BOOST_CHECK(map.is_walkable(1, 0));
  BOOST_CHECK(map.is_transparent(0, 1));

  map.set_walkable(2, 2, true);
  BOOST_CHECK(map.is_opaque(2, 2));
  BOOST_CHECK(map.is_walkable(2, 2));
}

BOOST_AUTO_TEST_CASE( render_plain_map ) {
  auto map = parse("#.x\n...\n");
  BOOST_CHECK_EQUAL(render(map), "+---+\n|#..|\n|...|\n+---+\n");

  ostringstream out;
  out << map;
  BOOST_CHECK_EQUAL(out.str(), render(map));

  // Opaque but walkable cells still draw as walls.
  map.set_transparent(1, 1, false);
  map.set_walkable(1, 1, true);
  BOOST_CHECK_EQUAL(render(map), "+---+\n|#..|\n|.#.|\n+---+\n");
}

BOOST_AUTO_TEST_CASE( render_path ) {
  auto map = parse("#.x\n...\n");
  Path path{Vec2i(0, 1), Vec2i(1, 1), Vec2i(2, 1), Vec2i(2, 0)};
  BOOST_CHECK_EQUAL(render(map, path), "+---+\n|#.o|\n|ooo|\n+---+\n");
}

BOOST_AUTO_TEST_CASE( render_fov ) {
  auto map = parse(
      "..#..\n"
      "..#..\n"
      "..#..\n");
  map.compute_fov(Vec2i(0, 1), 10);
  BOOST_CHECK(map.has_fov());
  BOOST_REQUIRE(map.last_origin());
  BOOST_CHECK(*map.last_origin() == Vec2i(0, 1));
  BOOST_CHECK_EQUAL(render(map),
      "+-----+\n"
      "|  #??|\n"
      "|* #??|\n"
      "|  #??|\n"
      "+-----+\n");

  // Walls can be left out of the field of view.
  map.compute_fov(Vec2i(0, 1), 10, false);
  BOOST_CHECK_EQUAL(render(map),
      "+-----+\n"
      "|  ???|\n"
      "|* ???|\n"
      "|  ???|\n"
      "+-----+\n");
}

BOOST_AUTO_TEST_CASE( recompute_fov ) {
  auto map = parse(
      "..#..\n"
      "..#..\n"
      "..#..\n");
  map.compute_fov(Vec2i(0, 1), 10);
  BOOST_CHECK(map.is_in_fov(0, 0));
  BOOST_CHECK(map.is_in_fov(2, 1));
  BOOST_CHECK(!map.is_in_fov(4, 0));

  map.compute_fov(Vec2i(4, 1), 10);
  BOOST_CHECK(*map.last_origin() == Vec2i(4, 1));
  BOOST_CHECK(!map.is_in_fov(0, 0));
  BOOST_CHECK(!map.is_in_fov(1, 2));
  BOOST_CHECK(map.is_in_fov(2, 1));
  BOOST_CHECK(map.is_in_fov(3, 0));
  BOOST_CHECK(map.is_in_fov(4, 2));

  // A zero radius only sees the origin.
  map.compute_fov(Vec2i(3, 2), 0);
  BOOST_CHECK(map.is_in_fov(3, 2));
  BOOST_CHECK(!map.is_in_fov(4, 1));
}
