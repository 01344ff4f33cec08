#include <sightline/vec.hpp>
#include <sightline/axis_box.hpp>
#include <sightline/format.hpp>
#define BOOST_TEST_MODULE vec
#include <boost/test/unit_test.hpp>

using namespace sightline;

BOOST_AUTO_TEST_CASE( vec1 ) {
  BOOST_CHECK((Vec2i{1, 2}) == (Vec2i{1, 2}));
  BOOST_CHECK(Vec2i(1, 2) != Vec2i(2, 1));

  BOOST_CHECK(Vec2i(3, 4) + Vec2i(1, -2) == Vec2i(4, 2));
  BOOST_CHECK(Vec2i(3, 4) - Vec2i(1, -2) == Vec2i(2, 6));
  BOOST_CHECK(-Vec2i(3, -4) == Vec2i(-3, 4));
  BOOST_CHECK(2 * Vec2i(3, 4) == Vec2i(6, 8));

  // Lexicographic ordering.
  BOOST_CHECK(Vec2i(1, 9) < Vec2i(2, 0));
  BOOST_CHECK(Vec2i(1, 0) < Vec2i(1, 1));
  BOOST_CHECK(!(Vec2i(1, 1) < Vec2i(1, 1)));

  BOOST_CHECK_EQUAL(Vec2i(3, -4).abs_sq(), 25);
  BOOST_CHECK_EQUAL(manhattan_length(Vec2i(3, -4)), 7);
  BOOST_CHECK_EQUAL(chebyshev_length(Vec2i(3, -4)), 4);

  BOOST_CHECK(elem_min(Vec2i(1, 5), Vec2i(3, 2)) == Vec2i(1, 2));
  BOOST_CHECK(elem_max(Vec2i(1, 5), Vec2i(3, 2)) == Vec2i(3, 5));
}

BOOST_AUTO_TEST_CASE( axis_box ) {
  ARecti box(Vec2i(10, 20));
  BOOST_CHECK(box.contains(Vec2i(0, 0)));
  BOOST_CHECK(box.contains(Vec2i(9, 19)));
  BOOST_CHECK(!box.contains(Vec2i(10, 19)));
  BOOST_CHECK(!box.contains(Vec2i(-1, 0)));
  BOOST_CHECK_EQUAL(box.volume(), 200);

  auto clipped = ARecti(Vec2i(-3, 15), Vec2i(7, 7)).intersection(box);
  BOOST_CHECK(clipped.min() == Vec2i(0, 15));
  BOOST_CHECK(clipped.max() == Vec2i(4, 20));
  BOOST_CHECK(clipped.dim() == Vec2i(4, 5));

  auto disjoint = ARecti(Vec2i(30, 30), Vec2i(2, 2)).intersection(box);
  BOOST_CHECK_EQUAL(disjoint.volume(), 0);
}

BOOST_AUTO_TEST_CASE( format_strings ) {
  BOOST_CHECK_EQUAL(format("plain"), "plain");
  BOOST_CHECK_EQUAL(format("100%%"), "100%");
  BOOST_CHECK_EQUAL(format("%s and %s", 1, "two"), "1 and two");
  BOOST_CHECK_EQUAL(format("at %s: 50%%", Vec2i(3, 4)), "at <3, 4>: 50%");
}
