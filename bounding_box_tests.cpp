#define BOOST_TEST_MODULE bounding_box tests
#include <boost/test/included/unit_test.hpp>

#include <cmath>
#include "bounding_box.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(bounding_box_tests)

void check_box(const BoundingBox& box, double lx, double by, double rx, double ty) {
  BOOST_REQUIRE(!box.empty());
  BOOST_CHECK_SMALL(*box.left_x() - lx, 1e-9);
  BOOST_CHECK_SMALL(*box.bottom_y() - by, 1e-9);
  BOOST_CHECK_SMALL(*box.right_x() - rx, 1e-9);
  BOOST_CHECK_SMALL(*box.top_y() - ty, 1e-9);
}

BOOST_AUTO_TEST_CASE(empty) {
  BoundingBox box;
  BOOST_CHECK(box.empty());
  BOOST_CHECK(!box.left_x());
  BOOST_CHECK(!box.top_y());
  BOOST_CHECK_EQUAL(box.width(), 0);
  BOOST_CHECK_EQUAL(box.height(), 0);
}

BOOST_AUTO_TEST_CASE(grows) {
  BoundingBox box;
  box.extend(point_type_fp(1, 2));
  check_box(box, 1, 2, 1, 2);
  BOOST_CHECK_EQUAL(box.width(), 0);

  box.extend(point_type_fp(-3, 5));
  check_box(box, -3, 2, 1, 5);
  BOOST_CHECK_EQUAL(box.width(), 4);
  BOOST_CHECK_EQUAL(box.height(), 3);

  // Never shrinks.
  box.extend(point_type_fp(0, 3));
  check_box(box, -3, 2, 1, 5);
}

BOOST_AUTO_TEST_CASE(full_circle) {
  BoundingBox box;
  box.extend(arc_bounding_points(point_type_fp(1, 0), point_type_fp(1, 0),
                                 point_type_fp(-1, 0), ArcDirection::COUNTERCLOCKWISE));
  check_box(box, -1, -1, 1, 1);

  BoundingBox offset_box;
  offset_box.extend(arc_bounding_points(point_type_fp(5, 5), point_type_fp(5, 5),
                                        point_type_fp(0, 2), ArcDirection::CLOCKWISE));
  check_box(offset_box, 3, 5, 7, 9);
}

BOOST_AUTO_TEST_CASE(full_circle_points) {
  const multi_point_type_fp points = arc_bounding_points(
      point_type_fp(0, 1), point_type_fp(0, 1), point_type_fp(0, -1), ArcDirection::CLOCKWISE);
  // The start and the four extremes.
  BOOST_CHECK_EQUAL(points.size(), 5UL);
}

BOOST_AUTO_TEST_CASE(quarter_counterclockwise) {
  BoundingBox box;
  box.extend(arc_bounding_points(point_type_fp(1, 0), point_type_fp(0, 1),
                                 point_type_fp(-1, 0), ArcDirection::COUNTERCLOCKWISE));
  check_box(box, 0, 0, 1, 1);
}

BOOST_AUTO_TEST_CASE(three_quarters_clockwise) {
  BoundingBox box;
  box.extend(arc_bounding_points(point_type_fp(1, 0), point_type_fp(0, 1),
                                 point_type_fp(-1, 0), ArcDirection::CLOCKWISE));
  check_box(box, -1, -1, 1, 1);
}

BOOST_AUTO_TEST_CASE(half_circle) {
  // From the top to the bottom through the left side.
  BoundingBox ccw;
  ccw.extend(arc_bounding_points(point_type_fp(0, 2), point_type_fp(0, -2),
                                 point_type_fp(0, -2), ArcDirection::COUNTERCLOCKWISE));
  check_box(ccw, -2, -2, 0, 2);

  // The same ends through the right side.
  BoundingBox cw;
  cw.extend(arc_bounding_points(point_type_fp(0, 2), point_type_fp(0, -2),
                                point_type_fp(0, -2), ArcDirection::CLOCKWISE));
  check_box(cw, 0, -2, 2, 2);
}

BOOST_AUTO_TEST_CASE(small_arc_inside_quadrant) {
  const double s = std::sqrt(0.5);
  BoundingBox box;
  box.extend(arc_bounding_points(point_type_fp(s, s), point_type_fp(-s, s),
                                 point_type_fp(-s, -s), ArcDirection::COUNTERCLOCKWISE));
  // Crosses the top of the circle only.
  check_box(box, -s, s, s, 1);
}

BOOST_AUTO_TEST_CASE(zero_radius) {
  const multi_point_type_fp points = arc_bounding_points(
      point_type_fp(1, 1), point_type_fp(1, 1), point_type_fp(0, 0), ArcDirection::CLOCKWISE);
  BOOST_CHECK_EQUAL(points.size(), 2UL);
}

BOOST_AUTO_TEST_SUITE_END()
