#define BOOST_TEST_MODULE aperture_table tests
#include <boost/test/included/unit_test.hpp>

#include <string>
#include <vector>
#include "aperture.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(aperture_table_tests)

BOOST_AUTO_TEST_CASE(circle) {
  ApertureTable table;
  BOOST_CHECK(table.define("D10", "C", "0.000070"));
  const auto aperture = table.find("D10");
  BOOST_REQUIRE(aperture);
  BOOST_CHECK(aperture->defined());
  BOOST_CHECK_EQUAL(aperture->kind(), ApertureKind::CIRCLE);
  BOOST_CHECK_EQUAL(aperture->modifiers, "0.000070");
  BOOST_REQUIRE(aperture->diameter);
  BOOST_CHECK_CLOSE(*aperture->diameter, 0.00007, 1e-9);
  BOOST_CHECK(!aperture->blank());
}

BOOST_AUTO_TEST_CASE(circle_with_hole) {
  ApertureTable table;
  BOOST_CHECK(table.define("D11", "C", "0.0100X0.005"));
  BOOST_CHECK_CLOSE(*table.find("D11")->diameter, 0.01, 1e-9);
}

BOOST_AUTO_TEST_CASE(circle_without_diameter) {
  ApertureTable table;
  BOOST_CHECK(!table.define("D12", "C", "X0.5"));
  // Stored anyway.
  BOOST_REQUIRE(table.contains("D12"));
  BOOST_CHECK(!table.find("D12")->diameter);
  BOOST_CHECK(table.find("D12")->blank());

  BOOST_CHECK(table.define("D13", "C", "0"));
  BOOST_CHECK(table.find("D13")->blank());
}

BOOST_AUTO_TEST_CASE(other_kinds) {
  ApertureTable table;
  BOOST_CHECK(table.define("D10", "R", "0.05X0.02"));
  BOOST_CHECK(table.define("D11", "O", "0.05X0.02"));
  BOOST_CHECK(table.define("D12", "P", "0.1X6"));
  BOOST_CHECK(table.define("D13", "OC8", "0.5"));
  BOOST_CHECK(table.define("D14", "$THERMAL_1", ""));
  BOOST_CHECK_EQUAL(table.find("D10")->kind(), ApertureKind::RECTANGLE);
  BOOST_CHECK_EQUAL(table.find("D11")->kind(), ApertureKind::OBROUND);
  BOOST_CHECK_EQUAL(table.find("D12")->kind(), ApertureKind::POLYGON);
  BOOST_CHECK_EQUAL(table.find("D13")->kind(), ApertureKind::MACRO);
  BOOST_CHECK_EQUAL(table.find("D14")->kind(), ApertureKind::MACRO);
  // Only circles have a diameter.
  BOOST_CHECK(table.find("D10")->blank());
  BOOST_CHECK_EQUAL(table.all().size(), 5UL);
}

BOOST_AUTO_TEST_CASE(redefine) {
  ApertureTable table;
  table.define("D10", "C", "0.1");
  table.define("D10", "C", "0.2");
  BOOST_CHECK_EQUAL(table.all().size(), 1UL);
  BOOST_CHECK_CLOSE(*table.find("D10")->diameter, 0.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(invalid_definitions) {
  ApertureTable table;
  BOOST_CHECK_THROW(table.define("D9", "C", "0.1"), gerber_exception);
  BOOST_CHECK_THROW(table.define("D03", "C", "0.1"), gerber_exception);
  BOOST_CHECK_THROW(table.define("X10", "C", "0.1"), gerber_exception);
  BOOST_CHECK_THROW(table.define("D10", "9C", "0.1"), gerber_exception);
  BOOST_CHECK_THROW(table.define("D10", "", "0.1"), gerber_exception);
  try {
    table.define("D1", "C", "0.1");
  } catch (const gerber_exception& e) {
    BOOST_CHECK_EQUAL(e.code(), ERR_APERTURE);
  }
  BOOST_CHECK(table.all().empty());
}

BOOST_AUTO_TEST_CASE(lookup) {
  ApertureTable table;
  table.define("D10", "C", "0.1");
  BOOST_CHECK(!table.find("D11"));
  BOOST_CHECK(!table.contains("D11"));
  BOOST_CHECK_THROW(table.find("D5"), gerber_exception);
  BOOST_CHECK_THROW(table.find("10"), gerber_exception);
  BOOST_CHECK(!Aperture().defined());
}

BOOST_AUTO_TEST_CASE(comment_primitives) {
  BOOST_CHECK(is_comment_primitive("0"));
  BOOST_CHECK(is_comment_primitive("0 Rounded rectangle"));
  BOOST_CHECK(is_comment_primitive(" 0 indented"));
  BOOST_CHECK(!is_comment_primitive("0.5,1"));
  BOOST_CHECK(!is_comment_primitive("01,1"));
  BOOST_CHECK(!is_comment_primitive("21,1,0.5,0.2,0,0,0"));
  BOOST_CHECK(!is_comment_primitive(""));
}

BOOST_AUTO_TEST_CASE(macros) {
  MacroTable table;
  table.define("OC8", {"0 octagon", "5,1,8,0,0,1.08239X$1,22.5", "", "  "});
  const auto primitives = table.find("OC8");
  BOOST_REQUIRE(primitives);
  BOOST_REQUIRE_EQUAL(primitives->size(), 1UL);
  BOOST_CHECK_EQUAL(primitives->front(), "5,1,8,0,0,1.08239X$1,22.5");

  BOOST_CHECK(!table.find("RECT"));
  BOOST_CHECK_THROW(table.define("1ABC", {"1,1,0.5,0,0"}), gerber_exception);
  BOOST_CHECK_THROW(table.define("", {}), gerber_exception);
  BOOST_CHECK_EQUAL(table.all().size(), 1UL);
}

BOOST_AUTO_TEST_SUITE_END()
