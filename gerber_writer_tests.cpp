#define BOOST_TEST_MODULE gerber_writer tests
#include <boost/test/included/unit_test.hpp>

#include <sstream>
#include <string>
#include <vector>
#include "gerber_parser.hpp"
#include "gerber_writer.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(gerber_writer_tests)

BOOST_AUTO_TEST_CASE(empty_document) {
  GerberDocument doc;
  GerberWriter writer;
  stringstream out;
  BOOST_CHECK(writer.write(out, doc));
  BOOST_CHECK_EQUAL(out.str(), "%FSLAX55Y55*%\n%MOIN*%\nM02*\n");
}

BOOST_AUTO_TEST_CASE(parsed_document) {
  const vector<string> lines = {
    "%FSLAX25Y25*%",
    "%MOMM*%",
    "%AMOC8*",
    "5,1,8,0,0,1.08239X$1,22.5*%",
    "%ADD10C,0.000070*%",
    "%ADD11OC8,0.5*%",
    "D10*",
    "%LPD*%",
    "G04 hand made*",
    "X123500Y001250D02*",
    "G01X1000Y1000D01*",
    "M02*",
  };
  GerberParser parser;
  const auto doc = parser.parse(lines);
  BOOST_REQUIRE_MESSAGE(doc, parser.error());

  GerberWriter writer;
  stringstream out;
  BOOST_CHECK(writer.write(out, *doc));
  BOOST_CHECK_EQUAL(out.str(),
                    "%FSLAX25Y25*%\n"
                    "%MOMM*%\n"
                    "%AMOC8*\n"
                    "5,1,8,0,0,1.08239X$1,22.5*%\n"
                    "%ADD10C,0.000070*%\n"
                    "%ADD11OC8,0.5*%\n"
                    "D10*\n"
                    "%LPD*%\n"
                    "G04 hand made*\n"
                    "X123500Y001250D02*\n"
                    "G01X1000Y1000D01*\n"
                    "M02*\n");

  // What was written reads back the same.
  vector<string> written;
  string line;
  while (getline(out, line)) {
    written.push_back(line);
  }
  const auto reread = parser.parse(written);
  BOOST_REQUIRE_MESSAGE(reread, parser.error());
  BOOST_CHECK_EQUAL(reread->function_count(), doc->function_count());
  BOOST_CHECK_EQUAL(reread->width(), doc->width());
}

BOOST_AUTO_TEST_CASE(appends_program_end) {
  GerberDocument doc;
  doc.append_param("LPC");
  doc.define_aperture("D10", "R", "");
  GerberWriter writer;
  stringstream out;
  BOOST_CHECK(writer.write(out, doc));
  BOOST_CHECK_EQUAL(out.str(), "%FSLAX55Y55*%\n%MOIN*%\n%ADD10R*%\n%LPC*%\nM02*\n");
}

BOOST_AUTO_TEST_CASE(unwritable_file) {
  GerberDocument doc;
  GerberWriter writer;
  BOOST_CHECK(!writer.write("/nonexistent_directory/out.gbr", doc));
  BOOST_CHECK(writer.error().find("Could not open") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
