/*
 * This file is part of gerberdoc.
 *
 * Copyright (C) 2026 The gerberdoc contributors
 *
 * gerberdoc is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * gerberdoc is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with gerberdoc.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <iostream>
#include <memory>

using std::cout;
using std::cerr;
using std::endl;
using std::flush;
using std::shared_ptr;

#include <string>
using std::string;

#include <boost/format.hpp>
using boost::format;

#include <boost/variant.hpp>
#include <boost/version.hpp>

#include "config.h"
#include "gerber_parser.hpp"
#include "gerber_writer.hpp"
#include "options.hpp"

class function_printer : public boost::static_visitor<string> {
 public:
  string operator()(const ApertureSelect& select) const {
    return "select aperture " + select.code;
  }
  string operator()(const ParamCall& param) const {
    return "parameter " + param.raw;
  }
  string operator()(const Command& command) const {
    string text = "command";
    if (command.function) {
      text += " " + *command.function;
    }
    if (command.coordinates) {
      text += " " + *command.coordinates;
    }
    if (command.operation) {
      text += " " + *command.operation;
    }
    if (command.comment) {
      text += " \"" + *command.comment + "\"";
    }
    if (command.xy_coords) {
      text += str(format(" -> (%1%, %2%)") % command.xy_coords->x() % command.xy_coords->y());
    }
    return text;
  }
};

static void print_summary(const GerberDocument& document) {
  cout << format("%-14s%s\n") % "Format:" % document.format();
  cout << format("%-14s%s\n") % "Units:" % document.mode();
  cout << format("%-14s%u\n") % "Apertures:" % document.apertures().all().size();
  cout << format("%-14s%u\n") % "Macros:" % document.macros().all().size();
  cout << format("%-14s%u\n") % "Functions:" % document.function_count();

  const BoundingBox& box = document.bounding_box();
  if (box.empty()) {
    cout << format("%-14s%s\n") % "Bounds:" % "empty";
  } else {
    cout << format("%-14s(%g, %g) - (%g, %g)\n") % "Bounds:"
        % *box.left_x() % *box.bottom_y() % *box.right_x() % *box.top_y();
  }
  cout << format("%-14s%g %s\n") % "Width:" % document.width() % document.mode();
  cout << format("%-14s%g %s\n") % "Height:" % document.height() % document.mode();
}

void do_gerberinfo(int argc, const char* argv[]) {
    options::parse(argc, argv);      //parse the command line parameters

    po::variables_map& vm = options::get_vm();      //get the cli parameters

    if (vm.count("version")) {       //return version and quit
      cout << PACKAGE_VERSION << endl;
      cout << "Boost: " << BOOST_VERSION << endl;
      return;
    }

    if (vm.count("help")) {       //return help and quit
      cout << options::help();
      return;
    }

    options::check_parameters();      //check the cli parameters
    if (!vm.count("input")) {
      return;
    }

    GerberParser parser;
    parser.ignore_invalid_codes = vm["ignore-invalid"].as<bool>();
    parser.ignore_blank_apertures = vm["ignore-blank"].as<bool>();
    parser.fold_linear_offsets = !vm["no-fold-offsets"].as<bool>();
    parser.operation_code_policy = vm["opcode-policy"].as<OperationCodePolicy::OperationCodePolicy>();

    const string input = vm["input"].as<string>();
    cout << "Importing " << input << "... " << flush;
    const shared_ptr<GerberDocument> document = parser.parse_file(input);
    if (!document) {
      cout << "failed." << endl;
      throw gerber_exception(input + ": " + parser.error(), parser.error_code());
    }
    cout << "done." << endl << endl;

    print_summary(*document);

    if (vm["functions"].as<bool>()) {
      cout << endl;
      function_printer printer;
      for (size_t i = 0; i < document->function_count(); i++) {
        cout << format("%5u  %s\n") % i % boost::apply_visitor(printer, document->functions()[i]);
      }
    }

    if (vm.count("output")) {
      const string output = vm["output"].as<string>();
      cout << endl << "Writing " << output << "... " << flush;
      GerberWriter writer;
      if (!writer.write(output, *document)) {
        cout << "failed." << endl;
        throw gerber_exception(writer.error(), ERR_OUTPUTFILE);
      }
      cout << "done." << endl;
    }
}

int main(int argc, const char* argv[]) {
  try {
    do_gerberinfo(argc, argv);
  } catch (const gerber_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return 0;
}
