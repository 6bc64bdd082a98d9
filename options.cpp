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

#include "options.hpp"
#include "config.h"

#include <fstream>
#include <sstream>

#include <string>
using std::string;

#include <iostream>
using std::cerr;
using std::endl;

/******************************************************************************/
/*
 */
/******************************************************************************/
options& options::instance() {
    static options singleton;
    return singleton;
}

void options::maybe_throw(const std::string& what, ErrorCodes error_code) {
  if (instance().vm["ignore-warnings"].as<bool>()) {
    cerr << "Ignoring error code " << error_code << ": " << what << endl;
  } else {
    throw gerber_exception(what, error_code);
  }
}

/* parse options, both command line and from the gerberinfo.conf file if it
 * exists.  Throws on error.
 */
void options::parse(int argc, const char** argv) {
    // guessing causes problems when one option is the start of another
    // (--ignore-invalid, --ignore-warnings)
    int style = po::command_line_style::default_style
                & ~po::command_line_style::allow_guessing;

    po::options_description generic;
    generic.add(instance().cli_options).add(instance().cfg_options);

    try {
      po::store(po::parse_command_line(argc, argv, generic, style),
                instance().vm);
    } catch (std::logic_error& e) {
      throw gerber_exception(std::string("Error: You've supplied an invalid parameter.\n"
                                         "Details: ")
                             + e.what(), ERR_UNKNOWNPARAMETER);
    }

    po::notify(instance().vm);

    if( !instance().vm["noconfigfile"].as<bool>() )
        parse_files();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
string options::help()
{
    std::stringstream msg;
    msg << PACKAGE_STRING << "\n\n";
    msg << "usage: gerberinfo [options] --input file.gbr\n\n";
    msg << instance().cli_options << instance().cfg_options;
    return msg.str();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::parse_files()
{

    std::string file("gerberinfo.conf");

    try {
        std::ifstream stream(file.c_str());
        po::store(po::parse_config_file(stream, instance().cfg_options),
                  instance().vm);
    } catch (std::exception& e) {
      maybe_throw("Error parsing configuration file \"" + file + "\": " +
                  e.what(), ERR_INVALIDPARAMETER);
    }

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
options::options()
         : cli_options("command line only options"), cfg_options("generic options (CLI and config files)") {

   cli_options.add_options()
       ("noconfigfile", po::value<bool>()->default_value(false)->implicit_value(true), "ignore any configuration file")
       ("help,?", "produce help message")
       ("version,V", "show the current software version");
   cfg_options.add_options()
       ("ignore-warnings", po::value<bool>()->default_value(false)->implicit_value(true), "Ignore warnings")
       ("input", po::value<string>(), "RS-274X .gbr file to read")
       ("output", po::value<string>(), "write the parsed document back out as RS-274X to this file")
       ("ignore-invalid", po::value<bool>()->default_value(false)->implicit_value(true),
        "skip unknown function codes and parameters instead of failing")
       ("ignore-blank", po::value<bool>()->default_value(false)->implicit_value(true),
        "draws with apertures of no size don't count towards the bounding box")
       ("no-fold-offsets", po::value<bool>()->default_value(false)->implicit_value(true),
        "don't add I and J offsets to X and Y in linear mode")
       ("opcode-policy", po::value<OperationCodePolicy::OperationCodePolicy>()->default_value(OperationCodePolicy::STRICT),
        "which coordinates may leave out the D01/D02/D03 code: strict (arcs only) or reuse (any)")
       ("functions", po::value<bool>()->default_value(false)->implicit_value(true), "list every function of the document");
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::check_parameters()
{
  po::variables_map const& vm = instance().vm;

  if (!vm.count("input")) {
    maybe_throw("Error: No input file specified.", ERR_NOINPUT);
    return;
  }
  if (vm.count("output") &&
      vm["output"].as<string>() == vm["input"].as<string>()) {
    maybe_throw("Error: The output file can't be the input file.", ERR_INVALIDPARAMETER);
  }
}
