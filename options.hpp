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

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <memory>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <boost/algorithm/string.hpp>
#include <boost/noncopyable.hpp>

#include <istream>
#include <iterator>
#include <string>

#include "gerber_document.hpp"
#include "gerber_error.hpp"

namespace OperationCodePolicy {
inline std::istream& operator>>(std::istream& in, OperationCodePolicy& policy)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "strict")) {
    policy = STRICT;
  } else if (boost::iequals(token, "reuse") ||
             boost::iequals(token, "reuse-last")) {
    policy = REUSE_LAST;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}
}; // namespace OperationCodePolicy

/******************************************************************************/
/*
 Options of gerberinfo, from the command line and from gerberinfo.conf.
 */
/******************************************************************************/
class options : private boost::noncopyable
{

public:
    static void parse(int argc, const char** argv);
    static void parse_files();
    static void check_parameters();
    static po::variables_map& get_vm()
    {
        return instance().vm;
    }
    ;
    static std::string help();

    static void maybe_throw(const std::string& what, ErrorCodes error_code);
private:
    options();
    po::variables_map vm;
    po::options_description cli_options;      //CLI options
    po::options_description cfg_options;      // all the non-CLI options
    static options& instance();
};

#endif // OPTIONS_HPP
