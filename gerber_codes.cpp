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

#include <cctype>
#include <set>
using std::set;

#include <string>
using std::string;

#include <boost/lexical_cast.hpp>

#include "gerber_codes.hpp"

static const set<string> function_codes = {
  "G01", "G1",
  "G02", "G2",
  "G03", "G3",
  "G04", "G4",
  "G36", "G37",
  "G54", "G55",
  "G70", "G71",
  "G74", "G75",
  "G90", "G91",
  "M00", "M01", "M02"
};

bool is_valid_function_code(const string& code) {
  return function_codes.count(code) > 0;
}

boost::optional<unsigned long> code_number(const string& code, char letter) {
  if (code.size() < 2 || code[0] != letter) {
    return boost::none;
  }
  for (size_t i = 1; i < code.size(); i++) {
    if (!std::isdigit(static_cast<unsigned char>(code[i]))) {
      return boost::none;
    }
  }
  try {
    return boost::lexical_cast<unsigned long>(code.substr(1));
  } catch (const boost::bad_lexical_cast&) {
    return boost::none;
  }
}

boost::optional<Operation::Operation> parse_operation(const string& op) {
  if (op.size() < 2 || op.size() > 3) {
    return boost::none;
  }
  if (op.size() == 3 && op[1] != '0') {
    return boost::none;
  }
  const auto number = code_number(op, 'D');
  if (!number) {
    return boost::none;
  }
  switch (*number) {
    case 1:
      return Operation::DRAW;
    case 2:
      return Operation::MOVE;
    case 3:
      return Operation::FLASH;
    default:
      return boost::none;
  }
}

bool is_circular_function(const string& func) {
  const auto number = code_number(func, 'G');
  return number && (*number == 2 || *number == 3);
}

bool is_tool_select_function(const string& func) {
  const auto number = code_number(func, 'G');
  return number && *number == 54;
}

bool is_comment_function(const string& func) {
  const auto number = code_number(func, 'G');
  return number && *number == 4;
}

bool is_aperture_code(const string& code) {
  const auto number = code_number(code, 'D');
  return number && *number >= 10;
}

boost::optional<string> normalize_aperture_code(const string& code) {
  const auto number = code_number(code, 'D');
  if (!number || *number < 10) {
    return boost::none;
  }
  return "D" + boost::lexical_cast<string>(*number);
}

bool is_identifier(const string& token) {
  if (token.empty()) {
    return false;
  }
  for (size_t i = 0; i < token.size(); i++) {
    const unsigned char c = token[i];
    const bool allowed = std::isalpha(c) || c == '_' || c == '$' ||
        (i > 0 && std::isdigit(c));
    if (!allowed) {
      return false;
    }
  }
  return true;
}
