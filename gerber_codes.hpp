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

#ifndef GERBER_CODES_H
#define GERBER_CODES_H

#include <string>
#include <boost/optional.hpp>

namespace Operation {
enum Operation {
  DRAW = 1,   // D01, exposure on
  MOVE = 2,   // D02, exposure off
  FLASH = 3   // D03
};
}; // namespace Operation

// Is code one of the G and M codes that the document accepts?
bool is_valid_function_code(const std::string& code);

// The numeric part of a code with the given letter, "G02" -> 2.  Returns none
// if code isn't the letter followed only by digits.
boost::optional<unsigned long> code_number(const std::string& code, char letter);

// D01/D02/D03, optionally without the leading zero.
boost::optional<Operation::Operation> parse_operation(const std::string& op);

bool is_circular_function(const std::string& func);  // G02/G03 family
bool is_tool_select_function(const std::string& func);  // G54
bool is_comment_function(const std::string& func);  // G04

// User-defined aperture codes are D10 and up.
bool is_aperture_code(const std::string& code);

// An aperture code without leading zeros in its number, "D010" -> "D10".
// Returns none if code isn't an aperture code.
boost::optional<std::string> normalize_aperture_code(const std::string& code);

// A letter, '_' or '$' followed by letters, digits, '_' or '$'.
bool is_identifier(const std::string& token);

#endif // GERBER_CODES_H
