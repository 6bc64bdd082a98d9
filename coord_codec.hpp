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

#ifndef COORD_CODEC_H
#define COORD_CODEC_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "format_spec.hpp"

// Axis letter to decimal value.
typedef std::map<char, double> axis_values;

struct DecodedCoordinates {
  axis_values position;  // X and Y
  axis_values offset;    // I and J
};

// Given a coordinate token, provide methods to extract successive
// axis/value pairs from it.
class CoordinateLexer {
 public:
  CoordinateLexer(const std::string& s) : pos(0), input(s) {}
  // The next axis letter among axes, or '\0' if there is none.
  char get_axis(const std::string& axes);
  // An optionally signed run of digits.  Throws if there are no digits.
  std::string get_signed_digits();
  bool at_end() const {
    return pos == input.size();
  }
  std::string rest() const {
    return input.substr(pos);
  }
  size_t pos;
 private:
  std::string input;
};

// The axis/raw digit pairs of token in the order they appear.  Each of X, Y,
// I and J may appear once.  Throws gerber_exception on anything else.
std::vector<std::pair<char, std::string>> split_coordinates(const std::string& token);

// Restores the suppressed zeros of a raw signed digit run and scales it.
double decode_value(const std::string& digits, const FormatSpec& format);

/* Decodes a compact token such as "X123500Y-1250I50" into decimal values
 * under format.  Absent axes are absent from the result.
 */
DecodedCoordinates decode_coordinates(const std::string& token, const FormatSpec& format);

/* The digit string for value under format, with the zeros on the suppressed
 * side removed.  Throws gerber_exception with ERR_GEOMETRY when the value
 * needs more digits than the format has.
 */
std::string encode_coordinate(double value, const FormatSpec& format);

// Rewrites every axis of token from one format to another, keeping the order.
std::string reformat_coordinates(const std::string& token, const FormatSpec& from, const FormatSpec& to);

#endif // COORD_CODEC_H
