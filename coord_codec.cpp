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
#include <cmath>
#include <string>
using std::string;

#include <vector>
using std::vector;

#include <utility>
using std::pair;
using std::make_pair;

#include <boost/lexical_cast.hpp>

#include "coord_codec.hpp"

char CoordinateLexer::get_axis(const string& axes) {
  if (pos < input.size() && axes.find(input[pos]) != string::npos) {
    return input[pos++];
  }
  return '\0';
}

string CoordinateLexer::get_signed_digits() {
  const size_t start = pos;
  if (pos < input.size() && (input[pos] == '+' || input[pos] == '-')) {
    pos++;
  }
  const size_t digits_start = pos;
  while (pos < input.size() && std::isdigit(static_cast<unsigned char>(input[pos]))) {
    pos++;
  }
  if (pos == digits_start) {
    throw gerber_exception("[coord] Missing digits in coordinate data: " + input, ERR_PARSE);
  }
  return input.substr(start, pos - start);
}

vector<pair<char, string>> split_coordinates(const string& token) {
  vector<pair<char, string>> values;
  CoordinateLexer lexer(token);
  while (!lexer.at_end()) {
    const char axis = lexer.get_axis("XYIJ");
    if (axis == '\0') {
      throw gerber_exception("[coord] Invalid coordinate data: " + lexer.rest(), ERR_PARSE);
    }
    for (const auto& value : values) {
      if (value.first == axis) {
        throw gerber_exception(string("[coord] Axis ") + axis + " given twice: " + token, ERR_PARSE);
      }
    }
    values.push_back(make_pair(axis, lexer.get_signed_digits()));
  }
  return values;
}

double decode_value(const string& raw, const FormatSpec& format) {
  string sign;
  string digits = raw;
  if (!digits.empty() && (digits[0] == '+' || digits[0] == '-')) {
    sign = digits.substr(0, 1);
    digits.erase(0, 1);
  }

  const size_t length = format.field_length();
  if (digits.size() < length) {
    if (format.zero_suppression == ZeroSuppression::LEADING) {
      digits.insert(0, length - digits.size(), '0');
    } else {
      digits.append(length - digits.size(), '0');
    }
  }

  double value;
  try {
    value = boost::lexical_cast<double>(digits);
  } catch (const boost::bad_lexical_cast&) {
    throw gerber_exception("[coord] Invalid coordinate value: " + raw, ERR_PARSE);
  }
  value /= format.divisor();
  return sign == "-" ? -value : value;
}

DecodedCoordinates decode_coordinates(const string& token, const FormatSpec& format) {
  DecodedCoordinates decoded;
  for (const auto& value : split_coordinates(token)) {
    if (value.first == 'X' || value.first == 'Y') {
      decoded.position[value.first] = decode_value(value.second, format);
    } else {
      decoded.offset[value.first] = decode_value(value.second, format);
    }
  }
  return decoded;
}

string encode_coordinate(double value, const FormatSpec& format) {
  const long long scaled = std::llround(std::fabs(value) * format.divisor());
  if (scaled == 0) {
    return "0";
  }
  string digits = boost::lexical_cast<string>(scaled);
  const size_t length = format.field_length();
  if (digits.size() > length) {
    throw gerber_exception(
        "[coord] Coordinate too large to format using Gerber: " +
        boost::lexical_cast<string>(value), ERR_GEOMETRY);
  }
  digits.insert(0, length - digits.size(), '0');
  if (format.zero_suppression == ZeroSuppression::LEADING) {
    digits.erase(0, digits.find_first_not_of('0'));
  } else {
    digits.erase(digits.find_last_not_of('0') + 1);
  }
  return (value < 0 ? "-" : "") + digits;
}

string reformat_coordinates(const string& token, const FormatSpec& from, const FormatSpec& to) {
  string reformatted;
  for (const auto& value : split_coordinates(token)) {
    reformatted += value.first;
    reformatted += encode_coordinate(decode_value(value.second, from), to);
  }
  return reformatted;
}
