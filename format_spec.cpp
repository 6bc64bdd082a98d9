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
#include <vector>
using std::vector;

#include <string>
using std::string;

#include <boost/format.hpp>
using boost::format;

#include <iostream>
using std::cerr;
using std::endl;

#include "format_spec.hpp"

namespace ZeroSuppression {
ZeroSuppression parse(const string& token) {
  if (!token.empty()) {
    switch (std::toupper(static_cast<unsigned char>(token[0]))) {
      case 'L':
        return LEADING;
      case 'T':
        return TRAILING;
    }
  }
  throw gerber_exception("[format] Invalid zero value: " + token, ERR_FORMAT);
}
}; // namespace ZeroSuppression

namespace CoordinateMode {
CoordinateMode parse(const string& token) {
  if (!token.empty()) {
    switch (std::toupper(static_cast<unsigned char>(token[0]))) {
      case 'A':
        return ABSOLUTE;
      case 'I':
        return INCREMENTAL;
    }
  }
  throw gerber_exception("[format] Invalid coordinates value: " + token, ERR_FORMAT);
}
}; // namespace CoordinateMode

namespace Units {
Units parse(const string& token) {
  if (token == "IN") {
    return INCH;
  } else if (token == "MM") {
    return MILLIMETER;
  }
  throw gerber_exception("[mode] Invalid Mode: " + token, ERR_MODE);
}
}; // namespace Units

double FormatSpec::divisor() const {
  return std::pow(10.0, static_cast<double>(decimal_digits));
}

std::ostream& operator<<(std::ostream& out, const FormatSpec& format) {
  out << format.zero_suppression << format.coordinate_mode
      << "X" << format.integer_digits << format.decimal_digits
      << "Y" << format.integer_digits << format.decimal_digits;
  return out;
}

static bool valid_digit_count(int digits) {
  return digits >= 0 && digits <= static_cast<int>(MAX_FORMAT_DIGITS);
}

void apply_format_update(FormatSpec& spec, const FormatUpdate& update) {
  vector<gerber_exception> failures;

  if (update.zero) {
    try {
      spec.zero_suppression = ZeroSuppression::parse(*update.zero);
    } catch (const gerber_exception& e) {
      failures.push_back(e);
    }
  }

  if (update.coordinates) {
    try {
      spec.coordinate_mode = CoordinateMode::parse(*update.coordinates);
      if (spec.coordinate_mode == CoordinateMode::INCREMENTAL) {
        cerr << "Warning: incremental coordinates are not fully supported, "
            "positions and bounds will be wrong." << endl;
      }
    } catch (const gerber_exception& e) {
      failures.push_back(e);
    }
  }

  if (update.integer) {
    if (valid_digit_count(*update.integer)) {
      spec.integer_digits = *update.integer;
    } else {
      failures.push_back(gerber_exception(
          str(format("[format] Invalid format spec for integer : %1%") % *update.integer),
          ERR_FORMAT));
    }
  }

  if (update.decimal) {
    if (valid_digit_count(*update.decimal)) {
      spec.decimal_digits = *update.decimal;
    } else {
      failures.push_back(gerber_exception(
          str(format("[format] Invalid format spec for decimal : %1%") % *update.decimal),
          ERR_FORMAT));
    }
  }

  if (!failures.empty()) {
    throw failures.front();
  }
}
