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

#ifndef FUNCTION_H
#define FUNCTION_H

#include <string>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "geometry.hpp"

// Dnn on its own, selects an aperture.
struct ApertureSelect {
  ApertureSelect(const std::string& code) : code(code) {}
  std::string code;
};

// A parameter kept verbatim, without the enclosing % and *.
struct ParamCall {
  ParamCall(const std::string& raw) : raw(raw) {}
  std::string raw;
};

struct Command {
  boost::optional<std::string> function;     // G or M code
  boost::optional<std::string> coordinates;  // raw token, "X100Y-20"
  boost::optional<std::string> operation;    // D01, D02 or D03 as written
  boost::optional<std::string> comment;      // G04 text
  // The position the command resolves to, when it carries coordinates.
  boost::optional<point_type_fp> xy_coords;
};

typedef boost::variant<ApertureSelect, ParamCall, Command> Function;

#endif // FUNCTION_H
