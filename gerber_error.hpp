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

#ifndef GERBER_ERROR_H
#define GERBER_ERROR_H

#include <stdexcept>
#include <string>

enum ErrorCodes {
    ERR_OK = 0,
    ERR_FORMAT = 1,         // bad digit counts, bad zero/coordinate tokens
    ERR_MODE = 2,           // bad units token
    ERR_APERTURE = 3,       // bad code, bad type token, unresolvable selection
    ERR_FUNCTION = 4,       // unrecognized function code, bad or missing operation code
    ERR_PARSE = 5,          // malformed line, unterminated parameter, unrecoverable token
    ERR_GEOMETRY = 6,       // coordinate value does not fit the field width
    ERR_INPUTFILE = 7,
    ERR_OUTPUTFILE = 8,
    ERR_NOINPUT = 9,
    ERR_INVALIDPARAMETER = 100,
    ERR_UNKNOWNPARAMETER = 101
};

class gerber_exception : public std::exception {
 public:
  gerber_exception(const std::string& what, ErrorCodes error_code) {
    what_string = what;
    this->error_code = error_code;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }
  virtual ErrorCodes code() const throw() {
    return error_code;
  }

 private:
  std::string what_string;
  ErrorCodes error_code;
};

#endif // GERBER_ERROR_H
