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

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

#include <string>
using std::string;

#include <vector>
using std::vector;

#include <memory>
using std::shared_ptr;

#include <iostream>
using std::cerr;
using std::endl;

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
using boost::format;

#include "gerber_codes.hpp"
#include "gerber_parser.hpp"

// Parameters that are kept as they are, without being interpreted.
static const std::set<string> passthrough_params = {
  "IP", "OF", "IN", "LN", "AS", "MI", "SF", "IR", "TF", "TA", "TO", "TD"
};

// A parameter body up to its first '*'.
static string first_statement(const string& data) {
  return data.substr(0, data.find('*'));
}

static bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c));
}

static bool is_identifier_char(char c, bool first) {
  const unsigned char u = c;
  return std::isalpha(u) || c == '_' || c == '$' || (!first && std::isdigit(u));
}

GerberParser::GerberParser() :
    ignore_invalid_codes(false),
    ignore_blank_apertures(false),
    fold_linear_offsets(true),
    operation_code_policy(OperationCodePolicy::STRICT),
    state(ParseState::IDLE),
    halted(false),
    line_number(0),
    last_error_code(ERR_OK) {}

void GerberParser::begin() {
  document = std::make_shared<GerberDocument>();
  document->ignore_invalid_codes = ignore_invalid_codes;
  document->ignore_blank_apertures = ignore_blank_apertures;
  document->fold_linear_offsets = fold_linear_offsets;
  document->operation_code_policy = operation_code_policy;
  state = ParseState::IDLE;
  parameter_buffer.clear();
  last_operation_code = boost::none;
  halted = false;
  line_number = 0;
  last_error.clear();
  last_error_code = ERR_OK;
}

void GerberParser::finish() {
  if (state == ParseState::ACCUMULATING_PARAMETER) {
    throw gerber_exception("[parse] Unterminated parameter at end of input: %" + parameter_buffer,
                           ERR_PARSE);
  }
}

shared_ptr<GerberDocument> GerberParser::fail(const gerber_exception& e) {
  last_error = str(format("line %1%: %2%") % line_number % e.what());
  last_error_code = e.code();
  document.reset();
  return nullptr;
}

void GerberParser::check(bool ok) {
  if (!ok) {
    throw gerber_exception(document->error(), document->error_code());
  }
}

shared_ptr<GerberDocument> GerberParser::parse(const vector<string>& lines) {
  begin();
  try {
    for (const auto& line : lines) {
      if (halted) {
        break;
      }
      parse_line(line);
    }
    finish();
  } catch (const gerber_exception& e) {
    return fail(e);
  }
  shared_ptr<GerberDocument> parsed = document;
  document.reset();
  return parsed;
}

shared_ptr<GerberDocument> GerberParser::parse(std::istream& input) {
  begin();
  try {
    string line;
    while (!halted && std::getline(input, line)) {
      parse_line(line);
    }
    finish();
  } catch (const gerber_exception& e) {
    return fail(e);
  }
  shared_ptr<GerberDocument> parsed = document;
  document.reset();
  return parsed;
}

shared_ptr<GerberDocument> GerberParser::parse_file(const string& filename) {
  std::ifstream input(filename);
  if (!input) {
    line_number = 0;
    last_error = "[parse] Could not open " + filename;
    last_error_code = ERR_INPUTFILE;
    return nullptr;
  }
  return parse(input);
}

void GerberParser::parse_line(string line) {
  line_number++;
  line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
  boost::trim(line);
  if (line.empty() || line == "*") {
    return;
  }

  if (state == ParseState::ACCUMULATING_PARAMETER) {
    if (!boost::ends_with(line, "%")) {
      parameter_buffer += line;
      return;
    }
    boost::erase_all(line, "%");
    const string param = parameter_buffer + line;
    state = ParseState::IDLE;
    parameter_buffer.clear();
    parse_param(param);
    return;
  }

  if (boost::starts_with(line, "%")) {
    parse_parameter_blocks(line);
  } else {
    parse_commands(line);
  }
}

// One or more %...% blocks, the last one possibly left open.
void GerberParser::parse_parameter_blocks(const string& line) {
  size_t pos = 0;
  while (pos < line.size()) {
    if (line[pos] != '%') {
      parse_commands(line.substr(pos));
      return;
    }
    const size_t close = line.find('%', pos + 1);
    if (close == string::npos) {
      state = ParseState::ACCUMULATING_PARAMETER;
      parameter_buffer = line.substr(pos + 1);
      return;
    }
    parse_param(line.substr(pos + 1, close - pos - 1));
    pos = close + 1;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
      pos++;
    }
  }
}

void GerberParser::parse_commands(const string& line) {
  vector<string> tokens;
  boost::split(tokens, line, boost::is_any_of("*"));
  for (auto& token : tokens) {
    boost::trim(token);
    if (halted) {
      return;
    }
    if (token.empty()) {
      continue;
    }

    if (token.size() > 1 && token[0] == 'G' && is_digit(token[1])) {
      parse_command(token);
    } else if (boost::starts_with(token, "D0") || (token.size() == 2 && token[0] == 'D' && is_digit(token[1]))) {
      if (!ignore_invalid_codes) {
        throw gerber_exception("[parse] Cannot have an operation code alone on a line: " + token,
                               ERR_PARSE);
      }
      cerr << "Warning: line " << line_number << ": operation code " << token
           << " alone on a line." << endl;
      parse_move(token);
    } else if (is_aperture_code(token)) {
      check(document->append_aperture_select(token));
    } else if (boost::starts_with(token, "M02")) {
      check(document->append_command(string("M02"), boost::none, boost::none));
      halted = true;
    } else if (token[0] == 'M') {
      check(document->append_command(token, boost::none, boost::none));
    } else {
      parse_move(token);
    }
  }
}

// A token starting with a G code.
void GerberParser::parse_command(const string& token) {
  size_t end = 1;
  while (end < token.size() && is_digit(token[end])) {
    end++;
  }
  const string function = token.substr(0, end);
  const string rest = token.substr(end);

  if (is_comment_function(function)) {
    check(document->append_command(function, boost::none, boost::none, rest));
    return;
  }
  if (rest.empty()) {
    check(document->append_command(function, boost::none, boost::none));
    return;
  }

  const size_t d = rest.find('D');
  const string coordinates = rest.substr(0, d);
  boost::optional<string> operation;
  if (d != string::npos) {
    operation = rest.substr(d);
    if (!code_number(*operation, 'D')) {
      throw gerber_exception("[parse] Invalid instruction following command code " +
                             function + ": " + rest, ERR_PARSE);
    }
    if (parse_operation(*operation)) {
      last_operation_code = operation;
    }
  } else if (!is_circular_function(function)) {
    // Arcs fall back on the document's last operation instead.
    operation = last_operation_code;
  }

  check(document->append_command(
      function,
      coordinates.empty() ? boost::optional<string>() : boost::optional<string>(coordinates),
      operation));
}

// Coordinates with an operation code, or with the last one seen.
void GerberParser::parse_move(const string& token) {
  boost::optional<string> coordinates;
  boost::optional<string> operation;

  const size_t d = token.rfind('D');
  if (d != string::npos && code_number(token.substr(d), 'D')) {
    operation = token.substr(d);
    if (d > 0) {
      coordinates = token.substr(0, d);
    }
    if (parse_operation(*operation)) {
      last_operation_code = operation;
    }
  } else if (last_operation_code) {
    operation = last_operation_code;
    coordinates = token;
  } else {
    throw gerber_exception("[parse] Invalid move instruction: " + token, ERR_PARSE);
  }

  check(document->append_command(boost::none, coordinates, operation));
}

void GerberParser::parse_param(const string& param) {
  const string body = boost::trim_copy(param);
  if (body.empty()) {
    return;
  }
  if (body.size() < 2) {
    throw gerber_exception("[parse] Invalid parameter: " + body, ERR_PARSE);
  }

  const string code = body.substr(0, 2);
  const string data = body.substr(2);
  if (code == "FS") {
    param_fs(data);
  } else if (code == "MO") {
    param_mo(data);
  } else if (code == "AD") {
    param_ad(data);
  } else if (code == "AM") {
    param_am(data);
  } else if (code == "LP") {
    param_lp(data);
  } else if (code == "SR") {
    check(document->append_param("SR" + first_statement(data)));
  } else if (passthrough_params.count(code) > 0) {
    check(document->append_param(code + boost::trim_right_copy_if(data, boost::is_any_of("*"))));
  } else if (ignore_invalid_codes) {
    cerr << "Warning: line " << line_number << ": skipping unknown parameter "
         << code << "." << endl;
  } else {
    throw gerber_exception("[parse] Unknown parameter: " + body, ERR_PARSE);
  }
}

// FSLAX25Y25: zero suppression, coordinate mode, then the X digit counts.
void GerberParser::param_fs(const string& data) {
  const string spec = first_statement(data);
  const string invalid = "[parse] Invalid FS Parameter Value: " + spec;
  if (spec.size() < 2 ||
      string("LT").find(std::toupper(static_cast<unsigned char>(spec[0]))) == string::npos ||
      string("AI").find(std::toupper(static_cast<unsigned char>(spec[1]))) == string::npos) {
    throw gerber_exception(invalid, ERR_PARSE);
  }
  const size_t x = spec.find('X');
  if (x == string::npos || x + 2 >= spec.size() ||
      !is_digit(spec[x + 1]) || !is_digit(spec[x + 2])) {
    throw gerber_exception(invalid, ERR_PARSE);
  }

  FormatUpdate update;
  update.zero = spec.substr(0, 1);
  update.coordinates = spec.substr(1, 1);
  update.integer = spec[x + 1] - '0';
  update.decimal = spec[x + 2] - '0';
  check(document->set_format(update));
}

void GerberParser::param_mo(const string& data) {
  check(document->set_mode(boost::to_upper_copy(first_statement(data))));
}

// ADD10C,0.0070: code, type, then the modifiers after the first comma.
void GerberParser::param_ad(const string& data) {
  const string definition = first_statement(data);
  const string invalid = "[parse] Invalid AD Parameter Value: " + definition;
  if (definition.empty() || definition[0] != 'D') {
    throw gerber_exception(invalid, ERR_PARSE);
  }

  size_t pos = 1;
  while (pos < definition.size() && is_digit(definition[pos])) {
    pos++;
  }
  size_t type_end = pos;
  if (type_end < definition.size() && is_identifier_char(definition[type_end], true)) {
    type_end++;
    while (type_end < definition.size() && is_identifier_char(definition[type_end], false)) {
      type_end++;
    }
  }
  if (pos == 1 || type_end == pos) {
    throw gerber_exception(invalid, ERR_PARSE);
  }

  const auto number = code_number(definition.substr(0, pos), 'D');
  if (!number || *number < 10) {
    throw gerber_exception("[parse] Invalid User-Defined Aperture Number: " +
                           definition.substr(1, pos - 1) + ", From: " + definition, ERR_PARSE);
  }

  string modifiers = definition.substr(type_end);
  const size_t comma = modifiers.find(',');
  if (comma != string::npos) {
    modifiers = modifiers.substr(comma + 1);
  }
  check(document->define_aperture(*normalize_aperture_code(definition.substr(0, pos)),
                                  definition.substr(pos, type_end - pos), modifiers));
}

// AMname*primitive*primitive*...
void GerberParser::param_am(const string& data) {
  vector<string> parts;
  boost::split(parts, data, boost::is_any_of("*"));
  const string name = boost::trim_copy(parts.front());
  parts.erase(parts.begin());
  check(document->define_macro(name, parts));
}

void GerberParser::param_lp(const string& data) {
  const string polarity = first_statement(data);
  if (polarity != "D" && polarity != "C") {
    throw gerber_exception("[parse] Invalid LP Parameter Value: " + polarity, ERR_PARSE);
  }
  check(document->append_param("LP" + polarity));
}
