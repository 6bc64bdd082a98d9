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

#ifndef GERBER_PARSER_H
#define GERBER_PARSER_H

#include <istream>
#include <memory>
#include <string>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "gerber_document.hpp"
#include "gerber_error.hpp"

namespace ParseState {
enum ParseState {
  IDLE,
  ACCUMULATING_PARAMETER  // inside a %...% block that spans lines
};
}; // namespace ParseState

/******************************************************************************/
/*
 Reads RS-274X text line by line into a new GerberDocument.  The first error
 stops the parse: the parse functions return null and error() holds the
 message, prefixed with the line number where it happened.
 */
/******************************************************************************/
class GerberParser : private boost::noncopyable
{
public:
    GerberParser();

    std::shared_ptr<GerberDocument> parse(const std::vector<std::string>& lines);
    std::shared_ptr<GerberDocument> parse(std::istream& input);
    std::shared_ptr<GerberDocument> parse_file(const std::string& filename);

    // Copied to every document that gets parsed.
    bool ignore_invalid_codes;
    bool ignore_blank_apertures;
    bool fold_linear_offsets;
    OperationCodePolicy::OperationCodePolicy operation_code_policy;

    const std::string& error() const {
        return last_error;
    }
    ErrorCodes error_code() const {
        return last_error_code;
    }
    // The number of the line being parsed, or of the last line parsed.
    unsigned int line() const {
        return line_number;
    }

private:
    void begin();
    void parse_line(std::string line);
    void finish();
    std::shared_ptr<GerberDocument> fail(const gerber_exception& e);

    void parse_parameter_blocks(const std::string& line);
    void parse_commands(const std::string& line);
    void parse_command(const std::string& token);
    void parse_move(const std::string& token);
    void parse_param(const std::string& param);
    void param_fs(const std::string& data);
    void param_mo(const std::string& data);
    void param_ad(const std::string& data);
    void param_am(const std::string& data);
    void param_lp(const std::string& data);
    void check(bool ok);

    std::shared_ptr<GerberDocument> document;
    ParseState::ParseState state;
    std::string parameter_buffer;
    // The last D01/D02/D03 seen, for coordinates given without one.
    boost::optional<std::string> last_operation_code;
    bool halted;
    unsigned int line_number;
    std::string last_error;
    ErrorCodes last_error_code;
};

#endif // GERBER_PARSER_H
