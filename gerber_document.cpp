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

#include <string>
using std::string;

#include <vector>
using std::vector;

#include <iostream>
using std::cerr;
using std::endl;

#include <boost/format.hpp>

#include "gerber_document.hpp"

GerberDocument::GerberDocument() :
    ignore_invalid_codes(false),
    ignore_blank_apertures(false),
    fold_linear_offsets(true),
    operation_code_policy(OperationCodePolicy::STRICT),
    units(Units::INCH),
    last_error_code(ERR_OK) {}

bool GerberDocument::fail(const gerber_exception& e) {
    last_error = e.what();
    last_error_code = e.code();
    return false;
}

bool GerberDocument::set_format(const FormatUpdate& update) {
    try {
        apply_format_update(format_spec, update);
    } catch (const gerber_exception& e) {
        return fail(e);
    }
    return true;
}

bool GerberDocument::set_mode(const string& mode) {
    try {
        units = Units::parse(mode);
    } catch (const gerber_exception& e) {
        return fail(e);
    }
    return true;
}

bool GerberDocument::define_aperture(const string& code, const string& type,
                                     const string& modifiers) {
    try {
        if (!aperture_table.define(code, type, modifiers)) {
            cerr << "Warning: circle aperture " << code << " has no diameter in \""
                 << modifiers << "\"." << endl;
        }
    } catch (const gerber_exception& e) {
        return fail(e);
    }
    return true;
}

boost::optional<Aperture> GerberDocument::aperture(const string& code) {
    try {
        const auto found = aperture_table.find(code);
        return found ? *found : Aperture();
    } catch (const gerber_exception& e) {
        fail(e);
        return boost::none;
    }
}

bool GerberDocument::define_macro(const string& name, const vector<string>& primitives) {
    try {
        macro_table.define(name, primitives);
    } catch (const gerber_exception& e) {
        return fail(e);
    }
    return true;
}

// The operation of a command with coordinates but no operation code.
Operation::Operation GerberDocument::implied_operation(const Command& command) const {
    const bool arc = command.function && is_circular_function(*command.function);
    if (!arc && operation_code_policy == OperationCodePolicy::STRICT) {
        throw gerber_exception("[function] Missing operation code for coordinates: " +
                               *command.coordinates, ERR_FUNCTION);
    }
    return modal.last_operation ? *modal.last_operation : Operation::DRAW;
}

bool GerberDocument::append_command(const boost::optional<string>& function,
                                    const boost::optional<string>& coordinates,
                                    const boost::optional<string>& operation,
                                    const boost::optional<string>& comment) {
    Command command;
    command.function = function;
    command.coordinates = coordinates;
    command.operation = operation;
    command.comment = comment;

    ModalState state = modal;
    BoundingBox new_box = box;
    try {
        if (function && !is_valid_function_code(*function) && !ignore_invalid_codes) {
            throw gerber_exception("[function] Invalid function code: " + *function, ERR_FUNCTION);
        }

        boost::optional<Operation::Operation> op;
        if (operation) {
            op = parse_operation(*operation);
            const bool tool_select = function && is_tool_select_function(*function);
            if (!op && !tool_select) {
                throw gerber_exception("[function] Invalid operation code: " + *operation,
                                       ERR_FUNCTION);
            }
            const auto aperture = tool_select ? normalize_aperture_code(*operation)
                                              : boost::optional<string>();
            if (aperture) {
                if (!aperture_table.contains(*aperture)) {
                    fail(gerber_exception("[aperture] Aperture " + *aperture + " selected by " +
                                          *function + " is not defined", ERR_APERTURE));
                    cerr << "Warning: aperture " << *aperture << " selected by "
                         << *function << " is not defined." << endl;
                }
                state.current_aperture = *aperture;
            }
        }

        if (function) {
            state.select_function(*function);
        }

        if (coordinates) {
            if (!op) {
                op = implied_operation(command);
            }
            InterpretOptions options;
            options.ignore_blank_apertures = ignore_blank_apertures;
            options.fold_linear_offsets = fold_linear_offsets;
            const DecodedCoordinates decoded = decode_coordinates(*coordinates, format_spec);
            command.xy_coords = interpret_coordinates(decoded, *op, options, aperture_table,
                                                      state, new_box);
        } else if (op) {
            state.last_operation = *op;
        }
    } catch (const gerber_exception& e) {
        return fail(e);
    }

    modal = state;
    box = new_box;
    function_list.push_back(command);
    return true;
}

bool GerberDocument::append_aperture_select(const string& code) {
    const auto aperture = normalize_aperture_code(code);
    if (!aperture) {
        return fail(gerber_exception("[aperture] Invalid D-Code: " + code, ERR_APERTURE));
    }
    if (!aperture_table.contains(*aperture)) {
        fail(gerber_exception("[aperture] Aperture " + *aperture + " is not defined",
                              ERR_APERTURE));
        cerr << "Warning: aperture " << *aperture << " selected but not defined." << endl;
    }
    modal.current_aperture = *aperture;
    function_list.push_back(ApertureSelect(*aperture));
    return true;
}

bool GerberDocument::append_param(const string& raw) {
    if (raw.empty()) {
        return fail(gerber_exception("[param] Empty parameter", ERR_PARSE));
    }
    function_list.push_back(ParamCall(raw));
    return true;
}

boost::optional<Function> GerberDocument::function(size_t index) {
    if (index >= function_list.size()) {
        fail(gerber_exception(
            boost::str(boost::format("[function] No function at index %1%, there are %2%")
                % index % function_list.size()), ERR_FUNCTION));
        return boost::none;
    }
    return function_list[index];
}

point_type_fp GerberDocument::position_before(size_t index) const {
    while (index > 0) {
        index--;
        const Command* command = boost::get<Command>(&function_list[index]);
        if (command && command->xy_coords) {
            return *command->xy_coords;
        }
    }
    return point_type_fp(0, 0);
}

bool GerberDocument::rewrite_command(size_t index,
                                     const boost::optional<string>& coordinates,
                                     const boost::optional<string>& operation) {
    try {
        if (index >= function_list.size()) {
            throw gerber_exception(
                boost::str(boost::format("[function] No function at index %1%, there are %2%")
                    % index % function_list.size()), ERR_FUNCTION);
        }
        Command* command = boost::get<Command>(&function_list[index]);
        if (!command) {
            throw gerber_exception(
                boost::str(boost::format("[function] Function %1% is not a command") % index), ERR_FUNCTION);
        }
        if (operation && !parse_operation(*operation)) {
            throw gerber_exception("[function] Invalid operation code: " + *operation,
                                   ERR_FUNCTION);
        }

        Command rewritten = *command;
        if (coordinates) {
            rewritten.coordinates = coordinates;
        }
        if (operation) {
            rewritten.operation = operation;
        }
        if (rewritten.coordinates) {
            const DecodedCoordinates decoded = decode_coordinates(*rewritten.coordinates,
                                                                  format_spec);
            rewritten.xy_coords = resolve_position(decoded, position_before(index));
        } else {
            rewritten.xy_coords = boost::none;
        }
        *command = rewritten;
    } catch (const gerber_exception& e) {
        return fail(e);
    }
    return true;
}
