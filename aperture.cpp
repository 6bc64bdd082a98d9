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
#include <string>
using std::string;

#include <vector>
using std::vector;

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "aperture.hpp"
#include "gerber_codes.hpp"

ApertureKind::ApertureKind Aperture::kind() const
{
    if (type == "C") {
        return ApertureKind::CIRCLE;
    } else if (type == "R") {
        return ApertureKind::RECTANGLE;
    } else if (type == "O") {
        return ApertureKind::OBROUND;
    } else if (type == "P") {
        return ApertureKind::POLYGON;
    }
    return ApertureKind::MACRO;
}

// Reads the number at the start of modifiers, "0.0100X0.02" -> 0.01.
static boost::optional<double> leading_number(const string& modifiers)
{
    size_t end = 0;
    while (end < modifiers.size() &&
           (std::isdigit(static_cast<unsigned char>(modifiers[end])) || modifiers[end] == '.')) {
        end++;
    }
    if (end == 0) {
        return boost::none;
    }
    try {
        return boost::lexical_cast<double>(modifiers.substr(0, end));
    } catch (const boost::bad_lexical_cast&) {
        return boost::none;
    }
}

bool ApertureTable::define(const string& code, const string& type, const string& modifiers)
{
    if (!is_aperture_code(code)) {
        throw gerber_exception("[aperture] Invalid D-Code: " + code, ERR_APERTURE);
    }
    if (!is_identifier(type)) {
        throw gerber_exception("[aperture] Invalid Type: " + type, ERR_APERTURE);
    }

    Aperture aperture(code, type, modifiers);
    bool diameter_found = true;
    if (aperture.kind() == ApertureKind::CIRCLE) {
        aperture.diameter = leading_number(modifiers);
        diameter_found = static_cast<bool>(aperture.diameter);
    }
    apertures[code] = aperture;
    return diameter_found;
}

boost::optional<Aperture> ApertureTable::find(const string& code) const
{
    if (!is_aperture_code(code)) {
        throw gerber_exception("[aperture] Invalid D-Code: " + code, ERR_APERTURE);
    }
    const auto found = apertures.find(code);
    if (found == apertures.cend()) {
        return boost::none;
    }
    return found->second;
}

bool is_comment_primitive(const string& primitive)
{
    const string trimmed = boost::trim_copy(primitive);
    if (trimmed.empty() || trimmed[0] != '0') {
        return false;
    }
    // "0 text" is a comment, "0.5,..." is not a primitive number at all.
    return trimmed.size() == 1 ||
        !(std::isdigit(static_cast<unsigned char>(trimmed[1])) || trimmed[1] == '.');
}

void MacroTable::define(const string& name, const vector<string>& primitives)
{
    if (!is_identifier(name)) {
        throw gerber_exception("[macro] Invalid macro name: " + name, ERR_APERTURE);
    }
    vector<string> kept;
    for (const auto& primitive : primitives) {
        const string trimmed = boost::trim_copy(primitive);
        if (!trimmed.empty() && !is_comment_primitive(trimmed)) {
            kept.push_back(trimmed);
        }
    }
    macros[name] = kept;
}

boost::optional<vector<string>> MacroTable::find(const string& name) const
{
    const auto found = macros.find(name);
    if (found == macros.cend()) {
        return boost::none;
    }
    return found->second;
}
