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

#include <fstream>
#include <string>
using std::string;

#include <boost/variant.hpp>

#include "gerber_writer.hpp"

class function_writer : public boost::static_visitor<void> {
 public:
  function_writer(std::ostream& out) : out(out) {}
  void operator()(const ApertureSelect& select) const {
    out << select.code << "*\n";
  }
  void operator()(const ParamCall& param) const {
    out << '%' << param.raw << "*%\n";
  }
  void operator()(const Command& command) const {
    out << command.function.value_or("")
        << command.coordinates.value_or("")
        << command.operation.value_or("")
        << command.comment.value_or("") << "*\n";
  }
 private:
  std::ostream& out;
};

static bool is_program_end(const Function& function) {
  const Command* command = boost::get<Command>(&function);
  return command && command->function && *command->function == "M02";
}

bool GerberWriter::write(std::ostream& out, const GerberDocument& document)
{
    out << "%FS" << document.format() << "*%\n";
    out << "%MO" << document.mode() << "*%\n";

    for (const auto& macro : document.macros().all()) {
        out << "%AM" << macro.first << '*';
        for (const auto& primitive : macro.second) {
            out << '\n' << primitive << '*';
        }
        out << "%\n";
    }

    for (const auto& entry : document.apertures().all()) {
        const Aperture& aperture = entry.second;
        out << "%AD" << aperture.code << aperture.type;
        if (!aperture.modifiers.empty()) {
            out << ',' << aperture.modifiers;
        }
        out << "*%\n";
    }

    const function_writer writer(out);
    for (const auto& function : document.functions()) {
        boost::apply_visitor(writer, function);
    }
    if (document.functions().empty() || !is_program_end(document.functions().back())) {
        out << "M02*\n";
    }

    out.flush();
    if (!out) {
        last_error = "[write] Could not write Gerber output";
        return false;
    }
    return true;
}

bool GerberWriter::write(const string& filename, const GerberDocument& document)
{
    std::ofstream out(filename);
    if (!out) {
        last_error = "[write] Could not open " + filename + " for writing";
        return false;
    }
    return write(out, document);
}
