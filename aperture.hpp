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

#ifndef APERTURE_H
#define APERTURE_H

#include <map>
#include <string>
#include <vector>
#include <ostream>
#include <boost/optional.hpp>

#include "gerber_error.hpp"

namespace ApertureKind {
enum ApertureKind {
  CIRCLE,
  RECTANGLE,
  OBROUND,
  POLYGON,
  MACRO
};

inline std::ostream& operator<<(std::ostream& out, const ApertureKind& kind)
{
  switch (kind) {
    case CIRCLE:
      out << "circle";
      break;
    case RECTANGLE:
      out << "rectangle";
      break;
    case OBROUND:
      out << "obround";
      break;
    case POLYGON:
      out << "polygon";
      break;
    case MACRO:
      out << "macro";
      break;
  }
  return out;
}
}; // namespace ApertureKind

/******************************************************************************/
/*
 An aperture definition.  A default-constructed Aperture is the "empty record"
 returned for codes that were never defined.
 */
/******************************************************************************/
class Aperture {
public:
    Aperture() {}
    Aperture(const std::string& code, const std::string& type, const std::string& modifiers) :
        code(code), type(type), modifiers(modifiers) {}

    bool defined() const {
        return !type.empty();
    }
    // Built-in types are C, R, O and P, anything else names a macro.
    ApertureKind::ApertureKind kind() const;
    // Circles with no diameter and all other shapes count as blank.
    bool blank() const {
        return !diameter || *diameter <= 0.0;
    }

    std::string code;
    std::string type;
    std::string modifiers;
    boost::optional<double> diameter;
};

class ApertureTable {
public:
    /* Stores the aperture, replacing any earlier definition of code.  Throws
     * gerber_exception with ERR_APERTURE if code is not D10 or above or if
     * type isn't an identifier.  Returns false when a circle's modifiers
     * don't start with a diameter; the aperture is stored anyway, without
     * one.
     */
    bool define(const std::string& code, const std::string& type, const std::string& modifiers);
    // none if code is undefined.  Throws if code is malformed.
    boost::optional<Aperture> find(const std::string& code) const;
    bool contains(const std::string& code) const {
        return apertures.count(code) > 0;
    }
    const std::map<std::string, Aperture>& all() const {
        return apertures;
    }

private:
    std::map<std::string, Aperture> apertures;
};

// Aperture macros are stored as their primitive statements, not evaluated.
class MacroTable {
public:
    // Comment primitives (number 0) in primitives are dropped.
    void define(const std::string& name, const std::vector<std::string>& primitives);
    boost::optional<std::vector<std::string>> find(const std::string& name) const;
    const std::map<std::string, std::vector<std::string>>& all() const {
        return macros;
    }

private:
    std::map<std::string, std::vector<std::string>> macros;
};

bool is_comment_primitive(const std::string& primitive);

#endif // APERTURE_H
