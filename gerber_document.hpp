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

#ifndef GERBER_DOCUMENT_H
#define GERBER_DOCUMENT_H

#include <ostream>
#include <string>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "aperture.hpp"
#include "bounding_box.hpp"
#include "coord_codec.hpp"
#include "format_spec.hpp"
#include "function.hpp"
#include "gerber_error.hpp"
#include "interpreter.hpp"
#include "modal_state.hpp"

namespace OperationCodePolicy {
enum OperationCodePolicy {
  STRICT,     // only G02/G03 may leave out the operation code
  REUSE_LAST  // any command with coordinates may
};

inline std::ostream& operator<<(std::ostream& out, const OperationCodePolicy& policy)
{
  switch (policy) {
    case STRICT:
      out << "strict";
      break;
    case REUSE_LAST:
      out << "reuse";
      break;
  }
  return out;
}
}; // namespace OperationCodePolicy

/******************************************************************************/
/*
 An in-memory Gerber document: format and units, the aperture and macro
 tables, and the ordered list of functions.  Appending a command validates it,
 decodes its coordinates and runs it through the modal state, growing the
 bounding box.

 Mutators return false on failure and leave the reason in error().  A failed
 append leaves the document as it was.
 */
/******************************************************************************/
class GerberDocument : private boost::noncopyable
{
public:
    GerberDocument();

    bool set_format(const FormatUpdate& update);
    const FormatSpec& format() const {
        return format_spec;
    }
    bool set_mode(const std::string& units);
    Units::Units mode() const {
        return units;
    }

    bool define_aperture(const std::string& code, const std::string& type,
                         const std::string& modifiers);
    /* The aperture defined as code.  An undefined code gives a default
     * constructed Aperture, a malformed one gives none.
     */
    boost::optional<Aperture> aperture(const std::string& code);
    const ApertureTable& apertures() const {
        return aperture_table;
    }

    bool define_macro(const std::string& name, const std::vector<std::string>& primitives);
    boost::optional<std::vector<std::string>> macro(const std::string& name) const {
        return macro_table.find(name);
    }
    const MacroTable& macros() const {
        return macro_table;
    }

    bool append_command(const boost::optional<std::string>& function,
                        const boost::optional<std::string>& coordinates,
                        const boost::optional<std::string>& operation,
                        const boost::optional<std::string>& comment = boost::none);
    // Appended even if code isn't defined, but then error() says so.
    bool append_aperture_select(const std::string& code);
    bool append_param(const std::string& raw);

    /* Replaces the coordinates and/or operation of the command at index and
     * refreshes its xy_coords.  Axes missing from the new coordinates come
     * from the closest earlier command with a position.  The modal state and
     * the bounding box are left alone.
     */
    bool rewrite_command(size_t index,
                         const boost::optional<std::string>& coordinates,
                         const boost::optional<std::string>& operation);

    const std::vector<Function>& functions() const {
        return function_list;
    }
    boost::optional<Function> function(size_t index);
    size_t function_count() const {
        return function_list.size();
    }

    const BoundingBox& bounding_box() const {
        return box;
    }
    coordinate_type_fp width() const {
        return box.width();
    }
    coordinate_type_fp height() const {
        return box.height();
    }
    const ModalState& modal_state() const {
        return modal;
    }

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

private:
    bool fail(const gerber_exception& e);
    Operation::Operation implied_operation(const Command& command) const;
    point_type_fp position_before(size_t index) const;

    FormatSpec format_spec;
    Units::Units units;
    ApertureTable aperture_table;
    MacroTable macro_table;
    std::vector<Function> function_list;
    ModalState modal;
    BoundingBox box;
    std::string last_error;
    ErrorCodes last_error_code;
};

#endif // GERBER_DOCUMENT_H
