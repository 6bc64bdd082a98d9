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

#ifndef MODAL_STATE_H
#define MODAL_STATE_H

#include <ostream>
#include <string>
#include <boost/optional.hpp>

#include "geometry.hpp"
#include "gerber_codes.hpp"

namespace InterpolationMode {
enum InterpolationMode {
  LINEAR,
  SINGLE_QUADRANT_ARC,
  MULTI_QUADRANT_ARC
};

inline std::ostream& operator<<(std::ostream& out, const InterpolationMode& mode)
{
  switch (mode) {
    case LINEAR:
      out << "linear";
      break;
    case SINGLE_QUADRANT_ARC:
      out << "single-quadrant arc";
      break;
    case MULTI_QUADRANT_ARC:
      out << "multi-quadrant arc";
      break;
  }
  return out;
}
}; // namespace InterpolationMode

namespace ArcDirection {
enum ArcDirection {
  CLOCKWISE,
  COUNTERCLOCKWISE
};
}; // namespace ArcDirection

namespace QuadrantMode {
enum QuadrantMode {
  SINGLE,  // G74
  MULTI    // G75
};
}; // namespace QuadrantMode

/******************************************************************************/
/*
 The modal values that carry over from one command to the next.
 */
/******************************************************************************/
struct ModalState {
  ModalState() :
      last_position(0, 0),
      last_was_move(false),
      interpolation_mode(InterpolationMode::LINEAR),
      arc_direction(ArcDirection::CLOCKWISE),
      quadrant_mode(QuadrantMode::SINGLE) {}

  bool in_arc_mode() const {
    return interpolation_mode != InterpolationMode::LINEAR;
  }

  /* Applies the interpolation side effects of a function code.  G01 selects
   * linear, G02/G03 select an arc of the current quadrant mode with its
   * direction, G74/G75 set the quadrant mode.  Other codes change nothing.
   */
  void select_function(const std::string& func);

  point_type_fp last_position;
  boost::optional<std::string> current_aperture;
  bool last_was_move;
  InterpolationMode::InterpolationMode interpolation_mode;
  ArcDirection::ArcDirection arc_direction;
  QuadrantMode::QuadrantMode quadrant_mode;
  // Used when an arc leaves off its operation code.
  boost::optional<Operation::Operation> last_operation;
};

#endif // MODAL_STATE_H
