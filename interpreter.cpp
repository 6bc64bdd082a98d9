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

#include "interpreter.hpp"

static double axis_or(const axis_values& values, char axis, double fallback) {
  const auto found = values.find(axis);
  return found == values.cend() ? fallback : found->second;
}

point_type_fp resolve_position(const DecodedCoordinates& coordinates,
                               const point_type_fp& last_position) {
  return point_type_fp(axis_or(coordinates.position, 'X', last_position.x()),
                       axis_or(coordinates.position, 'Y', last_position.y()));
}

// No aperture selected, an undefined one, or one without a positive diameter.
static bool blank_aperture(const ModalState& state, const ApertureTable& apertures) {
  if (!state.current_aperture) {
    return true;
  }
  const auto found = apertures.all().find(*state.current_aperture);
  return found == apertures.all().cend() || found->second.blank();
}

static void extend_draw(const point_type_fp& start, const point_type_fp& end,
                        const point_type_fp& offset, const ModalState& state,
                        BoundingBox& bounding_box) {
  switch (state.interpolation_mode) {
    case InterpolationMode::LINEAR:
      bounding_box.extend(end);
      break;
    case InterpolationMode::SINGLE_QUADRANT_ARC:
      // A single quadrant arc can't end where it starts.
      if (!bg::equals(start, end)) {
        bounding_box.extend(end);
      }
      break;
    case InterpolationMode::MULTI_QUADRANT_ARC:
      bounding_box.extend(arc_bounding_points(start, end, offset, state.arc_direction));
      break;
  }
}

point_type_fp interpret_coordinates(const DecodedCoordinates& coordinates,
                                    Operation::Operation operation,
                                    const InterpretOptions& options,
                                    const ApertureTable& apertures,
                                    ModalState& state,
                                    BoundingBox& bounding_box) {
  const point_type_fp start = state.last_position;
  const point_type_fp offset(axis_or(coordinates.offset, 'I', 0),
                             axis_or(coordinates.offset, 'J', 0));
  point_type_fp end = resolve_position(coordinates, start);
  if (options.fold_linear_offsets && !state.in_arc_mode()) {
    bg::add_point(end, offset);
  }

  switch (operation) {
    case Operation::MOVE:
      state.last_was_move = true;
      break;
    case Operation::DRAW:
      if (state.last_was_move) {
        bounding_box.extend(start);
        state.last_was_move = false;
      }
      if (!(options.ignore_blank_apertures && blank_aperture(state, apertures))) {
        extend_draw(start, end, offset, state, bounding_box);
      }
      break;
    case Operation::FLASH:
      bounding_box.extend(end);
      break;
  }

  state.last_position = end;
  state.last_operation = operation;
  return end;
}
