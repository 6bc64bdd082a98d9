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

#ifndef INTERPRETER_H
#define INTERPRETER_H

#include "aperture.hpp"
#include "bounding_box.hpp"
#include "coord_codec.hpp"
#include "gerber_codes.hpp"
#include "modal_state.hpp"

struct InterpretOptions {
  InterpretOptions() :
      ignore_blank_apertures(false),
      fold_linear_offsets(true) {}

  // Draws with an aperture of no size don't grow the bounding box.
  bool ignore_blank_apertures;
  // In linear mode I and J are added to X and Y.
  bool fold_linear_offsets;
};

/* Runs one decoded command through the modal state.  Absent X or Y axes take
 * their value from the last position.  The bounding box grows according to
 * the operation and the interpolation mode, then the last position and last
 * operation are updated.  Returns the resolved position.
 */
point_type_fp interpret_coordinates(const DecodedCoordinates& coordinates,
                                    Operation::Operation operation,
                                    const InterpretOptions& options,
                                    const ApertureTable& apertures,
                                    ModalState& state,
                                    BoundingBox& bounding_box);

// Resolves coordinates against last_position without touching any state.
point_type_fp resolve_position(const DecodedCoordinates& coordinates,
                               const point_type_fp& last_position);

#endif // INTERPRETER_H
