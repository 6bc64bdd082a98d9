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

#include "modal_state.hpp"

static InterpolationMode::InterpolationMode arc_mode(QuadrantMode::QuadrantMode quadrant_mode) {
  return quadrant_mode == QuadrantMode::MULTI ?
      InterpolationMode::MULTI_QUADRANT_ARC :
      InterpolationMode::SINGLE_QUADRANT_ARC;
}

void ModalState::select_function(const string& func) {
  const auto number = code_number(func, 'G');
  if (!number) {
    return;
  }
  switch (*number) {
    case 1:
      interpolation_mode = InterpolationMode::LINEAR;
      break;
    case 2:
      interpolation_mode = arc_mode(quadrant_mode);
      arc_direction = ArcDirection::CLOCKWISE;
      break;
    case 3:
      interpolation_mode = arc_mode(quadrant_mode);
      arc_direction = ArcDirection::COUNTERCLOCKWISE;
      break;
    case 74:
      quadrant_mode = QuadrantMode::SINGLE;
      if (in_arc_mode()) {
        interpolation_mode = InterpolationMode::SINGLE_QUADRANT_ARC;
      }
      break;
    case 75:
      quadrant_mode = QuadrantMode::MULTI;
      if (in_arc_mode()) {
        interpolation_mode = InterpolationMode::MULTI_QUADRANT_ARC;
      }
      break;
  }
}
