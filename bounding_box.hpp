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

#ifndef BOUNDING_BOX_H
#define BOUNDING_BOX_H

#include <boost/optional.hpp>

#include "geometry.hpp"
#include "modal_state.hpp"

/******************************************************************************/
/*
 Running extent of the drawn data.  All four bounds are absent until the
 first point arrives, and after that the box only grows.
 */
/******************************************************************************/
class BoundingBox {
public:
    void extend(const point_type_fp& point);
    void extend(const multi_point_type_fp& points);

    bool empty() const {
        return !box;
    }
    const boost::optional<box_type_fp>& get() const {
        return box;
    }
    boost::optional<coordinate_type_fp> left_x() const;
    boost::optional<coordinate_type_fp> right_x() const;
    boost::optional<coordinate_type_fp> bottom_y() const;
    boost::optional<coordinate_type_fp> top_y() const;
    // Zero while empty.
    coordinate_type_fp width() const;
    coordinate_type_fp height() const;

private:
    boost::optional<box_type_fp> box;
};

/* Points whose envelope contains a multi-quadrant arc from start to end
 * around start + offset.  A zero-length arc is a full circle.  The points are
 * start, end and each axis extreme of the circle that the sweep passes.  The
 * radius is the larger of the start and end radii, so the result may be a
 * little larger than the arc but never smaller.
 */
multi_point_type_fp arc_bounding_points(const point_type_fp& start, const point_type_fp& end,
                                        const point_type_fp& offset,
                                        ArcDirection::ArcDirection direction);

#endif // BOUNDING_BOX_H
