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

#include <algorithm>
#include <cmath>
#include <iterator>

#include "bounding_box.hpp"

void BoundingBox::extend(const point_type_fp& point) {
    if (!box) {
        box = bg::return_envelope<box_type_fp>(point);
    } else {
        bg::expand(*box, point);
    }
}

void BoundingBox::extend(const multi_point_type_fp& points) {
    for (const auto& point : points) {
        extend(point);
    }
}

boost::optional<coordinate_type_fp> BoundingBox::left_x() const {
    if (!box) {
        return boost::none;
    }
    return box->min_corner().x();
}

boost::optional<coordinate_type_fp> BoundingBox::right_x() const {
    if (!box) {
        return boost::none;
    }
    return box->max_corner().x();
}

boost::optional<coordinate_type_fp> BoundingBox::bottom_y() const {
    if (!box) {
        return boost::none;
    }
    return box->min_corner().y();
}

boost::optional<coordinate_type_fp> BoundingBox::top_y() const {
    if (!box) {
        return boost::none;
    }
    return box->max_corner().y();
}

coordinate_type_fp BoundingBox::width() const {
    if (!box) {
        return 0;
    }
    return box->max_corner().x() - box->min_corner().x();
}

coordinate_type_fp BoundingBox::height() const {
    if (!box) {
        return 0;
    }
    return box->max_corner().y() - box->min_corner().y();
}

// Angle of p around center in [0, 2pi).
static double angle_around(const point_type_fp& center, const point_type_fp& p) {
    double angle = std::atan2(p.y() - center.y(), p.x() - center.x());
    if (angle < 0) {
        angle += 2 * bg::math::pi<double>();
    }
    return angle;
}

// Counterclockwise sweep from one angle to another, in [0, 2pi).
static double ccw_sweep(double from, double to) {
    double sweep = std::fmod(to - from, 2 * bg::math::pi<double>());
    if (sweep < 0) {
        sweep += 2 * bg::math::pi<double>();
    }
    return sweep;
}

multi_point_type_fp arc_bounding_points(const point_type_fp& start, const point_type_fp& end,
                                        const point_type_fp& offset,
                                        ArcDirection::ArcDirection direction) {
    const point_type_fp center(start.x() + offset.x(), start.y() + offset.y());
    const coordinate_type_fp radius = std::max(bg::distance(start, center),
                                               bg::distance(end, center));

    multi_point_type_fp points;
    points.push_back(start);
    if (radius == 0) {
        points.push_back(end);
        return points;
    }

    // East, north, west and south extremes.
    const point_type_fp extremes[] = {
        point_type_fp(center.x() + radius, center.y()),
        point_type_fp(center.x(), center.y() + radius),
        point_type_fp(center.x() - radius, center.y()),
        point_type_fp(center.x(), center.y() - radius)
    };
    const double extreme_angles[] = {0, bg::math::pi<double>() / 2, bg::math::pi<double>(), 3 * bg::math::pi<double>() / 2};

    if (bg::equals(start, end)) {
        points.insert(points.end(), std::begin(extremes), std::end(extremes));
        return points;
    }

    points.push_back(end);
    const double start_angle = angle_around(center, start);
    const double end_angle = angle_around(center, end);
    for (unsigned int i = 0; i < 4; i++) {
        bool swept;
        if (direction == ArcDirection::COUNTERCLOCKWISE) {
            swept = ccw_sweep(start_angle, extreme_angles[i]) <= ccw_sweep(start_angle, end_angle);
        } else {
            swept = ccw_sweep(extreme_angles[i], start_angle) <= ccw_sweep(end_angle, start_angle);
        }
        if (swept) {
            points.push_back(extremes[i]);
        }
    }
    return points;
}
