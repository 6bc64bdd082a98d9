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

#ifndef GERBER_WRITER_H
#define GERBER_WRITER_H

#include <ostream>
#include <string>
#include <boost/noncopyable.hpp>

#include "gerber_document.hpp"

/******************************************************************************/
/*
 Writes a GerberDocument back out as RS-274X: the format and mode headers,
 the macros and apertures, then the functions in order, then M02 unless the
 document already ends with it.
 */
/******************************************************************************/
class GerberWriter : private boost::noncopyable
{
public:
    bool write(std::ostream& out, const GerberDocument& document);
    bool write(const std::string& filename, const GerberDocument& document);

    const std::string& error() const {
        return last_error;
    }

private:
    std::string last_error;
};

#endif // GERBER_WRITER_H
