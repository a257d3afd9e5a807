/* Copyright (C) 2014 J.F.Dockes
 *       This program is free software; you can redistribute it and/or modify
 *       it under the terms of the GNU General Public License as published by
 *       the Free Software Foundation; either version 2 of the License, or
 *       (at your option) any later version.
 *
 *       This program is distributed in the hope that it will be useful,
 *       but WITHOUT ANY WARRANTY; without even the implied warranty of
 *       MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *       GNU General Public License for more details.
 *
 *       You should have received a copy of the GNU General Public License
 *       along with this program; if not, write to the
 *       Free Software Foundation, Inc.,
 *       59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _UPCASTP_H_X_INCLUDED_
#define _UPCASTP_H_X_INCLUDED_

/* Private shared defs for the library. Clients need not and should
   not include this */

#include <string>

namespace UpCast {

// Resolve possibly relative reference against base (absolute references
// are returned unchanged, /xx replaces the path, other are appended to the
// base "directory").
extern std::string resolveurl(const std::string& base, const std::string& ref);

// Return the first non-loopback IPv4 address, for the named interface if
// iface is not empty. Empty result if none found.
extern std::string getLanIPv4(const std::string& iface = std::string());

} // namespace

#endif /* _UPCASTP_H_X_INCLUDED_ */
