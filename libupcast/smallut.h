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
#ifndef _SMALLUT_H_INCLUDED_
#define _SMALLUT_H_INCLUDED_

#include <string>
#include <vector>

// Miscellaneous mostly string-oriented small utilities.

extern void trimstring(std::string& s, const char *ws = " \t\n");
extern void stringtolower(std::string& io);
extern std::string stringtolower(const std::string& io);

// Case-insensitive ascii string compare where s1 is already upper-case
extern int stringuppercmp(const std::string& s1, const std::string& s2);

/**
 * Split input string. No handling of quoting.
 * Empty tokens are dropped unless allowempty is set.
 */
extern void stringToTokens(const std::string& s,
                           std::vector<std::string>& tokens,
                           const std::string& delims = " \t",
                           bool allowempty = false);

/** Parse a decimal integer. Returns false if the string is empty or
 *  has trailing garbage, leaving *val unchanged. */
extern bool stringToInt(const std::string& s, int *val);

// @return false if s does not look like a bool at all (does not begin
// with [FfNnYyTt01]
extern std::string lltodecstr(long long val);

#ifndef MIN
#define MIN(A,B) (((A)<(B)) ? (A) : (B))
#endif
#ifndef MAX
#define MAX(A,B) (((A)>(B)) ? (A) : (B))
#endif

#endif /* _SMALLUT_H_INCLUDED_ */
