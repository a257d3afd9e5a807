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
#ifndef _PATHUT_H_INCLUDED_
#define _PATHUT_H_INCLUDED_

#include <string>

/// Add a / at the end if none there yet.
extern void path_catslash(std::string& s);
/// Concatenate 2 paths
extern std::string path_cat(const std::string& s1, const std::string& s2);
/// Get the simple file name (get rid of any directory path prefix
extern std::string path_getsimple(const std::string& s);
/// Simple file name + optional suffix stripping
extern std::string path_basename(const std::string& s,
                                 const std::string& suff = std::string());
/// Component after last '.', empty if none
extern std::string path_suffix(const std::string& s);
/// Get the father directory
extern std::string path_getfather(const std::string& s);

/// Test if path is absolute
extern bool path_isabsolute(const std::string& s);

/// Test if path is root (/)
extern bool path_isroot(const std::string& p);

/// Turn into absolute path if needed and clean up the result: no
/// double slashes, no . or .. elements
extern std::string path_canon(const std::string& s,
                              const std::string *cwd = 0);

/// Create a directory path, including intermediate elements
extern bool path_makepath(const std::string& path, int mode);

/// Temporary files directory: $TMPDIR or /tmp
extern std::string path_tmpdir();

/// Create a uniquely named directory under parent. Returns empty on failure
/// with the error message in reason.
extern std::string path_mkdtemp(const std::string& parent,
                                const std::string& prefix,
                                std::string *reason = 0);

/// Delete a directory and everything under it.
extern bool path_rmtree(const std::string& path, std::string *reason = 0);

extern bool path_unlink(const std::string& path);

/// Stat parameter and check if it's a directory
extern bool path_isdir(const std::string& path);
/// Stat parameter and check if it's a regular file
extern bool path_isfile(const std::string& path);

/// Retrieve file size, -1 for error
extern long long path_filesize(const std::string& path);

/// Check that path is accessible
extern bool path_exists(const std::string& path);

/// Check that canonic path p is equal to or under canonic directory top
extern bool path_isdesc(const std::string& top, const std::string& p);

/// Encode according to rfc 1738
extern std::string url_encode(const std::string& url,
                              std::string::size_type offs = 0);
extern std::string url_decode(const std::string& encoded);

#endif /* _PATHUT_H_INCLUDED_ */
