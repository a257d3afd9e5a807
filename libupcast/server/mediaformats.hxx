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
#ifndef _MEDIAFORMATS_HXX_INCLUDED_
#define _MEDIAFORMATS_HXX_INCLUDED_

#include <string>

namespace UpCast {

/** How we can deliver a file to a renderer */
enum MediaFormatClass {
    MFC_UNSUPPORTED,
    /// Renderers play it directly
    MFC_ASIS,
    /// Must go through the transcoder
    MFC_TRANSCODE
};

/** Classify according to the file name extension (case-insensitive) */
extern MediaFormatClass mediaFormatClass(const std::string& path);

/** MIME type from the file name extension. application/octet-stream if
 *  unknown. */
extern std::string mimeTypeForPath(const std::string& path);

} // namespace UpCast

#endif /* _MEDIAFORMATS_HXX_INCLUDED_ */
