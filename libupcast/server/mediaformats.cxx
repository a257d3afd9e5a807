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
#include "libupcast/server/mediaformats.hxx"

#include <unordered_map>
#include <unordered_set>

#include "libupcast/pathut.h"
#include "libupcast/smallut.h"

using namespace std;

namespace UpCast {

static const unordered_set<string> asisSuffixes{"mp4", "m4v"};

static const unordered_set<string> transcodeSuffixes{
    "mkv", "avi", "wmv", "flv", "mov", "mpg", "mpeg", "webm"};

static const unordered_map<string, string> mimeTypes{
    {"mp4", "video/mp4"},
    {"m4v", "video/mp4"},
    {"mkv", "video/x-matroska"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"mp3", "audio/mpeg"},
    {"aac", "audio/aac"},
    {"flac", "audio/flac"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
};

MediaFormatClass mediaFormatClass(const string& path)
{
    string suff = stringtolower(path_suffix(path));
    if (asisSuffixes.find(suff) != asisSuffixes.end())
        return MFC_ASIS;
    if (transcodeSuffixes.find(suff) != transcodeSuffixes.end())
        return MFC_TRANSCODE;
    return MFC_UNSUPPORTED;
}

string mimeTypeForPath(const string& path)
{
    auto it = mimeTypes.find(stringtolower(path_suffix(path)));
    if (it == mimeTypes.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

} // namespace UpCast
