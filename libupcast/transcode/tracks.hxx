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
#ifndef _TRACKS_HXX_INCLUDED_
#define _TRACKS_HXX_INCLUDED_

#include <string>
#include <sstream>

namespace UpCast {

/** Subtitle or audio stream inside a media container */
class TrackDescriptor {
public:
    enum Kind {Subtitle, Audio};

    Kind kind{Subtitle};
    /// Absolute stream index in the container, as ffprobe reports it
    int index{-1};
    std::string language;
    std::string title;
    bool isdefault{false};
    /// Audio only: codec name, e.g. aac, ac3, dts
    std::string codec;

    std::string dump() const {
        std::ostringstream os;
        os << (kind == Subtitle ? "SUBTITLE" : "AUDIO") << " {index " <<
            index << " language [" << language << "] title [" << title <<
            "]";
        if (kind == Audio)
            os << " codec [" << codec << "]";
        if (isdefault)
            os << " default";
        os << "}";
        return os.str();
    }
};

/** Summary of the first video and audio streams of a file */
class MediaInfo {
public:
    std::string videocodec;
    int width{0};
    int height{0};
    /// Seconds, 0 if unknown
    double duration{0.0};
    std::string audiocodec;

    std::string dump() const {
        std::ostringstream os;
        os << "video [" << videocodec << " " << width << "x" << height <<
            " " << duration << " s] audio [" << audiocodec << "]";
        return os.str();
    }
};

} // namespace UpCast

#endif /* _TRACKS_HXX_INCLUDED_ */
