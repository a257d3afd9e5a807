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
#ifndef _NETFETCH_H_INCLUDED_
#define _NETFETCH_H_INCLUDED_

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace UpCast {

class Canceller;

//
// Wrapper for a blocking HTTP request/response exchange.
//
// The transfer is aborted when the Canceller is cancelled or its
// deadline passes, or after timeoutms, whichever comes first.
//
// Implementations must be usable from several threads at once.
class NetFetch {
public:
    virtual ~NetFetch() {}

    class Reply {
    public:
        int httpcode{0};
        std::string body;
        // Lower-cased header names
        std::map<std::string, std::string> headers;
    };

    typedef std::vector<std::pair<std::string, std::string> > HeaderList;

    /** Perform a GET.
     * @return UPC_OK if a reply was received whatever its HTTP code,
     *   UPC_E_CANCELLED, UPC_E_TIMEOUT or UPC_E_NETWORK. */
    virtual int get(const std::string& url, int timeoutms,
                    const Canceller *cancel, Reply& reply,
                    std::string *reason = 0) = 0;

    /** Perform a POST with the given headers and body. Same return
     *  values as get(). */
    virtual int post(const std::string& url, const HeaderList& headers,
                     const std::string& body, int timeoutms,
                     const Canceller *cancel, Reply& reply,
                     std::string *reason = 0) = 0;

    static bool is2xx(int httpcode) {
        return httpcode >= 200 && httpcode < 300;
    }
};

} // namespace UpCast

#endif /* _NETFETCH_H_INCLUDED_ */
