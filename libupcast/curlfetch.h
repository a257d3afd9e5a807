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
#ifndef _CURLFETCH_H_INCLUDED_
#define _CURLFETCH_H_INCLUDED_

#include <string>

#include "libupcast/netfetch.h"

namespace UpCast {

//
// libcurl-based HTTP transactions. Each call uses its own easy handle, so
// a single object can be shared by several threads.
//
class CurlFetch : public NetFetch {
public:
    CurlFetch();
    virtual ~CurlFetch();

    virtual int get(const std::string& url, int timeoutms,
                    const Canceller *cancel, Reply& reply,
                    std::string *reason = 0);

    virtual int post(const std::string& url, const HeaderList& headers,
                     const std::string& body, int timeoutms,
                     const Canceller *cancel, Reply& reply,
                     std::string *reason = 0);

private:
    int perform(const std::string& url, const HeaderList *headers,
                const std::string *body, int timeoutms,
                const Canceller *cancel, Reply& reply, std::string *reason);
};

} // namespace UpCast

#endif /* _CURLFETCH_H_INCLUDED_ */
