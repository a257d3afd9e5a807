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
#ifndef _SSDPSEARCH_H_X_INCLUDED_
#define _SSDPSEARCH_H_X_INCLUDED_

#include <string>
#include <memory>
#include <functional>

namespace UpCast {

class Canceller;

/** One answer to an M-SEARCH */
class SSDPResponse {
public:
    /// Unique Service Name: uuid:xxx[::urn:...]
    std::string usn;
    /// The device UUID part of the USN
    std::string deviceId;
    /// SERVER header: OS/version UPnP/1.0 product/version
    std::string server;
    /// Description document URL
    std::string location;
    /// Search target this answers
    std::string st;
};

/**
 * SSDP multicast search. Implementations deliver responses through
 * the callback, possibly from other threads, until the search window
 * closes.
 */
class SSDPSearcher {
public:
    virtual ~SSDPSearcher() {}

    typedef std::function<void (const SSDPResponse&)> ResponseCB;

    /** Send an M-SEARCH for target and collect answers.
     *
     * Returns when the devices had mxsecs to answer or when the
     * window Canceller is done, whichever comes first. No callback
     * is made after the return.
     * @return UPC_OK or an error code if the search could not be sent.
     */
    virtual int search(const std::string& target, int mxsecs,
                       const Canceller& window, ResponseCB cb,
                       std::string *reason = 0) = 0;
};

/**
 * SSDP search through libupnp. The library is initialized on the first
 * object creation. Only one search runs at a time for a given object.
 */
class LibUPnPSearcher : public SSDPSearcher {
public:
    /** @param ifname network interface to use, empty for the first
     *  suitable one. */
    LibUPnPSearcher(const std::string& ifname = std::string());
    virtual ~LibUPnPSearcher();

    virtual int search(const std::string& target, int mxsecs,
                       const Canceller& window, ResponseCB cb,
                       std::string *reason = 0);

    bool ok() const;
    const std::string& getReason() const;

    /** Shut down libupnp. Call before exit, after all searchers are
     *  deleted. */
    static void terminate();

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

} // namespace UpCast

#endif /* _SSDPSEARCH_H_X_INCLUDED_ */
