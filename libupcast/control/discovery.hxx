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
#ifndef _UPCDISC_H_X_INCLUDED_
#define _UPCDISC_H_X_INCLUDED_

#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace UpCast {

class SSDPSearcher;
class NetFetch;
class Canceller;

/** What we know about a discovered device */
class DeviceRecord {
public:
    std::string usn;
    /// Empty if the description could not be fetched
    std::string UDN;
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    /// Description document URL
    std::string location;
    /// SSDP SERVER header
    std::string server;

    /** Deduplication key: UDN, else USN, else location */
    const std::string& key() const {
        if (!UDN.empty())
            return UDN;
        if (!usn.empty())
            return usn;
        return location;
    }

    std::string dump() const;
};

/**
 * Search the local network for media renderers.
 *
 * Each search() call is a new session: the previous results are
 * dropped. M-SEARCH queries are sent in sequence for a few targets, and
 * the description documents of the responding devices are fetched in
 * parallel by a small pool of worker threads.
 *
 * The searcher and fetcher are not owned.
 */
class Discoverer {
public:
    Discoverer(SSDPSearcher *searcher, NetFetch *fetcher);
    ~Discoverer();

    /** Called once for each newly admitted device, from a worker thread */
    typedef std::function<void (const DeviceRecord&)> FoundCB;

    /** Run a search session.
     *
     * Never fails: on timeout or cancellation, the devices found so
     * far are returned.
     * @param timeoutms overall session duration.
     * @param cb optional callback for devices as they are found.
     * @param cancel optional cancellation token.
     */
    std::vector<DeviceRecord> search(int timeoutms, FoundCB cb = FoundCB(),
                                     const Canceller *cancel = nullptr);

    /** Results of the last or current session */
    std::vector<DeviceRecord> getDevices() const;

    /** Timeout for each description fetch. Default 3000 */
    void setDetailTimeoutMs(int ms);

    /** Search targets, in query order */
    static const std::vector<std::string>& targets();

    /** Number of parallel description fetches */
    static const int fetchSlots = 5;

    class Internal;
private:
    std::unique_ptr<Internal> m;

    Discoverer(const Discoverer&) = delete;
    Discoverer& operator=(const Discoverer&) = delete;
};

} // namespace UpCast

#endif /* _UPCDISC_H_X_INCLUDED_ */
