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
#include "libupcast/control/discovery.hxx"

#include <mutex>
#include <set>
#include <sstream>

#include "libupcast/control/ssdpsearch.hxx"
#include "libupcast/control/description.hxx"
#include "libupcast/netfetch.h"
#include "libupcast/canceller.hxx"
#include "libupcast/workqueue.h"
#include "libupcast/upcastlib.hxx"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

string DeviceRecord::dump() const
{
    ostringstream os;
    os << "DEVICE {friendlyName [" << friendlyName << "] UDN [" << UDN <<
        "] USN [" << usn << "] manufacturer [" << manufacturer <<
        "] modelName [" << modelName << "] location [" << location <<
        "] server [" << server << "]}";
    return os.str();
}

const int Discoverer::fetchSlots;

const vector<string>& Discoverer::targets()
{
    static const vector<string> tgts{
        "ssdp:all",
        "urn:schemas-upnp-org:device:MediaRenderer:1",
        "urn:schemas-upnp-org:device:MediaRenderer:2"
    };
    return tgts;
}

// Description fetch job, created for each new location.
class DetailTask {
public:
    string location;
    string usn;
    string server;
};

class Discoverer::Internal {
public:
    Internal(SSDPSearcher *s, NetFetch *f)
        : searcher(s), fetcher(f) {}

    void admit(const DeviceRecord& rec, const FoundCB& cb);
    bool seenLocation(const string& location);
    void fetchDetails(const DetailTask& task, const Canceller& session,
                      const FoundCB& cb);

    SSDPSearcher *searcher;
    NetFetch *fetcher;
    int detailtimeoutms{3000};

    // One session at a time
    std::mutex searchmutex;

    // Session results
    mutable std::mutex devmutex;
    vector<DeviceRecord> devices;
    set<string> keys;

    std::mutex locmutex;
    set<string> seenlocations;
};

void Discoverer::Internal::admit(const DeviceRecord& rec, const FoundCB& cb)
{
    {
        std::unique_lock<std::mutex> lock(devmutex);
        if (!keys.insert(rec.key()).second) {
            LOGDEB1("Discoverer: dup " << rec.key() << endl);
            return;
        }
        devices.push_back(rec);
    }
    LOGDEB("Discoverer: new device: " << rec.dump() << endl);
    if (cb) {
        cb(rec);
    }
}

// Returns true if the location was already queued in this session, else
// records it.
bool Discoverer::Internal::seenLocation(const string& location)
{
    std::unique_lock<std::mutex> lock(locmutex);
    return !seenlocations.insert(location).second;
}

void Discoverer::Internal::fetchDetails(const DetailTask& task,
                                        const Canceller& session,
                                        const FoundCB& cb)
{
    NetFetch::Reply reply;
    string reason;
    int ret = fetcher->get(task.location, detailtimeoutms, &session,
                           reply, &reason);
    if (session.done()) {
        LOGDEB("Discoverer: session over, dropping " << task.location << endl);
        return;
    }

    DeviceRecord rec;
    rec.usn = task.usn;
    rec.location = task.location;
    rec.server = task.server;
    if (ret == UPC_OK && NetFetch::is2xx(reply.httpcode)) {
        UPnPDeviceDesc desc(task.location, reply.body);
        if (desc.ok) {
            rec.UDN = desc.UDN;
            rec.friendlyName = desc.friendlyName;
            rec.manufacturer = desc.manufacturer;
            rec.modelName = desc.modelName;
            admit(rec, cb);
            return;
        }
        reason = desc.reason;
    } else if (ret == UPC_OK) {
        reason = string("HTTP status ") + to_string(reply.httpcode);
    }

    // Keep the device anyway, with what the SSDP response told us.
    LOGINF("Discoverer: description fetch failed for " << task.location <<
           ": " << reason << endl);
    rec.friendlyName = task.server.empty() ? task.usn : task.server;
    admit(rec, cb);
}

Discoverer::Discoverer(SSDPSearcher *searcher, NetFetch *fetcher)
    : m(new Internal(searcher, fetcher))
{
}

Discoverer::~Discoverer()
{
}

void Discoverer::setDetailTimeoutMs(int ms)
{
    m->detailtimeoutms = ms;
}

vector<DeviceRecord> Discoverer::getDevices() const
{
    std::unique_lock<std::mutex> lock(m->devmutex);
    return m->devices;
}

vector<DeviceRecord> Discoverer::search(int timeoutms, FoundCB cb,
                                        const Canceller *cancel)
{
    std::unique_lock<std::mutex> searchlock(m->searchmutex);
    {
        std::unique_lock<std::mutex> lock(m->devmutex);
        m->devices.clear();
        m->keys.clear();
    }
    {
        std::unique_lock<std::mutex> lock(m->locmutex);
        m->seenlocations.clear();
    }
    if (nullptr == m->searcher || nullptr == m->fetcher) {
        LOGERR("Discoverer::search: not initialized\n");
        return vector<DeviceRecord>();
    }

    Canceller session(cancel, timeoutms);
    WorkQueue<DetailTask> tasks("discovery");
    Internal *internal = m.get();
    tasks.start(fetchSlots, [&tasks, &session, internal, cb] () {
            DetailTask task;
            for (;;) {
                if (!tasks.take(&task)) {
                    tasks.workerExit();
                    return;
                }
                if (session.done()) {
                    continue;
                }
                internal->fetchDetails(task, session, cb);
            }
        });

    int querytimeoutms = timeoutms / 2;
    int mx = querytimeoutms / 1000;
    if (mx < 1)
        mx = 1;
    if (mx > 5)
        mx = 5;
    for (const auto& target : targets()) {
        if (session.done()) {
            break;
        }
        Canceller window(&session, querytimeoutms);
        string reason;
        int ret = m->searcher->search(
            target, mx, window,
            [&tasks, internal] (const SSDPResponse& resp) {
                if (resp.location.empty()) {
                    LOGDEB("Discoverer: no location for " << resp.usn << endl);
                    return;
                }
                if (internal->seenLocation(resp.location)) {
                    return;
                }
                DetailTask task;
                task.location = resp.location;
                task.usn = resp.usn;
                task.server = resp.server;
                tasks.put(task);
            }, &reason);
        if (ret != UPC_OK) {
            LOGERR("Discoverer::search: query for " << target << " failed: " <<
                   reason << endl);
        }
    }

    // Let the fetches in progress complete. They are bounded by their own
    // timeouts and by the session deadline.
    tasks.waitIdle();
    tasks.setTerminateAndWait();

    int status = session.status();
    if (status != UPC_OK) {
        LOGDEB("Discoverer::search: session ended: " <<
               errAsString("search", status) << endl);
    }
    return getDevices();
}

} // namespace UpCast
