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
#include "libupcast/control/devicecontroller.hxx"

#include <mutex>
#include <thread>

#include "libupcast/control/avtransport.hxx"
#include "libupcast/control/description.hxx"
#include "libupcast/netfetch.h"
#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

class DeviceController::Internal {
public:
    Internal(NetFetch *f, const string& loc, const Options& o)
        : fetcher(f), location(loc), opts(o) {}
    ~Internal() {
        stopSubscription();
    }

    void setState(State st) {
        std::unique_lock<std::mutex> lock(mutex);
        LOGDEB1("DeviceController: " << stateName(state) << " -> " <<
                stateName(st) << endl);
        state = st;
    }
    void startSubscription();
    void stopSubscription();

    NetFetch *fetcher;
    string location;
    Options opts;

    // Serializes resolve/play/stop
    std::mutex opmutex;

    // Guards state and the subscription slot
    mutable std::mutex mutex;
    State state{Uninitialized};
    UPnPDeviceDesc desc;
    std::unique_ptr<AVTransport> avt;
    HeartbeatCB hbcb;

    std::unique_ptr<Canceller> subcancel;
    std::thread subthread;
};

// Placeholder for event subscription renewal: just tick until cancelled.
void DeviceController::Internal::startSubscription()
{
    stopSubscription();

    std::unique_lock<std::mutex> lock(mutex);
    subcancel = std::unique_ptr<Canceller>(new Canceller());
    const Canceller *sc = subcancel.get();
    int intervalms = opts.heartbeatms;
    HeartbeatCB cb = hbcb;
    string name = desc.friendlyName;
    subthread = std::thread([sc, intervalms, cb, name] () {
            LOGDEB("DeviceController: heartbeat started for " << name << endl);
            while (sc->sleepms(intervalms)) {
                LOGDEB1("DeviceController: heartbeat for " << name << endl);
                if (cb) {
                    cb();
                }
            }
            LOGDEB("DeviceController: heartbeat ended for " << name << endl);
        });
}

void DeviceController::Internal::stopSubscription()
{
    std::unique_ptr<Canceller> sc;
    std::thread th;
    {
        std::unique_lock<std::mutex> lock(mutex);
        sc.swap(subcancel);
        th.swap(subthread);
    }
    if (sc) {
        sc->cancel();
    }
    if (th.joinable()) {
        th.join();
    }
}

DeviceController::DeviceController(NetFetch *fetcher, const string& location,
                                   const Options& opts)
    : m(new Internal(fetcher, location, opts))
{
}

DeviceController::~DeviceController()
{
}

DCH DeviceController::create(NetFetch *fetcher, const string& location,
                             const Canceller *cancel, int *err,
                             string *reason, const Options& opts)
{
    DCH dev(new DeviceController(fetcher, location, opts));
    int ret = dev->resolve(cancel, reason);
    if (err) {
        *err = ret;
    }
    if (ret != UPC_OK) {
        return DCH();
    }
    return dev;
}

int DeviceController::resolve(const Canceller *cancel, string *reason)
{
    std::unique_lock<std::mutex> oplock(m->opmutex);
    if (nullptr == m->fetcher) {
        if (reason)
            *reason = "no HTTP client";
        return UPC_E_INIT;
    }

    Canceller op(cancel);
    NetFetch::Reply reply;
    string fetchreason;
    int ret = m->fetcher->get(m->location, m->opts.httptimeoutms, &op,
                              reply, &fetchreason);
    if (ret == UPC_E_CANCELLED) {
        if (reason)
            *reason = "description fetch cancelled";
        return UPC_E_CANCELLED;
    }
    if (ret != UPC_OK || !NetFetch::is2xx(reply.httpcode)) {
        if (ret == UPC_OK) {
            fetchreason = string("HTTP status ") + to_string(reply.httpcode);
        }
        LOGERR("DeviceController::resolve: " << m->location << ": " <<
               fetchreason << endl);
        if (reason)
            *reason = string("description fetch failed for ") + m->location +
                ": " + fetchreason;
        return UPC_E_DESCFETCH;
    }

    UPnPDeviceDesc desc(m->location, reply.body);
    if (!desc.ok) {
        LOGERR("DeviceController::resolve: bad description at " <<
               m->location << ": " << desc.reason << endl);
        if (reason)
            *reason = string("bad description at ") + m->location + ": " +
                desc.reason;
        return UPC_E_DESCFETCH;
    }

    for (const auto& service : desc.services) {
        if (AVTransport::isAVTService(service.serviceType)) {
            std::unique_ptr<AVTransport> avt(
                new AVTransport(desc, service, m->fetcher,
                                m->opts.httptimeoutms));
            LOGDEB("DeviceController::resolve: " << desc.friendlyName <<
                   " control URL " << avt->getActionURL() << endl);
            std::unique_lock<std::mutex> lock(m->mutex);
            m->desc = desc;
            m->avt.swap(avt);
            m->state = DescriptionResolved;
            return UPC_OK;
        }
    }

    LOGERR("DeviceController::resolve: no AVTransport service in " <<
           desc.friendlyName << " at " << m->location << endl);
    if (reason)
        *reason = string("no AVTransport service in ") + desc.friendlyName;
    return UPC_E_NOSERVICE;
}

int DeviceController::playMedia(const string& url, const Canceller *cancel,
                                string *reason)
{
    std::unique_lock<std::mutex> oplock(m->opmutex);
    if (!m->avt) {
        if (reason)
            *reason = "device not resolved";
        return UPC_E_STATE;
    }

    LOGINF("DeviceController::playMedia: " << m->desc.friendlyName <<
           " <- " << url << endl);
    // The previous session ends here, whatever happens next
    m->stopSubscription();
    if (getState() == Playing) {
        m->setState(SourceSet);
    }
    Canceller op(cancel);
    int ret = m->avt->setURI(url, string(), &op, reason);
    if (ret != UPC_OK) {
        return ret;
    }
    m->setState(SourceSet);

    if (m->opts.settlems > 0 && !op.sleepms(m->opts.settlems)) {
        ret = op.status();
        LOGDEB("DeviceController::playMedia: interrupted during settle: " <<
               errAsString("playMedia", ret) << endl);
        if (reason)
            *reason = "interrupted while waiting for the renderer";
        return ret;
    }

    ret = m->avt->play(1, &op, reason);
    if (ret != UPC_OK) {
        return ret;
    }
    m->setState(Playing);
    m->startSubscription();
    return UPC_OK;
}

int DeviceController::stop(const Canceller *cancel, string *reason)
{
    std::unique_lock<std::mutex> oplock(m->opmutex);
    if (!m->avt) {
        if (reason)
            *reason = "device not resolved";
        return UPC_E_STATE;
    }
    Canceller op(cancel);
    int ret = m->avt->stop(&op, reason);
    m->stopSubscription();
    if (ret == UPC_OK && getState() == Playing) {
        m->setState(SourceSet);
    }
    return ret;
}

DeviceController::State DeviceController::getState() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->state;
}

bool DeviceController::subscriptionActive() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->subcancel.get() != nullptr;
}

void DeviceController::setHeartbeatCB(HeartbeatCB cb)
{
    std::unique_lock<std::mutex> lock(m->mutex);
    m->hbcb = cb;
}

const string& DeviceController::getLocation() const
{
    return m->location;
}

const UPnPDeviceDesc& DeviceController::getDescription() const
{
    return m->desc;
}

string DeviceController::getServiceType() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->avt ? m->avt->getServiceType() : string();
}

string DeviceController::getControlURL() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->avt ? m->avt->getActionURL() : string();
}

string DeviceController::getEventURL() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->avt ? m->avt->getEventURL() : string();
}

const char *DeviceController::stateName(State st)
{
    switch (st) {
    case Uninitialized: return "Uninitialized";
    case DescriptionResolved: return "DescriptionResolved";
    case SourceSet: return "SourceSet";
    case Playing: return "Playing";
    }
    return "Unknown";
}

} // namespace UpCast
