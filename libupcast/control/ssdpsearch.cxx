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
#include "libupcast/control/ssdpsearch.hxx"

#include <upnp/upnp.h>
#include <upnp/upnptools.h>

#include <mutex>
#include <sstream>

#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

// libupnp can only be initialized once per process.
static std::mutex initmutex;
static bool upnpinitdone;

static int initLibUPnP(const string& ifname, string *reason)
{
    std::unique_lock<std::mutex> lock(initmutex);
    if (upnpinitdone) {
        return UPNP_E_SUCCESS;
    }
    int code = UpnpInit2(ifname.empty() ? nullptr : ifname.c_str(), 0);
    if (code != UPNP_E_SUCCESS) {
        if (reason) {
            *reason = string("UpnpInit2 failed: ") + UpnpGetErrorMessage(code);
        }
        return code;
    }
    upnpinitdone = true;
    const char *ip = UpnpGetServerIpAddress();
    LOGDEB("initLibUPnP: using address " << (ip ? ip : "?") << " port " <<
           UpnpGetServerPort() << endl);
    return UPNP_E_SUCCESS;
}

void LibUPnPSearcher::terminate()
{
    std::unique_lock<std::mutex> lock(initmutex);
    if (upnpinitdone) {
        UpnpFinish();
        upnpinitdone = false;
    }
}

class LibUPnPSearcher::Internal {
public:
    int callback(Upnp_EventType et, const void *evp);

    bool ok{false};
    string reason;
    UpnpClient_Handle clh{-1};

    // Current search. The mutex is held while calling the client, so that
    // search() can't return while a callback is running.
    std::mutex mutex;
    bool active{false};
    bool timedout{false};
    string target;
    ResponseCB cb;
};

// This gets called in a libupnp thread context for all asynchronous
// events which we asked for.
static int cluCallBack(Upnp_EventType et, const void* evp, void *cookie)
{
    LibUPnPSearcher::Internal *me =
        static_cast<LibUPnPSearcher::Internal*>(cookie);
    return me ? me->callback(et, evp) : UPNP_E_SUCCESS;
}

int LibUPnPSearcher::Internal::callback(Upnp_EventType et, const void *evp)
{
    switch (et) {
    case UPNP_DISCOVERY_SEARCH_RESULT:
    {
        const UpnpDiscovery *disco = (const UpnpDiscovery *)evp;
        if (UpnpDiscovery_get_ErrCode(disco) != UPNP_E_SUCCESS) {
            LOGDEB("SSDP: search result with error " <<
                   UpnpDiscovery_get_ErrCode(disco) << endl);
            break;
        }
        SSDPResponse resp;
        resp.deviceId = UpnpDiscovery_get_DeviceID_cstr(disco);
        resp.location = UpnpDiscovery_get_Location_cstr(disco);
        resp.server = UpnpDiscovery_get_Os_cstr(disco);
        string tp = UpnpDiscovery_get_ServiceType_cstr(disco);
        if (tp.empty()) {
            tp = UpnpDiscovery_get_DeviceType_cstr(disco);
        }
        resp.usn = resp.deviceId;
        if (!tp.empty()) {
            resp.usn += "::" + tp;
        }
        std::unique_lock<std::mutex> lock(mutex);
        if (!active) {
            LOGDEB1("SSDP: late response from " << resp.location << endl);
            break;
        }
        resp.st = target;
        LOGDEB1("SSDP: " << resp.usn << " at " << resp.location << endl);
        if (cb) {
            cb(resp);
        }
        break;
    }
    case UPNP_DISCOVERY_SEARCH_TIMEOUT:
    {
        std::unique_lock<std::mutex> lock(mutex);
        timedout = true;
        break;
    }
    default:
        // Ignore advertisements and other events
        LOGDEB1("SSDP: unprocessed evt type: " << et << endl);
        break;
    }
    return UPNP_E_SUCCESS;
}

LibUPnPSearcher::LibUPnPSearcher(const string& ifname)
    : m(new Internal())
{
    int code = initLibUPnP(ifname, &m->reason);
    if (code != UPNP_E_SUCCESS) {
        LOGERR("LibUPnPSearcher: " << m->reason << endl);
        return;
    }
    code = UpnpRegisterClient(cluCallBack, (void *)m.get(), &m->clh);
    if (code != UPNP_E_SUCCESS) {
        m->reason = string("UpnpRegisterClient failed: ") +
            UpnpGetErrorMessage(code);
        LOGERR("LibUPnPSearcher: " << m->reason << endl);
        return;
    }
    m->ok = true;
}

LibUPnPSearcher::~LibUPnPSearcher()
{
    if (m->clh != -1) {
        UpnpUnRegisterClient(m->clh);
        m->clh = -1;
    }
}

bool LibUPnPSearcher::ok() const
{
    return m->ok;
}

const string& LibUPnPSearcher::getReason() const
{
    return m->reason;
}

int LibUPnPSearcher::search(const string& target, int mxsecs,
                            const Canceller& window, ResponseCB cb,
                            string *reason)
{
    if (!m->ok) {
        if (reason) {
            *reason = m->reason;
        }
        return UPC_E_INIT;
    }
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        m->active = true;
        m->timedout = false;
        m->target = target;
        m->cb = cb;
    }

    LOGDEB("LibUPnPSearcher::search: " << target << " mx " << mxsecs << endl);
    int ret = UPC_OK;
    int code = UpnpSearchAsync(m->clh, mxsecs, target.c_str(), m.get());
    if (code != UPNP_E_SUCCESS) {
        LOGERR("LibUPnPSearcher::search: UpnpSearchAsync failed: " <<
               UpnpGetErrorMessage(code) << endl);
        if (reason) {
            *reason = string("UpnpSearchAsync: ") + UpnpGetErrorMessage(code);
        }
        ret = UPC_E_NETWORK;
    } else {
        // Wait for the libupnp timeout event or the end of our window.
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(m->mutex);
                if (m->timedout) {
                    break;
                }
            }
            if (!window.sleepms(50)) {
                break;
            }
        }
    }

    std::unique_lock<std::mutex> lock(m->mutex);
    m->active = false;
    m->cb = ResponseCB();
    return ret;
}

} // namespace UpCast
