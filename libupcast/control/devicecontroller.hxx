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
#ifndef _DEVICECONTROLLER_HXX_INCLUDED_
#define _DEVICECONTROLLER_HXX_INCLUDED_

#include <string>
#include <memory>
#include <functional>

namespace UpCast {

class NetFetch;
class Canceller;
class UPnPDeviceDesc;
class DeviceController;

typedef std::shared_ptr<DeviceController> DCH;

/**
 * Drive one media renderer through its AVTransport service.
 *
 * The object is first resolved: the description document is fetched
 * and the AVTransport control URL is computed. playMedia() then sets
 * the source URI, waits for the renderer to settle, and starts
 * playback. Once playing, a background heartbeat runs until stop(), a
 * new playMedia() or destruction.
 */
class DeviceController {
public:
    enum State {Uninitialized, DescriptionResolved, SourceSet, Playing};

    class Options {
    public:
        Options()
            : httptimeoutms(5000), settlems(2000), heartbeatms(30000) {}
        /// Timeout for each HTTP exchange
        int httptimeoutms;
        /// Delay between SetAVTransportURI and Play
        int settlems;
        /// Subscription heartbeat interval
        int heartbeatms;
    };

    typedef std::function<void ()> HeartbeatCB;

    /** Build an unresolved controller. Call resolve() before use. */
    DeviceController(NetFetch *fetcher, const std::string& location,
                     const Options& opts = Options());
    ~DeviceController();

    /** Build and resolve a controller for the device described at
     *  location.
     * @return a null handle on failure, with *err set to
     *   UPC_E_DESCFETCH, UPC_E_NOSERVICE or UPC_E_CANCELLED. */
    static DCH create(NetFetch *fetcher, const std::string& location,
                      const Canceller *cancel, int *err = 0,
                      std::string *reason = 0,
                      const Options& opts = Options());

    /** Fetch the description and locate the AVTransport service */
    int resolve(const Canceller *cancel, std::string *reason = 0);

    /** SetAVTransportURI, settle delay, Play.
     *
     * If setting the URI fails, Play is not attempted. Cancelling
     * during the delay or one of the calls returns UPC_E_CANCELLED.
     */
    int playMedia(const std::string& url, const Canceller *cancel,
                  std::string *reason = 0);

    /** Send Stop and end the heartbeat */
    int stop(const Canceller *cancel, std::string *reason = 0);

    State getState() const;
    bool subscriptionActive() const;

    /** Called on each heartbeat tick, from the heartbeat thread */
    void setHeartbeatCB(HeartbeatCB cb);

    const std::string& getLocation() const;
    /// The following are empty before resolution.
    const UPnPDeviceDesc& getDescription() const;
    std::string getServiceType() const;
    std::string getControlURL() const;
    std::string getEventURL() const;

    static const char *stateName(State st);

    class Internal;
private:
    std::unique_ptr<Internal> m;

    DeviceController(const DeviceController&) = delete;
    DeviceController& operator=(const DeviceController&) = delete;
};

} // namespace UpCast

#endif /* _DEVICECONTROLLER_HXX_INCLUDED_ */
