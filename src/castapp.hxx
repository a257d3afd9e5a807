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
#ifndef _CASTAPP_HXX_INCLUDED_
#define _CASTAPP_HXX_INCLUDED_

#include <string>
#include <vector>
#include <memory>

#include "libupcast/control/discovery.hxx"
#include "libupcast/control/devicecontroller.hxx"
#include "libupcast/server/mediaserver.hxx"
#include "libupcast/transcode/transcoder.hxx"

class ConfSimple;

namespace UpCast {
class SSDPSearcher;
class NetFetch;
class Canceller;
}

/**
 * Ties the pipeline together: find renderers, serve a file, and tell a
 * renderer to play it.
 */
class CastApp {
public:
    class Config {
    public:
        Config()
            : searchtimeoutms(5000), detailtimeoutms(3000) {}
        std::string upnpiface;
        int searchtimeoutms;
        int detailtimeoutms;
        UpCast::DeviceController::Options ctl;
        UpCast::MediaServer::Options server;
        UpCast::Transcoder::Options transcode;
    };

    /** Read the configuration values. Missing ones keep their default. */
    static void readConfig(ConfSimple& conf, Config& config);

    /**
     * @param searcher, fetcher not owned. If null, the libupnp searcher
     *   (created on first use) and the curl fetcher are used.
     */
    CastApp(const Config& config, UpCast::SSDPSearcher *searcher = nullptr,
            UpCast::NetFetch *fetcher = nullptr);
    ~CastApp();

    /** Media URL for a file in the served directory */
    static std::string buildMediaURL(const std::string& baseurl,
                                     const std::string& filename,
                                     int subidx = -1, int audioidx = -1);

    /** Run a discovery session */
    int discover(std::vector<UpCast::DeviceRecord>& devices,
                 UpCast::Discoverer::FoundCB cb,
                 const UpCast::Canceller *cancel, std::string *reason = 0);

    /** Look up a renderer by friendly name or UDN in a device list */
    static bool findRenderer(const std::string& name,
                             const std::vector<UpCast::DeviceRecord>& devices,
                             UpCast::DeviceRecord& found);

    /** Find the description URL for a renderer: used as is if it is
     *  an http URL, else looked up by name or UDN through discovery. */
    int locateRenderer(const std::string& renderer, std::string& location,
                       const UpCast::Canceller *cancel,
                       std::string *reason = 0);

    /**
     * Serve file and tell the renderer to play it.
     * @param location renderer description URL
     * @param subidx, audioidx stream selections or -1
     */
    int cast(const std::string& location, const std::string& file,
             int subidx, int audioidx, const UpCast::Canceller *cancel,
             std::string *reason = 0);

    /** Send Stop to the renderer */
    int stopRenderer(const std::string& location,
                     const UpCast::Canceller *cancel,
                     std::string *reason = 0);

    /** Stop the media server (deletes the transcoded files) */
    void stopServing();

    UpCast::Transcoder& transcoder();
    UpCast::MediaServer& server();
    /** Controller for the last cast, may be null */
    UpCast::DCH controller();

private:
    class Internal;
    std::unique_ptr<Internal> m;

    CastApp(const CastApp&) = delete;
    CastApp& operator=(const CastApp&) = delete;
};

#endif /* _CASTAPP_HXX_INCLUDED_ */
