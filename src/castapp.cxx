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
#include "castapp.hxx"

#include <mutex>

#include "libupcast/control/ssdpsearch.hxx"
#include "libupcast/control/description.hxx"
#include "libupcast/server/mediaformats.hxx"
#include "libupcast/curlfetch.h"
#include "libupcast/canceller.hxx"
#include "libupcast/conftree.h"
#include "libupcast/upcastlib.hxx"
#include "libupcast/pathut.h"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;
using namespace UpCast;

class CastApp::Internal {
public:
    Internal(const Config& c, SSDPSearcher *s, NetFetch *f)
        : config(c), searcher(s), fetcher(f),
          transcoder(c.transcode), server(&transcoder, c.server) {
        if (nullptr == fetcher) {
            ownfetcher = std::unique_ptr<NetFetch>(new CurlFetch());
            fetcher = ownfetcher.get();
        }
    }

    SSDPSearcher *getSearcher(string *reason);

    Config config;
    SSDPSearcher *searcher;
    std::unique_ptr<SSDPSearcher> ownsearcher;
    NetFetch *fetcher;
    std::unique_ptr<NetFetch> ownfetcher;
    Transcoder transcoder;
    MediaServer server;
    std::mutex mutex;
    DCH dev;
};

// libupnp is only initialized if we actually need to search.
SSDPSearcher *CastApp::Internal::getSearcher(string *reason)
{
    if (searcher) {
        return searcher;
    }
    LibUPnPSearcher *lsearcher = new LibUPnPSearcher(config.upnpiface);
    ownsearcher = std::unique_ptr<SSDPSearcher>(lsearcher);
    if (!lsearcher->ok()) {
        if (reason)
            *reason = lsearcher->getReason();
        ownsearcher.reset();
        return nullptr;
    }
    searcher = lsearcher;
    return searcher;
}

static void confInt(ConfSimple& conf, const char *name, int *value,
                    int mult = 1)
{
    int v;
    if (conf.get(name, &v)) {
        *value = v * mult;
    }
}

static void confList(ConfSimple& conf, const char *name,
                     vector<string>& values)
{
    string value;
    if (conf.get(name, value)) {
        values.clear();
        stringToTokens(value, values, " \t,");
    }
}

void CastApp::readConfig(ConfSimple& conf, Config& config)
{
    if (conf.get("upnpiface", config.upnpiface)) {
        config.server.iface = config.upnpiface;
    }
    confInt(conf, "searchtimeout", &config.searchtimeoutms, 1000);
    confInt(conf, "detailtimeoutms", &config.detailtimeoutms);

    confInt(conf, "controltimeoutms", &config.ctl.httptimeoutms);
    confInt(conf, "settledelayms", &config.ctl.settlems);
    confInt(conf, "heartbeatsecs", &config.ctl.heartbeatms, 1000);

    confInt(conf, "httpport", &config.server.port);
    conf.get("httphost", config.server.host);

    conf.get("ffmpeg", config.transcode.ffmpeg);
    conf.get("ffprobe", config.transcode.ffprobe);
    conf.get("transcodedir", config.transcode.tmpdir);
    confInt(conf, "transcodejobs", &config.transcode.maxjobs);
    confInt(conf, "transcodettl", &config.transcode.ttlsecs);
    confList(conf, "sublangs", config.transcode.sublangs);
    confList(conf, "reencodeaudio", config.transcode.reencodeaudio);
}

CastApp::CastApp(const Config& config, SSDPSearcher *searcher,
                 NetFetch *fetcher)
    : m(new Internal(config, searcher, fetcher))
{
}

CastApp::~CastApp()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    m->dev.reset();
}

string CastApp::buildMediaURL(const string& baseurl, const string& filename,
                              int subidx, int audioidx)
{
    string url = baseurl;
    if (url.empty() || url.back() != '/') {
        url += "/";
    }
    url += url_encode(filename);
    string sep("?");
    if (subidx >= 0) {
        url += sep + "subtitle=" + lltodecstr(subidx);
        sep = "&";
    }
    if (audioidx >= 0) {
        url += sep + "audio=" + lltodecstr(audioidx);
    }
    return url;
}

int CastApp::discover(vector<DeviceRecord>& devices, Discoverer::FoundCB cb,
                      const Canceller *cancel, string *reason)
{
    SSDPSearcher *searcher = m->getSearcher(reason);
    if (nullptr == searcher) {
        return UPC_E_INIT;
    }
    Discoverer discoverer(searcher, m->fetcher);
    discoverer.setDetailTimeoutMs(m->config.detailtimeoutms);
    devices = discoverer.search(m->config.searchtimeoutms, cb, cancel);
    return UPC_OK;
}

bool CastApp::findRenderer(const string& name,
                           const vector<DeviceRecord>& devices,
                           DeviceRecord& found)
{
    for (const auto& dev : devices) {
        if (dev.friendlyName == name || (!dev.UDN.empty() && dev.UDN == name)) {
            found = dev;
            return true;
        }
    }
    // UDNs are often given without the uuid: prefix
    for (const auto& dev : devices) {
        if (dev.UDN == string("uuid:") + name) {
            found = dev;
            return true;
        }
    }
    return false;
}

int CastApp::locateRenderer(const string& renderer, string& location,
                            const Canceller *cancel, string *reason)
{
    if (renderer.find("http://") == 0 || renderer.find("https://") == 0) {
        location = renderer;
        return UPC_OK;
    }
    vector<DeviceRecord> devices;
    int ret = discover(devices, Discoverer::FoundCB(), cancel, reason);
    if (ret != UPC_OK) {
        return ret;
    }
    DeviceRecord dev;
    if (!findRenderer(renderer, devices, dev)) {
        if (reason)
            *reason = string("renderer not found: ") + renderer;
        return UPC_E_NOTFOUND;
    }
    location = dev.location;
    return UPC_OK;
}

int CastApp::cast(const string& location, const string& _file,
                  int subidx, int audioidx, const Canceller *cancel,
                  string *reason)
{
    string file = path_canon(_file);
    if (!path_isfile(file)) {
        if (reason)
            *reason = file + ": no such file";
        return UPC_E_NOTFOUND;
    }
    if (mediaFormatClass(file) == MFC_UNSUPPORTED) {
        if (reason)
            *reason = file + ": unsupported format";
        return UPC_E_UNSUPPORTED;
    }

    string baseurl;
    int ret = m->server.start(path_getfather(file), baseurl, reason);
    if (ret != UPC_OK) {
        return ret;
    }
    string url = buildMediaURL(baseurl, path_getsimple(file), subidx,
                               audioidx);

    int err;
    DCH dev = DeviceController::create(m->fetcher, location, cancel, &err,
                                       reason, m->config.ctl);
    if (!dev) {
        return err;
    }
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        m->dev = dev;
    }
    LOGINF("CastApp::cast: " << url << " -> " <<
           dev->getDescription().friendlyName << endl);
    return dev->playMedia(url, cancel, reason);
}

int CastApp::stopRenderer(const string& location, const Canceller *cancel,
                          string *reason)
{
    DCH dev;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (m->dev && m->dev->getLocation() == location) {
            dev = m->dev;
        }
    }
    if (!dev) {
        int err;
        dev = DeviceController::create(m->fetcher, location, cancel, &err,
                                       reason, m->config.ctl);
        if (!dev) {
            return err;
        }
    }
    return dev->stop(cancel, reason);
}

void CastApp::stopServing()
{
    m->server.stop();
}

Transcoder& CastApp::transcoder()
{
    return m->transcoder;
}

MediaServer& CastApp::server()
{
    return m->server;
}

DCH CastApp::controller()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->dev;
}
