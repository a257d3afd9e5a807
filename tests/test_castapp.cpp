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
#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "fakes.h"
#include "castapp.hxx"
#include "libupcast/conftree.h"
#include "libupcast/upcastlib.hxx"
#include "libupcast/pathut.h"

using namespace std;
using namespace UpCast;
using namespace UpCastTest;

static const string conftext(
    "# upcast test configuration\n"
    "upnpiface = eth1\n"
    "searchtimeout = 3\n"
    "detailtimeoutms = 1500\n"
    "controltimeoutms = 4000\n"
    "settledelayms = 500\n"
    "heartbeatsecs = 10\n"
    "httpport = 9090\n"
    "httphost = media.local\n"
    "ffmpeg = /opt/ff/bin/ffmpeg\n"
    "transcodejobs = 3\n"
    "transcodettl = 3600\n"
    "sublangs = fr, fre\tfra\n"
    "reencodeaudio = dts truehd \\\n"
    "   eac3\n"
    "[other]\n"
    "httpport = 1\n");

TEST(Config, ConfSimple)
{
    ConfSimple conf(conftext);
    ASSERT_TRUE(conf.ok());
    string value;
    ASSERT_TRUE(conf.get("httphost", value));
    EXPECT_EQ("media.local", value);
    int port = 0;
    ASSERT_TRUE(conf.get("httpport", &port));
    EXPECT_EQ(9090, port);
    ASSERT_TRUE(conf.get("httpport", &port, "other"));
    EXPECT_EQ(1, port);
    EXPECT_FALSE(conf.get("nosuchname", value));
    // Not a number: unchanged
    EXPECT_FALSE(conf.get("httphost", &port));
    EXPECT_EQ(1, port);
    ASSERT_TRUE(conf.get("reencodeaudio", value));
    EXPECT_NE(string::npos, value.find("eac3"));
}

TEST(Config, FromFile)
{
    TempDir tmp;
    string fn = path_cat(tmp.path, "upcast.conf");
    {
        std::ofstream out(fn.c_str());
        out << conftext;
    }
    ConfSimple conf(fn.c_str());
    ASSERT_TRUE(conf.ok());
    int jobs = 0;
    ASSERT_TRUE(conf.get("transcodejobs", &jobs));
    EXPECT_EQ(3, jobs);

    ConfSimple missing(path_cat(tmp.path, "nosuchfile").c_str());
    EXPECT_FALSE(missing.ok());
    string value;
    EXPECT_FALSE(missing.get("httphost", value));
}

TEST(Config, ReadConfig)
{
    ConfSimple conf(conftext);
    CastApp::Config config;
    CastApp::readConfig(conf, config);
    EXPECT_EQ("eth1", config.upnpiface);
    EXPECT_EQ("eth1", config.server.iface);
    EXPECT_EQ(3000, config.searchtimeoutms);
    EXPECT_EQ(1500, config.detailtimeoutms);
    EXPECT_EQ(4000, config.ctl.httptimeoutms);
    EXPECT_EQ(500, config.ctl.settlems);
    EXPECT_EQ(10000, config.ctl.heartbeatms);
    EXPECT_EQ(9090, config.server.port);
    EXPECT_EQ("media.local", config.server.host);
    EXPECT_EQ("/opt/ff/bin/ffmpeg", config.transcode.ffmpeg);
    EXPECT_EQ("ffprobe", config.transcode.ffprobe);
    EXPECT_EQ(3, config.transcode.maxjobs);
    EXPECT_EQ(3600, config.transcode.ttlsecs);
    ASSERT_EQ(3u, config.transcode.sublangs.size());
    EXPECT_EQ("fra", config.transcode.sublangs[2]);
    ASSERT_EQ(3u, config.transcode.reencodeaudio.size());
    EXPECT_EQ("eac3", config.transcode.reencodeaudio[2]);
}

TEST(Config, Defaults)
{
    ConfSimple conf(string(""));
    CastApp::Config config;
    CastApp::readConfig(conf, config);
    EXPECT_EQ(5000, config.searchtimeoutms);
    EXPECT_EQ(3000, config.detailtimeoutms);
    EXPECT_EQ(8080, config.server.port);
    EXPECT_EQ(86400, config.transcode.ttlsecs);
    EXPECT_EQ(6u, config.transcode.sublangs.size());
    EXPECT_EQ(2u, config.transcode.reencodeaudio.size());
}

TEST(CastApp, MediaURL)
{
    EXPECT_EQ("http://10.0.0.1:8080/movie.mkv",
              CastApp::buildMediaURL("http://10.0.0.1:8080", "movie.mkv"));
    EXPECT_EQ("http://10.0.0.1:8080/my%20movie.mkv?subtitle=3",
              CastApp::buildMediaURL("http://10.0.0.1:8080/", "my movie.mkv",
                                     3));
    EXPECT_EQ("http://h:1/a.mkv?audio=2",
              CastApp::buildMediaURL("http://h:1", "a.mkv", -1, 2));
    EXPECT_EQ("http://h:1/a.mkv?subtitle=0&audio=1",
              CastApp::buildMediaURL("http://h:1", "a.mkv", 0, 1));
    EXPECT_EQ("http://h:1/what%3F.mkv",
              CastApp::buildMediaURL("http://h:1", "what?.mkv"));
}

TEST(CastApp, FindRenderer)
{
    vector<DeviceRecord> devs(2);
    devs[0].friendlyName = "Living Room";
    devs[0].UDN = "uuid:aaaa";
    devs[0].location = "http://10.0.0.2/d.xml";
    devs[1].friendlyName = "Kitchen";
    devs[1].usn = "uuid:bbbb::upnp:rootdevice";
    devs[1].location = "http://10.0.0.3/d.xml";

    DeviceRecord found;
    ASSERT_TRUE(CastApp::findRenderer("Kitchen", devs, found));
    EXPECT_EQ("http://10.0.0.3/d.xml", found.location);
    ASSERT_TRUE(CastApp::findRenderer("uuid:aaaa", devs, found));
    EXPECT_EQ("Living Room", found.friendlyName);
    ASSERT_TRUE(CastApp::findRenderer("aaaa", devs, found));
    EXPECT_EQ("Living Room", found.friendlyName);
    EXPECT_FALSE(CastApp::findRenderer("Bedroom", devs, found));
    // An empty UDN matches nothing
    EXPECT_FALSE(CastApp::findRenderer("", devs, found));
}

static const char rendererdesc[] =
    "<?xml version=\"1.0\"?><root><device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
    "<friendlyName>Bedroom TV</friendlyName><UDN>uuid:bedroom</UDN>"
    "<serviceList><service>"
    "<serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<controlURL>/AVTransport/ctl</controlURL>"
    "<eventSubURL>/AVTransport/evt</eventSubURL>"
    "</service></serviceList></device></root>";

class CastAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        location = "http://10.0.0.5:49152/desc.xml";
        config.searchtimeoutms = 1000;
        config.ctl.settlems = 10;
        config.ctl.heartbeatms = 1000;
        config.server.port = 48232;
        config.server.host = "127.0.0.1";
        config.transcode.tmpdir = tmp.path;
        searcher.add("ssdp:all", "uuid:bedroom::upnp:rootdevice", location);
        fetch.setGet(location, rendererdesc);
        fetch.setAction("SetAVTransportURI", 200);
        fetch.setAction("Play", 200);
        fetch.setAction("Stop", 200);
        mediadir = path_cat(tmp.path, "media");
        ASSERT_TRUE(path_makepath(mediadir, 0700));
        tmp.file("media/my movie.mp4", 300);
        tmp.file("media/readme.txt", 10);
    }

    TempDir tmp;
    FakeSearcher searcher;
    FakeFetch fetch;
    CastApp::Config config;
    string location;
    string mediadir;
};

TEST_F(CastAppTest, Discover)
{
    CastApp app(config, &searcher, &fetch);
    vector<DeviceRecord> devices;
    int calls = 0;
    string reason;
    ASSERT_EQ(UPC_OK, app.discover(devices,
                                   [&calls] (const DeviceRecord&) {calls++;},
                                   nullptr, &reason));
    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("Bedroom TV", devices[0].friendlyName);
    EXPECT_EQ(1, calls);
}

TEST_F(CastAppTest, LocateRenderer)
{
    CastApp app(config, &searcher, &fetch);
    string loc, reason;
    ASSERT_EQ(UPC_OK, app.locateRenderer("Bedroom TV", loc, nullptr,
                                         &reason));
    EXPECT_EQ(location, loc);

    // URLs are used without searching
    searcher.queried.clear();
    ASSERT_EQ(UPC_OK, app.locateRenderer("http://10.9.9.9/x.xml", loc,
                                         nullptr, &reason));
    EXPECT_EQ("http://10.9.9.9/x.xml", loc);
    EXPECT_TRUE(searcher.queried.empty());

    EXPECT_EQ(UPC_E_NOTFOUND, app.locateRenderer("Garage", loc, nullptr,
                                                 &reason));
    EXPECT_NE(string::npos, reason.find("Garage"));
}

TEST_F(CastAppTest, CastChecksFile)
{
    CastApp app(config, &searcher, &fetch);
    string reason;
    EXPECT_EQ(UPC_E_NOTFOUND,
              app.cast(location, path_cat(mediadir, "nothere.mp4"), -1, -1,
                       nullptr, &reason));
    EXPECT_EQ(UPC_E_UNSUPPORTED,
              app.cast(location, path_cat(mediadir, "readme.txt"), -1, -1,
                       nullptr, &reason));
    EXPECT_FALSE(app.server().running());
    EXPECT_TRUE(fetch.actions().empty());
}

TEST_F(CastAppTest, CastAndStop)
{
    CastApp app(config, &searcher, &fetch);
    string reason;
    ASSERT_EQ(UPC_OK, app.cast(location, path_cat(mediadir, "my movie.mp4"),
                               1, 2, nullptr, &reason)) << reason;
    EXPECT_TRUE(app.server().running());
    EXPECT_EQ(path_canon(mediadir), app.server().getRoot());
    EXPECT_EQ("http://127.0.0.1:48232", app.server().getBaseURL());

    vector<string> actions = fetch.actions();
    ASSERT_EQ(2u, actions.size());
    EXPECT_EQ("http://10.0.0.5:49152/AVTransport/ctl", fetch.posturls[0]);
    EXPECT_NE(string::npos, fetch.postbodies[0].find(
                  "<CurrentURI>http://127.0.0.1:48232/my%20movie.mp4?"
                  "subtitle=1&amp;audio=2</CurrentURI>"));

    DCH dev = app.controller();
    ASSERT_TRUE(dev);
    EXPECT_EQ(DeviceController::Playing, dev->getState());

    ASSERT_EQ(UPC_OK, app.stopRenderer(location, nullptr, &reason));
    actions = fetch.actions();
    ASSERT_EQ(3u, actions.size());
    EXPECT_EQ("Stop", actions[2]);
    // The existing controller was reused: one description fetch
    EXPECT_EQ(1u, fetch.getlog.size());

    app.stopServing();
    EXPECT_FALSE(app.server().running());
}

TEST_F(CastAppTest, CastToBadRenderer)
{
    CastApp app(config, &searcher, &fetch);
    string reason;
    EXPECT_EQ(UPC_E_DESCFETCH,
              app.cast("http://10.0.0.99/none.xml",
                       path_cat(mediadir, "my movie.mp4"), -1, -1, nullptr,
                       &reason));
    EXPECT_FALSE(app.controller());
    app.stopServing();
}
