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

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "fakes.h"
#include "libupcast/control/devicecontroller.hxx"
#include "libupcast/control/description.hxx"
#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"

using namespace std;
using namespace UpCast;
using namespace UpCastTest;

static const char location[] = "http://192.168.1.30:1400/xml/device.xml";

static const char avtdesc[] =
    "<?xml version=\"1.0\"?>"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\"><device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
    "<friendlyName>Kitchen</friendlyName><UDN>uuid:kitchen</UDN>"
    "<serviceList>"
    "<service><serviceType>urn:schemas-upnp-org:service:ConnectionManager:1"
    "</serviceType><controlURL>/cm/ctl</controlURL></service>"
    "<service><serviceType>urn:schemas-upnp-org:service:AVTransport:2"
    "</serviceType><controlURL>avt/ctl</controlURL>"
    "<eventSubURL>/avt/evt</eventSubURL></service>"
    "</serviceList></device></root>";

static const char noavtdesc[] =
    "<?xml version=\"1.0\"?><root><device>"
    "<friendlyName>Server</friendlyName><UDN>uuid:srv</UDN><serviceList>"
    "<service><serviceType>urn:schemas-upnp-org:service:ContentDirectory:1"
    "</serviceType><controlURL>/cd/ctl</controlURL></service>"
    "</serviceList></device></root>";

class DeviceControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetch.setGet(location, avtdesc);
        opts.settlems = 50;
        opts.heartbeatms = 20;
    }

    DCH make(int *err = nullptr, string *reason = nullptr) {
        return DeviceController::create(&fetch, location, nullptr, err,
                                        reason, opts);
    }

    FakeFetch fetch;
    DeviceController::Options opts;
};

TEST_F(DeviceControllerTest, Defaults)
{
    DeviceController::Options defopts;
    EXPECT_EQ(2000, defopts.settlems);
    EXPECT_EQ(30000, defopts.heartbeatms);
}

TEST_F(DeviceControllerTest, Resolve)
{
    DeviceController dev(&fetch, location, opts);
    EXPECT_EQ(DeviceController::Uninitialized, dev.getState());
    EXPECT_TRUE(dev.getControlURL().empty());
    string reason;
    ASSERT_EQ(UPC_OK, dev.resolve(nullptr, &reason)) << reason;
    EXPECT_EQ(DeviceController::DescriptionResolved, dev.getState());
    EXPECT_EQ("urn:schemas-upnp-org:service:AVTransport:2",
              dev.getServiceType());
    // Relative to the description directory, or to the host
    EXPECT_EQ("http://192.168.1.30:1400/xml/avt/ctl", dev.getControlURL());
    EXPECT_EQ("http://192.168.1.30:1400/avt/evt", dev.getEventURL());
    EXPECT_EQ("Kitchen", dev.getDescription().friendlyName);
    EXPECT_EQ(string(location), dev.getLocation());
}

TEST_F(DeviceControllerTest, NoService)
{
    fetch.setGet(location, noavtdesc);
    int err = 0;
    string reason;
    DCH dev = make(&err, &reason);
    EXPECT_FALSE(dev);
    EXPECT_EQ(UPC_E_NOSERVICE, err);
    EXPECT_NE(string::npos, reason.find("AVTransport"));
}

TEST_F(DeviceControllerTest, DescriptionErrors)
{
    int err = 0;
    string reason;
    fetch.setGet(location, "Not found", 404);
    EXPECT_FALSE(make(&err, &reason));
    EXPECT_EQ(UPC_E_DESCFETCH, err);
    EXPECT_NE(string::npos, reason.find("404"));

    fetch.setGet(location, "<root><device><friendlyName>");
    EXPECT_FALSE(make(&err, &reason));
    EXPECT_EQ(UPC_E_DESCFETCH, err);

    fetch.gets.clear();
    EXPECT_FALSE(make(&err, &reason));
    EXPECT_EQ(UPC_E_DESCFETCH, err);
}

TEST_F(DeviceControllerTest, PlaySequence)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200);
    fetch.setAction("Play", 200);
    std::atomic<int> beats(0);
    dev->setHeartbeatCB([&beats] () {beats++;});

    string url("http://192.168.1.10:8080/movie.mkv?subtitle=2");
    string reason;
    auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(UPC_OK, dev->playMedia(url, nullptr, &reason)) << reason;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_GE(elapsed, opts.settlems);
    EXPECT_EQ(DeviceController::Playing, dev->getState());
    EXPECT_TRUE(dev->subscriptionActive());

    vector<string> actions = fetch.actions();
    ASSERT_EQ(2u, actions.size());
    EXPECT_EQ("SetAVTransportURI", actions[0]);
    EXPECT_EQ("Play", actions[1]);
    EXPECT_EQ("http://192.168.1.30:1400/xml/avt/ctl", fetch.posturls[0]);
    EXPECT_NE(string::npos, fetch.postbodies[0].find(
                  "<CurrentURI>http://192.168.1.10:8080/movie.mkv?"
                  "subtitle=2</CurrentURI>"));
    EXPECT_NE(string::npos, fetch.postbodies[1].find("<Speed>1</Speed>"));

    for (int i = 0; i < 100 && beats < 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_GE(beats.load(), 2);

    fetch.setAction("Stop", 200);
    ASSERT_EQ(UPC_OK, dev->stop(nullptr, &reason));
    EXPECT_FALSE(dev->subscriptionActive());
    EXPECT_EQ(DeviceController::SourceSet, dev->getState());
}

TEST_F(DeviceControllerTest, SetURIFailureSkipsPlay)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 500);
    fetch.setAction("Play", 200);
    string reason;
    EXPECT_EQ(UPC_E_REMOTECTL, dev->playMedia("http://h/x.mp4", nullptr,
                                              &reason));
    EXPECT_NE(string::npos, reason.find("SetAVTransportURI"));
    EXPECT_NE(string::npos, reason.find("500"));
    vector<string> actions = fetch.actions();
    ASSERT_EQ(1u, actions.size());
    EXPECT_EQ("SetAVTransportURI", actions[0]);
    EXPECT_EQ(DeviceController::DescriptionResolved, dev->getState());
    EXPECT_FALSE(dev->subscriptionActive());
}

TEST_F(DeviceControllerTest, PlayFailure)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200);
    fetch.setAction("Play", 701);
    string reason;
    EXPECT_EQ(UPC_E_REMOTECTL, dev->playMedia("http://h/x.mp4", nullptr,
                                              &reason));
    EXPECT_NE(string::npos, reason.find("Play"));
    EXPECT_EQ(DeviceController::SourceSet, dev->getState());
    EXPECT_FALSE(dev->subscriptionActive());
}

TEST_F(DeviceControllerTest, CancelDuringSettle)
{
    opts.settlems = 10000;
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200);
    fetch.setAction("Play", 200);

    Canceller cancel;
    std::thread canceller([&cancel] () {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            cancel.cancel();
        });
    auto start = std::chrono::steady_clock::now();
    string reason;
    int ret = dev->playMedia("http://h/x.mp4", &cancel, &reason);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    canceller.join();
    EXPECT_EQ(UPC_E_CANCELLED, ret);
    EXPECT_LT(elapsed, 5000);
    // Play never sent
    vector<string> actions = fetch.actions();
    ASSERT_EQ(1u, actions.size());
    EXPECT_EQ(DeviceController::SourceSet, dev->getState());
}

TEST_F(DeviceControllerTest, CancelDuringCall)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200, "", 10000);
    Canceller cancel;
    std::thread canceller([&cancel] () {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            cancel.cancel();
        });
    EXPECT_EQ(UPC_E_CANCELLED, dev->playMedia("http://h/x.mp4", &cancel));
    canceller.join();
    EXPECT_EQ(1u, fetch.actions().size());
}

TEST_F(DeviceControllerTest, NotResolved)
{
    DeviceController dev(&fetch, location, opts);
    string reason;
    EXPECT_EQ(UPC_E_STATE, dev.playMedia("http://h/x.mp4", nullptr, &reason));
    EXPECT_EQ(UPC_E_STATE, dev.stop(nullptr, &reason));
    EXPECT_TRUE(fetch.actions().empty());
}

TEST_F(DeviceControllerTest, ReplayRestartsSubscription)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200);
    fetch.setAction("Play", 200);
    ASSERT_EQ(UPC_OK, dev->playMedia("http://h/a.mp4", nullptr));
    ASSERT_EQ(UPC_OK, dev->playMedia("http://h/b.mp4", nullptr));
    EXPECT_TRUE(dev->subscriptionActive());
    EXPECT_EQ(4u, fetch.actions().size());
    // Destruction ends the heartbeat thread
    dev.reset();
}

TEST_F(DeviceControllerTest, FailedReplayEndsHeartbeat)
{
    DCH dev = make();
    ASSERT_TRUE(dev);
    fetch.setAction("SetAVTransportURI", 200);
    fetch.setAction("Play", 200);
    ASSERT_EQ(UPC_OK, dev->playMedia("http://h/a.mp4", nullptr));
    ASSERT_TRUE(dev->subscriptionActive());

    fetch.setAction("SetAVTransportURI", 500);
    string reason;
    EXPECT_EQ(UPC_E_REMOTECTL, dev->playMedia("http://h/b.mp4", nullptr,
                                              &reason));
    EXPECT_FALSE(dev->subscriptionActive());
    EXPECT_EQ(DeviceController::SourceSet, dev->getState());
    // Play was not sent for the second file
    vector<string> actions = fetch.actions();
    ASSERT_EQ(3u, actions.size());
    EXPECT_EQ("SetAVTransportURI", actions[2]);
}

TEST(DeviceControllerStates, Names)
{
    EXPECT_STREQ("Uninitialized",
                 DeviceController::stateName(DeviceController::Uninitialized));
    EXPECT_STREQ("Playing",
                 DeviceController::stateName(DeviceController::Playing));
}
