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

#include <chrono>
#include <string>
#include <thread>

#include "fakes.h"
#include "libupcast/server/mediaserver.hxx"
#include "libupcast/server/mediaformats.hxx"
#include "libupcast/transcode/transcoder.hxx"
#include "libupcast/curlfetch.h"
#include "libupcast/upcastlib.hxx"
#include "libupcast/pathut.h"

using namespace std;
using namespace UpCast;
using namespace UpCastTest;

TEST(MediaFormats, Classes)
{
    EXPECT_EQ(MFC_ASIS, mediaFormatClass("/x/a.mp4"));
    EXPECT_EQ(MFC_ASIS, mediaFormatClass("a.M4V"));
    EXPECT_EQ(MFC_TRANSCODE, mediaFormatClass("a.mkv"));
    EXPECT_EQ(MFC_TRANSCODE, mediaFormatClass("a.WebM"));
    EXPECT_EQ(MFC_TRANSCODE, mediaFormatClass("a.mpeg"));
    EXPECT_EQ(MFC_UNSUPPORTED, mediaFormatClass("a.txt"));
    EXPECT_EQ(MFC_UNSUPPORTED, mediaFormatClass("noext"));
}

TEST(MediaFormats, MimeTypes)
{
    EXPECT_EQ("video/mp4", mimeTypeForPath("a.mp4"));
    EXPECT_EQ("video/x-matroska", mimeTypeForPath("a.MKV"));
    EXPECT_EQ("image/jpeg", mimeTypeForPath("a.jpeg"));
    EXPECT_EQ("application/octet-stream", mimeTypeForPath("a.webm"));
}

TEST(MediaServerRange, Parse)
{
    int64_t start, end;
    ASSERT_TRUE(MediaServer::parseRange("bytes=0-99", 1000, start, end));
    EXPECT_EQ(0, start);
    EXPECT_EQ(99, end);

    ASSERT_TRUE(MediaServer::parseRange("bytes=900-", 1000, start, end));
    EXPECT_EQ(900, start);
    EXPECT_EQ(999, end);

    // Missing start
    ASSERT_TRUE(MediaServer::parseRange("bytes=-99", 1000, start, end));
    EXPECT_EQ(0, start);
    EXPECT_EQ(99, end);

    // End past the file or before start: clamped
    ASSERT_TRUE(MediaServer::parseRange("bytes=10-5000", 1000, start, end));
    EXPECT_EQ(999, end);
    ASSERT_TRUE(MediaServer::parseRange("bytes=10-5", 1000, start, end));
    EXPECT_EQ(999, end);

    // Only the first range counts
    ASSERT_TRUE(MediaServer::parseRange("bytes=0-9,20-29", 1000, start, end));
    EXPECT_EQ(0, start);
    EXPECT_EQ(9, end);

    EXPECT_FALSE(MediaServer::parseRange("bytes=2000-", 1000, start, end));
    EXPECT_FALSE(MediaServer::parseRange("bytes=1000-", 1000, start, end));
    EXPECT_FALSE(MediaServer::parseRange("bytes=-", 1000, start, end));
    EXPECT_FALSE(MediaServer::parseRange("bytes=abc-", 1000, start, end));
    EXPECT_FALSE(MediaServer::parseRange("items=0-9", 1000, start, end));
    EXPECT_FALSE(MediaServer::parseRange("bytes=0-9", 0, start, end));
}

class MediaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        topts.tmpdir = tmp.path;
        root = path_cat(tmp.path, "media");
        ASSERT_TRUE(path_makepath(root, 0700));
        movie = path_cat(root, "movie.mp4");
        tmp.file("media/movie.mp4", 1000);
        tmp.file("media/notes.txt", 10);
        tmp.file("media/show.mkv", 50);
        tmp.file("secret.mp4", 10);
        transcoder = std::unique_ptr<Transcoder>(
            new Transcoder(topts, &runner));
        server = std::unique_ptr<MediaServer>(
            new MediaServer(transcoder.get()));
    }

    MediaServer::Request get(const string& path) {
        MediaServer::Request req;
        req.method = "GET";
        req.path = path;
        return req;
    }

    TempDir tmp;
    FakeRunner runner;
    Transcoder::Options topts;
    std::unique_ptr<Transcoder> transcoder;
    std::unique_ptr<MediaServer> server;
    string root;
    string movie;
};

TEST_F(MediaServerTest, WholeFile)
{
    MediaServer::Reply reply;
    server->handleInRoot(root, get("/movie.mp4"), reply);
    EXPECT_EQ(200, reply.status);
    EXPECT_EQ(movie, reply.filepath);
    EXPECT_EQ(0, reply.offset);
    EXPECT_EQ(1000, reply.length);
    EXPECT_EQ("1000", reply.headers["Content-Length"]);
    EXPECT_EQ("bytes", reply.headers["Accept-Ranges"]);
    EXPECT_EQ("video/mp4", reply.headers["Content-Type"]);
    EXPECT_EQ("*", reply.headers["Access-Control-Allow-Origin"]);
    EXPECT_EQ("GET, OPTIONS", reply.headers["Access-Control-Allow-Methods"]);
    EXPECT_EQ("Content-Type, Range",
              reply.headers["Access-Control-Allow-Headers"]);
}

TEST_F(MediaServerTest, Ranges)
{
    MediaServer::Request req = get("/movie.mp4");
    MediaServer::Reply reply;

    req.headers["range"] = "bytes=0-99";
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(206, reply.status);
    EXPECT_EQ("bytes 0-99/1000", reply.headers["Content-Range"]);
    EXPECT_EQ(100, reply.length);
    EXPECT_EQ("100", reply.headers["Content-Length"]);

    req.headers["range"] = "bytes=900-";
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(206, reply.status);
    EXPECT_EQ("bytes 900-999/1000", reply.headers["Content-Range"]);
    EXPECT_EQ(900, reply.offset);
    EXPECT_EQ(100, reply.length);

    req.headers["range"] = "bytes=2000-";
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(416, reply.status);
    EXPECT_TRUE(reply.filepath.empty());
    EXPECT_EQ("bytes */1000", reply.headers["Content-Range"]);
}

TEST_F(MediaServerTest, Errors)
{
    MediaServer::Reply reply;
    server->handleInRoot(root, get("/notes.txt"), reply);
    EXPECT_EQ(415, reply.status);
    EXPECT_EQ("*", reply.headers["Access-Control-Allow-Origin"]);

    server->handleInRoot(root, get("/missing.mp4"), reply);
    EXPECT_EQ(404, reply.status);

    // Unsupported type wins over existence
    server->handleInRoot(root, get("/missing.txt"), reply);
    EXPECT_EQ(415, reply.status);

    // Outside of the root
    server->handleInRoot(root, get("/../secret.mp4"), reply);
    EXPECT_EQ(404, reply.status);
    EXPECT_TRUE(reply.filepath.empty());

    server->handleInRoot(root, get("/"), reply);
    EXPECT_EQ(404, reply.status);

    MediaServer::Request req = get("/movie.mp4");
    req.method = "POST";
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(405, reply.status);
}

TEST_F(MediaServerTest, Options)
{
    MediaServer::Request req = get("/movie.mp4");
    req.method = "OPTIONS";
    MediaServer::Reply reply;
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(200, reply.status);
    EXPECT_TRUE(reply.body.empty());
    EXPECT_TRUE(reply.filepath.empty());
    EXPECT_EQ("*", reply.headers["Access-Control-Allow-Origin"]);
}

TEST_F(MediaServerTest, TranscodedFile)
{
    MediaServer::Request req = get("/show.mkv");
    req.query["subtitle"] = "3";
    req.query["audio"] = "junk";
    MediaServer::Reply reply;
    server->handleInRoot(root, req, reply);
    ASSERT_EQ(200, reply.status) << reply.body;
    EXPECT_EQ(1, runner.encodeCount());
    EXPECT_TRUE(path_isdesc(transcoder->scratchDir(), reply.filepath));
    EXPECT_EQ(Transcoder::outputName(path_cat(root, "show.mkv"), 3, -1),
              path_getsimple(reply.filepath));
    EXPECT_EQ("video/mp4", reply.headers["Content-Type"]);

    // Cached, and ranges apply to the transcoded file
    req.headers["range"] = "bytes=0-3";
    server->handleInRoot(root, req, reply);
    EXPECT_EQ(206, reply.status);
    EXPECT_EQ(1, runner.encodeCount());
}

TEST_F(MediaServerTest, TranscodeFailure)
{
    runner.encodestatus = 256;
    runner.encodeerr = "Unknown encoder 'h264'";
    MediaServer::Reply reply;
    server->handleInRoot(root, get("/show.mkv"), reply);
    EXPECT_EQ(500, reply.status);
    EXPECT_EQ(0u, reply.body.find("transcode failed: "));
    EXPECT_NE(string::npos, reply.body.find("Unknown encoder"));
}

TEST_F(MediaServerTest, NotServing)
{
    EXPECT_FALSE(server->running());
    MediaServer::Reply reply;
    server->handle(get("/movie.mp4"), reply);
    EXPECT_EQ(404, reply.status);
}

TEST_F(MediaServerTest, StartBadRoot)
{
    string baseurl, reason;
    EXPECT_EQ(UPC_E_NOTFOUND,
              server->start(path_cat(tmp.path, "nosuchdir"), baseurl,
                            &reason));
    EXPECT_FALSE(server->running());
}

// Real listener on the loopback interface
TEST_F(MediaServerTest, ServeOverHTTP)
{
    MediaServer::Options sopts;
    sopts.port = 48231;
    sopts.host = "127.0.0.1";
    MediaServer live(transcoder.get(), sopts);
    string baseurl, reason;
    ASSERT_EQ(UPC_OK, live.start(root, baseurl, &reason)) << reason;
    EXPECT_EQ("http://127.0.0.1:48231", baseurl);
    EXPECT_TRUE(live.running());

    // Same root: no restart
    string baseurl1;
    ASSERT_EQ(UPC_OK, live.start(root, baseurl1, &reason));
    EXPECT_EQ(baseurl, baseurl1);

    CurlFetch fetch;
    NetFetch::Reply reply;
    ASSERT_EQ(UPC_OK, fetch.get(baseurl + "/movie.mp4", 5000, nullptr, reply,
                                &reason)) << reason;
    EXPECT_EQ(200, reply.httpcode);
    EXPECT_EQ(1000u, reply.body.size());
    EXPECT_EQ("abcde", reply.body.substr(0, 5));
    EXPECT_EQ("*", reply.headers["access-control-allow-origin"]);
    EXPECT_EQ("bytes", reply.headers["accept-ranges"]);

    ASSERT_EQ(UPC_OK, fetch.get(baseurl + "/notes.txt", 5000, nullptr, reply,
                                &reason));
    EXPECT_EQ(415, reply.httpcode);

    // Transcoded files are deleted when the server stops
    ASSERT_EQ(UPC_OK, fetch.get(baseurl + "/show.mkv", 5000, nullptr, reply,
                                &reason));
    EXPECT_EQ(200, reply.httpcode);
    EXPECT_EQ("transcoded", reply.body);
    string scratch = transcoder->scratchDir();
    live.stop();
    EXPECT_FALSE(live.running());
    EXPECT_FALSE(path_exists(scratch));
}

TEST_F(MediaServerTest, NewRootReplacesSession)
{
    string otherroot = path_cat(tmp.path, "other");
    ASSERT_TRUE(path_makepath(otherroot, 0700));
    tmp.file("other/clip.mp4", 20);

    MediaServer::Options sopts;
    sopts.port = 48233;
    sopts.host = "127.0.0.1";
    MediaServer live(transcoder.get(), sopts);
    string baseurl, reason;
    ASSERT_EQ(UPC_OK, live.start(root, baseurl, &reason)) << reason;

    MediaServer::Reply reply;
    live.handle(get("/show.mkv"), reply);
    ASSERT_EQ(200, reply.status) << reply.body;
    string scratch = transcoder->scratchDir();
    ASSERT_TRUE(path_isdir(scratch));

    ASSERT_EQ(UPC_OK, live.start(otherroot, baseurl, &reason)) << reason;
    EXPECT_TRUE(live.running());
    EXPECT_EQ(path_canon(otherroot), live.getRoot());
    // The previous session's transcoder output is gone
    EXPECT_FALSE(path_exists(scratch));

    live.handle(get("/clip.mp4"), reply);
    EXPECT_EQ(200, reply.status);
    EXPECT_EQ(path_cat(path_canon(otherroot), "clip.mp4"), reply.filepath);
    // Files of the old root are not served any more
    live.handle(get("/movie.mp4"), reply);
    EXPECT_EQ(404, reply.status);
    live.stop();
}

// Stopping the server interrupts a running encode
TEST_F(MediaServerTest, StopInterruptsTranscode)
{
    MediaServer::Options sopts;
    sopts.port = 48234;
    sopts.host = "127.0.0.1";
    MediaServer live(transcoder.get(), sopts);
    string baseurl, reason;
    ASSERT_EQ(UPC_OK, live.start(root, baseurl, &reason)) << reason;

    runner.hold = true;
    MediaServer::Reply reply;
    std::thread requester([&] () {live.handle(get("/show.mkv"), reply);});
    ASSERT_TRUE(runner.waitRunning(1));
    auto start = std::chrono::steady_clock::now();
    live.stop();
    requester.join();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(elapsed, 2000);
    EXPECT_EQ(500, reply.status);
    EXPECT_EQ(1, runner.cancelled);
    runner.release();
}
