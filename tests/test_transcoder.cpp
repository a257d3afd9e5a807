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

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <string>

#include "fakes.h"
#include "libupcast/transcode/transcoder.hxx"
#include "libupcast/transcode/toolrunner.hxx"
#include "libupcast/canceller.hxx"
#include "libupcast/permits.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/pathut.h"

using namespace std;
using namespace UpCast;
using namespace UpCastTest;

static const char subprobe[] =
    "[STREAM]\n"
    "index=2\n"
    "TAG:language=fre\n"
    "TAG:title=Francais, force\n"
    "[/STREAM]\n"
    "[STREAM]\n"
    "index=3\n"
    "TAG:language=ENG\n"
    "TAG:title=English\n"
    "[/STREAM]\n"
    "[STREAM]\n"
    "index=4\n"
    "TAG:language=chi\n"
    "[/STREAM]\n";

static const char audioprobe[] =
    "[STREAM]\n"
    "index=1\n"
    "codec_name=dts\n"
    "TAG:language=eng\n"
    "[/STREAM]\n"
    "[STREAM]\n"
    "index=5\n"
    "codec_name=aac\n"
    "TAG:language=fre\n"
    "[/STREAM]\n";

class TranscoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        opts.tmpdir = tmp.path;
        opts.maxjobs = 2;
        opts.threads = 4;
        input = tmp.file("movie.mkv", 100);
    }

    static bool hasSeq(const vector<string>& args, const string& a,
                       const string& b) {
        for (unsigned int i = 0; i + 1 < args.size(); i++) {
            if (args[i] == a && args[i+1] == b)
                return true;
        }
        return false;
    }

    TempDir tmp;
    FakeRunner runner;
    Transcoder::Options opts;
    string input;
};

TEST_F(TranscoderTest, ParseProbeOutput)
{
    vector<map<string, string> > streams =
        Transcoder::parseProbeOutput(subprobe);
    ASSERT_EQ(3u, streams.size());
    EXPECT_EQ("2", streams[0]["index"]);
    EXPECT_EQ("Francais, force", streams[0]["TAG:title"]);
    EXPECT_EQ("ENG", streams[1]["TAG:language"]);
    EXPECT_EQ(0u, streams[2].count("TAG:title"));

    streams = Transcoder::parseProbeOutput("codec_name=h264\nwidth=1920\n");
    ASSERT_EQ(1u, streams.size());
    EXPECT_EQ("1920", streams[0]["width"]);

    EXPECT_TRUE(Transcoder::parseProbeOutput("").empty());
}

TEST_F(TranscoderTest, ProbeSubtitlesPicksPreferredLanguage)
{
    runner.probeout["s"] = subprobe;
    Transcoder transcoder(opts, &runner);
    ASSERT_TRUE(transcoder.ok());

    vector<TrackDescriptor> tracks;
    string reason;
    ASSERT_EQ(UPC_OK, transcoder.probeSubtitles(input, tracks, &reason));
    ASSERT_EQ(3u, tracks.size());
    EXPECT_EQ(2, tracks[0].index);
    EXPECT_EQ(TrackDescriptor::Subtitle, tracks[0].kind);
    EXPECT_FALSE(tracks[0].isdefault);
    // First track in a preferred language, case-insensitive
    EXPECT_TRUE(tracks[1].isdefault);
    EXPECT_FALSE(tracks[2].isdefault);

    // Cached
    int runs = runner.proberuns;
    ASSERT_EQ(UPC_OK, transcoder.probeSubtitles(input, tracks, &reason));
    EXPECT_EQ(runs, runner.proberuns);
}

TEST_F(TranscoderTest, ProbeSubtitlesNoPreferredLanguage)
{
    runner.probeout["s"] = "[STREAM]\nindex=2\nTAG:language=ger\n[/STREAM]\n";
    Transcoder transcoder(opts, &runner);
    vector<TrackDescriptor> tracks;
    ASSERT_EQ(UPC_OK, transcoder.probeSubtitles(input, tracks));
    ASSERT_EQ(1u, tracks.size());
    EXPECT_FALSE(tracks[0].isdefault);
}

TEST_F(TranscoderTest, ProbeAudioFirstIsDefault)
{
    runner.probeout["a"] = audioprobe;
    Transcoder transcoder(opts, &runner);
    vector<TrackDescriptor> tracks;
    ASSERT_EQ(UPC_OK, transcoder.probeAudio(input, tracks));
    ASSERT_EQ(2u, tracks.size());
    EXPECT_TRUE(tracks[0].isdefault);
    EXPECT_EQ("dts", tracks[0].codec);
    EXPECT_FALSE(tracks[1].isdefault);
    EXPECT_EQ(5, tracks[1].index);
}

TEST_F(TranscoderTest, ProbeFailure)
{
    runner.probestatus = 256;
    Transcoder transcoder(opts, &runner);
    vector<TrackDescriptor> tracks;
    string reason;
    EXPECT_EQ(UPC_E_TRANSCODE, transcoder.probeSubtitles(input, tracks,
                                                         &reason));
    EXPECT_NE(string::npos, reason.find("ffprobe failed"));
}

TEST_F(TranscoderTest, ProbeMediaInfo)
{
    runner.probeout["v:0"] =
        "[STREAM]\ncodec_name=hevc\nwidth=1920\nheight=1080\n"
        "duration=N/A\n[/STREAM]\n";
    runner.probeout["a:0"] = "[STREAM]\ncodec_name=ac3\n[/STREAM]\n";
    Transcoder transcoder(opts, &runner);
    MediaInfo info;
    ASSERT_EQ(UPC_OK, transcoder.probeMediaInfo(input, info));
    EXPECT_EQ("hevc", info.videocodec);
    EXPECT_EQ(1920, info.width);
    EXPECT_EQ(1080, info.height);
    EXPECT_EQ(0.0, info.duration);
    EXPECT_EQ("ac3", info.audiocodec);
}

TEST_F(TranscoderTest, NamesAndKeys)
{
    EXPECT_EQ("/a/b.mkv_subtitle_3_audio_-1",
              Transcoder::cacheKey("/a/b.mkv", 3, -1));
    EXPECT_NE(Transcoder::cacheKey("/a/b.mkv", 3, 1),
              Transcoder::cacheKey("/a/b.mkv", 3, 2));
    string name = Transcoder::outputName("/a/b.mkv", -1, -1);
    EXPECT_EQ(0u, name.find("b_transcoded_"));
    EXPECT_EQ(name.size() - 4, name.rfind(".mp4"));
    // Stable
    EXPECT_EQ(name, Transcoder::outputName("/a/b.mkv", -1, -1));
    EXPECT_EQ(0u, Transcoder::outputName("/a/b.mkv", 3, 1).find(
                  "b_transcoded_sub3_audio1_"));

    // Same stem, other directory or extension: other name
    EXPECT_NE(name, Transcoder::outputName("/c/b.mkv", -1, -1));
    EXPECT_NE(name, Transcoder::outputName("/a/b.avi", -1, -1));
    EXPECT_NE(Transcoder::outputName("/a/b.mkv", 3, -1),
              Transcoder::outputName("/a/b.mkv", -1, 3));
}

TEST_F(TranscoderTest, EncodeArguments)
{
    Transcoder transcoder(opts, &runner);
    vector<string> args =
        transcoder.encodeArgs("/in.mkv", "/out.mp4", 3, 1, false);
    EXPECT_TRUE(hasSeq(args, "-i", "/in.mkv"));
    EXPECT_TRUE(hasSeq(args, "-map", "0:v:0"));
    EXPECT_TRUE(hasSeq(args, "-map", "0:1"));
    EXPECT_TRUE(hasSeq(args, "-map", "0:3"));
    EXPECT_TRUE(hasSeq(args, "-c:v", "h264"));
    EXPECT_TRUE(hasSeq(args, "-preset", "ultrafast"));
    EXPECT_TRUE(hasSeq(args, "-crf", "28"));
    EXPECT_TRUE(hasSeq(args, "-profile:v", "main"));
    EXPECT_TRUE(hasSeq(args, "-level", "4.0"));
    EXPECT_TRUE(hasSeq(args, "-c:s", "mov_text"));
    EXPECT_TRUE(hasSeq(args, "-disposition:s:0", "default"));
    EXPECT_TRUE(hasSeq(args, "-c:a", "copy"));
    EXPECT_TRUE(hasSeq(args, "-movflags", "+faststart"));
    EXPECT_TRUE(hasSeq(args, "-threads", "4"));
    EXPECT_EQ("/out.mp4", args.back());

    args = transcoder.encodeArgs("/in.mkv", "/out.mp4", -1, -1, true);
    EXPECT_TRUE(hasSeq(args, "-map", "0:a?"));
    EXPECT_TRUE(hasSeq(args, "-c:a", "aac"));
    EXPECT_TRUE(hasSeq(args, "-b:a", "128k"));
    EXPECT_TRUE(std::find(args.begin(), args.end(), "-c:s") == args.end());
}

TEST_F(TranscoderTest, TranscodeAndCacheHit)
{
    runner.probeout["a"] = audioprobe;
    Transcoder transcoder(opts, &runner);
    string out1, out2, reason;
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out1, &reason))
        << reason;
    EXPECT_TRUE(path_isfile(out1));
    EXPECT_TRUE(path_isdesc(transcoder.scratchDir(), out1));
    EXPECT_EQ(1, runner.encodeCount());
    // Default audio track is dts: re-encoded
    ASSERT_EQ(1u, runner.encodeargs.size());
    EXPECT_TRUE(hasSeq(runner.encodeargs[0], "-c:a", "aac"));

    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out2, &reason));
    EXPECT_EQ(out1, out2);
    EXPECT_EQ(1, runner.encodeCount());
    EXPECT_EQ(1, transcoder.encodeCount());

    // Different selection, different job. The aac track is copied.
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, 5, out2, &reason));
    EXPECT_NE(out1, out2);
    EXPECT_EQ(2, runner.encodeCount());
    EXPECT_TRUE(hasSeq(runner.encodeargs[1], "-c:a", "copy"));
}

static string fileContents(const string& path)
{
    std::ifstream in(path.c_str());
    std::stringstream data;
    data << in.rdbuf();
    return data.str();
}

TEST_F(TranscoderTest, SameStemInputsKeepTheirOwnArtifacts)
{
    ASSERT_TRUE(path_makepath(path_cat(tmp.path, "a"), 0700));
    ASSERT_TRUE(path_makepath(path_cat(tmp.path, "b"), 0700));
    string ina = tmp.file("a/movie.mkv", 10);
    string inb = tmp.file("b/movie.mkv", 10);
    string inavi = tmp.file("a/movie.avi", 10);
    runner.echoinput = true;
    Transcoder transcoder(opts, &runner);

    string outa, outb, outavi, reason;
    ASSERT_EQ(UPC_OK, transcoder.transcode(ina, -1, -1, outa, &reason));
    ASSERT_EQ(UPC_OK, transcoder.transcode(inb, -1, -1, outb, &reason));
    ASSERT_EQ(UPC_OK, transcoder.transcode(inavi, -1, -1, outavi, &reason));
    EXPECT_NE(outa, outb);
    EXPECT_NE(outa, outavi);
    EXPECT_NE(outb, outavi);
    EXPECT_EQ(ina, fileContents(outa));
    EXPECT_EQ(inb, fileContents(outb));
    EXPECT_EQ(inavi, fileContents(outavi));

    // The first entry still designates the first movie
    string again;
    ASSERT_EQ(UPC_OK, transcoder.transcode(ina, -1, -1, again, &reason));
    EXPECT_EQ(outa, again);
    EXPECT_EQ(ina, fileContents(again));
    EXPECT_EQ(3, runner.encodeCount());
}

TEST_F(TranscoderTest, DeletedArtifactIsRebuilt)
{
    Transcoder transcoder(opts, &runner);
    string out, reason;
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    ASSERT_TRUE(path_unlink(out));
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    EXPECT_TRUE(path_isfile(out));
    EXPECT_EQ(2, runner.encodeCount());
}

TEST_F(TranscoderTest, ZeroTTLExpiresImmediately)
{
    opts.ttlsecs = 0;
    Transcoder transcoder(opts, &runner);
    string out, reason;
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    EXPECT_EQ(2, runner.encodeCount());
}

TEST_F(TranscoderTest, EncoderFailure)
{
    runner.encodestatus = 256;
    runner.encodeerr = "Invalid data found when processing input\n";
    Transcoder transcoder(opts, &runner);
    string out, reason;
    EXPECT_EQ(UPC_E_TRANSCODE, transcoder.transcode(input, -1, -1, out,
                                                    &reason));
    EXPECT_NE(string::npos, reason.find("ffmpeg failed"));
    EXPECT_NE(string::npos, reason.find("Invalid data found"));

    // Nothing cached: a later attempt runs the tool again
    runner.encodestatus = 0;
    EXPECT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    EXPECT_EQ(2, runner.encodeCount());
}

TEST_F(TranscoderTest, EncoderMissing)
{
    runner.ffmpegavailable = false;
    Transcoder transcoder(opts, &runner);
    EXPECT_FALSE(transcoder.toolAvailable());
    string out, reason;
    EXPECT_EQ(UPC_E_TRANSCODE, transcoder.transcode(input, -1, -1, out,
                                                    &reason));
    EXPECT_EQ("ffmpeg not found", reason);
    EXPECT_EQ(0, runner.encodeCount());
}

TEST_F(TranscoderTest, ConcurrentEncodesAreBounded)
{
    vector<string> inputs;
    for (int i = 0; i < 4; i++) {
        inputs.push_back(tmp.file(string("m") + to_string(i) + ".mkv", 10));
    }
    runner.hold = true;
    Transcoder transcoder(opts, &runner);
    EXPECT_EQ(2, transcoder.maxJobs());

    vector<int> results(inputs.size(), -100);
    vector<std::thread> threads;
    for (unsigned int i = 0; i < inputs.size(); i++) {
        threads.push_back(std::thread([&, i] () {
                    string out;
                    results[i] = transcoder.transcode(inputs[i], -1, -1, out);
                }));
    }
    ASSERT_TRUE(runner.waitRunning(2));
    // Give the other two a chance to (wrongly) start
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    {
        std::unique_lock<std::mutex> lock(runner.mutex);
        EXPECT_EQ(2, runner.running);
    }
    runner.release();
    for (auto& thr : threads) {
        thr.join();
    }
    EXPECT_EQ(2, runner.maxrunning);
    EXPECT_EQ(4, runner.encodeCount());
    for (auto ret : results) {
        EXPECT_EQ(UPC_OK, ret);
    }
}

TEST_F(TranscoderTest, SameRequestSharesOneJob)
{
    runner.hold = true;
    Transcoder transcoder(opts, &runner);
    string out1, out2;
    int ret1 = -100, ret2 = -100;
    std::thread t1([&] () {ret1 = transcoder.transcode(input, 2, -1, out1);});
    ASSERT_TRUE(runner.waitRunning(1));
    std::thread t2([&] () {ret2 = transcoder.transcode(input, 2, -1, out2);});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    runner.release();
    t1.join();
    t2.join();
    EXPECT_EQ(UPC_OK, ret1);
    EXPECT_EQ(UPC_OK, ret2);
    EXPECT_EQ(out1, out2);
    EXPECT_EQ(1, runner.encodeCount());
}

TEST_F(TranscoderTest, CleanupRemovesScratch)
{
    Transcoder transcoder(opts, &runner);
    string out, reason;
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    string scratch = transcoder.scratchDir();
    ASSERT_TRUE(path_isdir(scratch));
    transcoder.cleanup();
    EXPECT_FALSE(path_exists(scratch));
    EXPECT_FALSE(path_exists(out));
    EXPECT_TRUE(transcoder.scratchDir().empty());

    // Usable again afterwards
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    EXPECT_TRUE(path_isfile(out));
    EXPECT_EQ(2, runner.encodeCount());
}

TEST_F(TranscoderTest, CleanupInterruptsRunningEncode)
{
    runner.hold = true;
    Transcoder transcoder(opts, &runner);
    string out, reason;
    int ret = -100;
    std::thread worker([&] () {
            ret = transcoder.transcode(input, -1, -1, out, &reason);
        });
    ASSERT_TRUE(runner.waitRunning(1));
    string scratch = transcoder.scratchDir();

    auto start = std::chrono::steady_clock::now();
    transcoder.cleanup();
    worker.join();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(elapsed, 2000);
    EXPECT_EQ(UPC_E_CANCELLED, ret);
    EXPECT_NE(string::npos, reason.find("cancelled"));
    EXPECT_EQ(1, runner.cancelled);
    EXPECT_FALSE(path_exists(scratch));

    // Nothing was registered: a new request encodes again
    runner.release();
    ASSERT_EQ(UPC_OK, transcoder.transcode(input, -1, -1, out, &reason));
    EXPECT_TRUE(path_isfile(out));
    EXPECT_EQ(2, runner.encodeCount());
}

TEST_F(TranscoderTest, CallerCancelInterruptsEncode)
{
    runner.hold = true;
    Transcoder transcoder(opts, &runner);
    Canceller cancel;
    string out, reason;
    int ret = -100;
    std::thread worker([&] () {
            ret = transcoder.transcode(input, 2, -1, out, &reason, &cancel);
        });
    ASSERT_TRUE(runner.waitRunning(1));
    cancel.cancel();
    worker.join();
    EXPECT_EQ(UPC_E_CANCELLED, ret);
    EXPECT_TRUE(out.empty());
    // Partial output removed
    EXPECT_FALSE(path_exists(path_cat(transcoder.scratchDir(),
                                      Transcoder::outputName(input, 2, -1))));
}

TEST_F(TranscoderTest, CancelWhileWaitingForEncoder)
{
    opts.maxjobs = 1;
    runner.hold = true;
    Transcoder transcoder(opts, &runner);
    string other = tmp.file("other.mkv", 10);
    string out1, out2, reason2;
    int ret1 = -100;
    std::thread first([&] () {
            ret1 = transcoder.transcode(input, -1, -1, out1);
        });
    ASSERT_TRUE(runner.waitRunning(1));

    // No free slot: this one blocks until its deadline
    Canceller deadline(nullptr, 200);
    EXPECT_EQ(UPC_E_TIMEOUT, transcoder.transcode(other, -1, -1, out2,
                                                  &reason2, &deadline));
    EXPECT_NE(string::npos, reason2.find("timed out"));
    EXPECT_EQ(1, runner.encodeCount());

    runner.release();
    first.join();
    EXPECT_EQ(UPC_OK, ret1);
}

// Real process: the tool is killed when its canceller fires
TEST(ExecToolRunner, KilledOnCancel)
{
    ExecToolRunner runner;
    ASSERT_TRUE(runner.available("sh"));
    Canceller cancel;
    std::thread canceller([&cancel] () {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            cancel.cancel();
        });
    auto start = std::chrono::steady_clock::now();
    string out, err;
    int status = runner.run("sh", {"-c", "sleep 10; echo done"}, &out, &err,
                            &cancel);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    canceller.join();
    EXPECT_NE(0, status);
    EXPECT_LT(elapsed, 5000);
    EXPECT_EQ(string::npos, out.find("done"));

    // Without cancellation, the output is collected
    status = runner.run("sh", {"-c", "echo hello; echo oops >&2"}, &out,
                        &err, nullptr);
    EXPECT_EQ(0, status);
    EXPECT_NE(string::npos, out.find("hello"));
    EXPECT_NE(string::npos, err.find("oops"));
}

TEST(PermitPool, ScopedPermits)
{
    PermitPool pool(2);
    EXPECT_EQ(2, pool.total());
    {
        PermitPool::Permit p1(pool);
        PermitPool::Permit p2(pool);
        EXPECT_EQ(0, pool.available());
    }
    EXPECT_EQ(2, pool.available());
    PermitPool zero(0);
    EXPECT_EQ(1, zero.total());
}

TEST(PermitPool, CancelledWait)
{
    PermitPool pool(1);
    PermitPool::Permit held(pool);
    ASSERT_TRUE(held.ok());
    Canceller cancel(nullptr, 100);
    {
        PermitPool::Permit waiting(pool, &cancel);
        EXPECT_FALSE(waiting.ok());
    }
    // The failed permit gave nothing back
    EXPECT_EQ(0, pool.available());
}

TEST(Transcoder, DefaultJobCount)
{
    FakeRunner runner;
    TempDir tmp;
    Transcoder::Options opts;
    opts.tmpdir = tmp.path;
    Transcoder transcoder(opts, &runner);
    EXPECT_EQ(std::max(1, Transcoder::cpuCount() / 2), transcoder.maxJobs());
    EXPECT_EQ(24 * 3600, opts.ttlsecs);
}
