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
#include "libupcast/transcode/transcoder.hxx"

#include <time.h>
#include <stdlib.h>
#include <stdio.h>
#include <stdint.h>

#include <chrono>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <set>

#include "libupcast/transcode/toolrunner.hxx"
#include "libupcast/canceller.hxx"
#include "libupcast/permits.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/pathut.h"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

class Artifact {
public:
    string path;
    time_t created;
    time_t expires;
};

class Transcoder::Internal {
public:
    Internal(const Options& o, ToolRunner *r)
        : opts(o), runner(r),
          permits(o.maxjobs > 0 ? o.maxjobs : defaultJobs()) {
        if (nullptr == runner) {
            ownrunner = std::unique_ptr<ToolRunner>(new ExecToolRunner());
            runner = ownrunner.get();
        }
    }

    static int defaultJobs() {
        int n = cpuCount() / 2;
        return n > 0 ? n : 1;
    }

    bool makeScratch(string *reason);
    void evictExpired();
    int probeTracks(const string& path, TrackDescriptor::Kind kind,
                    vector<TrackDescriptor>& tracks, string *reason,
                    const Canceller *cancel);
    bool mustReencodeAudio(const string& path, int audioidx,
                           const Canceller *cancel);
    int encode(const string& path, int subidx, int audioidx,
               const string& outpath, string *reason,
               const Canceller *cancel);
    string toolError(const string& tool, int status, const string& err);
    int interrupted(const string& what, const Canceller *cancel,
                    string *reason);

    Options opts;
    ToolRunner *runner;
    std::unique_ptr<ToolRunner> ownrunner;
    PermitPool permits;

    bool ok{false};
    string reason;

    // Track lists, per input path
    std::mutex trackmutex;
    map<string, vector<TrackDescriptor> > subtracks;
    map<string, vector<TrackDescriptor> > audiotracks;

    // Artifact cache and in-flight jobs
    mutable std::mutex mutex;
    std::condition_variable cv;
    string scratchdir;
    map<string, Artifact> artifacts;
    set<string> inflight;
    // Tokens of the running jobs, cancelled by cleanup()
    set<Canceller*> jobs;
    // Incremented by cleanup(), so that jobs started before don't
    // register their output.
    int generation{0};
    int encodes{0};
};

int Transcoder::cpuCount()
{
    int n = (int)std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
}

// Call with mutex held
bool Transcoder::Internal::makeScratch(string *reason)
{
    if (!scratchdir.empty() && path_isdir(scratchdir)) {
        return true;
    }
    string parent = opts.tmpdir.empty() ? path_tmpdir() : opts.tmpdir;
    if (!path_isdir(parent) && !path_makepath(parent, 0700)) {
        if (reason)
            *reason = string("can't create directory ") + parent;
        return false;
    }
    scratchdir = path_mkdtemp(parent, "upcast_transcode_", reason);
    if (scratchdir.empty()) {
        LOGERR("Transcoder: can't create scratch directory under " <<
               parent << endl);
        return false;
    }
    LOGDEB("Transcoder: scratch directory " << scratchdir << endl);
    return true;
}

// Call with mutex held
void Transcoder::Internal::evictExpired()
{
    time_t now = time(0);
    for (auto it = artifacts.begin(); it != artifacts.end();) {
        if (now >= it->second.expires) {
            LOGDEB("Transcoder: expired: " << it->second.path << endl);
            path_unlink(it->second.path);
            it = artifacts.erase(it);
        } else if (!path_exists(it->second.path)) {
            LOGDEB("Transcoder: gone: " << it->second.path << endl);
            it = artifacts.erase(it);
        } else {
            it++;
        }
    }
}

int Transcoder::Internal::interrupted(const string& what,
                                      const Canceller *cancel,
                                      string *reason)
{
    int status = cancel->status();
    LOGINF("Transcoder: " << what << ": " <<
           (status == UPC_E_TIMEOUT ? "timed out" : "cancelled") << endl);
    if (reason)
        *reason = what + (status == UPC_E_TIMEOUT ? ": timed out" :
                          ": cancelled");
    return status;
}

string Transcoder::Internal::toolError(const string& tool, int status,
                                       const string& err)
{
    string out = tool + " failed: " + runner->statusAsString(status);
    string diag(err);
    trimstring(diag, " \t\r\n");
    if (!diag.empty()) {
        out += ": " + diag;
    }
    return out;
}

vector<map<string, string> >
Transcoder::parseProbeOutput(const string& output)
{
    vector<map<string, string> > result;
    vector<string> lines;
    stringToTokens(output, lines, "\r\n");
    for (auto& line : lines) {
        trimstring(line, " \t");
        if (line.empty()) {
            continue;
        }
        if (line == "[STREAM]") {
            result.push_back(map<string, string>());
            continue;
        }
        if (line[0] == '[') {
            // [/STREAM], or other section markers
            continue;
        }
        string::size_type eq = line.find('=');
        if (eq == string::npos) {
            continue;
        }
        if (result.empty()) {
            result.push_back(map<string, string>());
        }
        result.back()[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return result;
}

int Transcoder::Internal::probeTracks(const string& path,
                                      TrackDescriptor::Kind kind,
                                      vector<TrackDescriptor>& tracks,
                                      string *reason,
                                      const Canceller *cancel)
{
    map<string, vector<TrackDescriptor> >& cache =
        kind == TrackDescriptor::Subtitle ? subtracks : audiotracks;
    {
        std::unique_lock<std::mutex> lock(trackmutex);
        auto it = cache.find(path);
        if (it != cache.end()) {
            tracks = it->second;
            return UPC_OK;
        }
    }

    if (!runner->available(opts.ffprobe)) {
        if (reason)
            *reason = opts.ffprobe + " not found";
        return UPC_E_TRANSCODE;
    }
    vector<string> args{"-v", "error", "-select_streams"};
    if (kind == TrackDescriptor::Subtitle) {
        args.push_back("s");
        args.push_back("-show_entries");
        args.push_back("stream=index:stream_tags=language,title");
    } else {
        args.push_back("a");
        args.push_back("-show_entries");
        args.push_back("stream=index,codec_name:stream_tags=language,title");
    }
    args.push_back("-of");
    args.push_back("default");
    args.push_back(path);

    string out, err;
    int status = runner->run(opts.ffprobe, args, &out, &err, cancel);
    if (cancel && cancel->done()) {
        return interrupted(opts.ffprobe + " " + path, cancel, reason);
    }
    if (status != 0) {
        string msg = toolError(opts.ffprobe, status, err);
        LOGERR("Transcoder::probe: " << path << ": " << msg << endl);
        if (reason)
            *reason = msg;
        return UPC_E_TRANSCODE;
    }

    tracks.clear();
    vector<map<string, string> > streams = parseProbeOutput(out);
    for (auto& stream : streams) {
        TrackDescriptor track;
        track.kind = kind;
        if (!stringToInt(stream["index"], &track.index)) {
            LOGDEB("Transcoder::probe: no index in stream entry\n");
            continue;
        }
        track.language = stream["TAG:language"];
        track.title = stream["TAG:title"];
        if (kind == TrackDescriptor::Audio) {
            track.codec = stream["codec_name"];
        }
        tracks.push_back(track);
    }

    if (kind == TrackDescriptor::Audio) {
        if (!tracks.empty()) {
            tracks[0].isdefault = true;
        }
    } else {
        bool found = false;
        for (auto& track : tracks) {
            const string& tracklang = track.language;
            for (const auto& lang : opts.sublangs) {
                if (stringtolower(lang) == stringtolower(tracklang)) {
                    track.isdefault = true;
                    found = true;
                    break;
                }
            }
            if (found)
                break;
        }
    }
    LOGDEB("Transcoder::probe: " << path << ": " << tracks.size() <<
           (kind == TrackDescriptor::Subtitle ? " subtitle" : " audio") <<
           " tracks\n");

    std::unique_lock<std::mutex> lock(trackmutex);
    cache[path] = tracks;
    return UPC_OK;
}

bool Transcoder::Internal::mustReencodeAudio(const string& path, int audioidx,
                                             const Canceller *cancel)
{
    vector<TrackDescriptor> tracks;
    string reason;
    if (probeTracks(path, TrackDescriptor::Audio, tracks, &reason, cancel) !=
        UPC_OK) {
        LOGINF("Transcoder: audio probe failed, copying audio: " <<
               reason << endl);
        return false;
    }
    string codec;
    for (const auto& track : tracks) {
        if (audioidx < 0 || track.index == audioidx) {
            codec = track.codec;
            break;
        }
    }
    stringtolower(codec);
    for (const auto& bad : opts.reencodeaudio) {
        if (!codec.empty() && stringtolower(bad) == codec) {
            return true;
        }
    }
    return false;
}

static vector<string> buildEncodeArgs(const Transcoder::Options& opts,
                                      const string& input,
                                      const string& output,
                                      int subidx, int audioidx,
                                      bool reencodeaudio)
{
    int threads = opts.threads > 0 ? opts.threads : Transcoder::cpuCount();
    vector<string> args{
        "-hide_banner", "-loglevel", "warning", "-nostdin", "-y",
        "-i", input,
        "-map", "0:v:0"};
    if (audioidx >= 0) {
        args.push_back("-map");
        args.push_back(string("0:") + to_string(audioidx));
    } else {
        args.push_back("-map");
        args.push_back("0:a?");
    }
    if (subidx >= 0) {
        args.push_back("-map");
        args.push_back(string("0:") + to_string(subidx));
    }
    const char *vargs[] = {"-c:v", "h264", "-preset", "ultrafast",
                           "-crf", "28", "-profile:v", "main",
                           "-level", "4.0"};
    args.insert(args.end(), vargs, vargs + sizeof(vargs) / sizeof(char *));
    if (subidx >= 0) {
        args.push_back("-c:s");
        args.push_back("mov_text");
        args.push_back("-disposition:s:0");
        args.push_back("default");
    }
    if (reencodeaudio) {
        args.push_back("-c:a");
        args.push_back("aac");
        args.push_back("-b:a");
        args.push_back("128k");
    } else {
        args.push_back("-c:a");
        args.push_back("copy");
    }
    args.push_back("-movflags");
    args.push_back("+faststart");
    args.push_back("-threads");
    args.push_back(to_string(threads));
    args.push_back(output);
    return args;
}

vector<string> Transcoder::encodeArgs(const string& input,
                                      const string& output,
                                      int subidx, int audioidx,
                                      bool reencodeaudio) const
{
    return buildEncodeArgs(m->opts, input, output, subidx, audioidx,
                           reencodeaudio);
}

int Transcoder::Internal::encode(const string& path, int subidx,
                                 int audioidx, const string& outpath,
                                 string *reason, const Canceller *cancel)
{
    bool reencode = mustReencodeAudio(path, audioidx, cancel);
    if (cancel && cancel->done()) {
        return interrupted(string("encode of ") + path, cancel, reason);
    }
    vector<string> args = buildEncodeArgs(opts, path, outpath, subidx,
                                          audioidx, reencode);
    LOGINF("Transcoder: encoding " << path << " to " << outpath <<
           (reencode ? " (audio to aac)" : "") << endl);
    time_t start = time(0);
    string out, err;
    int status = runner->run(opts.ffmpeg, args, &out, &err, cancel);
    if (cancel && cancel->done()) {
        path_unlink(outpath);
        return interrupted(string("encode of ") + path, cancel, reason);
    }
    if (status != 0) {
        path_unlink(outpath);
        string msg = toolError(opts.ffmpeg, status, err);
        LOGERR("Transcoder: " << path << ": " << msg << endl);
        if (reason)
            *reason = msg;
        return UPC_E_TRANSCODE;
    }
    if (!path_exists(outpath)) {
        if (reason)
            *reason = opts.ffmpeg + " produced no output";
        return UPC_E_TRANSCODE;
    }
    LOGINF("Transcoder: done in " << time(0) - start << " s: " << outpath <<
           endl);
    return UPC_OK;
}

Transcoder::Transcoder(const Options& opts, ToolRunner *runner)
    : m(new Internal(opts, runner))
{
    std::unique_lock<std::mutex> lock(m->mutex);
    m->ok = m->makeScratch(&m->reason);
    LOGDEB("Transcoder: max concurrent jobs " << m->permits.total() << endl);
}

Transcoder::~Transcoder()
{
}

bool Transcoder::ok() const
{
    return m->ok;
}

const string& Transcoder::getReason() const
{
    return m->reason;
}

bool Transcoder::toolAvailable()
{
    return m->runner->available(m->opts.ffmpeg);
}

int Transcoder::maxJobs() const
{
    return m->permits.total();
}

int Transcoder::encodeCount() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->encodes;
}

string Transcoder::scratchDir() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->scratchdir;
}

int Transcoder::probeSubtitles(const string& path,
                               vector<TrackDescriptor>& tracks,
                               string *reason, const Canceller *cancel)
{
    return m->probeTracks(path, TrackDescriptor::Subtitle, tracks, reason,
                          cancel);
}

int Transcoder::probeAudio(const string& path, vector<TrackDescriptor>& tracks,
                           string *reason, const Canceller *cancel)
{
    return m->probeTracks(path, TrackDescriptor::Audio, tracks, reason,
                          cancel);
}

int Transcoder::probeMediaInfo(const string& path, MediaInfo& info,
                               string *reason, const Canceller *cancel)
{
    if (!m->runner->available(m->opts.ffprobe)) {
        if (reason)
            *reason = m->opts.ffprobe + " not found";
        return UPC_E_TRANSCODE;
    }
    vector<string> args{"-v", "error", "-select_streams", "v:0",
            "-show_entries", "stream=codec_name,width,height,duration",
            "-of", "default", path};
    string out, err;
    int status = m->runner->run(m->opts.ffprobe, args, &out, &err, cancel);
    if (cancel && cancel->done()) {
        return m->interrupted(m->opts.ffprobe + " " + path, cancel, reason);
    }
    if (status != 0) {
        string msg = m->toolError(m->opts.ffprobe, status, err);
        LOGERR("Transcoder::probeMediaInfo: " << path << ": " << msg << endl);
        if (reason)
            *reason = msg;
        return UPC_E_TRANSCODE;
    }
    info = MediaInfo();
    vector<map<string, string> > streams = parseProbeOutput(out);
    if (!streams.empty()) {
        map<string, string>& video = streams[0];
        info.videocodec = video["codec_name"];
        stringToInt(video["width"], &info.width);
        stringToInt(video["height"], &info.height);
        // Duration is often N/A at the stream level in matroska files
        const string& dur = video["duration"];
        char *endp;
        double d = strtod(dur.c_str(), &endp);
        if (!dur.empty() && *endp == 0) {
            info.duration = d;
        }
    }

    // Missing audio is not an error
    args = vector<string>{"-v", "error", "-select_streams", "a:0",
                          "-show_entries", "stream=codec_name",
                          "-of", "default", path};
    out.clear();
    err.clear();
    if (m->runner->run(m->opts.ffprobe, args, &out, &err, cancel) == 0) {
        streams = parseProbeOutput(out);
        if (!streams.empty()) {
            info.audiocodec = streams[0]["codec_name"];
        }
    }
    return UPC_OK;
}

string Transcoder::cacheKey(const string& path, int subidx, int audioidx)
{
    return path + "_subtitle_" + to_string(subidx) + "_audio_" +
        to_string(audioidx);
}

// FNV-1a over the cache key, as 16 hex digits
static string keyTag(const string& key)
{
    uint64_t h = 14695981039346656037ULL;
    for (unsigned int i = 0; i < key.size(); i++) {
        h ^= (unsigned char)key[i];
        h *= 1099511628211ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return buf;
}

string Transcoder::outputName(const string& path, int subidx, int audioidx)
{
    string suff = path_suffix(path);
    string base = path_basename(path, suff.empty() ? suff : "." + suff);
    string name = base + "_transcoded";
    if (subidx >= 0) {
        name += "_sub" + to_string(subidx);
    }
    if (audioidx >= 0) {
        name += "_audio" + to_string(audioidx);
    }
    return name + "_" + keyTag(cacheKey(path, subidx, audioidx)) + ".mp4";
}

int Transcoder::transcode(const string& path, int subidx, int audioidx,
                          string& output, string *reason,
                          const Canceller *cancel)
{
    string key = cacheKey(path, subidx, audioidx);

    std::unique_lock<std::mutex> lock(m->mutex);
    int generation = m->generation;
    for (;;) {
        m->evictExpired();
        auto it = m->artifacts.find(key);
        if (it != m->artifacts.end()) {
            LOGDEB("Transcoder: cache hit for " << key << endl);
            output = it->second.path;
            return UPC_OK;
        }
        if (m->inflight.find(key) == m->inflight.end()) {
            break;
        }
        if (generation != m->generation) {
            if (reason)
                *reason = "transcoder was reset during the job";
            return UPC_E_CANCELLED;
        }
        if (cancel && cancel->done()) {
            return m->interrupted(string("wait for ") + key, cancel, reason);
        }
        LOGDEB1("Transcoder: waiting for running job " << key << endl);
        m->cv.wait_for(lock, std::chrono::milliseconds(50));
    }

    if (!m->runner->available(m->opts.ffmpeg)) {
        if (reason)
            *reason = m->opts.ffmpeg + " not found";
        return UPC_E_TRANSCODE;
    }
    if (!m->makeScratch(reason)) {
        return UPC_E_TRANSCODE;
    }
    string outpath = path_cat(m->scratchdir, outputName(path, subidx,
                                                        audioidx));
    generation = m->generation;
    Canceller job(cancel);
    m->jobs.insert(&job);
    m->inflight.insert(key);
    lock.unlock();

    int ret;
    {
        PermitPool::Permit permit(m->permits, &job);
        if (!permit.ok()) {
            ret = m->interrupted(string("wait for an encoder for ") + path,
                                 &job, reason);
        } else {
            {
                std::unique_lock<std::mutex> countlock(m->mutex);
                m->encodes++;
            }
            ret = m->encode(path, subidx, audioidx, outpath, reason, &job);
        }
    }

    lock.lock();
    m->jobs.erase(&job);
    m->inflight.erase(key);
    if (ret == UPC_OK) {
        if (generation == m->generation) {
            Artifact& art = m->artifacts[key];
            art.path = outpath;
            art.created = time(0);
            art.expires = art.created + m->opts.ttlsecs;
            output = outpath;
        } else {
            // cleanup() ran meanwhile
            path_unlink(outpath);
            if (reason)
                *reason = "transcoder was reset during the job";
            ret = UPC_E_CANCELLED;
        }
    }
    m->cv.notify_all();
    return ret;
}

void Transcoder::cleanup()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    for (auto job : m->jobs) {
        job->cancel();
    }
    if (!m->jobs.empty()) {
        LOGINF("Transcoder::cleanup: interrupted " << m->jobs.size() <<
               " running jobs\n");
    }
    m->artifacts.clear();
    m->generation++;
    m->cv.notify_all();
    if (!m->scratchdir.empty()) {
        string reason;
        if (!path_rmtree(m->scratchdir, &reason)) {
            LOGERR("Transcoder::cleanup: " << reason << endl);
        }
        LOGDEB("Transcoder::cleanup: removed " << m->scratchdir << endl);
        m->scratchdir.clear();
    }
}

} // namespace UpCast
