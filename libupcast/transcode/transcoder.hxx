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
#ifndef _TRANSCODER_HXX_INCLUDED_
#define _TRANSCODER_HXX_INCLUDED_

#include <string>
#include <vector>
#include <map>
#include <memory>

#include "libupcast/transcode/tracks.hxx"

namespace UpCast {

class ToolRunner;
class Canceller;

/**
 * Convert media files to an MP4/H.264 container which renderers can
 * play, using ffmpeg. Also probe the subtitle and audio streams with
 * ffprobe.
 *
 * Results are cached: track lists for the object lifetime, transcoded
 * files until they expire or are deleted. The number of simultaneous
 * encodes is bounded, callers beyond the limit block. Tool runs are
 * killed when the caller's canceller is done, or by cleanup().
 *
 * All methods are thread-safe.
 */
class Transcoder {
public:
    class Options {
    public:
        Options()
            : ffmpeg("ffmpeg"), ffprobe("ffprobe"), maxjobs(0), threads(0),
              ttlsecs(24 * 3600),
              sublangs{"zh", "zh-CN", "en", "chi", "zho", "eng"},
              reencodeaudio{"dts", "ac3"} {}
        /// Tool names or absolute paths
        std::string ffmpeg;
        std::string ffprobe;
        /// Parent for the scratch directory. Empty for $TMPDIR or /tmp
        std::string tmpdir;
        /// Concurrent encodes, 0 for half the CPU count
        int maxjobs;
        /// Encoder threads, 0 for the CPU count
        int threads;
        /// Lifetime of transcoded files
        int ttlsecs;
        /// Preferred subtitle languages, in order
        std::vector<std::string> sublangs;
        /// Audio codecs which must be re-encoded to AAC
        std::vector<std::string> reencodeaudio;
    };

    /**
     * @param runner executes the tools. Not owned. If null, an internal
     *   fork/exec runner is used.
     */
    Transcoder(const Options& opts = Options(), ToolRunner *runner = nullptr);
    ~Transcoder();

    /** False if the scratch directory could not be created */
    bool ok() const;
    const std::string& getReason() const;

    /** Is the ffmpeg executable available ? */
    bool toolAvailable();

    /** List the subtitle streams. A default is chosen according to the
     *  preferred languages.
     * @return UPC_OK, UPC_E_TRANSCODE, or the canceller status if it
     *  interrupted the probe */
    int probeSubtitles(const std::string& path,
                       std::vector<TrackDescriptor>& tracks,
                       std::string *reason = 0,
                       const Canceller *cancel = nullptr);

    /** List the audio streams. The first one is the default. */
    int probeAudio(const std::string& path,
                   std::vector<TrackDescriptor>& tracks,
                   std::string *reason = 0,
                   const Canceller *cancel = nullptr);

    /** Describe the first video and audio streams */
    int probeMediaInfo(const std::string& path, MediaInfo& info,
                       std::string *reason = 0,
                       const Canceller *cancel = nullptr);

    /**
     * Produce an MP4 version of the input file, or return the cached one.
     *
     * @param path input file.
     * @param subidx subtitle stream index to embed, or -1 for none.
     * @param audioidx audio stream index to keep, or -1 for the default.
     * @param[out] output the transcoded file path.
     * @param cancel interrupts the wait for an encoder slot, and kills
     *  the encoder.
     * @return UPC_OK, UPC_E_TRANSCODE with the tool diagnostic in reason,
     *  or UPC_E_CANCELLED (also after cleanup()) / UPC_E_TIMEOUT.
     */
    int transcode(const std::string& path, int subidx, int audioidx,
                  std::string& output, std::string *reason = 0,
                  const Canceller *cancel = nullptr);

    /** Kill the running encodes, forget the transcoded files and delete
     *  the scratch directory. A later transcode() creates a new one. */
    void cleanup();

    /** Current scratch directory, empty after cleanup() */
    std::string scratchDir() const;

    /** Concurrent encodes allowed */
    int maxJobs() const;

    /** Number of encodes (tool runs) performed so far */
    int encodeCount() const;

    /** Build the ffmpeg argument list */
    std::vector<std::string> encodeArgs(const std::string& input,
                                        const std::string& output,
                                        int subidx, int audioidx,
                                        bool reencodeaudio) const;

    /** Cache key and output file name for a request. The name carries
     *  a tag derived from the key, so that different keys never share
     *  a file. */
    static std::string cacheKey(const std::string& path, int subidx,
                                int audioidx);
    static std::string outputName(const std::string& path, int subidx,
                                  int audioidx);

    /** Split "ffprobe -of default" output into one key=value map per
     *  [STREAM] section. Output without sections gives one map. */
    static std::vector<std::map<std::string, std::string> >
    parseProbeOutput(const std::string& output);

    static int cpuCount();

    class Internal;
private:
    std::unique_ptr<Internal> m;

    Transcoder(const Transcoder&) = delete;
    Transcoder& operator=(const Transcoder&) = delete;
};

} // namespace UpCast

#endif /* _TRANSCODER_HXX_INCLUDED_ */
