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

////////////////////// upcast: cast local media files to DLNA renderers

#include <stdio.h>
#include <stdlib.h>
#include <signal.h>

#include <string>
#include <iostream>
#include <vector>
#include <mutex>
#include <thread>

#include "castapp.hxx"

#include "libupcast/control/ssdpsearch.hxx"
#include "libupcast/canceller.hxx"
#include "libupcast/conftree.h"
#include "libupcast/upcastlib.hxx"
#include "libupcast/log.h"

using namespace std;
using namespace UpCast;

static char *thisprog;

static char usage [] =
            " -L : list renderers as they are found\n"
            " -t <file> : list the subtitle and audio tracks of a media file\n"
            " -p <renderer> <file> : play file on renderer. The renderer is\n"
            "    designated by friendly name, UDN or description URL.\n"
            "    Keeps serving until interrupted.\n"
            "    -s <idx> : subtitle stream index to embed\n"
            "    -a <idx> : audio stream index to keep\n"
            " -S <renderer> : stop playback on renderer\n"
            " -c <configfile> : configuration file\n"
            "    (default: $UPCAST_CONFIG if set)\n"
            " -d <logfile> : log file name. Default is stderr\n"
            " -l <loglevel> : log level (0-6)\n"
            " -v : print version and exit\n"
            "  \n\n"
            ;
static void
Usage(void)
{
    fprintf(stderr, "%s: usage:\n%s", thisprog, usage);
    exit(1);
}
static int     op_flags;
#define OPT_MOINS 0x1
#define OPT_L     0x2
#define OPT_t     0x4
#define OPT_p     0x8
#define OPT_s     0x10
#define OPT_a     0x20
#define OPT_S     0x40
#define OPT_c     0x80
#define OPT_d     0x100
#define OPT_l     0x200
#define OPT_v     0x400

static volatile sig_atomic_t g_gotsig;

static void onsig(int)
{
    g_gotsig = 1;
}

static const int catchedSigs[] = {SIGINT, SIGQUIT, SIGTERM};
static void setupsigs()
{
    struct sigaction action;
    action.sa_handler = onsig;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (unsigned int i = 0; i < sizeof(catchedSigs) / sizeof(int); i++)
        if (signal(catchedSigs[i], SIG_IGN) != SIG_IGN) {
            if (sigaction(catchedSigs[i], &action, 0) < 0) {
                perror("Sigaction failed");
            }
        }
}

static std::mutex outmutex;

static void printDevice(const DeviceRecord& dev)
{
    std::unique_lock<std::mutex> lock(outmutex);
    cout << dev.friendlyName << " | " << dev.UDN << " | " << dev.location;
    if (!dev.manufacturer.empty() || !dev.modelName.empty()) {
        cout << " | " << dev.manufacturer << " " << dev.modelName;
    }
    cout << endl;
}

static int listRenderers(CastApp& app, const Canceller& cancel)
{
    vector<DeviceRecord> devices;
    string reason;
    int ret = app.discover(devices, printDevice, &cancel, &reason);
    if (ret != UPC_OK) {
        cerr << "Discovery failed: " << reason << endl;
        return 1;
    }
    if (devices.empty()) {
        cerr << "No renderers found" << endl;
    }
    return 0;
}

static void printTracks(const vector<TrackDescriptor>& tracks)
{
    for (const auto& track : tracks) {
        cout << "  " << track.index << " [" << track.language << "] " <<
            track.title;
        if (!track.codec.empty())
            cout << " (" << track.codec << ")";
        if (track.isdefault)
            cout << " *";
        cout << endl;
    }
}

static int listTracks(CastApp& app, const string& file)
{
    Transcoder& transcoder = app.transcoder();
    string reason;
    MediaInfo info;
    if (transcoder.probeMediaInfo(file, info, &reason) != UPC_OK) {
        cerr << "Probe failed: " << reason << endl;
        return 1;
    }
    cout << file << ": " << info.dump() << endl;

    vector<TrackDescriptor> tracks;
    if (transcoder.probeSubtitles(file, tracks, &reason) != UPC_OK) {
        cerr << "Subtitle probe failed: " << reason << endl;
        return 1;
    }
    cout << "Subtitles:" << endl;
    printTracks(tracks);
    if (transcoder.probeAudio(file, tracks, &reason) != UPC_OK) {
        cerr << "Audio probe failed: " << reason << endl;
        return 1;
    }
    cout << "Audio:" << endl;
    printTracks(tracks);
    return 0;
}

static int castFile(CastApp& app, const string& renderer, const string& file,
                    int subidx, int audioidx, const Canceller& cancel)
{
    string location, reason;
    int ret = app.locateRenderer(renderer, location, &cancel, &reason);
    if (ret != UPC_OK) {
        cerr << errAsString("locate", ret) << ": " << reason << endl;
        return 1;
    }
    ret = app.cast(location, file, subidx, audioidx, &cancel, &reason);
    if (ret != UPC_OK) {
        cerr << errAsString("cast", ret) << ": " << reason << endl;
        app.stopServing();
        return 1;
    }
    cout << "Playing. Interrupt to stop serving." << endl;
    cancel.wait();
    app.stopServing();
    return 0;
}

static int stopPlayback(CastApp& app, const string& renderer,
                        const Canceller& cancel)
{
    string location, reason;
    int ret = app.locateRenderer(renderer, location, &cancel, &reason);
    if (ret == UPC_OK) {
        ret = app.stopRenderer(location, &cancel, &reason);
    }
    if (ret != UPC_OK) {
        cerr << errAsString("stop", ret) << ": " << reason << endl;
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    string configfile, logfilename, renderer, file;
    int loglevel = Logger::LLERR;
    int subidx = -1, audioidx = -1;

    const char *cp;
    if ((cp = getenv("UPCAST_CONFIG")))
        configfile = cp;

    thisprog = argv[0];
    argc--; argv++;

    while (argc > 0 && **argv == '-') {
        (*argv)++;
        if (!(**argv))
            Usage();
        while (**argv)
            switch (*(*argv)++) {
            case 'L':   op_flags |= OPT_L; break;
            case 't':   op_flags |= OPT_t; if (argc < 2)  Usage();
                file = *(++argv); argc--;
                goto b1;
            case 'p':   op_flags |= OPT_p; if (argc < 3)  Usage();
                renderer = *(++argv); argc--;
                file = *(++argv); argc--;
                goto b1;
            case 's':   op_flags |= OPT_s; if (argc < 2)  Usage();
                subidx = atoi(*(++argv)); argc--;
                goto b1;
            case 'a':   op_flags |= OPT_a; if (argc < 2)  Usage();
                audioidx = atoi(*(++argv)); argc--;
                goto b1;
            case 'S':   op_flags |= OPT_S; if (argc < 2)  Usage();
                renderer = *(++argv); argc--;
                goto b1;
            case 'c':   op_flags |= OPT_c; if (argc < 2)  Usage();
                configfile = *(++argv); argc--;
                goto b1;
            case 'd':   op_flags |= OPT_d; if (argc < 2)  Usage();
                logfilename = *(++argv); argc--;
                goto b1;
            case 'l':   op_flags |= OPT_l; if (argc < 2)  Usage();
                loglevel = atoi(*(++argv)); argc--;
                goto b1;
            case 'v':   op_flags |= OPT_v; break;
            default: Usage();   break;
            }
    b1: argc--; argv++;
    }

    if (argc != 0)
        Usage();

    if (op_flags & OPT_v) {
        cout << "upcast " << UPCAST_VERSION << endl;
        return 0;
    }

    if (!(op_flags & (OPT_L|OPT_t|OPT_p|OPT_S)))
        Usage();

    CastApp::Config config;
    if (!configfile.empty()) {
        ConfSimple conf(configfile.c_str());
        if (!conf.ok()) {
            cerr << "Could not open config: " << configfile << endl;
            return 1;
        }
        string value;
        if (!(op_flags & OPT_d))
            conf.get("logfilename", logfilename);
        if (!(op_flags & OPT_l) && conf.get("loglevel", value))
            loglevel = atoi(value.c_str());
        CastApp::readConfig(conf, config);
    }

    if (Logger::getTheLog(logfilename) == 0) {
        cerr << "Can't initialize log" << endl;
        return 1;
    }
    Logger::getTheLog("")->setLogLevel(Logger::LogLevel(loglevel));

    setupsigs();

    // The signal handler just sets a flag, this thread turns it into a
    // cancellation.
    Canceller cancel;
    std::thread sigwatch([&cancel] () {
            while (cancel.sleepms(100)) {
                if (g_gotsig) {
                    LOGDEB("upcast: got signal\n");
                    cancel.cancel();
                }
            }
        });

    int status = 0;
    {
        CastApp app(config);
        if (op_flags & OPT_L) {
            status = listRenderers(app, cancel);
        } else if (op_flags & OPT_t) {
            status = listTracks(app, file);
        } else if (op_flags & OPT_p) {
            status = castFile(app, renderer, file, subidx, audioidx, cancel);
        } else if (op_flags & OPT_S) {
            status = stopPlayback(app, renderer, cancel);
        }
    }

    cancel.cancel();
    sigwatch.join();
    LibUPnPSearcher::terminate();
    return status;
}
