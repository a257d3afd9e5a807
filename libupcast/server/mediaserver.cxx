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
#include "libupcast/server/mediaserver.hxx"

#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <microhttpd.h>

#include <mutex>

#include "libupcast/server/mediaformats.hxx"
#include "libupcast/transcode/transcoder.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/upcastp.hxx"
#include "libupcast/pathut.h"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

#if MHD_VERSION >= 0x00097002
#define MHD_RESULT enum MHD_Result
#else
#define MHD_RESULT int
#endif

using namespace std;

namespace UpCast {

class MediaServer::Internal {
public:
    Internal(Transcoder *t, const Options& o)
        : transcoder(t), opts(o) {}

    bool startMHD();
    void stopLocked();
    void serveFile(const string& path, const Request& req, Reply& reply);
    MHD_RESULT answerConn(struct MHD_Connection *mhdconn, const char *url,
                          const char *method, void **con_cls);

    MediaServer *parent{nullptr};
    Transcoder *transcoder;
    Options opts;

    // start/stop serialization
    std::mutex lifemutex;
    struct MHD_Daemon *mhd{nullptr};

    // Session state, read by the request handlers
    mutable std::mutex mutex;
    bool running{false};
    string root;
    string baseurl;
};

static void setCORS(MediaServer::Reply& reply)
{
    reply.headers["Access-Control-Allow-Origin"] = "*";
    reply.headers["Access-Control-Allow-Methods"] = "GET, OPTIONS";
    reply.headers["Access-Control-Allow-Headers"] = "Content-Type, Range";
}

static void setError(MediaServer::Reply& reply, int status,
                     const string& body)
{
    reply.status = status;
    reply.body = body;
    reply.filepath.clear();
    reply.headers["Content-Type"] = "text/plain; charset=utf-8";
}

// Parse decimal non-negative integer. Empty or garbage: false.
static bool rangeBound(const string& s, int64_t *val)
{
    if (s.empty())
        return false;
    for (auto c : s) {
        if (c < '0' || c > '9')
            return false;
    }
    char *endp;
    errno = 0;
    long long v = strtoll(s.c_str(), &endp, 10);
    if (errno != 0)
        return false;
    *val = v;
    return true;
}

bool MediaServer::parseRange(const string& header, int64_t size,
                             int64_t& start, int64_t& end)
{
    string value(header);
    trimstring(value, " \t");
    if (value.size() < 6 || stringtolower(value.substr(0, 6)) != "bytes=") {
        LOGDEB("MediaServer::parseRange: bad unit in [" << header << "]\n");
        return false;
    }
    value = value.substr(6);
    // Only the first range is used
    string::size_type comma = value.find(',');
    if (comma != string::npos) {
        value = value.substr(0, comma);
    }
    string::size_type dash = value.find('-');
    if (dash == string::npos) {
        return false;
    }
    string sstart = value.substr(0, dash);
    string send = value.substr(dash + 1);
    trimstring(sstart, " \t");
    trimstring(send, " \t");
    if (sstart.empty() && send.empty()) {
        return false;
    }

    start = 0;
    if (!sstart.empty() && !rangeBound(sstart, &start)) {
        return false;
    }
    if (start < 0 || start >= size) {
        return false;
    }
    end = size - 1;
    if (!send.empty()) {
        int64_t e;
        if (!rangeBound(send, &e)) {
            return false;
        }
        if (e >= start && e < size) {
            end = e;
        }
    }
    return true;
}

void MediaServer::Internal::serveFile(const string& path, const Request& req,
                                      Reply& reply)
{
    int64_t size = path_filesize(path);
    if (size < 0) {
        setError(reply, 404, "not found");
        return;
    }
    reply.headers["Content-Type"] = mimeTypeForPath(path);
    reply.headers["Accept-Ranges"] = "bytes";

    auto it = req.headers.find("range");
    if (it == req.headers.end() || it->second.empty()) {
        reply.status = 200;
        reply.filepath = path;
        reply.offset = 0;
        reply.length = size;
        reply.headers["Content-Length"] = lltodecstr(size);
        return;
    }

    int64_t start, end;
    if (!parseRange(it->second, size, start, end)) {
        LOGDEB("MediaServer: unsatisfiable range [" << it->second <<
               "] size " << size << endl);
        reply.status = 416;
        reply.filepath.clear();
        reply.headers["Content-Range"] = string("bytes */") + lltodecstr(size);
        return;
    }
    reply.status = 206;
    reply.filepath = path;
    reply.offset = start;
    reply.length = end - start + 1;
    reply.headers["Content-Range"] = string("bytes ") + lltodecstr(start) +
        "-" + lltodecstr(end) + "/" + lltodecstr(size);
    reply.headers["Content-Length"] = lltodecstr(reply.length);
}

void MediaServer::handleInRoot(const string& root, const Request& req,
                               Reply& reply)
{
    reply = Reply();
    setCORS(reply);

    string rel(req.path);
    while (!rel.empty() && rel[0] == '/') {
        rel.erase(0, 1);
    }
    if (rel.empty()) {
        setError(reply, 404, "not found");
        return;
    }
    string path = path_cat(root, rel);
    bool exists = path_isdesc(root, path) && path_isfile(path);

    if (req.method == "OPTIONS") {
        if (exists) {
            reply.status = 200;
        } else {
            setError(reply, 404, "not found");
        }
        return;
    }
    if (req.method != "GET" && req.method != "HEAD") {
        reply.headers["Allow"] = "GET, HEAD, OPTIONS";
        setError(reply, 405, "method not allowed");
        return;
    }

    // The format is checked first: unsupported types are 415 even if
    // the file does not exist.
    MediaFormatClass fclass = mediaFormatClass(rel);
    if (fclass == MFC_UNSUPPORTED) {
        setError(reply, 415, "unsupported media type");
        return;
    }
    if (!exists) {
        LOGDEB("MediaServer: not found: " << req.path << endl);
        setError(reply, 404, "not found");
        return;
    }

    if (fclass == MFC_ASIS) {
        m->serveFile(path, req, reply);
        return;
    }

    if (nullptr == m->transcoder) {
        setError(reply, 500, "transcode failed: no transcoder");
        return;
    }
    int subidx = -1, audioidx = -1;
    auto it = req.query.find("subtitle");
    if (it != req.query.end() && !stringToInt(it->second, &subidx)) {
        subidx = -1;
    }
    it = req.query.find("audio");
    if (it != req.query.end() && !stringToInt(it->second, &audioidx)) {
        audioidx = -1;
    }
    string output, reason;
    int ret = m->transcoder->transcode(path, subidx, audioidx, output,
                                       &reason);
    if (ret != UPC_OK) {
        LOGERR("MediaServer: " << path << ": " << reason << endl);
        setError(reply, 500, string("transcode failed: ") + reason);
        return;
    }
    m->serveFile(output, req, reply);
}

void MediaServer::handle(const Request& req, Reply& reply)
{
    string root;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (m->running) {
            root = m->root;
        }
    }
    if (root.empty()) {
        reply = Reply();
        setCORS(reply);
        setError(reply, 404, "not serving");
        return;
    }
    handleInRoot(root, req, reply);
}

/////////////// libmicrohttpd glue

// Read a slice of file for the response
class FileReader {
public:
    FileReader(int _fd, int64_t _offset, int64_t _length)
        : fd(_fd), offset(_offset), length(_length) {}
    ~FileReader() {
        if (fd >= 0) {
            close(fd);
        }
    }
    ssize_t contentRead(uint64_t pos, char *buf, size_t max);

    int fd;
    int64_t offset;
    int64_t length;
};

ssize_t FileReader::contentRead(uint64_t pos, char *buf, size_t max)
{
    if ((int64_t)pos >= length) {
        return MHD_CONTENT_READER_END_OF_STREAM;
    }
    size_t toread = MIN(max, (size_t)(length - (int64_t)pos));
    ssize_t cnt = pread(fd, buf, toread, offset + pos);
    if (cnt < 0) {
        LOGSYSERR("FileReader::contentRead", "pread", "");
        return MHD_CONTENT_READER_END_WITH_ERROR;
    }
    if (cnt == 0) {
        // File shrunk under us
        return MHD_CONTENT_READER_END_WITH_ERROR;
    }
    return cnt;
}

static ssize_t content_reader_cb(void *cls, uint64_t pos, char *buf,
                                 size_t max)
{
    FileReader *reader = static_cast<FileReader*>(cls);
    if (reader) {
        return reader->contentRead(pos, buf, max);
    } else {
        return -1;
    }
}

static void content_reader_free_cb(void *cls)
{
    FileReader *reader = static_cast<FileReader*>(cls);
    delete reader;
}

static MHD_RESULT mapvalues_cb(void *cls, enum MHD_ValueKind kind,
                               const char *key, const char *value)
{
    map<string, string> *mp = static_cast<map<string, string> *>(cls);
    if (key) {
        string k(key);
        if (kind == MHD_HEADER_KIND) {
            stringtolower(k);
        }
        (*mp)[k] = value ? value : "";
    }
    return MHD_YES;
}

// Per-request state between the two answer calls
class ConnState {
public:
    MediaServer::Request req;
    MediaServer::Reply reply;
};

static MHD_RESULT answer_to_connection(
    void *cls, struct MHD_Connection *conn,
    const char *url, const char *method, const char *version,
    const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    MediaServer::Internal *internal =
        static_cast<MediaServer::Internal*>(cls);
    if (internal) {
        return internal->answerConn(conn, url, method, con_cls);
    } else {
        return MHD_NO;
    }
}

MHD_RESULT MediaServer::Internal::answerConn(
    struct MHD_Connection *mhdconn, const char *url, const char *method,
    void **con_cls)
{
    if (nullptr == *con_cls) {
        // First call: headers are available. The url was unescaped
        // by microhttpd.
        ConnState *state = new ConnState;
        state->req.method = method;
        state->req.path = url;
        MHD_get_connection_values(mhdconn, MHD_HEADER_KIND, &mapvalues_cb,
                                  &state->req.headers);
        MHD_get_connection_values(mhdconn, MHD_GET_ARGUMENT_KIND,
                                  &mapvalues_cb, &state->req.query);
        *con_cls = state;
        return MHD_YES;
    }

    ConnState *state = static_cast<ConnState*>(*con_cls);
    LOGDEB("MediaServer: " << state->req.method << " " << state->req.path <<
           endl);
    parent->handle(state->req, state->reply);
    const MediaServer::Reply& reply = state->reply;

    struct MHD_Response *response{nullptr};
    if (!reply.filepath.empty()) {
        int fd = open(reply.filepath.c_str(), O_RDONLY);
        if (fd < 0) {
            LOGSYSERR("MediaServer::answerConn", "open", reply.filepath);
            response = MHD_create_response_from_buffer(
                0, 0, MHD_RESPMEM_PERSISTENT);
            if (nullptr == response) {
                return MHD_NO;
            }
            MHD_RESULT ret = MHD_queue_response(
                mhdconn, MHD_HTTP_INTERNAL_SERVER_ERROR, response);
            MHD_destroy_response(response);
            return ret;
        }
        FileReader *reader = new FileReader(fd, reply.offset, reply.length);
        // the block size seems to be flatly ignored by libmicrohttpd
        response = MHD_create_response_from_callback(
            reply.length, 64 * 1024, content_reader_cb, reader,
            content_reader_free_cb);
        if (nullptr == response) {
            delete reader;
        }
    } else {
        response = MHD_create_response_from_buffer(
            reply.body.size(), (void*)reply.body.data(),
            MHD_RESPMEM_MUST_COPY);
    }
    if (nullptr == response) {
        LOGERR("MediaServer::answerConn: could not create response\n");
        return MHD_NO;
    }
    for (const auto& hdr : reply.headers) {
        // Set by microhttpd from the response size
        if (!stringuppercmp("CONTENT-LENGTH", hdr.first)) {
            continue;
        }
        MHD_add_response_header(response, hdr.first.c_str(),
                                hdr.second.c_str());
    }
    MHD_RESULT ret = MHD_queue_response(mhdconn, reply.status, response);
    MHD_destroy_response(response);
    return ret;
}

static void request_completed_callback(
    void *cls, struct MHD_Connection *conn,
    void **con_cls, enum MHD_RequestTerminationCode toe)
{
    // We get this even if the answer callback returned MHD_NO
    if (con_cls && *con_cls) {
        ConnState *state = static_cast<ConnState*>(*con_cls);
        LOGDEB1("MediaServer: request completed, status " << toe << endl);
        delete state;
        *con_cls = nullptr;
    }
}

bool MediaServer::Internal::startMHD()
{
    mhd = MHD_start_daemon(
        MHD_USE_THREAD_PER_CONNECTION|MHD_USE_SELECT_INTERNALLY,
        opts.port,
        /* Accept policy callback and arg */
        nullptr, nullptr,
        /* handler and arg */
        &answer_to_connection, this,
        MHD_OPTION_NOTIFY_COMPLETED, request_completed_callback, this,
        MHD_OPTION_END);

    if (nullptr == mhd) {
        LOGERR("MediaServer: MHD_start_daemon failed on port " << opts.port <<
               endl);
        return false;
    }
    return true;
}

// Call with lifemutex held. New requests get 404 from now on. The
// transcoder cleanup kills the running encodes, so that the connection
// threads which MHD_stop_daemon joins return quickly.
void MediaServer::Internal::stopLocked()
{
    bool wasrunning;
    {
        std::unique_lock<std::mutex> lock(mutex);
        wasrunning = running;
        running = false;
        root.clear();
        baseurl.clear();
    }
    if (wasrunning && transcoder) {
        transcoder->cleanup();
    }
    if (mhd) {
        MHD_stop_daemon(mhd);
        mhd = nullptr;
    }
    if (wasrunning) {
        LOGINF("MediaServer: stopped\n");
    }
}

MediaServer::MediaServer(Transcoder *transcoder, const Options& opts)
    : m(new Internal(transcoder, opts))
{
    m->parent = this;
}

MediaServer::~MediaServer()
{
    std::unique_lock<std::mutex> lock(m->lifemutex);
    m->stopLocked();
}

int MediaServer::start(const string& _root, string& baseurl, string *reason)
{
    std::unique_lock<std::mutex> lifelock(m->lifemutex);
    string root = path_canon(_root);
    if (!path_isdir(root)) {
        if (reason)
            *reason = root + ": not a directory";
        return UPC_E_NOTFOUND;
    }
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (m->running && m->root == root) {
            baseurl = m->baseurl;
            return UPC_OK;
        }
    }
    m->stopLocked();

    if (!m->startMHD()) {
        if (reason)
            *reason = string("can't listen on port ") +
                lltodecstr(m->opts.port);
        return UPC_E_INIT;
    }

    string host = m->opts.host;
    if (host.empty()) {
        host = getLanIPv4(m->opts.iface);
    }
    if (host.empty()) {
        host = "localhost";
    }
    baseurl = string("http://") + host + ":" + lltodecstr(m->opts.port);

    std::unique_lock<std::mutex> lock(m->mutex);
    m->running = true;
    m->root = root;
    m->baseurl = baseurl;
    LOGINF("MediaServer: serving " << root << " at " << baseurl << endl);
    return UPC_OK;
}

void MediaServer::stop()
{
    std::unique_lock<std::mutex> lock(m->lifemutex);
    m->stopLocked();
}

bool MediaServer::running() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->running;
}

string MediaServer::getRoot() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->root;
}

string MediaServer::getBaseURL() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->baseurl;
}

} // namespace UpCast
