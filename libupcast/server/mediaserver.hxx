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
#ifndef _MEDIASERVER_HXX_INCLUDED_
#define _MEDIASERVER_HXX_INCLUDED_

#include <stdint.h>

#include <string>
#include <map>
#include <memory>

namespace UpCast {

class Transcoder;

/**
 * HTTP server for the files in one directory.
 *
 * Files which renderers can't play are converted by the transcoder
 * before being served. Byte ranges are supported (one range per
 * request). The server runs its own threads (one per connection).
 */
class MediaServer {
public:
    class Options {
    public:
        Options()
            : port(8080) {}
        int port;
        /// Host name or address for the URLs. Empty for the LAN address.
        std::string host;
        /// Interface used to look up the LAN address. Empty for any.
        std::string iface;
    };

    /** Parsed request */
    class Request {
    public:
        std::string method;
        /// Decoded path, starting with /
        std::string path;
        /// Lower-case header names
        std::map<std::string, std::string> headers;
        /// Query parameters
        std::map<std::string, std::string> query;
    };

    /** What to send back. If filepath is set, the body is length bytes
     *  from the file at offset, else it is the body string. */
    class Reply {
    public:
        int status{200};
        std::map<std::string, std::string> headers;
        std::string body;
        std::string filepath;
        int64_t offset{0};
        int64_t length{0};
    };

    /** @param transcoder not owned, may be null (no transcoding) */
    MediaServer(Transcoder *transcoder, const Options& opts = Options());
    ~MediaServer();

    /** Start serving root. Idempotent for the same root, else the
     *  previous session is stopped first.
     * @param[out] baseurl http://host:port
     * @return UPC_OK, UPC_E_NOTFOUND (bad root) or UPC_E_INIT (can't
     *  listen) */
    int start(const std::string& root, std::string& baseurl,
              std::string *reason = 0);

    /** Stop listening and clean up the transcoder output */
    void stop();

    bool running() const;
    std::string getRoot() const;
    std::string getBaseURL() const;

    /** Process a request against the current session */
    void handle(const Request& req, Reply& reply);

    /** Process a request for files under root */
    void handleInRoot(const std::string& root, const Request& req,
                      Reply& reply);

    /** Parse a Range header value for a file of the given size. Only
     *  the first range is considered.
     * @return false if the range can't be satisfied (416) */
    static bool parseRange(const std::string& header, int64_t size,
                           int64_t& start, int64_t& end);

    class Internal;
private:
    std::unique_ptr<Internal> m;

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;
};

} // namespace UpCast

#endif /* _MEDIASERVER_HXX_INCLUDED_ */
