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
//#define LOGGER_LOCAL_LOGINC 2

#include "libupcast/curlfetch.h"

#include <string.h>

#include <string>

#include <curl/curl.h>

#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

// Global libcurl initialization.
class CurlInit {
public:
    CurlInit() {
        int opts = CURL_GLOBAL_ALL;
#ifdef CURL_GLOBAL_ACK_EINTR
        opts |= CURL_GLOBAL_ACK_EINTR;
#endif
        curl_global_init(opts);
    }
    ~CurlInit() {
        curl_global_cleanup();
    }
};
static CurlInit curlglobalinit;

// State for one transaction, passed to the curl callbacks.
class CurlTransfer {
public:
    CurlTransfer(NetFetch::Reply& r, const Canceller *c)
        : reply(r), cancel(c) {}
    size_t curlHeaderCB(void *contents, size_t size, size_t nmemb);
    size_t curlWriteCB(void *contents, size_t size, size_t nmemb);
    int curlXferInfoCB();

    NetFetch::Reply& reply;
    const Canceller *cancel;
    bool cancelled{false};
};

static size_t
curl_header_cb(void *contents, size_t size, size_t nmemb, void *userp)
{
    CurlTransfer *me = (CurlTransfer *)userp;
    return me ? me->curlHeaderCB(contents, size, nmemb) : 0;
}

size_t CurlTransfer::curlHeaderCB(void *contents, size_t size, size_t cnt)
{
    size_t bcnt = size * cnt;
    string header((char *)contents, bcnt);
    trimstring(header, " \t\r\n");
    LOGDEB1("CurlFetch::curlHeaderCB: header: [" << header << "]\n");
    if (header.compare(0, 5, "HTTP/") == 0) {
        // Status line: new response (after redirect or 100-continue)
        reply.headers.clear();
        return bcnt;
    }
    string::size_type colon = header.find(":");
    if (string::npos != colon) {
        string hname = header.substr(0, colon);
        stringtolower(hname);
        string val = header.substr(colon+1);
        trimstring(val);
        reply.headers[hname] = val;
    }
    return bcnt;
}

static size_t
curl_write_cb(void *contents, size_t size, size_t nmemb, void *userp)
{
    CurlTransfer *me = (CurlTransfer *)userp;
    return me ? me->curlWriteCB(contents, size, nmemb) : 0;
}

size_t CurlTransfer::curlWriteCB(void *contents, size_t size, size_t cnt)
{
    size_t bcnt = size * cnt;
    reply.body.append((const char *)contents, bcnt);
    return bcnt;
}

static int curl_xferinfo_cb(void *userp, curl_off_t, curl_off_t,
                            curl_off_t, curl_off_t)
{
    CurlTransfer *me = (CurlTransfer *)userp;
    return me ? me->curlXferInfoCB() : 1;
}

int CurlTransfer::curlXferInfoCB()
{
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    if (cancel && cancel->cancelled()) {
        cancelled = true;
        return 1;
    }
    return 0;
}

CurlFetch::CurlFetch()
{
}

CurlFetch::~CurlFetch()
{
}

int CurlFetch::get(const string& url, int timeoutms, const Canceller *cancel,
                   Reply& reply, string *reason)
{
    return perform(url, nullptr, nullptr, timeoutms, cancel, reply, reason);
}

int CurlFetch::post(const string& url, const HeaderList& headers,
                    const string& body, int timeoutms, const Canceller *cancel,
                    Reply& reply, string *reason)
{
    return perform(url, &headers, &body, timeoutms, cancel, reply, reason);
}

int CurlFetch::perform(const string& url, const HeaderList *headers,
                       const string *body, int timeoutms,
                       const Canceller *cancel, Reply& reply, string *reason)
{
    reply = Reply();
    if (cancel) {
        int status = cancel->status();
        if (status != UPC_OK) {
            if (reason) {
                *reason = errCodeName(status);
            }
            return status;
        }
        // Use the nearest deadline
        int remaining = cancel->remainingms();
        if (remaining >= 0 && (timeoutms <= 0 || remaining < timeoutms)) {
            timeoutms = remaining > 0 ? remaining : 1;
        }
    }

    CURL *curl = curl_easy_init();
    if (nullptr == curl) {
        LOGERR("CurlFetch::perform: curl_easy_init failed" << endl);
        if (reason) {
            *reason = "curl_easy_init failed";
        }
        return UPC_E_INIT;
    }

    CurlTransfer xfer(reply, cancel);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &xfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curl_header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &xfer);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curl_xferinfo_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &xfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    if (timeoutms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, long(timeoutms));
    }

    struct curl_slist *slist = nullptr;
    if (headers) {
        for (const auto& hdr : *headers) {
            string line = hdr.first + ": " + hdr.second;
            slist = curl_slist_append(slist, line.c_str());
        }
        // Don't let curl add an Expect: 100-continue
        slist = curl_slist_append(slist, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, slist);
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, long(body->size()));
    }

    LOGDEB1("CurlFetch::perform: " << (body ? "POST " : "GET ") << url <<
            " timeout " << timeoutms << endl);
    CURLcode curl_code = curl_easy_perform(curl);

    int ret = UPC_OK;
    if (curl_code == CURLE_OK) {
        long httpcode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpcode);
        reply.httpcode = int(httpcode);
        LOGDEB1("CurlFetch::perform: http code " << httpcode << endl);
    } else {
        if (curl_code == CURLE_ABORTED_BY_CALLBACK && xfer.cancelled) {
            ret = UPC_E_CANCELLED;
        } else if (curl_code == CURLE_OPERATION_TIMEDOUT) {
            ret = UPC_E_TIMEOUT;
        } else {
            ret = UPC_E_NETWORK;
        }
        LOGDEB("CurlFetch::perform: " << url << ": curl_easy_perform(): " <<
               curl_easy_strerror(curl_code) << endl);
        if (reason) {
            *reason = curl_easy_strerror(curl_code);
        }
    }

    if (slist) {
        curl_slist_free_all(slist);
    }
    curl_easy_cleanup(curl);
    return ret;
}

} // namespace UpCast
