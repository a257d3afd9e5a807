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
#include "libupcast/upcastlib.hxx"
#include "libupcast/upcastp.hxx"

#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

#include <sstream>

#include "libupcast/log.h"

using namespace std;

namespace UpCast {

const char *errCodeName(int code)
{
    switch (code) {
    case UPC_OK: return "UPC_OK";
    case UPC_E_CANCELLED: return "UPC_E_CANCELLED";
    case UPC_E_TIMEOUT: return "UPC_E_TIMEOUT";
    case UPC_E_DESCFETCH: return "UPC_E_DESCFETCH";
    case UPC_E_NOSERVICE: return "UPC_E_NOSERVICE";
    case UPC_E_REMOTECTL: return "UPC_E_REMOTECTL";
    case UPC_E_UNSUPPORTED: return "UPC_E_UNSUPPORTED";
    case UPC_E_TRANSCODE: return "UPC_E_TRANSCODE";
    case UPC_E_RANGE: return "UPC_E_RANGE";
    case UPC_E_INIT: return "UPC_E_INIT";
    case UPC_E_NOTFOUND: return "UPC_E_NOTFOUND";
    case UPC_E_STATE: return "UPC_E_STATE";
    case UPC_E_NETWORK: return "UPC_E_NETWORK";
    default: return "UPC_E_UNKNOWN";
    }
}

string errAsString(const string& who, int code)
{
    ostringstream os;
    os << who << " :" << code << ": " << errCodeName(code);
    return os.str();
}

static string::size_type hostpartend(const string& url)
{
    string::size_type pos = url.find("://");
    if (pos == string::npos) {
        return string::npos;
    }
    return url.find_first_of("/?#", pos + 3);
}

string resolveurl(const string& base, const string& ref)
{
    if (ref.empty()) {
        return base;
    }
    if (ref.find("://") != string::npos) {
        return ref;
    }
    string::size_type hend = hostpartend(base);
    string hostpart = hend == string::npos ? base : base.substr(0, hend);
    if (ref[0] == '/') {
        return hostpart + ref;
    }
    // Relative: strip query, then the last path element of base
    string path = hend == string::npos ? string("/") : base.substr(hend);
    string::size_type q = path.find_first_of("?#");
    if (q != string::npos) {
        path.erase(q);
    }
    string::size_type slash = path.rfind('/');
    if (slash == string::npos) {
        path = "/";
    } else {
        path.erase(slash + 1);
    }
    return hostpart + path + ref;
}

string getLanIPv4(const string& iface)
{
    struct ifaddrs *ifap;
    if (getifaddrs(&ifap) != 0) {
        LOGERR("getLanIPv4: getifaddrs failed: " << strerror(errno) << endl);
        return string();
    }
    string out;
    for (struct ifaddrs *ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (nullptr == ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }
        if (!iface.empty() && iface.compare(ifa->ifa_name)) {
            continue;
        }
        char buf[INET_ADDRSTRLEN];
        struct sockaddr_in *sin = (struct sockaddr_in *)ifa->ifa_addr;
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            out = buf;
            LOGDEB1("getLanIPv4: using " << ifa->ifa_name << " " << out <<
                    endl);
            break;
        }
    }
    freeifaddrs(ifap);
    return out;
}

} // namespace UpCast
