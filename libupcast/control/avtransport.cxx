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
#include "libupcast/control/avtransport.hxx"

#include <sstream>
#include <string>

#include "libupcast/netfetch.h"
#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

bool AVTransport::isAVTService(const string& st)
{
    return st.find("AVTransport") != string::npos;
}

AVTransport::AVTransport(const UPnPDeviceDesc& device,
                         const UPnPServiceDesc& service,
                         NetFetch *fetcher, int timeoutms)
    : m_serviceType(service.serviceType),
      m_actionURL(device.absoluteURL(service.controlURL)),
      m_friendlyName(device.friendlyName),
      m_fetcher(fetcher), m_timeoutms(timeoutms)
{
    if (!service.eventSubURL.empty()) {
        m_eventURL = device.absoluteURL(service.eventSubURL);
    }
    LOGDEB1("AVTransport: " << m_friendlyName << " action URL " <<
            m_actionURL << " event URL " << m_eventURL << endl);
}

int AVTransport::runAction(const SoapEncodeInput& args,
                           const Canceller *cancel, string *reason)
{
    if (nullptr == m_fetcher) {
        if (reason) {
            *reason = "no HTTP client";
        }
        return UPC_E_INIT;
    }
    NetFetch::HeaderList headers;
    headers.push_back(pair<string,string>("Content-Type",
                                          "text/xml; charset=utf-8"));
    headers.push_back(pair<string,string>("SOAPAction",
                                          soapActionHeader(args)));
    string body = buildSoapBody(args);

    LOGDEB("AVTransport::runAction: " << args.name << " -> " <<
           m_actionURL << endl);
    NetFetch::Reply reply;
    string fetchreason;
    int ret = m_fetcher->post(m_actionURL, headers, body, m_timeoutms,
                              cancel, reply, &fetchreason);
    if (ret == UPC_E_CANCELLED) {
        if (reason) {
            *reason = args.name + ": cancelled";
        }
        return UPC_E_CANCELLED;
    }
    if (ret != UPC_OK) {
        LOGERR("AVTransport::runAction: " << args.name << " on " <<
               m_friendlyName << ": " << fetchreason << endl);
        if (reason) {
            *reason = args.name + " failed: " + fetchreason;
        }
        return UPC_E_REMOTECTL;
    }
    if (!NetFetch::is2xx(reply.httpcode)) {
        ostringstream os;
        os << args.name << " failed: HTTP status " << reply.httpcode;
        int upnperr;
        string upnpdesc;
        if (decodeSoapFault(reply.body, &upnperr, &upnpdesc)) {
            os << " (UPnP error " << upnperr;
            if (!upnpdesc.empty()) {
                os << ": " << upnpdesc;
            }
            os << ")";
        }
        LOGERR("AVTransport::runAction: " << m_friendlyName << ": " <<
               os.str() << endl);
        if (reason) {
            *reason = os.str();
        }
        return UPC_E_REMOTECTL;
    }
    LOGDEB1("AVTransport::runAction: " << args.name << " ok\n");
    return UPC_OK;
}

int AVTransport::setURI(const string& uri, const string& metadata,
                        const Canceller *cancel, string *reason,
                        int instanceID)
{
    SoapEncodeInput args(m_serviceType, "SetAVTransportURI");
    args("InstanceID", SoapHelp::i2s(instanceID))
        ("CurrentURI", uri)
        ("CurrentURIMetaData", metadata);
    return runAction(args, cancel, reason);
}

int AVTransport::play(int speed, const Canceller *cancel, string *reason,
                      int instanceID)
{
    SoapEncodeInput args(m_serviceType, "Play");
    args("InstanceID", SoapHelp::i2s(instanceID))
        ("Speed", SoapHelp::i2s(speed));
    return runAction(args, cancel, reason);
}

int AVTransport::stop(const Canceller *cancel, string *reason, int instanceID)
{
    SoapEncodeInput args(m_serviceType, "Stop");
    args("InstanceID", SoapHelp::i2s(instanceID));
    return runAction(args, cancel, reason);
}

} // namespace UpCast
