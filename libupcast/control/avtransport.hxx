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
#ifndef _AVTRANSPORT_HXX_INCLUDED_
#define _AVTRANSPORT_HXX_INCLUDED_

#include <string>

#include "libupcast/control/description.hxx"
#include "libupcast/control/soaphelp.hxx"

namespace UpCast {

class NetFetch;
class Canceller;

/**
 * AVTransport Service client class.
 *
 * Only the actions needed to start and stop playback are implemented.
 * Each call is a synchronous SOAP POST to the control URL. The NetFetch
 * object is not owned and must outlive us.
 */
class AVTransport {
public:

    /** Build from the device description and the service entry */
    AVTransport(const UPnPDeviceDesc& device, const UPnPServiceDesc& service,
                NetFetch *fetcher, int timeoutms = 5000);

    /** Test service type from discovery message. Any service type which
     *  contains "AVTransport" is accepted, whatever the version. */
    static bool isAVTService(const std::string& st);

    /** Set the current media. The metadata may be empty. */
    int setURI(const std::string& uri, const std::string& metadata,
               const Canceller *cancel, std::string *reason = 0,
               int instanceID = 0);

    int play(int speed, const Canceller *cancel, std::string *reason = 0,
             int instanceID = 0);

    int stop(const Canceller *cancel, std::string *reason = 0,
             int instanceID = 0);

    /** Perform a SOAP call and check the reply status.
     * @return UPC_OK, UPC_E_CANCELLED or UPC_E_REMOTECTL. */
    int runAction(const SoapEncodeInput& args, const Canceller *cancel,
                  std::string *reason = 0);

    const std::string& getServiceType() const {
        return m_serviceType;
    }
    const std::string& getActionURL() const {
        return m_actionURL;
    }
    const std::string& getEventURL() const {
        return m_eventURL;
    }
    void setTimeoutMs(int ms) {
        m_timeoutms = ms;
    }

private:
    std::string m_serviceType;
    std::string m_actionURL;
    std::string m_eventURL;
    std::string m_friendlyName;
    NetFetch *m_fetcher;
    int m_timeoutms;
};

} // namespace UpCast

#endif /* _AVTRANSPORT_HXX_INCLUDED_ */
