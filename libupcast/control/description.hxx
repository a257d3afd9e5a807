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
#ifndef _UPNPDEV_HXX_INCLUDED_
#define _UPNPDEV_HXX_INCLUDED_

/**
 * UPnP Description phase: interpreting the device description which we
 * downloaded from the URL obtained by the discovery phase.
 */

#include <vector>
#include <string>
#include <sstream>

namespace UpCast {

/**
 * Data holder for a UPnP service, parsed from the XML description
 * downloaded after discovery yielded its URL.
 */
class UPnPServiceDesc {
public:
    /// Service Type e.g. urn:schemas-upnp-org:service:AVTransport:1
    std::string serviceType;
    /// Service Id inside device: e.g. urn:upnp-org:serviceId:AVTransport
    std::string serviceId;
    /// Service description URL.
    std::string SCPDURL;
    /// Service control URL.
    std::string controlURL;
    /// Service event URL.
    std::string eventSubURL;

    void clear() {
        serviceType.clear();
        serviceId.clear();
        SCPDURL.clear();
        controlURL.clear();
        eventSubURL.clear();
    }

    std::string dump() const {
        std::ostringstream os;
        os << "SERVICE {serviceType [" << serviceType <<
            "] serviceId [" << serviceId <<
            "] SCPDURL [" << SCPDURL <<
            "] controlURL [" << controlURL <<
            "] eventSubURL [" << eventSubURL <<
            "] }" << std::endl;
        return os.str();
    }
};

/**
 * Data holder for a UPnP device, parsed from the XML description obtained
 * during discovery. Only the root device properties are kept, but the
 * service list includes the embedded devices' services.
 */
class UPnPDeviceDesc {
public:
    /** Build device from xml description downloaded from discovery
     * @param url where the description came from
     * @param description the xml device description
     */
    UPnPDeviceDesc(const std::string& url, const std::string& description);

    UPnPDeviceDesc() {}

    bool ok{false};
    /// Parse error message if !ok
    std::string reason;
    /// Where the description came from
    std::string descURL;
    /// Device Type: e.g. urn:schemas-upnp-org:device:MediaRenderer:1
    std::string deviceType;
    /// User-configurable name (usually), e.g. Lounge-streamer
    std::string friendlyName;
    /// Unique Device Number. This is the same as the deviceID in the
    /// discovery message. e.g. uuid:a7bdcd12-e6c1-4c7e-b588-3bbc959eda8d
    std::string UDN;
    /// Base for all relative URLs. e.g. http://192.168.4.4:49152/
    std::string URLBase;
    /// Manufacturer: e.g. D-Link, PacketVideo ("manufacturer")
    std::string manufacturer;
    /// Model name: e.g. MediaTomb, DNS-327L ("modelName")
    std::string modelName;
    /// Services provided by this device.
    std::vector<UPnPServiceDesc> services;

    /** Turn a possibly relative URL from the description into an
     *  absolute one. */
    std::string absoluteURL(const std::string& ref) const;

    std::string dump() const {
        std::ostringstream os;
        os << "DEVICE " << " {deviceType [" << deviceType <<
            "] friendlyName [" << friendlyName <<
            "] UDN [" << UDN <<
            "] URLBase [" << URLBase << "] Services:" << std::endl;
        for (std::vector<UPnPServiceDesc>::const_iterator it =
                 services.begin(); it != services.end(); it++) {
            os << "    " << it->dump();
        }
        os << "}" << std::endl;
        return os.str();
    }
};

} // namespace

#endif /* _UPNPDEV_HXX_INCLUDED_ */
