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
// An XML parser which constructs an UPnP device object from the
// device descriptor
#include "libupcast/control/description.hxx"

#include <vector>

#include "libupcast/xmlparser.hxx"
#include "libupcast/upcastp.hxx"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

class UPnPDeviceParser : public XMLParser {
public:
    UPnPDeviceParser(const string& input, UPnPDeviceDesc& device)
        : XMLParser(input), m_device(device)
        {}

protected:
    virtual void StartElement(const XML_Char *name, const XML_Char **)
    {
        m_path.push_back(localName(name));
        if (!m_path.back().compare("device")) {
            m_devdepth++;
        }
        m_chardata.clear();
    }

    virtual void EndElement(const XML_Char *)
    {
        if (m_path.empty())
            return;
        const string elt = m_path.back();
        string str;
        str.swap(m_chardata);
        trimstring(str, " \t\r\n");
        // Device properties: only from the root device, not embedded ones
        bool rootdev = m_devdepth == 1 && m_path.size() >= 2 &&
            !m_path[m_path.size()-2].compare("device");
        switch (elt[0]) {
        case 'c':
            if (!elt.compare("controlURL"))
                m_tservice.controlURL = str;
            break;
        case 'd':
            if (!elt.compare("device"))
                m_devdepth--;
            else if (rootdev && !elt.compare("deviceType"))
                m_device.deviceType = str;
            break;
        case 'e':
            if (!elt.compare("eventSubURL"))
                m_tservice.eventSubURL = str;
            break;
        case 'f':
            if (rootdev && !elt.compare("friendlyName"))
                m_device.friendlyName = str;
            break;
        case 'm':
            if (rootdev && !elt.compare("manufacturer"))
                m_device.manufacturer = str;
            else if (rootdev && !elt.compare("modelName"))
                m_device.modelName = str;
            break;
        case 's':
            if (!elt.compare("service")) {
                m_device.services.push_back(m_tservice);
                m_tservice.clear();
            } else if (!elt.compare("serviceType")) {
                m_tservice.serviceType = str;
            } else if (!elt.compare("serviceId")) {
                m_tservice.serviceId = str;
            }
            break;
        case 'S':
            if (!elt.compare("SCPDURL"))
                m_tservice.SCPDURL = str;
            break;
        case 'U':
            if (rootdev && !elt.compare("UDN"))
                m_device.UDN = str;
            else if (!elt.compare("URLBase") && m_devdepth == 0)
                m_device.URLBase = str;
            break;
        }
        m_path.pop_back();
    }

    virtual void CharacterData(const XML_Char *s, int len)
    {
        if (s == 0 || len <= 0)
            return;
        m_chardata.append(s, len);
    }

private:
    UPnPDeviceDesc& m_device;
    std::vector<std::string> m_path;
    int m_devdepth{0};
    string m_chardata;
    UPnPServiceDesc m_tservice;
};

UPnPDeviceDesc::UPnPDeviceDesc(const string& url, const string& description)
    : descURL(url)
{
    UPnPDeviceParser mparser(description, *this);
    if (!mparser.Parse()) {
        reason = mparser.getReason();
        LOGERR("UPnPDeviceDesc: parse failed for " << url << ": " << reason <<
               endl);
        return;
    }
    if (URLBase.empty()) {
        // The standard says that if the URLBase value is empty, we
        // should use the url the description was retrieved
        // from. Relative references are resolved against it, so it
        // must be kept whole (not only the host part).
        URLBase = url;
    }
    ok = true;
    LOGDEB1("UPnPDeviceDesc: " << dump());
}

string UPnPDeviceDesc::absoluteURL(const string& ref) const
{
    return resolveurl(URLBase, ref);
}

} // namespace UpCast
