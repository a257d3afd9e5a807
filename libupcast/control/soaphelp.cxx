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
#include "libupcast/control/soaphelp.hxx"

#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "libupcast/xmlparser.hxx"
#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

/* The action call envelope is like:
   <?xml version="1.0" encoding="utf-8"?>
   <s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/"
     s:encodingStyle="http://schemas.xmlsoap.org/soap/encoding/">
     <s:Body>
       <u:SetAVTransportURI
          xmlns:u="urn:schemas-upnp-org:service:AVTransport:1">
         <InstanceID>0</InstanceID>
         <CurrentURI>http://...</CurrentURI>
         <CurrentURIMetaData></CurrentURIMetaData>
       </u:SetAVTransportURI>
     </s:Body>
   </s:Envelope>
*/
string buildSoapBody(const SoapEncodeInput& data)
{
    string out;
    out += "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body>";
    out += string("<u:") + data.name + " xmlns:u=\"" +
        SoapHelp::xmlQuote(data.serviceType) + "\">";
    for (const auto& arg : data.data) {
        out += "<" + arg.first + ">" + SoapHelp::xmlQuote(arg.second) +
            "</" + arg.first + ">";
    }
    out += string("</u:") + data.name + ">";
    out += "</s:Body></s:Envelope>";
    return out;
}

string soapActionHeader(const SoapEncodeInput& data)
{
    return string("\"") + data.serviceType + "#" + data.name + "\"";
}

// Fault reply:
// <s:Envelope><s:Body><s:Fault><faultcode>s:Client</faultcode>
//  <faultstring>UPnPError</faultstring><detail>
//  <UPnPError xmlns="urn:schemas-upnp-org:control-1-0">
//   <errorCode>714</errorCode>
//   <errorDescription>Illegal MIME-type</errorDescription>
//  </UPnPError></detail></s:Fault></s:Body></s:Envelope>
class SoapFaultParser : public XMLParser {
public:
    SoapFaultParser(const string& input)
        : XMLParser(input) {}

    bool sawfault{false};
    string errorCode;
    string errorDescription;

protected:
    virtual void StartElement(const XML_Char *name, const XML_Char **) {
        const XML_Char *nm = localName(name);
        if (!strcmp(nm, "Fault")) {
            sawfault = true;
        }
        m_chardata.clear();
    }
    virtual void EndElement(const XML_Char *name) {
        const XML_Char *nm = localName(name);
        if (!strcmp(nm, "errorCode")) {
            errorCode = m_chardata;
            trimstring(errorCode, " \t\r\n");
        } else if (!strcmp(nm, "errorDescription")) {
            errorDescription = m_chardata;
            trimstring(errorDescription, " \t\r\n");
        }
    }
    virtual void CharacterData(const XML_Char *s, int len) {
        m_chardata.append(s, len);
    }
private:
    string m_chardata;
};

bool decodeSoapFault(const string& body, int *errorCode,
                     string *errorDescription)
{
    if (body.empty()) {
        return false;
    }
    SoapFaultParser parser(body);
    if (!parser.Parse() || !parser.sawfault) {
        return false;
    }
    int code = -1;
    if (!stringToInt(parser.errorCode, &code)) {
        LOGDEB("decodeSoapFault: no/bad errorCode [" << parser.errorCode <<
               "]\n");
    }
    if (errorCode) {
        *errorCode = code;
    }
    if (errorDescription) {
        *errorDescription = parser.errorDescription;
    }
    return true;
}

namespace SoapHelp {

string xmlQuote(const string& in)
{
    string out;
    for (unsigned int i = 0; i < in.size(); i++) {
        switch(in[i]) {
        case '"': out += "&quot;";break;
        case '&': out += "&amp;";break;
        case '<': out += "&lt;";break;
        case '>': out += "&gt;";break;
        case '\'': out += "&apos;";break;
        default: out += in[i];
        }
    }
    return out;
}

string xmlUnquote(const string& in)
{
    string out;
    for (unsigned int i = 0; i < in.size(); i++) {
        if (in[i] == '&') {
            unsigned int j;
            for (j = i; j < in.size(); j++) {
                if (in[j] == ';')
                    break;
            }
            if (in[j] != ';') {
                out += in.substr(i);
                return out;
            }
            string entname = in.substr(i+1, j-i-1);
            if (!entname.compare("quot")) {
                out += '"';
            } else if (!entname.compare("amp")) {
                out += '&';
            } else if (!entname.compare("lt")) {
                out += '<';
            } else if (!entname.compare("gt")) {
                out += '>';
            } else if (!entname.compare("apos")) {
                out += '\'';
            } else {
                out += in.substr(i, j-i+1);
            }
            i = j;
        } else {
            out += in[i];
        }
    }
    return out;
}

string i2s(int val)
{
    char cbuf[30];
    sprintf(cbuf, "%d", val);
    return string(cbuf);
}

} // namespace SoapHelp

} // namespace UpCast
