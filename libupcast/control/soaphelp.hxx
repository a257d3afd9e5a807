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
#ifndef _SOAPHELP_H_X_INCLUDED_
#define _SOAPHELP_H_X_INCLUDED_

#include <vector>
#include <string>
#include <utility>

namespace UpCast {

/** Store the values to be encoded in a SOAP action call.
 *
 * The elements in the call must be in a defined order, so we
 * can't use a map as container, we use a vector of pairs instead.
 */
class SoapEncodeInput {
public:
    SoapEncodeInput() {}
    SoapEncodeInput(const std::string& st, const std::string& nm)
        : serviceType(st), name(nm) {}
    SoapEncodeInput& addarg(const std::string& k, const std::string& v) {
        data.push_back(std::pair<std::string, std::string>(k, v));
        return *this;
    }
    SoapEncodeInput& operator() (const std::string& k, const std::string& v) {
        data.push_back(std::pair<std::string, std::string>(k, v));
        return *this;
    }

    std::string serviceType;
    std::string name;
    std::vector<std::pair<std::string, std::string> > data;
};

/** Build the complete SOAP envelope for an action call. Argument values
 *  are XML-escaped. */
extern std::string buildSoapBody(const SoapEncodeInput& data);

/** The SOAPACTION header value: "serviceType#name", with the quotes */
extern std::string soapActionHeader(const SoapEncodeInput& data);

/** Extract the UPnP error code and description from a SOAP fault reply.
 * @return false if the body does not look like a UPnP fault. */
extern bool decodeSoapFault(const std::string& body, int *errorCode,
                            std::string *errorDescription);

namespace SoapHelp {
    std::string xmlQuote(const std::string& in);
    std::string xmlUnquote(const std::string& in);
    std::string i2s(int val);
}

} // namespace UpCast

#endif /* _SOAPHELP_H_X_INCLUDED_ */
