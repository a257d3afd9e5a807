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
#ifndef _XMLPARSER_H_X_INCLUDED_
#define _XMLPARSER_H_X_INCLUDED_

#include <expat.h>

#include <string>

namespace UpCast {

/**
 * Minimal event-style wrapper for the expat parser. Derived classes
 * override the element and data handlers. The input is parsed from a
 * string reference which must stay valid during Parse().
 */
class XMLParser {
public:
    XMLParser(const std::string& input);
    virtual ~XMLParser();

    /** Parse the whole input. @return false on XML error (see getReason()) */
    bool Parse();

    const std::string& getReason() const {
        return m_reason;
    }

protected:
    virtual void StartElement(const XML_Char *, const XML_Char **) {}
    virtual void EndElement(const XML_Char *) {}
    virtual void CharacterData(const XML_Char *, int) {}

    /** Strip the namespace prefix if any: "s:Body" -> "Body" */
    static const XML_Char *localName(const XML_Char *name);

    XML_Parser expat_parser{nullptr};

private:
    const std::string& m_input;
    std::string m_reason;

    static void startElementCB(void *userData, const XML_Char *name,
                               const XML_Char **atts);
    static void endElementCB(void *userData, const XML_Char *name);
    static void characterDataCB(void *userData, const XML_Char *s, int len);

    XMLParser(const XMLParser&) = delete;
    XMLParser& operator=(const XMLParser&) = delete;
};

} // namespace UpCast

#endif /* _XMLPARSER_H_X_INCLUDED_ */
