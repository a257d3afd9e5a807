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
#include "libupcast/xmlparser.hxx"

#include <string.h>

#include <sstream>

#include "libupcast/log.h"

using namespace std;

namespace UpCast {

XMLParser::XMLParser(const string& input)
    : m_input(input)
{
    expat_parser = XML_ParserCreate(nullptr);
    if (nullptr == expat_parser) {
        m_reason = "XML_ParserCreate failed";
        return;
    }
    XML_SetUserData(expat_parser, this);
    XML_SetElementHandler(expat_parser, startElementCB, endElementCB);
    XML_SetCharacterDataHandler(expat_parser, characterDataCB);
}

XMLParser::~XMLParser()
{
    if (expat_parser) {
        XML_ParserFree(expat_parser);
        expat_parser = nullptr;
    }
}

bool XMLParser::Parse()
{
    if (nullptr == expat_parser) {
        return false;
    }
    if (XML_Parse(expat_parser, m_input.c_str(), int(m_input.size()), 1) ==
        XML_STATUS_ERROR) {
        ostringstream os;
        os << "XML error: " <<
            XML_ErrorString(XML_GetErrorCode(expat_parser)) << " at line " <<
            XML_GetCurrentLineNumber(expat_parser);
        m_reason = os.str();
        LOGDEB("XMLParser::Parse: " << m_reason << endl);
        return false;
    }
    return true;
}

const XML_Char *XMLParser::localName(const XML_Char *name)
{
    const XML_Char *colon = strchr(name, ':');
    return colon ? colon + 1 : name;
}

void XMLParser::startElementCB(void *userData, const XML_Char *name,
                               const XML_Char **atts)
{
    static_cast<XMLParser*>(userData)->StartElement(name, atts);
}

void XMLParser::endElementCB(void *userData, const XML_Char *name)
{
    static_cast<XMLParser*>(userData)->EndElement(name);
}

void XMLParser::characterDataCB(void *userData, const XML_Char *s, int len)
{
    static_cast<XMLParser*>(userData)->CharacterData(s, len);
}

} // namespace UpCast
