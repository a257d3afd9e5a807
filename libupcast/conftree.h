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
#ifndef _CONFTREE_H_INCLUDED_
#define _CONFTREE_H_INCLUDED_

/**
 * A simple configuration file implementation.
 *
 * Configuration files have lines like 'name = value', and/or like '[subkey]'
 *
 * Lines like '[subkey]' in the file define subsections, with independant
 * configuration namespaces. Only subsections holding at least one variable are
 * significant (empty subsections may be deleted during an update, or not).
 *
 * Whitespace around name and value is insignificant.
 *
 * Lines beginning with # are ignored. A value can be continued on the
 * next line by ending the line with a backslash.
 *
 * The names/values are stored in maps, there is no order kept.
 */

#include <string>
#include <map>

class ConfSimple {
public:

    enum StatusCode {STATUS_ERROR = 0, STATUS_RO = 1};

    /**
     * Build the object by reading content from file.
     * @param filename file to open
     */
    ConfSimple(const char *fname);

    /**
     * Build the object by reading content from a string
     * @param data points to the data to parse
     */
    ConfSimple(const std::string& data);

    virtual ~ConfSimple() {}

    /**
     * Get string value for named parameter, from specified subsection
     * (or top level if sk is empty).
     * @return 0 if name not found, 1 else
     */
    virtual int get(const std::string& name, std::string& value,
                    const std::string& sk = std::string()) const;

    /**
     * Get integer value for named parameter, from specified subsection.
     * The value is left unchanged if not found or not a number.
     * @return 0 if name not found or bad value, 1 else
     */
    virtual int get(const std::string& name, int *value,
                    const std::string& sk = std::string()) const;

    virtual bool ok() const {
        return status != STATUS_ERROR;
    }

protected:
    StatusCode status;

private:
    // Configuration data submaps (one per subkey, the main data has a
    // null subkey)
    std::map<std::string, std::map<std::string, std::string> > m_submaps;

    void parseinput(std::istream& input);
    int i_set(const std::string& nm, const std::string& val,
              const std::string& sk);
};

#endif /*_CONFTREE_H_INCLUDED_ */
