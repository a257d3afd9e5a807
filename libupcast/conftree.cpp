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
#include "libupcast/conftree.h"

#include <stdlib.h>

#include <fstream>
#include <sstream>

#include "libupcast/smallut.h"
#include "libupcast/log.h"

using namespace std;

#undef DEBUG_CONFTREE
#ifdef DEBUG_CONFTREE
#define CONFDEB LOGDEB
#else
#define CONFDEB LOGDEB2
#endif

static const string WHITESPACE(" \t\n\r");

void ConfSimple::parseinput(istream& input)
{
    string submapkey;
    string line;
    bool appending = false;

    for (;;) {
        string cline;
        getline(input, cline);
        CONFDEB("Parse:line: [" << cline << "] status " << status << endl);
        if (!input.good()) {
            if (input.bad()) {
                CONFDEB("Parse: input.bad()\n");
                status = STATUS_ERROR;
                return;
            }
            CONFDEB("Parse: eof\n");
            // Must be eof ? But maybe we have a partial line which
            // must be processed. This happens if the last line before
            // eof ends with a backslash, or there is no final \n
            if (cline.empty()) {
                break;
            }
        }

        {
            string::size_type pos = cline.find_last_not_of("\n\r");
            if (pos == string::npos) {
                cline.clear();
            } else if (pos != cline.length() - 1) {
                cline.erase(pos + 1);
            }
        }

        if (appending) {
            line += cline;
        } else {
            line = cline;
        }

        // Note that we trim whitespace before checking for backslash-eol
        // This avoids invisible whitespace problems.
        trimstring(line, WHITESPACE.c_str());
        if (line.empty() || line.at(0) == '#') {
            if (input.eof()) {
                break;
            }
            continue;
        }
        if (line[line.length() - 1] == '\\') {
            line.erase(line.length() - 1);
            appending = true;
            continue;
        }
        appending = false;

        if (line[0] == '[') {
            trimstring(line, "[]");
            submapkey = line;
            continue;
        }

        // Look for first equal sign
        string::size_type eqpos = line.find("=");
        if (eqpos == string::npos) {
            if (input.eof()) {
                break;
            }
            continue;
        }

        // Compute name and value, trim white space
        string nm, val;
        nm = line.substr(0, eqpos);
        trimstring(nm, WHITESPACE.c_str());
        val = line.substr(eqpos + 1, string::npos);
        trimstring(val, WHITESPACE.c_str());

        if (nm.length() == 0) {
            if (input.eof()) {
                break;
            }
            continue;
        }
        i_set(nm, val, submapkey);
        if (input.eof()) {
            break;
        }
    }
}

ConfSimple::ConfSimple(const string& data)
    : status(STATUS_RO)
{
    stringstream input(data, ios::in);
    parseinput(input);
}

ConfSimple::ConfSimple(const char *fname)
    : status(STATUS_ERROR)
{
    ifstream input(fname, ios::in);
    if (!input.is_open()) {
        LOGERR("ConfSimple::ConfSimple: can't open " << fname << endl);
        return;
    }
    status = STATUS_RO;
    parseinput(input);
}

int ConfSimple::get(const string& nm, string& value, const string& sk) const
{
    if (!ok()) {
        return 0;
    }

    // Find submap
    auto ss = m_submaps.find(sk);
    if (ss == m_submaps.end()) {
        return 0;
    }

    // Find named value
    auto s = ss->second.find(nm);
    if (s == ss->second.end()) {
        return 0;
    }
    value = s->second;
    return 1;
}

int ConfSimple::get(const string& nm, int *value, const string& sk) const
{
    string sval;
    if (!get(nm, sval, sk) || sval.empty()) {
        return 0;
    }
    char *endptr;
    long lval = strtol(sval.c_str(), &endptr, 0);
    if (*endptr != 0) {
        LOGERR("ConfSimple::get: bad numeric value for " << nm << ": " <<
               sval << endl);
        return 0;
    }
    *value = int(lval);
    return 1;
}

int ConfSimple::i_set(const string& nm, const string& value, const string& sk)
{
    CONFDEB("ConfSimple::i_set: nm[" << nm << "] val[" << value <<
            "] key[" << sk << "]\n");
    // Note that map[sk] creates the submap if it does not exist
    m_submaps[sk][nm] = value;
    return 1;
}
