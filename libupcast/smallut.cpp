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
#include "libupcast/smallut.h"

#include <stdlib.h>
#include <ctype.h>
#include <errno.h>

#include <sstream>

using namespace std;

void trimstring(string& s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());

    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length()-1) {
        s.replace(pos+1, string::npos, string());
    }
}

void stringtolower(string& io)
{
    string::iterator it = io.begin();
    string::iterator ite = io.end();
    while (it != ite) {
        *it = ::tolower(*it);
        it++;
    }
}

string stringtolower(const string& i)
{
    string o = i;
    stringtolower(o);
    return o;
}

int stringuppercmp(const string& s1, const string& s2)
{
    string::size_type i = 0;
    for (; i < s1.size() && i < s2.size(); i++) {
        int c2 = ::toupper((unsigned char)s2[i]);
        int c1 = (unsigned char)s1[i];
        if (c1 != c2) {
            return c1 > c2 ? 1 : -1;
        }
    }
    if (s1.size() == s2.size()) {
        return 0;
    }
    return s1.size() > s2.size() ? 1 : -1;
}

void stringToTokens(const string& str, vector<string>& tokens,
                    const string& delims, bool allowempty)
{
    string::size_type startPos = 0, pos;

    // Skip initial delims, return empty if this eats all.
    if (!allowempty &&
        (startPos = str.find_first_not_of(delims, 0)) == string::npos) {
        return;
    }
    while (startPos < str.size()) {
        // Find next delimiter or end of string (end of token)
        pos = str.find_first_of(delims, startPos);

        // Add token to the vector and adjust start
        if (pos == string::npos) {
            tokens.push_back(str.substr(startPos));
            break;
        } else if (pos == startPos) {
            // Dont' push empty tokens after first
            if (allowempty) {
                tokens.push_back(string());
            }
            startPos = ++pos;
        } else {
            tokens.push_back(str.substr(startPos, pos - startPos));
            startPos = ++pos;
        }
    }
}

bool stringToInt(const string& s, int *val)
{
    string t(s);
    trimstring(t, " \t\r\n");
    if (t.empty()) {
        return false;
    }
    char *endptr;
    errno = 0;
    long l = strtol(t.c_str(), &endptr, 10);
    if (*endptr != 0 || errno != 0) {
        return false;
    }
    *val = int(l);
    return true;
}

string lltodecstr(long long val)
{
    ostringstream out;
    out << val;
    return out.str();
}
