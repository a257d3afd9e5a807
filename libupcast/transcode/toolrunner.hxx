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
#ifndef _TOOLRUNNER_HXX_INCLUDED_
#define _TOOLRUNNER_HXX_INCLUDED_

#include <string>
#include <vector>

namespace UpCast {

class Canceller;

/** Run an external program to completion */
class ToolRunner {
public:
    virtual ~ToolRunner() {}

    /** Execute tool with args, capturing its output.
     * @param cancel if not null, the tool is killed when it is done.
     * @return 0 for success, else a non-zero status (waitpid value, or
     *   -1 if the program could not be started). */
    virtual int run(const std::string& tool,
                    const std::vector<std::string>& args,
                    std::string *output, std::string *erroutput,
                    const Canceller *cancel) = 0;

    /** Check that the tool can be executed (absolute path or $PATH) */
    virtual bool available(const std::string& tool) = 0;

    /** Printable description of a run() return value */
    virtual std::string statusAsString(int status);
};

/** Real runner, fork/exec based */
class ExecToolRunner : public ToolRunner {
public:
    virtual int run(const std::string& tool,
                    const std::vector<std::string>& args,
                    std::string *output, std::string *erroutput,
                    const Canceller *cancel);
    virtual bool available(const std::string& tool);
    virtual std::string statusAsString(int status);
};

} // namespace UpCast

#endif /* _TOOLRUNNER_HXX_INCLUDED_ */
