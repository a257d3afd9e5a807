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
#include "libupcast/transcode/toolrunner.hxx"

#include "libupcast/canceller.hxx"
#include "libupcast/execmd.h"
#include "libupcast/log.h"

using namespace std;

namespace UpCast {

string ToolRunner::statusAsString(int status)
{
    return string("status ") + to_string(status);
}

class CancelAdvise : public ExecCmdAdvise {
public:
    explicit CancelAdvise(const Canceller *c)
        : cancel(c) {}
    virtual bool keepGoing() {
        return !cancel->done();
    }
    const Canceller *cancel;
};

int ExecToolRunner::run(const string& tool, const vector<string>& args,
                        string *output, string *erroutput,
                        const Canceller *cancel)
{
    ExecCmd cmd;
    CancelAdvise advise(cancel);
    if (cancel) {
        cmd.setAdvise(&advise);
    }
    int status = cmd.doexec(tool, args, output, erroutput);
    if (cmd.wasKilled()) {
        LOGINF("ExecToolRunner: " << tool << " interrupted\n");
    } else if (status != 0) {
        LOGDEB("ExecToolRunner: " << tool << ": " <<
               ExecCmd::statusAsString(status) << endl);
    }
    return status;
}

bool ExecToolRunner::available(const string& tool)
{
    string exepath;
    return ExecCmd::which(tool, exepath);
}

string ExecToolRunner::statusAsString(int status)
{
    return ExecCmd::statusAsString(status);
}

} // namespace UpCast
