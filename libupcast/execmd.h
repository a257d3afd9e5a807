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
#ifndef _EXECMD_H_INCLUDED_
#define _EXECMD_H_INCLUDED_

#include <sys/types.h>

#include <string>
#include <vector>

/**
 * Callback checked while a command runs. Returning false kills the
 * command (the whole process group it leads).
 */
class ExecCmdAdvise {
public:
    virtual ~ExecCmdAdvise() {}
    virtual bool keepGoing() = 0;
};

/**
 * Execute command possibly taking both input and output (will do
 * asynchronous io as appropriate for things to work).
 *
 * Input to the command can be provided either once in a parameter
 * or via a callback. Output can be received either in a string or via
 * a callback (here: only the string version is implemented). Both
 * stdout and stderr are captured, stdin is /dev/null.
 */
class ExecCmd {
public:
    ExecCmd() {}
    ~ExecCmd() {}

    /** Set the callback checked every 100 mS while the command runs.
     *  Not owned. */
    void setAdvise(ExecCmdAdvise *adv) {
        m_advise = adv;
    }

    /** True if the last doexec() killed its command on the advise's
     *  request */
    bool wasKilled() const {
        return m_killed;
    }

    /**
     * Execute command.
     *
     * Both stdout and stderr are captured and returned in the strings if
     * they are not null. The command is searched in $PATH if it is
     * not an absolute path.
     *
     * @param cmd the program to execute. This must be an absolute file name
     *   or exist in the PATH.
     * @param args the argument vector (NOT including argv[0]).
     * @param output Output FROM the command.
     * @param erroutput stderr output FROM the command.
     * @return the exit status as returned by waitpid (0 if ok), or -1 if
     *   the command could not be started. If the command can't be found or
     *   can't be executed, the child exits with status 127.
     */
    int doexec(const std::string& cmd, const std::vector<std::string>& args,
               std::string *output = 0, std::string *erroutput = 0);

    /** Human-readable description of a doexec() return value */
    static std::string statusAsString(int status);

    /**
     * Utility routine: check if/where a command is found according to the
     * current PATH (or the specified one
     * @param cmd command name
     * @param exe on return, executable path name if found
     * @param path exec seach path to use instead of getenv(PATH)
     * @return true if found
     */
    static bool which(const std::string& cmd, std::string& exepath,
                      const char* path = 0);

private:
    ExecCmdAdvise *m_advise{nullptr};
    bool m_killed{false};

    int killChild(pid_t pid);

    ExecCmd(const ExecCmd&) = delete;
    ExecCmd& operator=(const ExecCmd&) = delete;
};

#endif /* _EXECMD_H_INCLUDED_ */
