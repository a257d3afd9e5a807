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
#include "libupcast/execmd.h"

#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>

#include <sstream>

#include "libupcast/smallut.h"
#include "libupcast/pathut.h"
#include "libupcast/log.h"

using namespace std;

bool ExecCmd::which(const string& cmd, string& exepath, const char* path)
{
    if (cmd.empty()) {
        return false;
    }
    if (cmd[0] == '/') {
        if (access(cmd.c_str(), X_OK) == 0) {
            exepath = cmd;
            return true;
        } else {
            return false;
        }
    }

    const char *pp;
    if (path) {
        pp = path;
    } else {
        pp = getenv("PATH");
    }
    if (pp == 0) {
        return false;
    }

    vector<string> pels;
    stringToTokens(pp, pels, ":");
    for (vector<string>::iterator it = pels.begin(); it != pels.end(); it++) {
        string candidate = path_cat(it->empty() ? string(".") : *it, cmd);
        if (access(candidate.c_str(), X_OK) == 0 &&
            !path_isdir(candidate)) {
            exepath = candidate;
            return true;
        }
    }
    return false;
}

string ExecCmd::statusAsString(int status)
{
    ostringstream out;
    if (status == -1) {
        out << "could not start";
    } else if (WIFEXITED(status)) {
        out << "exit status " << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out << "killed by signal " << WTERMSIG(status);
    } else {
        out << "status " << status;
    }
    return out.str();
}

// Close both ends of a pipe, ignoring already closed ones
static void closepipe(int fds[2])
{
    for (int i = 0; i < 2; i++) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Terminate the child's process group and reap the leader. Use SIGKILL
// if SIGTERM was not enough after a while. Returns the waitpid status.
int ExecCmd::killChild(pid_t pid)
{
    LOGDEB("ExecCmd: killing process group " << pid << endl);
    ::kill(-pid, SIGTERM);
    int status = -1;
    for (int i = 0; i < 20; i++) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            return status;
        }
        if (ret < 0 && errno != EINTR) {
            LOGSYSERR("ExecCmd::killChild", "waitpid", pid);
            return -1;
        }
        usleep(100 * 1000);
    }
    LOGINF("ExecCmd: process " << pid << " ignored SIGTERM\n");
    ::kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOGSYSERR("ExecCmd::killChild", "waitpid", pid);
            return -1;
        }
    }
    return status;
}

int ExecCmd::doexec(const string& cmd, const vector<string>& args,
                    string *output, string *erroutput)
{
    m_killed = false;
    string exe;
    if (!which(cmd, exe)) {
        LOGERR("ExecCmd::doexec: command not found: " << cmd << endl);
        return -1;
    }

    // Prepare argv before forking: no allocation in the child.
    vector<const char *> argv;
    argv.push_back(exe.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    {
        string cmdline(exe);
        for (const auto& arg : args) {
            cmdline += " [" + arg + "]";
        }
        LOGDEB("ExecCmd::doexec: " << cmdline << endl);
    }

    int outpipe[2] = {-1, -1};
    int errpipe[2] = {-1, -1};
    if (pipe(outpipe) < 0 || pipe(errpipe) < 0) {
        LOGSYSERR("ExecCmd::doexec", "pipe", "");
        closepipe(outpipe);
        closepipe(errpipe);
        return -1;
    }

    pid_t pid = fork();
    if (pid < 0) {
        LOGSYSERR("ExecCmd::doexec", "fork", "");
        closepipe(outpipe);
        closepipe(errpipe);
        return -1;
    }

    if (pid == 0) {
        // Child. Lead a process group, so that a kill reaches the
        // command's own children.
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, 0);
            close(devnull);
        }
        dup2(outpipe[1], 1);
        dup2(errpipe[1], 2);
        close(outpipe[0]);
        close(outpipe[1]);
        close(errpipe[0]);
        close(errpipe[1]);
        execv(exe.c_str(), (char *const*)&argv[0]);
        _exit(127);
    }

    // Parent. Also set the group here, the child may not have run yet.
    setpgid(pid, pid);
    close(outpipe[1]);
    outpipe[1] = -1;
    close(errpipe[1]);
    errpipe[1] = -1;

    struct pollfd pfds[2];
    pfds[0].fd = outpipe[0];
    pfds[0].events = POLLIN;
    pfds[1].fd = errpipe[0];
    pfds[1].events = POLLIN;
    string *dests[2] = {output, erroutput};
    int nopen = 2;
    char buf[8192];
    while (nopen > 0) {
        if (m_advise && !m_advise->keepGoing()) {
            m_killed = true;
            break;
        }
        int ret = poll(pfds, 2, m_advise ? 100 : -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOGSYSERR("ExecCmd::doexec", "poll", "");
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(pfds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                // EOF or error: this stream is done
                pfds[i].fd = -1;
                nopen--;
                continue;
            }
            if (dests[i]) {
                dests[i]->append(buf, n);
            }
        }
    }
    closepipe(outpipe);
    closepipe(errpipe);
    if (m_killed) {
        return killChild(pid);
    }

    int status;
    for (;;) {
        if (waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOGSYSERR("ExecCmd::doexec", "waitpid", pid);
            return -1;
        }
        break;
    }
    LOGDEB1("ExecCmd::doexec: " << cmd << ": " << statusAsString(status) <<
            endl);
    return status;
}
