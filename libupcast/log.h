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
#ifndef _LOG_H_X_INCLUDED_
#define _LOG_H_X_INCLUDED_

#include <fstream>
#include <iostream>
#include <string>
#include <mutex>

#ifndef LOGGER_THREADSAFE
#define LOGGER_THREADSAFE 1
#endif

// Can't use the symbolic Logger::LLXX names in preproc. 6 is LLDEB1
#ifndef LOGGER_STATICVERBOSITY
#define LOGGER_STATICVERBOSITY 5
#endif

class Logger {
public:
    /** Initialize logging to file or stderr. Use "stderr" as file name to
     *  write to stderr, an empty name gets the existing log. */
    static Logger *getTheLog(const std::string& fn);

    /** Close and reopen the output file. For rotating the log: rename
     * then reopen. */
    bool reopen(const std::string& fn);

    /** Retrieve the output stream in case you need to write directly
     * to it. In a multithreaded program, you probably also need to obtain
     * the mutex with getmutex, and lock it. */
    std::ostream& getstream() {
        return m_tocerr ? std::cerr : m_stream;
    }

    /** @brief Log level values. Messages at level above the current will
     * not be printed. Messages at a level above
     * LOGGER_STATICVERBOSITY will not even be compiled in. */
    enum LogLevel {LLNON=0, LLFAT=1, LLERR=2, LLINF=3, LLDEB=4,
                   LLDEB0=5, LLDEB1=6, LLDEB2=7};

    /** @brief Set the log dynamic verbosity level */
    void setLogLevel(LogLevel level) {
        m_loglevel = level;
    }
    /** @brief Set the log dynamic verbosity level */
    void setloglevel(LogLevel level) {
        m_loglevel = level;
    }

    /** @brief Retrieve the current log level */
    int getloglevel() const {
        return m_loglevel;
    }
    const std::string& getlogfilename() const {
        return m_fn;
    }
    bool logisstderr() const {
        return m_tocerr;
    }

#if LOGGER_THREADSAFE
    std::recursive_mutex& getmutex() {
        return m_mutex;
    }
#endif

private:
    bool m_tocerr{false};
    int m_loglevel{LLERR};
    std::string m_fn;
    std::ofstream m_stream;
#if LOGGER_THREADSAFE
    std::recursive_mutex m_mutex;
#endif

    Logger(const std::string& fn);
    Logger(const Logger &);
    Logger& operator=(const Logger &);
};

#define LOGGER_PRT (Logger::getTheLog("")->getstream())

#if LOGGER_THREADSAFE
#define LOGGER_LOCK \
    std::unique_lock<std::recursive_mutex> lock(Logger::getTheLog("")->getmutex())
#else
#define LOGGER_LOCK
#endif

#ifndef LOGGER_LOCAL_LOGINC
#define LOGGER_LOCAL_LOGINC 0
#endif

#define LOGGER_LEVEL (Logger::getTheLog("")->getloglevel() +    \
                      LOGGER_LOCAL_LOGINC)

#define LOGGER_DOLOG(L,X) LOGGER_PRT << ":" << L << ":" <<            \
                                  __FILE__ << ":" << __LINE__ << "::" << X \
    << std::flush

#if LOGGER_STATICVERBOSITY >= 7
#define LOGDEB2(X) {                                                    \
        if (LOGGER_LEVEL >= Logger::LLDEB2) {                           \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLDEB2, X);                            \
        }                                                               \
    }
#else
#define LOGDEB2(X)
#endif

#if LOGGER_STATICVERBOSITY >= 6
#define LOGDEB1(X) {                                                    \
        if (LOGGER_LEVEL >= Logger::LLDEB1) {                           \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLDEB1, X);                            \
        }                                                               \
    }
#else
#define LOGDEB1(X)
#endif

#if LOGGER_STATICVERBOSITY >= 5
#define LOGDEB0(X) {                                                    \
        if (LOGGER_LEVEL >= Logger::LLDEB0) {                           \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLDEB0, X);                            \
        }                                                               \
    }
#else
#define LOGDEB0(X)
#endif

#if LOGGER_STATICVERBOSITY >= 4
#define LOGDEB(X) {                                                     \
        if (LOGGER_LEVEL >= Logger::LLDEB) {                            \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLDEB, X);                             \
        }                                                               \
    }
#else
#define LOGDEB(X)
#endif

#if LOGGER_STATICVERBOSITY >= 3
#define LOGINF(X) {                                                     \
        if (LOGGER_LEVEL >= Logger::LLINF) {                            \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLINF, X);                             \
        }                                                               \
    }
#else
#define LOGINF(X)
#endif
#define LOGINFO LOGINF

#define LOGERR(X) {                                                     \
        if (LOGGER_LEVEL >= Logger::LLERR) {                            \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLERR, X);                             \
        }                                                               \
    }

#define LOGFAT(X) {                                                     \
        if (LOGGER_LEVEL >= Logger::LLFAT) {                            \
            LOGGER_LOCK;                                                \
            LOGGER_DOLOG(Logger::LLFAT, X);                             \
        }                                                               \
    }
#define LOGFATAL LOGFAT

#define LOGSYSERR(who, what, arg) {                                     \
        LOGERR(who << ": " << what << "("  << arg << "): errno " << errno \
               << ": " << strerror(errno) << std::endl);                \
    }

#endif /* _LOG_H_X_INCLUDED_ */
