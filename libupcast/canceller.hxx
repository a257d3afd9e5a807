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
#ifndef _CANCELLER_H_X_INCLUDED_
#define _CANCELLER_H_X_INCLUDED_

#include <chrono>
#include <mutex>
#include <condition_variable>

namespace UpCast {

/**
 * Cancellation token with an optional deadline and an optional parent.
 *
 * A Canceller is "done" when cancel() was called on it or on any of its
 * ancestors, or when its own (or an ancestor's) deadline is past. Waiting
 * operations poll the ancestors in short slices, so cancelling a parent
 * is seen by children within a few tens of milliseconds.
 *
 * The parent must outlive its children.
 */
class Canceller {
public:
    /** @param parent the enclosing operation's token, or nullptr.
     *  @param timeoutms deadline in mS from now, or -1 for none. */
    explicit Canceller(const Canceller *parent = nullptr, int timeoutms = -1);

    /** Request cancellation. Wakes up any thread sleeping on us. */
    void cancel();

    /** True if explicitly cancelled (here or above) */
    bool cancelled() const;

    /** True if the deadline (here or above) is past */
    bool expired() const;

    /** cancelled() || expired() */
    bool done() const {
        return cancelled() || expired();
    }

    /** UPC_OK, UPC_E_CANCELLED or UPC_E_TIMEOUT */
    int status() const;

    /** Milliseconds until the nearest deadline, -1 if there is none. 0 if
     *  the deadline is past. */
    int remainingms() const;

    /** Sleep for ms milliseconds or until done().
     * @return true if the full delay elapsed, false if interrupted. */
    bool sleepms(int ms) const;

    /** Sleep until done(). */
    void wait() const;

private:
    typedef std::chrono::steady_clock Clock;
    const Canceller *m_parent;
    bool m_hasdeadline;
    Clock::time_point m_deadline;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_cancelled{false};

    Canceller(const Canceller&) = delete;
    Canceller& operator=(const Canceller&) = delete;
};

} // namespace UpCast

#endif /* _CANCELLER_H_X_INCLUDED_ */
