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
#include "libupcast/canceller.hxx"
#include "libupcast/upcastlib.hxx"

using namespace std;

namespace UpCast {

// Max time slice for waits: this is how fast we notice a parent's cancel.
static const int pollms = 50;

Canceller::Canceller(const Canceller *parent, int timeoutms)
    : m_parent(parent), m_hasdeadline(timeoutms >= 0)
{
    if (m_hasdeadline) {
        m_deadline = Clock::now() + chrono::milliseconds(timeoutms);
    }
}

void Canceller::cancel()
{
    unique_lock<mutex> lock(m_mutex);
    m_cancelled = true;
    m_cv.notify_all();
}

bool Canceller::cancelled() const
{
    {
        unique_lock<mutex> lock(m_mutex);
        if (m_cancelled) {
            return true;
        }
    }
    return m_parent ? m_parent->cancelled() : false;
}

bool Canceller::expired() const
{
    if (m_hasdeadline && Clock::now() >= m_deadline) {
        return true;
    }
    return m_parent ? m_parent->expired() : false;
}

int Canceller::status() const
{
    if (cancelled()) {
        return UPC_E_CANCELLED;
    }
    if (expired()) {
        return UPC_E_TIMEOUT;
    }
    return UPC_OK;
}

int Canceller::remainingms() const
{
    int mine = -1;
    if (m_hasdeadline) {
        auto left = chrono::duration_cast<chrono::milliseconds>(
            m_deadline - Clock::now()).count();
        mine = left > 0 ? int(left) : 0;
    }
    int theirs = m_parent ? m_parent->remainingms() : -1;
    if (mine < 0) {
        return theirs;
    }
    if (theirs < 0) {
        return mine;
    }
    return mine < theirs ? mine : theirs;
}

bool Canceller::sleepms(int ms) const
{
    Clock::time_point end = Clock::now() + chrono::milliseconds(ms);
    for (;;) {
        if (done()) {
            return false;
        }
        Clock::time_point now = Clock::now();
        if (now >= end) {
            return true;
        }
        auto slice = chrono::duration_cast<chrono::milliseconds>(end - now);
        if (slice.count() > pollms) {
            slice = chrono::milliseconds(pollms);
        }
        unique_lock<mutex> lock(m_mutex);
        if (m_cancelled) {
            return false;
        }
        m_cv.wait_for(lock, slice);
    }
}

void Canceller::wait() const
{
    while (!done()) {
        unique_lock<mutex> lock(m_mutex);
        if (m_cancelled) {
            return;
        }
        m_cv.wait_for(lock, chrono::milliseconds(pollms));
    }
}

} // namespace UpCast
