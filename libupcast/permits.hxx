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
#ifndef _PERMITS_H_X_INCLUDED_
#define _PERMITS_H_X_INCLUDED_

#include <chrono>
#include <mutex>
#include <condition_variable>

#include "libupcast/canceller.hxx"

namespace UpCast {

/** Counting semaphore. acquire() blocks while all permits are out. */
class PermitPool {
public:
    explicit PermitPool(int count)
        : m_total(count > 0 ? count : 1), m_avail(m_total) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_avail == 0) {
            m_cv.wait(lock);
        }
        m_avail--;
    }

    /** Wait for a permit, giving up when cancel is done.
     * @return true if a permit was obtained */
    bool acquire(const Canceller *cancel) {
        if (nullptr == cancel) {
            acquire();
            return true;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_avail == 0) {
            if (cancel->done()) {
                return false;
            }
            m_cv.wait_for(lock, std::chrono::milliseconds(50));
        }
        if (cancel->done()) {
            return false;
        }
        m_avail--;
        return true;
    }

    void release() {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_avail < m_total) {
            m_avail++;
        }
        m_cv.notify_one();
    }

    int total() const {
        return m_total;
    }

    int available() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_avail;
    }

    /** Scoped permit: acquired on construction, released on
     *  destruction. With a canceller, check ok() before using it. */
    class Permit {
    public:
        explicit Permit(PermitPool& pool, const Canceller *cancel = nullptr)
            : m_pool(pool) {
            m_ok = m_pool.acquire(cancel);
        }
        ~Permit() {
            if (m_ok)
                m_pool.release();
        }
        bool ok() const {
            return m_ok;
        }
    private:
        PermitPool& m_pool;
        bool m_ok;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
    };

private:
    const int m_total;
    int m_avail;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace UpCast

#endif /* _PERMITS_H_X_INCLUDED_ */
