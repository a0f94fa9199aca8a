/** \file    ThreadUtil.h
 *  \brief   Declaration of thread-related utility classes.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef THREAD_UTIL_H
#define THREAD_UTIL_H


#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include "util.h"


namespace ThreadUtil {


/** \class  ThreadSafeCounter
 *  \brief  Implements a numeric counter that can safely be shared between threads.
 *  \note   Typical usage would be to create an instance of this class in some "main" thread and pass pointers into
 *          worker threads that call the increment and decrement operators as needed.  Other threads may block in
 *          waitForZero() until all workers have decremented the counter again.
 */
template <typename NumericType> class ThreadSafeCounter {
    mutable std::mutex mutex_;
    std::condition_variable zero_reached_;
    NumericType counter_;

public:
    explicit ThreadSafeCounter(const NumericType initial_value = 0): counter_(initial_value) { }
    operator NumericType() const;
    NumericType operator++();
    NumericType operator--();
    NumericType operator++(int);

    // Blocks the calling thread until the counter has dropped to zero.
    void waitForZero();

private:
    void screwPointers() { counter_ /= 1; } // Prevent this template class from being instantiated w/ a pointer type!
};


template <typename NumericType> ThreadSafeCounter<NumericType>::operator NumericType() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    return counter_;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator++() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    ++counter_;

    return counter_;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator++(int) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const NumericType previous_value(counter_);
    ++counter_;

    return previous_value;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator--() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (unlikely(counter_ == 0))
        throw std::runtime_error("in ThreadSafeCounter::operator--: trying to decrement a zero counter!");
    --counter_;
    if (counter_ == 0)
        zero_reached_.notify_all();

    return counter_;
}


template <typename NumericType> void ThreadSafeCounter<NumericType>::waitForZero() {
    std::unique_lock<std::mutex> mutex_locker(mutex_);
    zero_reached_.wait(mutex_locker, [this] { return counter_ == 0; });
}


} // namespace ThreadUtil


#endif // ifndef THREAD_UTIL_H
