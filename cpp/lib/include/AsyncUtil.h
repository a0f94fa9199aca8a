/** \brief Tasklets and futures for running work on background threads.
 *  \author Madeeswaran Kannan
 *
 *  \copyright 2019-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <pthread.h>
#include "ThreadUtil.h"
#include "util.h"


namespace AsyncUtil {


template <typename Parameter, typename Result>
class Future;


// Base class of all asynchronous operations. Provides an interface to spin up
// a new thread of execution and run arbitrary code on it. Tasklets are self-contained
// in that they host their own copy of inputs and outputs and maintain their own state.
template <typename Parameter, typename Result>
class Tasklet {
    friend class Future<Parameter, Result>;

public:
    enum Status { NOT_STARTED, RUNNING, COMPLETED_SUCCESS, COMPLETED_ERROR };

private:
    // The thread routine that gets executed once the tasklet is started.
    // The single parameter points to the calling Tasklet instance. The user
    // of the Tasklet class must ensure that instance pointed to is valid
    // until the thread routine returns, which is guaranteed if the instance is only destroyed after await().
    static void *ThreadRoutine(void * const parameter);

    const std::string description_;
    ::pthread_t thread_id_;
    mutable std::mutex mutex_;
    mutable std::condition_variable status_changed_;
    Status status_;

    // Incremented by one for the duration of the task.
    ThreadUtil::ThreadSafeCounter<unsigned> * const running_instance_counter_;

    // Functor that executes the actual payload code.
    std::function<void(const Parameter &, Result * const)> runnable_;

    std::unique_ptr<const Parameter> parameter_;
    std::unique_ptr<Result> result_;

    void setStatus(const Status new_status);

public:
    Tasklet(ThreadUtil::ThreadSafeCounter<unsigned> * const running_instance_counter, const std::string &description,
            const std::function<void(const Parameter &, Result * const)> &runnable, std::unique_ptr<Result> default_result,
            std::unique_ptr<Parameter> parameter);
    Tasklet(const Tasklet &) = delete;
    Tasklet &operator=(const Tasklet &) = delete;

    // Blocks until a started tasklet has run to completion.
    virtual ~Tasklet();

    // Spins up a new thread and executes the payload.
    void start();

    inline const std::string &toString() const { return description_; }
    inline Status getStatus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }
    inline bool isComplete() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ == COMPLETED_SUCCESS or status_ == COMPLETED_ERROR;
    }
    inline const Parameter &getParameter() const { return *parameter_; }

    // Relinquishes ownership of the result to the caller. If the tasklet is complete, returns
    // immediately. Otherwise, blocks the calling thread until the tasklet has run to completion.
    // Returns nullptr if the payload failed or the result has already been yielded.
    std::unique_ptr<Result> getResult();

    // Blocks the calling thread until the task has run to completion.
    void await() const;
};


template <typename Parameter, typename Result>
void *Tasklet<Parameter, Result>::ThreadRoutine(void * const parameter) {
    Tasklet<Parameter, Result> * const tasklet(reinterpret_cast<Tasklet<Parameter, Result> *>(parameter));

    // Detach the thread so that its resources are automatically cleaned up.
    ::pthread_detach(::pthread_self());

    Status completion_status(COMPLETED_SUCCESS);
    try {
        tasklet->setStatus(RUNNING);
        tasklet->runnable_(*tasklet->parameter_, tasklet->result_.get());
    } catch (const std::exception &exception) {
        LOG_WARNING("exception in tasklet \"" + tasklet->description_ + "\": " + exception.what());
        completion_status = COMPLETED_ERROR;
    }

    --(*tasklet->running_instance_counter_);

    // Flagged at the very end of the routine as the tasklet may be destroyed as soon as waiters have been woken up.
    tasklet->setStatus(completion_status);

    return nullptr;
}


template <typename Parameter, typename Result>
void Tasklet<Parameter, Result>::setStatus(const Status new_status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = new_status;
    status_changed_.notify_all();
}


template <typename Parameter, typename Result>
Tasklet<Parameter, Result>::Tasklet(ThreadUtil::ThreadSafeCounter<unsigned> * const running_instance_counter,
                                    const std::string &description,
                                    const std::function<void(const Parameter &, Result * const)> &runnable,
                                    std::unique_ptr<Result> default_result, std::unique_ptr<Parameter> parameter)
    : description_(description), status_(NOT_STARTED), running_instance_counter_(running_instance_counter), runnable_(runnable),
      parameter_(std::move(parameter)), result_(std::move(default_result)) { }


template <typename Parameter, typename Result>
Tasklet<Parameter, Result>::~Tasklet() {
    if (getStatus() != NOT_STARTED and not isComplete()) {
        LOG_DEBUG("tasklet \"" + description_ + "\" is still running, waiting for it to finish");
        await();
    }
}


template <typename Parameter, typename Result>
void Tasklet<Parameter, Result>::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (status_ != NOT_STARTED)
        LOG_ERROR("tasklet \"" + description_ + "\" has already been started! (status = " + std::to_string(status_) + ")");

    // Counted before the thread exists so that waiters on the counter can't miss this tasklet.
    ++(*running_instance_counter_);
    status_ = RUNNING;
    if (::pthread_create(&thread_id_, nullptr, ThreadRoutine, this) != 0) {
        --(*running_instance_counter_);
        status_ = COMPLETED_ERROR;
        LOG_ERROR("tasklet thread creation failed! (tasklet description: " + description_ + ")");
    }
}


template <typename Parameter, typename Result>
std::unique_ptr<Result> Tasklet<Parameter, Result>::getResult() {
    await();

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != COMPLETED_SUCCESS)
        return nullptr;

    return std::move(result_);
}


template <typename Parameter, typename Result>
void Tasklet<Parameter, Result>::await() const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (status_ == NOT_STARTED)
        LOG_ERROR("can't await tasklet \"" + description_ + "\" which has never been started!");

    status_changed_.wait(lock, [this] {
        return status_ == COMPLETED_SUCCESS or status_ == COMPLETED_ERROR;
    });
}


// Wrapper around a Tasklet that can be passed around in place of its result. Once the
// tasklet has run to completion, the Future can be used to retrieve its result.
template <typename Parameter, typename Result>
class Future {
    std::shared_ptr<Tasklet<Parameter, Result>> source_tasklet_;
    std::unique_ptr<Result> result_;
    bool result_fetched_;

public:
    explicit Future(const std::shared_ptr<Tasklet<Parameter, Result>> &source_tasklet)
        : source_tasklet_(source_tasklet), result_fetched_(false) { }
    Future(const Future<Parameter, Result> &rhs) = delete;

    inline bool isComplete() const { return result_fetched_ or source_tasklet_->isComplete(); }

    // Blocks the calling thread until the task has run to completion.
    inline void await() const { source_tasklet_->await(); }

    // Returns false if the tasklet encountered an error, true otherwise. Blocks if the task is still running.
    bool hasResult();

    // Returns the result of the tasklet. Will block if the task is still running.
    // \throws std::runtime_error if the tasklet failed.
    Result &getResult();

    inline const Parameter &getParameter() const { return source_tasklet_->getParameter(); }
    inline const std::string &toString() const { return source_tasklet_->toString(); }
};


template <typename Parameter, typename Result>
bool Future<Parameter, Result>::hasResult() {
    if (not result_fetched_) {
        result_ = source_tasklet_->getResult();
        result_fetched_ = true;
    }

    return result_ != nullptr;
}


template <typename Parameter, typename Result>
Result &Future<Parameter, Result>::getResult() {
    if (not hasResult())
        throw std::runtime_error("in AsyncUtil::Future::getResult: tasklet \"" + source_tasklet_->toString() + "\" has no result!");

    return *result_;
}


} // namespace AsyncUtil
