/*
 *    Copyright (c) 2026, The OpenThread Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file
 *   This file includes the template for a bounded, closable concurrent queue.
 */

#ifndef ZC_UTILS_CONCURRENT_QUEUE_HPP_
#define ZC_UTILS_CONCURRENT_QUEUE_HPP_

#include <stddef.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>

namespace zc {
namespace Utils {

/**
 * This class implements a multi-producer multi-consumer queue.
 *
 * A queue constructed with a non-zero capacity blocks producers while it is full. Once closed, pushes are
 * rejected and consumers drain the remaining items before `Pop` reports the end of the queue.
 */
template <typename T> class ConcurrentQueue
{
public:
    /**
     * Constructor.
     *
     * @param[in] aCapacity  The maximum number of queued items, zero for an unbounded queue.
     */
    explicit ConcurrentQueue(size_t aCapacity = 0)
        : mCapacity(aCapacity)
        , mClosed(false)
    {
    }

    /**
     * This method pushes an item into the queue, blocking while the queue is full.
     *
     * @param[in] aItem  The item to be pushed
     *
     * @retval true   The item was queued.
     * @retval false  The queue is closed, the item was dropped.
     */
    template <typename R> bool Push(R &&aItem)
    {
        std::unique_lock<std::mutex> lck(mMutex);

        mItemPoppedEvent.wait(lck, [this]() { return mClosed || mCapacity == 0 || mQueue.size() < mCapacity; });

        if (mClosed)
        {
            return false;
        }

        mQueue.push(std::forward<R>(aItem));
        mItemPushedEvent.notify_one();
        return true;
    }

    /**
     * This method pops an item from the queue, blocking until one item is pushed or the queue is closed.
     *
     * @param[out] aItem  The item at the front.
     *
     * @retval true   @p aItem holds the popped item.
     * @retval false  The queue is closed and drained.
     */
    bool Pop(T &aItem)
    {
        std::unique_lock<std::mutex> lck(mMutex);

        mItemPushedEvent.wait(lck, [this]() { return mClosed || !mQueue.empty(); });

        return PopLocked(aItem);
    }

    /**
     * This method pops an item from the queue, blocking for at most @p aTimeout.
     *
     * @retval true   @p aItem holds the popped item.
     * @retval false  The timeout expired, or the queue is closed and drained.
     */
    template <typename Rep, typename Period> bool PopFor(T &aItem, const std::chrono::duration<Rep, Period> &aTimeout)
    {
        std::unique_lock<std::mutex> lck(mMutex);

        mItemPushedEvent.wait_for(lck, aTimeout, [this]() { return mClosed || !mQueue.empty(); });

        return PopLocked(aItem);
    }

    /**
     * This method pops an item if one is immediately available.
     */
    bool TryPop(T &aItem)
    {
        std::lock_guard<std::mutex> l(mMutex);

        return PopLocked(aItem);
    }

    /**
     * This method closes the queue, waking every blocked producer and consumer.
     *
     * Items already queued can still be popped.
     */
    void Close(void)
    {
        std::lock_guard<std::mutex> l(mMutex);

        mClosed = true;
        mItemPushedEvent.notify_all();
        mItemPoppedEvent.notify_all();
    }

    bool IsClosed(void)
    {
        std::lock_guard<std::mutex> l(mMutex);
        return mClosed;
    }

    /**
     * This method returns whether the queue is empty
     *
     * @returns Whether the queue is emtpy. Only when you are the only consumer
     *          it is ensured that a call to Pop() won't block if Empty() returns
     *          false.
     */
    bool Empty(void)
    {
        std::lock_guard<std::mutex> l(mMutex);
        return mQueue.empty();
    }

    size_t Size(void)
    {
        std::lock_guard<std::mutex> l(mMutex);
        return mQueue.size();
    }

private:
    bool PopLocked(T &aItem)
    {
        if (mQueue.empty())
        {
            return false;
        }

        aItem = std::move(mQueue.front());
        mQueue.pop();
        mItemPoppedEvent.notify_one();
        return true;
    }

    const size_t            mCapacity;
    bool                    mClosed;
    std::mutex              mMutex;
    std::condition_variable mItemPushedEvent;
    std::condition_variable mItemPoppedEvent;
    std::queue<T>           mQueue;
};

using TaskQueue = ConcurrentQueue<std::function<void(void)>>;

} // namespace Utils
} // namespace zc

#endif // ZC_UTILS_CONCURRENT_QUEUE_HPP_
