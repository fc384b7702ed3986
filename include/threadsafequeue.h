/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef THREADSAFEQUEUE_H
#define THREADSAFEQUEUE_H

#include <queue>
#include <mutex>

// Work and message queue shared by the download worker threads.
// Workers only ever try_pop so a drained or cleared queue ends their loop.
template<typename T>
class ThreadSafeQueue
{
    public:
        void push(const T& item)
        {
            std::lock_guard<std::mutex> lock(m);
            q.push(item);
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(m);
            return q.empty();
        }

        typename std::queue<T>::size_type size() const
        {
            std::lock_guard<std::mutex> lock(m);
            return q.size();
        }

        bool try_pop(T& item)
        {
            std::lock_guard<std::mutex> lock(m);
            if (q.empty())
                return false;

            item = q.front();
            q.pop();
            return true;
        }

        // Drop all pending items, returns how many were dropped
        typename std::queue<T>::size_type clear()
        {
            std::lock_guard<std::mutex> lock(m);
            typename std::queue<T>::size_type dropped = q.size();
            std::queue<T>().swap(q);
            return dropped;
        }

        ThreadSafeQueue() = default;
        ThreadSafeQueue(const ThreadSafeQueue&) = delete;
        ThreadSafeQueue& operator= (const ThreadSafeQueue&) = delete;
    private:
        std::queue<T> q;
        mutable std::mutex m;
};

#endif // THREADSAFEQUEUE_H
