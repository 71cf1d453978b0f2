/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef ENERTRADE_TASKQUEUE_HPP
#define ENERTRADE_TASKQUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace enertrade
{

/**
 * A pool of worker threads running tasks, optionally after a delay.  This is
 * used to process protocol messages after they have been acknowledged.
 *
 * Exceptions thrown by a task are logged and do not affect other tasks.
 * Tasks still pending on destruction are dropped.
 */
class TaskQueue
{

public:

  using Task = std::function<void ()>;

private:

  using Clock = std::chrono::steady_clock;

  struct Entry
  {

    Clock::time_point due;

    /** Insertion counter, so that tasks due at the same time run FIFO.  */
    uint64_t seq;

    Task task;

    /** Ordering for the priority queue (earliest due first).  */
    bool
    operator< (const Entry& o) const
    {
      if (due != o.due)
        return due > o.due;
      return seq > o.seq;
    }

  };

  /** Tasks not yet started.  */
  std::priority_queue<Entry> pending;

  /** Number of tasks currently running.  */
  unsigned running = 0;

  /** Counter for Entry::seq.  */
  uint64_t nextSeq = 0;

  /** Set to true to signal that the workers should stop.  */
  bool stop = false;

  /** Mutex for this instance and its condition variables.  */
  std::mutex mut;

  /** Signals workers about new tasks and stopping.  */
  std::condition_variable cvTasks;

  /** Signalled when a task finishes, for WaitIdle.  */
  std::condition_variable cvIdle;

  std::vector<std::thread> workers;

  /**
   * Main loop of the worker threads.
   */
  void RunWorker ();

public:

  /**
   * Starts the given number of worker threads (at least one).
   */
  explicit TaskQueue (unsigned threads);

  /**
   * Starts the number of workers set by --worker_threads.
   */
  TaskQueue ();

  /**
   * Stops and joins all workers.  Tasks being run are finished first.
   */
  ~TaskQueue ();

  TaskQueue (const TaskQueue&) = delete;
  void operator= (const TaskQueue&) = delete;

  /**
   * Schedules a task to run as soon as possible.
   */
  void
  Schedule (const Task& t)
  {
    ScheduleAfter (std::chrono::milliseconds (0), t);
  }

  /**
   * Schedules a task to run after the given delay.
   */
  void ScheduleAfter (std::chrono::milliseconds delay, const Task& t);

  /**
   * Blocks until no tasks are pending or running.
   */
  void WaitIdle ();

  /**
   * Returns the number of tasks pending or running.
   */
  size_t PendingCount ();

};

} // namespace enertrade

#endif // ENERTRADE_TASKQUEUE_HPP
