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

#include "private/taskqueue.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <exception>

DEFINE_int32 (worker_threads, 4,
              "number of threads processing protocol messages");

namespace enertrade
{

TaskQueue::TaskQueue (const unsigned threads)
{
  const unsigned n = threads > 0 ? threads : 1;
  LOG (INFO) << "Starting " << n << " worker threads";

  for (unsigned i = 0; i < n; ++i)
    workers.emplace_back ([this] ()
      {
        RunWorker ();
      });
}

TaskQueue::TaskQueue ()
  : TaskQueue(FLAGS_worker_threads > 0
                ? static_cast<unsigned> (FLAGS_worker_threads) : 1)
{}

TaskQueue::~TaskQueue ()
{
  {
    std::lock_guard<std::mutex> lock(mut);
    stop = true;
    LOG_IF (WARNING, !pending.empty ())
        << "Dropping " << pending.size () << " pending tasks";
    cvTasks.notify_all ();
  }

  for (auto& w : workers)
    w.join ();
}

void
TaskQueue::RunWorker ()
{
  std::unique_lock<std::mutex> lock(mut);
  while (!stop)
    {
      if (pending.empty ())
        {
          cvTasks.wait (lock);
          continue;
        }

      const auto due = pending.top ().due;
      if (due > Clock::now ())
        {
          cvTasks.wait_until (lock, due);
          continue;
        }

      Task task = pending.top ().task;
      pending.pop ();
      ++running;

      lock.unlock ();
      try
        {
          task ();
        }
      catch (const std::exception& exc)
        {
          LOG (ERROR) << "Task failed with exception: " << exc.what ();
        }
      lock.lock ();

      --running;
      cvIdle.notify_all ();
    }
}

void
TaskQueue::ScheduleAfter (const std::chrono::milliseconds delay,
                          const Task& t)
{
  std::lock_guard<std::mutex> lock(mut);

  Entry e;
  e.due = Clock::now () + delay;
  e.seq = nextSeq++;
  e.task = t;
  pending.push (std::move (e));

  cvTasks.notify_all ();
}

void
TaskQueue::WaitIdle ()
{
  std::unique_lock<std::mutex> lock(mut);
  cvIdle.wait (lock, [this] ()
    {
      return pending.empty () && running == 0;
    });
}

size_t
TaskQueue::PendingCount ()
{
  std::lock_guard<std::mutex> lock(mut);
  return pending.size () + running;
}

} // namespace enertrade
