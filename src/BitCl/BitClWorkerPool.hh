//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
//------------------------------------------------------------------------------
// This file is part of the BitCl software suite.
//
// BitCl is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// BitCl is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with BitCl.  If not, see <http://www.gnu.org/licenses/>.
//------------------------------------------------------------------------------

#ifndef __BIT_CL_WORKER_POOL_HH__
#define __BIT_CL_WORKER_POOL_HH__

#include <vector>
#include <thread>
#include <mutex>
#include <memory>
#include <cstdint>

#include "BitCl/BitClSyncQueue.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Interface for a task to be run by the worker pool
  //----------------------------------------------------------------------------
  class WorkerTask
  {
    public:
      virtual ~WorkerTask() {}

      //------------------------------------------------------------------------
      //! The actual work, must not throw
      //------------------------------------------------------------------------
      virtual void Run() = 0;
  };

  typedef std::shared_ptr<WorkerTask> WorkerTaskPtr;

  //----------------------------------------------------------------------------
  //! Fixed number of worker threads running tasks in the order they were
  //! queued
  //----------------------------------------------------------------------------
  class WorkerPool
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param workers number of threads, the WorkerThreads setting if 0
      //------------------------------------------------------------------------
      WorkerPool( uint32_t workers = 0 );

      //------------------------------------------------------------------------
      //! Destructor, stops the workers if still running
      //------------------------------------------------------------------------
      ~WorkerPool();

      //------------------------------------------------------------------------
      //! Start the workers, a stopped pool cannot be started again
      //------------------------------------------------------------------------
      bool Start();

      //------------------------------------------------------------------------
      //! Stop the workers, the tasks already queued are run first
      //------------------------------------------------------------------------
      bool Stop();

      //------------------------------------------------------------------------
      //! Add a task to be run
      //!
      //! @return false if the pool is not accepting tasks anymore
      //------------------------------------------------------------------------
      bool QueueTask( const WorkerTaskPtr &task );

      uint32_t GetNumWorkers() const
      {
        return pNumWorkers;
      }

      bool IsRunning() const
      {
        std::unique_lock<std::mutex> lck( pMutex );
        return pRunning;
      }

      //------------------------------------------------------------------------
      //! Worker loop, run by every worker thread
      //------------------------------------------------------------------------
      void RunTasks();

    private:
      WorkerPool( const WorkerPool &other );
      WorkerPool &operator = ( const WorkerPool &other );

      void StopWorkers();

      uint32_t                  pNumWorkers;
      std::vector<std::thread>  pWorkers;
      SyncQueue<WorkerTaskPtr>  pTasks;
      mutable std::mutex        pMutex;
      bool                      pRunning;
      bool                      pStopped;
  };
}

#endif // __BIT_CL_WORKER_POOL_HH__
