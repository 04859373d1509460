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

#include "BitCl/BitClWorkerPool.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"
#include "BitCl/BitClEnv.hh"

#include <system_error>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  WorkerPool::WorkerPool( uint32_t workers ):
    pNumWorkers( workers ),
    pRunning( false ),
    pStopped( false )
  {
    if( pNumWorkers == 0 )
    {
      int numWorkers = DefaultWorkerThreads;
      DefaultEnv::GetEnv()->GetInt( "WorkerThreads", numWorkers );
      pNumWorkers = numWorkers > 0 ? numWorkers : 1;
    }
  }

  //----------------------------------------------------------------------------
  // Destructor
  //----------------------------------------------------------------------------
  WorkerPool::~WorkerPool()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    if( pRunning )
    {
      StopWorkers();
      pRunning = false;
    }
  }

  //----------------------------------------------------------------------------
  // Start the workers
  //----------------------------------------------------------------------------
  bool WorkerPool::Start()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    Log *log = DefaultEnv::GetLog();
    log->Debug( WorkerPoolMsg, "Starting the worker pool..." );

    if( pRunning || pStopped )
    {
      log->Error( WorkerPoolMsg, "The worker pool is %s",
                  pRunning ? "already running" : "stopped" );
      return false;
    }

    for( uint32_t i = 0; i < pNumWorkers; ++i )
    {
      try
      {
        pWorkers.push_back( std::thread( &WorkerPool::RunTasks, this ) );
      }
      catch( const std::system_error &ex )
      {
        log->Error( WorkerPoolMsg, "Unable to spawn a worker thread: %s",
                    ex.what() );
        StopWorkers();
        return false;
      }
    }
    pRunning = true;
    log->Debug( WorkerPoolMsg, "Worker pool started, %d workers",
                (int)pWorkers.size() );
    return true;
  }

  //----------------------------------------------------------------------------
  // Stop the workers
  //----------------------------------------------------------------------------
  bool WorkerPool::Stop()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    Log *log = DefaultEnv::GetLog();
    log->Debug( WorkerPoolMsg, "Stopping the worker pool..." );
    if( !pRunning )
    {
      log->Error( WorkerPoolMsg, "The worker pool is not running" );
      return false;
    }

    StopWorkers();
    pRunning = false;
    log->Debug( WorkerPoolMsg, "Worker pool stopped" );
    return true;
  }

  //----------------------------------------------------------------------------
  // Queue a task
  //----------------------------------------------------------------------------
  bool WorkerPool::QueueTask( const WorkerTaskPtr &task )
  {
    if( !pTasks.Put( task ) )
    {
      Log *log = DefaultEnv::GetLog();
      log->Error( WorkerPoolMsg, "The worker pool has been stopped, refusing "
                  "the task" );
      return false;
    }
    return true;
  }

  //----------------------------------------------------------------------------
  // Shut the queue down and join everybody, the mutex needs to be locked
  //----------------------------------------------------------------------------
  void WorkerPool::StopWorkers()
  {
    Log *log = DefaultEnv::GetLog();
    pTasks.Shutdown();
    pStopped = true;
    for( size_t i = 0; i < pWorkers.size(); ++i )
    {
      log->Dump( WorkerPoolMsg, "Stopping worker #%d...", (int)i );
      pWorkers[i].join();
      log->Dump( WorkerPoolMsg, "Worker #%d stopped", (int)i );
    }
    pWorkers.clear();
  }

  //----------------------------------------------------------------------------
  // Run the tasks until the queue is shut down and empty
  //----------------------------------------------------------------------------
  void WorkerPool::RunTasks()
  {
    WorkerTaskPtr task;
    while( pTasks.Get( task ) )
    {
      task->Run();
      task.reset();
    }
  }
}
