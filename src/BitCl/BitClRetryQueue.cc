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

#include "BitCl/BitClRetryQueue.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

#include <chrono>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  RetryQueue::RetryQueue( size_t capacity ):
    pCapacity( capacity )
  {
    if( pCapacity == 0 )
    {
      int size = DefaultRetryQueueSize;
      DefaultEnv::GetEnv()->GetInt( "RetryQueueSize", size );
      pCapacity = size > 0 ? size : 0;
    }
  }

  //----------------------------------------------------------------------------
  // Queue a job, wait for space
  //----------------------------------------------------------------------------
  Status RetryQueue::Put( const JobPtr &job )
  {
    if( !job )
      return Status( stError, errInvalidArgs, 0, "null job" );

    std::unique_lock<std::mutex> lck( pMutex );
    while( Full() && !pQueuedIDs.count( job->GetFileID() ) )
      pNotFull.wait( lck );
    return Enqueue( job );
  }

  //----------------------------------------------------------------------------
  // Queue a job if there is space
  //----------------------------------------------------------------------------
  Status RetryQueue::Offer( const JobPtr &job )
  {
    if( !job )
      return Status( stError, errInvalidArgs, 0, "null job" );

    std::unique_lock<std::mutex> lck( pMutex );
    if( Full() && !pQueuedIDs.count( job->GetFileID() ) )
    {
      Log *log = DefaultEnv::GetLog();
      log->Warning( TransferMsg, "Retry queue full (%d jobs), cannot queue "
                    "%s", (int)pJobs.size(), job->GetFileID().c_str() );
      return Status( stError, errRetryQueueFull, 0, job->GetFileID() );
    }
    return Enqueue( job );
  }

  //----------------------------------------------------------------------------
  // Take the oldest job
  //----------------------------------------------------------------------------
  bool RetryQueue::Get( JobPtr &job, uint32_t timeoutMs )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    if( timeoutMs == 0 )
    {
      while( pJobs.empty() )
        pNotEmpty.wait( lck );
    }
    else
    {
      std::chrono::milliseconds timeout( timeoutMs );
      if( !pNotEmpty.wait_for( lck, timeout,
                               [this]{ return !pJobs.empty(); } ) )
        return false;
    }
    Dequeue( job );
    return true;
  }

  //----------------------------------------------------------------------------
  // Take the oldest job without waiting
  //----------------------------------------------------------------------------
  bool RetryQueue::TryGet( JobPtr &job )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    if( pJobs.empty() )
      return false;
    Dequeue( job );
    return true;
  }

  //----------------------------------------------------------------------------
  // Check for a queued file id
  //----------------------------------------------------------------------------
  bool RetryQueue::Contains( const std::string &fileID ) const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pQueuedIDs.count( fileID ) != 0;
  }

  //----------------------------------------------------------------------------
  // Number of queued jobs
  //----------------------------------------------------------------------------
  size_t RetryQueue::Size() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pJobs.size();
  }

  //----------------------------------------------------------------------------
  // Drop everything
  //----------------------------------------------------------------------------
  void RetryQueue::Clear()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    pJobs.clear();
    pQueuedIDs.clear();
    pNotFull.notify_all();
  }

  //----------------------------------------------------------------------------
  // Append a job, the mutex needs to be locked
  //----------------------------------------------------------------------------
  Status RetryQueue::Enqueue( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    if( !pQueuedIDs.insert( job->GetFileID() ).second )
    {
      log->Error( TransferMsg, "%s is already waiting to be retried",
                  job->GetFileID().c_str() );
      return Status( stFatal, errDuplicateJob, 0, job->GetFileID() );
    }

    pJobs.push_back( job );
    pNotEmpty.notify_one();
    log->Debug( TransferMsg, "Queued %s for retry, %d job(s) waiting",
                job->GetFileID().c_str(), (int)pJobs.size() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Pop the oldest job, the mutex needs to be locked
  //----------------------------------------------------------------------------
  void RetryQueue::Dequeue( JobPtr &job )
  {
    job = pJobs.front();
    pJobs.pop_front();
    pQueuedIDs.erase( job->GetFileID() );
    pNotFull.notify_one();
  }
}
