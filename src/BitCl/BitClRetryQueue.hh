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

#ifndef __BIT_CL_RETRY_QUEUE_HH__
#define __BIT_CL_RETRY_QUEUE_HH__

#include <deque>
#include <set>
#include <string>
#include <mutex>
#include <condition_variable>
#include <cstdint>

#include "BitCl/BitClJob.hh"
#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Jobs that failed and wait to be resubmitted, in failure order. A file
  //! id is queued at most once. Draining the queue is up to the caller.
  //----------------------------------------------------------------------------
  class RetryQueue
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param capacity max number of queued jobs, the RetryQueueSize setting
      //!                 if 0, unbounded if that is 0 too
      //------------------------------------------------------------------------
      RetryQueue( size_t capacity = 0 );

      virtual ~RetryQueue() {}

      //------------------------------------------------------------------------
      //! Queue a job, wait for space if the queue is full
      //!
      //! @return errDuplicateJob (fatal) if the file id is already queued
      //------------------------------------------------------------------------
      virtual Status Put( const JobPtr &job );

      //------------------------------------------------------------------------
      //! Queue a job if there is space for it
      //!
      //! @return errRetryQueueFull if the queue is full, errDuplicateJob
      //!         (fatal) if the file id is already queued
      //------------------------------------------------------------------------
      virtual Status Offer( const JobPtr &job );

      //------------------------------------------------------------------------
      //! Take the oldest job
      //!
      //! @param job       the job, set only if true is returned
      //! @param timeoutMs how long to wait for a job, 0 to wait forever
      //! @return          false if no job became available in time
      //------------------------------------------------------------------------
      bool Get( JobPtr &job, uint32_t timeoutMs = 0 );

      //------------------------------------------------------------------------
      //! Take the oldest job if there is one
      //------------------------------------------------------------------------
      bool TryGet( JobPtr &job );

      //------------------------------------------------------------------------
      //! Check whether a job for the file id is queued
      //------------------------------------------------------------------------
      bool Contains( const std::string &fileID ) const;

      size_t Size() const;

      size_t GetCapacity() const
      {
        return pCapacity;
      }

      //------------------------------------------------------------------------
      //! Drop all the queued jobs
      //------------------------------------------------------------------------
      void Clear();

    private:
      RetryQueue( const RetryQueue &other );
      RetryQueue &operator = ( const RetryQueue &other );

      bool Full() const
      {
        return pCapacity && pJobs.size() >= pCapacity;
      }

      Status Enqueue( const JobPtr &job );
      void   Dequeue( JobPtr &job );

      std::deque<JobPtr>       pJobs;
      std::set<std::string>    pQueuedIDs;
      size_t                   pCapacity;
      mutable std::mutex       pMutex;
      std::condition_variable  pNotEmpty;
      std::condition_variable  pNotFull;
  };
}

#endif // __BIT_CL_RETRY_QUEUE_HH__
