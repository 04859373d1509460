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

#ifndef __BIT_CL_SYNC_QUEUE_HH__
#define __BIT_CL_SYNC_QUEUE_HH__

#include <deque>
#include <mutex>
#include <condition_variable>

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! A synchronized FIFO queue, optionally bounded. Getters block until an
  //! item is available or the queue is shut down.
  //----------------------------------------------------------------------------
  template <typename Item>
  class SyncQueue
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param capacity max number of queued items, 0 means unbounded
      //------------------------------------------------------------------------
      SyncQueue( size_t capacity = 0 ):
        pCapacity( capacity ), pShutdown( false ) {}

      //------------------------------------------------------------------------
      //! Put the item in the queue, wait for space if the queue is full
      //!
      //! @return false if the queue was shut down
      //------------------------------------------------------------------------
      bool Put( const Item &item )
      {
        std::unique_lock<std::mutex> lck( pMutex );
        while( !pShutdown && Full() )
          pNotFull.wait( lck );
        if( pShutdown )
          return false;
        pQueue.push_back( item );
        pNotEmpty.notify_one();
        return true;
      }

      //------------------------------------------------------------------------
      //! Put the item in the queue if there is space for it
      //------------------------------------------------------------------------
      bool Offer( const Item &item )
      {
        std::unique_lock<std::mutex> lck( pMutex );
        if( pShutdown || Full() )
          return false;
        pQueue.push_back( item );
        pNotEmpty.notify_one();
        return true;
      }

      //------------------------------------------------------------------------
      //! Get the oldest item, wait until one is available
      //!
      //! @return false if the queue was shut down and drained
      //------------------------------------------------------------------------
      bool Get( Item &item )
      {
        std::unique_lock<std::mutex> lck( pMutex );
        while( !pShutdown && pQueue.empty() )
          pNotEmpty.wait( lck );
        if( pQueue.empty() )
          return false;
        item = pQueue.front();
        pQueue.pop_front();
        pNotFull.notify_one();
        return true;
      }

      //------------------------------------------------------------------------
      //! Get the oldest item if there is one, don't wait
      //------------------------------------------------------------------------
      bool TryGet( Item &item )
      {
        std::unique_lock<std::mutex> lck( pMutex );
        if( pQueue.empty() )
          return false;
        item = pQueue.front();
        pQueue.pop_front();
        pNotFull.notify_one();
        return true;
      }

      //------------------------------------------------------------------------
      //! Refuse new items and wake up everybody waiting, the items already
      //! queued can still be taken
      //------------------------------------------------------------------------
      void Shutdown()
      {
        std::unique_lock<std::mutex> lck( pMutex );
        pShutdown = true;
        pNotEmpty.notify_all();
        pNotFull.notify_all();
      }

      size_t Size() const
      {
        std::unique_lock<std::mutex> lck( pMutex );
        return pQueue.size();
      }

      void Clear()
      {
        std::unique_lock<std::mutex> lck( pMutex );
        pQueue.clear();
        pNotFull.notify_all();
      }

    private:
      bool Full() const
      {
        return pCapacity && pQueue.size() >= pCapacity;
      }

      std::deque<Item>         pQueue;
      size_t                   pCapacity;
      bool                     pShutdown;
      mutable std::mutex       pMutex;
      std::condition_variable  pNotEmpty;
      std::condition_variable  pNotFull;
  };
}

#endif // __BIT_CL_SYNC_QUEUE_HH__
