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

#ifndef __BIT_CL_SEQUENCED_EVENT_DISPATCHER_HH__
#define __BIT_CL_SEQUENCED_EVENT_DISPATCHER_HH__

#include <map>
#include <deque>
#include <string>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <cstdint>

#include "BitCl/BitClOperationEvent.hh"
#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  class WorkerPool;

  //----------------------------------------------------------------------------
  //! Moves event handling off the delivering thread onto a worker pool.
  //! Events for the same file id are handled one at a time in the order
  //! they arrived, events for different file ids run in parallel.
  //!
  //! If the wrapped handler throws, the error is kept, the events still
  //! waiting are dropped, and any further event is refused by throwing
  //! EventException with the same error.
  //----------------------------------------------------------------------------
  class SequencedEventDispatcher: public EventHandler
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param handler the handler doing the work, must outlive this
      //! @param pool    a started pool, must outlive this
      //------------------------------------------------------------------------
      SequencedEventDispatcher( EventHandler &handler, WorkerPool &pool );

      //------------------------------------------------------------------------
      //! Destructor, waits for the queued events
      //------------------------------------------------------------------------
      virtual ~SequencedEventDispatcher();

      //------------------------------------------------------------------------
      //! Queue the event for handling
      //!
      //! @throws EventException if a previous event failed or the pool does
      //!         not accept work
      //------------------------------------------------------------------------
      virtual void HandleEvent( const OperationEvent &event );

      //------------------------------------------------------------------------
      //! Wait until all the queued events have been handled
      //!
      //! @return the error of the first failed event, OK otherwise
      //------------------------------------------------------------------------
      Status WaitForIdle();

      //------------------------------------------------------------------------
      //! Number of events queued and not handled yet
      //------------------------------------------------------------------------
      uint64_t GetPending() const;

      //------------------------------------------------------------------------
      //! Handle the queued events of a file id until there are none left,
      //! run by the workers
      //------------------------------------------------------------------------
      void RunStrand( const std::string &fileID );

    private:
      SequencedEventDispatcher( const SequencedEventDispatcher &other );
      SequencedEventDispatcher &operator = (
                                  const SequencedEventDispatcher &other );

      void Done( uint64_t count );

      typedef std::deque<OperationEvent>          EventQueue;
      typedef std::map<std::string, EventQueue>   StrandMap;

      EventHandler            &pHandler;
      WorkerPool              &pPool;
      StrandMap                pStrands;
      uint64_t                 pPending;
      std::unique_ptr<Status>  pFailure;
      mutable std::mutex       pMutex;
      std::condition_variable  pIdle;
  };
}

#endif // __BIT_CL_SEQUENCED_EVENT_DISPATCHER_HH__
