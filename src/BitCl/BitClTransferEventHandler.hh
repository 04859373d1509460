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

#ifndef __BIT_CL_TRANSFER_EVENT_HANDLER_HH__
#define __BIT_CL_TRANSFER_EVENT_HANDLER_HH__

#include "BitCl/BitClOperationEvent.hh"
#include "BitCl/BitClJob.hh"
#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  class JobRegistry;
  class RetryQueue;
  class FileExchange;
  class StatusReporter;

  //----------------------------------------------------------------------------
  //! Finishes file transfers when the remote side reports their outcome.
  //!
  //! Every event is checked against the registry first, an event for a file
  //! id without a running job raises EventException. Then:
  //!  - Complete: fetch the file, report it, unregister the job and delete
  //!    the remote copy, a failed fetch is handled as Failed
  //!  - Failed: delete the remote copy, offer the job to the retry queue
  //!    and unregister it, a full retry queue is logged and not waited for
  //!  - anything else: nothing
  //!
  //! The collaborators must outlive the handler.
  //----------------------------------------------------------------------------
  class TransferEventHandler: public EventHandler
  {
    public:
      TransferEventHandler( JobRegistry    &registry,
                            RetryQueue     &retryQueue,
                            FileExchange   &exchange,
                            StatusReporter &reporter ):
        pRegistry( registry ),
        pRetryQueue( retryQueue ),
        pExchange( exchange ),
        pReporter( reporter ) {}

      virtual ~TransferEventHandler() {}

      //------------------------------------------------------------------------
      //! Handle an event
      //!
      //! @throws EventException if no job is running for the file id
      //------------------------------------------------------------------------
      virtual void HandleEvent( const OperationEvent &event );

    private:
      void   HandleComplete( const JobPtr &job );
      void   HandleFailure( const JobPtr &job, const std::string &reason );
      Status FetchFile( const JobPtr &job );
      void   DeleteRemoteCopy( const JobPtr &job );
      void   Unregister( const JobPtr &job );

      JobRegistry    &pRegistry;
      RetryQueue     &pRetryQueue;
      FileExchange   &pExchange;
      StatusReporter &pReporter;
  };
}

#endif // __BIT_CL_TRANSFER_EVENT_HANDLER_HH__
