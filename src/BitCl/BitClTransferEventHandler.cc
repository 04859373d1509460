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

#include "BitCl/BitClTransferEventHandler.hh"
#include "BitCl/BitClJobRegistry.hh"
#include "BitCl/BitClRetryQueue.hh"
#include "BitCl/BitClFileExchange.hh"
#include "BitCl/BitClStatusReporter.hh"
#include "BitCl/BitClEventException.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

#include <fstream>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Handle an event
  //----------------------------------------------------------------------------
  void TransferEventHandler::HandleEvent( const OperationEvent &event )
  {
    Log *log = DefaultEnv::GetLog();
    log->Dump( TransferMsg, "Got event: %s", event.ToString().c_str() );

    JobPtr job;
    Status st = pRegistry.GetJob( event.GetFileID(), job );
    if( !st.IsOK() )
    {
      log->Error( TransferMsg, "Event %s for %s does not belong to any "
                  "running job", OperationEvent::TypeToString( event.GetType() ),
                  event.GetFileID().c_str() );
      throw EventException( st );
    }

    switch( event.GetType() )
    {
      case OperationEvent::Complete:
        HandleComplete( job );
        break;

      case OperationEvent::Failed:
        HandleFailure( job, event.GetInfo() );
        break;

      default:
        break;
    }
  }

  //----------------------------------------------------------------------------
  // The remote side has the file ready for us
  //----------------------------------------------------------------------------
  void TransferEventHandler::HandleComplete( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();

    Status st = FetchFile( job );
    if( !st.IsOK() )
    {
      HandleFailure( job, st.ToStr() );
      return;
    }

    log->Info( TransferMsg, "Transfer of %s to %s finished",
               job->GetFileID().c_str(), job->GetLocalPath().c_str() );
    pReporter.ReportFinish( job->GetFileID() );
    Unregister( job );
    DeleteRemoteCopy( job );
  }

  //----------------------------------------------------------------------------
  // Clean up and give the job back for a retry
  //----------------------------------------------------------------------------
  void TransferEventHandler::HandleFailure( const JobPtr      &job,
                                            const std::string &reason )
  {
    Log *log = DefaultEnv::GetLog();
    log->Warning( TransferMsg, "Transfer of %s failed: %s",
                  job->GetFileID().c_str(), reason.c_str() );

    DeleteRemoteCopy( job );

    //--------------------------------------------------------------------------
    // Never wait for the retry consumer, a full queue loses the job
    //--------------------------------------------------------------------------
    Status st = pRetryQueue.Offer( job );
    if( !st.IsOK() )
      log->Error( TransferMsg, "Unable to queue %s for retry: %s",
                  job->GetFileID().c_str(), st.ToStr().c_str() );

    Unregister( job );
  }

  //----------------------------------------------------------------------------
  // Write the remote copy to the local destination
  //----------------------------------------------------------------------------
  Status TransferEventHandler::FetchFile( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    const std::string &path = job->GetLocalPath();

    std::ofstream out( path.c_str(), std::ios::out | std::ios::binary |
                                      std::ios::trunc );
    if( !out.is_open() )
    {
      int err = errno;
      log->Error( TransferMsg, "Unable to open %s for writing: %s",
                  path.c_str(), ::strerror( err ) );
      return Status( stError, errOSError, err, path );
    }

    log->Debug( TransferMsg, "Fetching %s from %s", job->GetFileID().c_str(),
                job->GetURL().GetURL().c_str() );

    Status st = pExchange.GetFile( out, job->GetURL() );
    out.close();
    if( st.IsOK() && out.fail() )
      st = Status( stError, errOSError, 0, path );

    if( !st.IsOK() )
    {
      if( ::unlink( path.c_str() ) != 0 )
        log->Warning( TransferMsg, "Unable to remove the partial file %s: %s",
                      path.c_str(), ::strerror( errno ) );
    }
    return st;
  }

  //----------------------------------------------------------------------------
  // The outcome of the deletion doesn't change anything for the job
  //----------------------------------------------------------------------------
  void TransferEventHandler::DeleteRemoteCopy( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    Status st = pExchange.DeleteFile( job->GetURL() );
    if( !st.IsOK() )
      log->Warning( TransferMsg, "Unable to delete the remote copy of %s: %s",
                    job->GetFileID().c_str(), st.ToStr().c_str() );
  }

  void TransferEventHandler::Unregister( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    Status st = pRegistry.RemoveJob( job );
    if( !st.IsOK() )
      log->Error( TransferMsg, "Unable to unregister %s: %s",
                  job->GetFileID().c_str(), st.ToStr().c_str() );
  }
}
