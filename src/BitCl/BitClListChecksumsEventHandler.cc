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

#include "BitCl/BitClListChecksumsEventHandler.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

namespace BitCl
{
  ListChecksumsEventHandler::ListChecksumsEventHandler(
                                              const std::string &pillarID ):
    pPillarID( pillarID ),
    pPartial( false ),
    pFailed( false ),
    pFinished( false )
  {
  }

  //----------------------------------------------------------------------------
  // Handle an event
  //----------------------------------------------------------------------------
  void ListChecksumsEventHandler::HandleEvent( const OperationEvent &event )
  {
    Log *log = DefaultEnv::GetLog();
    log->Dump( ListMsg, "Got event: %s", event.ToString().c_str() );

    switch( event.GetType() )
    {
      case OperationEvent::ComponentComplete:
      {
        if( event.GetContributor() != pPillarID )
        {
          log->Warning( ListMsg, "Ignoring results from %s, waiting for %s",
                        event.GetContributor().c_str(), pPillarID.c_str() );
          break;
        }

        const std::shared_ptr<const ChecksumResult> &result =
          event.GetChecksums();
        std::unique_lock<std::mutex> lck( pMutex );
        if( result )
        {
          pRecords.insert( pRecords.end(), result->records.begin(),
                           result->records.end() );
          pPartial = result->partial;
        }
        log->Debug( ListMsg, "%s delivered %d checksum(s)%s",
                    pPillarID.c_str(), result ? (int)result->records.size() : 0,
                    pPartial ? ", more to come" : "" );
        break;
      }

      case OperationEvent::ComponentFailed:
      {
        if( event.GetContributor() != pPillarID )
          break;
        log->Error( ListMsg, "%s failed to deliver checksums: %s",
                    pPillarID.c_str(), event.GetInfo().c_str() );
        std::unique_lock<std::mutex> lck( pMutex );
        pFailed      = true;
        pFailureInfo = event.GetInfo();
        break;
      }

      case OperationEvent::Complete:
        Finish( false );
        break;

      case OperationEvent::Failed:
      {
        {
          std::unique_lock<std::mutex> lck( pMutex );
          if( pFailureInfo.empty() )
            pFailureInfo = event.GetInfo();
        }
        Finish( true );
        break;
      }

      default:
        break;
    }
  }

  //----------------------------------------------------------------------------
  // Wait for the end
  //----------------------------------------------------------------------------
  void ListChecksumsEventHandler::WaitForFinish()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    while( !pFinished )
      pFinishedCond.wait( lck );
  }

  bool ListChecksumsEventHandler::IsFinished() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pFinished;
  }

  bool ListChecksumsEventHandler::HasFailed() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pFailed;
  }

  bool ListChecksumsEventHandler::PartialResults() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pPartial;
  }

  std::vector<ChecksumData> ListChecksumsEventHandler::GetChecksumData() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pRecords;
  }

  std::string ListChecksumsEventHandler::GetFailureInfo() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pFailureInfo;
  }

  //----------------------------------------------------------------------------
  // Mark the operation as done and wake up the waiters
  //----------------------------------------------------------------------------
  void ListChecksumsEventHandler::Finish( bool failed )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    if( failed )
      pFailed = true;
    pFinished = true;
    pFinishedCond.notify_all();
  }
}
