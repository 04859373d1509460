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

#include "BitCl/BitClSequencedEventDispatcher.hh"
#include "BitCl/BitClWorkerPool.hh"
#include "BitCl/BitClEventException.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

namespace
{
  using namespace BitCl;

  //----------------------------------------------------------------------------
  // Runs the strand of one file id
  //----------------------------------------------------------------------------
  class StrandTask: public WorkerTask
  {
    public:
      StrandTask( SequencedEventDispatcher *dispatcher,
                  const std::string        &fileID ):
        pDispatcher( dispatcher ), pFileID( fileID ) {}

      virtual void Run()
      {
        pDispatcher->RunStrand( pFileID );
      }

    private:
      SequencedEventDispatcher *pDispatcher;
      std::string               pFileID;
  };
}

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  SequencedEventDispatcher::SequencedEventDispatcher( EventHandler &handler,
                                                      WorkerPool   &pool ):
    pHandler( handler ),
    pPool( pool ),
    pPending( 0 )
  {
  }

  //----------------------------------------------------------------------------
  // Destructor
  //----------------------------------------------------------------------------
  SequencedEventDispatcher::~SequencedEventDispatcher()
  {
    Status st = WaitForIdle();
    if( !st.IsOK() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Error( WorkerPoolMsg, "Event dispatching stopped on error: %s",
                  st.ToStr().c_str() );
    }
  }

  //----------------------------------------------------------------------------
  // Queue an event
  //----------------------------------------------------------------------------
  void SequencedEventDispatcher::HandleEvent( const OperationEvent &event )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    if( pFailure )
      throw EventException( *pFailure );

    const std::string &fileID = event.GetFileID();
    StrandMap::iterator it = pStrands.find( fileID );
    if( it != pStrands.end() )
    {
      //------------------------------------------------------------------------
      // A worker is busy with this file id and will pick the event up
      //------------------------------------------------------------------------
      it->second.push_back( event );
      ++pPending;
      return;
    }

    it = pStrands.insert( std::make_pair( fileID, EventQueue() ) ).first;
    it->second.push_back( event );
    ++pPending;

    WorkerTaskPtr task( new StrandTask( this, fileID ) );
    if( !pPool.QueueTask( task ) )
    {
      pStrands.erase( it );
      Done( 1 );
      throw EventException( Status( stFatal, errUninitialized, 0,
                                    "worker pool not accepting events" ) );
    }
  }

  //----------------------------------------------------------------------------
  // Handle the events of a file id
  //----------------------------------------------------------------------------
  void SequencedEventDispatcher::RunStrand( const std::string &fileID )
  {
    Log *log = DefaultEnv::GetLog();
    std::unique_ptr<OperationEvent> event;
    {
      std::unique_lock<std::mutex> lck( pMutex );
      StrandMap::iterator it = pStrands.find( fileID );
      if( it == pStrands.end() || it->second.empty() )
        return;
      event.reset( new OperationEvent( it->second.front() ) );
    }

    while( true )
    {
      Status error;
      try
      {
        pHandler.HandleEvent( *event );
      }
      catch( const EventException &ex )
      {
        error = ex.GetError();
      }
      catch( const std::exception &ex )
      {
        error = Status( stFatal, errInternal, 0, ex.what() );
      }

      //------------------------------------------------------------------------
      // The strand is retired in the same critical section in which its last
      // event is counted as done, nothing touches the dispatcher afterwards
      //------------------------------------------------------------------------
      std::unique_lock<std::mutex> lck( pMutex );
      if( !error.IsOK() && !pFailure )
      {
        log->Error( WorkerPoolMsg, "Handling %s failed: %s",
                    event->ToString().c_str(), error.ToStr().c_str() );
        pFailure.reset( new Status( error ) );
      }

      StrandMap::iterator it = pStrands.find( fileID );
      it->second.pop_front();
      uint64_t done = 1;

      if( pFailure && !it->second.empty() )
      {
        log->Warning( WorkerPoolMsg, "Dropping %d event(s) for %s after a "
                      "previous failure", (int)it->second.size(),
                      fileID.c_str() );
        done += it->second.size();
        it->second.clear();
      }

      if( it->second.empty() )
      {
        pStrands.erase( it );
        Done( done );
        return;
      }

      Done( done );
      event.reset( new OperationEvent( it->second.front() ) );
    }
  }

  //----------------------------------------------------------------------------
  // Wait for everything to be handled
  //----------------------------------------------------------------------------
  Status SequencedEventDispatcher::WaitForIdle()
  {
    std::unique_lock<std::mutex> lck( pMutex );
    while( pPending != 0 )
      pIdle.wait( lck );
    if( pFailure )
      return *pFailure;
    return Status();
  }

  uint64_t SequencedEventDispatcher::GetPending() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pPending;
  }

  //----------------------------------------------------------------------------
  // Count handled events, the mutex needs to be locked
  //----------------------------------------------------------------------------
  void SequencedEventDispatcher::Done( uint64_t count )
  {
    pPending -= count;
    if( pPending == 0 )
      pIdle.notify_all();
  }
}
