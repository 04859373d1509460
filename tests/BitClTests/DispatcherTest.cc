//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitBitHelpers.hh"
#include "RecordingFakes.hh"
#include "TestEnv.hh"

#include "BitCl/BitClWorkerPool.hh"
#include "BitCl/BitClSequencedEventDispatcher.hh"
#include "BitCl/BitClTransferEventHandler.hh"
#include "BitCl/BitClEventException.hh"

#include <map>
#include <atomic>
#include <thread>
#include <chrono>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class DispatcherTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( DispatcherTest );
      CPPUNIT_TEST( WorkerPoolTest );
      CPPUNIT_TEST( PerFileOrderTest );
      CPPUNIT_TEST( FailureTest );
      CPPUNIT_TEST( TransferTest );
    CPPUNIT_TEST_SUITE_END();
    void WorkerPoolTest();
    void PerFileOrderTest();
    void FailureTest();
    void TransferTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( DispatcherTest );

namespace
{
  using namespace BitCl;

  class CountingTask: public WorkerTask
  {
    public:
      CountingTask( std::atomic<int> &counter ): pCounter( counter ) {}
      virtual void Run() { ++pCounter; }
    private:
      std::atomic<int> &pCounter;
  };

  //----------------------------------------------------------------------------
  // Remembers the order of the events per file id and checks that no two
  // events of a file are handled at the same time
  //----------------------------------------------------------------------------
  class SequenceHandler: public EventHandler
  {
    public:
      SequenceHandler(): pOverlaps( 0 ) {}

      virtual void HandleEvent( const OperationEvent &event )
      {
        {
          std::unique_lock<std::mutex> lck( pMutex );
          if( pBusy[event.GetFileID()]++ )
            ++pOverlaps;
        }

        std::this_thread::sleep_for( std::chrono::microseconds( 200 ) );

        std::unique_lock<std::mutex> lck( pMutex );
        pSeen[event.GetFileID()].push_back( atoi( event.GetInfo().c_str() ) );
        --pBusy[event.GetFileID()];
      }

      std::map<std::string, std::vector<int> > GetSeen()
      {
        std::unique_lock<std::mutex> lck( pMutex );
        return pSeen;
      }

      int GetOverlaps()
      {
        std::unique_lock<std::mutex> lck( pMutex );
        return pOverlaps;
      }

    private:
      std::mutex                                pMutex;
      std::map<std::string, int>                pBusy;
      std::map<std::string, std::vector<int> >  pSeen;
      int                                       pOverlaps;
  };

  std::string Num( const char *prefix, int i )
  {
    std::ostringstream o;
    o << prefix << i;
    return o.str();
  }
}

//------------------------------------------------------------------------------
// The pool runs everything queued before it stops
//------------------------------------------------------------------------------
void DispatcherTest::WorkerPoolTest()
{
  std::atomic<int> counter( 0 );
  WorkerPool pool( 3 );
  CPPUNIT_ASSERT( pool.GetNumWorkers() == 3 );

  for( int i = 0; i < 50; ++i )
    CPPUNIT_ASSERT( pool.QueueTask( WorkerTaskPtr( new CountingTask( counter ) ) ) );

  CPPUNIT_ASSERT( pool.Start() );
  CPPUNIT_ASSERT( pool.IsRunning() );
  CPPUNIT_ASSERT( !pool.Start() );

  for( int i = 0; i < 50; ++i )
    CPPUNIT_ASSERT( pool.QueueTask( WorkerTaskPtr( new CountingTask( counter ) ) ) );

  CPPUNIT_ASSERT( pool.Stop() );
  CPPUNIT_ASSERT_EQUAL( 100, counter.load() );
  CPPUNIT_ASSERT( !pool.Stop() );
  CPPUNIT_ASSERT( !pool.Start() );
  CPPUNIT_ASSERT( !pool.QueueTask( WorkerTaskPtr( new CountingTask( counter ) ) ) );
}

//------------------------------------------------------------------------------
// Events of a file id are handled in order, one at a time
//------------------------------------------------------------------------------
void DispatcherTest::PerFileOrderTest()
{
  SequenceHandler handler;
  WorkerPool      pool( 4 );
  CPPUNIT_ASSERT( pool.Start() );

  {
    SequencedEventDispatcher dispatcher( handler, pool );
    for( int i = 0; i < 20; ++i )
      for( int f = 0; f < 5; ++f )
        dispatcher.HandleEvent( OperationEvent( OperationEvent::Progress,
                                                "collection1", Num( "f", f ),
                                                "pillar1", Num( "", i ) ) );

    CPPUNIT_ASSERT_BITST( dispatcher.WaitForIdle() );
    CPPUNIT_ASSERT( dispatcher.GetPending() == 0 );
  }
  CPPUNIT_ASSERT( pool.Stop() );

  std::map<std::string, std::vector<int> > seen = handler.GetSeen();
  CPPUNIT_ASSERT( seen.size() == 5 );
  std::map<std::string, std::vector<int> >::iterator it;
  for( it = seen.begin(); it != seen.end(); ++it )
  {
    CPPUNIT_ASSERT( it->second.size() == 20 );
    for( int i = 0; i < 20; ++i )
      CPPUNIT_ASSERT_EQUAL( i, it->second[i] );
  }
  CPPUNIT_ASSERT_EQUAL( 0, handler.GetOverlaps() );
}

//------------------------------------------------------------------------------
// An event nobody waits for stops the dispatching
//------------------------------------------------------------------------------
void DispatcherTest::FailureTest()
{
  CallLog                 calls;
  RecordingJobRegistry    registry( calls );
  RecordingRetryQueue     retryQueue( calls );
  RecordingFileExchange   exchange( calls );
  RecordingStatusReporter reporter( calls );
  TransferEventHandler    handler( registry, retryQueue, exchange, reporter );

  WorkerPool pool( 2 );
  CPPUNIT_ASSERT( pool.Start() );
  {
    SequencedEventDispatcher dispatcher( handler, pool );
    dispatcher.HandleEvent( OperationEvent( OperationEvent::Complete,
                                            "collection1", "unknown" ) );

    Status st = dispatcher.WaitForIdle();
    CPPUNIT_ASSERT( st.IsFatal() );
    CPPUNIT_ASSERT( st.code == errUnknownJob );
    CPPUNIT_ASSERT_EQUAL( std::string( "lookup(unknown)" ), calls.ToString() );

    CPPUNIT_ASSERT_THROW( dispatcher.HandleEvent(
                            OperationEvent( OperationEvent::Progress,
                                            "collection1", "other" ) ),
                          EventException );
    CPPUNIT_ASSERT( dispatcher.GetPending() == 0 );
  }
  CPPUNIT_ASSERT( pool.Stop() );
}

//------------------------------------------------------------------------------
// Transfers finished on the pool keep their per job order
//------------------------------------------------------------------------------
void DispatcherTest::TransferTest()
{
  CallLog                 calls;
  RecordingJobRegistry    registry( calls );
  RecordingRetryQueue     retryQueue( calls );
  RecordingFileExchange   exchange( calls );
  RecordingStatusReporter reporter( calls );
  TransferEventHandler    handler( registry, retryQueue, exchange, reporter );

  std::vector<std::string> paths;
  for( int i = 0; i < 10; ++i )
  {
    paths.push_back( TestEnv::GetTempPath( Num( "f", i ) ) );
    JobPtr job( new Job( paths.back(), Num( "f", i ), "",
                         URL( Num( "http://host/f", i ) ) ) );
    CPPUNIT_ASSERT_BITST( registry.AddJob( job ) );
  }

  WorkerPool pool( 3 );
  CPPUNIT_ASSERT( pool.Start() );
  {
    SequencedEventDispatcher dispatcher( handler, pool );
    for( int i = 0; i < 10; ++i )
    {
      std::string fileID = Num( "f", i );
      dispatcher.HandleEvent( OperationEvent( OperationEvent::RequestSent,
                                              "collection1", fileID ) );
      dispatcher.HandleEvent( OperationEvent( i % 2 ? OperationEvent::Failed :
                                                      OperationEvent::Complete,
                                              "collection1", fileID ) );
    }
    CPPUNIT_ASSERT_BITST( dispatcher.WaitForIdle() );
  }
  CPPUNIT_ASSERT( pool.Stop() );

  CPPUNIT_ASSERT( registry.GetSize() == 0 );
  CPPUNIT_ASSERT( retryQueue.Size() == 5 );

  //----------------------------------------------------------------------------
  // Pick the calls of every job out of the interleaved log
  //----------------------------------------------------------------------------
  std::vector<std::string> all = calls.Get();
  for( int i = 0; i < 10; ++i )
  {
    std::string suffix = Num( "f", i ) + ")";
    std::string url    = Num( "http://host/f", i );
    std::string id     = Num( "f", i );
    std::string mine;
    for( size_t j = 0; j < all.size(); ++j )
    {
      const std::string &c = all[j];
      if( c.size() >= suffix.size() &&
          c.compare( c.size() - suffix.size(), suffix.size(), suffix ) == 0 )
        mine += ( mine.empty() ? "" : " " ) + c;
    }

    std::string expected;
    if( i % 2 )
      expected = "lookup(" + id + ") lookup(" + id + ") delete(" + url +
                 ") enqueue(" + id + ") remove(" + id + ")";
    else
      expected = "lookup(" + id + ") lookup(" + id + ") fetch(" + url +
                 ") reportFinish(" + id + ") remove(" + id + ") delete(" +
                 url + ")";
    CPPUNIT_ASSERT_EQUAL( expected, mine );
    ::unlink( paths[i].c_str() );
  }
}
