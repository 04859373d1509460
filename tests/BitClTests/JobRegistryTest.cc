//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitBitHelpers.hh"

#include "BitCl/BitClJobRegistry.hh"
#include "BitCl/BitClRetryQueue.hh"

#include <thread>
#include <chrono>
#include <atomic>
#include <sstream>
#include <vector>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class JobRegistryTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( JobRegistryTest );
      CPPUNIT_TEST( RegisterTest );
      CPPUNIT_TEST( RemoveTest );
      CPPUNIT_TEST( ConcurrentRegisterTest );
      CPPUNIT_TEST( RetryQueueOrderTest );
      CPPUNIT_TEST( RetryQueueCapacityTest );
      CPPUNIT_TEST( RetryQueueBlockingTest );
    CPPUNIT_TEST_SUITE_END();
    void RegisterTest();
    void RemoveTest();
    void ConcurrentRegisterTest();
    void RetryQueueOrderTest();
    void RetryQueueCapacityTest();
    void RetryQueueBlockingTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( JobRegistryTest );

namespace
{
  using namespace BitCl;

  JobPtr MakeJob( const std::string &fileID )
  {
    return JobPtr( new Job( "/tmp/" + fileID, fileID, "",
                            URL( "http://host/" + fileID ) ) );
  }
}

//------------------------------------------------------------------------------
// Register and look up
//------------------------------------------------------------------------------
void JobRegistryTest::RegisterTest()
{
  JobRegistry registry;
  JobPtr      job1 = MakeJob( "f1" );
  JobPtr      job2 = MakeJob( "f2" );

  CPPUNIT_ASSERT_BITST( registry.AddJob( job1 ) );
  CPPUNIT_ASSERT_BITST( registry.AddJob( job2 ) );
  CPPUNIT_ASSERT( registry.GetSize() == 2 );

  JobPtr found;
  CPPUNIT_ASSERT_BITST( registry.GetJob( "f1", found ) );
  CPPUNIT_ASSERT( found == job1 );
  CPPUNIT_ASSERT( found->GetURL().GetURL() == "http://host/f1" );
  CPPUNIT_ASSERT( !found->HasChecksum() );

  //----------------------------------------------------------------------------
  // Second job for the same file id
  //----------------------------------------------------------------------------
  Status st = registry.AddJob( MakeJob( "f1" ) );
  CPPUNIT_ASSERT( st.IsFatal() );
  CPPUNIT_ASSERT( st.code == errDuplicateJob );
  CPPUNIT_ASSERT_BITST( registry.GetJob( "f1", found ) );
  CPPUNIT_ASSERT( found == job1 );

  //----------------------------------------------------------------------------
  // Unknown file id
  //----------------------------------------------------------------------------
  JobPtr missing;
  st = registry.GetJob( "f3", missing );
  CPPUNIT_ASSERT( st.IsFatal() );
  CPPUNIT_ASSERT( st.code == errUnknownJob );
  CPPUNIT_ASSERT( !missing );
}

//------------------------------------------------------------------------------
// Removal is idempotent
//------------------------------------------------------------------------------
void JobRegistryTest::RemoveTest()
{
  JobRegistry registry;
  JobPtr      job = MakeJob( "f1" );

  CPPUNIT_ASSERT_BITST( registry.AddJob( job ) );
  Status st = registry.RemoveJob( job );
  CPPUNIT_ASSERT( st.IsOK() );
  CPPUNIT_ASSERT( st.code == suDone );
  CPPUNIT_ASSERT( !registry.HasJob( "f1" ) );

  st = registry.RemoveJob( job );
  CPPUNIT_ASSERT( st.IsOK() );
  CPPUNIT_ASSERT( st.code == suAlreadyDone );

  //----------------------------------------------------------------------------
  // The file id can be registered again
  //----------------------------------------------------------------------------
  CPPUNIT_ASSERT_BITST( registry.AddJob( MakeJob( "f1" ) ) );
  CPPUNIT_ASSERT( registry.GetSize() == 1 );
}

//------------------------------------------------------------------------------
// Only one of the racing registrations wins
//------------------------------------------------------------------------------
void JobRegistryTest::ConcurrentRegisterTest()
{
  JobRegistry              registry;
  std::atomic<int>         added( 0 );
  std::atomic<int>         duplicates( 0 );
  std::vector<std::thread> threads;

  for( int i = 0; i < 8; ++i )
    threads.push_back( std::thread( [&registry, &added, &duplicates, i]()
    {
      for( int j = 0; j < 100; ++j )
      {
        std::ostringstream o; o << "f" << j;
        Status st = registry.AddJob( MakeJob( o.str() ) );
        if( st.IsOK() ) ++added;
        else if( st.code == errDuplicateJob ) ++duplicates;

        o.str( "" ); o << "t" << i << "-" << j;
        JobPtr own = MakeJob( o.str() );
        JobPtr found;
        if( registry.AddJob( own ).IsOK() &&
            registry.GetJob( own->GetFileID(), found ).IsOK() &&
            found == own )
          registry.RemoveJob( own );
      }
    } ) );

  for( size_t i = 0; i < threads.size(); ++i )
    threads[i].join();

  CPPUNIT_ASSERT_EQUAL( 100, added.load() );
  CPPUNIT_ASSERT_EQUAL( 700, duplicates.load() );
  CPPUNIT_ASSERT( registry.GetSize() == 100 );
}

//------------------------------------------------------------------------------
// Jobs come out in failure order, each file id at most once
//------------------------------------------------------------------------------
void JobRegistryTest::RetryQueueOrderTest()
{
  RetryQueue queue;
  JobPtr     job1 = MakeJob( "f1" );
  JobPtr     job2 = MakeJob( "f2" );

  CPPUNIT_ASSERT_BITST( queue.Put( job1 ) );
  CPPUNIT_ASSERT_BITST( queue.Offer( job2 ) );

  Status st = queue.Put( MakeJob( "f1" ) );
  CPPUNIT_ASSERT( st.IsFatal() );
  CPPUNIT_ASSERT( st.code == errDuplicateJob );
  CPPUNIT_ASSERT( queue.Size() == 2 );

  JobPtr job;
  CPPUNIT_ASSERT( queue.Get( job, 100 ) );
  CPPUNIT_ASSERT( job == job1 );
  CPPUNIT_ASSERT( !queue.Contains( "f1" ) );
  CPPUNIT_ASSERT( queue.TryGet( job ) );
  CPPUNIT_ASSERT( job == job2 );
  CPPUNIT_ASSERT( !queue.TryGet( job ) );
  CPPUNIT_ASSERT( !queue.Get( job, 10 ) );

  //----------------------------------------------------------------------------
  // Once taken out the job may fail again
  //----------------------------------------------------------------------------
  CPPUNIT_ASSERT_BITST( queue.Put( job1 ) );
  queue.Clear();
  CPPUNIT_ASSERT( queue.Size() == 0 );
  CPPUNIT_ASSERT( !queue.Contains( "f1" ) );
}

//------------------------------------------------------------------------------
// A bounded queue refuses offers when full
//------------------------------------------------------------------------------
void JobRegistryTest::RetryQueueCapacityTest()
{
  RetryQueue queue( 2 );
  CPPUNIT_ASSERT( queue.GetCapacity() == 2 );
  CPPUNIT_ASSERT_BITST( queue.Offer( MakeJob( "f1" ) ) );
  CPPUNIT_ASSERT_BITST( queue.Offer( MakeJob( "f2" ) ) );

  Status st = queue.Offer( MakeJob( "f3" ) );
  CPPUNIT_ASSERT( st.IsError() );
  CPPUNIT_ASSERT( !st.IsFatal() );
  CPPUNIT_ASSERT( st.code == errRetryQueueFull );
  CPPUNIT_ASSERT( queue.Size() == 2 );

  JobPtr job;
  CPPUNIT_ASSERT( queue.TryGet( job ) );
  CPPUNIT_ASSERT_BITST( queue.Offer( MakeJob( "f3" ) ) );
}

//------------------------------------------------------------------------------
// Put waits for space, Get waits for a job
//------------------------------------------------------------------------------
void JobRegistryTest::RetryQueueBlockingTest()
{
  RetryQueue queue( 1 );
  CPPUNIT_ASSERT_BITST( queue.Put( MakeJob( "f1" ) ) );

  std::atomic<bool> putDone( false );
  Status            putStatus;
  std::thread producer( [&queue, &putDone, &putStatus]()
  {
    putStatus = queue.Put( MakeJob( "f2" ) );
    putDone   = true;
  } );

  std::this_thread::sleep_for( std::chrono::milliseconds( 50 ) );
  CPPUNIT_ASSERT( !putDone );

  JobPtr job;
  CPPUNIT_ASSERT( queue.Get( job ) );
  CPPUNIT_ASSERT( job->GetFileID() == "f1" );
  producer.join();
  CPPUNIT_ASSERT( putDone );
  CPPUNIT_ASSERT( putStatus.IsOK() );

  std::thread consumer( [&queue, &job]()
  {
    queue.Get( job );
  } );
  consumer.join();
  CPPUNIT_ASSERT( job->GetFileID() == "f2" );
}
