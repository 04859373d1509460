//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitBitHelpers.hh"
#include "RecordingFakes.hh"
#include "TestEnv.hh"

#include "BitCl/BitClListAction.hh"
#include "BitCl/BitClListChecksumsEventHandler.hh"
#include "BitCl/BitClSumFileWriter.hh"
#include "BitCl/BitClUtils.hh"

#include <fstream>
#include <memory>
#include <thread>
#include <sstream>
#include <unistd.h>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class ListActionTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( ListActionTest );
      CPPUNIT_TEST( SinglePageTest );
      CPPUNIT_TEST( PageBoundaryTest );
      CPPUNIT_TEST( SinglePageLookbackTest );
      CPPUNIT_TEST( PrefixTest );
      CPPUNIT_TEST( CursorTest );
      CPPUNIT_TEST( QueryFailureTest );
      CPPUNIT_TEST( ExistingSumFileTest );
      CPPUNIT_TEST( InvalidArgsTest );
      CPPUNIT_TEST( ChecksumsHandlerTest );
    CPPUNIT_TEST_SUITE_END();
    void SinglePageTest();
    void PageBoundaryTest();
    void SinglePageLookbackTest();
    void PrefixTest();
    void CursorTest();
    void QueryFailureTest();
    void ExistingSumFileTest();
    void InvalidArgsTest();
    void ChecksumsHandlerTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( ListActionTest );

namespace
{
  using namespace BitCl;

  const char *md5a = "d41d8cd98f00b204e9800998ecf8427e";
  const char *md5b = "0cc175b9c0f1b6a831c399e269772661";
  const char *md5c = "92eb5ffee6ae2fec3ad71c777531578f";

  ChecksumData Record( const std::string &fileID, const char *hex,
                       int64_t time )
  {
    std::vector<uint8_t> bytes;
    Status st = Utils::Hex2Char( bytes, hex );
    CPPUNIT_ASSERT( st.IsOK() );
    return ChecksumData( fileID, bytes, time );
  }

  std::string Line( const char *hex, const std::string &path )
  {
    return std::string( hex ) + "  " + path + "\n";
  }

  std::string ReadFile( const std::string &path )
  {
    std::ifstream in( path.c_str() );
    std::ostringstream o;
    o << in.rdbuf();
    return o.str();
  }

  //----------------------------------------------------------------------------
  // Removes the sum file when the test is done
  //----------------------------------------------------------------------------
  struct SumFile
  {
    SumFile(): path( TestEnv::GetTempPath( "sums.md5" ) ) {}
    ~SumFile() { ::unlink( path.c_str() ); }
    std::string path;
  };
}

//------------------------------------------------------------------------------
// One page, everything written
//------------------------------------------------------------------------------
void ListActionTest::SinglePageTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  FakePage           page;
  page.records.push_back( Record( "a", md5a, 1000 ) );
  page.records.push_back( Record( "b", md5b, 3000 ) );
  page.records.push_back( Record( "c", md5c, 2000 ) );
  client.AddPage( page );

  ListAction action( client, "collection1", "pillar1", sums.path );
  action.SetPrefixes( "/data/", "" );
  action.SetPageSize( 500 );
  CPPUNIT_ASSERT_BITST( action.Run() );

  CPPUNIT_ASSERT_EQUAL( Line( md5a, "/data/a" ) + Line( md5b, "/data/b" ) +
                        Line( md5c, "/data/c" ), ReadFile( sums.path ) );
  CPPUNIT_ASSERT( action.GetCursor() == 3000 );
  CPPUNIT_ASSERT( action.GetPageCount() == 1 );

  const std::vector<ContributorQuery> &queries = client.GetQueries();
  CPPUNIT_ASSERT( queries.size() == 1 );
  CPPUNIT_ASSERT( queries[0].contributorID == "pillar1" );
  CPPUNIT_ASSERT( queries[0].minTimestamp == 0 );
  CPPUNIT_ASSERT( queries[0].maxTimestamp == NoTimeLimit );
  CPPUNIT_ASSERT( queries[0].maxResults == 500 );
  CPPUNIT_ASSERT( client.GetChecksumType() == "md5" );
}

//------------------------------------------------------------------------------
// A record repeated at the page boundary is written once
//------------------------------------------------------------------------------
void ListActionTest::PageBoundaryTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  FakePage           page1;
  page1.records.push_back( Record( "a", md5a, 1000 ) );
  page1.records.push_back( Record( "b", md5b, 2000 ) );
  page1.partial = true;
  FakePage           page2;
  page2.records.push_back( Record( "b", md5b, 2000 ) );
  page2.records.push_back( Record( "c", md5c, 3000 ) );
  client.AddPage( page1 );
  client.AddPage( page2 );

  ListAction action( client, "collection1", "pillar1", sums.path );
  CPPUNIT_ASSERT_BITST( action.Run() );

  CPPUNIT_ASSERT_EQUAL( Line( md5a, "a" ) + Line( md5b, "b" ) +
                        Line( md5c, "c" ), ReadFile( sums.path ) );
  CPPUNIT_ASSERT( action.GetPageCount() == 2 );
  CPPUNIT_ASSERT( action.GetCursor() == 3000 );

  const std::vector<ContributorQuery> &queries = client.GetQueries();
  CPPUNIT_ASSERT( queries.size() == 2 );
  CPPUNIT_ASSERT( queries[0].minTimestamp == 0 );
  CPPUNIT_ASSERT( queries[1].minTimestamp == 2000 );
}

//------------------------------------------------------------------------------
// Only the previous page is remembered
//------------------------------------------------------------------------------
void ListActionTest::SinglePageLookbackTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  FakePage           page1;
  page1.records.push_back( Record( "a", md5a, 1000 ) );
  page1.partial = true;
  FakePage           page2;
  page2.records.push_back( Record( "b", md5b, 2000 ) );
  page2.partial = true;
  FakePage           page3;
  page3.records.push_back( Record( "a", md5a, 3000 ) );
  client.AddPage( page1 );
  client.AddPage( page2 );
  client.AddPage( page3 );

  ListAction action( client, "collection1", "pillar1", sums.path );
  CPPUNIT_ASSERT_BITST( action.Run() );

  CPPUNIT_ASSERT_EQUAL( Line( md5a, "a" ) + Line( md5b, "b" ) +
                        Line( md5a, "a" ), ReadFile( sums.path ) );
  CPPUNIT_ASSERT( action.GetPageCount() == 3 );
}

//------------------------------------------------------------------------------
// Records outside of the remote prefix are skipped
//------------------------------------------------------------------------------
void ListActionTest::PrefixTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  FakePage           page;
  page.records.push_back( Record( "col/a", md5a, 1000 ) );
  page.records.push_back( Record( "other/b", md5b, 5000 ) );
  page.records.push_back( Record( "col/sub/c", md5c, 2000 ) );
  client.AddPage( page );

  ListAction action( client, "collection1", "pillar1", sums.path );
  action.SetPrefixes( "/data/", "col/" );
  CPPUNIT_ASSERT_BITST( action.Run() );

  CPPUNIT_ASSERT_EQUAL( Line( md5a, "/data/a" ) + Line( md5c, "/data/sub/c" ),
                        ReadFile( sums.path ) );

  //----------------------------------------------------------------------------
  // The skipped record still moves the cursor
  //----------------------------------------------------------------------------
  CPPUNIT_ASSERT( action.GetCursor() == 5000 );
}

//------------------------------------------------------------------------------
// Page processing on its own
//------------------------------------------------------------------------------
void ListActionTest::CursorTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  ListAction         action( client, "collection1", "pillar1", sums.path );
  action.SetPrefixes( "", "col/" );

  SumFileWriter writer;
  CPPUNIT_ASSERT_BITST( writer.Open( sums.path ) );

  std::vector<ChecksumData> records;
  records.push_back( Record( "col/a", md5a, 1000 ) );
  records.push_back( Record( "col/b", md5b, 4000 ) );
  records.push_back( Record( "x/c", md5c, 6000 ) );

  std::set<std::string> lastPage;
  lastPage.insert( "col/b" );
  std::set<std::string> currentPage;
  int64_t               latestDate = 0;

  CPPUNIT_ASSERT_BITST( action.ReportResults( records, lastPage, 500, writer,
                                              currentPage, latestDate ) );
  CPPUNIT_ASSERT( latestDate == 6000 );
  CPPUNIT_ASSERT( currentPage.size() == 1 );
  CPPUNIT_ASSERT( currentPage.count( "col/a" ) );

  //----------------------------------------------------------------------------
  // Older or no records never move the cursor back
  //----------------------------------------------------------------------------
  std::set<std::string> nextPage;
  CPPUNIT_ASSERT_BITST( action.ReportResults( records, currentPage, 9000,
                                              writer, nextPage, latestDate ) );
  CPPUNIT_ASSERT( latestDate == 9000 );
  CPPUNIT_ASSERT( nextPage.size() == 1 );
  CPPUNIT_ASSERT( nextPage.count( "col/b" ) );

  std::set<std::string> emptyPage;
  CPPUNIT_ASSERT_BITST( action.ReportResults( std::vector<ChecksumData>(),
                                              nextPage, 7000, writer,
                                              emptyPage, latestDate ) );
  CPPUNIT_ASSERT( latestDate == 7000 );
  CPPUNIT_ASSERT( emptyPage.empty() );

  CPPUNIT_ASSERT_BITST( writer.Close() );
  CPPUNIT_ASSERT_EQUAL( Line( md5a, "a" ) + Line( md5b, "b" ),
                        ReadFile( sums.path ) );
}

//------------------------------------------------------------------------------
// A failed page ends the run and names the pillar
//------------------------------------------------------------------------------
void ListActionTest::QueryFailureTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );
  FakePage           page1;
  page1.records.push_back( Record( "a", md5a, 1000 ) );
  page1.partial = true;
  FakePage           page2;
  page2.failed = true;
  client.AddPage( page1 );
  client.AddPage( page2 );

  ListAction action( client, "collection1", "pillar1", sums.path );
  Status st = action.Run();
  CPPUNIT_ASSERT( st.IsError() );
  CPPUNIT_ASSERT( st.code == errQueryFailed );
  CPPUNIT_ASSERT_EQUAL( std::string( "Error getting checksumdata from pillar: "
                                     "'pillar1'" ), st.GetErrorMessage() );
  CPPUNIT_ASSERT( client.GetQueries().size() == 2 );
  CPPUNIT_ASSERT( action.GetCursor() == 1000 );

  //----------------------------------------------------------------------------
  // A request that cannot be submitted fails the same way
  //----------------------------------------------------------------------------
  SumFile            sums2;
  FakeChecksumClient client2( "pillar2" );
  FakePage           refused;
  refused.refused = true;
  client2.AddPage( refused );

  ListAction action2( client2, "collection1", "pillar2", sums2.path );
  st = action2.Run();
  CPPUNIT_ASSERT( st.code == errQueryFailed );
  CPPUNIT_ASSERT_EQUAL( std::string( "Error getting checksumdata from pillar: "
                                     "'pillar2'" ), st.GetErrorMessage() );
}

//------------------------------------------------------------------------------
// An existing sum file is never touched
//------------------------------------------------------------------------------
void ListActionTest::ExistingSumFileTest()
{
  SumFile sums;
  {
    std::ofstream out( sums.path.c_str() );
    out << "previous run\n";
  }

  FakeChecksumClient client( "pillar1" );
  FakePage           page;
  page.records.push_back( Record( "a", md5a, 1000 ) );
  client.AddPage( page );

  ListAction action( client, "collection1", "pillar1", sums.path );
  Status st = action.Run();
  CPPUNIT_ASSERT( st.code == errFileExists );
  CPPUNIT_ASSERT( client.GetQueries().empty() );
  CPPUNIT_ASSERT_EQUAL( std::string( "previous run\n" ),
                        ReadFile( sums.path ) );
}

//------------------------------------------------------------------------------
// Missing parameters
//------------------------------------------------------------------------------
void ListActionTest::InvalidArgsTest()
{
  SumFile            sums;
  FakeChecksumClient client( "pillar1" );

  ListAction noCollection( client, "", "pillar1", sums.path );
  CPPUNIT_ASSERT_BITST_CODE( noCollection.Run(), errInvalidArgs );

  ListAction noPillar( client, "collection1", "", sums.path );
  CPPUNIT_ASSERT_BITST_CODE( noPillar.Run(), errInvalidArgs );

  ListAction noSumFile( client, "collection1", "pillar1", "" );
  CPPUNIT_ASSERT_BITST_CODE( noSumFile.Run(), errInvalidArgs );

  ListAction noPageSize( client, "collection1", "pillar1", sums.path );
  noPageSize.SetPageSize( 0 );
  CPPUNIT_ASSERT_BITST_CODE( noPageSize.Run(), errInvalidArgs );

  CPPUNIT_ASSERT( client.GetQueries().empty() );
  CPPUNIT_ASSERT( ::access( sums.path.c_str(), F_OK ) != 0 );
}

//------------------------------------------------------------------------------
// Results of one pillar collected for a waiting caller
//------------------------------------------------------------------------------
void ListActionTest::ChecksumsHandlerTest()
{
  ListChecksumsEventHandler handler( "pillar1" );

  std::shared_ptr<ChecksumResult> other( new ChecksumResult() );
  other->records.push_back( Record( "x1", md5c, 7 ) );
  OperationEvent otherEv( OperationEvent::ComponentComplete, "collection1", "",
                          "pillar2" );
  otherEv.SetChecksums( other );

  std::shared_ptr<ChecksumResult> mine( new ChecksumResult() );
  mine->records.push_back( Record( "f1", md5a, 1 ) );
  mine->records.push_back( Record( "f2", md5b, 2 ) );
  mine->partial = true;
  OperationEvent mineEv( OperationEvent::ComponentComplete, "collection1", "",
                         "pillar1" );
  mineEv.SetChecksums( mine );

  std::thread notifier( [&]()
  {
    handler.HandleEvent( OperationEvent( OperationEvent::RequestSent,
                                         "collection1", "" ) );
    handler.HandleEvent( otherEv );
    handler.HandleEvent( mineEv );
    handler.HandleEvent( OperationEvent( OperationEvent::Complete,
                                         "collection1", "" ) );
  } );

  handler.WaitForFinish();
  notifier.join();

  CPPUNIT_ASSERT( handler.IsFinished() );
  CPPUNIT_ASSERT( !handler.HasFailed() );
  CPPUNIT_ASSERT( handler.PartialResults() );
  std::vector<ChecksumData> records = handler.GetChecksumData();
  CPPUNIT_ASSERT( records.size() == 2 );
  CPPUNIT_ASSERT( records[0].fileID == "f1" );
  CPPUNIT_ASSERT( records[1].calculationTime == 2 );

  //----------------------------------------------------------------------------
  // The failure of the pillar wins over the one of the operation
  //----------------------------------------------------------------------------
  ListChecksumsEventHandler failing( "pillar1" );
  failing.HandleEvent( OperationEvent( OperationEvent::ComponentFailed,
                                       "collection1", "", "pillar2",
                                       "not mine" ) );
  CPPUNIT_ASSERT( !failing.HasFailed() );
  failing.HandleEvent( OperationEvent( OperationEvent::ComponentFailed,
                                       "collection1", "", "pillar1",
                                       "no such collection" ) );
  failing.HandleEvent( OperationEvent( OperationEvent::Failed,
                                       "collection1", "", "",
                                       "operation failed" ) );
  failing.WaitForFinish();
  CPPUNIT_ASSERT( failing.HasFailed() );
  CPPUNIT_ASSERT( !failing.PartialResults() );
  CPPUNIT_ASSERT( failing.GetChecksumData().empty() );
  CPPUNIT_ASSERT_EQUAL( std::string( "no such collection" ),
                        failing.GetFailureInfo() );
}
