//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitBitHelpers.hh"
#include "TestEnv.hh"

#include "BitCl/BitClSumFileWriter.hh"

#include <fstream>
#include <sstream>
#include <unistd.h>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class SumFileWriterTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( SumFileWriterTest );
      CPPUNIT_TEST( WriteTest );
      CPPUNIT_TEST( ExistingFileTest );
      CPPUNIT_TEST( ScopeTest );
      CPPUNIT_TEST( LargeFileTest );
    CPPUNIT_TEST_SUITE_END();
    void WriteTest();
    void ExistingFileTest();
    void ScopeTest();
    void LargeFileTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( SumFileWriterTest );

namespace
{
  std::string ReadFile( const std::string &path )
  {
    std::ifstream in( path.c_str() );
    std::ostringstream o;
    o << in.rdbuf();
    return o.str();
  }
}

using namespace BitCl;

//------------------------------------------------------------------------------
// md5sum format, nothing hits the disk before the close
//------------------------------------------------------------------------------
void SumFileWriterTest::WriteTest()
{
  std::string   path = TestEnv::GetTempPath( "write.md5" );
  SumFileWriter writer;
  CPPUNIT_ASSERT( !writer.IsOpen() );
  CPPUNIT_ASSERT_BITST_CODE( writer.WriteLine( "/data/f1", "00" ),
                             errUninitialized );

  CPPUNIT_ASSERT_BITST( writer.Open( path ) );
  CPPUNIT_ASSERT( writer.IsOpen() );
  CPPUNIT_ASSERT( writer.GetPath() == path );
  CPPUNIT_ASSERT_BITST_CODE( writer.Open( path ), errInvalidOp );

  CPPUNIT_ASSERT_BITST( writer.WriteLine( "/data/f1",
                                          "d41d8cd98f00b204e9800998ecf8427e" ) );
  CPPUNIT_ASSERT_BITST( writer.WriteLine( "/data/dir with space/f2",
                                          "0cc175b9c0f1b6a831c399e269772661" ) );
  CPPUNIT_ASSERT( writer.GetLineCount() == 2 );
  CPPUNIT_ASSERT( ReadFile( path ).empty() );

  CPPUNIT_ASSERT_BITST( writer.Close() );
  CPPUNIT_ASSERT( !writer.IsOpen() );
  CPPUNIT_ASSERT_EQUAL( std::string(
                          "d41d8cd98f00b204e9800998ecf8427e  /data/f1\n"
                          "0cc175b9c0f1b6a831c399e269772661  "
                          "/data/dir with space/f2\n" ),
                        ReadFile( path ) );
  CPPUNIT_ASSERT_BITST_CODE( writer.Close(), errUninitialized );
  ::unlink( path.c_str() );
}

//------------------------------------------------------------------------------
// Never overwrite
//------------------------------------------------------------------------------
void SumFileWriterTest::ExistingFileTest()
{
  std::string path = TestEnv::GetTempPath( "existing.md5" );
  {
    std::ofstream out( path.c_str() );
    out << "old content\n";
  }

  SumFileWriter writer;
  Status st = writer.Open( path );
  CPPUNIT_ASSERT( st.IsError() );
  CPPUNIT_ASSERT( st.code == errFileExists );
  CPPUNIT_ASSERT( !writer.IsOpen() );
  CPPUNIT_ASSERT( ReadFile( path ) == "old content\n" );

  CPPUNIT_ASSERT_BITST_CODE( writer.Open( "" ), errInvalidArgs );
  CPPUNIT_ASSERT_BITST_CODE( writer.Open( "/nonexistent-dir/sums.md5" ),
                             errOSError );
  ::unlink( path.c_str() );
}

//------------------------------------------------------------------------------
// The buffered lines survive leaving the scope without a close
//------------------------------------------------------------------------------
void SumFileWriterTest::ScopeTest()
{
  std::string path = TestEnv::GetTempPath( "scope.md5" );
  {
    SumFileWriter writer;
    CPPUNIT_ASSERT_BITST( writer.Open( path ) );
    CPPUNIT_ASSERT_BITST( writer.WriteLine( "f1", "aa" ) );
  }
  CPPUNIT_ASSERT_EQUAL( std::string( "aa  f1\n" ), ReadFile( path ) );
  ::unlink( path.c_str() );
}

//------------------------------------------------------------------------------
// More lines than fit in the buffer
//------------------------------------------------------------------------------
void SumFileWriterTest::LargeFileTest()
{
  std::string   path = TestEnv::GetTempPath( "large.md5" );
  std::string   expected;
  SumFileWriter writer;
  CPPUNIT_ASSERT_BITST( writer.Open( path ) );
  for( int i = 0; i < 5000; ++i )
  {
    std::ostringstream o;
    o << "/data/file-" << i;
    CPPUNIT_ASSERT_BITST( writer.WriteLine( o.str(),
                                            "d41d8cd98f00b204e9800998ecf8427e" ) );
    expected += "d41d8cd98f00b204e9800998ecf8427e  " + o.str() + "\n";
  }
  CPPUNIT_ASSERT( !ReadFile( path ).empty() );
  CPPUNIT_ASSERT_BITST( writer.Close() );
  CPPUNIT_ASSERT( ReadFile( path ) == expected );
  ::unlink( path.c_str() );
}
