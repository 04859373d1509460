//------------------------------------------------------------------------------
// Copyright (c) 2024 by the BitCl developers
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include "TestEnv.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClLog.hh"

#include <cstdlib>
#include <sstream>
#include <atomic>
#include <unistd.h>

std::mutex  TestEnv::sEnvMutex;
BitCl::Env *TestEnv::sEnv = 0;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
TestEnv::TestEnv()
{
  PutString( "TmpDir", "/tmp" );
  ImportString( "TmpDir", "BITCL_TEST_TMPDIR" );
}

//------------------------------------------------------------------------------
// Get default test environment
//------------------------------------------------------------------------------
BitCl::Env *TestEnv::GetEnv()
{
  std::unique_lock<std::mutex> lck( sEnvMutex );
  if( !sEnv )
    sEnv = new TestEnv();
  return sEnv;
}

//------------------------------------------------------------------------------
// Unique scratch path, the pid keeps concurrent runs apart
//------------------------------------------------------------------------------
std::string TestEnv::GetTempPath( const std::string &name )
{
  static std::atomic<int> counter( 0 );
  std::string tmpDir = "/tmp";
  GetEnv()->GetString( "TmpDir", tmpDir );

  std::ostringstream o;
  o << tmpDir << "/bitcl-test-" << ::getpid() << "-" << counter++ << "-";
  o << name;
  std::string path = o.str();
  ::unlink( path.c_str() );
  return path;
}

//------------------------------------------------------------------------------
// Release the environment
//------------------------------------------------------------------------------
void TestEnv::Release()
{
  std::unique_lock<std::mutex> lck( sEnvMutex );
  delete sEnv;
  sEnv = 0;
}

//------------------------------------------------------------------------------
// Finalizer
//------------------------------------------------------------------------------
namespace
{
  static struct EnvInitializer
  {
    //--------------------------------------------------------------------------
    // Initializer
    //--------------------------------------------------------------------------
    EnvInitializer()
    {
      char *level = getenv( "BITCL_TEST_LOGLEVEL" );
      if( level )
        BitCl::DefaultEnv::SetLogLevel( level );
    }

    //--------------------------------------------------------------------------
    // Finalizer
    //--------------------------------------------------------------------------
    ~EnvInitializer()
    {
      TestEnv::Release();
    }
  } initializer;
}
