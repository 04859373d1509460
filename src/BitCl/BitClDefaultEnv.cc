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

#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"
#include "BitCl/BitClUtils.hh"

#include <map>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{
  //----------------------------------------------------------------------------
  // Topic names as used in the mask expressions
  //----------------------------------------------------------------------------
  struct TopicName
  {
    uint64_t    topic;
    const char *maskName;
    const char *logName;
  };

  TopicName topics[] = {
    { BitCl::AppMsg,          "AppMsg",          "App"          },
    { BitCl::UtilityMsg,      "UtilityMsg",      "Utility"      },
    { BitCl::RegistryMsg,     "RegistryMsg",     "Registry"     },
    { BitCl::TransferMsg,     "TransferMsg",     "Transfer"     },
    { BitCl::ListMsg,         "ListMsg",         "List"         },
    { BitCl::FileExchangeMsg, "FileExchangeMsg", "FileExchange" },
    { BitCl::WorkerPoolMsg,   "WorkerPoolMsg",   "WorkerPool"   },
    { 0, 0, 0 } };

  //----------------------------------------------------------------------------
  // Helper for handling environment variables
  //----------------------------------------------------------------------------
  template<typename Item>
  struct EnvVarHolder
  {
    EnvVarHolder( const std::string &name_, const Item &def_ ):
      name( name_ ), def( def_ ) {}
    std::string name;
    Item        def;
  };

  //----------------------------------------------------------------------------
  // Name of the shell variable overriding the given setting
  //----------------------------------------------------------------------------
  std::string ShellName( const std::string &setting )
  {
    std::string name = "BITCL_" + setting;
    std::transform( name.begin(), name.end(), name.begin(), ::toupper );
    return name;
  }
}

#define REGISTER_VAR_INT( array, name,  def ) \
    array.push_back( EnvVarHolder<int>( name, def ) )

#define REGISTER_VAR_STR( array, name,  def ) \
    array.push_back( EnvVarHolder<std::string>( name, def ) )

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Statics
  //----------------------------------------------------------------------------
  Env *DefaultEnv::sEnv = 0;
  Log *DefaultEnv::sLog = 0;

  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  DefaultEnv::DefaultEnv()
  {
    Log *log = GetLog();

    std::vector<EnvVarHolder<int> >         varsInt;
    std::vector<EnvVarHolder<std::string> > varsStr;
    REGISTER_VAR_INT( varsInt, "PageSize",       DefaultPageSize       );
    REGISTER_VAR_INT( varsInt, "WorkerThreads",  DefaultWorkerThreads  );
    REGISTER_VAR_INT( varsInt, "RetryQueueSize", DefaultRetryQueueSize );

    REGISTER_VAR_STR( varsStr, "ChecksumType",   DefaultChecksumType   );

    //--------------------------------------------------------------------------
    // Process the configuration files, the user file wins
    //--------------------------------------------------------------------------
    std::map<std::string, std::string> config, userConfig;
    Status st = Utils::ProcessConfig( config, DefaultGlobalConfFile );
    if( !st.IsOK() )
      log->Debug( UtilityMsg, "Unable to process global config file: %s",
                  st.ToString().c_str() );

    passwd *pwd = getpwuid( getuid() );
    if( pwd && pwd->pw_dir )
    {
      std::string userConfigFile = pwd->pw_dir;
      userConfigFile += DefaultUserConfFile;
      st = Utils::ProcessConfig( userConfig, userConfigFile );
      if( !st.IsOK() )
        log->Debug( UtilityMsg, "Unable to process user config file: %s",
                    st.ToString().c_str() );
    }

    std::map<std::string, std::string>::iterator it;
    for( it = userConfig.begin(); it != userConfig.end(); ++it )
      config[it->first] = it->second;

    for( it = config.begin(); it != config.end(); ++it )
      log->Debug( UtilityMsg, "[Effective config] \"%s\" = \"%s\"",
                  it->first.c_str(), it->second.c_str() );

    //--------------------------------------------------------------------------
    // Process ints
    //--------------------------------------------------------------------------
    for( size_t i = 0; i < varsInt.size(); ++i )
    {
      PutInt( varsInt[i].name, varsInt[i].def );

      it = config.find( varsInt[i].name );
      if( it != config.end() )
      {
        char *endPtr = 0;
        int value = (int)strtol( it->second.c_str(), &endPtr, 0 );
        if( *endPtr )
          log->Warning( UtilityMsg, "Unable to set %s to %s: not a proper "
                        "integer", varsInt[i].name.c_str(),
                        it->second.c_str() );
        else
          PutInt( varsInt[i].name, value );
      }

      ImportInt( varsInt[i].name, ShellName( varsInt[i].name ) );
    }

    //--------------------------------------------------------------------------
    // Process strings
    //--------------------------------------------------------------------------
    for( size_t i = 0; i < varsStr.size(); ++i )
    {
      PutString( varsStr[i].name, varsStr[i].def );

      it = config.find( varsStr[i].name );
      if( it != config.end() )
        PutString( varsStr[i].name, it->second );

      ImportString( varsStr[i].name, ShellName( varsStr[i].name ) );
    }
  }

  //----------------------------------------------------------------------------
  // Get default client environment
  //----------------------------------------------------------------------------
  Env *DefaultEnv::GetEnv()
  {
    return sEnv;
  }

  //----------------------------------------------------------------------------
  // Get default log
  //----------------------------------------------------------------------------
  Log *DefaultEnv::GetLog()
  {
    return sLog;
  }

  //----------------------------------------------------------------------------
  // Set log level
  //----------------------------------------------------------------------------
  void DefaultEnv::SetLogLevel( const std::string &level )
  {
    Log *log = GetLog();
    if( !log->SetLevel( level ) )
      log->Error( UtilityMsg, "Unknown log level: %s", level.c_str() );
  }

  //----------------------------------------------------------------------------
  // Set log file
  //----------------------------------------------------------------------------
  bool DefaultEnv::SetLogFile( const std::string &filepath )
  {
    LogOutFile *out = new LogOutFile();
    if( out->Open( filepath ) )
    {
      GetLog()->SetOutput( out );
      return true;
    }
    delete out;
    return false;
  }

  //----------------------------------------------------------------------------
  // Set log mask
  //----------------------------------------------------------------------------
  void DefaultEnv::SetLogMask( const std::string &level,
                               const std::string &mask )
  {
    Log *log = GetLog();
    uint64_t topicMask = TranslateMask( mask );

    if( level == "All" )
    {
      log->SetMask( Log::ErrorMsg,   topicMask );
      log->SetMask( Log::WarningMsg, topicMask );
      log->SetMask( Log::InfoMsg,    topicMask );
      log->SetMask( Log::DebugMsg,   topicMask );
      log->SetMask( Log::DumpMsg,    topicMask );
      return;
    }

    if( !log->SetMask( level, topicMask ) )
      log->Error( UtilityMsg, "Unknown log level for the mask: %s",
                  level.c_str() );
  }

  //----------------------------------------------------------------------------
  // Translate the mask
  //----------------------------------------------------------------------------
  uint64_t DefaultEnv::TranslateMask( const std::string &mask )
  {
    if( mask.empty() )
      return 0xffffffffffffffffULL;

    std::vector<std::string>           elements;
    std::vector<std::string>::iterator it;
    Utils::splitString( elements, mask, "|" );

    uint64_t resultMask = 0;
    for( it = elements.begin(); it != elements.end(); ++it )
    {
      if( *it == "All" )
      {
        resultMask = 0xffffffffffffffffULL;
        continue;
      }

      if( *it == "None" )
      {
        resultMask = 0ULL;
        continue;
      }

      std::string topic   = *it;
      bool        disable = false;
      if( !topic.empty() && topic[0] == '^' )
      {
        disable = true;
        topic.erase( 0, 1 );
      }

      for( int i = 0; topics[i].maskName != 0; ++i )
      {
        if( topic != topics[i].maskName )
          continue;
        if( disable )
          resultMask &= ~topics[i].topic;
        else
          resultMask |= topics[i].topic;
      }
    }
    return resultMask;
  }

  //----------------------------------------------------------------------------
  // Initialize the environment
  //----------------------------------------------------------------------------
  void DefaultEnv::Initialize()
  {
    sLog = new Log();
    SetUpLog();
    sEnv = new DefaultEnv();
  }

  //----------------------------------------------------------------------------
  // Finalize the environment
  //----------------------------------------------------------------------------
  void DefaultEnv::Finalize()
  {
    delete sEnv;
    sEnv = 0;
    delete sLog;
    sLog = 0;
  }

  //----------------------------------------------------------------------------
  // Set up the log
  //----------------------------------------------------------------------------
  void DefaultEnv::SetUpLog()
  {
    Log *log = GetLog();

    char *level = getenv( "BITCL_LOGLEVEL" );
    if( level )
      SetLogLevel( level );

    char *file = getenv( "BITCL_LOGFILE" );
    if( file )
      SetLogFile( file );

    log->SetMask( Log::DumpMsg, TranslateMask( "All|^UtilityMsg" ) );

    char *logMask = getenv( "BITCL_LOGMASK" );
    if( logMask )
      SetLogMask( "All", logMask );

    const char *levels[] = { "Error", "Warning", "Info", "Debug", "Dump", 0 };
    for( int i = 0; levels[i] != 0; ++i )
    {
      std::string name = "BITCL_LOGMASK_" + std::string( levels[i] );
      std::transform( name.begin(), name.end(), name.begin(), ::toupper );
      logMask = getenv( name.c_str() );
      if( logMask )
        SetLogMask( levels[i], logMask );
    }

    for( int i = 0; topics[i].logName != 0; ++i )
      log->SetTopicName( topics[i].topic, topics[i].logName );
  }
}

//------------------------------------------------------------------------------
// Static initialization and finalization
//------------------------------------------------------------------------------
namespace
{
  static struct EnvInitializer
  {
    EnvInitializer()
    {
      BitCl::DefaultEnv::Initialize();
    }

    ~EnvInitializer()
    {
      BitCl::DefaultEnv::Finalize();
    }
  } initializer;
}
