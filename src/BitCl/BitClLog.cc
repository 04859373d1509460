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

#include "BitCl/BitClLog.hh"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/time.h>

namespace
{
  //----------------------------------------------------------------------------
  // Local time with microseconds and the zone offset
  //----------------------------------------------------------------------------
  std::string Timestamp()
  {
    timeval now;
    tm      local;
    gettimeofday( &now, 0 );
    localtime_r( &now.tv_sec, &local );

    char date[32];
    char zone[8];
    strftime( date, sizeof( date ), "%Y-%m-%d %H:%M:%S", &local );
    strftime( zone, sizeof( zone ), "%z", &local );

    char buffer[64];
    snprintf( buffer, sizeof( buffer ), "%s.%06ld %s", date,
              (long)now.tv_usec, zone );
    return buffer;
  }
}

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Open the file for appending
  //----------------------------------------------------------------------------
  bool LogOutFile::Open( const std::string &fileName )
  {
    Close();
    int fd = ::open( fileName.c_str(), O_WRONLY | O_APPEND | O_CREAT,
                     S_IRUSR | S_IWUSR );
    if( fd < 0 )
    {
      int err = errno;
      std::cerr << "Unable to open the log file " << fileName << ": ";
      std::cerr << ::strerror( err ) << std::endl;
      return false;
    }
    pFileDes = fd;
    return true;
  }

  void LogOutFile::Close()
  {
    if( pFileDes == -1 )
      return;
    ::close( pFileDes );
    pFileDes = -1;
  }

  //----------------------------------------------------------------------------
  // Write everything, a failure goes to stderr
  //----------------------------------------------------------------------------
  void LogOutFile::Write( const std::string &message )
  {
    if( pFileDes == -1 )
    {
      std::cerr << message;
      return;
    }

    size_t done = 0;
    while( done < message.size() )
    {
      ssize_t ret = ::write( pFileDes, message.data() + done,
                             message.size() - done );
      if( ret < 0 )
      {
        int err = errno;
        if( err == EINTR )
          continue;
        std::cerr << "Unable to write to the log file: " << ::strerror( err );
        std::cerr << std::endl;
        return;
      }
      done += ret;
    }
  }

  void LogOutCerr::Write( const std::string &message )
  {
    std::cerr << message << std::flush;
  }

  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  Log::Log():
    pLevel( NoMsg ),
    pOutput( new LogOutCerr() ),
    pTopicWidth( 0 )
  {
    for( int i = 0; i <= DumpMsg; ++i )
      pMask[i].store( ~0ULL );
  }

  //----------------------------------------------------------------------------
  // Format and write the message
  //----------------------------------------------------------------------------
  void Log::Say( LogLevel    level,
                 uint64_t    topic,
                 const char *format,
                 va_list     list )
  {
    va_list cp;
    va_copy( cp, list );
    int len = vsnprintf( 0, 0, format, cp );
    va_end( cp );

    std::string text;
    if( len < 0 )
      text = std::string( "Unable to format the log message: " ) + format;
    else
    {
      std::vector<char> buffer( len + 1 );
      va_copy( cp, list );
      vsnprintf( buffer.data(), buffer.size(), format, cp );
      va_end( cp );
      text.assign( buffer.data(), len );
    }

    std::string        now = Timestamp();
    std::unique_lock<std::mutex> lck( pMutex );
    std::string        topicName = TopicName( topic );
    std::istringstream lines( text );
    std::ostringstream out;
    std::string        line;
    while( std::getline( lines, line ) )
    {
      out << "[" << now << "][" << std::left << std::setw( 7 );
      out << LevelName( level ) << "][" << std::setw( pTopicWidth );
      out << topicName << "] " << line << "\n";
    }
    pOutput->Write( out.str() );
  }

  bool Log::SetLevel( const std::string &level )
  {
    LogLevel lvl;
    if( !ParseLevel( level, lvl ) )
      return false;
    SetLevel( lvl );
    return true;
  }

  void Log::SetOutput( LogOut *output )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    pOutput.reset( output );
  }

  bool Log::SetMask( const std::string &level, uint64_t mask )
  {
    LogLevel lvl;
    if( !ParseLevel( level, lvl ) )
      return false;
    SetMask( lvl, mask );
    return true;
  }

  //----------------------------------------------------------------------------
  // Name a topic, all the names are padded to the longest one
  //----------------------------------------------------------------------------
  void Log::SetTopicName( uint64_t topic, const std::string &name )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    pTopicMap[topic] = name;
    if( name.length() > pTopicWidth )
      pTopicWidth = name.length();
  }

  const char *Log::LevelName( LogLevel level )
  {
    switch( level )
    {
      case ErrorMsg:   return "Error";
      case WarningMsg: return "Warning";
      case InfoMsg:    return "Info";
      case DebugMsg:   return "Debug";
      case DumpMsg:    return "Dump";
      default:         return "Unknown";
    }
  }

  bool Log::ParseLevel( const std::string &name, LogLevel &level )
  {
    for( int i = ErrorMsg; i <= DumpMsg; ++i )
    {
      if( name == LevelName( (LogLevel)i ) )
      {
        level = (LogLevel)i;
        return true;
      }
    }
    return false;
  }

  //----------------------------------------------------------------------------
  // Topic name or its hex value, the mutex needs to be locked
  //----------------------------------------------------------------------------
  std::string Log::TopicName( uint64_t topic )
  {
    TopicMap::const_iterator it = pTopicMap.find( topic );
    if( it != pTopicMap.end() )
      return it->second;
    std::ostringstream o;
    o << "0x" << std::hex << std::setw( 8 ) << std::setfill( '0' ) << topic;
    return o.str();
  }
}
