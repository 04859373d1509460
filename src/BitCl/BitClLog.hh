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

#ifndef __BIT_CL_LOG_HH__
#define __BIT_CL_LOG_HH__

#include <cstdarg>
#include <cstdint>
#include <string>
#include <map>
#include <mutex>
#include <atomic>
#include <memory>

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Interface for logger outputs
  //----------------------------------------------------------------------------
  class LogOut
  {
    public:
      virtual ~LogOut() {}

      //------------------------------------------------------------------------
      //! Write a formatted block of lines, calls are serialized by the log
      //------------------------------------------------------------------------
      virtual void Write( const std::string &message ) = 0;
  };

  //----------------------------------------------------------------------------
  //! Append log messages to a file
  //----------------------------------------------------------------------------
  class LogOutFile: public LogOut
  {
    public:
      LogOutFile(): pFileDes( -1 ) {}
      virtual ~LogOutFile() { Close(); }

      bool Open( const std::string &fileName );
      void Close();
      virtual void Write( const std::string &message );

    private:
      LogOutFile( const LogOutFile &other );
      LogOutFile &operator = ( const LogOutFile &other );

      int pFileDes;
  };

  //----------------------------------------------------------------------------
  //! Write log messages to stderr
  //----------------------------------------------------------------------------
  class LogOutCerr: public LogOut
  {
    public:
      virtual void Write( const std::string &message );
  };

  //----------------------------------------------------------------------------
  //! Topic and level filtered diagnostics
  //----------------------------------------------------------------------------
  class Log
  {
    public:
      enum LogLevel
      {
        NoMsg       = 0,  //!< report nothing
        ErrorMsg    = 1,  //!< report errors
        WarningMsg  = 2,  //!< report warnings
        InfoMsg     = 3,  //!< print info
        DebugMsg    = 4,  //!< print debug info
        DumpMsg     = 5   //!< print the events and the records
      };

      Log();

      void Error( uint64_t topic, const char *format, ... )
      {
        if( !IsEnabled( ErrorMsg, topic ) )
          return;
        va_list argList;
        va_start( argList, format );
        Say( ErrorMsg, topic, format, argList );
        va_end( argList );
      }

      void Warning( uint64_t topic, const char *format, ... )
      {
        if( !IsEnabled( WarningMsg, topic ) )
          return;
        va_list argList;
        va_start( argList, format );
        Say( WarningMsg, topic, format, argList );
        va_end( argList );
      }

      void Info( uint64_t topic, const char *format, ... )
      {
        if( !IsEnabled( InfoMsg, topic ) )
          return;
        va_list argList;
        va_start( argList, format );
        Say( InfoMsg, topic, format, argList );
        va_end( argList );
      }

      void Debug( uint64_t topic, const char *format, ... )
      {
        if( !IsEnabled( DebugMsg, topic ) )
          return;
        va_list argList;
        va_start( argList, format );
        Say( DebugMsg, topic, format, argList );
        va_end( argList );
      }

      void Dump( uint64_t topic, const char *format, ... )
      {
        if( !IsEnabled( DumpMsg, topic ) )
          return;
        va_list argList;
        va_start( argList, format );
        Say( DumpMsg, topic, format, argList );
        va_end( argList );
      }

      //------------------------------------------------------------------------
      //! Print the message regardless of the level and the masks, every line
      //! of it gets the timestamp, level and topic prefix
      //------------------------------------------------------------------------
      void Say( LogLevel level, uint64_t topic, const char *format,
                va_list list );

      void SetLevel( LogLevel level )
      {
        pLevel.store( level, std::memory_order_relaxed );
      }

      //------------------------------------------------------------------------
      //! Set the level by name: Error, Warning, Info, Debug or Dump
      //!
      //! @return false if the name is unknown, the level is unchanged then
      //------------------------------------------------------------------------
      bool SetLevel( const std::string &level );

      //------------------------------------------------------------------------
      //! Replace the output, the log takes the ownership
      //------------------------------------------------------------------------
      void SetOutput( LogOut *output );

      //------------------------------------------------------------------------
      //! Topics printed at the given level
      //------------------------------------------------------------------------
      void SetMask( LogLevel level, uint64_t mask )
      {
        pMask[level].store( mask, std::memory_order_relaxed );
      }

      bool SetMask( const std::string &level, uint64_t mask );

      void SetTopicName( uint64_t topic, const std::string &name );

      LogLevel GetLevel() const
      {
        return pLevel.load( std::memory_order_relaxed );
      }

    private:
      Log( const Log &other );
      Log &operator = ( const Log &other );

      bool IsEnabled( LogLevel level, uint64_t topic ) const
      {
        return GetLevel() >= level &&
               ( topic & pMask[level].load( std::memory_order_relaxed ) );
      }

      static const char *LevelName( LogLevel level );
      static bool ParseLevel( const std::string &name, LogLevel &level );
      std::string TopicName( uint64_t topic );

      typedef std::map<uint64_t, std::string> TopicMap;

      std::atomic<LogLevel>    pLevel;
      std::atomic<uint64_t>    pMask[DumpMsg+1];
      std::unique_ptr<LogOut>  pOutput;
      std::mutex               pMutex;
      TopicMap                 pTopicMap;
      size_t                   pTopicWidth;
  };
}

#endif // __BIT_CL_LOG_HH__
