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

#include "BitCl/BitClSumFileWriter.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace BitCl
{
  SumFileWriter::SumFileWriter():
    pFD( -1 ),
    pLines( 0 )
  {
  }

  SumFileWriter::~SumFileWriter()
  {
    if( !IsOpen() )
      return;

    Status st = Close();
    if( !st.IsOK() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Error( ListMsg, "Unable to close the sum file %s: %s",
                  pPath.c_str(), st.ToStr().c_str() );
    }
  }

  //----------------------------------------------------------------------------
  // Create the file
  //----------------------------------------------------------------------------
  Status SumFileWriter::Open( const std::string &path )
  {
    Log *log = DefaultEnv::GetLog();
    if( IsOpen() )
      return Status( stError, errInvalidOp, 0, "already open: " + pPath );

    if( path.empty() )
      return Status( stError, errInvalidArgs, 0, "no sum file given" );

    //--------------------------------------------------------------------------
    // O_EXCL makes the check atomic, the stat just gives a clearer message
    //--------------------------------------------------------------------------
    struct stat st;
    if( ::stat( path.c_str(), &st ) == 0 )
    {
      log->Error( ListMsg, "The sum file %s already exists", path.c_str() );
      return Status( stError, errFileExists, EEXIST, path );
    }

    int fd = ::open( path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644 );
    if( fd == -1 )
    {
      int err = errno;
      log->Error( ListMsg, "Unable to create the sum file %s: %s",
                  path.c_str(), ::strerror( err ) );
      if( err == EEXIST )
        return Status( stError, errFileExists, err, path );
      return Status( stError, errOSError, err, path );
    }

    pFD    = fd;
    pPath  = path;
    pLines = 0;
    pBuffer.clear();
    log->Debug( ListMsg, "Opened the sum file %s", path.c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Add a line
  //----------------------------------------------------------------------------
  Status SumFileWriter::WriteLine( const std::string &path,
                                   const std::string &checksum )
  {
    if( !IsOpen() )
      return Status( stError, errUninitialized, 0, "sum file not open" );

    pBuffer += checksum;
    pBuffer += SumFileFieldSeparator;
    pBuffer += path;
    pBuffer += '\n';
    ++pLines;

    if( pBuffer.size() >= BufferSize )
      return Flush();
    return Status();
  }

  //----------------------------------------------------------------------------
  // Close the file
  //----------------------------------------------------------------------------
  Status SumFileWriter::Close()
  {
    if( !IsOpen() )
      return Status( stError, errUninitialized, 0, "sum file not open" );

    Log *log = DefaultEnv::GetLog();
    Status st = Flush();

    if( ::close( pFD ) != 0 && st.IsOK() )
      st = Status( stError, errOSError, errno, pPath );
    pFD = -1;

    log->Debug( ListMsg, "Closed the sum file %s, %llu lines", pPath.c_str(),
                (unsigned long long)pLines );
    return st;
  }

  //----------------------------------------------------------------------------
  // Write the buffer out
  //----------------------------------------------------------------------------
  Status SumFileWriter::Flush()
  {
    size_t done = 0;
    while( done < pBuffer.size() )
    {
      ssize_t ret = ::write( pFD, pBuffer.data() + done, pBuffer.size() - done );
      if( ret < 0 )
      {
        if( errno == EINTR )
          continue;
        int err = errno;
        Log *log = DefaultEnv::GetLog();
        log->Error( ListMsg, "Unable to write to the sum file %s: %s",
                    pPath.c_str(), ::strerror( err ) );
        pBuffer.erase( 0, done );
        return Status( stError, errOSError, err, pPath );
      }
      done += ret;
    }
    pBuffer.clear();
    return Status();
  }
}
