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

#include "BitCl/BitClLocalFileExchange.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"
#include "BitCl/BitClUtils.hh"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Copy the file into the stream
  //----------------------------------------------------------------------------
  Status LocalFileExchange::GetFile( std::ostream &out, const URL &url )
  {
    Log *log = DefaultEnv::GetLog();
    Status st = CheckURL( url );
    if( !st.IsOK() )
      return st;

    const std::string &path = url.GetPath();
    log->Debug( FileExchangeMsg, "Fetching %s", path.c_str() );

    int fd = ::open( path.c_str(), O_RDONLY );
    if( fd == -1 )
    {
      int err = errno;
      log->Error( FileExchangeMsg, "Unable to open %s: %s", path.c_str(),
                  ::strerror( err ) );
      return Status( stError, errOSError, err, path );
    }
    ScopedDescriptor desc( fd );

    char     buffer[32*1024];
    uint64_t total = 0;
    while( true )
    {
      ssize_t ret = ::read( desc.GetDescriptor(), buffer, sizeof( buffer ) );
      if( ret == 0 )
        break;
      if( ret < 0 )
      {
        int err = errno;
        if( err == EINTR )
          continue;
        log->Error( FileExchangeMsg, "Unable to read %s: %s", path.c_str(),
                    ::strerror( err ) );
        return Status( stError, errOSError, err, path );
      }

      out.write( buffer, ret );
      if( !out )
      {
        log->Error( FileExchangeMsg, "Unable to write the content of %s to "
                    "the output stream", path.c_str() );
        return Status( stError, errOSError, 0, path );
      }
      total += ret;
    }

    out.flush();
    if( !out )
      return Status( stError, errOSError, 0, path );

    log->Debug( FileExchangeMsg, "Fetched %llu bytes from %s",
                (unsigned long long)total, path.c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Unlink the file
  //----------------------------------------------------------------------------
  Status LocalFileExchange::DeleteFile( const URL &url )
  {
    Log *log = DefaultEnv::GetLog();
    Status st = CheckURL( url );
    if( !st.IsOK() )
      return st;

    const std::string &path = url.GetPath();
    if( ::unlink( path.c_str() ) != 0 )
    {
      int err = errno;
      log->Warning( FileExchangeMsg, "Unable to delete %s: %s", path.c_str(),
                    ::strerror( err ) );
      return Status( stError, errOSError, err, path );
    }

    log->Debug( FileExchangeMsg, "Deleted %s", path.c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Only local files are served
  //----------------------------------------------------------------------------
  Status LocalFileExchange::CheckURL( const URL &url )
  {
    if( !url.IsValid() )
      return Status( stError, errInvalidURL, 0, url.GetURL() );

    if( !url.IsLocalFile() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Error( FileExchangeMsg, "Protocol %s is not supported: %s",
                  url.GetProtocol().c_str(), url.GetURL().c_str() );
      return Status( stError, errNotSupported, 0, url.GetURL() );
    }
    return Status();
  }
}
