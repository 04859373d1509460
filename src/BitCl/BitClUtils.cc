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

#include "BitCl/BitClUtils.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <unistd.h>

namespace
{
  bool isNotSpace( char c )
  {
    return c != ' ';
  }

  int HexValue( char c )
  {
    if( c >= '0' && c <= '9' ) return c - '0';
    if( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
    if( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
    return -1;
  }
}

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Convert timestamp to a string
  //----------------------------------------------------------------------------
  std::string Utils::TimeToString( int64_t timestampMs )
  {
    char   now[30];
    char   result[40];
    tm     tsNow;
    time_t ttNow = timestampMs / 1000;
    localtime_r( &ttNow, &tsNow );
    strftime( now, 30, "%Y-%m-%d %H:%M:%S", &tsNow );
    snprintf( result, 40, "%s.%03d", now, (int)( timestampMs % 1000 ) );
    return result;
  }

  //----------------------------------------------------------------------------
  // Print a char array as hex
  //----------------------------------------------------------------------------
  std::string Utils::Char2Hex( const uint8_t *array, size_t size )
  {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve( 2*size );
    for( size_t i = 0; i < size; ++i )
    {
      result += digits[array[i] >> 4];
      result += digits[array[i] & 0x0f];
    }
    return result;
  }

  //----------------------------------------------------------------------------
  // Convert hex to a byte array
  //----------------------------------------------------------------------------
  Status Utils::Hex2Char( std::vector<uint8_t> &result,
                          const std::string    &hex )
  {
    result.clear();
    if( hex.length() % 2 )
      return Status( stError, errDataError, 0, "odd number of hex digits" );

    result.reserve( hex.length() / 2 );
    for( size_t i = 0; i < hex.length(); i += 2 )
    {
      int hi = HexValue( hex[i] );
      int lo = HexValue( hex[i+1] );
      if( hi < 0 || lo < 0 )
      {
        result.clear();
        return Status( stError, errDataError, 0, "not a hex string: " + hex );
      }
      result.push_back( (uint8_t)( (hi << 4) | lo ) );
    }
    return Status();
  }

  //----------------------------------------------------------------------------
  // Process a config file and return key-value pairs
  //----------------------------------------------------------------------------
  Status Utils::ProcessConfig( std::map<std::string, std::string> &config,
                               const std::string                  &file )
  {
    config.clear();
    std::ifstream inFile( file.c_str() );
    if( !inFile.good() )
      return Status( stError, errOSError, errno );

    errno = 0;
    std::string line;
    while( std::getline( inFile, line ) )
    {
      if( line.empty() || line[0] == '#' )
        continue;

      std::vector<std::string> elems;
      splitString( elems, line, "=" );
      if( elems.size() != 2 )
        return Status( stError, errConfig, 0, "malformed line: " + line );
      std::string key   = elems[0]; Trim( key );
      std::string value = elems[1]; Trim( value );
      config[key] = value;
    }

    if( inFile.bad() )
      return Status( stError, errOSError, errno );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Trim a string
  //----------------------------------------------------------------------------
  void Utils::Trim( std::string &str )
  {
    str.erase( str.begin(),
               std::find_if( str.begin(), str.end(), isNotSpace ) );
    str.erase( std::find_if( str.rbegin(), str.rend(), isNotSpace ).base(),
               str.end() );
  }

  //----------------------------------------------------------------------------
  // Close the descriptor
  //----------------------------------------------------------------------------
  ScopedDescriptor::~ScopedDescriptor()
  {
    if( pDescriptor >= 0 )
      close( pDescriptor );
  }
}
