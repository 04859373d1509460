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

#ifndef __BIT_CL_UTILS_HH__
#define __BIT_CL_UTILS_HH__

#include <string>
#include <map>
#include <vector>
#include <stdint.h>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Random utilities
  //----------------------------------------------------------------------------
  class Utils
  {
    public:
      //------------------------------------------------------------------------
      //! Split a string, empty elements are skipped
      //------------------------------------------------------------------------
      template<class Container>
      static void splitString( Container         &result,
                               const std::string &input,
                               const std::string &delimiter )
      {
        size_t start  = 0;
        size_t end    = 0;
        size_t length = 0;

        do
        {
          end = input.find( delimiter, start );

          if( end != std::string::npos )
            length = end - start;
          else
            length = input.length() - start;

          if( length )
            result.push_back( input.substr( start, length ) );

          start = end + delimiter.size();
        }
        while( end != std::string::npos );
      }

      //------------------------------------------------------------------------
      //! Convert a millisecond timestamp to a human readable string
      //------------------------------------------------------------------------
      static std::string TimeToString( int64_t timestampMs );

      //------------------------------------------------------------------------
      //! Print a byte array as lower case hex
      //------------------------------------------------------------------------
      static std::string Char2Hex( const uint8_t *array, size_t size );

      //------------------------------------------------------------------------
      //! Convert a hex string back to bytes
      //!
      //! @return errDataError if the string is not valid hex
      //------------------------------------------------------------------------
      static Status Hex2Char( std::vector<uint8_t> &result,
                              const std::string    &hex );

      //------------------------------------------------------------------------
      //! Process a config file and return key-value pairs
      //------------------------------------------------------------------------
      static Status ProcessConfig( std::map<std::string, std::string> &config,
                                   const std::string                  &file );

      //------------------------------------------------------------------------
      //! Trim a string
      //------------------------------------------------------------------------
      static void Trim( std::string &str );

      //------------------------------------------------------------------------
      //! Check whether a string starts with the given prefix
      //------------------------------------------------------------------------
      static bool StartsWith( const std::string &str,
                              const std::string &prefix )
      {
        return str.compare( 0, prefix.length(), prefix ) == 0;
      }
  };

  //----------------------------------------------------------------------------
  //! Close a file descriptor when going out of scope
  //----------------------------------------------------------------------------
  class ScopedDescriptor
  {
    public:
      ScopedDescriptor( int descriptor ): pDescriptor( descriptor ) {}

      ~ScopedDescriptor();

      //------------------------------------------------------------------------
      //! Release the descriptor being held
      //------------------------------------------------------------------------
      int Release()
      {
        int desc = pDescriptor;
        pDescriptor = -1;
        return desc;
      }

      //------------------------------------------------------------------------
      //! Get the descriptor
      //------------------------------------------------------------------------
      int GetDescriptor()
      {
        return pDescriptor;
      }

    private:
      int pDescriptor;
  };
}

#endif // __BIT_CL_UTILS_HH__
