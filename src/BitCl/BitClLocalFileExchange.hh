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

#ifndef __BIT_CL_LOCAL_FILE_EXCHANGE_HH__
#define __BIT_CL_LOCAL_FILE_EXCHANGE_HH__

#include "BitCl/BitClFileExchange.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! File exchange through the local file system, serves file:// locators
  //----------------------------------------------------------------------------
  class LocalFileExchange: public FileExchange
  {
    public:
      LocalFileExchange() {}
      virtual ~LocalFileExchange() {}

      //------------------------------------------------------------------------
      //! Copy the local file into the output
      //------------------------------------------------------------------------
      virtual Status GetFile( std::ostream &out, const URL &url );

      //------------------------------------------------------------------------
      //! Unlink the local file
      //------------------------------------------------------------------------
      virtual Status DeleteFile( const URL &url );

    private:
      static Status CheckURL( const URL &url );
  };
}

#endif // __BIT_CL_LOCAL_FILE_EXCHANGE_HH__
