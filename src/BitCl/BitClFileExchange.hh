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

#ifndef __BIT_CL_FILE_EXCHANGE_HH__
#define __BIT_CL_FILE_EXCHANGE_HH__

#include <ostream>

#include "BitCl/BitClURL.hh"
#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Access to the temporary copies of files exchanged with the remote side
  //----------------------------------------------------------------------------
  class FileExchange
  {
    public:
      virtual ~FileExchange() {}

      //------------------------------------------------------------------------
      //! Stream the resource into the output
      //!
      //! @param out destination of the bytes
      //! @param url locator of the resource
      //! @return    an error status if the bytes could not be transferred,
      //!            the output may hold a part of the file in this case
      //------------------------------------------------------------------------
      virtual Status GetFile( std::ostream &out, const URL &url ) = 0;

      //------------------------------------------------------------------------
      //! Remove the resource
      //------------------------------------------------------------------------
      virtual Status DeleteFile( const URL &url ) = 0;
  };
}

#endif // __BIT_CL_FILE_EXCHANGE_HH__
