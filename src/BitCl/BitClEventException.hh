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

#ifndef __BIT_CL_EVENT_EXCEPTION_HH__
#define __BIT_CL_EVENT_EXCEPTION_HH__

#include <exception>
#include <string>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Raised by event handlers when an event does not match the job
  //! bookkeeping, ie. a notification for a file id nobody is waiting for.
  //! It is a logic error between the event source and the handler and is
  //! never retried.
  //----------------------------------------------------------------------------
  class EventException: public std::exception
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor from Status
      //------------------------------------------------------------------------
      EventException( const Status &error ):
        pError( error ), pWhat( error.ToStr() )
      {
      }

      //------------------------------------------------------------------------
      //! inherited from std::exception
      //------------------------------------------------------------------------
      const char* what() const noexcept
      {
        return pWhat.c_str();
      }

      //------------------------------------------------------------------------
      //! @return : the Status
      //------------------------------------------------------------------------
      const Status& GetError() const
      {
        return pError;
      }

    private:
      Status      pError;
      std::string pWhat;
  };
}

#endif // __BIT_CL_EVENT_EXCEPTION_HH__
