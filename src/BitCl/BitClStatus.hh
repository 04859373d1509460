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

#ifndef __BIT_CL_STATUS_HH__
#define __BIT_CL_STATUS_HH__

#include <stdint.h>
#include <errno.h>
#include <string>
#include <sstream>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constants
  //----------------------------------------------------------------------------
  const uint16_t stOK    = 0x0000;  //!< Everything went OK
  const uint16_t stError = 0x0001;  //!< An error occurred that could potentially be retried
  const uint16_t stFatal = 0x0003;  //!< Fatal error, it's still an error

  //----------------------------------------------------------------------------
  // Additional info for the stOK status
  //----------------------------------------------------------------------------
  const uint16_t suDone            = 0;
  const uint16_t suContinue        = 1;
  const uint16_t suPartial         = 3;
  const uint16_t suAlreadyDone     = 4;

  //----------------------------------------------------------------------------
  // Generic errors
  //----------------------------------------------------------------------------
  const uint16_t errNone           = 0; //!< No error
  const uint16_t errUnknown        = 2; //!< Unknown error
  const uint16_t errInvalidOp      = 3; //!< The operation cannot be performed in the
                                        //!< given circumstances
  const uint16_t errConfig         = 6; //!< System misconfigured
  const uint16_t errInternal       = 7; //!< Internal error
  const uint16_t errInvalidArgs    = 9;
  const uint16_t errUninitialized  = 11;
  const uint16_t errOSError        = 12;
  const uint16_t errNotSupported   = 13;
  const uint16_t errDataError      = 14; //!< data is corrupted

  //----------------------------------------------------------------------------
  // Resource and file errors
  //----------------------------------------------------------------------------
  const uint16_t errInvalidURL     = 101;
  const uint16_t errNotFound       = 102;
  const uint16_t errFileExists     = 103; //!< refusing to overwrite a file
  const uint16_t errSkipFile       = 104; //!< file id outside of the prefix

  //----------------------------------------------------------------------------
  // Job bookkeeping errors
  //----------------------------------------------------------------------------
  const uint16_t errUnknownJob     = 201; //!< no running job for the file id
  const uint16_t errDuplicateJob   = 202; //!< a job for the file id is running
  const uint16_t errRetryQueueFull = 203;

  //----------------------------------------------------------------------------
  // Remote operation errors
  //----------------------------------------------------------------------------
  const uint16_t errOperationFailed = 301;
  const uint16_t errQueryFailed     = 302;

  //----------------------------------------------------------------------------
  //! Procedure execution status
  //----------------------------------------------------------------------------
  struct Status
  {
    //--------------------------------------------------------------------------
    //! Constructor
    //--------------------------------------------------------------------------
    Status( uint16_t           st      = stOK,
            uint16_t           cod     = errNone,
            uint32_t           errN    = 0,
            const std::string &message = "" ):
      status(st), code(cod), errNo( errN ), pMessage( message ) {}

    bool IsError() const { return status & stError; }           //!< Error
    bool IsFatal() const { return (status&0x0002) & stFatal; }  //!< Fatal error
    bool IsOK()    const { return status == stOK; }             //!< We're fine

    //--------------------------------------------------------------------------
    //! Get the status code that may be returned to the shell
    //--------------------------------------------------------------------------
    int GetShellCode() const
    {
      if( IsOK() )
        return 0;
      return (code/100)+50;
    }

    //--------------------------------------------------------------------------
    //! Get error message
    //--------------------------------------------------------------------------
    const std::string &GetErrorMessage() const
    {
      return pMessage;
    }

    //--------------------------------------------------------------------------
    //! Set the error message
    //--------------------------------------------------------------------------
    void SetErrorMessage( const std::string &message )
    {
      pMessage = message;
    }

    //--------------------------------------------------------------------------
    //! Create a string representation
    //--------------------------------------------------------------------------
    std::string ToString() const;

    //--------------------------------------------------------------------------
    //! Create a string representation including the error message
    //--------------------------------------------------------------------------
    std::string ToStr() const
    {
      std::string str = ToString();
      if( !pMessage.empty() )
        str += ": " + pMessage;
      return str;
    }

    uint16_t status;     //!< Status of the execution
    uint16_t code;       //!< Error type, or additional hints on what to do
    uint32_t errNo;      //!< Errno, if any

    private:
      std::string pMessage;
  };
}

#endif // __BIT_CL_STATUS_HH__
