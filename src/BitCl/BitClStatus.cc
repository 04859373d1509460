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

#include "BitCl/BitClStatus.hh"
#include <cstring>

namespace
{
  using namespace BitCl;
  struct ErrorMap
  {
    uint16_t    code;
    const char *msg;
  };

  ErrorMap errors[] = {
    { errUnknown,              "Unknown error"        },
    { errInvalidOp,            "Invalid operation"    },
    { errConfig,               "Configuration error"  },
    { errInternal,             "Internal error"       },
    { errInvalidArgs,          "Invalid arguments"    },
    { errUninitialized,        "Initialization error" },
    { errOSError,              "OS Error"             },
    { errNotSupported,         "Operation not supported" },
    { errDataError,            "Received corrupted data" },
    { errInvalidURL,           "Invalid URL"          },
    { errNotFound,             "Resource not found"   },
    { errFileExists,           "File already exists"  },
    { errSkipFile,             "File skipped"         },
    { errUnknownJob,           "Unknown job"          },
    { errDuplicateJob,         "Duplicate job"        },
    { errRetryQueueFull,       "Retry queue full"     },
    { errOperationFailed,      "Operation failed"     },
    { errQueryFailed,          "Query failed"         },
    { 0, 0 } };

  //----------------------------------------------------------------------------
  // Get error code
  //----------------------------------------------------------------------------
  std::string ErrorCodeToString( uint16_t code )
  {
    for( int i = 0; errors[i].msg != 0; ++i )
      if( errors[i].code == code )
        return errors[i].msg;
    return "Unknown error code";
  }
}

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Create a string representation
  //----------------------------------------------------------------------------
  std::string Status::ToString() const
  {
    std::ostringstream o;

    //--------------------------------------------------------------------------
    // The status is OK
    //--------------------------------------------------------------------------
    if( IsOK() )
    {
      o << "[SUCCESS] ";

      if( code == suContinue )
        o << "Continue";
      else if( code == suPartial )
        o << "Partial";
      else if( code == suAlreadyDone )
        o << "Already done";

      return o.str();
    }

    //--------------------------------------------------------------------------
    // We have an error
    //--------------------------------------------------------------------------
    if( IsFatal() )
      o << "[FATAL] ";
    else
      o << "[ERROR] ";

    o << ErrorCodeToString( code );

    //--------------------------------------------------------------------------
    // Add errno
    //--------------------------------------------------------------------------
    if( errNo )
      o << ": " << strerror( errNo );

    return o.str();
  }
}
