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

#ifndef __BIT_CL_CONSTANTS_HH__
#define __BIT_CL_CONSTANTS_HH__

#include <cstdint>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Log message types
  //----------------------------------------------------------------------------
  const uint64_t AppMsg             = 0x0000000000000001ULL;
  const uint64_t UtilityMsg         = 0x0000000000000002ULL;
  const uint64_t RegistryMsg        = 0x0000000000000004ULL;
  const uint64_t TransferMsg        = 0x0000000000000008ULL;
  const uint64_t ListMsg            = 0x0000000000000010ULL;
  const uint64_t FileExchangeMsg    = 0x0000000000000020ULL;
  const uint64_t WorkerPoolMsg      = 0x0000000000000040ULL;

  //----------------------------------------------------------------------------
  // Environment settings
  //----------------------------------------------------------------------------
  const int DefaultPageSize                = 10000;
  const int DefaultWorkerThreads           = 3;
  const int DefaultRetryQueueSize          = 0;

  const char * const DefaultChecksumType   = "md5";
  const char * const DefaultGlobalConfFile = "/etc/bitcl/client.conf";
  const char * const DefaultUserConfFile   = "/.bitcl/client.conf";

  //----------------------------------------------------------------------------
  // Sum file format, md5sum text mode
  //----------------------------------------------------------------------------
  const char * const SumFileFieldSeparator = "  ";
}

#endif // __BIT_CL_CONSTANTS_HH__
