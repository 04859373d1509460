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

#ifndef __BIT_CL_DEFAULT_ENV_HH__
#define __BIT_CL_DEFAULT_ENV_HH__

#include <string>
#include <stdint.h>

#include "BitCl/BitClEnv.hh"

namespace BitCl
{
  class Log;

  //----------------------------------------------------------------------------
  //! Client environment holding the process wide configuration and the log
  //----------------------------------------------------------------------------
  class DefaultEnv: public Env
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor, loads the defaults, the config files and the shell
      //! settings
      //------------------------------------------------------------------------
      DefaultEnv();

      //------------------------------------------------------------------------
      //! Get default client environment
      //------------------------------------------------------------------------
      static Env *GetEnv();

      //------------------------------------------------------------------------
      //! Get default log
      //------------------------------------------------------------------------
      static Log *GetLog();

      //------------------------------------------------------------------------
      //! Set log level
      //!
      //! @param level Dump, Debug, Info, Warning or Error
      //------------------------------------------------------------------------
      static void SetLogLevel( const std::string &level );

      //------------------------------------------------------------------------
      //! Set log file
      //!
      //! @param filepath path to the log file
      //------------------------------------------------------------------------
      static bool SetLogFile( const std::string &filepath );

      //------------------------------------------------------------------------
      //! Set log mask.
      //! Determines which diagnostics topics should be printed. It's a
      //! "|" separated list of topics. The first element may be "All" in which
      //! case all the topics are enabled and the subsequent elements may turn
      //! them off, or "None" in which case all the topics are disabled and
      //! the subsequent flags may turn them on. If the topic name is prefixed
      //! with "^", then it means that the topic should be disabled. If the
      //! topic name is not prefixed, then it means that the topic should be
      //! enabled.
      //!
      //! The default for each level is "All", except for the "Dump" level,
      //! where the default is "All|^UtilityMsg".
      //!
      //! Available topics: AppMsg, UtilityMsg, RegistryMsg, TransferMsg,
      //! ListMsg, FileExchangeMsg, WorkerPoolMsg
      //------------------------------------------------------------------------
      static void SetLogMask( const std::string &level,
                              const std::string &mask );

      //------------------------------------------------------------------------
      //! Translate a topic expression into a topic mask
      //------------------------------------------------------------------------
      static uint64_t TranslateMask( const std::string &mask );

      //------------------------------------------------------------------------
      //! Initialize the environment
      //------------------------------------------------------------------------
      static void Initialize();

      //------------------------------------------------------------------------
      //! Finalize the environment
      //------------------------------------------------------------------------
      static void Finalize();

    private:
      static void SetUpLog();

      static Env *sEnv;
      static Log *sLog;
  };
}

#endif // __BIT_CL_DEFAULT_ENV_HH__
