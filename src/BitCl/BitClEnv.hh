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

#ifndef __BIT_CL_ENV_HH__
#define __BIT_CL_ENV_HH__

#include <map>
#include <string>
#include <utility>
#include <mutex>

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! A simple key value store intended to hold the client configuration.
  //! Settings imported from the shell environment supersede the ones
  //! provided by the C++ code or the configuration files.
  //----------------------------------------------------------------------------
  class Env
  {
    public:
      virtual ~Env() {}

      //------------------------------------------------------------------------
      //! Get a string associated to the given key
      //!
      //! @return true if the value was found, false otherwise
      //------------------------------------------------------------------------
      bool GetString( const std::string &key, std::string &value );

      //------------------------------------------------------------------------
      //! Associate a string with the given key
      //!
      //! @return false if there is already a shell-imported setting for this
      //!         key, true otherwise
      //------------------------------------------------------------------------
      bool PutString( const std::string &key, const std::string &value );

      //------------------------------------------------------------------------
      //! Get an int associated to the given key
      //!
      //! @return true if the value was found, false otherwise
      //------------------------------------------------------------------------
      bool GetInt( const std::string &key, int &value );

      //------------------------------------------------------------------------
      //! Associate an int with the given key
      //!
      //! @return false if there is already a shell-imported setting for this
      //!         key, true otherwise
      //------------------------------------------------------------------------
      bool PutInt( const std::string &key, int value );

      //------------------------------------------------------------------------
      //! Import an int from the shell environment
      //!
      //! @return true if the setting exists in the shell and is a proper
      //!         integer, false otherwise
      //------------------------------------------------------------------------
      bool ImportInt( const std::string &key, const std::string &shellKey );

      //------------------------------------------------------------------------
      //! Import a string from the shell environment
      //!
      //! @return true if the setting exists in the shell, false otherwise
      //------------------------------------------------------------------------
      bool ImportString( const std::string &key, const std::string &shellKey );

    private:
      template<typename Item>
      bool Put( std::map<std::string, std::pair<Item, bool> > &store,
                const std::string                            &key,
                const Item                                   &value );

      static std::string GetShellVariable( const std::string &key );

      typedef std::map<std::string, std::pair<std::string, bool> > StringMap;
      typedef std::map<std::string, std::pair<int, bool> >         IntMap;

      std::mutex   pMutex;
      StringMap    pStringMap;
      IntMap       pIntMap;
  };
}

#endif // __BIT_CL_ENV_HH__
