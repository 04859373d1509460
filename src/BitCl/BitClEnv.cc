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

#include <cstdlib>

#include "BitCl/BitClEnv.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClLog.hh"
#include "BitCl/BitClConstants.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Insert or override a value unless it came from the shell
  //----------------------------------------------------------------------------
  template<typename Item>
  bool Env::Put( std::map<std::string, std::pair<Item, bool> > &store,
                 const std::string                            &key,
                 const Item                                   &value )
  {
    typename std::map<std::string, std::pair<Item, bool> >::iterator it;
    it = store.find( key );
    if( it != store.end() && it->second.second )
    {
      Log *log = DefaultEnv::GetLog();
      log->Debug( UtilityMsg, "Env: refusing to override a shell-imported "
                  "entry: %s", key.c_str() );
      return false;
    }
    store[key] = std::make_pair( value, false );
    return true;
  }

  //----------------------------------------------------------------------------
  // Get string
  //----------------------------------------------------------------------------
  bool Env::GetString( const std::string &key, std::string &value )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    StringMap::iterator it = pStringMap.find( key );
    if( it == pStringMap.end() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Debug( UtilityMsg, "Env: trying to get a non-existent string "
                  "entry: %s", key.c_str() );
      return false;
    }
    value = it->second.first;
    return true;
  }

  //----------------------------------------------------------------------------
  // Put string
  //----------------------------------------------------------------------------
  bool Env::PutString( const std::string &key, const std::string &value )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return Put( pStringMap, key, value );
  }

  //----------------------------------------------------------------------------
  // Get int
  //----------------------------------------------------------------------------
  bool Env::GetInt( const std::string &key, int &value )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    IntMap::iterator it = pIntMap.find( key );
    if( it == pIntMap.end() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Debug( UtilityMsg, "Env: trying to get a non-existent integer "
                  "entry: %s", key.c_str() );
      return false;
    }
    value = it->second.first;
    return true;
  }

  //----------------------------------------------------------------------------
  // Put int
  //----------------------------------------------------------------------------
  bool Env::PutInt( const std::string &key, int value )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return Put( pIntMap, key, value );
  }

  //----------------------------------------------------------------------------
  // Import int
  //----------------------------------------------------------------------------
  bool Env::ImportInt( const std::string &key, const std::string &shellKey )
  {
    std::string strValue = GetShellVariable( shellKey );
    if( strValue.empty() )
      return false;

    Log  *log    = DefaultEnv::GetLog();
    char *endPtr = 0;
    int   value  = (int)strtol( strValue.c_str(), &endPtr, 0 );
    if( *endPtr )
    {
      log->Error( UtilityMsg, "Env: Unable to import %s as %s: %s is not a "
                  "proper integer", shellKey.c_str(), key.c_str(),
                  strValue.c_str() );
      return false;
    }

    log->Info( UtilityMsg, "Env: Importing from shell %s=%d as %s",
               shellKey.c_str(), value, key.c_str() );

    std::unique_lock<std::mutex> lck( pMutex );
    pIntMap[key] = std::make_pair( value, true );
    return true;
  }

  //----------------------------------------------------------------------------
  // Import string
  //----------------------------------------------------------------------------
  bool Env::ImportString( const std::string &key, const std::string &shellKey )
  {
    std::string value = GetShellVariable( shellKey );
    if( value.empty() )
      return false;

    Log *log = DefaultEnv::GetLog();
    log->Info( UtilityMsg, "Env: Importing from shell %s=%s as %s",
               shellKey.c_str(), value.c_str(), key.c_str() );

    std::unique_lock<std::mutex> lck( pMutex );
    pStringMap[key] = std::make_pair( value, true );
    return true;
  }

  //----------------------------------------------------------------------------
  // Get a variable from the shell environment
  //----------------------------------------------------------------------------
  std::string Env::GetShellVariable( const std::string &key )
  {
    char *var = getenv( key.c_str() );
    if( !var )
      return "";
    return var;
  }
}
