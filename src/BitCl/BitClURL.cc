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

#include "BitCl/BitClLog.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClURL.hh"
#include "BitCl/BitClUtils.hh"

#include <cstdlib>
#include <vector>
#include <sstream>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  URL::URL():
    pPort( 0 ),
    pExplicitPort( false )
  {
  }

  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  URL::URL( const std::string &url ):
    pPort( 0 ),
    pExplicitPort( false )
  {
    FromString( url );
  }

  URL::URL( const char *url ):
    pPort( 0 ),
    pExplicitPort( false )
  {
    FromString( url );
  }

  //----------------------------------------------------------------------------
  // Parse URL
  //----------------------------------------------------------------------------
  bool URL::FromString( const std::string &url )
  {
    Log *log = DefaultEnv::GetLog();

    Clear();

    if( url.empty() )
    {
      log->Error( UtilityMsg, "The given URL is empty" );
      return false;
    }

    //--------------------------------------------------------------------------
    // Extract the protocol, a bare absolute path is a local file
    //--------------------------------------------------------------------------
    std::string current;
    size_t pos = url.find( "://" );
    if( pos != std::string::npos )
    {
      pProtocol = url.substr( 0, pos );
      current   = url.substr( pos+3 );
    }
    else if( url[0] == '/' )
    {
      pProtocol = "file";
      current   = "localhost" + url;
    }
    else
    {
      log->Error( UtilityMsg, "No protocol in URL: %s", url.c_str() );
      return false;
    }

    if( pProtocol == "file" && !current.empty() && current[0] == '/' )
      current = "localhost" + current;

    pPort = DefaultPort( pProtocol );

    //--------------------------------------------------------------------------
    // Split host info and path, the path keeps its leading slash
    //--------------------------------------------------------------------------
    std::string hostInfo;
    std::string path;
    pos = current.find( '/' );
    if( pos == std::string::npos )
      hostInfo = current;
    else
    {
      hostInfo = current.substr( 0, pos );
      path     = current.substr( pos );
    }

    if( !ParseHostInfo( hostInfo ) || !ParsePath( path ) )
    {
      log->Error( UtilityMsg, "Malformed URL: %s", url.c_str() );
      Clear();
      return false;
    }

    ComputeURL();

    log->Dump( UtilityMsg,
               "URL: %s\n"
               "Protocol:  %s\n"
               "User Name: %s\n"
               "Host Name: %s\n"
               "Port:      %d\n"
               "Path:      %s\n",
               url.c_str(), pProtocol.c_str(), pUserName.c_str(),
               pHostName.c_str(), pPort, pPath.c_str() );
    return true;
  }

  //----------------------------------------------------------------------------
  // Parse host info
  //----------------------------------------------------------------------------
  bool URL::ParseHostInfo( const std::string &hostInfo )
  {
    if( pProtocol.empty() || hostInfo.empty() )
      return false;

    std::string hostPort = hostInfo;
    size_t pos = hostInfo.find( '@' );
    if( pos != std::string::npos )
    {
      std::string userPass = hostInfo.substr( 0, pos );
      hostPort = hostInfo.substr( pos+1 );
      pos = userPass.find( ':' );
      if( pos != std::string::npos )
      {
        pUserName = userPass.substr( 0, pos );
        pPassword = userPass.substr( pos+1 );
        if( pPassword.empty() )
          return false;
      }
      else
        pUserName = userPass;
      if( pUserName.empty() )
        return false;
    }

    //--------------------------------------------------------------------------
    // IPv6 literal, RFC 2732
    //--------------------------------------------------------------------------
    std::string portStr;
    if( !hostPort.empty() && hostPort[0] == '[' )
    {
      pos = hostPort.find( ']' );
      if( pos == std::string::npos )
        return false;
      pHostName = hostPort.substr( 0, pos+1 );
      if( pos+1 < hostPort.length() )
      {
        if( hostPort[pos+1] != ':' )
          return false;
        portStr = hostPort.substr( pos+2 );
      }
    }
    else
    {
      pos = hostPort.find( ':' );
      if( pos != std::string::npos )
      {
        pHostName = hostPort.substr( 0, pos );
        portStr   = hostPort.substr( pos+1 );
      }
      else
        pHostName = hostPort;
    }

    if( pHostName.empty() )
      return false;

    if( !portStr.empty() )
    {
      char *result;
      pPort = ::strtol( portStr.c_str(), &result, 10 );
      if( *result != 0 || pPort <= 0 || pPort > 65535 )
        return false;
      pExplicitPort = true;
    }
    return true;
  }

  //----------------------------------------------------------------------------
  // Parse path
  //----------------------------------------------------------------------------
  bool URL::ParsePath( const std::string &path )
  {
    std::string params;
    size_t pos = path.find( '?' );
    if( pos != std::string::npos )
    {
      pPath  = path.substr( 0, pos );
      params = path.substr( pos+1 );
    }
    else
      pPath = path;

    std::vector<std::string> paramsVect;
    Utils::splitString( paramsVect, params, "&" );
    std::vector<std::string>::iterator it;
    for( it = paramsVect.begin(); it != paramsVect.end(); ++it )
    {
      pos = it->find( '=' );
      if( pos == std::string::npos )
        pParams[*it] = "";
      else
        pParams[it->substr( 0, pos )] = it->substr( pos+1 );
    }
    return true;
  }

  //----------------------------------------------------------------------------
  // Get protocol://host:port/path
  //----------------------------------------------------------------------------
  std::string URL::GetLocation() const
  {
    std::ostringstream o;
    o << pProtocol << "://" << pHostName;
    if( pProtocol != "file" )
      o << ":" << pPort;
    o << pPath;
    return o.str();
  }

  //----------------------------------------------------------------------------
  // Get the URL params as string
  //----------------------------------------------------------------------------
  std::string URL::GetParamsAsString() const
  {
    if( pParams.empty() )
      return "";

    std::ostringstream o;
    o << "?";
    ParamsMap::const_iterator it;
    for( it = pParams.begin(); it != pParams.end(); ++it )
    {
      if( it != pParams.begin() ) o << "&";
      o << it->first;
      if( !it->second.empty() )
        o << "=" << it->second;
    }
    return o.str();
  }

  //----------------------------------------------------------------------------
  // Clear the fields
  //----------------------------------------------------------------------------
  void URL::Clear()
  {
    pProtocol.clear();
    pUserName.clear();
    pPassword.clear();
    pHostName.clear();
    pPort         = 0;
    pExplicitPort = false;
    pPath.clear();
    pParams.clear();
    pURL.clear();
  }

  //----------------------------------------------------------------------------
  // Check validity
  //----------------------------------------------------------------------------
  bool URL::IsValid() const
  {
    if( pProtocol.empty() || pHostName.empty() )
      return false;
    if( pProtocol == "file" && pPath.empty() )
      return false;
    return true;
  }

  //----------------------------------------------------------------------------
  // Is it a local file
  //----------------------------------------------------------------------------
  bool URL::IsLocalFile() const
  {
    return pProtocol == "file" && pHostName == "localhost";
  }

  //----------------------------------------------------------------------------
  // Default ports
  //----------------------------------------------------------------------------
  int URL::DefaultPort( const std::string &protocol )
  {
    if( protocol == "http" || protocol == "dav" )
      return 80;
    if( protocol == "https" || protocol == "davs" )
      return 443;
    if( protocol == "ftp" )
      return 21;
    return 0;
  }

  //----------------------------------------------------------------------------
  // Recreate the url
  //----------------------------------------------------------------------------
  void URL::ComputeURL()
  {
    if( !IsValid() )
    {
      pURL = "";
      return;
    }

    std::ostringstream o;
    o << pProtocol << "://";

    if( !pUserName.empty() )
    {
      o << pUserName;
      if( !pPassword.empty() )
        o << ":" << pPassword;
      o << "@";
    }

    o << pHostName;
    if( pExplicitPort )
      o << ":" << pPort;

    o << pPath << GetParamsAsString();
    pURL = o.str();
  }
}
