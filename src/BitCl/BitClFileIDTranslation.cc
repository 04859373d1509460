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

#include "BitCl/BitClFileIDTranslation.hh"
#include "BitCl/BitClUtils.hh"

namespace BitCl
{
  Status FileIDTranslation::RemoteToLocal( const std::string &fileID,
                                           const std::string &localPrefix,
                                           const std::string &remotePrefix,
                                           std::string       &localPath )
  {
    return Substitute( fileID, remotePrefix, localPrefix, localPath );
  }

  Status FileIDTranslation::LocalToRemote( const std::string &localPath,
                                           const std::string &localPrefix,
                                           const std::string &remotePrefix,
                                           std::string       &fileID )
  {
    return Substitute( localPath, localPrefix, remotePrefix, fileID );
  }

  //----------------------------------------------------------------------------
  // Replace the leading "from" with "to", just prepend "to" if there is
  // nothing to replace
  //----------------------------------------------------------------------------
  Status FileIDTranslation::Substitute( const std::string &name,
                                        const std::string &from,
                                        const std::string &to,
                                        std::string       &result )
  {
    if( name.empty() )
      return Status( stError, errInvalidArgs, 0, "empty name" );

    if( from.empty() )
    {
      result = to + name;
      return Status();
    }

    if( !Utils::StartsWith( name, from ) )
      return Status( stError, errSkipFile, 0,
                     "'" + name + "' does not start with '" + from + "'" );

    result = to + name.substr( from.length() );
    return Status();
  }
}
