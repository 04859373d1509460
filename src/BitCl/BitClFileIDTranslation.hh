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

#ifndef __BIT_CL_FILE_ID_TRANSLATION_HH__
#define __BIT_CL_FILE_ID_TRANSLATION_HH__

#include <string>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Translation between file ids in a collection and local paths by prefix
  //! substitution
  //----------------------------------------------------------------------------
  class FileIDTranslation
  {
    public:
      //------------------------------------------------------------------------
      //! Map a file id to a local path
      //!
      //! @param fileID       the file id
      //! @param localPrefix  prefix of the local path, may be empty
      //! @param remotePrefix required prefix of the file id, may be empty
      //! @param localPath    the resulting path, set only on success
      //! @return             errSkipFile if the file id does not start with
      //!                     the remote prefix
      //------------------------------------------------------------------------
      static Status RemoteToLocal( const std::string &fileID,
                                   const std::string &localPrefix,
                                   const std::string &remotePrefix,
                                   std::string       &localPath );

      //------------------------------------------------------------------------
      //! Map a local path to a file id, the inverse of RemoteToLocal
      //!
      //! @return errSkipFile if the path does not start with the local prefix
      //------------------------------------------------------------------------
      static Status LocalToRemote( const std::string &localPath,
                                   const std::string &localPrefix,
                                   const std::string &remotePrefix,
                                   std::string       &fileID );

    private:
      static Status Substitute( const std::string &name,
                                const std::string &from,
                                const std::string &to,
                                std::string       &result );
  };
}

#endif // __BIT_CL_FILE_ID_TRANSLATION_HH__
