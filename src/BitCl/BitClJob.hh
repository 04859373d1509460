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

#ifndef __BIT_CL_JOB_HH__
#define __BIT_CL_JOB_HH__

#include <string>
#include <memory>

#include "BitCl/BitClURL.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! A single file transfer: where the file goes locally, which file it is
  //! in the collection, the checksum it should have and the locator of the
  //! remote temporary copy. Immutable once constructed.
  //----------------------------------------------------------------------------
  class Job
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param localPath  local destination of the file
      //! @param fileID     id of the file in the collection
      //! @param checksum   expected checksum, empty if not known
      //! @param url        locator of the remote copy of the file
      //------------------------------------------------------------------------
      Job( const std::string &localPath,
           const std::string &fileID,
           const std::string &checksum,
           const URL         &url ):
        pLocalPath( localPath ),
        pFileID( fileID ),
        pChecksum( checksum ),
        pURL( url ) {}

      const std::string &GetLocalPath() const
      {
        return pLocalPath;
      }

      const std::string &GetFileID() const
      {
        return pFileID;
      }

      //------------------------------------------------------------------------
      //! Get the expected checksum, only meaningful if HasChecksum()
      //------------------------------------------------------------------------
      const std::string &GetChecksum() const
      {
        return pChecksum;
      }

      bool HasChecksum() const
      {
        return !pChecksum.empty();
      }

      const URL &GetURL() const
      {
        return pURL;
      }

      //------------------------------------------------------------------------
      //! Jobs are equal if they describe the same transfer
      //------------------------------------------------------------------------
      bool operator==( const Job &other ) const
      {
        return pFileID == other.pFileID && pLocalPath == other.pLocalPath &&
               pChecksum == other.pChecksum && pURL == other.pURL;
      }

    private:
      const std::string pLocalPath;
      const std::string pFileID;
      const std::string pChecksum;
      const URL         pURL;
  };

  typedef std::shared_ptr<const Job> JobPtr;
}

#endif // __BIT_CL_JOB_HH__
