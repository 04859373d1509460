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

#ifndef __BIT_CL_LIST_ACTION_HH__
#define __BIT_CL_LIST_ACTION_HH__

#include <string>
#include <vector>
#include <set>
#include <cstdint>

#include "BitCl/BitClStatus.hh"
#include "BitCl/BitClOperationEvent.hh"

namespace BitCl
{
  class ChecksumClient;
  class SumFileWriter;

  //----------------------------------------------------------------------------
  //! Produces a sum file with the checksums one pillar holds for a
  //! collection.
  //!
  //! The pillar is asked for pages of records newer than a time cursor. The
  //! cursor moves to the newest record of every page. Records at the cursor
  //! boundary may be delivered again with the next page, so the file ids
  //! written for the previous page are not written again. Repetitions
  //! spanning more than one page boundary are not detected.
  //----------------------------------------------------------------------------
  class ListAction
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param client       the checksum client, must outlive the action
      //! @param collectionID the collection to list
      //! @param pillarID     the pillar to ask
      //! @param sumFile      path of the sum file to create
      //------------------------------------------------------------------------
      ListAction( ChecksumClient    &client,
                  const std::string &collectionID,
                  const std::string &pillarID,
                  const std::string &sumFile );

      //------------------------------------------------------------------------
      //! Only file ids starting with the remote prefix are listed, the
      //! prefix is replaced by the local prefix in the sum file
      //------------------------------------------------------------------------
      void SetPrefixes( const std::string &localPrefix,
                        const std::string &remotePrefix )
      {
        pLocalPrefix  = localPrefix;
        pRemotePrefix = remotePrefix;
      }

      void SetPageSize( uint32_t pageSize )
      {
        pPageSize = pageSize;
      }

      void SetChecksumType( const std::string &checksumType )
      {
        pChecksumType = checksumType;
      }

      //------------------------------------------------------------------------
      //! Query the pillar page by page and write the sum file
      //!
      //! @return errInvalidArgs if a parameter is missing, errFileExists if
      //!         the sum file is already there, errQueryFailed if the pillar
      //!         failed to deliver a page
      //------------------------------------------------------------------------
      Status Run();

      //------------------------------------------------------------------------
      //! Write the records of one page
      //!
      //! @param records     the records of the page
      //! @param lastPage    file ids written for the previous page
      //! @param cursor      the cursor the page was queried with
      //! @param writer      destination of the lines
      //! @param currentPage file ids written for this page
      //! @param latestDate  newest calculation time among all the records of
      //!                    the page, never older than the cursor
      //------------------------------------------------------------------------
      Status ReportResults( const std::vector<ChecksumData> &records,
                            const std::set<std::string>     &lastPage,
                            int64_t                          cursor,
                            SumFileWriter                   &writer,
                            std::set<std::string>           &currentPage,
                            int64_t                         &latestDate );

      //------------------------------------------------------------------------
      //! Cursor reached by the last run
      //------------------------------------------------------------------------
      int64_t GetCursor() const
      {
        return pCursor;
      }

      uint32_t GetPageCount() const
      {
        return pPages;
      }

    private:
      Status QueryPage( int64_t cursor, std::vector<ChecksumData> &records,
                        bool &partial );

      ChecksumClient &pClient;
      std::string     pCollectionID;
      std::string     pPillarID;
      std::string     pSumFile;
      std::string     pLocalPrefix;
      std::string     pRemotePrefix;
      uint32_t        pPageSize;
      std::string     pChecksumType;
      int64_t         pCursor;
      uint32_t        pPages;
  };
}

#endif // __BIT_CL_LIST_ACTION_HH__
