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

#ifndef __BIT_CL_CHECKSUM_CLIENT_HH__
#define __BIT_CL_CHECKSUM_CLIENT_HH__

#include <string>
#include <vector>
#include <cstdint>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  class EventHandler;

  //----------------------------------------------------------------------------
  //! No bound on a query timestamp
  //----------------------------------------------------------------------------
  const int64_t NoTimeLimit = -1;

  //----------------------------------------------------------------------------
  //! Selects the results one contributor should deliver
  //----------------------------------------------------------------------------
  struct ContributorQuery
  {
    ContributorQuery( const std::string &contributor,
                      int64_t            minTime,
                      int64_t            maxTime,
                      uint32_t           max ):
      contributorID( contributor ),
      minTimestamp( minTime ),
      maxTimestamp( maxTime ),
      maxResults( max ) {}

    std::string contributorID;  //!< id of the pillar to ask
    int64_t     minTimestamp;   //!< ms since the epoch, inclusive
    int64_t     maxTimestamp;   //!< ms since the epoch or NoTimeLimit
    uint32_t    maxResults;     //!< max number of records in the reply
  };

  //----------------------------------------------------------------------------
  //! Client asking the pillars of a collection for the checksums of their
  //! files
  //----------------------------------------------------------------------------
  class ChecksumClient
  {
    public:
      virtual ~ChecksumClient() {}

      //------------------------------------------------------------------------
      //! Ask for checksums, asynchronously
      //!
      //! @param collectionID the collection
      //! @param queries      what each contributor should deliver
      //! @param checksumType checksum algorithm, ie. "md5"
      //! @param handler      receives the events of the operation, the last
      //!                     one is Complete or Failed
      //! @return             status of the submission, no event is delivered
      //!                     if it is an error
      //------------------------------------------------------------------------
      virtual Status GetChecksums( const std::string                   &collectionID,
                                   const std::vector<ContributorQuery> &queries,
                                   const std::string                   &checksumType,
                                   EventHandler                        *handler ) = 0;
  };
}

#endif // __BIT_CL_CHECKSUM_CLIENT_HH__
