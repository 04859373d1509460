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

#ifndef __BIT_CL_LIST_CHECKSUMS_EVENT_HANDLER_HH__
#define __BIT_CL_LIST_CHECKSUMS_EVENT_HANDLER_HH__

#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>

#include "BitCl/BitClOperationEvent.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Collects the checksums one pillar delivers for a single query and lets
  //! the caller wait for the end of the operation
  //----------------------------------------------------------------------------
  class ListChecksumsEventHandler: public EventHandler
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param pillarID the pillar whose results are collected
      //------------------------------------------------------------------------
      ListChecksumsEventHandler( const std::string &pillarID );

      virtual ~ListChecksumsEventHandler() {}

      virtual void HandleEvent( const OperationEvent &event );

      //------------------------------------------------------------------------
      //! Wait until the operation has completed or failed
      //------------------------------------------------------------------------
      void WaitForFinish();

      bool IsFinished() const;

      //------------------------------------------------------------------------
      //! The operation or the pillar have failed
      //------------------------------------------------------------------------
      bool HasFailed() const;

      //------------------------------------------------------------------------
      //! The pillar has more records than it delivered
      //------------------------------------------------------------------------
      bool PartialResults() const;

      //------------------------------------------------------------------------
      //! The records delivered by the pillar
      //------------------------------------------------------------------------
      std::vector<ChecksumData> GetChecksumData() const;

      //------------------------------------------------------------------------
      //! Info of the failure event, if any
      //------------------------------------------------------------------------
      std::string GetFailureInfo() const;

    private:
      void Finish( bool failed );

      std::string                pPillarID;
      std::vector<ChecksumData>  pRecords;
      bool                       pPartial;
      bool                       pFailed;
      bool                       pFinished;
      std::string                pFailureInfo;
      mutable std::mutex         pMutex;
      std::condition_variable    pFinishedCond;
  };
}

#endif // __BIT_CL_LIST_CHECKSUMS_EVENT_HANDLER_HH__
