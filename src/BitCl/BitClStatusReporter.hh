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

#ifndef __BIT_CL_STATUS_REPORTER_HH__
#define __BIT_CL_STATUS_REPORTER_HH__

#include <string>
#include <ostream>
#include <mutex>
#include <atomic>
#include <cstdint>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Interface for the notifications about the progress of file jobs, only
  //! the completion needs to be handled
  //----------------------------------------------------------------------------
  class StatusReporter
  {
    public:
      virtual ~StatusReporter() {}

      //------------------------------------------------------------------------
      //! A job for the file has been submitted
      //------------------------------------------------------------------------
      virtual void ReportStart( const std::string &fileID ) { (void)fileID; }

      //------------------------------------------------------------------------
      //! The file has been left out
      //!
      //! @param fileID the file id
      //! @param reason why it was left out
      //------------------------------------------------------------------------
      virtual void ReportSkipFile( const std::string &fileID,
                                   const std::string &reason )
      {
        (void)fileID; (void)reason;
      }

      //------------------------------------------------------------------------
      //! The job for the file has completed successfully
      //------------------------------------------------------------------------
      virtual void ReportFinish( const std::string &fileID ) = 0;

      //------------------------------------------------------------------------
      //! The job for the file has failed for good
      //------------------------------------------------------------------------
      virtual void ReportFailure( const std::string &fileID,
                                  const Status      &status )
      {
        (void)fileID; (void)status;
      }

      //------------------------------------------------------------------------
      //! Print the summary of everything reported so far
      //------------------------------------------------------------------------
      virtual void PrintStatistics() {}
  };

  //----------------------------------------------------------------------------
  //! Writes one line per notification to a stream and counts them
  //----------------------------------------------------------------------------
  class StreamStatusReporter: public StatusReporter
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param out the stream, must outlive the reporter
      //------------------------------------------------------------------------
      StreamStatusReporter( std::ostream &out );

      virtual ~StreamStatusReporter() {}

      virtual void ReportStart( const std::string &fileID );
      virtual void ReportSkipFile( const std::string &fileID,
                                   const std::string &reason );
      virtual void ReportFinish( const std::string &fileID );
      virtual void ReportFailure( const std::string &fileID,
                                  const Status      &status );
      virtual void PrintStatistics();

      uint64_t GetStarted() const  { return pStarted.load(); }
      uint64_t GetFinished() const { return pFinished.load(); }
      uint64_t GetFailed() const   { return pFailed.load(); }
      uint64_t GetSkipped() const  { return pSkipped.load(); }

    private:
      void WriteLine( const std::string &line );

      std::ostream          &pOut;
      std::mutex             pMutex;
      std::atomic<uint64_t>  pStarted;
      std::atomic<uint64_t>  pFinished;
      std::atomic<uint64_t>  pFailed;
      std::atomic<uint64_t>  pSkipped;
  };
}

#endif // __BIT_CL_STATUS_REPORTER_HH__
