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

#ifndef __BIT_CL_JOB_REGISTRY_HH__
#define __BIT_CL_JOB_REGISTRY_HH__

#include <string>
#include <mutex>
#include <unordered_map>

#include "BitCl/BitClJob.hh"
#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Jobs in flight, keyed by file id. At most one job per file id is
  //! registered at any time. Safe to use from the event delivery threads
  //! and the submitting thread at the same time.
  //----------------------------------------------------------------------------
  class JobRegistry
  {
    public:
      JobRegistry() {}
      virtual ~JobRegistry() {}

      //------------------------------------------------------------------------
      //! Register a job
      //!
      //! @return errDuplicateJob (fatal) if a job with the same file id is
      //!         already running
      //------------------------------------------------------------------------
      virtual Status AddJob( const JobPtr &job );

      //------------------------------------------------------------------------
      //! Find the running job for a file id
      //!
      //! @param fileID the file id
      //! @param job    the job, set only on success
      //! @return errUnknownJob (fatal) if no job is registered for the id
      //------------------------------------------------------------------------
      virtual Status GetJob( const std::string &fileID, JobPtr &job );

      //------------------------------------------------------------------------
      //! Remove a job by its file id
      //!
      //! @return OK, or OK with suAlreadyDone if the job was not registered
      //------------------------------------------------------------------------
      virtual Status RemoveJob( const JobPtr &job );

      //------------------------------------------------------------------------
      //! Check whether a job for the file id is registered
      //------------------------------------------------------------------------
      bool HasJob( const std::string &fileID ) const;

      //------------------------------------------------------------------------
      //! Number of running jobs
      //------------------------------------------------------------------------
      size_t GetSize() const;

    private:
      JobRegistry( const JobRegistry &other );
      JobRegistry &operator = ( const JobRegistry &other );

      typedef std::unordered_map<std::string, JobPtr> JobMap;

      mutable std::mutex pMutex;
      JobMap             pJobs;
  };
}

#endif // __BIT_CL_JOB_REGISTRY_HH__
