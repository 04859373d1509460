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

#include "BitCl/BitClJobRegistry.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClLog.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Register a job
  //----------------------------------------------------------------------------
  Status JobRegistry::AddJob( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    if( !job )
      return Status( stError, errInvalidArgs, 0, "null job" );

    std::unique_lock<std::mutex> lck( pMutex );
    std::pair<JobMap::iterator, bool> res;
    res = pJobs.insert( std::make_pair( job->GetFileID(), job ) );
    if( !res.second )
    {
      log->Error( RegistryMsg, "A job for %s is already running",
                  job->GetFileID().c_str() );
      return Status( stFatal, errDuplicateJob, 0, job->GetFileID() );
    }

    log->Debug( RegistryMsg, "Registered job for %s, %d job(s) running",
                job->GetFileID().c_str(), (int)pJobs.size() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Find a job
  //----------------------------------------------------------------------------
  Status JobRegistry::GetJob( const std::string &fileID, JobPtr &job )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    JobMap::iterator it = pJobs.find( fileID );
    if( it == pJobs.end() )
    {
      Log *log = DefaultEnv::GetLog();
      log->Error( RegistryMsg, "No running job for %s", fileID.c_str() );
      return Status( stFatal, errUnknownJob, 0, fileID );
    }
    job = it->second;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Remove a job
  //----------------------------------------------------------------------------
  Status JobRegistry::RemoveJob( const JobPtr &job )
  {
    Log *log = DefaultEnv::GetLog();
    if( !job )
      return Status( stError, errInvalidArgs, 0, "null job" );

    std::unique_lock<std::mutex> lck( pMutex );
    if( pJobs.erase( job->GetFileID() ) == 0 )
    {
      log->Warning( RegistryMsg, "Job for %s was not running, nothing to "
                    "remove", job->GetFileID().c_str() );
      return Status( stOK, suAlreadyDone );
    }

    log->Debug( RegistryMsg, "Removed job for %s, %d job(s) running",
                job->GetFileID().c_str(), (int)pJobs.size() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Check for a job
  //----------------------------------------------------------------------------
  bool JobRegistry::HasJob( const std::string &fileID ) const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pJobs.find( fileID ) != pJobs.end();
  }

  //----------------------------------------------------------------------------
  // Number of running jobs
  //----------------------------------------------------------------------------
  size_t JobRegistry::GetSize() const
  {
    std::unique_lock<std::mutex> lck( pMutex );
    return pJobs.size();
  }
}
