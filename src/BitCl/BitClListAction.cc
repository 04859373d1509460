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

#include "BitCl/BitClListAction.hh"
#include "BitCl/BitClChecksumClient.hh"
#include "BitCl/BitClListChecksumsEventHandler.hh"
#include "BitCl/BitClSumFileWriter.hh"
#include "BitCl/BitClFileIDTranslation.hh"
#include "BitCl/BitClDefaultEnv.hh"
#include "BitCl/BitClConstants.hh"
#include "BitCl/BitClEnv.hh"
#include "BitCl/BitClLog.hh"
#include "BitCl/BitClUtils.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  ListAction::ListAction( ChecksumClient    &client,
                          const std::string &collectionID,
                          const std::string &pillarID,
                          const std::string &sumFile ):
    pClient( client ),
    pCollectionID( collectionID ),
    pPillarID( pillarID ),
    pSumFile( sumFile ),
    pPageSize( DefaultPageSize ),
    pChecksumType( DefaultChecksumType ),
    pCursor( 0 ),
    pPages( 0 )
  {
    Env *env = DefaultEnv::GetEnv();
    int pageSize = DefaultPageSize;
    env->GetInt( "PageSize", pageSize );
    if( pageSize > 0 )
      pPageSize = pageSize;
    env->GetString( "ChecksumType", pChecksumType );
  }

  //----------------------------------------------------------------------------
  // Run the listing
  //----------------------------------------------------------------------------
  Status ListAction::Run()
  {
    Log *log = DefaultEnv::GetLog();

    if( pCollectionID.empty() )
      return Status( stError, errInvalidArgs, 0, "no collection given" );
    if( pPillarID.empty() )
      return Status( stError, errInvalidArgs, 0, "no pillar given" );
    if( pSumFile.empty() )
      return Status( stError, errInvalidArgs, 0, "no sum file given" );
    if( pPageSize == 0 )
      return Status( stError, errInvalidArgs, 0, "page size is 0" );

    SumFileWriter writer;
    Status st = writer.Open( pSumFile );
    if( !st.IsOK() )
      return st;

    log->Info( ListMsg, "Listing %s checksums of collection %s at %s into %s",
               pChecksumType.c_str(), pCollectionID.c_str(), pPillarID.c_str(),
               pSumFile.c_str() );

    pCursor = 0;
    pPages  = 0;
    std::set<std::string> lastPage;
    bool partial = false;

    do
    {
      std::vector<ChecksumData> records;
      st = QueryPage( pCursor, records, partial );
      if( !st.IsOK() )
        return st;

      std::set<std::string> currentPage;
      int64_t               latestDate = pCursor;
      st = ReportResults( records, lastPage, pCursor, writer, currentPage,
                          latestDate );
      if( !st.IsOK() )
        return st;

      ++pPages;
      lastPage.swap( currentPage );
      pCursor = latestDate;

      log->Debug( ListMsg, "Page %d of %s: %d record(s), cursor at %s%s",
                  (int)pPages, pPillarID.c_str(), (int)records.size(),
                  Utils::TimeToString( pCursor ).c_str(),
                  partial ? ", more to come" : "" );
    }
    while( partial );

    st = writer.Close();
    if( !st.IsOK() )
      return st;

    log->Info( ListMsg, "Wrote %llu checksum(s) of %s to %s in %d page(s)",
               (unsigned long long)writer.GetLineCount(), pPillarID.c_str(),
               pSumFile.c_str(), (int)pPages );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Write the records of a page
  //----------------------------------------------------------------------------
  Status ListAction::ReportResults( const std::vector<ChecksumData> &records,
                                    const std::set<std::string>     &lastPage,
                                    int64_t                          cursor,
                                    SumFileWriter                   &writer,
                                    std::set<std::string>           &currentPage,
                                    int64_t                         &latestDate )
  {
    Log *log = DefaultEnv::GetLog();
    latestDate = cursor;

    std::vector<ChecksumData>::const_iterator it;
    for( it = records.begin(); it != records.end(); ++it )
    {
      //------------------------------------------------------------------------
      // Every record moves the cursor, including the ones not written below
      //------------------------------------------------------------------------
      if( it->calculationTime > latestDate )
        latestDate = it->calculationTime;

      std::string path;
      Status st = FileIDTranslation::RemoteToLocal( it->fileID, pLocalPrefix,
                                                    pRemotePrefix, path );
      if( !st.IsOK() )
      {
        log->Debug( ListMsg, "Skipping file '%s' due to '%s'",
                    it->fileID.c_str(), st.ToStr().c_str() );
        continue;
      }

      if( lastPage.count( it->fileID ) )
      {
        log->Dump( ListMsg, "%s was listed with the previous page",
                   it->fileID.c_str() );
        continue;
      }
      currentPage.insert( it->fileID );

      std::string checksum = Utils::Char2Hex( it->checksum.data(),
                                              it->checksum.size() );
      st = writer.WriteLine( path, checksum );
      if( !st.IsOK() )
        return st;
    }
    return Status();
  }

  //----------------------------------------------------------------------------
  // Ask the pillar for a page and wait for it
  //----------------------------------------------------------------------------
  Status ListAction::QueryPage( int64_t                    cursor,
                                std::vector<ChecksumData> &records,
                                bool                      &partial )
  {
    Log *log = DefaultEnv::GetLog();
    const std::string failure = "Error getting checksumdata from pillar: '" +
                                pPillarID + "'";

    std::vector<ContributorQuery> queries;
    queries.push_back( ContributorQuery( pPillarID, cursor, NoTimeLimit,
                                         pPageSize ) );

    ListChecksumsEventHandler handler( pPillarID );
    Status st = pClient.GetChecksums( pCollectionID, queries, pChecksumType,
                                      &handler );
    if( !st.IsOK() )
    {
      log->Error( ListMsg, "Unable to query %s for checksums of %s: %s",
                  pPillarID.c_str(), pCollectionID.c_str(),
                  st.ToStr().c_str() );
      return Status( stError, errQueryFailed, 0, failure );
    }

    handler.WaitForFinish();
    if( handler.HasFailed() )
    {
      log->Error( ListMsg, "Failed collecting checksumdata of %s from %s: %s",
                  pCollectionID.c_str(), pPillarID.c_str(),
                  handler.GetFailureInfo().c_str() );
      return Status( stError, errQueryFailed, 0, failure );
    }

    records = handler.GetChecksumData();
    partial = handler.PartialResults();
    return Status();
  }
}
