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

#include "BitCl/BitClStatusReporter.hh"

#include <sstream>

namespace BitCl
{
  StreamStatusReporter::StreamStatusReporter( std::ostream &out ):
    pOut( out ),
    pStarted( 0 ),
    pFinished( 0 ),
    pFailed( 0 ),
    pSkipped( 0 )
  {
  }

  void StreamStatusReporter::ReportStart( const std::string &fileID )
  {
    ++pStarted;
    WriteLine( "Started: " + fileID );
  }

  void StreamStatusReporter::ReportSkipFile( const std::string &fileID,
                                             const std::string &reason )
  {
    ++pSkipped;
    WriteLine( "Skipped: " + fileID + " (" + reason + ")" );
  }

  void StreamStatusReporter::ReportFinish( const std::string &fileID )
  {
    ++pFinished;
    WriteLine( "Finished: " + fileID );
  }

  void StreamStatusReporter::ReportFailure( const std::string &fileID,
                                            const Status      &status )
  {
    ++pFailed;
    WriteLine( "Failed: " + fileID + " " + status.ToStr() );
  }

  //----------------------------------------------------------------------------
  // Print the counters
  //----------------------------------------------------------------------------
  void StreamStatusReporter::PrintStatistics()
  {
    std::ostringstream o;
    o << "Started: " << pStarted.load() << ", finished: " << pFinished.load();
    o << ", failed: " << pFailed.load() << ", skipped: " << pSkipped.load();
    WriteLine( o.str() );
  }

  //----------------------------------------------------------------------------
  // Lines of concurrent reports must not interleave
  //----------------------------------------------------------------------------
  void StreamStatusReporter::WriteLine( const std::string &line )
  {
    std::unique_lock<std::mutex> lck( pMutex );
    pOut << line << std::endl;
  }
}
