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

#include "BitCl/BitClOperationEvent.hh"

#include <sstream>

namespace BitCl
{
  //----------------------------------------------------------------------------
  // Event type names
  //----------------------------------------------------------------------------
  const char *OperationEvent::TypeToString( EventType type )
  {
    switch( type )
    {
      case IdentifyRequestSent:    return "IdentifyRequestSent";
      case ComponentIdentified:    return "ComponentIdentified";
      case IdentificationComplete: return "IdentificationComplete";
      case RequestSent:            return "RequestSent";
      case Progress:               return "Progress";
      case ComponentComplete:      return "ComponentComplete";
      case ComponentFailed:        return "ComponentFailed";
      case Warning:                return "Warning";
      case IdentifyTimeout:        return "IdentifyTimeout";
      case Complete:               return "Complete";
      case Failed:                 return "Failed";
    }
    return "Unknown";
  }

  //----------------------------------------------------------------------------
  // Printable form for the logs
  //----------------------------------------------------------------------------
  std::string OperationEvent::ToString() const
  {
    std::ostringstream o;
    o << TypeToString( pType ) << " collection: " << pCollection;
    if( !pFileID.empty() )
      o << ", file: " << pFileID;
    if( !pContributor.empty() )
      o << ", contributor: " << pContributor;
    if( pChecksums )
      o << ", checksums: " << pChecksums->records.size()
        << ( pChecksums->partial ? " (partial)" : "" );
    if( !pInfo.empty() )
      o << ", info: " << pInfo;
    return o.str();
  }
}
