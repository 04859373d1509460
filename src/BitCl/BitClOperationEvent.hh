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

#ifndef __BIT_CL_OPERATION_EVENT_HH__
#define __BIT_CL_OPERATION_EVENT_HH__

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Checksum of a file as reported by a contributor
  //----------------------------------------------------------------------------
  struct ChecksumData
  {
    ChecksumData(): calculationTime( 0 ) {}

    ChecksumData( const std::string          &id,
                  const std::vector<uint8_t> &value,
                  int64_t                     time ):
      fileID( id ), checksum( value ), calculationTime( time ) {}

    std::string          fileID;           //!< file id in the collection
    std::vector<uint8_t> checksum;         //!< raw checksum bytes
    int64_t              calculationTime;  //!< ms since the epoch
  };

  //----------------------------------------------------------------------------
  //! Checksums delivered by one contributor
  //----------------------------------------------------------------------------
  struct ChecksumResult
  {
    ChecksumResult(): partial( false ) {}

    std::vector<ChecksumData> records;
    bool                      partial;  //!< more records are available
  };

  //----------------------------------------------------------------------------
  //! Notification about the progress of a remote operation
  //----------------------------------------------------------------------------
  class OperationEvent
  {
    public:
      //------------------------------------------------------------------------
      //! Event types
      //------------------------------------------------------------------------
      enum EventType
      {
        IdentifyRequestSent,     //!< identification request broadcast
        ComponentIdentified,     //!< a contributor declared it can serve
        IdentificationComplete,  //!< identification phase done
        RequestSent,             //!< the operation request was sent
        Progress,                //!< a contributor reported progress
        ComponentComplete,       //!< a contributor has finished
        ComponentFailed,         //!< a contributor has failed
        Warning,                 //!< non fatal problem
        IdentifyTimeout,         //!< not everybody answered in time
        Complete,                //!< the whole operation succeeded
        Failed                   //!< the whole operation failed
      };

      OperationEvent( EventType          type,
                      const std::string &collection,
                      const std::string &fileID,
                      const std::string &contributor = "",
                      const std::string &info = "" ):
        pType( type ),
        pCollection( collection ),
        pFileID( fileID ),
        pContributor( contributor ),
        pInfo( info ) {}

      EventType GetType() const
      {
        return pType;
      }

      const std::string &GetCollection() const
      {
        return pCollection;
      }

      //------------------------------------------------------------------------
      //! Get the id of the file the operation concerns
      //------------------------------------------------------------------------
      const std::string &GetFileID() const
      {
        return pFileID;
      }

      const std::string &GetContributor() const
      {
        return pContributor;
      }

      const std::string &GetInfo() const
      {
        return pInfo;
      }

      //------------------------------------------------------------------------
      //! Checksums carried by a contributor completion, may be null
      //------------------------------------------------------------------------
      const std::shared_ptr<const ChecksumResult> &GetChecksums() const
      {
        return pChecksums;
      }

      void SetChecksums( const std::shared_ptr<const ChecksumResult> &result )
      {
        pChecksums = result;
      }

      //------------------------------------------------------------------------
      //! No more events for the operation follow this one
      //------------------------------------------------------------------------
      bool IsFinal() const
      {
        return pType == Complete || pType == Failed;
      }

      std::string ToString() const;

      static const char *TypeToString( EventType type );

    private:
      EventType                              pType;
      std::string                            pCollection;
      std::string                            pFileID;
      std::string                            pContributor;
      std::string                            pInfo;
      std::shared_ptr<const ChecksumResult>  pChecksums;
  };

  //----------------------------------------------------------------------------
  //! Handle the events of a remote operation
  //----------------------------------------------------------------------------
  class EventHandler
  {
    public:
      virtual ~EventHandler() {}

      //------------------------------------------------------------------------
      //! Called for every event of the operation, possibly from several
      //! threads at a time
      //------------------------------------------------------------------------
      virtual void HandleEvent( const OperationEvent &event ) = 0;
  };
}

#endif // __BIT_CL_OPERATION_EVENT_HH__
