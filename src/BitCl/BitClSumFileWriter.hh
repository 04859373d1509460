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

#ifndef __BIT_CL_SUM_FILE_WRITER_HH__
#define __BIT_CL_SUM_FILE_WRITER_HH__

#include <string>
#include <cstdint>

#include "BitCl/BitClStatus.hh"

namespace BitCl
{
  //----------------------------------------------------------------------------
  //! Writes checksum lines in the md5sum text format:
  //! <checksum><two spaces><path>. Never writes to an existing file.
  //----------------------------------------------------------------------------
  class SumFileWriter
  {
    public:
      SumFileWriter();

      //------------------------------------------------------------------------
      //! Destructor, closes the file, the outcome of closing is only logged
      //------------------------------------------------------------------------
      ~SumFileWriter();

      //------------------------------------------------------------------------
      //! Create the sum file
      //!
      //! @return errFileExists if the file is already there
      //------------------------------------------------------------------------
      Status Open( const std::string &path );

      //------------------------------------------------------------------------
      //! Add a line, the lines are buffered
      //------------------------------------------------------------------------
      Status WriteLine( const std::string &path, const std::string &checksum );

      //------------------------------------------------------------------------
      //! Write out the buffered lines and close the file
      //------------------------------------------------------------------------
      Status Close();

      bool IsOpen() const
      {
        return pFD != -1;
      }

      const std::string &GetPath() const
      {
        return pPath;
      }

      //------------------------------------------------------------------------
      //! Number of lines written so far
      //------------------------------------------------------------------------
      uint64_t GetLineCount() const
      {
        return pLines;
      }

    private:
      SumFileWriter( const SumFileWriter &other );
      SumFileWriter &operator = ( const SumFileWriter &other );

      Status Flush();

      static const size_t BufferSize = 64*1024;

      std::string pPath;
      std::string pBuffer;
      int         pFD;
      uint64_t    pLines;
  };
}

#endif // __BIT_CL_SUM_FILE_WRITER_HH__
