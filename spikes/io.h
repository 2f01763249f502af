
//    --------------------------------------------------------------------
//
//    This file is part of CMEA.
//
//    CMEA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    CMEA is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with CMEA. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __CMEA_SPIKES_IO_H__
#define __CMEA_SPIKES_IO_H__

#include <string>

#include "spikes/spikes.h"

namespace mea {

  // header: electrode,time,amplitude,threshold,conductance (any order;
  // electrode and time required, unknown columns ignored)
  spike_table_t read_csv( const std::string & filename );

  void write_csv( const spike_table_t & spikes , const std::string & filename );

  // by extension: .db is an SQLite spike store, anything else CSV
  spike_table_t load_spikes( const std::string & filename );

  void save_spikes( const spike_table_t & spikes , const std::string & filename );

  // append one 'electrode,time' file built from a folder of per-channel
  // spike-time files (label = name after the last '_', minus extension)
  void condense_spikes( const std::string & folder , const std::string & filename );

}

#endif
