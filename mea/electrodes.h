
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

#ifndef __CMEA_ELECTRODES_H__
#define __CMEA_ELECTRODES_H__

#include <string>
#include <utility>

// 12 x 12 MEA layout: columns a-m (no i), rows 1-12; the
// four corners of the top and bottom rows carry the analog inputs

namespace mea {

  // (x,y) grid position; case-insensitive, ignores any .<cluster> suffix
  std::pair<int,int> coordinates_for_electrode( const std::string & tag );

  std::string tag_for_electrode( const int x , const int y );

  inline std::string tag_for_electrode( const std::pair<int,int> & xy )
  {
    return tag_for_electrode( xy.first , xy.second );
  }

  // strip the .<cluster> suffix added by sub-clustering
  std::string base_tag( const std::string & tag );

  bool is_analog( const std::string & tag );

}

#endif
