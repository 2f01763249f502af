
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

#ifndef __CMEA_EVAL_H__
#define __CMEA_EVAL_H__

#include <string>

struct param_t;

// run one command; halts on an unknown command
void cmea_eval( const std::string & cmd , param_t & param );

bool is( const std::string & c , const std::string & s );

void proc_detect( param_t & );
void proc_sort( param_t & );
void proc_tag( param_t & );
void proc_cofire( param_t & );
void proc_condense( param_t & );
void proc_map( param_t & );

#endif
