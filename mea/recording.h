
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

#ifndef __CMEA_RECORDING_H__
#define __CMEA_RECORDING_H__

#include <string>
#include <vector>
#include <map>

#include "mea/series.h"

struct param_t;

//
// All channels of one MEA recording, at a single sample rate
//

struct recording_t {

  recording_t( double sample_rate ) : sample_rate( sample_rate ) , nsamples(0) { }

  // add a channel, time index i / fs
  void add( const std::string & label , const std::vector<double> & x );

  bool has( const std::string & label ) const { return data.find( label ) != data.end(); }

  // halts if the label is unknown
  const series_t & operator[]( const std::string & label ) const;

  // channel labels, in insertion order
  const std::vector<std::string> & channels() const { return order; }

  int size() const { return order.size(); }

  double duration() const { return nsamples / sample_rate; }

  // time slice [start,end) in seconds, clipped to the recording;
  // end < 0 means to the end of the recording
  series_t get( const std::string & label , double start = 0 , double end = -1 ) const;

  double sample_rate;

  int nsamples;

private:

  std::map<std::string,series_t> data;

  std::vector<std::string> order;

};


namespace mea {

  // interleaved unsigned 16-bit samples, (v - 32768) * cal
  recording_t read_binary( const std::string & filename ,
			   const int nch ,
			   const std::vector<std::string> & labels ,
			   const double fs ,
			   const double cal );

  // 'bin' , 'nch' , 'ch' , 'fs' , 'cal'
  recording_t read_binary( const param_t & param );

}

#endif
