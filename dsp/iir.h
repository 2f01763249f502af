
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

#ifndef __CMEA_DSP_IIR_H__
#define __CMEA_DSP_IIR_H__

#include <vector>
#include <cstdio>
#include <cmath>
#include <cstdlib>
#include <complex>

#include "defs/defs.h"

struct series_t;

enum iir_type_t {
  BUTTERWORTH_LOWPASS ,
  BUTTERWORTH_HIGHPASS ,
  BUTTERWORTH_BANDPASS
};


// IIR filter in transfer-function form (b/a, a[0] == 1)

struct iir_t {

  iir_t() { }

  // order , sample rate , f1 (f2) in Hz; halts if an edge is not in (0,Nyquist)
  void init( iir_type_t , int order , double fs , double f1 , double f2 = 0 );

  // single causal pass (transposed direct form II), starting at rest
  std::vector<double> apply( const std::vector<double> & x ) const;

  // as above, with initial delay state zi
  std::vector<double> apply( const std::vector<double> & x , const std::vector<double> & zi ) const;

  // zero-phase: forward and backward passes over an odd-reflected
  // extension of x, each started from the step-response steady state
  std::vector<double> filtfilt( const std::vector<double> & x ) const;

  // delay state for a unit-step steady state (scaled by the first sample)
  std::vector<double> steady_state() const;

  // extension length used by filtfilt(), before clipping to n-1
  int padlen() const { return 3 * a.size(); }

  std::vector<double> b;

  std::vector<double> a;

};


namespace dsptools {

  // digital Butterworth design, edges normalized to Nyquist (0,1)
  void butterworth( iir_type_t type , int order ,
		    double w1 , double w2 ,
		    std::vector<double> * b ,
		    std::vector<double> * a );

  // zero-phase 2nd-order Butterworth: low < 0.1 Hz gives a low-pass at
  // 'high', high > 10 kHz a high-pass at 'low', otherwise band-pass
  series_t bandpass_filter( const series_t & s ,
			    double low = defaults::filter_low ,
			    double high = defaults::filter_high );

}


#endif
