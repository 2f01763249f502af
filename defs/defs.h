
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

#ifndef __CMEA_DEFS_H__
#define __CMEA_DEFS_H__

#include <string>

//
// Default analysis constants
//

namespace defaults {

  // band used before waveform extraction and detection (Hz)
  const double filter_low  = 200.0;
  const double filter_high = 4000.0;

  // below / above these, a band collapses to a high- or low-pass
  const double lowpass_only_below = 0.1;
  const double highpass_only_above = 10000.0;

  // waveform window (seconds)
  const double window_len = 0.003;

  // density clustering in PCA space
  const double dbscan_eps = 30.0;
  const int    dbscan_minpts = 3;

  // cofiring / conductance
  const double cofire_sep = 0.0005;
  const double conductance_sep = 0.0012;
  const int    conductance_min_events = 30;
  const double conductance_max_jitter = 0.3;  // msec
  const double keep_frac = 0.8;

  // detection
  const double amp = 6.0;
  const double dead_time = 0.001;

  // binary ingestion
  const double sample_rate = 20000.0;
  const double cal = 0.0610;
}


struct globals
{

  static std::string version;

  static std::string date;

  static int retcode;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // kill the process on halt()?
  static bool bail_on_fail;

  // optional redirect of log output
  static void (*logger_function) ( const std::string & msg );

  // no log output
  static bool silent;

  // keep a copy of all log output
  static bool cache_log;

  // running as a library (no banners)
  static bool api_mode;

  static bool verbose;

  // global functions: primary initiation of all globals
  void init_defs();

  // modes
  void api();

};


#endif
