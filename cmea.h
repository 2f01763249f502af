
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

#ifndef __CMEA_H__
#define __CMEA_H__

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cmath>

#include "defs/defs.h"
#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include "miscmath/miscmath.h"

#include "mea/series.h"
#include "mea/recording.h"
#include "mea/electrodes.h"

#include "dsp/iir.h"
#include "dsp/waveforms.h"
#include "dsp/peaks.h"

#include "stats/eigen_ops.h"
#include "stats/pca.h"
#include "stats/dbscan.h"

#include "db/sqlwrap.h"

#include "spikes/spikes.h"
#include "spikes/io.h"
#include "spikes/spikedb.h"
#include "spikes/detect.h"
#include "spikes/sort.h"

#include "conductance/cofiring.h"
#include "conductance/conductance.h"

#endif
