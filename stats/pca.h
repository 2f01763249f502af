
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

#ifndef __CMEA_PCA_H__
#define __CMEA_PCA_H__

#include "Eigen/Dense"
#include <vector>

//
// Principal components of a (rows = observations) matrix, via the SVD
// of the column-centred data
//

struct pca_t {

  pca_t( const int nc = 2 ) : nc( nc ) { }

  // returns projected scores (rows x nc); fewer columns if the data
  // have fewer rows or columns than nc
  Eigen::MatrixXd fit( const Eigen::MatrixXd & X );

  // number of components retained
  int nc;

  // scores = U * W
  Eigen::MatrixXd U;

  // loadings
  Eigen::MatrixXd V;

  // singular values
  Eigen::VectorXd W;

  // proportion of variance per retained component
  std::vector<double> explained;

};

#endif
