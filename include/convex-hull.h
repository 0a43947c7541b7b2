// include/convex-hull.h

// Copyright 2018 Jian Wu

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.


#ifndef CONVEX_HULL_H
#define CONVEX_HULL_H

#include <vector>

#include "matrix/matrix-lib.h"
#include "base/kaldi-common.h"


namespace kaldi {

// points:  (num_points, 2)
// indices: row index of hull vertices, counter-clockwise, starting from
//          the lowest-leftmost point. Collinear boundary points are
//          not vertices. Less than 3 distinct points gives the distinct ones.
void ConvexHull2D(const MatrixBase<BaseFloat> &points,
                  std::vector<int32> *indices);

// Remove duplicated columns of mat, remaining columns are sorted
// lexicographically, like MATLAB's unique(mat.', 'rows').'
void UniqueColumns(Matrix<BaseFloat> *mat);

// Covariance of rows of data (rows as variables), normalized by N - 1
void ComputeRowCovariance(const MatrixBase<BaseFloat> &data,
                          SpMatrix<BaseFloat> *covar);

// Select points on the convex hull of columns of data, instead of
// computing a hull in high dimension, using union of 2D hulls on each plane
// spanned by a pair of leading principal directions.
//
// data:        (dim, num_samples)
// hull_points: (dim, num_points)
//
// for dim == 1, hull_points = [min(data) max(data)]
void ComputeConvexHullPoints(const MatrixBase<BaseFloat> &data,
                             int32 num_basis_elems,
                             Matrix<BaseFloat> *hull_points);

}

#endif
