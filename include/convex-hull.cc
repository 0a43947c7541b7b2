// include/convex-hull.cc

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

#include <algorithm>

#include "include/convex-hull.h"
#include "include/cnmf-utils.h"

namespace kaldi {

struct PointLess {
  const MatrixBase<BaseFloat> &points;
  explicit PointLess(const MatrixBase<BaseFloat> &p): points(p) {}
  bool operator() (int32 a, int32 b) const {
    if (points(a, 0) != points(b, 0)) return points(a, 0) < points(b, 0);
    if (points(a, 1) != points(b, 1)) return points(a, 1) < points(b, 1);
    return a < b;
  }
};

// > 0 if o -> a -> b turns counter-clockwise
static double Cross(const MatrixBase<BaseFloat> &points,
                    int32 o, int32 a, int32 b) {
  double ax = points(a, 0) - points(o, 0), ay = points(a, 1) - points(o, 1),
         bx = points(b, 0) - points(o, 0), by = points(b, 1) - points(o, 1);
  return ax * by - ay * bx;
}

// Andrew's monotone chain
void ConvexHull2D(const MatrixBase<BaseFloat> &points,
                  std::vector<int32> *indices) {
  KALDI_ASSERT(points.NumCols() == 2);
  int32 num_points = points.NumRows();
  indices->clear();

  std::vector<int32> order(num_points);
  for (int32 i = 0; i < num_points; i++) order[i] = i;
  std::sort(order.begin(), order.end(), PointLess(points));

  // drop repeated points, keep the one with smallest index
  std::vector<int32> distinct;
  for (int32 i = 0; i < num_points; i++) {
    int32 cur = order[i];
    if (!distinct.empty()) {
      int32 pre = distinct.back();
      if (points(pre, 0) == points(cur, 0) && points(pre, 1) == points(cur, 1))
        continue;
    }
    distinct.push_back(cur);
  }

  int32 num_distinct = distinct.size();
  if (num_distinct < 3) {
    *indices = distinct;
    return;
  }

  std::vector<int32> hull(2 * num_distinct);
  int32 k = 0;
  // lower hull
  for (int32 i = 0; i < num_distinct; i++) {
    while (k >= 2 && Cross(points, hull[k - 2], hull[k - 1], distinct[i]) <= 0)
      k--;
    hull[k++] = distinct[i];
  }
  // upper hull
  for (int32 i = num_distinct - 2, lower_size = k + 1; i >= 0; i--) {
    while (k >= lower_size &&
           Cross(points, hull[k - 2], hull[k - 1], distinct[i]) <= 0)
      k--;
    hull[k++] = distinct[i];
  }
  // last point is the first one
  hull.resize(k - 1);
  indices->swap(hull);
}

void UniqueColumns(Matrix<BaseFloat> *mat) {
  MatrixIndexT num_rows = mat->NumRows(), num_cols = mat->NumCols();
  std::vector<std::vector<BaseFloat> > columns(num_cols);
  for (MatrixIndexT j = 0; j < num_cols; j++) {
    columns[j].resize(num_rows);
    for (MatrixIndexT i = 0; i < num_rows; i++)
      columns[j][i] = (*mat)(i, j);
  }
  std::sort(columns.begin(), columns.end());
  columns.erase(std::unique(columns.begin(), columns.end()), columns.end());

  if (columns.size() == num_cols) {
    // only reorder
    for (MatrixIndexT j = 0; j < num_cols; j++)
      for (MatrixIndexT i = 0; i < num_rows; i++)
        (*mat)(i, j) = columns[j][i];
    return;
  }
  mat->Resize(num_rows, columns.size(), kUndefined);
  for (MatrixIndexT j = 0; j < columns.size(); j++)
    for (MatrixIndexT i = 0; i < num_rows; i++)
      (*mat)(i, j) = columns[j][i];
}

void ComputeRowCovariance(const MatrixBase<BaseFloat> &data,
                          SpMatrix<BaseFloat> *covar) {
  MatrixIndexT num_samples = data.NumCols();
  KALDI_ASSERT(num_samples > 0);
  Vector<BaseFloat> mean(data.NumRows());
  mean.AddColSumMat(1.0 / num_samples, data, 0.0);

  Matrix<BaseFloat> centered(data);
  centered.AddVecToCols(-1.0, mean);

  covar->Resize(data.NumRows());
  // MATLAB's cov() normalize by 1 for single observation
  BaseFloat norm = num_samples > 1 ? num_samples - 1 : 1;
  covar->AddMat2(1.0 / norm, centered, kNoTrans, 0.0);
}

void ComputeConvexHullPoints(const MatrixBase<BaseFloat> &data,
                             int32 num_basis_elems,
                             Matrix<BaseFloat> *hull_points) {
  KALDI_ASSERT(num_basis_elems > 0);
  if (data.NumRows() == 0 || data.NumCols() == 0)
    KALDI_ERR << "Could not select convex hull points from an empty matrix";
  // sorting columns needs a strict weak order
  if (!CheckFinite(data))
    KALDI_ERR << "Could not select convex hull points with NaN or Inf elements";

  MatrixIndexT dim = data.NumRows(), num_samples = data.NumCols();
  if (dim == 1) {
    hull_points->Resize(1, 2);
    (*hull_points)(0, 0) = data.Min();
    (*hull_points)(0, 1) = data.Max();
    return;
  }

  SpMatrix<BaseFloat> covar;
  ComputeRowCovariance(data, &covar);

  // need at least one projection plane
  int32 num_dirs = std::max(std::min(num_basis_elems, dim), 2);
  Matrix<BaseFloat> directions(dim, num_dirs);
  if (num_dirs >= dim) {
    Vector<BaseFloat> eig_values(dim);
    covar.Eig(&eig_values, &directions);
    SortSvd(&eig_values, &directions);
  } else {
    Vector<BaseFloat> eig_values(num_dirs);
    covar.TopEigs(&eig_values, &directions);
  }

  Matrix<BaseFloat> plane(dim, 2), projected(num_samples, 2), candidates;
  Vector<BaseFloat> point(dim);
  std::vector<int32> hull_indices;

  for (int32 e1 = 0; e1 < num_dirs - 1; e1++) {
    for (int32 e2 = e1 + 1; e2 < num_dirs; e2++) {
      plane.ColRange(0, 1).CopyFromMat(directions.ColRange(e1, 1));
      plane.ColRange(1, 1).CopyFromMat(directions.ColRange(e2, 1));
      // (num_samples, dim) x (dim, 2)
      projected.AddMatMat(1, data, kTrans, plane, kNoTrans, 0);
      ConvexHull2D(projected, &hull_indices);

      int32 num_kept = candidates.NumCols();
      Matrix<BaseFloat> merged(dim, num_kept + hull_indices.size());
      if (num_kept)
        merged.ColRange(0, num_kept).CopyFromMat(candidates);
      for (int32 i = 0; i < hull_indices.size(); i++) {
        point.CopyColFromMat(data, hull_indices[i]);
        merged.CopyColFromVec(point, num_kept + i);
      }
      UniqueColumns(&merged);
      candidates.Swap(&merged);

      KALDI_VLOG(2) << "Plane (" << e1 << ", " << e2 << "): "
                    << hull_indices.size() << " hull vertices, "
                    << candidates.NumCols() << " points in total";
    }
  }
  hull_points->Swap(&candidates);
}

}
