// test-convex-hull.cc

#include <algorithm>

#include "include/convex-hull.h"

using namespace kaldi;

void FillPoints(const BaseFloat (*coords)[2], int32 num_points,
                Matrix<BaseFloat> *points) {
  points->Resize(num_points, 2);
  for (int32 i = 0; i < num_points; i++)
    (*points)(i, 0) = coords[i][0], (*points)(i, 1) = coords[i][1];
}

void TestConvexHull2D() {
  // unit square, interior points, edge midpoint and a repeated corner
  const BaseFloat square[8][2] = {
    {0.5, 0.5}, {0, 0}, {1, 0}, {0.5, 0}, {1, 1}, {0.2, 0.7}, {0, 1}, {1, 1}
  };
  Matrix<BaseFloat> points;
  FillPoints(square, 8, &points);
  std::vector<int32> indices;
  ConvexHull2D(points, &indices);
  // counter-clockwise from the lowest-leftmost point
  KALDI_ASSERT(indices.size() == 4);
  KALDI_ASSERT(indices[0] == 1 && indices[1] == 2 && indices[2] == 4 && indices[3] == 6);

  // collinear points only keep the end points
  const BaseFloat line[4][2] = {{1, 1}, {0, 0}, {3, 3}, {2, 2}};
  FillPoints(line, 4, &points);
  ConvexHull2D(points, &indices);
  std::sort(indices.begin(), indices.end());
  KALDI_ASSERT(indices.size() == 2 && indices[0] == 1 && indices[1] == 2);

  const BaseFloat same[3][2] = {{2, 1}, {2, 1}, {2, 1}};
  FillPoints(same, 3, &points);
  ConvexHull2D(points, &indices);
  KALDI_ASSERT(indices.size() == 1 && indices[0] == 0);
  std::cout << "Test ConvexHull2D done" << std::endl;
}

// every other points should lie inside the hull polygon
void TestConvexHull2DRandom() {
  for (int32 i = 0; i < 10; i++) {
    int32 n = Rand() % 40 + 10;
    Matrix<BaseFloat> points(n, 2);
    points.SetRandn();
    std::vector<int32> indices;
    ConvexHull2D(points, &indices);
    KALDI_ASSERT(indices.size() >= 3);
    for (int32 v = 0; v < indices.size(); v++) {
      int32 a = indices[v], b = indices[(v + 1) % indices.size()];
      for (int32 p = 0; p < n; p++) {
        double cross = (points(b, 0) - points(a, 0)) * (points(p, 1) - points(a, 1)) -
                       (points(b, 1) - points(a, 1)) * (points(p, 0) - points(a, 0));
        KALDI_ASSERT(cross >= -1e-5);
      }
    }
  }
  std::cout << "Test ConvexHull2D(random) done" << std::endl;
}

void TestUniqueColumns() {
  Matrix<BaseFloat> mat(2, 4);
  mat(0, 0) = 1, mat(1, 0) = 2;
  mat(0, 1) = 0, mat(1, 1) = 5;
  mat(0, 2) = 1, mat(1, 2) = 2;
  mat(0, 3) = 1, mat(1, 3) = -1;
  UniqueColumns(&mat);
  KALDI_ASSERT(mat.NumRows() == 2 && mat.NumCols() == 3);
  KALDI_ASSERT(mat(0, 0) == 0 && mat(1, 0) == 5);
  KALDI_ASSERT(mat(0, 1) == 1 && mat(1, 1) == -1);
  KALDI_ASSERT(mat(0, 2) == 1 && mat(1, 2) == 2);
  std::cout << "Test UniqueColumns done" << std::endl;
}

void TestRowCovariance() {
  int32 d = 4, n = 30;
  Matrix<BaseFloat> data(d, n);
  data.SetRandn();
  SpMatrix<BaseFloat> covar;
  ComputeRowCovariance(data, &covar);
  for (int32 i = 0; i < d; i++) {
    for (int32 j = 0; j <= i; j++) {
      double mi = 0, mj = 0, c = 0;
      for (int32 k = 0; k < n; k++) mi += data(i, k), mj += data(j, k);
      mi /= n, mj /= n;
      for (int32 k = 0; k < n; k++) c += (data(i, k) - mi) * (data(j, k) - mj);
      c /= (n - 1);
      KALDI_ASSERT(std::abs(covar(i, j) - c) < 1e-4);
    }
  }
  std::cout << "Test ComputeRowCovariance done" << std::endl;
}

void TestOneDimHullPoints() {
  Matrix<BaseFloat> data(1, 6), hull_points;
  data.SetRandn();
  ComputeConvexHullPoints(data, 3, &hull_points);
  KALDI_ASSERT(hull_points.NumRows() == 1 && hull_points.NumCols() == 2);
  KALDI_ASSERT(hull_points(0, 0) == data.Min() && hull_points(0, 1) == data.Max());
  std::cout << "Test ComputeConvexHullPoints(1D) done" << std::endl;
}

bool HasColumn(const MatrixBase<BaseFloat> &data, const MatrixBase<BaseFloat> &points,
               int32 col) {
  for (int32 j = 0; j < data.NumCols(); j++) {
    bool same = true;
    for (int32 i = 0; i < data.NumRows(); i++)
      if (data(i, j) != points(i, col)) same = false;
    if (same) return true;
  }
  return false;
}

void TestHullPoints() {
  for (int32 i = 0; i < 5; i++) {
    // num_basis >= dim uses full eigen decomposition, otherwise top ones
    int32 d = Rand() % 4 + 2, n = Rand() % 30 + 20, k = Rand() % 5 + 1;
    Matrix<BaseFloat> data(d, n), hull_points;
    data.SetRandn();
    ComputeConvexHullPoints(data, k, &hull_points);
    KALDI_ASSERT(hull_points.NumRows() == d);
    KALDI_ASSERT(hull_points.NumCols() >= 3 && hull_points.NumCols() <= n);

    Matrix<BaseFloat> unique_points(hull_points);
    UniqueColumns(&unique_points);
    KALDI_ASSERT(unique_points.NumCols() == hull_points.NumCols());
    for (int32 j = 0; j < hull_points.NumCols(); j++)
      KALDI_ASSERT(HasColumn(data, hull_points, j));
    std::cout << "d = " << d << ", n = " << n << ", k = " << k
              << ": " << hull_points.NumCols() << " hull points" << std::endl;
  }
}

// points on plane: extreme points in both axes must be selected
void TestPlaneHullPoints() {
  const BaseFloat coords[6][2] = {
    {-3, 0.1}, {0.2, 0.3}, {3, -0.2}, {0.1, 2}, {-0.3, -0.1}, {0, -2.5}
  };
  Matrix<BaseFloat> points, data, hull_points;
  FillPoints(coords, 6, &points);
  data.Resize(2, 6);
  data.CopyFromMat(points, kTrans);
  ComputeConvexHullPoints(data, 2, &hull_points);
  KALDI_ASSERT(hull_points.NumCols() == 4);
  for (int32 j = 0; j < 4; j++)
    KALDI_ASSERT(!(hull_points(0, j) == 0.2f && hull_points(1, j) == 0.3f));
  std::cout << "Test ComputeConvexHullPoints(2D) done" << std::endl;
}

int main() {
  TestConvexHull2D();
  TestConvexHull2DRandom();
  TestUniqueColumns();
  TestRowCovariance();
  TestOneDimHullPoints();
  TestHullPoints();
  TestPlaneHullPoints();
  return 0;
}
