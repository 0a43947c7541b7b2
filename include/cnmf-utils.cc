// include/cnmf-utils.cc

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

#include "include/cnmf-utils.h"

namespace kaldi {

void ShiftColumns(const MatrixBase<BaseFloat> &src, int32 shift,
                  Matrix<BaseFloat> *dst) {
  KALDI_ASSERT(dst != NULL && &src != dst);
  MatrixIndexT num_rows = src.NumRows(), num_cols = src.NumCols();
  dst->Resize(num_rows, num_cols, kSetZero);

  int32 offset = std::abs(shift);
  if (offset >= num_cols) return;
  int32 num_kept = num_cols - offset;
  if (shift >= 0)
    dst->ColRange(offset, num_kept).CopyFromMat(src.ColRange(0, num_kept));
  else
    dst->ColRange(0, num_kept).CopyFromMat(src.ColRange(offset, num_kept));
}

void NormalizeColumns(MatrixBase<BaseFloat> *mat) {
  Vector<BaseFloat> col_sum(mat->NumCols());
  col_sum.AddRowSumMat(1.0, *mat, 0.0);
  col_sum.InvertElements();
  mat->MulColsVec(col_sum);
}

void SplitSigns(const MatrixBase<BaseFloat> &src,
                Matrix<BaseFloat> *pos, Matrix<BaseFloat> *neg) {
  // 0.5 * (|x| + x), 0.5 * (|x| - x)
  pos->Resize(src.NumRows(), src.NumCols(), kUndefined);
  neg->Resize(src.NumRows(), src.NumCols(), kUndefined);
  pos->CopyFromMat(src);
  pos->ApplyFloor(0);
  neg->CopyFromMat(src);
  neg->Scale(-1);
  neg->ApplyFloor(0);
}

bool CheckNonNegative(const MatrixBase<BaseFloat> &mat) {
  for (MatrixIndexT i = 0; i < mat.NumRows(); i++)
    for (MatrixIndexT j = 0; j < mat.NumCols(); j++)
      if (mat(i, j) < 0)
        return false;
  return true;
}

bool CheckFinite(const MatrixBase<BaseFloat> &mat) {
  for (MatrixIndexT i = 0; i < mat.NumRows(); i++)
    for (MatrixIndexT j = 0; j < mat.NumCols(); j++)
      if (!KALDI_ISFINITE(mat(i, j)))
        return false;
  return true;
}

void ReconstructFromDecomposition(const FrameTensor &W,
                                  const MatrixBase<BaseFloat> &H,
                                  Matrix<BaseFloat> *V_hat) {
  KALDI_ASSERT(W.size() > 0);
  int32 num_frames = W.size();
  V_hat->Resize(W[0].NumRows(), H.NumCols());

  Matrix<BaseFloat> H_shifted;
  for (int32 t = 0; t < num_frames; t++) {
    KALDI_ASSERT(W[t].NumCols() == H.NumRows());
    ShiftColumns(H, t, &H_shifted);
    V_hat->AddMatMat(1, W[t], kNoTrans, H_shifted, kNoTrans, 1);
  }
}

double SquaredError(const MatrixBase<BaseFloat> &V,
                    const MatrixBase<BaseFloat> &V_hat) {
  KALDI_ASSERT(SameDim(V, V_hat));
  double err = 0;
  for (MatrixIndexT i = 0; i < V.NumRows(); i++) {
    const BaseFloat *v = V.RowData(i), *v_hat = V_hat.RowData(i);
    for (MatrixIndexT j = 0; j < V.NumCols(); j++) {
      double diff = static_cast<double>(v[j]) - v_hat[j];
      err += diff * diff;
    }
  }
  return 0.5 * err;
}

void StackFrames(const FrameTensor &tensor, Matrix<BaseFloat> *stacked) {
  KALDI_ASSERT(tensor.size() > 0);
  MatrixIndexT num_rows = tensor[0].NumRows(), num_cols = tensor[0].NumCols();
  stacked->Resize(num_rows, num_cols * tensor.size(), kUndefined);
  for (int32 t = 0; t < tensor.size(); t++) {
    KALDI_ASSERT(SameDim(tensor[t], tensor[0]));
    stacked->ColRange(t * num_cols, num_cols).CopyFromMat(tensor[t]);
  }
}

}
