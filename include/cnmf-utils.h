// include/cnmf-utils.h

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


#ifndef CNMF_UTILS_H
#define CNMF_UTILS_H

#include <vector>

#include "matrix/matrix-lib.h"
#include "base/kaldi-common.h"


namespace kaldi {

// Tensors in convolutive NMF are kept as one matrix per context frame,
// e.g. W: num_frames x (dim, num_basis)
typedef std::vector<Matrix<BaseFloat> > FrameTensor;

// Shift columns of src by |shift| positions and zero fill the gap:
// shift > 0: to the right, first shift columns are zero, last shift dropped
// shift < 0: to the left, last -shift columns are zero, first -shift dropped
// for MATLAB:
// >> dst = [zeros(r, s) src(:, 1:n-s)];     % shift right by s
// >> dst = [src(:, s+1:n) zeros(r, s)];     % shift left by s
void ShiftColumns(const MatrixBase<BaseFloat> &src, int32 shift,
                  Matrix<BaseFloat> *dst);

// Rescale each column of mat to sum to one (project weights on simplex).
// Zero columns are not protected and produce NaN.
void NormalizeColumns(MatrixBase<BaseFloat> *mat);

// pos = max(src, 0), neg = max(-src, 0), so src = pos - neg
void SplitSigns(const MatrixBase<BaseFloat> &src,
                Matrix<BaseFloat> *pos, Matrix<BaseFloat> *neg);

bool CheckNonNegative(const MatrixBase<BaseFloat> &mat);

// false if any element is NaN or Inf
bool CheckFinite(const MatrixBase<BaseFloat> &mat);

// Convolutive reconstruction:
// V_hat = \sum_t W[t] * shift_right(H, t)
void ReconstructFromDecomposition(const FrameTensor &W,
                                  const MatrixBase<BaseFloat> &H,
                                  Matrix<BaseFloat> *V_hat);

// 0.5 * ||V - V_hat||_F^2, accumulated in double
double SquaredError(const MatrixBase<BaseFloat> &V,
                    const MatrixBase<BaseFloat> &V_hat);

// tensor:  num_frames x (num_rows, num_cols)
// stacked: (num_rows, num_frames x num_cols), frame t in columns
//          [t * num_cols, (t + 1) * num_cols)
void StackFrames(const FrameTensor &tensor, Matrix<BaseFloat> *stacked);

}

#endif
