// include/chcnmf.h

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


#ifndef CHCNMF_H
#define CHCNMF_H

#include <vector>

#include "matrix/matrix-lib.h"
#include "base/kaldi-common.h"
#include "util/common-utils.h"

#include "include/cnmf-utils.h"
#include "include/convex-hull.h"


namespace kaldi {


struct ConvexHullCNMFOptions {

    int32 max_iter;
    bool fix_g, fix_h;
    BaseFloat g_sparsity, h_sparsity;
    // cost is accumulated in double, so is the tolerance on its decrease
    double tolerance;

    ConvexHullCNMFOptions(): max_iter(100), fix_g(false), fix_h(false),
                             g_sparsity(0), h_sparsity(0), tolerance(1e-3) {}

    void Register(OptionsItf *opts) {
        opts->Register("fix-combination", &fix_g,
                        "Keep the convex combination tensor G unchanged "
                        "during the update iterations");
        opts->Register("fix-encoding", &fix_h,
                        "Keep the encoding matrix H unchanged during the update iterations");
        opts->Register("combination-sparsity", &g_sparsity,
                        "Sparsity weight for the convex combination tensor, "
                        "added to the denominator of its update");
        opts->Register("encoding-sparsity", &h_sparsity,
                        "Sparsity weight for the encoding matrix, "
                        "added to the denominator of its update");
        opts->Register("max-iter", &max_iter,
                        "Maximum number of iterations to update G and H, "
                        "non-positive value means 100");
        opts->Register("tolerance", &tolerance,
                        "Stop iterations when the decrease of cost is less than it, "
                        "non-positive value means 1e-3");
    }

    void ComputeDerived() {
        if (max_iter <= 0)
            max_iter = 100;
        if (tolerance <= 0)
            tolerance = 1e-3;
        if (g_sparsity < 0 || h_sparsity < 0)
            KALDI_ERR << "Sparsity weights should be non-negative, got "
                      << g_sparsity << " and " << h_sparsity;
    }
};

// V_hat = f(W, H), see ReconstructFromDecomposition() in cnmf-utils.h
typedef void (*ReconstructFunction)(const FrameTensor &W,
                                    const MatrixBase<BaseFloat> &H,
                                    Matrix<BaseFloat> *V_hat);

// Implement of Convex Hull Convolutive Non-negative Matrix Factorization
// V ~= \sum_t S * G[t] * shift_right(H, t), minimize 0.5 * ||V - V_hat||^2
// where columns of S lie on the convex hull of V, columns of G[t] are
// convex combinations and H is non-negative. V could have mixed sign.
// Reference:
//      Vaz C, Toutios A, Narayanan S. Convex Hull Convolutive Non-negative
//      Matrix Factorization for Uncovering Temporal Patterns in Multivariate
//      Time-Series Data[C]. Interspeech, 2016.

class ConvexHullCNMF {

public:
    ConvexHullCNMF(const ConvexHullCNMFOptions &opts,
                   ReconstructFunction reconstruct = ReconstructFromDecomposition):
        opts_(opts), reconstruct_(reconstruct) { opts_.ComputeDerived(); }

    // V:       (dim, num_samples)
    // S:       (dim, num_points), computed from V if empty
    // G:       num_frames x (num_points, num_basis_elems), random if empty
    // H:       (num_basis_elems, num_samples), random if empty
    // W:       num_frames x (dim, num_basis_elems), W[t] = S * G[t]
    // cost:    cost after initialization and each iteration
    // return final cost
    double DoCNMF(const MatrixBase<BaseFloat> &V,
                  int32 num_basis_elems, int32 num_frames,
                  Matrix<BaseFloat> *S, FrameTensor *G,
                  Matrix<BaseFloat> *H, FrameTensor *W,
                  std::vector<double> *cost);

    const ConvexHullCNMFOptions &Options() const { return opts_; }

private:

    ConvexHullCNMF &operator = (const ConvexHullCNMF &in);

    void Initialize(const MatrixBase<BaseFloat> &V,
                    int32 num_basis_elems, int32 num_frames,
                    Matrix<BaseFloat> *S, FrameTensor *G,
                    Matrix<BaseFloat> *H);

    void UpdateG(const MatrixBase<BaseFloat> &S, const MatrixBase<BaseFloat> &H,
                 FrameTensor *G, FrameTensor *W);

    void UpdateH(const FrameTensor &G, Matrix<BaseFloat> *H);

    double Objf(const MatrixBase<BaseFloat> &V, const FrameTensor &W,
                const MatrixBase<BaseFloat> &H);

    ConvexHullCNMFOptions opts_;
    ReconstructFunction reconstruct_;

    // S^T * V and S^T * S split into non-negative parts, fixed in one run
    Matrix<BaseFloat> S_V_pos_, S_V_neg_, S_S_pos_, S_S_neg_;
    // G of last iteration
    FrameTensor G0_;
};


}

#endif
