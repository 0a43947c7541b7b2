// include/chcnmf.cc

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

#include "include/chcnmf.h"


namespace kaldi {

double ConvexHullCNMF::Objf(const MatrixBase<BaseFloat> &V,
                            const FrameTensor &W,
                            const MatrixBase<BaseFloat> &H) {
    Matrix<BaseFloat> V_hat;
    reconstruct_(W, H, &V_hat);
    return SquaredError(V, V_hat);
}

void ConvexHullCNMF::Initialize(const MatrixBase<BaseFloat> &V,
                                int32 num_basis_elems, int32 num_frames,
                                Matrix<BaseFloat> *S, FrameTensor *G,
                                Matrix<BaseFloat> *H) {
    int32 dim = V.NumRows(), num_samples = V.NumCols();

    if (S->NumCols() == 0) {
        ComputeConvexHullPoints(V, num_basis_elems, S);
        KALDI_VLOG(1) << "Select " << S->NumCols() << " points on convex hull";
    } else {
        KALDI_ASSERT(S->NumRows() == dim);
    }
    int32 num_points = S->NumCols();

    if (G->empty()) {
        G->resize(num_frames);
        for (int32 t = 0; t < num_frames; t++) {
            (*G)[t].Resize(num_points, num_basis_elems);
            (*G)[t].SetRandUniform();
            NormalizeColumns(&(*G)[t]);
        }
    } else {
        KALDI_ASSERT(G->size() == num_frames);
        for (int32 t = 0; t < num_frames; t++) {
            KALDI_ASSERT((*G)[t].NumRows() == num_points &&
                         (*G)[t].NumCols() == num_basis_elems);
            if (!CheckNonNegative((*G)[t]))
                KALDI_ERR << "Tensor G has negative elements on frame " << t;
        }
    }

    if (H->NumRows() == 0) {
        H->Resize(num_basis_elems, num_samples);
        H->SetRandUniform();
    } else {
        KALDI_ASSERT(H->NumRows() == num_basis_elems && H->NumCols() == num_samples);
        if (!CheckNonNegative(*H))
            KALDI_ERR << "Matrix H has negative elements";
    }
}


double ConvexHullCNMF::DoCNMF(const MatrixBase<BaseFloat> &V,
                              int32 num_basis_elems, int32 num_frames,
                              Matrix<BaseFloat> *S, FrameTensor *G,
                              Matrix<BaseFloat> *H, FrameTensor *W,
                              std::vector<double> *cost) {
    KALDI_ASSERT(num_basis_elems > 0 && num_frames > 0);
    KALDI_ASSERT(S != NULL && G != NULL && H != NULL && W != NULL && cost != NULL);
    if (V.NumRows() == 0 || V.NumCols() == 0)
        KALDI_ERR << "Could not factorize an empty matrix";
    if (!CheckFinite(V))
        KALDI_ERR << "Matrix V has NaN or Inf elements";

    Initialize(V, num_basis_elems, num_frames, S, G, H);

    int32 num_points = S->NumCols();
    Matrix<BaseFloat> SV(num_points, V.NumCols()), SS(num_points, num_points);
    SV.AddMatMat(1, *S, kTrans, V, kNoTrans, 0);
    SS.AddMatMat(1, *S, kTrans, *S, kNoTrans, 0);
    SplitSigns(SV, &S_V_pos_, &S_V_neg_);
    SplitSigns(SS, &S_S_pos_, &S_S_neg_);

    W->resize(num_frames);
    for (int32 t = 0; t < num_frames; t++) {
        (*W)[t].Resize(V.NumRows(), num_basis_elems);
        (*W)[t].AddMatMat(1, *S, kNoTrans, (*G)[t], kNoTrans, 0);
    }
    G0_ = *G;

    cost->clear();
    cost->push_back(Objf(V, *W, *H));
    KALDI_LOG << "Initial objfunc " << cost->back();

    for (int32 iter = 0; iter < opts_.max_iter; iter++) {
        if (!opts_.fix_g)
            UpdateG(*S, *H, G, W);
        if (!opts_.fix_h)
            UpdateH(*G, H);

        double pre_cost = cost->back(), cur_cost = Objf(V, *W, *H);
        cost->push_back(cur_cost);
        KALDI_VLOG(1) << "On iteration " << iter << ": objfunc " << cur_cost;

        if (!KALDI_ISFINITE(cur_cost))
            KALDI_WARN << "Objfunc is not finite on iteration " << iter
                       << ", check zero columns in G or H";

        // stop only when the cost decreased
        if (iter >= 1 && cur_cost < pre_cost && pre_cost - cur_cost < opts_.tolerance) {
            KALDI_LOG << "Convergence reached after " << iter + 1
                      << " iterations, aborting iteration";
            break;
        }
        G0_ = *G;
    }
    KALDI_LOG << "Done " << cost->size() - 1 << " iterations, objfunc "
              << cost->back();
    return cost->back();
}

// Frames are updated in order, F reflects new G for frames before t
// and G of last iteration for the others.
void ConvexHullCNMF::UpdateG(const MatrixBase<BaseFloat> &S,
                             const MatrixBase<BaseFloat> &H,
                             FrameTensor *G, FrameTensor *W) {
    int32 num_frames = G->size(), num_points = S.NumCols(),
          num_basis = H.NumRows(), num_samples = H.NumCols();

    // F = \sum_t G0[t] * shift_right(H, t)
    Matrix<BaseFloat> F;
    ReconstructFromDecomposition(G0_, H, &F);

    Matrix<BaseFloat> H_shifted, numer_pn(num_points, num_samples),
                      denom_pn(num_points, num_samples),
                      numerator(num_points, num_basis),
                      denumerator(num_points, num_basis),
                      diff(num_points, num_basis);

    for (int32 t = 0; t < num_frames; t++) {
        ShiftColumns(H, t, &H_shifted);

        numer_pn.CopyFromMat(S_V_pos_);
        numer_pn.AddMatMat(1, S_S_neg_, kNoTrans, F, kNoTrans, 1);
        numerator.AddMatMat(1, numer_pn, kNoTrans, H_shifted, kTrans, 0);

        denom_pn.CopyFromMat(S_V_neg_);
        denom_pn.AddMatMat(1, S_S_pos_, kNoTrans, F, kNoTrans, 1);
        denumerator.AddMatMat(1, denom_pn, kNoTrans, H_shifted, kTrans, 0);
        denumerator.Add(opts_.g_sparsity);

        Matrix<BaseFloat> &G_t = (*G)[t];
        G_t.CopyFromMat(G0_[t]);
        G_t.MulElements(numerator);
        G_t.DivElements(denumerator);
        NormalizeColumns(&G_t);

        // replace contribution of G0[t] in F
        diff.CopyFromMat(G_t);
        diff.AddMat(-1, G0_[t]);
        F.AddMatMat(1, diff, kNoTrans, H_shifted, kNoTrans, 1);
        F.ApplyFloor(0);

        (*W)[t].AddMatMat(1, S, kNoTrans, G_t, kNoTrans, 0);
    }
}

void ConvexHullCNMF::UpdateH(const FrameTensor &G, Matrix<BaseFloat> *H) {
    int32 num_frames = G.size(), num_basis = H->NumRows(),
          num_samples = H->NumCols();

    // F from the updated G and the old H
    Matrix<BaseFloat> F;
    ReconstructFromDecomposition(G, *H, &F);

    // A * I_shifted + B * F * I_shifted = shift_left(A + B * F, t),
    // so shift once per frame instead of multiplying shifted identity
    Matrix<BaseFloat> numer_pn(S_V_pos_), denom_pn(S_V_neg_);
    numer_pn.AddMatMat(1, S_S_neg_, kNoTrans, F, kNoTrans, 1);
    denom_pn.AddMatMat(1, S_S_pos_, kNoTrans, F, kNoTrans, 1);

    Matrix<BaseFloat> negative_grad(num_basis, num_samples),
                      positive_grad(num_basis, num_samples), shifted;
    for (int32 t = 0; t < num_frames; t++) {
        ShiftColumns(numer_pn, -t, &shifted);
        negative_grad.AddMatMat(1, G[t], kTrans, shifted, kNoTrans, 1);
        ShiftColumns(denom_pn, -t, &shifted);
        positive_grad.AddMatMat(1, G[t], kTrans, shifted, kNoTrans, 1);
    }
    positive_grad.Add(opts_.h_sparsity);

    H->MulElements(negative_grad);
    H->DivElements(positive_grad);
}

}
