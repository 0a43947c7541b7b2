// src/compute-chcnmf.cc

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

#include "base/kaldi-common.h"
#include "util/common-utils.h"

#include "include/chcnmf.h"


using namespace kaldi;

// feature: (num_samples, dim), as kaldi's feature matrix
// basis:   (dim, num_frames x num_basis), stacked W
// encoding:(num_basis, num_samples)
double FactorizeFeature(ConvexHullCNMF &chcnmf,
                        const MatrixBase<BaseFloat> &feature,
                        int32 num_basis, int32 num_frames,
                        Matrix<BaseFloat> *basis, Matrix<BaseFloat> *encoding,
                        Matrix<BaseFloat> *hull_points,
                        Matrix<BaseFloat> *combination) {
    Matrix<BaseFloat> V(feature, kTrans);
    FrameTensor G, W;
    std::vector<double> cost;
    hull_points->Resize(0, 0);
    encoding->Resize(0, 0);

    double objf = chcnmf.DoCNMF(V, num_basis, num_frames, hull_points,
                                &G, encoding, &W, &cost);
    StackFrames(W, basis);
    StackFrames(G, combination);
    return objf;
}

int main(int argc, char *argv[]) {
    try{
        const char *usage =
            "Do convex hull convolutive NMF on (mixed sign) feature matrices, V^T ~= \\sum_t S * G[t] * H[t->]\n"
            "Basis W[t] = S * G[t] and combination G are written with frames stacked along columns.\n"
            "\n"
            "Usage:  compute-chcnmf [options...] <feats-rspecifier> <basis-wspecifier> (encoding-wspecifier)\n"
            "   or:  compute-chcnmf [options...] <feats-rxfilename> <basis-wxfilename> (encoding-wxfilename)\n";

        ParseOptions po(usage);
        ConvexHullCNMFOptions chcnmf_options;

        int32 num_basis = 8, num_frames = 1, rand_seed = 777;
        bool wx_binary = true;
        std::string hull_out = "", combination_out = "";

        po.Register("num-basis", &num_basis, "Number of basis elements(rows of H)");
        po.Register("num-frames", &num_frames, "Number of context frames of the convolutive basis");
        po.Register("random-seed", &rand_seed, "Seed for random number generator");
        po.Register("binary", &wx_binary, "Write in binary mode (only relevant if output is a wxfilename)");
        po.Register("hull-points", &hull_out, "If not empty, write convex hull points S to it");
        po.Register("combination", &combination_out, "If not empty, write convex combination tensor G to it");

        chcnmf_options.Register(&po);

        po.Read(argc, argv);

        if (po.NumArgs() < 2 || po.NumArgs() > 3) {
            po.PrintUsage();
            exit(1);
        }

        if (num_basis <= 0 || num_frames <= 0)
            KALDI_ERR << "Options --num-basis and --num-frames should be positive";

        std::srand(rand_seed);
        ConvexHullCNMF chcnmf(chcnmf_options);

        std::string feats_in = po.GetArg(1), basis_out = po.GetArg(2), encoding_out = "";

        if (po.NumArgs() == 3)
            encoding_out = po.GetArg(3);

        bool feats_is_rspecifier = (ClassifyRspecifier(feats_in, NULL, NULL) != kNoRspecifier),
            basis_is_wspecifier = (ClassifyWspecifier(basis_out, NULL, NULL, NULL) != kNoWspecifier);

        if (feats_is_rspecifier != basis_is_wspecifier)
            KALDI_ERR << "Cannot mix archives with regular files";

        Matrix<BaseFloat> basis, encoding, hull_points, combination;

        if (feats_is_rspecifier) {

            SequentialBaseFloatMatrixReader feats_reader(feats_in);
            BaseFloatMatrixWriter basis_writer, encoding_writer, hull_writer, combination_writer;

            if (!basis_writer.Open(basis_out))
                KALDI_ERR << "Could not initialize output with wspecifier " << basis_out;
            if (encoding_out != "" && !encoding_writer.Open(encoding_out))
                KALDI_ERR << "Could not initialize output with wspecifier " << encoding_out;
            if (hull_out != "" && !hull_writer.Open(hull_out))
                KALDI_ERR << "Could not initialize output with wspecifier " << hull_out;
            if (combination_out != "" && !combination_writer.Open(combination_out))
                KALDI_ERR << "Could not initialize output with wspecifier " << combination_out;

            int32 num_done = 0, num_err = 0;
            for (; !feats_reader.Done(); feats_reader.Next()) {
                std::string utt_key = feats_reader.Key();
                const Matrix<BaseFloat> &feature = feats_reader.Value();

                if (feature.NumRows() == 0) {
                    KALDI_WARN << "Empty feature matrix for utterance " << utt_key;
                    num_err++;
                    continue;
                }

                double objf = FactorizeFeature(chcnmf, feature, num_basis, num_frames,
                                               &basis, &encoding, &hull_points, &combination);

                basis_writer.Write(utt_key, basis);
                if (encoding_out != "")
                    encoding_writer.Write(utt_key, encoding);
                if (hull_out != "")
                    hull_writer.Write(utt_key, hull_points);
                if (combination_out != "")
                    combination_writer.Write(utt_key, combination);

                num_done += 1;
                if (num_done % 100 == 0)
                    KALDI_LOG << "Processed " << num_done << " utterances";
                KALDI_VLOG(2) << "Perform CH-CNMF for utterance " << utt_key
                              << ", objfunc = " << objf;
            }

            KALDI_LOG << "Done " << num_done << " utterances, " << num_err << " with errors";
            return num_done == 0 ? 1: 0;
        } else {
            Matrix<BaseFloat> feature;
            ReadKaldiObject(feats_in, &feature);

            double objf = FactorizeFeature(chcnmf, feature, num_basis, num_frames,
                                           &basis, &encoding, &hull_points, &combination);

            WriteKaldiObject(basis, basis_out, wx_binary);
            if (encoding_out != "")
                WriteKaldiObject(encoding, encoding_out, wx_binary);
            if (hull_out != "")
                WriteKaldiObject(hull_points, hull_out, wx_binary);
            if (combination_out != "")
                WriteKaldiObject(combination, combination_out, wx_binary);

            KALDI_LOG << "Done processed " << feats_in << ", objfunc = " << objf;
        }

    } catch(const std::exception& e) {
        std::cerr << e.what();
        return -1;
    }
    return 0;
}
