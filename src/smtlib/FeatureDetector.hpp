// FeatureDetector.hpp ---
//
// Filename: FeatureDetector.hpp
// Author: Abhishek Udupa
// Created: Fri Nov  9 08:46:26 2015 (-0400)
//
//
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
//

// Code:

// Detection of the theories and constructs a problem uses

#if !defined SMTG_SMTLIB_FEATURE_DETECTOR_HPP_
#define SMTG_SMTLIB_FEATURE_DETECTOR_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../kinds/Kinds.hpp"
#include "../program/Snapshot.hpp"

namespace SMTG {
    namespace SMTLib {

        using Kinds::KindRef;
        using Kinds::KindSetT;

        struct ProblemFeatures : public Stringifiable
        {
            bool HasInteger;
            bool HasReal;
            bool HasFP;
            bool HasString;
            bool HasRegExp;
            bool HasChar;
            bool HasRounding;
            bool HasBVs;
            bool HasNonBVArrays;
            bool HasArrayInits;
            bool HasOverflows;
            bool HasList;
            bool HasSets;
            bool HasTuples;
            bool HasEither;
            bool HasMaybe;
            bool HasRational;
            bool NeedsFlattening;
            // every user sort, including RoundingMode, in kind order
            vector<KindRef> UserSorts;
            // user sorts other than RoundingMode
            vector<string> TrueUserSorts;
            // ascending, without duplicates
            vector<u32> TupleArities;
            // kinds reversed by the program, in order of first use
            vector<KindRef> ReversedKinds;

            ProblemFeatures();
            virtual ~ProblemFeatures();

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        // Only the features that depend on the kinds alone
        extern ProblemFeatures DetectKindFeatures(const KindSetT& Kinds);
        extern ProblemFeatures DetectFeatures(const KindSetT& Kinds,
                                              const vector<Program::Assignment>& Assignments,
                                              const vector<Program::ArrayInfo>& Arrays);
        extern ProblemFeatures DetectFeatures(const Program::ProblemSnapshot& Snapshot);

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_FEATURE_DETECTOR_HPP_ */

//
// FeatureDetector.hpp ends here
