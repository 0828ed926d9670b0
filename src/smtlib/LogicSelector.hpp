// LogicSelector.hpp ---
//
// Filename: LogicSelector.hpp
// Author: Abhishek Udupa
// Created: Sun Mar 18 10:44:20 2015 (-0400)
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

// Selection of the logic to declare in a script

#if !defined SMTG_SMTLIB_LOGIC_SELECTOR_HPP_
#define SMTG_SMTLIB_LOGIC_SELECTOR_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../program/Snapshot.hpp"
#include "FeatureDetector.hpp"
#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        class LogicSelector
        {
        private:
            const ProblemFeatures& Features;
            const SMTConfig& Config;
            Program::QueryContextT Context;
            bool HasForalls;
            bool HasAxioms;
            bool HasArrays;
            bool HasUIsOrTables;

            // Lines reporting the unmet requirements, empty if none
            vector<string> GetUnmetRequirements() const;
            string GetCatchAllReason() const;

        public:
            LogicSelector(const ProblemFeatures& Features, const SMTConfig& Config,
                          Program::QueryContextT Context, bool HasForalls,
                          bool HasAxioms, bool HasArrays, bool HasUIsOrTables);
            LogicSelector(const ProblemFeatures& Features, const SMTConfig& Config,
                          const Program::ProblemSnapshot& Snapshot);
            ~LogicSelector();

            // The set-logic line, or a comment when the user asked for
            // no logic. Throws SMTGError when the user gave more than one
            // logic, or the solver cannot handle the problem.
            vector<string> GetLogicLines() const;
        };

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_LOGIC_SELECTOR_HPP_ */

//
// LogicSelector.hpp ends here
