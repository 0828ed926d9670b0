// ScriptCompiler.hpp ---
//
// Filename: ScriptCompiler.hpp
// Author: Abhishek Udupa
// Created: Mon Nov 26 19:40:18 2015 (-0400)
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

// The entry points of the translator: a complete script
// for a problem snapshot, and the delta for an open session

#if !defined SMTG_SMTLIB_SCRIPT_COMPILER_HPP_
#define SMTG_SMTLIB_SCRIPT_COMPILER_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../program/Snapshot.hpp"
#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        class ScriptCompiler
        {
        private:
            const SMTConfig& Config;

            vector<string> GetUserSettings() const;
            vector<string> GetFlattenSettings(const Kinds::KindSetT& Kinds) const;

        public:
            ScriptCompiler(const SMTConfig& Config);
            ~ScriptCompiler();

            // Throws SMTGError for ill-formed snapshots, conflicting
            // logic overrides, unsupported features and quantifiers
            // mixed with named or soft constraints. No lines are
            // returned in any of these cases.
            vector<string> Compile(const Program::ProblemSnapshot& Snapshot) const;
            // Only the lines needed to bring an open session up to
            // date with the delta. Never opens a quantifier.
            vector<string> CompileIncremental(const Program::IncrementalSnapshot& Delta) const;
        };

        extern vector<string> CompileScript(const Program::ProblemSnapshot& Snapshot,
                                            const SMTConfig& Config);
        extern vector<string> CompileIncremental(const Program::IncrementalSnapshot& Delta,
                                                 const SMTConfig& Config);

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_SCRIPT_COMPILER_HPP_ */

//
// ScriptCompiler.hpp ends here
