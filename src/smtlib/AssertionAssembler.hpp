// AssertionAssembler.hpp ---
//
// Filename: AssertionAssembler.hpp
// Author: Abhishek Udupa
// Created: Tue Jun  5 12:45:53 2015 (-0400)
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

// Assembly of the final assertions of a script from the
// constraints and the goal

#if !defined SMTG_SMTLIB_ASSERTION_ASSEMBLER_HPP_
#define SMTG_SMTLIB_ASSERTION_ASSEMBLER_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../program/Snapshot.hpp"

namespace SMTG {
    namespace SMTLib {

        // (! Term attr |value| ...), with | and \ in values escaped
        extern string AddAnnotations(const Program::AttributeListT& Attributes,
                                     const string& Term);

        class AssertionAssembler
        {
        private:
            // A literal that must hold (or must not hold, if negative)
            typedef pair<bool, Program::SV> LiteralT;

            struct FinalAssertion
            {
                bool IsSoft;
                Program::AttributeListT Attributes;
                LiteralT Literal;
            };

            const SkolemMapT& SkolemMap;
            const vector<Program::SV>& Foralls;
            u32 NumPostAssigns;
            bool HasDelayedEqualities;

            string MkLiteral(const LiteralT& Literal) const;
            // Nothing for literals that hold trivially
            static bool Positive(const Program::SV& Var, LiteralT& Literal);
            static bool Negative(const Program::SV& Var, LiteralT& Literal);
            string Combine(const vector<FinalAssertion>& HardAsserts) const;

        public:
            AssertionAssembler(const SkolemMapT& SkolemMap,
                               const vector<Program::SV>& Foralls,
                               u32 NumPostAssigns, bool HasDelayedEqualities);
            ~AssertionAssembler();

            // The let bindings, the binder and its assert, and the
            // conjunction of delayed equalities if any
            u32 GetNumCloseParens() const;

            // Without universals, one assert (or assert-soft) per
            // literal, and nothing at all if there is nothing to assert.
            // With universals, the single combined literal closing the
            // binder. Throws SMTGError if universals are mixed with
            // named or soft constraints.
            vector<string> Assemble(const vector<Program::Constraint>& Constraints,
                                    const Program::SV& Goal, bool IsSat) const;
        };

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_ASSERTION_ASSEMBLER_HPP_ */

//
// AssertionAssembler.hpp ends here
