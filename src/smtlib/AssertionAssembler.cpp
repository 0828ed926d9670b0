// AssertionAssembler.cpp ---
//
// Filename: AssertionAssembler.cpp
// Author: Abhishek Udupa
// Created: Thu Aug  4 21:44:03 2015 (-0400)
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

#include <algorithm>
#include <boost/algorithm/string/join.hpp>

#include "AssertionAssembler.hpp"
#include "ExprTranslator.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Program;
        using boost::algorithm::join;

        string AddAnnotations(const AttributeListT& Attributes, const string& Term)
        {
            if (Attributes.size() == 0) {
                return Term;
            }

            vector<string> Attrs;
            for (auto const& Attr : Attributes) {
                string Sanitized;
                for (auto c : Attr.second) {
                    if (c == '|') {
                        Sanitized += "_bar_";
                    } else if (c == '\\') {
                        Sanitized += "_backslash_";
                    } else {
                        Sanitized += c;
                    }
                }
                Attrs.push_back(Attr.first + " |" + Sanitized + "|");
            }
            return "(! " + Term + " " + join(Attrs, " ") + ")";
        }

        AssertionAssembler::AssertionAssembler(const SkolemMapT& SkolemMap,
                                               const vector<SV>& Foralls,
                                               u32 NumPostAssigns, bool HasDelayedEqualities)
            : SkolemMap(SkolemMap), Foralls(Foralls), NumPostAssigns(NumPostAssigns),
              HasDelayedEqualities(HasDelayedEqualities)
        {
            // Nothing here
        }

        AssertionAssembler::~AssertionAssembler()
        {
            // Nothing here
        }

        u32 AssertionAssembler::GetNumCloseParens() const
        {
            if (Foralls.size() == 0) {
                return 0;
            }
            return NumPostAssigns + 2 + (HasDelayedEqualities ? 1 : 0);
        }

        string AssertionAssembler::MkLiteral(const LiteralT& Literal) const
        {
            if (Literal.first) {
                return "(not " + CvtSV(SkolemMap, Literal.second) + ")";
            }
            return CvtSV(SkolemMap, Literal.second);
        }

        bool AssertionAssembler::Positive(const SV& Var, LiteralT& Literal)
        {
            if (Var.IsTrue()) {
                return false;
            }
            Literal = make_pair(false, Var.IsFalse() ? SV::False() : Var);
            return true;
        }

        bool AssertionAssembler::Negative(const SV& Var, LiteralT& Literal)
        {
            if (Var.IsFalse()) {
                return false;
            }
            if (Var.IsTrue()) {
                Literal = make_pair(false, SV::False());
            } else {
                Literal = make_pair(true, Var);
            }
            return true;
        }

        string AssertionAssembler::Combine(const vector<FinalAssertion>& HardAsserts) const
        {
            vector<LiteralT> Literals;
            for (auto const& Assertion : HardAsserts) {
                Literals.push_back(Assertion.Literal);
            }
            sort(Literals.begin(), Literals.end());
            Literals.erase(unique(Literals.begin(), Literals.end()), Literals.end());

            auto Redundant = [] (const LiteralT& Literal) -> bool
                {
                    return (Literal.first ? Literal.second.IsFalse() : Literal.second.IsTrue());
                };
            Literals.erase(remove_if(Literals.begin(), Literals.end(), Redundant),
                           Literals.end());

            if (Literals.size() == 0) {
                return "true";
            } else if (Literals.size() == 1) {
                return MkLiteral(Literals[0]);
            }

            vector<string> Strs;
            for (auto const& Literal : Literals) {
                if (Literal.first ? Literal.second.IsTrue() : Literal.second.IsFalse()) {
                    return "false";
                }
                Strs.push_back(MkLiteral(Literal));
            }
            return "(and " + join(Strs, " ") + ")";
        }

        vector<string> AssertionAssembler::Assemble(const vector<Constraint>& Constraints,
                                                    const SV& Goal, bool IsSat) const
        {
            vector<FinalAssertion> Finals;
            for (auto const& Cstr : Constraints) {
                FinalAssertion Final;
                Final.IsSoft = Cstr.IsSoft;
                Final.Attributes = Cstr.Attributes;
                bool Keep = Cstr.Negated ? Negative(Cstr.Literal, Final.Literal) :
                    Positive(Cstr.Literal, Final.Literal);
                if (Keep) {
                    Finals.push_back(Final);
                }
            }

            // the goal is asserted for satisfiability,
            // and refuted for validity
            FinalAssertion GoalAssertion;
            GoalAssertion.IsSoft = false;
            bool KeepGoal = IsSat ? Positive(Goal, GoalAssertion.Literal) :
                Negative(Goal, GoalAssertion.Literal);
            if (KeepGoal) {
                Finals.push_back(GoalAssertion);
            }

            bool NoConstraints = (Finals.size() == 0);
            if (NoConstraints) {
                FinalAssertion Trivial;
                Trivial.IsSoft = false;
                Trivial.Literal = make_pair(false, SV::True());
                Finals.push_back(Trivial);
            }

            vector<FinalAssertion> HardAsserts;
            vector<FinalAssertion> SoftAsserts;
            vector<string> NamedAsserts;
            for (auto const& Final : Finals) {
                if (Final.IsSoft) {
                    SoftAsserts.push_back(Final);
                } else {
                    HardAsserts.push_back(Final);
                }
                if (Final.Attributes.size() > 0) {
                    string Name = "<anonymous>";
                    for (auto const& Attr : Final.Attributes) {
                        if (Attr.first == ":named") {
                            Name = Attr.second;
                            break;
                        }
                    }
                    NamedAsserts.push_back("\"" + Name + "\"");
                }
            }

            vector<string> Retval;
            if (Foralls.size() == 0) {
                if (NoConstraints) {
                    return Retval;
                }
                for (auto const& Final : HardAsserts) {
                    Retval.push_back("(assert " +
                                     AddAnnotations(Final.Attributes, MkLiteral(Final.Literal)) +
                                     ")");
                }
                for (auto const& Final : SoftAsserts) {
                    Retval.push_back("(assert-soft " +
                                     AddAnnotations(Final.Attributes, MkLiteral(Final.Literal)) +
                                     ")");
                }
                return Retval;
            }

            vector<string> ForallNames;
            for (auto const& Forall : Foralls) {
                ForallNames.push_back(Forall.ToString());
            }

            if (NamedAsserts.size() > 0) {
                throw SMTGError((string)"Constraints with attributes and quantifiers " +
                                "cannot be mixed!\n" +
                                "   Quantified variables: " + join(ForallNames, " ") + "\n" +
                                "   Named constraints   : " + join(NamedAsserts, ", "));
            }
            if (SoftAsserts.size() > 0) {
                vector<string> Softs;
                for (auto const& Final : SoftAsserts) {
                    Softs.push_back(MkLiteral(Final.Literal));
                }
                throw SMTGError((string)"Soft constraints and quantifiers " +
                                "cannot be mixed!\n" +
                                "   Quantified variables: " + join(ForallNames, " ") + "\n" +
                                "   Soft constraints    : " + join(Softs, ", "));
            }

            string Line = string(12, ' ') + Combine(HardAsserts);
            if (HasDelayedEqualities) {
                Line = string(5, ' ') + Line;
            }
            Retval.push_back(Line + string(GetNumCloseParens(), ')'));
            return Retval;
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// AssertionAssembler.cpp ends here
