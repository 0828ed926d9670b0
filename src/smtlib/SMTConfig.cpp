// SMTConfig.cpp ---
//
// Filename: SMTConfig.cpp
// Author: Abhishek Udupa
// Created: Fri Oct  2 10:08:47 2015 (-0400)
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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>

#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        Logic::Logic()
            : Name("ALL")
        {
            // Nothing here
        }

        Logic::Logic(const string& Name)
            : Name(Name)
        {
            if (Name.length() == 0) {
                throw SMTGError("Logic names cannot be empty");
            }
        }

        Logic::~Logic()
        {
            // Nothing here
        }

        const string& Logic::GetName() const
        {
            return Name;
        }

        bool Logic::IsNone() const
        {
            return (Name == "NONE");
        }

        string Logic::ToString(u32 Verbosity) const
        {
            if (IsNone()) {
                return "Logic_NONE";
            }
            return Name;
        }

        Logic Logic::None()
        {
            return Logic("NONE");
        }

        SMTOption::SMTOption(SMTOptionKind Kind)
            : Kind(Kind), BoolValue(false), IntValue(0)
        {
            // Nothing here
        }

        SMTOption::~SMTOption()
        {
            // Nothing here
        }

        SMTOptionKind SMTOption::GetKind() const
        {
            return Kind;
        }

        bool SMTOption::IsLogic() const
        {
            return (Kind == SMTOptionKind::SetLogic);
        }

        bool SMTOption::IsDiagnosticOutput() const
        {
            return (Kind == SMTOptionKind::DiagnosticOutputChannel);
        }

        const Logic& SMTOption::GetLogic() const
        {
            if (Kind != SMTOptionKind::SetLogic) {
                throw InternalError((string)"GetLogic() called on option " + ToString() +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            return LogicValue;
        }

        static inline string SetOptionCmd(const string& Keyword, const string& Value)
        {
            return "(set-option " + Keyword + " " + Value + ")";
        }

        static inline string SMTBool(bool Value)
        {
            return (Value ? "true" : "false");
        }

        string SMTOption::ToSMTLib() const
        {
            switch (Kind) {
            case SMTOptionKind::DiagnosticOutputChannel:
                return SetOptionCmd(":diagnostic-output-channel", "\"" + StrValue + "\"");
            case SMTOptionKind::ProduceAssertions:
                return SetOptionCmd(":produce-assertions", SMTBool(BoolValue));
            case SMTOptionKind::ProduceAssignments:
                return SetOptionCmd(":produce-assignments", SMTBool(BoolValue));
            case SMTOptionKind::ProduceProofs:
                return SetOptionCmd(":produce-proofs", SMTBool(BoolValue));
            case SMTOptionKind::ProduceInterpolants:
                return SetOptionCmd(":produce-interpolants", SMTBool(BoolValue));
            case SMTOptionKind::ProduceUnsatAssumptions:
                return SetOptionCmd(":produce-unsat-assumptions", SMTBool(BoolValue));
            case SMTOptionKind::ProduceUnsatCores:
                return SetOptionCmd(":produce-unsat-cores", SMTBool(BoolValue));
            case SMTOptionKind::RandomSeed:
                return SetOptionCmd(":random-seed", to_string(IntValue));
            case SMTOptionKind::ReproducibleResourceLimit:
                return SetOptionCmd(":reproducible-resource-limit", to_string(IntValue));
            case SMTOptionKind::SMTVerbosity:
                return SetOptionCmd(":verbosity", to_string(IntValue));
            case SMTOptionKind::SetTimeOut:
                return SetOptionCmd(":timeout", to_string(IntValue));
            case SMTOptionKind::OptionKeyword: {
                vector<string> Parts = { StrValue };
                Parts.insert(Parts.end(), Arguments.begin(), Arguments.end());
                return "(set-option " + boost::algorithm::join(Parts, " ") + ")";
            }
            case SMTOptionKind::SetInfo: {
                vector<string> Parts = { StrValue };
                Parts.insert(Parts.end(), Arguments.begin(), Arguments.end());
                return "(set-info " + boost::algorithm::join(Parts, " ") + ")";
            }
            case SMTOptionKind::SetLogic:
                if (LogicValue.IsNone()) {
                    return "; NB. not setting the logic per user request of Logic_NONE";
                }
                return "(set-logic " + LogicValue.GetName() + ")";
            }
            throw InternalError((string)"Unhandled solver option kind" +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

        string SMTOption::ToString(u32 Verbosity) const
        {
            if (Kind == SMTOptionKind::SetLogic) {
                return "SetLogic " + LogicValue.ToString();
            }
            return ToSMTLib();
        }

        SMTOption SMTOption::MkDiagnosticOutputChannel(const string& Channel)
        {
            SMTOption Retval(SMTOptionKind::DiagnosticOutputChannel);
            Retval.StrValue = Channel;
            return Retval;
        }

        SMTOption SMTOption::MkProduceAssertions(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceAssertions);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkProduceAssignments(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceAssignments);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkProduceProofs(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceProofs);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkProduceInterpolants(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceInterpolants);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkProduceUnsatAssumptions(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceUnsatAssumptions);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkProduceUnsatCores(bool Value)
        {
            SMTOption Retval(SMTOptionKind::ProduceUnsatCores);
            Retval.BoolValue = Value;
            return Retval;
        }

        SMTOption SMTOption::MkRandomSeed(i64 Seed)
        {
            SMTOption Retval(SMTOptionKind::RandomSeed);
            Retval.IntValue = Seed;
            return Retval;
        }

        SMTOption SMTOption::MkReproducibleResourceLimit(i64 Limit)
        {
            SMTOption Retval(SMTOptionKind::ReproducibleResourceLimit);
            Retval.IntValue = Limit;
            return Retval;
        }

        SMTOption SMTOption::MkVerbosity(i64 Level)
        {
            SMTOption Retval(SMTOptionKind::SMTVerbosity);
            Retval.IntValue = Level;
            return Retval;
        }

        SMTOption SMTOption::MkOptionKeyword(const string& Keyword,
                                             const vector<string>& Arguments)
        {
            if (Keyword.length() == 0 || Keyword[0] != ':') {
                throw SMTGError((string)"Option keywords must begin with a colon, got: \"" +
                                Keyword + "\"");
            }
            SMTOption Retval(SMTOptionKind::OptionKeyword);
            Retval.StrValue = Keyword;
            Retval.Arguments = Arguments;
            return Retval;
        }

        SMTOption SMTOption::MkSetLogic(const Logic& TheLogic)
        {
            SMTOption Retval(SMTOptionKind::SetLogic);
            Retval.LogicValue = TheLogic;
            return Retval;
        }

        SMTOption SMTOption::MkSetInfo(const string& Keyword,
                                       const vector<string>& Arguments)
        {
            if (Keyword.length() == 0 || Keyword[0] != ':') {
                throw SMTGError((string)"Info keywords must begin with a colon, got: \"" +
                                Keyword + "\"");
            }
            SMTOption Retval(SMTOptionKind::SetInfo);
            Retval.StrValue = Keyword;
            Retval.Arguments = Arguments;
            return Retval;
        }

        SMTOption SMTOption::MkTimeOut(i64 Milliseconds)
        {
            SMTOption Retval(SMTOptionKind::SetTimeOut);
            Retval.IntValue = Milliseconds;
            return Retval;
        }

        SolverCapabilities::SolverCapabilities()
            : Name("Unknown"), SupportsQuantifiers(false), SupportsDefineFun(true),
              SupportsDistinct(true), SupportsBitVectors(false),
              SupportsUninterpretedSorts(false), SupportsUnboundedInts(false),
              SupportsReals(false), SupportsIEEE754(false), SupportsSets(false),
              SupportsOptimization(false), SupportsPseudoBooleans(false),
              SupportsDataTypes(false), SupportsDirectAccessors(false),
              SupportsInt2bv(false)
        {
            // Nothing here
        }

        SolverCapabilities MkZ3Capabilities()
        {
            SolverCapabilities Retval;
            Retval.Name = "Z3";
            Retval.SupportsQuantifiers = true;
            Retval.SupportsBitVectors = true;
            Retval.SupportsUninterpretedSorts = true;
            Retval.SupportsUnboundedInts = true;
            Retval.SupportsReals = true;
            Retval.SupportsIEEE754 = true;
            Retval.SupportsSets = true;
            Retval.SupportsOptimization = true;
            Retval.SupportsPseudoBooleans = true;
            Retval.SupportsDataTypes = true;
            Retval.SupportsInt2bv = true;
            Retval.FlattenedModelSettings = {
                "(set-option :pp.max_depth 4294967295)",
                "(set-option :pp.min_alias_size 4294967295)",
                "(set-option :model.inline_def true)"
            };
            return Retval;
        }

        SolverCapabilities MkCVC5Capabilities()
        {
            SolverCapabilities Retval;
            Retval.Name = "CVC5";
            Retval.SupportsQuantifiers = true;
            Retval.SupportsBitVectors = true;
            Retval.SupportsUninterpretedSorts = true;
            Retval.SupportsUnboundedInts = true;
            Retval.SupportsReals = true;
            Retval.SupportsIEEE754 = true;
            Retval.SupportsSets = true;
            Retval.SupportsDataTypes = true;
            Retval.SupportsDirectAccessors = true;
            Retval.SupportsInt2bv = true;
            return Retval;
        }

        SolverCapabilities MkYicesCapabilities()
        {
            SolverCapabilities Retval;
            Retval.Name = "Yices";
            Retval.SupportsBitVectors = true;
            Retval.SupportsUninterpretedSorts = true;
            Retval.SupportsUnboundedInts = true;
            Retval.SupportsReals = true;
            return Retval;
        }

        SolverCapabilities MkBoolectorCapabilities()
        {
            SolverCapabilities Retval;
            Retval.Name = "Boolector";
            Retval.SupportsBitVectors = true;
            return Retval;
        }

        SolverCapabilities MkMathSATCapabilities()
        {
            SolverCapabilities Retval;
            Retval.Name = "MathSAT";
            Retval.SupportsBitVectors = true;
            Retval.SupportsUninterpretedSorts = true;
            Retval.SupportsUnboundedInts = true;
            Retval.SupportsReals = true;
            Retval.SupportsIEEE754 = true;
            Retval.SupportsDataTypes = true;
            return Retval;
        }

        SolverCapabilities GetSolverCapabilities(const string& SolverName)
        {
            auto&& LowerName = boost::algorithm::to_lower_copy(SolverName);
            if (LowerName == "z3") {
                return MkZ3Capabilities();
            } else if (LowerName == "cvc5") {
                return MkCVC5Capabilities();
            } else if (LowerName == "yices") {
                return MkYicesCapabilities();
            } else if (LowerName == "boolector") {
                return MkBoolectorCapabilities();
            } else if (LowerName == "mathsat") {
                return MkMathSATCapabilities();
            }
            throw SMTGError((string)"Unknown solver \"" + SolverName + "\". Known solvers " +
                            "are: Z3, CVC5, Yices, Boolector and MathSAT");
        }

        SMTConfig::SMTConfig()
            : RoundingMode(Program::RoundingModeT::RoundNearestTiesToEven),
              Capabilities(MkZ3Capabilities())
        {
            // Nothing here
        }

        SMTConfig::SMTConfig(const SolverCapabilities& Capabilities)
            : RoundingMode(Program::RoundingModeT::RoundNearestTiesToEven),
              Capabilities(Capabilities)
        {
            // Nothing here
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// SMTConfig.cpp ends here
