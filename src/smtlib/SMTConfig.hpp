// SMTConfig.hpp ---
//
// Filename: SMTConfig.hpp
// Author: Abhishek Udupa
// Created: Fri Feb 23 03:33:31 2014 (-0400)
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

// Solver options, logics, capability records and the
// configuration handed to the script compiler

#if !defined SMTG_SMTLIB_SMTCONFIG_HPP_
#define SMTG_SMTLIB_SMTCONFIG_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../program/Values.hpp"

namespace SMTG {
    namespace SMTLib {

        class Logic : public Stringifiable
        {
        private:
            string Name;

        public:
            Logic();
            Logic(const string& Name);
            virtual ~Logic();

            const string& GetName() const;
            // The logic "NONE" asks for no set-logic command at all
            bool IsNone() const;

            virtual string ToString(u32 Verbosity = 0) const override;

            static Logic None();
        };

        enum class SMTOptionKind {
            DiagnosticOutputChannel, ProduceAssertions, ProduceAssignments,
            ProduceProofs, ProduceInterpolants, ProduceUnsatAssumptions,
            ProduceUnsatCores, RandomSeed, ReproducibleResourceLimit,
            SMTVerbosity, OptionKeyword, SetLogic, SetInfo, SetTimeOut
        };

        class SMTOption : public Stringifiable
        {
        private:
            SMTOptionKind Kind;
            bool BoolValue;
            i64 IntValue;
            // channel names, keywords and info names
            string StrValue;
            vector<string> Arguments;
            Logic LogicValue;

            SMTOption(SMTOptionKind Kind);

        public:
            virtual ~SMTOption();

            SMTOptionKind GetKind() const;
            bool IsLogic() const;
            bool IsDiagnosticOutput() const;
            const Logic& GetLogic() const;

            // The set-option/set-info command for this option
            string ToSMTLib() const;
            virtual string ToString(u32 Verbosity = 0) const override;

            static SMTOption MkDiagnosticOutputChannel(const string& Channel);
            static SMTOption MkProduceAssertions(bool Value);
            static SMTOption MkProduceAssignments(bool Value);
            static SMTOption MkProduceProofs(bool Value);
            static SMTOption MkProduceInterpolants(bool Value);
            static SMTOption MkProduceUnsatAssumptions(bool Value);
            static SMTOption MkProduceUnsatCores(bool Value);
            static SMTOption MkRandomSeed(i64 Seed);
            static SMTOption MkReproducibleResourceLimit(i64 Limit);
            static SMTOption MkVerbosity(i64 Level);
            static SMTOption MkOptionKeyword(const string& Keyword,
                                             const vector<string>& Arguments);
            static SMTOption MkSetLogic(const Logic& TheLogic);
            static SMTOption MkSetInfo(const string& Keyword,
                                       const vector<string>& Arguments);
            static SMTOption MkTimeOut(i64 Milliseconds);
        };

        // What the target solver accepts. Read only.
        struct SolverCapabilities
        {
            string Name;
            bool SupportsQuantifiers;
            bool SupportsDefineFun;
            bool SupportsDistinct;
            bool SupportsBitVectors;
            bool SupportsUninterpretedSorts;
            bool SupportsUnboundedInts;
            bool SupportsReals;
            bool SupportsIEEE754;
            bool SupportsSets;
            bool SupportsOptimization;
            bool SupportsPseudoBooleans;
            bool SupportsDataTypes;
            bool SupportsDirectAccessors;
            bool SupportsInt2bv;
            // options to send when models need flattening; empty
            // if the solver does not support flattened models
            vector<string> FlattenedModelSettings;

            SolverCapabilities();
        };

        extern SolverCapabilities MkZ3Capabilities();
        extern SolverCapabilities MkCVC5Capabilities();
        extern SolverCapabilities MkYicesCapabilities();
        extern SolverCapabilities MkBoolectorCapabilities();
        extern SolverCapabilities MkMathSATCapabilities();
        // Case insensitive lookup of the presets above
        extern SolverCapabilities GetSolverCapabilities(const string& SolverName);

        struct SMTConfig
        {
            Program::RoundingModeT RoundingMode;
            vector<SMTOption> SolverSetOptions;
            SolverCapabilities Capabilities;

            SMTConfig();
            SMTConfig(const SolverCapabilities& Capabilities);
        };

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_SMTCONFIG_HPP_ */

//
// SMTConfig.hpp ends here
