// Snapshot.hpp ---
//
// Filename: Snapshot.hpp
// Author: Abhishek Udupa
// Created: Mon Aug 18 20:36:54 2014 (-0400)
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

// The immutable snapshot of a symbolic program handed to
// the script compiler, and the delta snapshot used by the
// incremental compiler

#if !defined SMTG_PROGRAM_SNAPSHOT_HPP_
#define SMTG_PROGRAM_SNAPSHOT_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../kinds/Kinds.hpp"
#include "Values.hpp"
#include "Operators.hpp"

namespace SMTG {
    namespace Program {

        typedef vector<pair<SV, CV>> ConstantListT;
        typedef vector<pair<string, string>> AttributeListT;

        // A memoized lookup function, indexed from 0
        struct TableInfo
        {
            i32 TableId;
            KindRef IndexKind;
            KindRef ResultKind;
            vector<SV> Elements;

            TableInfo();
            TableInfo(i32 TableId, const KindRef& IndexKind,
                      const KindRef& ResultKind, const vector<SV>& Elements);
        };

        enum class ArrayContextKind {
            Free, Mutate, Merge
        };

        // How an array came to be
        struct ArrayContext
        {
            ArrayContextKind Kind;
            // Free arrays, optionally initialized to a constant value
            bool HasInitializer;
            SV Initializer;
            // Mutations: BaseArray with Index updated to Value
            i32 BaseArray;
            SV Index;
            SV Value;
            // Merges: Condition ? ThenArray : ElseArray
            SV Condition;
            i32 ThenArray;
            i32 ElseArray;

            ArrayContext();

            static ArrayContext MkFree();
            static ArrayContext MkFree(const SV& Initializer);
            static ArrayContext MkMutate(i32 BaseArray, const SV& Index, const SV& Value);
            static ArrayContext MkMerge(const SV& Condition, i32 ThenArray, i32 ElseArray);
        };

        struct ArrayInfo
        {
            i32 ArrayId;
            string Name;
            KindRef DomainKind;
            KindRef RangeKind;
            ArrayContext Context;

            ArrayInfo();
            ArrayInfo(i32 ArrayId, const string& Name, const KindRef& DomainKind,
                      const KindRef& RangeKind, const ArrayContext& Context);
        };

        // Signature lists the argument kinds followed by the result kind
        struct UninterpretedSymbol
        {
            string Name;
            vector<KindRef> Signature;

            UninterpretedSymbol();
            UninterpretedSymbol(const string& Name, const vector<KindRef>& Signature);
        };

        struct Axiom
        {
            bool IsDefinition;
            string Name;
            vector<string> Lines;

            Axiom();
            Axiom(bool IsDefinition, const string& Name, const vector<string>& Lines);
        };

        // Universal variables, or existentials along with
        // the universals they depend on
        struct QuantifiedInput
        {
            bool IsUniversal;
            SV Var;
            vector<SV> Dependencies;

            QuantifiedInput();
            QuantifiedInput(bool IsUniversal, const SV& Var,
                            const vector<SV>& Dependencies = vector<SV>());
        };

        struct NamedInput
        {
            SV Var;
            string UserName;

            NamedInput();
            NamedInput(const SV& Var, const string& UserName);
        };

        // Negated constraints require the literal to be false
        struct Constraint
        {
            bool IsSoft;
            AttributeListT Attributes;
            SV Literal;
            bool Negated;

            Constraint();
            Constraint(bool IsSoft, const AttributeListT& Attributes,
                       const SV& Literal, bool Negated = false);
        };

        enum class QueryContextT {
            Internal, External
        };

        struct ProblemSnapshot
        {
            QueryContextT Context;
            // true for satisfiability, false for validity
            bool IsSat;
            vector<string> Comments;
            Kinds::KindSetT Kinds;
            vector<NamedInput> Inputs;
            vector<NamedInput> TrackerVars;
            vector<QuantifiedInput> QuantifiedInputs;
            ConstantListT Constants;
            vector<TableInfo> Tables;
            vector<ArrayInfo> Arrays;
            vector<UninterpretedSymbol> Uninterpreteds;
            vector<Axiom> Axioms;
            vector<Assignment> Assignments;
            vector<Constraint> Constraints;
            SV Goal;

            ProblemSnapshot();

            vector<SV> GetForalls() const;
            // Throws SMTGError if the node ids of the assignments
            // are not strictly increasing, or if an operand is
            // neither an earlier node, an input nor a constant, or
            // if a table or array is set up from an unknown node or array
            void CheckWellFormed() const;
        };

        struct IncrementalSnapshot
        {
            vector<NamedInput> NewInputs;
            Kinds::KindSetT NewKinds;
            // every constant known to the session, and the ones
            // that are new in this delta
            ConstantListT AllConstants;
            ConstantListT NewConstants;
            vector<ArrayInfo> Arrays;
            vector<TableInfo> Tables;
            vector<UninterpretedSymbol> Uninterpreteds;
            vector<Assignment> Assignments;
            vector<Constraint> Constraints;

            IncrementalSnapshot();
        };

    } /* end namespace Program */
} /* end namespace SMTG */

#endif /* SMTG_PROGRAM_SNAPSHOT_HPP_ */

//
// Snapshot.hpp ends here
