// Snapshot.cpp ---
//
// Filename: Snapshot.cpp
// Author: Abhishek Udupa
// Created: Wed Feb 27 11:01:17 2014 (-0400)
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

#include <unordered_set>

#include "Snapshot.hpp"

namespace SMTG {
    namespace Program {

        TableInfo::TableInfo()
            : TableId(-1)
        {
            // Nothing here
        }

        TableInfo::TableInfo(i32 TableId, const KindRef& IndexKind,
                             const KindRef& ResultKind, const vector<SV>& Elements)
            : TableId(TableId), IndexKind(IndexKind), ResultKind(ResultKind),
              Elements(Elements)
        {
            // Nothing here
        }

        ArrayContext::ArrayContext()
            : Kind(ArrayContextKind::Free), HasInitializer(false),
              BaseArray(-1), ThenArray(-1), ElseArray(-1)
        {
            // Nothing here
        }

        ArrayContext ArrayContext::MkFree()
        {
            return ArrayContext();
        }

        ArrayContext ArrayContext::MkFree(const SV& Initializer)
        {
            ArrayContext Retval;
            Retval.HasInitializer = true;
            Retval.Initializer = Initializer;
            return Retval;
        }

        ArrayContext ArrayContext::MkMutate(i32 BaseArray, const SV& Index, const SV& Value)
        {
            ArrayContext Retval;
            Retval.Kind = ArrayContextKind::Mutate;
            Retval.BaseArray = BaseArray;
            Retval.Index = Index;
            Retval.Value = Value;
            return Retval;
        }

        ArrayContext ArrayContext::MkMerge(const SV& Condition, i32 ThenArray, i32 ElseArray)
        {
            ArrayContext Retval;
            Retval.Kind = ArrayContextKind::Merge;
            Retval.Condition = Condition;
            Retval.ThenArray = ThenArray;
            Retval.ElseArray = ElseArray;
            return Retval;
        }

        ArrayInfo::ArrayInfo()
            : ArrayId(-1)
        {
            // Nothing here
        }

        ArrayInfo::ArrayInfo(i32 ArrayId, const string& Name, const KindRef& DomainKind,
                             const KindRef& RangeKind, const ArrayContext& Context)
            : ArrayId(ArrayId), Name(Name), DomainKind(DomainKind),
              RangeKind(RangeKind), Context(Context)
        {
            // Nothing here
        }

        UninterpretedSymbol::UninterpretedSymbol()
        {
            // Nothing here
        }

        UninterpretedSymbol::UninterpretedSymbol(const string& Name,
                                                 const vector<KindRef>& Signature)
            : Name(Name), Signature(Signature)
        {
            // Nothing here
        }

        Axiom::Axiom()
            : IsDefinition(false)
        {
            // Nothing here
        }

        Axiom::Axiom(bool IsDefinition, const string& Name, const vector<string>& Lines)
            : IsDefinition(IsDefinition), Name(Name), Lines(Lines)
        {
            // Nothing here
        }

        QuantifiedInput::QuantifiedInput()
            : IsUniversal(false)
        {
            // Nothing here
        }

        QuantifiedInput::QuantifiedInput(bool IsUniversal, const SV& Var,
                                         const vector<SV>& Dependencies)
            : IsUniversal(IsUniversal), Var(Var), Dependencies(Dependencies)
        {
            if (IsUniversal && Dependencies.size() > 0) {
                throw SMTGError((string)"Universal variable " + Var.ToString() +
                                " cannot depend on other variables");
            }
        }

        NamedInput::NamedInput()
        {
            // Nothing here
        }

        NamedInput::NamedInput(const SV& Var, const string& UserName)
            : Var(Var), UserName(UserName)
        {
            // Nothing here
        }

        Constraint::Constraint()
            : IsSoft(false), Literal(SV::True()), Negated(false)
        {
            // Nothing here
        }

        Constraint::Constraint(bool IsSoft, const AttributeListT& Attributes,
                               const SV& Literal, bool Negated)
            : IsSoft(IsSoft), Attributes(Attributes), Literal(Literal), Negated(Negated)
        {
            // Nothing here
        }

        ProblemSnapshot::ProblemSnapshot()
            : Context(QueryContextT::Internal), IsSat(true), Goal(SV::True())
        {
            // Nothing here
        }

        vector<SV> ProblemSnapshot::GetForalls() const
        {
            vector<SV> Retval;
            for (auto const& Input : QuantifiedInputs) {
                if (Input.IsUniversal) {
                    Retval.push_back(Input.Var);
                }
            }
            return Retval;
        }

        void ProblemSnapshot::CheckWellFormed() const
        {
            unordered_set<i64> Known = { SV::True().GetNodeId(), SV::False().GetNodeId() };
            for (auto const& Input : Inputs) {
                Known.insert(Input.Var.GetNodeId());
            }
            for (auto const& Input : TrackerVars) {
                Known.insert(Input.Var.GetNodeId());
            }
            for (auto const& Input : QuantifiedInputs) {
                Known.insert(Input.Var.GetNodeId());
            }
            for (auto const& Const : Constants) {
                Known.insert(Const.first.GetNodeId());
            }

            auto CheckKnown = [&] (const SV& Operand, const SV& User) -> void
                {
                    if (Known.find(Operand.GetNodeId()) == Known.end()) {
                        throw SMTGError((string)"Node " + User.ToString() + " refers to " +
                                        Operand.ToString() + ", which is neither an " +
                                        "earlier node, an input nor a constant");
                    }
                };

            i64 LastId = -1;
            for (auto const& Asgn : Assignments) {
                auto NodeId = Asgn.first.GetNodeId();
                if (NodeId <= LastId) {
                    throw SMTGError((string)"Assignments are not in creation order: " +
                                    Asgn.first.ToString() + " follows s" + to_string(LastId));
                }
                LastId = NodeId;

                for (auto const& Arg : Asgn.second.GetArgs()) {
                    CheckKnown(Arg, Asgn.first);
                }
                auto const& Op = Asgn.second.GetOp();
                if (Op.GetCode() == OpKind::LkUp) {
                    CheckKnown(Op.GetLookupIndex(), Asgn.first);
                    CheckKnown(Op.GetLookupDefault(), Asgn.first);
                } else if (Op.GetCode() == OpKind::IEEEFP && Op.GetFPOp() == FPOpKind::Cast) {
                    CheckKnown(Op.GetRoundingModeSV(), Asgn.first);
                }
                Known.insert(NodeId);
            }

            for (auto const& Cstr : Constraints) {
                CheckKnown(Cstr.Literal, Cstr.Literal);
            }
            CheckKnown(Goal, Goal);

            // Tables and arrays may be set up from any node
            auto CheckEntityKnown = [&] (const SV& Operand, const string& User) -> void
                {
                    if (Known.find(Operand.GetNodeId()) == Known.end()) {
                        throw SMTGError(User + " refers to " + Operand.ToString() +
                                        ", which is neither a node, an input nor a constant");
                    }
                };

            for (auto const& Table : Tables) {
                for (auto const& Element : Table.Elements) {
                    CheckEntityKnown(Element, "table" + to_string(Table.TableId));
                }
            }

            unordered_set<i32> KnownArrays;
            for (auto const& Array : Arrays) {
                KnownArrays.insert(Array.ArrayId);
            }
            for (auto const& Array : Arrays) {
                auto&& Name = "array_" + to_string(Array.ArrayId);
                auto const& Ctx = Array.Context;
                auto CheckArrayKnown = [&] (i32 OtherId) -> void
                    {
                        if (KnownArrays.find(OtherId) == KnownArrays.end()) {
                            throw SMTGError(Name + " refers to array_" + to_string(OtherId) +
                                            ", which is not part of the problem");
                        }
                    };

                switch (Ctx.Kind) {
                case ArrayContextKind::Free:
                    if (Ctx.HasInitializer) {
                        CheckEntityKnown(Ctx.Initializer, Name);
                    }
                    break;
                case ArrayContextKind::Mutate:
                    CheckArrayKnown(Ctx.BaseArray);
                    CheckEntityKnown(Ctx.Index, Name);
                    CheckEntityKnown(Ctx.Value, Name);
                    break;
                case ArrayContextKind::Merge:
                    CheckEntityKnown(Ctx.Condition, Name);
                    CheckArrayKnown(Ctx.ThenArray);
                    CheckArrayKnown(Ctx.ElseArray);
                    break;
                }
            }
        }

        IncrementalSnapshot::IncrementalSnapshot()
        {
            // Nothing here
        }

    } /* end namespace Program */
} /* end namespace SMTG */

//
// Snapshot.cpp ends here
