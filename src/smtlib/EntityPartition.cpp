// EntityPartition.cpp ---
//
// Filename: EntityPartition.cpp
// Author: Abhishek Udupa
// Created: Wed Jul 26 02:11:37 2014 (-0400)
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

#include "EntityPartition.hpp"
#include "ExprTranslator.hpp"
#include "../utils/LogManager.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Kinds;
        using namespace Program;

        static inline const CV* FindConstant(const ConstantListT& Constants, const SV& Var)
        {
            for (auto const& Entry : Constants) {
                if (Entry.first == Var) {
                    return &(Entry.second);
                }
            }
            return nullptr;
        }

        bool IsConstantSV(const ConstantListT& Constants, const SV& Var)
        {
            return (Var.IsTrue() || Var.IsFalse() || FindConstant(Constants, Var) != nullptr);
        }

        // The initializer definitions and the combined initializer
        // of a table or an array named Name
        static inline string MkInit(const string& Name, u32 Index)
        {
            return Name + "_initializer_" + to_string(Index);
        }

        static inline string WrapInit(const string& Name, u32 Index, const string& Equality)
        {
            return "(define-fun " + MkInit(Name, Index) + " () Bool " + Equality + ")";
        }

        static inline vector<string> MkSetup(const string& Name, u32 NumInits)
        {
            auto&& Initializer = Name + "_initializer";
            if (NumInits == 0) {
                return { "(define-fun " + Initializer + " () Bool true) ; no initialization needed" };
            } else if (NumInits == 1) {
                return {
                    "(define-fun " + Initializer + " () Bool " + MkInit(Name, 0) + ")",
                    "(assert " + Initializer + ")"
                };
            }
            vector<string> Inits;
            for (u32 i = 0; i < NumInits; ++i) {
                Inits.push_back(MkInit(Name, i));
            }
            return {
                "(define-fun " + Initializer + " () Bool (and " +
                boost::algorithm::join(Inits, " ") + "))",
                "(assert " + Initializer + ")"
            };
        }

        TableData GenTableData(const SMTConfig& Config, const SkolemMapT& SkolemMap,
                               const string& ForallArgs, const ConstantListT& Constants,
                               const TableInfo& Table)
        {
            TableData Retval;
            Retval.Table = Table;
            Retval.IsConstant = true;

            auto&& Name = "table" + to_string(Table.TableId);
            vector<pair<string, string>> Pre;
            vector<pair<string, string>> Post;

            for (u32 i = 0; i < Table.Elements.size(); ++i) {
                auto const& Elem = Table.Elements[i];
                auto&& Index = CV::MkConst(Table.IndexKind, BigInt(i)).ToSMTLib(Config.RoundingMode);
                auto&& Value = CvtSV(SkolemMap, Elem);
                if (IsConstantSV(Constants, Elem)) {
                    Pre.push_back(make_pair(Index, Value));
                } else {
                    Post.push_back(make_pair(Index, Value));
                }
            }

            if (Post.size() == 0) {
                for (auto const& IdxVal : Pre) {
                    Retval.Equalities.push_back("(= (" + Name + " " + IdxVal.first + ") " +
                                                IdxVal.second + ")");
                }
            } else {
                Retval.IsConstant = false;
                Pre.insert(Pre.end(), Post.begin(), Post.end());
                for (auto const& IdxVal : Pre) {
                    Retval.Equalities.push_back("(= (" + Name + ForallArgs + " " + IdxVal.first +
                                                ") " + IdxVal.second + ")");
                }
            }

            SMTG_LOG_FULL("Compiler.Partition",
                          Out_ << Name << " with " << Table.Elements.size() << " elements is "
                               << (Retval.IsConstant ? "constant" : "deferred") << endl;);
            return Retval;
        }

        string ConstTableDecl(const TableInfo& Table)
        {
            return "(declare-fun table" + to_string(Table.TableId) + " (" +
                Table.IndexKind->ToSMTType() + ") " + Table.ResultKind->ToSMTType() + ")";
        }

        vector<string> ConstTableInits(const TableData& Data)
        {
            auto&& Name = "table" + to_string(Data.Table.TableId);
            vector<string> Retval;
            for (u32 i = 0; i < Data.Equalities.size(); ++i) {
                Retval.push_back(WrapInit(Name, i, Data.Equalities[i]));
            }
            auto&& Setup = MkSetup(Name, Data.Equalities.size());
            Retval.insert(Retval.end(), Setup.begin(), Setup.end());
            return Retval;
        }

        vector<string> ConstTable(const TableData& Data)
        {
            vector<string> Retval = { ConstTableDecl(Data.Table) };
            auto&& Inits = ConstTableInits(Data);
            Retval.insert(Retval.end(), Inits.begin(), Inits.end());
            return Retval;
        }

        string SkolemTable(const vector<SV>& Foralls, const TableInfo& Table)
        {
            string ForallTypes;
            for (auto const& Forall : Foralls) {
                ForallTypes += Forall.GetKind()->ToSMTType() + " ";
            }
            return "(declare-fun table" + to_string(Table.TableId) + " (" + ForallTypes +
                Table.IndexKind->ToSMTType() + ") " + Table.ResultKind->ToSMTType() + ")";
        }

        ArrayDecl DeclArray(const SMTConfig& Config, bool Quantified,
                            const ConstantListT& Constants, const SkolemMapT& SkolemMap,
                            const ArrayInfo& Array)
        {
            auto const& Ctx = Array.Context;
            auto IsConst = [&] (const SV& Var) -> bool
                {
                    return IsConstantSV(Constants, Var);
                };

            bool TopLevel = !Quantified;
            if (!TopLevel) {
                switch (Ctx.Kind) {
                case ArrayContextKind::Free:
                    TopLevel = !Ctx.HasInitializer || IsConst(Ctx.Initializer);
                    break;
                case ArrayContextKind::Mutate:
                    TopLevel = IsConst(Ctx.Index) && IsConst(Ctx.Value);
                    break;
                case ArrayContextKind::Merge:
                    TopLevel = IsConst(Ctx.Condition);
                    break;
                }
            }

            auto SSV = [&] (const SV& Var) -> string
                {
                    if (TopLevel || IsConst(Var)) {
                        return CvtSV(SkolemMap, Var);
                    }
                    throw NotYetSupportedError("Non-constant array initializer in a " +
                                               (string)"quantified context");
                };

            auto&& Name = "array_" + to_string(Array.ArrayId);
            auto&& ArrayType = "(Array " + Array.DomainKind->ToSMTType() + " " +
                Array.RangeKind->ToSMTType() + ")";

            ArrayDecl Retval;
            if (Ctx.Kind == ArrayContextKind::Free && Ctx.HasInitializer) {
                auto Value = FindConstant(Constants, Ctx.Initializer);
                auto&& Init = (Value != nullptr ? Value->ToSMTLib(Config.RoundingMode) :
                               SSV(Ctx.Initializer));
                Retval.Constants.push_back("(define-fun " + Name + " () " + ArrayType +
                                           " ((as const " + ArrayType + ") " + Init + "))");
            } else if (Ctx.Kind == ArrayContextKind::Free && IsChar(Array.RangeKind)) {
                // the elements would have to be constrained to length one
                throw NotYetSupportedError("Free array declarations containing SChars");
            } else {
                Retval.Constants.push_back("(declare-fun " + Name + " () " + ArrayType + ")");
            }

            bool HasInit = false;
            bool InitIsPre = false;
            string Equality;
            switch (Ctx.Kind) {
            case ArrayContextKind::Free:
                break;
            case ArrayContextKind::Mutate:
                HasInit = true;
                InitIsPre = IsConst(Ctx.Index) && IsConst(Ctx.Value);
                Equality = "(= " + Name + " (store array_" + to_string(Ctx.BaseArray) + " " +
                    SSV(Ctx.Index) + " " + SSV(Ctx.Value) + "))";
                break;
            case ArrayContextKind::Merge:
                HasInit = true;
                InitIsPre = IsConst(Ctx.Condition);
                Equality = "(= " + Name + " (ite " + SSV(Ctx.Condition) + " array_" +
                    to_string(Ctx.ThenArray) + " array_" + to_string(Ctx.ElseArray) + "))";
                break;
            }

            if (HasInit) {
                if (InitIsPre) {
                    Retval.Constants.push_back(WrapInit(Name, 0, Equality));
                } else {
                    Retval.Delayeds.push_back(WrapInit(Name, 0, Equality));
                }
                Retval.Setups = MkSetup(Name, 1);
            } else if (!Quantified) {
                Retval.Setups = MkSetup(Name, 0);
            }

            SMTG_LOG_FULL("Compiler.Partition",
                          Out_ << Name << " (" << Array.Name << ") is "
                               << (!HasInit || InitIsPre ? "constant" : "deferred") << endl;);
            return Retval;
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// EntityPartition.cpp ends here
