// EntityPartition.hpp ---
//
// Filename: EntityPartition.hpp
// Author: Abhishek Udupa
// Created: Sat Jun 24 09:15:28 2014 (-0400)
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

// Partition of tables and arrays into the entities that are
// resolved by constants before any quantifier, and the ones
// that are deferred into the scope of the universals

#if !defined SMTG_SMTLIB_ENTITY_PARTITION_HPP_
#define SMTG_SMTLIB_ENTITY_PARTITION_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../program/Snapshot.hpp"
#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        struct TableData
        {
            Program::TableInfo Table;
            // every element is a literal constant
            bool IsConstant;
            // one (= (tableN idx) v) per element; deferred tables are
            // applied to the universals first
            vector<string> Equalities;
        };

        struct ArrayDecl
        {
            // the declaration and the initializers resolvable
            // from constants
            vector<string> Constants;
            // initializers that must wait for the definitions
            vector<string> Delayeds;
            // the combined initializer and its assertion
            vector<string> Setups;
        };

        // Is the value a literal, i.e., true, false or a
        // member of the constant list?
        extern bool IsConstantSV(const Program::ConstantListT& Constants,
                                 const Program::SV& Var);

        // ForallArgs is the string " s0 s1 ..." of the universals
        extern TableData GenTableData(const SMTConfig& Config, const SkolemMapT& SkolemMap,
                                      const string& ForallArgs,
                                      const Program::ConstantListT& Constants,
                                      const Program::TableInfo& Table);
        // The declaration, the per element initializer definitions,
        // and the setup of a constant table
        extern vector<string> ConstTable(const TableData& Data);
        extern string ConstTableDecl(const Program::TableInfo& Table);
        extern vector<string> ConstTableInits(const TableData& Data);
        // The declaration of a deferred table, whose arguments
        // are the universals followed by the index
        extern string SkolemTable(const vector<Program::SV>& Foralls,
                                  const Program::TableInfo& Table);

        // Throws NotYetSupportedError for arrays depending on non-constant
        // values in a quantified context, and for free arrays of characters
        extern ArrayDecl DeclArray(const SMTConfig& Config, bool Quantified,
                                   const Program::ConstantListT& Constants,
                                   const SkolemMapT& SkolemMap,
                                   const Program::ArrayInfo& Array);

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_ENTITY_PARTITION_HPP_ */

//
// EntityPartition.hpp ends here
