// SMTGLib.hpp ---
//
// Filename: SMTGLib.hpp
// Author: Abhishek Udupa
// Created: Tue Jul 10 18:03:29 2014 (-0400)
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

// Library wide settings: where the trace goes, and
// which trace options are enabled

#if !defined SMTG_LIB_SMTG_LIB_HPP_
#define SMTG_LIB_SMTG_LIB_HPP_

#include <set>

#include "../common/SMTGFwdDecls.hpp"

namespace SMTG {

    class SMTGLibOptionsT
    {
    public:
        string LogFileName;
        LogFileCompressionTechniqueT LogCompressionTechnique;
        set<string> LoggingOptions;

        SMTGLibOptionsT();
        virtual ~SMTGLibOptionsT();

        SMTGLibOptionsT(const SMTGLibOptionsT& Other);
        SMTGLibOptionsT& operator = (const SMTGLibOptionsT& Other);
    };

    class SMTGLib
    {
    private:
        static SMTGLibOptionsT& SMTGLibOptions();

        SMTGLib();
        SMTGLib(const SMTGLib& Other) = delete;
        SMTGLib(SMTGLib&& Other) = delete;

    public:
        static void Initialize();
        // Throws SMTGError on an unknown logging option
        static void Initialize(const SMTGLibOptionsT& LibOptions);
        static void Finalize();
        static const SMTGLibOptionsT& GetOptions();
    };

    __attribute__((constructor)) extern void SMTGLibInitialize_();
    __attribute__((destructor)) extern void SMTGLibFinalize_();

} /* end namespace SMTG */

#endif /* SMTG_LIB_SMTG_LIB_HPP_ */

//
// SMTGLib.hpp ends here
