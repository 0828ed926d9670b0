// TestUtils.hpp ---
//
// Filename: TestUtils.hpp
// Author: Abhishek Udupa
// Created: Tue Mar  7 05:22:10 2014 (-0400)
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

// Checks shared by the test drivers. A failed check prints
// what went wrong and exits with a non-zero status.

#if !defined SMTG_TEST_COMMON_TEST_UTILS_HPP_
#define SMTG_TEST_COMMON_TEST_UTILS_HPP_

#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/join.hpp>

#include "../../src/common/SMTGFwdDecls.hpp"

namespace SMTG {
    namespace Test {

        static inline void Fail(const string& What)
        {
            cout << "FAILED: " << What << endl;
            exit(1);
        }

        static inline void CheckTrue(bool Condition, const string& What)
        {
            if (!Condition) {
                Fail(What);
            }
            cout << "Passed: " << What << endl;
        }

        static inline void CheckEqual(const string& Actual, const string& Expected,
                                      const string& What)
        {
            if (Actual != Expected) {
                Fail(What + "\nExpected: " + Expected + "\nActual  : " + Actual);
            }
            cout << "Passed: " << What << endl;
        }

        static inline void CheckLines(const vector<string>& Actual,
                                      const vector<string>& Expected,
                                      const string& What)
        {
            CheckEqual(boost::algorithm::join(Actual, "\n"),
                       boost::algorithm::join(Expected, "\n"), What);
        }

        static inline i64 IndexOf(const vector<string>& Lines, const string& Line)
        {
            auto it = find(Lines.begin(), Lines.end(), Line);
            if (it == Lines.end()) {
                return -1;
            }
            return it - Lines.begin();
        }

        static inline u32 CountContaining(const vector<string>& Lines, const string& Fragment)
        {
            u32 Retval = 0;
            for (auto const& Line : Lines) {
                if (boost::algorithm::contains(Line, Fragment)) {
                    ++Retval;
                }
            }
            return Retval;
        }

        static inline void CheckHasLine(const vector<string>& Lines, const string& Line,
                                        const string& What)
        {
            if (IndexOf(Lines, Line) < 0) {
                Fail(What + "\nMissing line: " + Line + "\nIn:\n" +
                     boost::algorithm::join(Lines, "\n"));
            }
            cout << "Passed: " << What << endl;
        }

        // Func must throw ExceptionT, whose message must
        // contain Fragment
        template <typename ExceptionT, typename FuncT>
        static inline void ExpectThrows(const FuncT& Func, const string& Fragment,
                                        const string& What)
        {
            try {
                Func();
            } catch (const ExceptionT& Ex) {
                if (!boost::algorithm::contains(string(Ex.what()), Fragment)) {
                    Fail(What + "\nUnexpected message: " + Ex.what());
                }
                cout << "Passed: " << What << endl;
                return;
            }
            Fail(What + "\nNo exception was thrown");
        }

    } /* end namespace Test */
} /* end namespace SMTG */

#endif /* SMTG_TEST_COMMON_TEST_UTILS_HPP_ */

//
// TestUtils.hpp ends here
