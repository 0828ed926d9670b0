// SmartPtr.hpp ---
//
// Filename: SmartPtr.hpp
// Author: Abhishek Udupa
// Created: Thu Sep 28 23:14:39 2015 (-0400)
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

// Intrusively counted objects and the smart pointers over
// them. Comparisons are on the pointer values; use the Ptr
// comparators of the pointee classes for structural comparisons.

#if !defined SMTG_CONTAINERS_SMART_PTR_HPP_
#define SMTG_CONTAINERS_SMART_PTR_HPP_

#include "../common/SMTGFwdDecls.hpp"

namespace SMTG {

    // Deleted when the last SmartPtr to it goes away. Copies of
    // a counted object are not referenced by anybody yet.
    class RefCountable
    {
    private:
        mutable u32 NumRefs_;

    public:
        inline RefCountable()
            : NumRefs_(0)
        {
            // Nothing here
        }

        inline RefCountable(const RefCountable&)
            : NumRefs_(0)
        {
            // Nothing here
        }

        inline RefCountable& operator = (const RefCountable&)
        {
            return *this;
        }

        virtual ~RefCountable()
        {
            // Nothing here
        }

        inline void IncRef_() const
        {
            ++NumRefs_;
        }

        inline void DecRef_() const
        {
            if (--NumRefs_ == 0) {
                delete this;
            }
        }

        inline u32 GetNumRefs_() const
        {
            return NumRefs_;
        }
    };

    template <typename T>
    class SmartPtr
    {
        friend class CSmartPtr<T>;
    private:
        T* Ptr_;

    public:
        inline SmartPtr()
            : Ptr_(nullptr)
        {
            // Nothing here
        }

        inline SmartPtr(T* OtherPtr)
            : Ptr_(OtherPtr)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline SmartPtr(const SmartPtr& Other)
            : SmartPtr(Other.Ptr_)
        {
            // Nothing here
        }

        inline SmartPtr(SmartPtr&& Other)
            : Ptr_(nullptr)
        {
            swap(Ptr_, Other.Ptr_);
        }

        inline ~SmartPtr()
        {
            if (Ptr_ != nullptr) {
                Ptr_->DecRef_();
            }
            Ptr_ = nullptr;
        }

        inline SmartPtr& operator = (SmartPtr Other)
        {
            swap(Ptr_, Other.Ptr_);
            return *this;
        }

        inline T* GetPtr_() const
        {
            return Ptr_;
        }

        inline T* operator -> () const
        {
            return Ptr_;
        }

        inline T& operator * () const
        {
            return *Ptr_;
        }

        inline bool operator == (const SmartPtr& Other) const
        {
            return (Ptr_ == Other.Ptr_);
        }

        inline bool operator != (const SmartPtr& Other) const
        {
            return (Ptr_ != Other.Ptr_);
        }

        inline bool operator < (const SmartPtr& Other) const
        {
            return (Ptr_ < Other.Ptr_);
        }

        inline bool operator ! () const
        {
            return (Ptr_ == nullptr);
        }

        inline bool IsNull_() const
        {
            return (Ptr_ == nullptr);
        }
    };

    template <typename T>
    class CSmartPtr
    {
    private:
        const T* Ptr_;

    public:
        inline CSmartPtr()
            : Ptr_(nullptr)
        {
            // Nothing here
        }

        inline CSmartPtr(const T* OtherPtr)
            : Ptr_(OtherPtr)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline CSmartPtr(const CSmartPtr& Other)
            : CSmartPtr(Other.Ptr_)
        {
            // Nothing here
        }

        inline CSmartPtr(const SmartPtr<T>& Other)
            : CSmartPtr(Other.Ptr_)
        {
            // Nothing here
        }

        inline CSmartPtr(CSmartPtr&& Other)
            : Ptr_(nullptr)
        {
            swap(Ptr_, Other.Ptr_);
        }

        inline ~CSmartPtr()
        {
            if (Ptr_ != nullptr) {
                Ptr_->DecRef_();
            }
            Ptr_ = nullptr;
        }

        inline CSmartPtr& operator = (CSmartPtr Other)
        {
            swap(Ptr_, Other.Ptr_);
            return *this;
        }

        inline const T* GetPtr_() const
        {
            return Ptr_;
        }

        inline const T* operator -> () const
        {
            return Ptr_;
        }

        inline const T& operator * () const
        {
            return *Ptr_;
        }

        inline bool operator == (const CSmartPtr& Other) const
        {
            return (Ptr_ == Other.Ptr_);
        }

        inline bool operator != (const CSmartPtr& Other) const
        {
            return (Ptr_ != Other.Ptr_);
        }

        inline bool operator < (const CSmartPtr& Other) const
        {
            return (Ptr_ < Other.Ptr_);
        }

        inline bool operator ! () const
        {
            return (Ptr_ == nullptr);
        }

        inline bool IsNull_() const
        {
            return (Ptr_ == nullptr);
        }
    };

    template <typename T>
    static inline ostream& operator << (ostream& Out, const SmartPtr<T>& Ptr)
    {
        Out << Ptr->ToString();
        return Out;
    }

    template <typename T>
    static inline ostream& operator << (ostream& Out, const CSmartPtr<T>& Ptr)
    {
        Out << Ptr->ToString();
        return Out;
    }

} /* end namespace SMTG */

#endif /* SMTG_CONTAINERS_SMART_PTR_HPP_ */

//
// SmartPtr.hpp ends here
