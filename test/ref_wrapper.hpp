//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_REF_WRAPPER_HPP_INCLUDED
#define DEVCTL_REF_WRAPPER_HPP_INCLUDED

namespace devctl
{

/// Owned proxy of a stack allocated mock.
///
/// Production code takes ownership of the wrapper (via smart pointer) while the test keeps the mock itself,
/// so that expectations stay verifiable. Destruction of the wrapper is reported as `deinit()` of the mock.
///
template <typename Interface, typename Reference>
struct RefWrapper : Interface
{
    explicit RefWrapper(Reference& reference)
        : reference_{reference}
    {
    }

    RefWrapper(const RefWrapper& other)          = delete;
    RefWrapper(RefWrapper&&) noexcept            = delete;
    RefWrapper& operator=(const RefWrapper&)     = delete;
    RefWrapper& operator=(RefWrapper&&) noexcept = delete;

    virtual ~RefWrapper()
    {
        reference_.deinit();
    }

    Reference& reference() const
    {
        return reference_;
    }

private:
    Reference& reference_;

};  // RefWrapper

}  // namespace devctl

#endif  // DEVCTL_REF_WRAPPER_HPP_INCLUDED
