//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_GTEST_HELPERS_HPP_INCLUDED
#define DEVCTL_SDK_GTEST_HELPERS_HPP_INCLUDED

#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>

#include <spdlog/fmt/fmt.h>

#include <gmock/gmock.h>
#include <gtest/gtest-matchers.h>
#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{

// MARK: - GTest Printers:

inline void PrintTo(const ErrorKind kind, std::ostream* os)
{
    *os << toString(kind);
}

inline void PrintTo(const Error& error, std::ostream* os)
{
    *os << fmt::format("Error{{{}}}", error);
}

// MARK: - GTest Matchers:

inline testing::Matcher<const Error&> ErrorWith(const ErrorKind kind, const std::string& op_name)
{
    return testing::AllOf(testing::Field(&Error::kind, kind), testing::Field(&Error::op_name, op_name));
}

inline testing::Matcher<const Error&> ErrorWith(const ErrorKind                     kind,
                                               const std::string&                  op_name,
                                               const testing::Matcher<std::string> message_matcher)
{
    return testing::AllOf(testing::Field(&Error::kind, kind),
                          testing::Field(&Error::op_name, op_name),
                          testing::Field(&Error::message, message_matcher));
}

// MARK: - Senders:

/// Sender which result is emitted by the test (see `State::complete`), rather than by the sender itself.
///
/// The state outlives the sender, so the test can observe whether the sender was submitted and destroyed.
///
template <typename Result>
class ManualSender final : public SenderOf<Result>
{
public:
    struct State final
    {
        // NOLINTBEGIN
        bool                          submitted{false};
        bool                          destroyed{false};
        std::function<void(Result&&)> receiver;
        // NOLINTEND

        void complete(Result&& result)
        {
            ASSERT_TRUE(receiver) << "Sender is not submitted (or already completed).";
            auto receive = std::move(receiver);
            receive(std::move(result));
        }

    };  // State

    static typename SenderOf<Result>::Ptr make(std::shared_ptr<State> state)
    {
        return std::make_unique<ManualSender>(std::move(state));
    }

    explicit ManualSender(std::shared_ptr<State> state)
        : state_{std::move(state)}
    {
    }

    ManualSender(const ManualSender&)                = delete;
    ManualSender(ManualSender&&) noexcept            = delete;
    ManualSender& operator=(const ManualSender&)     = delete;
    ManualSender& operator=(ManualSender&&) noexcept = delete;

    ~ManualSender() override
    {
        state_->destroyed = true;
        state_->receiver  = nullptr;
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        state_->submitted = true;
        state_->receiver  = std::move(receiver);
    }

private:
    std::shared_ptr<State> state_;

};  // ManualSender

/// Submits the sender, and forwards its result (if any) to the mock function.
///
template <typename Result, typename Sender>
void submitTo(Sender& sender, testing::MockFunction<void(const Result&)>& receiver_mock)
{
    sender->submit([&receiver_mock](Result&& result) {
        //
        receiver_mock.Call(result);
    });
}

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_GTEST_HELPERS_HPP_INCLUDED
