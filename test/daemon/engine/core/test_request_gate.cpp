//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "core/request_gate.hpp"

#include "virtual_time_scheduler.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace
{

using namespace netcfgd::daemon::engine::core;  // NOLINT This our main concern here in the unit tests.
using netcfgd::model::ErrorKind;

using testing::ElementsAre;
using testing::IsEmpty;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestRequestGate : public testing::Test
{
protected:
    using Ticket      = RequestGate::Ticket;
    using AdmitResult = RequestGate::AdmitResult;

    /// Collects outcomes of admissions by their "request" number.
    struct Outcomes final
    {
        std::map<int, Ticket>    tickets;
        std::map<int, ErrorKind> errors;
        std::vector<int>         order;
    };

    RequestGate::TicketId admit(const int request, const libcyphal::Duration timeout = 10s)
    {
        return gate_.admit(scheduler_.now() + timeout, [this, request](AdmitResult::Var&& result) {
            //
            outcomes_.order.push_back(request);
            if (auto* const ticket = cetl::get_if<AdmitResult::Success>(&result))
            {
                outcomes_.tickets.emplace(request, std::move(*ticket));
            }
            else
            {
                outcomes_.errors.emplace(request, cetl::get<AdmitResult::Failure>(result).kind);
            }
        });
    }

    // NOLINTBEGIN
    netcfgd::VirtualTimeScheduler scheduler_{};
    RequestGate                   gate_{scheduler_, 2, 2};
    Outcomes                      outcomes_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestRequestGate, admits_up_to_limit_then_queues)
{
    (void) admit(1);
    (void) admit(2);
    (void) admit(3);

    // Nothing is delivered from within `admit`.
    EXPECT_THAT(outcomes_.order, IsEmpty());
    EXPECT_THAT(gate_.activeCount(), 2U);
    EXPECT_THAT(gate_.queuedCount(), 1U);

    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2));
    ASSERT_THAT(outcomes_.tickets.size(), 2U);
    EXPECT_TRUE(outcomes_.tickets.at(1).isValid());

    // Releasing a ticket admits the next waiter.
    outcomes_.tickets.at(1).release();
    EXPECT_FALSE(outcomes_.tickets.at(1).isValid());
    EXPECT_THAT(gate_.activeCount(), 2U);
    EXPECT_THAT(gate_.queuedCount(), 0U);

    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2, 3));

    // Destruction of tickets releases their slots as well.
    outcomes_.tickets.clear();
    EXPECT_THAT(gate_.activeCount(), 0U);
}

TEST_F(TestRequestGate, waiters_are_admitted_in_order)
{
    for (int request = 1; request <= 4; ++request)
    {
        (void) admit(request);
    }
    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2));

    outcomes_.tickets.erase(2);
    outcomes_.tickets.erase(1);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2, 3, 4));
    EXPECT_THAT(outcomes_.errors, IsEmpty());
}

TEST_F(TestRequestGate, queue_overflow_is_rejected)
{
    for (int request = 1; request <= 5; ++request)
    {
        (void) admit(request);
    }
    EXPECT_THAT(gate_.queuedCount(), 2U);

    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2, 5));
    ASSERT_THAT(outcomes_.errors.size(), 1U);
    EXPECT_THAT(outcomes_.errors.at(5), ErrorKind::RequestTimeout);
}

TEST_F(TestRequestGate, queued_request_times_out)
{
    (void) admit(1);
    (void) admit(2);
    (void) admit(3, 3s);
    (void) admit(4, 5s);

    scheduler_.spinFor(4s);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2, 3));
    EXPECT_THAT(outcomes_.errors.at(3), ErrorKind::RequestTimeout);
    EXPECT_THAT(gate_.queuedCount(), 1U);

    // The still queued one gets the freed slot.
    outcomes_.tickets.erase(1);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(outcomes_.order, ElementsAre(1, 2, 3, 4));
    EXPECT_TRUE(outcomes_.tickets.at(4).isValid());

    // Its (already disarmed) deadline has no effect anymore.
    scheduler_.spinFor(10s);
    EXPECT_THAT(outcomes_.errors.size(), 1U);
}

TEST_F(TestRequestGate, cancel)
{
    (void) admit(1);
    const auto id2 = admit(2);
    const auto id3 = admit(3);
    EXPECT_THAT(gate_.queuedCount(), 1U);

    // Queued one.
    gate_.cancel(id3);
    EXPECT_THAT(gate_.queuedCount(), 0U);

    // Admitted, but not yet delivered one.
    gate_.cancel(id2);
    EXPECT_THAT(gate_.activeCount(), 1U);

    scheduler_.spinFor(10s);
    EXPECT_THAT(outcomes_.order, ElementsAre(1));

    // Unknown ids are ignored.
    gate_.cancel(id2);
    gate_.cancel(12345);
    EXPECT_THAT(gate_.activeCount(), 1U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
