//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "core/request_serializer.hpp"

#include "core/scope.hpp"
#include "virtual_time_scheduler.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace netcfgd::daemon::engine::core;  // NOLINT This our main concern here in the unit tests.
using netcfgd::model::ErrorKind;

using testing::IsEmpty;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestRequestSerializer : public testing::Test
{
protected:
    using Mode          = RequestSerializer::LockMode;
    using Lease         = RequestSerializer::Lease;
    using AcquireResult = RequestSerializer::AcquireResult;

    RequestSerializer::RequestId acquire(const int                                      request,
                                         std::vector<RequestSerializer::LockRequest>&& locks,
                                         const libcyphal::Duration                      timeout = 10s)
    {
        return serializer_.acquire(std::move(locks),
                                   scheduler_.now() + timeout,
                                   [this, request](AcquireResult::Var&& result) {
                                       //
                                       order_.push_back(request);
                                       if (auto* const lease = cetl::get_if<AcquireResult::Success>(&result))
                                       {
                                           leases_.emplace(request, std::move(*lease));
                                       }
                                       else
                                       {
                                           errors_.emplace(request, cetl::get<AcquireResult::Failure>(result).kind);
                                       }
                                   });
    }

    // NOLINTBEGIN
    netcfgd::VirtualTimeScheduler scheduler_{};
    RequestSerializer             serializer_{scheduler_};
    std::map<int, Lease>          leases_;
    std::map<int, ErrorKind>      errors_;
    std::vector<int>              order_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestRequestSerializer, areCompatible)
{
    using RS = RequestSerializer;

    EXPECT_TRUE(RS::areCompatible(Mode::IntentShared, Mode::IntentShared));
    EXPECT_TRUE(RS::areCompatible(Mode::IntentShared, Mode::IntentExclusive));
    EXPECT_TRUE(RS::areCompatible(Mode::IntentShared, Mode::Shared));
    EXPECT_FALSE(RS::areCompatible(Mode::IntentShared, Mode::Exclusive));

    EXPECT_TRUE(RS::areCompatible(Mode::IntentExclusive, Mode::IntentShared));
    EXPECT_TRUE(RS::areCompatible(Mode::IntentExclusive, Mode::IntentExclusive));
    EXPECT_FALSE(RS::areCompatible(Mode::IntentExclusive, Mode::Shared));
    EXPECT_FALSE(RS::areCompatible(Mode::IntentExclusive, Mode::Exclusive));

    EXPECT_TRUE(RS::areCompatible(Mode::Shared, Mode::IntentShared));
    EXPECT_FALSE(RS::areCompatible(Mode::Shared, Mode::IntentExclusive));
    EXPECT_TRUE(RS::areCompatible(Mode::Shared, Mode::Shared));
    EXPECT_FALSE(RS::areCompatible(Mode::Shared, Mode::Exclusive));

    EXPECT_FALSE(RS::areCompatible(Mode::Exclusive, Mode::IntentShared));
    EXPECT_FALSE(RS::areCompatible(Mode::Exclusive, Mode::IntentExclusive));
    EXPECT_FALSE(RS::areCompatible(Mode::Exclusive, Mode::Shared));
    EXPECT_FALSE(RS::areCompatible(Mode::Exclusive, Mode::Exclusive));
}

TEST_F(TestRequestSerializer, lock_sets)
{
    const auto query_all = RequestSerializer::forQuery(Scope::all());
    ASSERT_THAT(query_all.size(), 1U);
    EXPECT_THAT(query_all[0].resource, RequestSerializer::RootResource);
    EXPECT_THAT(query_all[0].mode, Mode::Shared);

    const auto query_one = RequestSerializer::forQuery(Scope::one("eth0"));
    ASSERT_THAT(query_one.size(), 2U);
    EXPECT_THAT(query_one[0].mode, Mode::IntentShared);
    EXPECT_THAT(query_one[1].resource, "eth0");
    EXPECT_THAT(query_one[1].mode, Mode::Shared);

    const auto apply = RequestSerializer::forApply({"eth1", "eth0"});
    ASSERT_THAT(apply.size(), 3U);
    EXPECT_THAT(apply[0].mode, Mode::IntentExclusive);
    EXPECT_THAT(apply[1].resource, "eth0");
    EXPECT_THAT(apply[1].mode, Mode::Exclusive);
    EXPECT_THAT(apply[2].resource, "eth1");
    EXPECT_THAT(apply[2].mode, Mode::Exclusive);

    EXPECT_THAT(RequestSerializer::forApply(Scope::of({"eth0"})).size(), 2U);

    const auto apply_all = RequestSerializer::forApply(Scope::all());
    ASSERT_THAT(apply_all.size(), 1U);
    EXPECT_THAT(apply_all[0].resource, RequestSerializer::RootResource);
    EXPECT_THAT(apply_all[0].mode, Mode::Exclusive);
}

TEST_F(TestRequestSerializer, apply_of_everything_excludes_any_other_request)
{
    (void) acquire(1, RequestSerializer::forQuery(Scope::one("eth0")));
    (void) acquire(2, RequestSerializer::forApply(Scope::all()));
    (void) acquire(3, RequestSerializer::forApply({"eth7"}));
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1));

    leases_.erase(1);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2));

    leases_.erase(2);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));
}

TEST_F(TestRequestSerializer, disjoint_applies_run_concurrently)
{
    (void) acquire(1, RequestSerializer::forApply({"eth0"}));
    (void) acquire(2, RequestSerializer::forApply({"eth1"}));
    (void) acquire(3, RequestSerializer::forQuery(Scope::one("eth2")));

    // Nothing is delivered from within `acquire`.
    EXPECT_THAT(order_, IsEmpty());

    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));
    EXPECT_THAT(serializer_.waitingCount(), 0U);
}

TEST_F(TestRequestSerializer, overlapping_applies_are_serialized)
{
    (void) acquire(1, RequestSerializer::forApply({"eth0", "eth1"}));
    (void) acquire(2, RequestSerializer::forApply({"eth1", "eth2"}));
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1));
    EXPECT_THAT(serializer_.waitingCount(), 1U);

    leases_.erase(1);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2));

    leases_.clear();
    EXPECT_TRUE(serializer_.isIdle());
}

TEST_F(TestRequestSerializer, shared_queries_of_same_interface)
{
    (void) acquire(1, RequestSerializer::forQuery(Scope::one("eth0")));
    (void) acquire(2, RequestSerializer::forQuery(Scope::of({"eth0", "eth1"})));
    (void) acquire(3, RequestSerializer::forQuery(Scope::all()));
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));

    // But an apply has to wait for all of them.
    (void) acquire(4, RequestSerializer::forApply({"eth1"}));
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));

    leases_.erase(3);
    leases_.erase(2);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3, 4));
}

TEST_F(TestRequestSerializer, waiters_are_not_overtaken)
{
    (void) acquire(1, RequestSerializer::forApply({"eth0"}));
    // Query of everything waits for the apply...
    (void) acquire(2, RequestSerializer::forQuery(Scope::all()));
    // ...and so does a compatible apply which has come later.
    (void) acquire(3, RequestSerializer::forApply({"eth5"}));
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1));

    leases_.erase(1);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2));

    leases_.erase(2);
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));
}

TEST_F(TestRequestSerializer, deadline)
{
    (void) acquire(1, RequestSerializer::forApply({"eth0", "eth1"}));
    (void) acquire(2, RequestSerializer::forApply({"eth1"}), 1s);
    (void) acquire(3, RequestSerializer::forApply({"eth0"}), 5s);

    scheduler_.spinFor(2s);
    EXPECT_THAT(order_, ElementsAre(1, 2));
    EXPECT_THAT(errors_.at(2), ErrorKind::RequestTimeout);
    EXPECT_THAT(serializer_.waitingCount(), 1U);

    leases_.clear();
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2, 3));
    EXPECT_THAT(errors_.size(), 1U);

    leases_.clear();
    EXPECT_TRUE(serializer_.isIdle());
}

TEST_F(TestRequestSerializer, cancel)
{
    (void) acquire(1, RequestSerializer::forApply({"eth0"}));
    const auto id2 = acquire(2, RequestSerializer::forApply({"eth0"}));
    const auto id3 = acquire(3, RequestSerializer::forApply({"eth9"}));

    // Waiting one, and granted but not yet delivered one.
    serializer_.cancel(id2);
    serializer_.cancel(id3);

    scheduler_.spinFor(10s);
    EXPECT_THAT(order_, ElementsAre(1));
    EXPECT_THAT(serializer_.waitingCount(), 0U);

    leases_.clear();
    EXPECT_TRUE(serializer_.isIdle());
}

TEST_F(TestRequestSerializer, duplicate_resources_take_strongest_mode)
{
    (void) acquire(1, {{"eth0", Mode::Shared}, {"eth0", Mode::IntentExclusive}});
    (void) acquire(2, {{"eth0", Mode::IntentShared}});
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1));

    leases_.clear();
    scheduler_.spinFor(1ms);
    EXPECT_THAT(order_, ElementsAre(1, 2));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
