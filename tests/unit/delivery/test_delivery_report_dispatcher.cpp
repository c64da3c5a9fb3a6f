// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_delivery_report_dispatcher.cpp
 * @brief Unit tests for delivery report routing and de-duplication
 */

#include <gtest/gtest.h>

#include "common/test_fixtures.h"

#include <kcenon/ims_session/delivery/delivery_report_dispatcher.h>

#include <atomic>
#include <thread>
#include <vector>

namespace kcenon::ims_session::test {

class DeliveryReportDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<session_registry>();
        sender_ = std::make_shared<recording_delivery_sender>();
        dispatcher_ = std::make_unique<delivery_report_dispatcher>(registry_, sender_);
    }

    static auto make_request(const std::string& message_id = "msg-1") -> delivery_request {
        delivery_request request;
        request.contact = "tel:+33612345678";
        request.message_id = message_id;
        request.status = delivery_status::displayed;
        request.remote_instance_id = "<urn:gsma:imei:35-123456-789012-0>";
        return request;
    }

    auto add_one_to_one_chat(bool established) -> std::shared_ptr<fake_chat_session> {
        auto chat = std::make_shared<fake_chat_session>(
            "chat-1", std::nullopt, std::string("tel:+33612345678"), established);
        EXPECT_TRUE(registry_->add_chat_session(chat).has_value());
        return chat;
    }

    std::shared_ptr<session_registry> registry_;
    std::shared_ptr<recording_delivery_sender> sender_;
    std::unique_ptr<delivery_report_dispatcher> dispatcher_;
};

// =============================================================================
// Routing
// =============================================================================

TEST_F(DeliveryReportDispatcherTest, NoChatSessionSendsOutOfBand) {
    auto r = dispatcher_->report(make_request());

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value().transport, delivery_transport::out_of_band);
    ASSERT_EQ(sender_->sent().size(), 1u);
    EXPECT_EQ(sender_->sent()[0].message_id, "msg-1");
    EXPECT_EQ(sender_->sent()[0].remote_instance_id, "<urn:gsma:imei:35-123456-789012-0>");
}

TEST_F(DeliveryReportDispatcherTest, EstablishedChatSendsInSession) {
    auto chat = add_one_to_one_chat(true);

    auto r = dispatcher_->report(make_request());

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().transport, delivery_transport::in_session);
    ASSERT_EQ(chat->sent().size(), 1u);
    EXPECT_EQ(chat->sent()[0].status, delivery_status::displayed);
    EXPECT_TRUE(sender_->sent().empty());
}

TEST_F(DeliveryReportDispatcherTest, UnestablishedChatFallsBackToOutOfBand) {
    auto chat = add_one_to_one_chat(false);

    auto r = dispatcher_->report(make_request());

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().transport, delivery_transport::out_of_band);
    EXPECT_TRUE(chat->sent().empty());
    EXPECT_EQ(sender_->sent().size(), 1u);
}

TEST_F(DeliveryReportDispatcherTest, FailedMsrpSendFallsBackToOutOfBand) {
    auto chat = add_one_to_one_chat(true);
    chat->set_fail_sends(true);

    auto r = dispatcher_->report(make_request());

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().transport, delivery_transport::out_of_band);
    EXPECT_EQ(sender_->sent().size(), 1u);
}

TEST_F(DeliveryReportDispatcherTest, GroupReportUsesGroupChat) {
    auto group = std::make_shared<fake_chat_session>("chat-g", std::string("contrib-1"),
                                                     std::nullopt, true);
    ASSERT_TRUE(registry_->add_chat_session(group).has_value());

    auto request = make_request();
    request.is_group = true;
    request.contribution_id = "contrib-1";
    auto r = dispatcher_->report(request);

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().transport, delivery_transport::in_session);
    EXPECT_EQ(group->sent().size(), 1u);
}

TEST_F(DeliveryReportDispatcherTest, GroupReportIgnoresOneToOneChat) {
    auto chat = add_one_to_one_chat(true);

    auto request = make_request();
    request.is_group = true;
    request.contribution_id = "contrib-unknown";
    auto r = dispatcher_->report(request);

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().transport, delivery_transport::out_of_band);
    EXPECT_TRUE(chat->sent().empty());
}

// =============================================================================
// De-duplication
// =============================================================================

TEST_F(DeliveryReportDispatcherTest, DuplicateReportRejected) {
    ASSERT_TRUE(dispatcher_->report(make_request()).has_value());

    auto again = dispatcher_->report(make_request());

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::duplicate_delivery_report);
    EXPECT_EQ(sender_->sent().size(), 1u);
    EXPECT_TRUE(dispatcher_->has_dispatched("msg-1", delivery_status::displayed));
}

TEST_F(DeliveryReportDispatcherTest, DifferentStatusesAreDistinct) {
    auto delivered = make_request();
    delivered.status = delivery_status::delivered;

    EXPECT_TRUE(dispatcher_->report(delivered).has_value());
    EXPECT_TRUE(dispatcher_->report(make_request()).has_value());
    EXPECT_EQ(dispatcher_->dispatched_count(), 2u);
}

TEST_F(DeliveryReportDispatcherTest, ConcurrentDuplicatesSentOnce) {
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &successes] {
            if (dispatcher_->report(make_request())) {
                ++successes;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(sender_->sent().size(), 1u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(DeliveryReportDispatcherTest, EmptyMessageIdRejected) {
    auto r = dispatcher_->report(make_request(""));

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_argument);
}

TEST_F(DeliveryReportDispatcherTest, SendFailureAllowsRetry) {
    sender_->set_fail_sends(true);

    auto failed = dispatcher_->report(make_request());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::delivery_send_failed);
    EXPECT_FALSE(dispatcher_->has_dispatched("msg-1", delivery_status::displayed));

    sender_->set_fail_sends(false);
    EXPECT_TRUE(dispatcher_->report(make_request()).has_value());
}

TEST_F(DeliveryReportDispatcherTest, MissingSenderFails) {
    delivery_report_dispatcher dispatcher(registry_, nullptr);

    auto r = dispatcher.report(make_request());

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::delivery_send_failed);
    EXPECT_EQ(dispatcher.dispatched_count(), 0u);
}

TEST(DeliveryTypesTest, ToString) {
    EXPECT_STREQ(to_string(delivery_status::delivered), "delivered");
    EXPECT_STREQ(to_string(delivery_status::displayed), "displayed");
    EXPECT_STREQ(to_string(delivery_transport::in_session), "in_session");
    EXPECT_STREQ(to_string(delivery_transport::out_of_band), "out_of_band");
}

}  // namespace kcenon::ims_session::test
