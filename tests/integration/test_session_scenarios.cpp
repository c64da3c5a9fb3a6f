// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_session_scenarios.cpp
 * @brief End-to-end scenarios for terminating file sharing sessions
 */

#include <gtest/gtest.h>

#include "common/test_fixtures.h"

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

namespace kcenon::ims_session::test {

using namespace std::chrono_literals;

class SessionScenarioTest : public SessionFixture {};

// =============================================================================
// Happy paths
// =============================================================================

TEST_F(SessionScenarioTest, AcceptDownloadAndReport) {
    auto session = make_session();

    std::thread user([session] { (void)session->accept(); });
    ASSERT_EQ(session->wait_for_user_answer(2s), invitation_status::accepted);
    user.join();

    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("completed"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(sha256_hex(read_file(session->download_path())), sha256_hex(content_));
    EXPECT_EQ(sender_->sent().size(), 1u);
    EXPECT_EQ(registry_->file_sharing_session_count(), 0u);
    EXPECT_EQ(log_->last_state("ft-session-1"), session_state::completed);
}

TEST_F(SessionScenarioTest, PauseAtOffsetAndResumeWithRange) {
    auto session = make_session();
    std::weak_ptr<file_sharing_session> weak = session;
    std::atomic<bool> paused_once{false};
    http_->set_on_bytes_served([weak, &paused_once](uint64_t end) {
        if (end == 400 && !paused_once.exchange(true)) {
            if (auto s = weak.lock()) {
                (void)s->pause();
            }
        }
    });

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("paused"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(std::filesystem::file_size(session->download_path()), 400u);
    EXPECT_EQ(log_->last_state("ft-session-1"), session_state::paused);

    ASSERT_TRUE(session->resume().has_value());
    ASSERT_TRUE(listener_->wait_for("completed"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(read_file(session->download_path()), content_);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].headers.count("Range"), 0u);
    EXPECT_EQ(requests[1].headers.at("Range"), "bytes=400-");
    EXPECT_EQ(requests[1].headers.at("If-Range"), "\"v1\"");

    EXPECT_EQ(listener_->events(),
              (std::vector<std::string>{"accepted", "started", "paused", "resumed",
                                        "completed"}));
}

TEST_F(SessionScenarioTest, TransientFailuresRecovered) {
    http_->fail_next_requests(2);
    auto session = make_session();

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("completed"));

    EXPECT_EQ(read_file(session->download_path()), content_);
    EXPECT_EQ(listener_->count("error"), 0u);
}

TEST_F(SessionScenarioTest, ConcurrentSessionsKeepSeparateFiles) {
    std::vector<std::shared_ptr<file_sharing_session>> sessions;
    for (int i = 0; i < 4; ++i) {
        auto invitation = make_invitation("session-" + std::to_string(i));
        invitation.file.name = "photo-" + std::to_string(i) + ".jpg";
        sessions.push_back(make_session(invitation));
    }
    for (auto& s : sessions) {
        ASSERT_TRUE(s->accept().has_value());
        ASSERT_TRUE(s->start().has_value());
    }
    for (auto& s : sessions) {
        ASSERT_TRUE(s->wait_for_worker(10s));
        EXPECT_EQ(s->state(), session_state::completed);
    }

    std::set<std::filesystem::path> paths;
    for (auto& s : sessions) {
        paths.insert(s->download_path());
        EXPECT_EQ(read_file(s->download_path()), content_);
    }
    EXPECT_EQ(paths.size(), sessions.size());
    EXPECT_EQ(sender_->sent().size(), sessions.size());
}

// =============================================================================
// Suspension racing a transport exception
// =============================================================================

TEST_F(SessionScenarioTest, PauseThenConnectionDropResumes) {
    auto session = make_session();
    std::weak_ptr<file_sharing_session> weak = session;
    std::atomic<bool> dropped{false};
    http_->set_on_bytes_served([weak, &dropped](uint64_t end) {
        if (end == 400 && !dropped.exchange(true)) {
            if (auto s = weak.lock()) {
                (void)s->pause();
            }
            throw std::runtime_error("connection reset by peer");
        }
    });

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("paused"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(session->state(), session_state::paused);
    EXPECT_EQ(std::filesystem::file_size(session->download_path()), 400u);

    ASSERT_TRUE(session->resume().has_value());
    ASSERT_TRUE(listener_->wait_for("completed"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(read_file(session->download_path()), content_);
    EXPECT_EQ(listener_->count("error"), 0u);
    EXPECT_EQ(log_->last_state("ft-session-1"), session_state::completed);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].headers.at("Range"), "bytes=400-");
}

TEST_F(SessionScenarioTest, CancelThenConnectionDropAborts) {
    auto session = make_session();
    std::weak_ptr<file_sharing_session> weak = session;
    std::atomic<bool> dropped{false};
    http_->set_on_bytes_served([weak, &dropped](uint64_t end) {
        if (end == 500 && !dropped.exchange(true)) {
            if (auto s = weak.lock()) {
                (void)s->cancel();
            }
            throw std::runtime_error("connection reset by peer");
        }
    });

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("aborted"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    EXPECT_EQ(session->state(), session_state::cancelled);
    EXPECT_EQ(listener_->count("error"), 0u);
    EXPECT_EQ(registry_->file_sharing_session_count(), 0u);
    EXPECT_EQ(log_->last_state("ft-session-1"), session_state::cancelled);
}

// =============================================================================
// Rejections and failures
// =============================================================================

TEST_F(SessionScenarioTest, RejectBeforeStart) {
    auto session = make_session();

    ASSERT_TRUE(session->reject(rejection_reason::by_user).has_value());

    EXPECT_EQ(registry_->find_file_sharing_session("session-1"), nullptr);
    EXPECT_FALSE(session->start().has_value());
    EXPECT_EQ(http_->request_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(session->download_path()));
}

TEST_F(SessionScenarioTest, RingingTimeoutRejects) {
    auto session = make_session();

    EXPECT_EQ(session->wait_for_user_answer(), invitation_status::timeout);
    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"rejected"}));
    EXPECT_FALSE(session->accept().has_value());
}

TEST_F(SessionScenarioTest, ResourceChangedWhilePaused) {
    auto session = make_session();
    std::weak_ptr<file_sharing_session> weak = session;
    std::atomic<bool> paused_once{false};
    http_->set_on_bytes_served([weak, &paused_once](uint64_t end) {
        if (end == 300 && !paused_once.exchange(true)) {
            if (auto s = weak.lock()) {
                (void)s->pause();
            }
        }
    });

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("paused"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    http_->set_etag("\"v2\"");
    ASSERT_TRUE(session->resume().has_value());
    ASSERT_TRUE(listener_->wait_for("error"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    auto failure = listener_->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, failure_kind::transfer_incomplete);
    EXPECT_EQ(session->state(), session_state::error);
    EXPECT_EQ(listener_->count("completed"), 0u);
}

TEST_F(SessionScenarioTest, PartialFileRemovedWhilePaused) {
    auto session = make_session();
    std::weak_ptr<file_sharing_session> weak = session;
    std::atomic<bool> paused_once{false};
    http_->set_on_bytes_served([weak, &paused_once](uint64_t end) {
        if (end == 500 && !paused_once.exchange(true)) {
            if (auto s = weak.lock()) {
                (void)s->pause();
            }
        }
    });

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("paused"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    std::filesystem::remove(session->download_path());
    ASSERT_TRUE(session->resume().has_value());
    ASSERT_TRUE(listener_->wait_for("error"));

    auto failure = listener_->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, failure_kind::transfer_incomplete);
}

TEST_F(SessionScenarioTest, AdapterExceptionReportedAsFault) {
    http_->set_throw_on_get(true);
    auto session = make_session();

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("error"));
    ASSERT_TRUE(session->wait_for_worker(5s));

    auto failure = listener_->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, failure_kind::unexpected_fault);
    EXPECT_EQ(registry_->file_sharing_session_count(), 0u);
}

TEST_F(SessionScenarioTest, DigestMismatchReportedAsIncomplete) {
    auto invitation = make_invitation();
    invitation.file.sha256 = std::string(64, '0');
    auto session = make_session(invitation);

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());
    ASSERT_TRUE(listener_->wait_for("error"));

    auto failure = listener_->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, failure_kind::transfer_incomplete);
    EXPECT_FALSE(session->content().has_location());
    EXPECT_TRUE(sender_->sent().empty());
}

TEST_F(SessionScenarioTest, DigestMatchCompletes) {
    auto invitation = make_invitation();
    invitation.file.sha256 = sha256_hex(content_);
    auto session = make_session(invitation);

    ASSERT_TRUE(session->accept().has_value());
    ASSERT_TRUE(session->start().has_value());

    ASSERT_TRUE(listener_->wait_for("completed"));
}

}  // namespace kcenon::ims_session::test
