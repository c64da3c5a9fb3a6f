// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_download_engine.cpp
 * @brief Unit tests for the resumable download engine
 */

#include <gtest/gtest.h>

#include "common/test_fixtures.h"

#include <kcenon/ims_session/download/download_engine.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

namespace kcenon::ims_session::test {

class DownloadEngineTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        content_ = make_content(1000);
        http_ = std::make_shared<scripted_http_adapter>(content_);
        config_.retry_delay = std::chrono::milliseconds(1);
    }

    auto make_task(uint64_t total_size = 1000) -> download_task {
        download_task task;
        task.transfer_id = "ft-1";
        task.uri = "https://ftcontent.example.com/files/ft-1";
        task.destination = download_dir_ / "photo.jpg";
        task.total_size = total_size;
        return task;
    }

    auto make_engine(download_task task) -> std::unique_ptr<download_engine> {
        return std::make_unique<download_engine>(http_, std::move(task), config_);
    }

    auto make_engine() -> std::unique_ptr<download_engine> {
        return make_engine(make_task());
    }

    /**
     * @brief Pause the engine once the adapter has served the given offset
     */
    void pause_at(download_engine& engine, uint64_t at) {
        http_->set_on_bytes_served([&engine, at](uint64_t served) {
            if (served == at) {
                engine.pause_transfer_by_user();
            }
        });
    }

    std::vector<std::byte> content_;
    std::shared_ptr<scripted_http_adapter> http_;
    download_config config_;
};

// =============================================================================
// Full downloads
// =============================================================================

TEST_F(DownloadEngineTest, FetchStoresWholeResource) {
    auto engine = make_engine();
    std::vector<transfer_progress> updates;

    auto r = engine->fetch([&](const transfer_progress& p) { updates.push_back(p); });

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(engine->status(), download_status::completed);
    EXPECT_EQ(read_file(engine->destination()), content_);
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().bytes_transferred, 1000u);
    EXPECT_EQ(updates.back().total_bytes, 1000u);
}

TEST_F(DownloadEngineTest, FirstRequestHasNoRange) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->fetch().has_value());

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://ftcontent.example.com/files/ft-1");
    EXPECT_EQ(requests[0].headers.count("Range"), 0u);
    EXPECT_EQ(requests[0].headers.at("User-Agent"), "ims-session/1.0");
}

TEST_F(DownloadEngineTest, UnknownSizeTakenFromContentLength) {
    auto engine = make_engine(make_task(0));

    ASSERT_TRUE(engine->fetch().has_value());
    EXPECT_EQ(engine->progress().total_bytes, 1000u);
    EXPECT_EQ(engine->snapshot().task.total_size, 1000u);
}

TEST_F(DownloadEngineTest, EntityTagRecorded) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->fetch().has_value());

    auto snap = engine->snapshot();
    ASSERT_TRUE(snap.etag.has_value());
    EXPECT_EQ(*snap.etag, "\"v1\"");
    EXPECT_EQ(snap.offset, 1000u);
}

TEST_F(DownloadEngineTest, SecondFetchRejected) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->fetch().has_value());

    auto again = engine->fetch();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state_transition);
}

TEST_F(DownloadEngineTest, MissingAdapterReported) {
    download_engine engine(nullptr, make_task(), config_);

    auto r = engine.fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::http_not_available);
    EXPECT_EQ(engine.status(), download_status::failed);
}

// =============================================================================
// Pause and resume
// =============================================================================

TEST_F(DownloadEngineTest, PauseKeepsOffsetAndFile) {
    auto engine = make_engine();
    pause_at(*engine, 400);

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_paused);
    EXPECT_TRUE(engine->is_paused());
    EXPECT_EQ(engine->status(), download_status::paused);
    EXPECT_EQ(engine->progress().bytes_transferred, 400u);
    EXPECT_EQ(std::filesystem::file_size(engine->destination()), 400u);
}

TEST_F(DownloadEngineTest, ResumeRequestsRemainingRange) {
    auto engine = make_engine();
    pause_at(*engine, 400);
    ASSERT_FALSE(engine->fetch().has_value());
    http_->set_on_bytes_served(nullptr);

    auto r = engine->resume_from();

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_FALSE(engine->is_paused());
    EXPECT_EQ(engine->status(), download_status::completed);
    EXPECT_EQ(read_file(engine->destination()), content_);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].headers.at("Range"), "bytes=400-");
    EXPECT_EQ(requests[1].headers.at("If-Range"), "\"v1\"");
}

TEST_F(DownloadEngineTest, SuspensionTakesEffectBeforeNextSlice) {
    config_.chunk_size = 10;
    auto engine = make_engine();
    download_engine* raw = engine.get();

    auto r = engine->fetch([raw](const transfer_progress& p) {
        if (p.bytes_transferred == 250) {
            raw->pause_transfer_by_user();
        }
    });

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(engine->progress().bytes_transferred, 250u);
    EXPECT_EQ(std::filesystem::file_size(engine->destination()), 250u);
}

TEST_F(DownloadEngineTest, ChangedEntityTagFailsResume) {
    auto engine = make_engine();
    pause_at(*engine, 400);
    ASSERT_FALSE(engine->fetch().has_value());
    http_->set_on_bytes_served(nullptr);
    http_->set_etag("\"v2\"");

    auto r = engine->resume_from();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::resource_changed);
    EXPECT_EQ(engine->status(), download_status::failed);
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(DownloadEngineTest, LostPartialFileFailsResume) {
    auto engine = make_engine();
    pause_at(*engine, 400);
    ASSERT_FALSE(engine->fetch().has_value());
    std::filesystem::remove(engine->destination());

    auto r = engine->resume_from();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_incomplete);
}

TEST_F(DownloadEngineTest, ResumeAtTotalSizeSendsNoRequest) {
    auto engine = make_engine();
    pause_at(*engine, 1000);
    ASSERT_FALSE(engine->fetch().has_value());
    ASSERT_EQ(engine->progress().bytes_transferred, 1000u);

    auto r = engine->resume_from();

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(http_->request_count(), 1u);
    EXPECT_EQ(engine->status(), download_status::completed);
}

TEST_F(DownloadEngineTest, PauseBeforeStartThenResumeDownloadsEverything) {
    auto engine = make_engine();
    engine->pause_transfer_by_user();
    EXPECT_EQ(engine->status(), download_status::paused);

    auto r = engine->resume_from();

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(read_file(engine->destination()), content_);
}

TEST_F(DownloadEngineTest, ResumeAfterCompletionRejected) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->fetch().has_value());

    auto r = engine->resume_from();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_state_transition);
}

// =============================================================================
// Cancel
// =============================================================================

TEST_F(DownloadEngineTest, CancelStopsTransfer) {
    auto engine = make_engine();
    download_engine* raw = engine.get();
    http_->set_on_bytes_served([raw](uint64_t served) {
        if (served == 300) {
            raw->cancel();
        }
    });

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_cancelled);
    EXPECT_TRUE(engine->is_cancelled());
    EXPECT_EQ(engine->status(), download_status::cancelled);
}

TEST_F(DownloadEngineTest, CancelOverridesPause) {
    auto engine = make_engine();
    pause_at(*engine, 400);
    ASSERT_FALSE(engine->fetch().has_value());

    engine->cancel();
    auto r = engine->resume_from();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(http_->request_count(), 1u);
}

TEST_F(DownloadEngineTest, PauseAfterCancelIgnored) {
    auto engine = make_engine();
    engine->cancel();
    engine->pause_transfer_by_user();

    EXPECT_TRUE(engine->is_cancelled());
    EXPECT_FALSE(engine->is_paused());
    EXPECT_EQ(engine->status(), download_status::cancelled);
}

TEST_F(DownloadEngineTest, ExceptionAfterPauseLeavesEnginePaused) {
    auto engine = make_engine();
    download_engine* raw = engine.get();
    http_->set_on_bytes_served([raw](uint64_t served) {
        if (served == 400) {
            raw->pause_transfer_by_user();
            throw std::runtime_error("connection reset");
        }
    });

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::unexpected_fault);
    EXPECT_EQ(engine->status(), download_status::paused);
    EXPECT_EQ(engine->snapshot().offset, 400u);

    http_->set_on_bytes_served(nullptr);
    auto resumed = engine->resume_from();

    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(engine->status(), download_status::completed);
    EXPECT_EQ(read_file(engine->destination()), content_);
    EXPECT_EQ(http_->requests().back().headers.at("Range"), "bytes=400-");
}

TEST_F(DownloadEngineTest, ExceptionAfterCancelLeavesEngineCancelled) {
    auto engine = make_engine();
    download_engine* raw = engine.get();
    http_->set_on_bytes_served([raw](uint64_t served) {
        if (served == 300) {
            raw->cancel();
            throw std::runtime_error("connection reset");
        }
    });

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(engine->status(), download_status::cancelled);
    EXPECT_TRUE(engine->is_cancelled());
}

// =============================================================================
// Failures and retries
// =============================================================================

TEST_F(DownloadEngineTest, TransientFailuresRetried) {
    http_->fail_next_requests(2);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(http_->request_count(), 3u);
    EXPECT_EQ(read_file(engine->destination()), content_);
}

TEST_F(DownloadEngineTest, RetriesExhausted) {
    config_.max_retries = 2;
    http_->fail_next_requests(10);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transport_failure);
    EXPECT_EQ(http_->request_count(), 3u);
    EXPECT_EQ(engine->status(), download_status::failed);
}

TEST_F(DownloadEngineTest, ServerErrorRetried) {
    config_.max_retries = 1;
    http_->set_status_override(503);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transport_failure);
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(DownloadEngineTest, AdapterExceptionFailsFetch) {
    http_->set_throw_on_get(true);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::unexpected_fault);
    EXPECT_EQ(engine->status(), download_status::failed);
}

TEST_F(DownloadEngineTest, AbsentResourceNotRetried) {
    http_->set_status_override(404);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_incomplete);
    EXPECT_EQ(http_->request_count(), 1u);
}

TEST_F(DownloadEngineTest, GoneResourceIsIncomplete) {
    http_->set_status_override(410);
    auto engine = make_engine();

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(classify(r.error().code), failure_kind::transfer_incomplete);
}

TEST_F(DownloadEngineTest, ShortBodyIsIncomplete) {
    auto engine = make_engine(make_task(2000));

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::transfer_incomplete);
}

// =============================================================================
// Integrity
// =============================================================================

TEST_F(DownloadEngineTest, MatchingDigestAccepted) {
    auto task = make_task();
    task.expected_sha256 = sha256_hex(content_);
    auto engine = make_engine(std::move(task));

    EXPECT_TRUE(engine->fetch().has_value());
}

TEST_F(DownloadEngineTest, MismatchingDigestRejected) {
    auto task = make_task();
    task.expected_sha256 = sha256_hex(make_content(1000, 7));
    auto engine = make_engine(std::move(task));

    auto r = engine->fetch();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_hash_mismatch);
}

TEST_F(DownloadEngineTest, DigestIgnoredWhenVerificationDisabled) {
    config_.verify_checksum = false;
    auto task = make_task();
    task.expected_sha256 = sha256_hex(make_content(1000, 7));
    auto engine = make_engine(std::move(task));

    EXPECT_TRUE(engine->fetch().has_value());
}

TEST_F(DownloadEngineTest, StatusToString) {
    EXPECT_STREQ(to_string(download_status::pending), "pending");
    EXPECT_STREQ(to_string(download_status::completed), "completed");
    EXPECT_STREQ(to_string(static_cast<download_status>(99)), "unknown");
}

}  // namespace kcenon::ims_session::test
