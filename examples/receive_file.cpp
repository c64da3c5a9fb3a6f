// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file receive_file.cpp
 * @brief Terminating file sharing session example
 *
 * This example demonstrates how to:
 * - Build a file sharing service with the default HTTP adapter
 * - Receive an invitation and accept it
 * - Download the file with progress reporting
 * - Pause and resume the transfer
 * - Observe the displayed report sent once the file is stored
 */

#include <kcenon/ims_session/ims_session.h>

#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace kcenon::ims_session;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <url> <size> [download_dir] [--pause-at <bytes>]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Downloads <url> as if a remote contact had offered it." << std::endl;
}

class console_sender : public delivery_status_sender {
public:
    auto send_delivery_status_immediately(const std::string& contact,
                                          const std::string& message_id,
                                          delivery_status status,
                                          const std::string& remote_instance_id,
                                          std::chrono::system_clock::time_point /*timestamp*/)
        -> result<void> override {
        std::cout << "[report] " << to_string(status) << " for " << message_id << " to "
                  << contact << " (" << remote_instance_id << ")" << std::endl;
        return {};
    }
};

class console_listener : public session_listener {
public:
    void on_transfer_started(const std::string& id) override {
        std::cout << "[" << id << "] download started" << std::endl;
    }

    void on_transfer_progress(const std::string&, const transfer_progress& progress) override {
        std::cout << "\rProgress: " << std::fixed << std::setprecision(1)
                  << progress.completion_percentage() << "% (" << progress.bytes_transferred
                  << "/" << progress.total_bytes << " bytes)" << std::flush;
    }

    void on_transfer_paused(const std::string& id) override {
        std::cout << std::endl << "[" << id << "] paused" << std::endl;
        signal();
    }

    void on_transfer_resumed(const std::string& id) override {
        std::cout << "[" << id << "] resumed" << std::endl;
    }

    void on_transfer_completed(const std::string& id, const content_location& location) override {
        std::cout << std::endl << "[" << id << "] stored at " << location.uri() << std::endl;
        finish(true);
    }

    void on_transfer_error(const std::string& id, const session_failure& failure) override {
        std::cerr << std::endl
                  << "[" << id << "] failed: " << to_string(failure.kind) << " ("
                  << failure.cause.message << ")" << std::endl;
        finish(false);
    }

    void wait_paused() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return paused_ || done_; });
        paused_ = false;
    }

    auto wait_done() -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
        return success_;
    }

private:
    void signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            paused_ = true;
        }
        cv_.notify_all();
    }

    void finish(bool success) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
            success_ = success;
        }
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
    bool done_ = false;
    bool success_ = false;
};

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string url = argv[1];
    auto size = std::strtoull(argv[2], nullptr, 10);
    std::filesystem::path download_dir = std::filesystem::current_path();
    uint64_t pause_at = 0;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pause-at" && i + 1 < argc) {
            pause_at = std::strtoull(argv[++i], nullptr, 10);
        } else {
            download_dir = arg;
        }
    }

    get_logger().set_level(log_level::info);

    auto service_result = file_sharing_service::builder()
        .with_settings_provider(std::make_shared<memory_settings_provider>(download_dir, true))
        .with_delivery_sender(std::make_shared<console_sender>())
        .build();

    if (!service_result.has_value()) {
        std::cerr << "Failed to create service: " << service_result.error().message
                  << std::endl;
        return 1;
    }

    auto& service = service_result.value();

    file_transfer_invitation invitation;
    invitation.identity.file_transfer_id = "example-ft";
    invitation.identity.remote_contact = "tel:+33612345678";
    invitation.download_uri = url;
    invitation.file.name = std::filesystem::path(url).filename().string();
    invitation.file.size = size;

    auto received = service.receive_invitation(invitation);
    if (!received.has_value()) {
        std::cerr << "Invitation refused: " << received.error().message << std::endl;
        return 1;
    }

    auto session = received.value();
    auto listener = std::make_shared<console_listener>();
    session->add_listener(listener);

    std::cout << "Receiving " << session->content().name() << " (" << size << " bytes) into "
              << session->download_path() << std::endl;

    if (auto r = session->accept(); !r) {
        std::cerr << "Accept failed: " << r.error().message << std::endl;
        return 1;
    }
    if (auto r = session->start(); !r) {
        std::cerr << "Start failed: " << r.error().message << std::endl;
        return 1;
    }

    if (pause_at > 0) {
        while (session->progress().bytes_transferred < pause_at &&
               !is_terminal(session->state())) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (session->pause()) {
            listener->wait_paused();
            (void)session->wait_for_worker(std::chrono::seconds(30));
            std::cout << "Paused at offset " << session->download_state().offset << std::endl;
            if (auto r = session->resume(); !r) {
                std::cerr << "Resume failed: " << r.error().message << std::endl;
                return 1;
            }
        }
    }

    bool ok = listener->wait_done();
    (void)session->wait_for_worker(std::chrono::seconds(30));
    return ok ? 0 : 1;
}
