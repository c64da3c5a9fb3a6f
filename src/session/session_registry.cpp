// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_registry.cpp
 * @brief Implementation of session_registry
 */

#include "kcenon/ims_session/session/session_registry.h"

#include "kcenon/ims_session/core/logging.h"
#include "kcenon/ims_session/session/file_sharing_session.h"

#include <mutex>

namespace kcenon::ims_session {

auto session_registry::add_file_sharing_session(std::shared_ptr<file_sharing_session> session)
    -> result<void> {
    if (!session) {
        return unexpected(error{error_code::invalid_argument, "null session"});
    }

    const auto id = session->identity().session_id;
    {
        std::unique_lock lock(file_sharing_mutex_);
        auto [it, inserted] = file_sharing_.emplace(id, std::move(session));
        if (!inserted) {
            return unexpected(error{error_code::session_already_exists,
                                    "session already registered: " + id});
        }
    }

    IMS_LOG_DEBUG(log_category::registry, "registered file sharing session " + id);
    return {};
}

auto session_registry::remove_file_sharing_session(const std::string& session_id) -> bool {
    std::shared_ptr<file_sharing_session> removed;
    {
        std::unique_lock lock(file_sharing_mutex_);
        auto it = file_sharing_.find(session_id);
        if (it == file_sharing_.end()) {
            return false;
        }
        // Released after the lock; the registry may hold the last reference
        removed = std::move(it->second);
        file_sharing_.erase(it);
    }

    IMS_LOG_DEBUG(log_category::registry, "removed file sharing session " + session_id);
    return true;
}

auto session_registry::find_file_sharing_session(const std::string& session_id) const
    -> std::shared_ptr<file_sharing_session> {
    std::shared_lock lock(file_sharing_mutex_);
    auto it = file_sharing_.find(session_id);
    return it != file_sharing_.end() ? it->second : nullptr;
}

auto session_registry::file_sharing_session_count() const -> std::size_t {
    std::shared_lock lock(file_sharing_mutex_);
    return file_sharing_.size();
}

auto session_registry::file_sharing_session_ids() const -> std::vector<std::string> {
    std::shared_lock lock(file_sharing_mutex_);
    std::vector<std::string> ids;
    ids.reserve(file_sharing_.size());
    for (const auto& [id, session] : file_sharing_) {
        ids.push_back(id);
    }
    return ids;
}

auto session_registry::add_chat_session(std::shared_ptr<chat_session> session) -> result<void> {
    if (!session) {
        return unexpected(error{error_code::invalid_argument, "null chat session"});
    }

    const bool group = session->is_group_chat();
    auto key = group ? session->contribution_id() : session->remote_contact();
    if (!key || key->empty()) {
        return unexpected(error{error_code::invalid_argument,
                                group ? "group chat without contribution id"
                                      : "one-to-one chat without remote contact"});
    }

    std::unique_lock lock(chat_mutex_);
    auto& table = group ? group_chats_ : one_to_one_chats_;
    auto [it, inserted] = table.emplace(*key, std::move(session));
    if (!inserted) {
        return unexpected(error{error_code::session_already_exists,
                                "chat session already registered for " + *key});
    }
    return {};
}

auto session_registry::remove_chat_session(const std::string& session_id) -> bool {
    std::unique_lock lock(chat_mutex_);
    for (auto* table : {&group_chats_, &one_to_one_chats_}) {
        for (auto it = table->begin(); it != table->end(); ++it) {
            if (it->second->session_id() == session_id) {
                table->erase(it);
                return true;
            }
        }
    }
    return false;
}

auto session_registry::find_group_chat_session(const std::string& contribution_id) const
    -> std::shared_ptr<chat_session> {
    std::shared_lock lock(chat_mutex_);
    auto it = group_chats_.find(contribution_id);
    return it != group_chats_.end() ? it->second : nullptr;
}

auto session_registry::find_one_to_one_chat_session(const std::string& contact) const
    -> std::shared_ptr<chat_session> {
    std::shared_lock lock(chat_mutex_);
    auto it = one_to_one_chats_.find(contact);
    return it != one_to_one_chats_.end() ? it->second : nullptr;
}

auto session_registry::chat_session_count() const -> std::size_t {
    std::shared_lock lock(chat_mutex_);
    return group_chats_.size() + one_to_one_chats_.size();
}

void session_registry::clear() {
    std::unordered_map<std::string, std::shared_ptr<file_sharing_session>> sessions;
    {
        std::unique_lock lock(file_sharing_mutex_);
        sessions.swap(file_sharing_);
    }
    std::unique_lock lock(chat_mutex_);
    group_chats_.clear();
    one_to_one_chats_.clear();
}

}  // namespace kcenon::ims_session
