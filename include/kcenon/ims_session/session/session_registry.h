// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_registry.h
 * @brief Concurrent table of live sessions
 */

#ifndef KCENON_IMS_SESSION_SESSION_SESSION_REGISTRY_H
#define KCENON_IMS_SESSION_SESSION_SESSION_REGISTRY_H

#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/session/chat_session.h>

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::ims_session {

class file_sharing_session;

/**
 * @brief Registry of live file sharing and chat sessions
 *
 * File sharing sessions are keyed by session id. Chat sessions are keyed by
 * contribution id for group chats and by remote contact for one-to-one
 * chats. Each table has its own reader/writer lock. Lookup misses return
 * nullptr.
 *
 * @code
 * session_registry registry;
 * registry.add_file_sharing_session(session);
 * if (auto s = registry.find_file_sharing_session(id)) {
 *     s->accept();
 * }
 * @endcode
 */
class session_registry {
public:
    session_registry() = default;
    ~session_registry() = default;

    session_registry(const session_registry&) = delete;
    auto operator=(const session_registry&) -> session_registry& = delete;

    // File sharing sessions

    /**
     * @brief Register a session
     * @return session_already_exists if the id is taken, invalid_argument for null
     */
    [[nodiscard]] auto add_file_sharing_session(std::shared_ptr<file_sharing_session> session)
        -> result<void>;

    /**
     * @brief Remove a session
     * @return true if it was registered
     */
    auto remove_file_sharing_session(const std::string& session_id) -> bool;

    [[nodiscard]] auto find_file_sharing_session(const std::string& session_id) const
        -> std::shared_ptr<file_sharing_session>;

    [[nodiscard]] auto file_sharing_session_count() const -> std::size_t;

    [[nodiscard]] auto file_sharing_session_ids() const -> std::vector<std::string>;

    // Chat sessions

    /**
     * @brief Register a chat session under its contribution id or contact
     * @return invalid_argument when the session has no usable key,
     *         session_already_exists when the key is taken
     */
    [[nodiscard]] auto add_chat_session(std::shared_ptr<chat_session> session) -> result<void>;

    /**
     * @brief Remove a chat session by its session id
     */
    auto remove_chat_session(const std::string& session_id) -> bool;

    [[nodiscard]] auto find_group_chat_session(const std::string& contribution_id) const
        -> std::shared_ptr<chat_session>;

    [[nodiscard]] auto find_one_to_one_chat_session(const std::string& contact) const
        -> std::shared_ptr<chat_session>;

    [[nodiscard]] auto chat_session_count() const -> std::size_t;

    void clear();

private:
    mutable std::shared_mutex file_sharing_mutex_;
    std::unordered_map<std::string, std::shared_ptr<file_sharing_session>> file_sharing_;

    mutable std::shared_mutex chat_mutex_;
    std::unordered_map<std::string, std::shared_ptr<chat_session>> group_chats_;
    std::unordered_map<std::string, std::shared_ptr<chat_session>> one_to_one_chats_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_SESSION_REGISTRY_H
