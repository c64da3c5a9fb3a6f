// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_session_types.cpp
 * @brief Unit tests for session states and the transition table
 */

#include <gtest/gtest.h>

#include <kcenon/ims_session/session/session_types.h>

#include <vector>

namespace kcenon::ims_session::test {

namespace {

const std::vector<session_state> kAllStates = {
    session_state::invited,     session_state::accepted, session_state::rejected,
    session_state::downloading, session_state::paused,   session_state::completed,
    session_state::error,       session_state::cancelled,
};

}  // namespace

// =============================================================================
// session_state Tests
// =============================================================================

class SessionStateTest : public ::testing::Test {};

TEST_F(SessionStateTest, ToString) {
    EXPECT_STREQ(to_string(session_state::invited), "invited");
    EXPECT_STREQ(to_string(session_state::downloading), "downloading");
    EXPECT_STREQ(to_string(session_state::cancelled), "cancelled");
    EXPECT_STREQ(to_string(static_cast<session_state>(999)), "unknown");
}

TEST_F(SessionStateTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(session_state::invited));
    EXPECT_FALSE(is_terminal(session_state::accepted));
    EXPECT_FALSE(is_terminal(session_state::downloading));
    EXPECT_FALSE(is_terminal(session_state::paused));
    EXPECT_TRUE(is_terminal(session_state::rejected));
    EXPECT_TRUE(is_terminal(session_state::completed));
    EXPECT_TRUE(is_terminal(session_state::error));
    EXPECT_TRUE(is_terminal(session_state::cancelled));
}

TEST_F(SessionStateTest, InvitationTransitions) {
    EXPECT_TRUE(is_valid_transition(session_state::invited, session_state::accepted));
    EXPECT_TRUE(is_valid_transition(session_state::invited, session_state::rejected));
    EXPECT_FALSE(is_valid_transition(session_state::invited, session_state::downloading));
    EXPECT_FALSE(is_valid_transition(session_state::invited, session_state::cancelled));
}

TEST_F(SessionStateTest, DownloadTransitions) {
    EXPECT_TRUE(is_valid_transition(session_state::accepted, session_state::downloading));
    EXPECT_FALSE(is_valid_transition(session_state::accepted, session_state::paused));
    EXPECT_FALSE(is_valid_transition(session_state::accepted, session_state::cancelled));

    EXPECT_TRUE(is_valid_transition(session_state::downloading, session_state::paused));
    EXPECT_TRUE(is_valid_transition(session_state::downloading, session_state::completed));
    EXPECT_TRUE(is_valid_transition(session_state::downloading, session_state::error));
    EXPECT_TRUE(is_valid_transition(session_state::downloading, session_state::cancelled));

    EXPECT_TRUE(is_valid_transition(session_state::paused, session_state::downloading));
    EXPECT_TRUE(is_valid_transition(session_state::paused, session_state::cancelled));
    EXPECT_FALSE(is_valid_transition(session_state::paused, session_state::completed));
}

TEST_F(SessionStateTest, TerminalStatesHaveNoExit) {
    for (auto from : kAllStates) {
        if (!is_terminal(from)) {
            continue;
        }
        for (auto to : kAllStates) {
            EXPECT_FALSE(is_valid_transition(from, to))
                << to_string(from) << " -> " << to_string(to);
        }
    }
}

TEST_F(SessionStateTest, NoSelfTransitions) {
    for (auto state : kAllStates) {
        EXPECT_FALSE(is_valid_transition(state, state)) << to_string(state);
    }
}

// =============================================================================
// Reason enums
// =============================================================================

TEST(SessionReasonTest, ToString) {
    EXPECT_STREQ(to_string(invitation_status::timeout), "timeout");
    EXPECT_STREQ(to_string(rejection_reason::low_space), "low_space");
    EXPECT_STREQ(to_string(termination_reason::by_remote), "by_remote");
}

TEST(SessionIdentityTest, DefaultsToTerminatingOneToOne) {
    session_identity identity;

    EXPECT_EQ(identity.direction, session_direction::terminating);
    EXPECT_FALSE(identity.is_group);
    EXPECT_FALSE(identity.contribution_id.has_value());
}

}  // namespace kcenon::ims_session::test
