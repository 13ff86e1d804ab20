#include <gtest/gtest.h>

#include "SessionStore.h"

using namespace Session;

namespace {

TranscriptMessage agentMessage(const std::string& text)
{
    TranscriptMessage msg;
    msg.speaker = Speaker::AGENT;
    msg.text = text;
    msg.isFinal = true;
    return msg;
}

} // namespace

TEST(SessionStoreTest, StartsIdle)
{
    SessionStore store;
    SessionSnapshot s = store.Snapshot();
    EXPECT_EQ(s.callStatus, CallStatus::IDLE);
    EXPECT_FALSE(s.sessionId.has_value());
    EXPECT_EQ(s.agentStatus, AgentStatus::IDLE);
    EXPECT_TRUE(s.messages.empty());
    EXPECT_FALSE(s.conversation.intent.has_value());
    EXPECT_FALSE(s.conversation.authenticated);
    EXPECT_FALSE(s.isMuted);
    EXPECT_FLOAT_EQ(s.volume, 1.0f);
}

TEST(SessionStoreTest, InterimUpdatesReplaceTheOpenMessage)
{
    SessionStore store;
    store.UpdateLastInterim("trans");
    store.UpdateLastInterim("transfer");

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_EQ(s.messages[0].speaker, Speaker::USER);
    EXPECT_EQ(s.messages[0].text, "transfer");
    EXPECT_FALSE(s.messages[0].isFinal);
    EXPECT_FALSE(s.messages[0].id.empty());
    EXPECT_FALSE(s.messages[0].timestamp.empty());
}

TEST(SessionStoreTest, FinalTranscriptClosesTheInterimInPlace)
{
    SessionStore store;
    store.UpdateLastInterim("check my bal");
    std::string id = store.Snapshot().messages[0].id;

    store.FinalizeUserTranscript("check my balance", "2024-05-01T10:00:00.000");

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_EQ(s.messages[0].id, id);
    EXPECT_EQ(s.messages[0].text, "check my balance");
    EXPECT_TRUE(s.messages[0].isFinal);
}

TEST(SessionStoreTest, FinalTranscriptWithoutInterimAppends)
{
    SessionStore store;
    store.FinalizeUserTranscript("hello", "2024-05-01T10:00:00.000");

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_TRUE(s.messages[0].isFinal);
    EXPECT_EQ(s.messages[0].timestamp, "2024-05-01T10:00:00.000");
}

TEST(SessionStoreTest, FinalizedMessagesAreNeverRewritten)
{
    SessionStore store;
    store.UpdateLastInterim("first");
    store.FinalizeUserTranscript("first turn", "");
    store.UpdateLastInterim("sec");

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 2u);
    EXPECT_EQ(s.messages[0].text, "first turn");
    EXPECT_TRUE(s.messages[0].isFinal);
    EXPECT_EQ(s.messages[1].text, "sec");
    EXPECT_FALSE(s.messages[1].isFinal);
    EXPECT_NE(s.messages[0].id, s.messages[1].id);
}

TEST(SessionStoreTest, AgentMessagesDoNotTouchTheUserInterim)
{
    SessionStore store;
    store.UpdateLastInterim("I want to");
    store.AddMessage(agentMessage("Go on."));
    store.UpdateLastInterim("I want to transfer");

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 2u);
    EXPECT_EQ(s.messages[0].text, "I want to transfer");
    EXPECT_EQ(s.messages[1].speaker, Speaker::AGENT);
    EXPECT_EQ(s.messages[1].text, "Go on.");
}

TEST(SessionStoreTest, AddMessageFillsMissingIdAndTimestamp)
{
    SessionStore store;
    store.AddMessage(agentMessage("one"));
    store.AddMessage(agentMessage("two"));

    SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 2u);
    EXPECT_FALSE(s.messages[0].id.empty());
    EXPECT_NE(s.messages[0].id, s.messages[1].id);

    // UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
    const std::string& stamp = s.messages[0].timestamp;
    ASSERT_EQ(stamp.size(), 24u);
    EXPECT_EQ(stamp[10], 'T');
    EXPECT_EQ(stamp[19], '.');
    EXPECT_EQ(stamp.back(), 'Z');
}

TEST(SessionStoreTest, MergeKeepsAbsentFieldsAndClearsNulls)
{
    SessionStore store;

    ConversationStateUpdate first;
    first.intent = std::optional<std::string>("transfer");
    first.authenticated = true;
    first.flowStage = std::optional<std::string>("collect_amount");
    store.MergeConversationState(first);

    ConversationStateUpdate second;
    second.flowStage = std::optional<std::string>();
    second.escalationRequested = true;
    store.MergeConversationState(second);

    ConversationState c = store.Snapshot().conversation;
    ASSERT_TRUE(c.intent.has_value());
    EXPECT_EQ(*c.intent, "transfer");
    EXPECT_TRUE(c.authenticated);
    EXPECT_FALSE(c.flowStage.has_value());
    EXPECT_TRUE(c.escalationRequested);
}

TEST(SessionStoreTest, EmptyMergeIsNotAChange)
{
    SessionStore store;
    uint64_t before = store.Snapshot().revision;
    store.MergeConversationState(ConversationStateUpdate{});
    EXPECT_EQ(store.Snapshot().revision, before);
}

TEST(SessionStoreTest, AudioPreferences)
{
    SessionStore store;
    store.ToggleMute();
    EXPECT_TRUE(store.IsMuted());
    store.ToggleMute();
    EXPECT_FALSE(store.IsMuted());

    store.SetVolume(1.7f);
    EXPECT_FLOAT_EQ(store.Snapshot().volume, 1.0f);
    store.SetVolume(-0.2f);
    EXPECT_FLOAT_EQ(store.Snapshot().volume, 0.0f);
    store.SetVolume(0.4f);
    EXPECT_FLOAT_EQ(store.Snapshot().volume, 0.4f);
}

TEST(SessionStoreTest, ResetRestoresInitialValues)
{
    SessionStore store;
    store.SetCallStatus(CallStatus::ACTIVE);
    store.SetSessionId("abc");
    store.SetAgentStatus(AgentStatus::SPEAKING);
    store.AddMessage(agentMessage("hi"));
    store.SetMuted(true);
    store.SetVolume(0.2f);
    uint64_t revision = store.Snapshot().revision;

    store.Reset();

    SessionSnapshot s = store.Snapshot();
    EXPECT_EQ(s.callStatus, CallStatus::IDLE);
    EXPECT_FALSE(s.sessionId.has_value());
    EXPECT_EQ(s.agentStatus, AgentStatus::IDLE);
    EXPECT_TRUE(s.messages.empty());
    EXPECT_FALSE(s.isMuted);
    EXPECT_FLOAT_EQ(s.volume, 1.0f);
    EXPECT_GT(s.revision, revision);
}

TEST(SessionStoreTest, ListenersSeeEveryMutationInOrder)
{
    SessionStore store;
    std::vector<ChangeKind> kinds;
    std::vector<uint64_t> revisions;
    int id = store.Subscribe([&](ChangeKind kind, const SessionSnapshot& s) {
        kinds.push_back(kind);
        revisions.push_back(s.revision);
    });

    store.SetCallStatus(CallStatus::CONNECTING);
    store.SetSessionId("s-1");
    store.SetAgentStatus(AgentStatus::LISTENING);
    store.UpdateLastInterim("hi");

    ASSERT_EQ(kinds.size(), 4u);
    EXPECT_EQ(kinds[0], ChangeKind::CALL_STATUS);
    EXPECT_EQ(kinds[1], ChangeKind::SESSION_ID);
    EXPECT_EQ(kinds[2], ChangeKind::AGENT_STATUS);
    EXPECT_EQ(kinds[3], ChangeKind::TRANSCRIPT);
    for (size_t i = 1; i < revisions.size(); ++i) {
        EXPECT_EQ(revisions[i], revisions[i - 1] + 1);
    }

    store.Unsubscribe(id);
    store.SetCallStatus(CallStatus::ENDED);
    EXPECT_EQ(kinds.size(), 4u);
}

TEST(SessionStoreTest, ListenerMayReadTheStore)
{
    SessionStore store;
    CallStatus seen = CallStatus::IDLE;
    store.Subscribe([&](ChangeKind, const SessionSnapshot&) {
        seen = store.GetCallStatus();
    });
    store.SetCallStatus(CallStatus::ACTIVE);
    EXPECT_EQ(seen, CallStatus::ACTIVE);
}

TEST(SessionStoreTest, UnobservedMutationsStillAdvanceAndLaterListenersSeeThem)
{
    SessionStore store;
    for (int i = 0; i < 50; ++i) {
        store.AddMessage(agentMessage("line " + std::to_string(i)));
    }
    store.UpdateLastInterim("still talking");
    EXPECT_EQ(store.Snapshot().revision, 51u);

    size_t seenMessages = 0;
    uint64_t seenRevision = 0;
    store.Subscribe([&](ChangeKind, const SessionSnapshot& s) {
        seenMessages = s.messages.size();
        seenRevision = s.revision;
    });
    store.UpdateLastInterim("still talking, louder");
    EXPECT_EQ(seenMessages, 51u);
    EXPECT_EQ(seenRevision, 52u);
}
