#include <gtest/gtest.h>

#include "tutor/event_whitelist.hpp"

TEST(EventWhitelistTest, AcceptsExactlyTheSevenClientEvents) {
  const char* allowed[] = {"input_audio_buffer.append", "input_audio_buffer.commit", "response.cancel",
                           "conversation.item.truncate", "response.create",          "conversation.item.create",
                           "session.update"};
  for (const char* type : allowed) {
    EXPECT_TRUE(tutor::IsClientEventAllowed(type)) << type;
  }
  EXPECT_EQ(tutor::kAllowedClientEventTypes.size(), 7u);
}

TEST(EventWhitelistTest, RejectsEverythingElse) {
  EXPECT_FALSE(tutor::IsClientEventAllowed(""));
  EXPECT_FALSE(tutor::IsClientEventAllowed("input_audio_buffer.clear"));
  EXPECT_FALSE(tutor::IsClientEventAllowed("response.function_call_arguments.done"));
  EXPECT_FALSE(tutor::IsClientEventAllowed("Session.Update"));
  EXPECT_FALSE(tutor::IsClientEventAllowed("session.update "));
  EXPECT_FALSE(tutor::IsClientEventAllowed("session"));
}
