#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "mudlink/subjects.hpp"

namespace {

TEST(SubjectNamerTest, BuildsHierarchicalSubjects) {
  mudlink::SubjectNamer subjects;
  EXPECT_EQ(subjects.Location("town_square").value_or(""), "chat.location.town_square");
  EXPECT_EQ(subjects.Global(), "chat.global");
  EXPECT_EQ(subjects.Direct("alice").value_or(""), "chat.direct.alice");
  EXPECT_EQ(subjects.System(), "chat.system");
  EXPECT_EQ(subjects.ForChannel(mudlink::ChannelKind::kBroadcast).value_or(""), "chat.global");

  mudlink::SubjectNamer custom("mud");
  EXPECT_EQ(custom.Location("dock").value_or(""), "mud.location.dock");
}

TEST(SubjectNamerTest, RejectsInvalidTokens) {
  mudlink::SubjectNamer subjects;
  EXPECT_FALSE(subjects.Location("").has_value());
  EXPECT_FALSE(subjects.Location("a.b").has_value());
  EXPECT_FALSE(subjects.Location("two words").has_value());
  EXPECT_FALSE(subjects.Direct("*").has_value());
  EXPECT_FALSE(subjects.Direct("x>").has_value());
  EXPECT_FALSE(subjects.ForChannel(mudlink::ChannelKind::kDirect).has_value());
  EXPECT_THROW(mudlink::SubjectNamer("bad.root"), std::invalid_argument);
}

TEST(SubjectNamerTest, EnforcesTotalLength) {
  mudlink::SubjectNamer subjects;
  std::string long_key(250, 'x');
  EXPECT_TRUE(mudlink::SubjectNamer::IsValidToken(long_key));
  EXPECT_FALSE(subjects.Location(long_key).has_value());
  EXPECT_TRUE(subjects.Location(std::string(200, 'x')).has_value());
}

TEST(SubjectNamerTest, ParsesKnownShapes) {
  mudlink::SubjectNamer subjects;
  auto location = subjects.Parse("chat.location.dock");
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->kind, mudlink::ChannelKind::kLocation);
  EXPECT_EQ(location->parameter, "dock");

  auto direct = subjects.Parse("chat.direct.bob");
  ASSERT_TRUE(direct.has_value());
  EXPECT_EQ(direct->kind, mudlink::ChannelKind::kDirect);
  EXPECT_EQ(direct->parameter, "bob");

  ASSERT_TRUE(subjects.Parse("chat.system").has_value());
  EXPECT_EQ(subjects.Parse("chat.global")->kind, mudlink::ChannelKind::kBroadcast);
  EXPECT_FALSE(subjects.Parse("other.global").has_value());
  EXPECT_FALSE(subjects.Parse("chat.location").has_value());
  EXPECT_FALSE(subjects.Parse("chat.weather.rain").has_value());
  EXPECT_FALSE(subjects.Parse("chat..global").has_value());
}

TEST(SubjectNamerTest, WildcardMatching) {
  using mudlink::SubjectNamer;
  EXPECT_TRUE(SubjectNamer::Matches("chat.global", "chat.global"));
  EXPECT_TRUE(SubjectNamer::Matches("chat.location.*", "chat.location.dock"));
  EXPECT_FALSE(SubjectNamer::Matches("chat.location.*", "chat.location.dock.pier"));
  EXPECT_FALSE(SubjectNamer::Matches("chat.location.*", "chat.location"));
  EXPECT_TRUE(SubjectNamer::Matches("chat.>", "chat.direct.alice"));
  EXPECT_TRUE(SubjectNamer::Matches("chat.>", "chat.global"));
  EXPECT_FALSE(SubjectNamer::Matches("chat.>", "chat"));
  EXPECT_TRUE(SubjectNamer::Matches("*.system", "chat.system"));
  EXPECT_FALSE(SubjectNamer::Matches("chat.global", "chat.system"));
}

TEST(SubjectNamerTest, InboundPatternsCoverSharedChannels) {
  mudlink::SubjectNamer subjects;
  auto patterns = subjects.InboundPatterns();
  ASSERT_EQ(patterns.size(), 2u);
  EXPECT_EQ(patterns[0], "chat.global");
  EXPECT_EQ(patterns[1], "chat.system");
}

}  // namespace
