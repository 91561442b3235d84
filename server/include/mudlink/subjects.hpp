/*
 * 설명: 브로커 주제 이름 규칙(root.location.{key}, root.global, root.direct.{id}, root.system)을 생성/검증/해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/subjects_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mudlink/types.hpp"

namespace mudlink {

struct ParsedSubject {
  ChannelKind kind;
  std::string parameter;
};

class SubjectNamer {
 public:
  static constexpr std::size_t kMaxSubjectLength = 255;

  explicit SubjectNamer(std::string root = "chat");

  const std::string& Root() const { return root_; }

  std::optional<std::string> Location(const LocationKey& location) const;
  std::string Global() const { return root_ + ".global"; }
  std::optional<std::string> Direct(const Identity& identity) const;
  std::string System() const { return root_ + ".system"; }

  // 위치/개인 채널은 parameter가 필요하다. 잘못된 토큰이면 nullopt.
  std::optional<std::string> ForChannel(ChannelKind kind, const std::string& parameter = {}) const;
  std::optional<ParsedSubject> Parse(std::string_view subject) const;
  std::vector<std::string> InboundPatterns() const;

  static bool IsValidToken(std::string_view token);
  // NATS 방식 와일드카드: '*'는 토큰 하나, '>'는 나머지 전체와 일치한다.
  static bool Matches(std::string_view pattern, std::string_view subject);
  static std::vector<std::string_view> Split(std::string_view subject);

 private:
  std::optional<std::string> Checked(std::string subject) const;

  std::string root_;
};

}  // namespace mudlink
