/*
 * 설명: 브로커 주제 문자열을 조립하고 토큰 규칙과 와일드카드 일치를 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/subjects_test.cpp
 */
#include "mudlink/subjects.hpp"

#include <cctype>
#include <stdexcept>

namespace mudlink {

SubjectNamer::SubjectNamer(std::string root) : root_(std::move(root)) {
  if (!IsValidToken(root_)) {
    throw std::invalid_argument("주제 루트 토큰이 올바르지 않습니다: " + root_);
  }
}

std::optional<std::string> SubjectNamer::Location(const LocationKey& location) const {
  if (!IsValidToken(location)) {
    return std::nullopt;
  }
  return Checked(root_ + ".location." + location);
}

std::optional<std::string> SubjectNamer::Direct(const Identity& identity) const {
  if (!IsValidToken(identity)) {
    return std::nullopt;
  }
  return Checked(root_ + ".direct." + identity);
}

std::optional<std::string> SubjectNamer::ForChannel(ChannelKind kind, const std::string& parameter) const {
  switch (kind) {
    case ChannelKind::kLocation:
      return Location(parameter);
    case ChannelKind::kBroadcast:
      return Global();
    case ChannelKind::kDirect:
      return Direct(parameter);
    case ChannelKind::kSystem:
      return System();
  }
  return std::nullopt;
}

std::optional<ParsedSubject> SubjectNamer::Parse(std::string_view subject) const {
  auto tokens = Split(subject);
  if (tokens.size() < 2 || tokens[0] != root_) {
    return std::nullopt;
  }
  for (auto token : tokens) {
    if (!IsValidToken(token)) {
      return std::nullopt;
    }
  }
  if (tokens.size() == 2 && tokens[1] == "global") {
    return ParsedSubject{ChannelKind::kBroadcast, {}};
  }
  if (tokens.size() == 2 && tokens[1] == "system") {
    return ParsedSubject{ChannelKind::kSystem, {}};
  }
  if (tokens.size() == 3 && tokens[1] == "location") {
    return ParsedSubject{ChannelKind::kLocation, std::string(tokens[2])};
  }
  if (tokens.size() == 3 && tokens[1] == "direct") {
    return ParsedSubject{ChannelKind::kDirect, std::string(tokens[2])};
  }
  return std::nullopt;
}

std::vector<std::string> SubjectNamer::InboundPatterns() const {
  return {Global(), System()};
}

bool SubjectNamer::IsValidToken(std::string_view token) {
  if (token.empty() || token.size() > kMaxSubjectLength) {
    return false;
  }
  for (char c : token) {
    if (c == '.' || c == '*' || c == '>' || std::isspace(static_cast<unsigned char>(c)) ||
        std::iscntrl(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool SubjectNamer::Matches(std::string_view pattern, std::string_view subject) {
  auto pattern_tokens = Split(pattern);
  auto subject_tokens = Split(subject);
  std::size_t i = 0;
  for (; i < pattern_tokens.size(); ++i) {
    if (pattern_tokens[i] == ">") {
      return i + 1 == pattern_tokens.size() && subject_tokens.size() > i;
    }
    if (i >= subject_tokens.size()) {
      return false;
    }
    if (pattern_tokens[i] != "*" && pattern_tokens[i] != subject_tokens[i]) {
      return false;
    }
  }
  return i == subject_tokens.size();
}

std::vector<std::string_view> SubjectNamer::Split(std::string_view subject) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos <= subject.size()) {
    auto dot = subject.find('.', pos);
    if (dot == std::string_view::npos) {
      tokens.push_back(subject.substr(pos));
      break;
    }
    tokens.push_back(subject.substr(pos, dot - pos));
    pos = dot + 1;
  }
  return tokens;
}

std::optional<std::string> SubjectNamer::Checked(std::string subject) const {
  if (subject.size() > kMaxSubjectLength) {
    return std::nullopt;
  }
  return subject;
}

}  // namespace mudlink
