/*
 * 설명: OpenSSL 난수로 연결/메시지/노드 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace mudlink {

// bytes 바이트의 난수를 16진 문자열로 돌려준다. 난수원을 쓸 수 없으면 std::runtime_error.
std::string RandomHex(std::size_t bytes);

}  // namespace mudlink
