/*
 * 설명: OpenSSL 기반 난수, base64url 인코딩, HMAC-SHA256 서명과 상수 시간 비교를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/crypto_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace foxnavy {

// RAND_bytes 실패 시 std::runtime_error를 던진다.
std::string RandomBytes(std::size_t count);

// 패딩 없는 URL-safe base64 (RFC 4648 §5).
std::string Base64UrlEncode(std::string_view data);
std::optional<std::string> Base64UrlDecode(std::string_view encoded);

// 32바이트 원시 다이제스트를 반환한다.
std::string HmacSha256(std::string_view key, std::string_view data);

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs);

}  // namespace foxnavy
