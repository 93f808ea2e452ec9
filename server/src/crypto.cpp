/*
 * 설명: OpenSSL 기반 난수, base64url 인코딩, HMAC-SHA256 서명과 상수 시간 비교를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/crypto_test.cpp
 */
#include "foxnavy/crypto.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace foxnavy {

namespace {
bool IsBase64UrlChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}
}  // namespace

std::string RandomBytes(std::size_t count) {
  std::vector<unsigned char> buffer(count);
  if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return std::string(buffer.begin(), buffer.end());
}

std::string Base64UrlEncode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string_view encoded) {
  if (encoded.empty()) {
    return std::string{};
  }
  // 4로 나눈 나머지가 1인 길이는 어떤 바이트열로도 만들어지지 않는다.
  if (encoded.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string standard;
  standard.reserve(encoded.size() + 3);
  for (char c : encoded) {
    if (!IsBase64UrlChar(c)) {
      return std::nullopt;
    }
    standard.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
  }
  std::size_t padding = (4 - standard.size() % 4) % 4;
  standard.append(padding, '=');

  std::vector<unsigned char> out(standard.size() / 4 * 3);
  int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                static_cast<int>(standard.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 위치도 0 바이트로 채워 길이에 포함한다.
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(decoded) - padding);
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digest_len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace foxnavy
