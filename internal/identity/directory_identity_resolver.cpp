#include "directory_identity_resolver.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace scanhub::identity {

using observability::StringField;

namespace {

constexpr std::size_t kMaxTokenBytes = 8192;

std::optional<std::string> Base64UrlDecode(const std::string& in) {
  std::string b64 = in;
  for (auto& c : b64) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
  }
  std::size_t padding = 0;
  while (b64.size() % 4 != 0) {
    b64.push_back('=');
    ++padding;
  }
  if (padding > 2) return std::nullopt;

  std::string out(b64.size() / 4 * 3, '\0');
  const int   decoded =
      EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
  if (decoded < 0) return std::nullopt;

  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

// nullopt when OpenSSL refuses the key or input
std::optional<std::string> HmacSha256(const std::string& key, const std::string& data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), md,
           &md_len) == nullptr) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char*>(md), md_len);
}

std::optional<google::protobuf::Struct> ParseJsonObject(const std::string& json) {
  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(json, &object).ok()) return std::nullopt;
  return object;
}

std::optional<std::string> StringClaim(const google::protobuf::Struct& claims, const std::string& name) {
  auto it = claims.fields().find(name);
  if (it == claims.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
  return it->second.string_value();
}

} // namespace

DirectoryIdentityResolver::DirectoryIdentityResolver(const scanhub::runtime::config::IdentityConfig& config)
    : secret_(config.token_secret()), accept_unknown_logins_(config.accept_unknown_logins()) {
  for (const auto& user : config.users()) {
    scanhub::session::IdentityMetadata metadata;
    metadata.login = user.login();
    if (user.id() != 0) {
      metadata.id = user.id();
    }
    metadata.display_name = user.display_name();
    users_.emplace(user.login(), std::move(metadata));
  }
}

std::optional<scanhub::session::IdentityMetadata> DirectoryIdentityResolver::Resolve(const Credential& credential) const {
  if (credential.value.empty()) return std::nullopt;

  if (credential.kind == Credential::Kind::kLogin) {
    return ResolveLogin(credential.value);
  }

  auto login = VerifyToken(credential.value);
  if (!login) return std::nullopt;
  return ResolveLogin(*login);
}

std::optional<scanhub::session::IdentityMetadata> DirectoryIdentityResolver::ResolveLogin(const std::string& login) const {
  if (auto it = users_.find(login); it != users_.end()) {
    return it->second;
  }
  if (!accept_unknown_logins_) {
    SCANHUB_LOG_WARN("unknown login refused", {StringField("login", login)});
    return std::nullopt;
  }

  scanhub::session::IdentityMetadata metadata;
  metadata.login = login;
  return metadata;
}

std::optional<std::string> DirectoryIdentityResolver::VerifyToken(const std::string& token) const {
  if (secret_.empty()) {
    SCANHUB_LOG_WARN("token presented but no token secret is configured");
    return std::nullopt;
  }

  if (token.size() > kMaxTokenBytes) {
    SCANHUB_LOG_WARN("token refused, too large", {observability::IntField("bytes", static_cast<int64_t>(token.size()))});
    return std::nullopt;
  }

  const auto first  = token.find('.');
  const auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) return std::nullopt;

  const auto signing_input = token.substr(0, second);
  const auto signature     = Base64UrlDecode(token.substr(second + 1));
  const auto expected      = HmacSha256(secret_, signing_input);
  if (!expected) {
    SCANHUB_LOG_ERROR("token signature could not be computed");
    return std::nullopt;
  }
  if (!signature || signature->size() != expected->size() || CRYPTO_memcmp(signature->data(), expected->data(), expected->size()) != 0) {
    SCANHUB_LOG_WARN("token signature mismatch");
    return std::nullopt;
  }

  const auto header_json = Base64UrlDecode(token.substr(0, first));
  const auto claims_json = Base64UrlDecode(token.substr(first + 1, second - first - 1));
  if (!header_json || !claims_json) return std::nullopt;

  const auto header = ParseJsonObject(*header_json);
  if (!header || StringClaim(*header, "alg") != std::optional<std::string>("HS256")) return std::nullopt;

  const auto claims = ParseJsonObject(*claims_json);
  if (!claims) return std::nullopt;

  if (auto exp = claims->fields().find("exp"); exp != claims->fields().end()) {
    const double now_s = static_cast<double>(scanhub::util::NowMillis()) / 1000.0;
    if (exp->second.kind_case() != google::protobuf::Value::kNumberValue || exp->second.number_value() <= now_s) {
      SCANHUB_LOG_WARN("token expired");
      return std::nullopt;
    }
  }

  auto login = StringClaim(*claims, "login");
  if (!login) login = StringClaim(*claims, "sub");
  return login;
}

} // namespace scanhub::identity
