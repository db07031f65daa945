#include "internal/identity/directory_identity_resolver.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cassert>
#include <ctime>
#include <exception>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

using scanhub::identity::Credential;
using scanhub::identity::DirectoryIdentityResolver;
using scanhub::runtime::config::IdentityConfig;

constexpr const char* kSecret = "unit-test-secret";

std::string Base64Url(const std::string& in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int   written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
  out.resize(static_cast<std::size_t>(written));
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (auto& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

std::string Sign(const std::string& secret, const std::string& data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), md,
       &md_len);
  return std::string(reinterpret_cast<const char*>(md), md_len);
}

std::string MintToken(const std::string& claims_json, const std::string& secret = kSecret,
                      const std::string& header_json = R"({"alg":"HS256","typ":"JWT"})") {
  const auto signing_input = Base64Url(header_json) + "." + Base64Url(claims_json);
  return signing_input + "." + Base64Url(Sign(secret, signing_input));
}

IdentityConfig MakeConfig(bool accept_unknown = false, const std::string& secret = kSecret) {
  IdentityConfig config;
  config.set_token_secret(secret);
  config.set_accept_unknown_logins(accept_unknown);

  auto* alice = config.add_users();
  alice->set_login("alice");
  alice->set_id(7);
  alice->set_display_name("Alice");

  auto* bob = config.add_users();
  bob->set_login("bob");
  return config;
}

Credential Token(std::string value) {
  return Credential{Credential::Kind::kToken, std::move(value)};
}

Credential Login(std::string value) {
  return Credential{Credential::Kind::kLogin, std::move(value)};
}

std::string FutureExp() {
  return std::to_string(std::time(nullptr) + 3600);
}

void TestValidTokenResolvesConfiguredUser() {
  DirectoryIdentityResolver resolver(MakeConfig());

  auto identity = resolver.Resolve(Token(MintToken(R"({"login":"alice","exp":)" + FutureExp() + "}")));
  assert(identity.has_value());
  assert(identity->login == "alice");
  assert(identity->id == 7);
  assert(identity->display_name == "Alice");

  // sub is the fallback claim; a zero id stays absent
  auto by_sub = resolver.Resolve(Token(MintToken(R"({"sub":"bob"})")));
  assert(by_sub.has_value());
  assert(by_sub->login == "bob");
  assert(!by_sub->id.has_value());
}

void TestTamperedTokensAreRefused() {
  DirectoryIdentityResolver resolver(MakeConfig());

  assert(!resolver.Resolve(Token(MintToken(R"({"login":"alice"})", "other-secret"))));

  auto token   = MintToken(R"({"login":"alice"})");
  auto forged  = MintToken(R"({"login":"bob"})");
  auto swapped = forged.substr(0, forged.rfind('.')) + token.substr(token.rfind('.'));
  assert(!resolver.Resolve(Token(swapped)));

  assert(!resolver.Resolve(Token(MintToken(R"({"login":"alice"})", kSecret, R"({"alg":"none"})"))));
  assert(!resolver.Resolve(Token("not-a-token")));
  assert(!resolver.Resolve(Token("a.b.c.d")));
  assert(!resolver.Resolve(Token("")));
}

void TestExpiredTokenIsRefused() {
  DirectoryIdentityResolver resolver(MakeConfig());

  assert(!resolver.Resolve(Token(MintToken(R"({"login":"alice","exp":1000})"))));
  assert(!resolver.Resolve(Token(MintToken(R"({"login":"alice","exp":"tomorrow"})"))));
}

void TestTokenWithoutLoginClaimIsRefused() {
  DirectoryIdentityResolver resolver(MakeConfig());
  assert(!resolver.Resolve(Token(MintToken(R"({"exp":)" + FutureExp() + "}"))));
}

void TestUnknownLoginsDependOnPolicy() {
  DirectoryIdentityResolver strict(MakeConfig(false));
  assert(!strict.Resolve(Login("mallory")));
  assert(!strict.Resolve(Token(MintToken(R"({"login":"mallory"})"))));

  DirectoryIdentityResolver open(MakeConfig(true));
  auto                      identity = open.Resolve(Login("mallory"));
  assert(identity.has_value());
  assert(identity->login == "mallory");
  assert(!identity->id.has_value());
  assert(identity->display_name.empty());
}

void TestTokensNeedAConfiguredSecret() {
  DirectoryIdentityResolver resolver(MakeConfig(false, ""));
  assert(!resolver.Resolve(Token(MintToken(R"({"login":"alice"})", ""))));
  assert(resolver.Resolve(Login("alice")).has_value());
}

void TestOversizedTokenIsRefusedWithoutThrowing() {
  DirectoryIdentityResolver resolver(MakeConfig());

  // correctly signed, but far beyond any real token
  const auto huge = MintToken(R"({"login":"alice","pad":")" + std::string(64 * 1024, 'x') + R"("})");

  bool threw = false;
  try {
    assert(!resolver.Resolve(Token(huge)).has_value());
  } catch (const std::exception&) {
    threw = true;
  }
  assert(!threw);

  // a normal token still resolves afterwards
  assert(resolver.Resolve(Token(MintToken(R"({"login":"alice"})"))).has_value());
}

void TestBareLoginResolvesConfiguredUser() {
  DirectoryIdentityResolver resolver(MakeConfig());

  auto identity = resolver.Resolve(Login("alice"));
  assert(identity.has_value());
  assert(identity->id == 7);
  assert(!resolver.Resolve(Login("")));
}

} // namespace

int main() {
  TestValidTokenResolvesConfiguredUser();
  TestTamperedTokensAreRefused();
  TestExpiredTokenIsRefused();
  TestTokenWithoutLoginClaimIsRefused();
  TestUnknownLoginsDependOnPolicy();
  TestTokensNeedAConfiguredSecret();
  TestOversizedTokenIsRefusedWithoutThrowing();
  TestBareLoginResolvesConfiguredUser();

  std::cout << "scanhub_unit_identity_resolver: pass\n";
  return 0;
}
