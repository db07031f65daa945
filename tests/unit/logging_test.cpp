#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>

namespace {

using scanhub::observability::BoolField;
using scanhub::observability::FormatFields;
using scanhub::observability::IntField;
using scanhub::observability::ParseLogLevel;
using scanhub::observability::StringField;

void TestPlainValuesAreUnquoted() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("login", "alice"), IntField("platform", -5), BoolField("overwrite", true)}) ==
         "login=alice platform=-5 overwrite=true");
}

void TestAmbiguousValuesAreQuoted() {
  assert(FormatFields({StringField("login", "alice smith")}) == "login=\"alice smith\"");
  assert(FormatFields({StringField("login", "")}) == "login=\"\"");
  assert(FormatFields({StringField("login", "a=b")}) == "login=\"a=b\"");
  assert(FormatFields({StringField("error", "say \"hi\"")}) == "error=\"say \\\"hi\\\"\"");
  assert(FormatFields({StringField("path", "c:\\x")}) == "path=\"c:\\\\x\"");
  // a forged field cannot appear as a separate key
  assert(FormatFields({StringField("login", "x\nlevel=error")}) == "login=\"x\\nlevel=error\"");
}

void TestLevelNames() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("INFO") == spdlog::level::info);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("err") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);
  assert(!ParseLogLevel("verbose").has_value());
  assert(!ParseLogLevel("").has_value());
}

} // namespace

int main() {
  TestPlainValuesAreUnquoted();
  TestAmbiguousValuesAreQuoted();
  TestLevelNames();

  std::cout << "scanhub_unit_logging: pass\n";
  return 0;
}
