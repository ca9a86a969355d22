#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using supervisor::observability::FormatFields;
using supervisor::observability::IntField;
using supervisor::observability::StringField;

void TestPlainFields() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("instance_id", "abc-123"), IntField("silence_ms", 95000)}) == "instance_id=abc-123 silence_ms=95000");
}

void TestValuesNeedingQuotes() {
  // termination reasons and step names are free text
  assert(FormatFields({StringField("reason", "out of memory")}) == R"(reason="out of memory")");
  assert(FormatFields({StringField("error", R"(bad "payload")")}) == R"(error="bad \"payload\"")");
  assert(FormatFields({StringField("step", "a=b")}) == R"(step="a=b")");
  assert(FormatFields({StringField("summary", "line\nbreak")}) == R"(summary="line\nbreak")");
  assert(FormatFields({StringField("reason", "")}) == R"(reason="")");
}

void TestParseLevel() {
  assert(supervisor::observability::ParseLevel("debug") == spdlog::level::debug);
  assert(supervisor::observability::ParseLevel("warn") == spdlog::level::warn);
  assert(supervisor::observability::ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)supervisor::observability::ParseLevel("verbose");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesNeedingQuotes();
  TestParseLevel();

  std::cout << "agent_supervisor_unit_logging_fields: pass\n";
  return 0;
}
