#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using phrase::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "phrase_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\phrases\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\phrases\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/phrase-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(config.validation().min_words() == 0);
  assert(config.selection().max_batch_size() == 0);
}

void TestPolicySectionsParse() {
  auto config = ConfigLoader::LoadFromYamlString(R"(validation:
  min_words: 1
  max_words: 4
  max_word_length: 10
selection:
  beginner_threshold: 40
  beginner_ceiling: 60
  default_batch_size: 3
  max_batch_size: 10
logging:
  level: debug
)");

  assert(config.validation().min_words() == 1);
  assert(config.validation().max_words() == 4);
  assert(config.validation().max_word_length() == 10);
  assert(config.selection().beginner_threshold() == 40);
  assert(config.selection().beginner_ceiling() == 60);
  assert(config.selection().default_batch_size() == 3);
  assert(config.selection().max_batch_size() == 10);
  assert(config.logging().level() == "debug");
}

void TestInconsistentSettingsAreRejected() {
  assert(Rejects("validation:\n  min_words: 5\n  max_words: 2\n"));
  assert(Rejects("selection:\n  beginner_threshold: 101\n"));
  assert(Rejects("selection:\n  beginner_ceiling: -1\n"));
  assert(Rejects("selection:\n  default_batch_size: 30\n  max_batch_size: 25\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(!Rejects("selection:\n  default_batch_size: 25\n  max_batch_size: 25\n"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestEmptyDocumentUsesDefaults();
  TestPolicySectionsParse();
  TestInconsistentSettingsAreRejected();

  std::cout << "phrase_manager_unit_config_loader: pass\n";
  return 0;
}
