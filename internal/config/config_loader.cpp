#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace planner::config {
namespace {

using planner::runtime::config::RuntimeConfig;
using ProtoValue = google::protobuf::Value;

constexpr const char* kInlineSource = "<inline>";

[[noreturn]] void Fail(const std::string& source, const std::string& what) {
  throw util::ConfigError("config " + source + ": " + what);
}

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  if (mark.is_null()) {
    return {};
  }
  return " at line " + std::to_string(mark.line + 1);
}

// Largest magnitude a JSON double carries without losing integer precision.
constexpr double kExactIntegerLimit = 9007199254740992.0;

// Decimal literal: [+-]digits[.digits][(e|E)[+-]digits]. Rejects hex, inf and nan.
bool IsDecimalNumber(const std::string& text, bool* integral) {
  std::size_t i      = 0;
  const auto  digits = [&] {
    const std::size_t from = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    return i > from;
  };

  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  bool whole = digits();
  *integral  = true;
  if (i < text.size() && text[i] == '.') {
    ++i;
    *integral = false;
    whole     = digits() || whole;
  }
  if (!whole) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    *integral = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    if (!digits()) {
      return false;
    }
  }
  return i == text.size();
}

// YAML 1.2 spellings of infinity and NaN.
bool IsYamlSpecialFloat(const std::string& text) {
  std::string lowered;
  for (char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered == ".inf" || lowered == "+.inf" || lowered == "-.inf" || lowered == ".nan";
}

// Plain scalars are typed by their text; quoted ones ("5") stay strings.
// Integers too large for a double keep their digits as a string, which the
// JSON parser accepts for 64-bit fields.
void ConvertScalar(const YAML::Node& node, const std::string& source, ProtoValue* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  const bool   parsed = !text.empty() && end != nullptr && *end == '\0';

  bool integral = false;
  if (!IsDecimalNumber(text, &integral)) {
    if ((parsed && !std::isfinite(number)) || IsYamlSpecialFloat(text)) {
      Fail(source, "non-finite number: " + text + Where(node));
    }
    out->set_string_value(text);
    return;
  }
  if (!std::isfinite(number)) {
    Fail(source, "number out of range: " + text + Where(node));
  }
  if (integral && std::fabs(number) >= kExactIntegerLimit) {
    out->set_string_value(text.front() == '+' ? text.substr(1) : text);
  } else {
    out->set_number_value(number);
  }
}

void Convert(const YAML::Node& node, const std::string& source, ProtoValue* out) {
  if (node.IsNull()) {
    out->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ConvertScalar(node, source, out);
  } else if (node.IsSequence()) {
    auto* list = out->mutable_list_value();
    for (const auto& item : node) {
      Convert(item, source, list->add_values());
    }
  } else if (node.IsMap()) {
    auto* fields = out->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) {
        Fail(source, "mapping keys must be plain names" + Where(entry.first));
      }
      Convert(entry.second, source, &(*fields)[entry.first.Scalar()]);
    }
  } else {
    Fail(source, "unsupported YAML node" + Where(node));
  }
}

RuntimeConfig ParseDocument(const YAML::Node& root, const std::string& source) {
  RuntimeConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    Fail(source, "document root must be a mapping of config sections");
  }

  ProtoValue tree;
  Convert(root, source, &tree);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
    Fail(source, "cannot serialize to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    Fail(source, "does not match schema: " + std::string(status.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    Fail(path, std::string("failed to load YAML config: ") + e.what());
  }
  return ParseDocument(root, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    Fail(kInlineSource, std::string("failed to parse YAML config: ") + e.what());
  }
  return ParseDocument(root, kInlineSource);
}

} // namespace planner::config
