#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace supervisor::config {

namespace {

// ${NAME} is replaced by the environment value; an unset variable is an
// error so that a missing secret does not become an empty connection uri.
std::string ExpandEnv(const std::string& raw, const std::string& source) {
  std::string out;
  out.reserve(raw.size());

  std::size_t pos = 0;
  while (pos < raw.size()) {
    const auto open = raw.find("${", pos);
    if (open == std::string::npos) {
      out.append(raw, pos, std::string::npos);
      break;
    }
    const auto close = raw.find('}', open + 2);
    if (close == std::string::npos) {
      throw std::runtime_error(source + ": unterminated ${ in '" + raw + "'");
    }
    out.append(raw, pos, open - pos);

    const auto  name  = raw.substr(open + 2, close - open - 2);
    const char* value = std::getenv(name.c_str());
    if (name.empty() || value == nullptr) {
      throw std::runtime_error(source + ": environment variable '" + name + "' is not set");
    }
    out.append(value);
    pos = close + 1;
  }
  return out;
}

class YamlToValue {
 public:
  explicit YamlToValue(std::string source) : source_(std::move(source)) {
  }

  void Convert(const YAML::Node& node, google::protobuf::Value* value) const {
    switch (node.Type()) {
      case YAML::NodeType::Null:
        value->set_null_value(google::protobuf::NULL_VALUE);
        return;
      case YAML::NodeType::Scalar:
        ConvertScalar(node, value);
        return;
      case YAML::NodeType::Sequence: {
        auto* list = value->mutable_list_value();
        for (const auto& item : node) {
          Convert(item, list->add_values());
        }
        return;
      }
      case YAML::NodeType::Map: {
        auto& fields = *value->mutable_struct_value()->mutable_fields();
        for (const auto& kv : node) {
          Convert(kv.second, &fields[kv.first.Scalar()]);
        }
        return;
      }
      default:
        throw std::runtime_error(source_ + ": unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
    }
  }

 private:
  void ConvertScalar(const YAML::Node& node, google::protobuf::Value* value) const {
    const auto text = ExpandEnv(node.Scalar(), source_);

    // quoted scalars carry the "!" tag and always stay strings
    if (node.Tag() == "!") {
      value->set_string_value(text);
      return;
    }
    if (text == "true" || text == "false") {
      value->set_bool_value(text == "true");
      return;
    }

    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end != nullptr && *end == '\0') {
      value->set_number_value(number);
      return;
    }
    value->set_string_value(text);
  }

  std::string source_;
};

supervisor::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml, const std::string& source) {
  if (yaml.IsNull()) {
    return {};
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error(source + ": configuration root must be a mapping");
  }

  google::protobuf::Value root;
  YamlToValue(source).Convert(yaml, &root);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error(source + ": " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  supervisor::runtime::config::RuntimeConfig config;
  auto                                       parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error(source + ": invalid configuration: " + std::string(parsed.message()));
  }
  return config;
}

} // namespace

supervisor::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config " + path + ": " + e.what());
  }
  return ParseYamlNode(yaml, "config " + path);
}

supervisor::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  return ParseYamlNode(yaml, "config");
}

} // namespace supervisor::config
