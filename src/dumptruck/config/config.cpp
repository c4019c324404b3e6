#include "dumptruck/config/config.hpp"

#include "dumptruck/config/yaml_utils.hpp"
#include "dumptruck/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

using dumptruck::yaml_scalar_or;
using dumptruck::yaml_seconds_or;

template <>
struct convert<dumptruck::OutputFormat> {
  static bool decode(const Node& node, dumptruck::OutputFormat& f) {
    if (!node.IsMap()) {
      return false;
    }
    f.name = yaml_scalar_or<std::string>(node, "name", "");
    f.extension = yaml_scalar_or<std::string>(node, "extension", "");
    return true;
  }
};

template <>
struct convert<dumptruck::ToolConfig> {
  static bool decode(const Node& node, dumptruck::ToolConfig& t) {
    namespace defaults = dumptruck::defaults;
    namespace help = dumptruck::help;
    if (!node.IsMap()) {
      return false;
    }
    t.command =
        yaml_scalar_or<std::string>(node, "command", std::string(defaults::kTool));
    t.timeout = yaml_seconds_or(node, "timeout_sec", defaults::kTimeout);
    t.cache_capacity = yaml_scalar_or<std::size_t>(node, "cache_capacity",
                                                   defaults::kCacheCapacity);
    t.services_marker = yaml_scalar_or<std::string>(
        node, "services_marker", std::string(help::kServicesMarker));
    t.commands_marker = yaml_scalar_or<std::string>(
        node, "commands_marker", std::string(help::kCommandsMarker));
    return true;
  }
};

template <>
struct convert<dumptruck::OutputConfig> {
  static bool decode(const Node& node, dumptruck::OutputConfig& o) {
    if (!node.IsMap()) {
      return false;
    }
    o.directory = yaml_scalar_or<std::string>(
        node, "directory", std::string(dumptruck::defaults::kOutputDir));
    // A formats list replaces the defaults rather than extending them
    if (auto formats = node["formats"]) {
      if (!formats.IsSequence()) {
        return false;
      }
      o.formats.clear();
      for (const auto& f : formats) {
        o.formats.push_back(f.as<dumptruck::OutputFormat>());
      }
    }
    return true;
  }
};

template <>
struct convert<dumptruck::LoggingConfig> {
  static bool decode(const Node& node, dumptruck::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = yaml_scalar_or<std::string>(node, "level", "info");
    l.file = yaml_scalar_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<dumptruck::DumpConfig> {
  static bool decode(const Node& node, dumptruck::DumpConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto tool = node["tool"]) {
      c.tool = tool.as<dumptruck::ToolConfig>();
    }
    if (auto output = node["output"]) {
      c.output = output.as<dumptruck::OutputConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<dumptruck::LoggingConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace dumptruck {

namespace {

void to_yaml(YAML::Emitter& out, const ToolConfig& t) {
  const ToolConfig base;
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "command", t.command, base.command);
  yaml_emit_if_changed(out, "timeout_sec", t.timeout.count(),
                       base.timeout.count());
  yaml_emit_if_changed(out, "cache_capacity", t.cache_capacity,
                       base.cache_capacity);
  yaml_emit_if_changed(out, "services_marker", t.services_marker,
                       base.services_marker);
  yaml_emit_if_changed(out, "commands_marker", t.commands_marker,
                       base.commands_marker);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const OutputConfig& o) {
  const OutputConfig base;
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "directory", o.directory, base.directory);
  if (o.formats != base.formats) {
    out << YAML::Key << "formats" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : o.formats) {
      out << YAML::Flow << YAML::BeginMap;
      out << YAML::Key << "name" << YAML::Value << f.name;
      out << YAML::Key << "extension" << YAML::Value << f.extension;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  const LoggingConfig base;
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "level", l.level, base.level);
  yaml_emit_if_changed(out, "file", l.file, base.file);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<DumpConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<DumpConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    DumpConfig config = root.as<DumpConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_yaml_string(const DumpConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "tool" << YAML::Value;
  to_yaml(out, config.tool);

  out << YAML::Key << "output" << YAML::Value;
  to_yaml(out, config.output);

  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);

  out << YAML::EndMap;
  return std::string(out.c_str());
}

auto validate_config(const DumpConfig& config) -> Result<void> {
  if (config.tool.command.empty()) {
    log::error("tool.command must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.tool.timeout.count() <= 0 ||
      config.tool.timeout > defaults::kMaxTimeout) {
    log::error("tool.timeout_sec must be in 1..{}, got {}",
               std::chrono::seconds(defaults::kMaxTimeout).count(),
               config.tool.timeout.count());
    return fail(Error::InvalidArgument);
  }
  if (config.tool.services_marker.empty() ||
      config.tool.commands_marker.empty()) {
    log::error("help section markers must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.output.directory.empty()) {
    log::error("output.directory must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.output.formats.empty()) {
    log::error("output.formats must list at least one format");
    return fail(Error::InvalidArgument);
  }
  for (const auto& f : config.output.formats) {
    if (f.name.empty() || f.extension.empty()) {
      log::error("output format needs both name and extension (got '{}' -> '{}')",
                 f.name, f.extension);
      return fail(Error::InvalidArgument);
    }
  }
  if (!log::is_level_name(config.logging.level)) {
    log::error("unknown logging.level '{}'", config.logging.level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace dumptruck
