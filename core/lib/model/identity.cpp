// driftscan/model/identity.cpp - Id derivation
#include "driftscan/model/identity.hpp"

#include <fmt/core.h>

namespace driftscan
{

std::string make_token_id(const TokenSource & source, std::string_view name)
{
  if (const auto * ts = std::get_if<TypeScriptSource>(&source)) {
    return fmt::format("typescript:{}:{}:{}", ts->path, ts->type_name, name);
  }
  return fmt::format("{}:{}:{}", source_kind(source), source_path(source), name);
}

std::string make_component_id(const ComponentSource & source)
{
  return fmt::format("{}:{}:{}", to_string(source.framework), source.path, source.export_name);
}

}  // namespace driftscan
