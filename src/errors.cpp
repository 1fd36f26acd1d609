#include "errors.h"

#include <utility>

namespace embedpy {

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::invalid_format: return "InvalidFormat";
    case error_kind::not_found: return "NotFound";
    case error_kind::fetch: return "FetchError";
    case error_kind::extraction: return "ExtractionError";
    case error_kind::copy: return "CopyError";
    case error_kind::patch: return "PatchError";
    case error_kind::tool_execution: return "ToolExecutionError";
    case error_kind::external_tool: return "ExternalToolError";
    case error_kind::missing_environment: return "MissingEnvironment";
  }
  return "UnknownError";
}

provision_error::provision_error(error_kind kind,
                                 std::string const &message,
                                 std::string output)
    : std::runtime_error{ std::string{ error_kind_name(kind) } + ": " + message },
      kind_{ kind },
      output_{ std::move(output) } {}

}  // namespace embedpy
