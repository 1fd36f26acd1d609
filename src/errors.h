#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace embedpy {

enum class error_kind {
  invalid_format,       // malformed version string or tool output
  not_found,            // no matching host library directory
  fetch,                // network / HTTP failure
  extraction,           // archive corrupt or unwritable
  copy,                 // filesystem merge failure
  patch,                // expected configuration directive missing
  tool_execution,       // child process exited non-zero or failed to spawn
  external_tool,        // host interpreter missing or failed during version query
  missing_environment,  // process search-path variable absent
};

std::string_view error_kind_name(error_kind kind);

// Fatal provisioning failure. what() is "<Kind>: <message>".
class provision_error : public std::runtime_error {
 public:
  provision_error(error_kind kind, std::string const &message, std::string output = {});

  error_kind kind() const { return kind_; }

  // Captured child-process output for tool failures, empty otherwise.
  std::string const &output() const { return output_; }

 private:
  error_kind kind_;
  std::string output_;
};

}  // namespace embedpy
