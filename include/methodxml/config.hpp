#pragma once

#include <cstddef>
#include <string>

namespace methodxml {

/// Encoder configuration.
struct config {
  /// Bytes reserved in the output buffer up front.
  /// Method bodies are usually a few KiB of markup.
  std::size_t initial_capacity = 1024;

  /// Text appended by line_break().
  std::string line_break = "\r\n";

  /// Display name of the assembly that owns the built-in types.
  /// Used when a special type is emitted assembly-qualified.
  std::string core_library_name =
    "mscorlib, Version=4.0.0.0, Culture=neutral, PublicKeyToken=b77a5c561934e089";
};

}  // namespace methodxml
