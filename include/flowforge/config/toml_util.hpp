#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace flowforge::toml_util {

inline auto report_error(std::string *diagnostic, std::string message) -> void {
  log::debug("{}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

// "<origin>: <detail>", or just the detail for text with no origin.
inline auto with_origin(std::string_view origin, std::string_view detail)
    -> std::string {
  return origin.empty() ? std::string(detail)
                        : std::format("{}: {}", origin, detail);
}

/// Parses workflow or engine TOML. Unknown keys are tolerated so newer files
/// still load; a syntax or type error yields ParseError with glaze's
/// caret-annotated excerpt, prefixed by `origin` when one is given.
template <typename T>
[[nodiscard]] auto parse(std::string_view text, std::string_view origin,
                         std::string *diagnostic) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    report_error(diagnostic,
                   with_origin(origin, glz::format_error(ec, text)));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

/// Reads and parses `path`. A missing file is FileNotFound; a path that
/// exists but cannot be read (a directory, no permission) is FileOpenFailed.
template <typename T>
[[nodiscard]] auto load(const std::filesystem::path &path,
                        std::string *diagnostic) -> Result<T> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    report_error(diagnostic,
                   std::format("cannot read {}: no such file", path.string()));
    return fail(Error::FileNotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in || std::filesystem::is_directory(path, ec)) {
    report_error(diagnostic,
                   std::format("cannot read {}: not a readable file",
                               path.string()));
    return fail(Error::FileOpenFailed);
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return parse<T>(text, path.string(), diagnostic);
}

} // namespace flowforge::toml_util
