#pragma once

#include <ib/spec.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace ib {

  // Builds a spec from a JSON configuration object:
  //
  //   {
  //     "skip-generation": false,
  //     "list-out-files": "out/files.txt",
  //     "cpp": { "out": "gen/cpp", "namespace": "app::gen",
  //              "ident": { "field": "m_foo_bar" } },
  //     "objc": { "out": "gen/objc", "file-ident": "APPFooBar" }
  //   }
  //
  // Identifier styles are given as an example spelling of "foo_bar" and
  // inferred. Throws std::runtime_error on malformed input.
  spec
  load_spec(const nlohmann::json& config);

  spec
  load_spec_file(const std::filesystem::path& path);

} // namespace ib
