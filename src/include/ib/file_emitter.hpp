#pragma once

#include <ib/indent_writer.hpp>
#include <ib/spec.hpp>

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ib {

  enum class claim_status { claimed, duplicate, case_collision };

  struct claim_result {
    claim_status status;
    // The previously registered path when status != claimed.
    std::string existing;
  };

  // State shared by every backend during one generation run. Construct a
  // fresh session per run: a reused session reports collisions against files
  // written by the earlier run.
  class generation_session {
    // case-folded canonical path -> canonical path as first written
    std::unordered_map<std::string, std::string> written_files_;
    std::vector<std::string> manifest_;
    bool record_manifest_;
    std::ostream* manifest_sink_;

  public:
    explicit generation_session(bool record_manifest = false,
                                std::ostream* manifest_sink = nullptr);

    claim_result
    claim(const fs::path& canonical_path);

    bool
    records_manifest() const {
      return record_manifest_;
    }

    void
    record_output(const std::string& path);

    const std::vector<std::string>&
    manifest() const {
      return manifest_;
    }

    std::size_t
    written_file_count() const {
      return written_files_.size();
    }
  };

  using write_fn = std::function<void(indent_writer&)>;

  class file_emitter {
    const spec& spec_;
    generation_session& session_;

  public:
    file_emitter(const spec& s, generation_session& session);

    // Throws generation_error if a file with the same path, or one that
    // differs only in letter case, was already written in this session.
    void
    create_file(const fs::path& folder, const std::string& file_name,
                const writer_factory& make_writer, const write_fn& body) const;

    void
    create_file(const fs::path& folder, const std::string& file_name,
                const write_fn& body) const;

    // Like create_file, but a path that was already written is silently
    // skipped instead of being an error.
    void
    create_file_once(const fs::path& folder, const std::string& file_name,
                     const write_fn& body) const;

    // Appends to a file created earlier in the session. Not registered and
    // not listed in the manifest.
    void
    append_to_file(const fs::path& folder, const std::string& file_name,
                   const write_fn& body) const;
  };

  std::string
  case_fold(std::string_view path);

  // Creates `folder` and its parents. `label` names the folder in errors,
  // e.g. "C++ header".
  void
  create_folder(std::string_view label, const fs::path& folder);

} // namespace ib
