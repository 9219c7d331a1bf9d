#include <ib/file_emitter.hpp>
#include <ib/generation_error.hpp>

#include <fstream>
#include <system_error>

namespace ib {

  namespace {

    std::string
    quote(const std::string& s) {
      return '"' + s + '"';
    }

    // Paths are compared and recorded in absolute, symlink-resolved form;
    // weakly_canonical handles files that do not exist yet.
    fs::path
    canonical_path(const fs::path& path) {
      std::error_code ec;
      auto absolute = fs::absolute(path, ec);
      if (ec) absolute = path;
      auto canonical = fs::weakly_canonical(absolute, ec);
      if (ec) return absolute.lexically_normal();
      return canonical;
    }

    void
    write_file(const fs::path& path, std::ios::openmode mode,
               const writer_factory& make_writer, const write_fn& body) {
      std::ofstream out(path, std::ios::binary | mode);
      if (!out)
        throw generation_error("Unable to open " + quote(path.string()) +
                               " for writing.");

      auto w = make_writer(out);
      body(w);
      out.flush();
      if (!out)
        throw generation_error("Unable to write " + quote(path.string()) +
                               ".");
    }

    indent_writer
    default_writer(std::ostream& os) {
      return indent_writer(os);
    }

  } // namespace

  // ---------------------------------------------------------------------------
  // generation_session
  // ---------------------------------------------------------------------------

  generation_session::generation_session(bool record_manifest,
                                         std::ostream* manifest_sink)
      : record_manifest_(record_manifest), manifest_sink_(manifest_sink) {}

  claim_result
  generation_session::claim(const fs::path& canonical_path) {
    auto cp = canonical_path.string();
    auto [it, inserted] = written_files_.try_emplace(case_fold(cp), cp);
    if (inserted) return {claim_status::claimed, {}};
    if (it->second == cp) return {claim_status::duplicate, it->second};
    return {claim_status::case_collision, it->second};
  }

  void
  generation_session::record_output(const std::string& path) {
    if (!record_manifest_) return;
    manifest_.push_back(path);
    if (manifest_sink_) *manifest_sink_ << path << '\n' << std::flush;
  }

  // ---------------------------------------------------------------------------
  // file_emitter
  // ---------------------------------------------------------------------------

  file_emitter::file_emitter(const spec& s, generation_session& session)
      : spec_(s), session_(session) {}

  void
  file_emitter::create_file(const fs::path& folder,
                            const std::string& file_name,
                            const writer_factory& make_writer,
                            const write_fn& body) const {
    auto file = folder / file_name;
    session_.record_output(file.generic_string());
    if (spec_.skip_generation) return;

    auto cp = canonical_path(file);
    auto claim = session_.claim(cp);
    switch (claim.status) {
    case claim_status::claimed:
      break;
    case claim_status::duplicate:
      throw generation_error("Refusing to write " + quote(file.string()) +
                             "; we already wrote a file to that path.");
    case claim_status::case_collision:
      throw generation_error(
          "Refusing to write " + quote(file.string()) +
          "; we already wrote a file to a path that is the same when "
          "lower-cased: " +
          quote(claim.existing) + ".");
    }

    write_file(cp, std::ios::trunc, make_writer, body);
  }

  void
  file_emitter::create_file(const fs::path& folder,
                            const std::string& file_name,
                            const write_fn& body) const {
    create_file(folder, file_name, default_writer, body);
  }

  void
  file_emitter::create_file_once(const fs::path& folder,
                                 const std::string& file_name,
                                 const write_fn& body) const {
    auto file = folder / file_name;
    auto cp = canonical_path(file);

    // Registered even on a dry run so the manifest lists the file only once.
    if (session_.claim(cp).status != claim_status::claimed) return;

    session_.record_output(file.generic_string());
    if (spec_.skip_generation) return;

    write_file(cp, std::ios::trunc, default_writer, body);
  }

  void
  file_emitter::append_to_file(const fs::path& folder,
                               const std::string& file_name,
                               const write_fn& body) const {
    if (spec_.skip_generation) return;
    write_file(folder / file_name, std::ios::app, default_writer, body);
  }

  std::string
  case_fold(std::string_view path) {
    std::string result(path);
    for (auto& c : result) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return result;
  }

  void
  create_folder(std::string_view label, const fs::path& folder) {
    std::error_code create_ec;
    fs::create_directories(folder, create_ec);

    std::error_code status_ec;
    auto status = fs::status(folder, status_ec);
    if (fs::is_directory(status)) return;

    if (fs::exists(status))
      throw generation_error("Unable to create " + std::string(label) +
                             " folder at " + quote(folder.string()) +
                             ", there's something in the way.");

    throw generation_error("Unable to create " + std::string(label) +
                           " folder at " + quote(folder.string()) + ".");
  }

} // namespace ib
