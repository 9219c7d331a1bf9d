#pragma once

#include <ib/file_emitter.hpp>
#include <ib/generator.hpp>
#include <ib/idl.hpp>
#include <ib/spec.hpp>

#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ib {

  // Listed in the order generate() runs them.
  enum class backend_id {
    cpp,
    java,
    jni,
    objc,
    objcpp,
    swift_bridging_header,
    cpp_cli,
    yaml,
    python,
    c_wrapper,
    pycffi,
  };

  std::string_view
  to_string(backend_id id);

  using backend_runner = std::function<void(
      const std::vector<type_decl>&, const spec&, generation_session&)>;

  class backend_registry {
    std::map<backend_id, backend_runner> runners_;

  public:
    void
    add(backend_id id, backend_runner runner);

    const backend_runner*
    find(backend_id id) const;

    template <backend B>
      requires std::constructible_from<B, generator>
    static backend_runner
    make_runner() {
      return [](const std::vector<type_decl>& idl, const spec& s,
                generation_session& session) {
        B b{generator{s, session}};
        generate(b, idl);
      };
    }
  };

  // Registry holding the backends implemented by this library.
  backend_registry
  default_backends();

  struct output_folder {
    std::string label;
    fs::path path;
  };

  struct backend_step {
    backend_id id;
    bool enabled;
    std::vector<output_folder> folders;
  };

  // All steps in run order, with what `s` enables.
  std::vector<backend_step>
  backend_steps(const spec& s);

  // Runs every enabled backend in order. Returns the message of the first
  // generation_error, which also stops the remaining backends. Files written
  // before the failure are left in place.
  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           generation_session& session, const backend_registry& backends);

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           generation_session& session);

  // Fresh session; the manifest goes to s.out_file_list when set.
  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           const backend_registry& backends);

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s);

} // namespace ib
