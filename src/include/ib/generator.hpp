#pragma once

#include <ib/file_emitter.hpp>
#include <ib/generation_error.hpp>
#include <ib/idl.hpp>
#include <ib/indent_writer.hpp>
#include <ib/spec.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ib {

  // The three hooks every backend provides, one per declaration kind.
  template <typename B>
  concept backend = requires(B& b, const std::string& origin, const ident& id,
                             const doc& d,
                             const std::vector<type_param>& params,
                             const enum_decl& e, const record_decl& r,
                             const interface_decl& i) {
    b.generate_enum(origin, id, d, e);
    b.generate_record(origin, id, d, params, r);
    b.generate_interface(origin, id, d, params, i);
  };

  template <typename>
  inline constexpr bool always_false = false;

  // Visits every locally defined declaration once, in order.
  template <backend B>
  void
  generate(B& b, const std::vector<type_decl>& idl) {
    for (const auto& td : idl) {
      if (td.imported) continue;

      std::visit(
          [&b, &td](const auto& body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, enum_decl>) {
              if (!td.params.empty())
                throw generation_error("enum " + td.ident.name() +
                                       " cannot have type parameters");
              b.generate_enum(td.origin, td.ident, td.doc, body);
            } else if constexpr (std::is_same_v<T, record_decl>) {
              b.generate_record(td.origin, td.ident, td.doc, td.params, body);
            } else if constexpr (std::is_same_v<T, interface_decl>) {
              b.generate_interface(td.origin, td.ident, td.doc, td.params,
                                   body);
            } else {
              static_assert(always_false<T>, "unhandled declaration kind");
            }
          },
          td.body);
    }
  }

  // ---------------------------------------------------------------------------
  // Small rendering helpers
  // ---------------------------------------------------------------------------

  inline std::string
  q(const std::string& s) {
    return '"' + s + '"';
  }

  inline std::string
  p(const std::string& s) {
    return '(' + s + ')';
  }

  inline std::string
  t(const std::string& s) {
    return '<' + s + '>';
  }

  inline std::string
  pre_comma(const std::string& s) {
    return s.empty() ? s : ", " + s;
  }

  // nullopt -> "t", "" -> "::t", "a::b" -> "::a::b::t"
  std::string
  with_ns(const std::optional<std::string>& ns, const std::string& t);

  // ---------------------------------------------------------------------------
  // Shared emission algorithms
  // ---------------------------------------------------------------------------

  void
  wrap_namespace(indent_writer& w, const std::string& ns,
                 const write_fn& body);

  void
  wrap_anonymous_namespace(indent_writer& w, const write_fn& body);

  struct encoded_option {
    const enum_option* option;
    // Unset for ordinary options of an enum that is not a bit-flag enum.
    std::optional<std::uint64_t> value;
  };

  // One bit per ordinary option of a bit-flag enum.
  inline constexpr unsigned max_flag_options = 64;

  // Orders options as: no-flags option (0), ordinary options (1 << k on
  // bit-flag enums), all-flags option (OR of every ordinary value). Throws
  // generation_error when a bit-flag enum has more than max_flag_options
  // ordinary options.
  std::vector<encoded_option>
  encode_enum_options(const enum_decl& e);

  void
  write_enum_option_none(indent_writer& w, const enum_decl& e,
                         const ident_converter& ident);

  void
  write_enum_options(indent_writer& w, const enum_decl& e,
                     const ident_converter& ident);

  void
  write_enum_option_all(indent_writer& w, const enum_decl& e,
                        const ident_converter& ident);

  // name(a,
  //      b)
  void
  write_aligned_call(indent_writer& w, const std::string& call,
                     const std::vector<field>& params, const std::string& delim,
                     const std::string& end,
                     const std::function<std::string(const field&)>& render);

  void
  write_aligned_call(indent_writer& w, const std::string& call,
                     const std::vector<field>& params, const std::string& end,
                     const std::function<std::string(const field&)>& render);

  // [obj callWithA:a
  //           andB:b]
  void
  write_aligned_objc_call(
      indent_writer& w, const std::string& call,
      const std::vector<field>& params, const std::string& end,
      const std::function<std::pair<std::string, std::string>(const field&)>&
          render);

  void
  write_doc(indent_writer& w, const doc& d);

  // Replaces whole-word parameter names in the method doc with their
  // styled form before rendering it.
  void
  write_method_doc(indent_writer& w, const method& m,
                   const ident_converter& ident);

  std::string
  replace_whole_word(std::string_view text, std::string_view word,
                     std::string_view replacement);

  // ---------------------------------------------------------------------------
  // generator
  // ---------------------------------------------------------------------------

  // Per-backend view of the run: the read-only spec plus file emission
  // against the shared session.
  class generator {
    const spec& spec_;
    file_emitter files_;

  public:
    generator(const spec& s, generation_session& session);

    const ib::spec&
    options() const {
      return spec_;
    }

    const file_emitter&
    files() const {
      return files_;
    }

    std::string
    with_cpp_ns(const std::string& t) const;

    void
    write_hpp_file(const fs::path& folder, const std::string& ns,
                   const ident_converter& file_ident, const std::string& name,
                   const std::string& origin,
                   const std::vector<std::string>& includes,
                   const std::vector<std::string>& fwds, const write_fn& body,
                   const write_fn& after_namespace) const;

    void
    write_cpp_file(const fs::path& folder, const std::string& ns,
                   const ident_converter& file_ident,
                   const std::string& include_prefix, const std::string& name,
                   const std::string& origin,
                   const std::vector<std::string>& includes,
                   const write_fn& body) const;
  };

} // namespace ib
