#include <ib/generator.hpp>

#include <algorithm>

namespace ib {

  namespace {

    bool
    is_word_char(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
             (c >= '0' && c <= '9') || c == '_';
    }

    std::vector<std::string>
    split_namespace(const std::string& ns) {
      std::vector<std::string> parts;
      std::size_t start = 0;
      for (;;) {
        auto pos = ns.find("::", start);
        if (pos == std::string::npos) {
          parts.push_back(ns.substr(start));
          return parts;
        }
        parts.push_back(ns.substr(start, pos - start));
        start = pos + 2;
      }
    }

    void
    write_options_where(indent_writer& w, const enum_decl& e,
                        const ident_converter& ident,
                        const std::optional<special_flag>& which) {
      for (const auto& encoded : encode_enum_options(e)) {
        const auto& o = *encoded.option;
        if (o.special_flag != which) continue;

        write_doc(w, o.doc);
        w.w(ident(o.ident.name()));
        if (encoded.value) w.w(" = " + std::to_string(*encoded.value));
        w.wl(",");
      }
    }

  } // namespace

  std::string
  with_ns(const std::optional<std::string>& ns, const std::string& t) {
    if (!ns) return t;
    if (ns->empty()) return "::" + t;
    return "::" + *ns + "::" + t;
  }

  void
  wrap_namespace(indent_writer& w, const std::string& ns,
                 const write_fn& body) {
    if (ns.empty()) {
      body(w);
      return;
    }

    auto parts = split_namespace(ns);
    std::string open;
    std::string close;
    for (const auto& part : parts) {
      if (!open.empty()) {
        open += ' ';
        close += ' ';
      }
      open += "namespace " + part + " {";
      close += '}';
    }

    w.wl(open).wl();
    body(w);
    w.wl();
    w.wl(close + "  // namespace " + ns);
  }

  void
  wrap_anonymous_namespace(indent_writer& w, const write_fn& body) {
    w.wl("namespace { // anonymous namespace");
    w.wl();
    body(w);
    w.wl();
    w.wl("} // end anonymous namespace");
  }

  std::vector<encoded_option>
  encode_enum_options(const enum_decl& e) {
    std::vector<encoded_option> result;

    auto find_special = [&e](special_flag which) -> const enum_option* {
      auto it = std::find_if(
          e.options.begin(), e.options.end(),
          [which](const enum_option& o) { return o.special_flag == which; });
      return it == e.options.end() ? nullptr : &*it;
    };

    if (const auto* none = find_special(special_flag::no_flags))
      result.push_back({none, 0});

    std::uint64_t all = 0;
    unsigned shift = 0;
    for (const auto& o : e.options) {
      if (o.special_flag) continue;
      if (e.flags) {
        if (shift >= max_flag_options)
          throw generation_error("Bit-flag enum has more than " +
                                 std::to_string(max_flag_options) +
                                 " options.");
        std::uint64_t value = std::uint64_t{1} << shift;
        all |= value;
        result.push_back({&o, value});
      } else {
        result.push_back({&o, std::nullopt});
      }
      ++shift;
    }

    if (const auto* every = find_special(special_flag::all_flags))
      result.push_back({every, all});

    return result;
  }

  void
  write_enum_option_none(indent_writer& w, const enum_decl& e,
                         const ident_converter& ident) {
    write_options_where(w, e, ident, special_flag::no_flags);
  }

  void
  write_enum_options(indent_writer& w, const enum_decl& e,
                     const ident_converter& ident) {
    write_options_where(w, e, ident, std::nullopt);
  }

  void
  write_enum_option_all(indent_writer& w, const enum_decl& e,
                        const ident_converter& ident) {
    write_options_where(w, e, ident, special_flag::all_flags);
  }

  void
  write_aligned_call(indent_writer& w, const std::string& call,
                     const std::vector<field>& params, const std::string& delim,
                     const std::string& end,
                     const std::function<std::string(const field&)>& render) {
    w.w(call);
    bool first = true;
    for (const auto& param : params) {
      if (!first) {
        w.wl(delim);
        w.w(std::string(call.size(), ' '));
      }
      first = false;
      w.w(render(param));
    }
    w.w(end);
  }

  void
  write_aligned_call(indent_writer& w, const std::string& call,
                     const std::vector<field>& params, const std::string& end,
                     const std::function<std::string(const field&)>& render) {
    write_aligned_call(w, call, params, ",", end, render);
  }

  void
  write_aligned_objc_call(
      indent_writer& w, const std::string& call,
      const std::vector<field>& params, const std::string& end,
      const std::function<std::pair<std::string, std::string>(const field&)>&
          render) {
    w.w(call);
    bool first = true;
    for (const auto& param : params) {
      auto [name, value] = render(param);
      if (!first) {
        w.wl();
        auto pad = call.size() > name.size() ? call.size() - name.size() : 0;
        w.w(std::string(pad, ' '));
        w.w(name);
      }
      first = false;
      w.w(":" + value);
    }
    w.w(end);
  }

  void
  write_doc(indent_writer& w, const doc& d) {
    switch (d.lines.size()) {
    case 0:
      return;
    case 1:
      w.wl("/**" + d.lines.front() + " */");
      return;
    default:
      w.wl("/**");
      for (const auto& line : d.lines)
        w.wl(" *" + line);
      w.wl(" */");
    }
  }

  std::string
  replace_whole_word(std::string_view text, std::string_view word,
                     std::string_view replacement) {
    if (word.empty()) return std::string(text);

    std::string result;
    result.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
      auto pos = text.find(word, i);
      if (pos == std::string_view::npos) break;

      auto after = pos + word.size();
      bool starts_word = pos == 0 || !is_word_char(text[pos - 1]);
      bool ends_word = after == text.size() || !is_word_char(text[after]);

      if (starts_word && ends_word) {
        result.append(text.substr(i, pos - i));
        result.append(replacement);
        i = after;
      } else {
        result.append(text.substr(i, pos + 1 - i));
        i = pos + 1;
      }
    }
    result.append(text.substr(std::min(i, text.size())));
    return result;
  }

  void
  write_method_doc(indent_writer& w, const method& m,
                   const ident_converter& ident) {
    doc rewritten;
    rewritten.lines.reserve(m.doc.lines.size());
    for (const auto& line : m.doc.lines) {
      std::string current = line;
      for (const auto& param : m.params) {
        const auto& name = param.ident.name();
        current = replace_whole_word(current, name, ident(name));
      }
      rewritten.lines.push_back(std::move(current));
    }
    write_doc(w, rewritten);
  }

  // ---------------------------------------------------------------------------
  // generator
  // ---------------------------------------------------------------------------

  generator::generator(const spec& s, generation_session& session)
      : spec_(s), files_(s, session) {}

  std::string
  generator::with_cpp_ns(const std::string& t) const {
    return with_ns(spec_.cpp.ns, t);
  }

  void
  generator::write_hpp_file(const fs::path& folder, const std::string& ns,
                            const ident_converter& file_ident,
                            const std::string& name, const std::string& origin,
                            const std::vector<std::string>& includes,
                            const std::vector<std::string>& fwds,
                            const write_fn& body,
                            const write_fn& after_namespace) const {
    files_.create_file(
        folder, file_ident(name) + "." + spec_.cpp.header_ext,
        [&](indent_writer& w) {
          w.wl("// AUTOGENERATED FILE - DO NOT MODIFY!");
          w.wl("// This file was generated by ib from " + origin);
          w.wl();
          w.wl("#pragma once");
          if (!includes.empty()) {
            w.wl();
            for (const auto& include : includes)
              w.wl(include);
          }
          w.wl();
          wrap_namespace(w, ns, [&](indent_writer& w) {
            if (!fwds.empty()) {
              for (const auto& fwd : fwds)
                w.wl(fwd);
              w.wl();
            }
            body(w);
          });
          after_namespace(w);
        });
  }

  void
  generator::write_cpp_file(const fs::path& folder, const std::string& ns,
                            const ident_converter& file_ident,
                            const std::string& include_prefix,
                            const std::string& name, const std::string& origin,
                            const std::vector<std::string>& includes,
                            const write_fn& body) const {
    files_.create_file(
        folder, file_ident(name) + "." + spec_.cpp.ext,
        [&](indent_writer& w) {
          w.wl("// AUTOGENERATED FILE - DO NOT MODIFY!");
          w.wl("// This file was generated by ib from " + origin);
          w.wl();
          auto my_header =
              q(include_prefix + file_ident(name) + "." + spec_.cpp.header_ext);
          w.wl("#include " + my_header + "  // my header");
          auto my_header_include = "#include " + my_header;
          for (const auto& include : includes) {
            if (include != my_header_include) w.wl(include);
          }
          w.wl();
          wrap_namespace(w, ns, body);
        });
  }

} // namespace ib
