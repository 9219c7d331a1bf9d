#include <ib/ident_style.hpp>

#include <utility>

namespace ib {

  namespace {

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    // Splits on '_', keeping empty words so that repeated delimiters survive
    // the delimiter-preserving styles.
    std::vector<std::string_view>
    split_words(std::string_view token) {
      std::vector<std::string_view> words;
      std::size_t start = 0;
      for (;;) {
        auto pos = token.find('_', start);
        if (pos == std::string_view::npos) {
          words.push_back(token.substr(start));
          return words;
        }
        words.push_back(token.substr(start, pos - start));
        start = pos + 1;
      }
    }

    // "enum-type" and "enum_type" name the same role.
    std::string
    normalize_role(std::string_view role) {
      std::string result(role);
      for (auto& c : result)
        if (c == '-') c = '_';
      return result;
    }

    template <typename Style>
    using role_table =
        std::vector<std::pair<std::string_view, ident_converter Style::*>>;

    template <typename Style>
    ident_converter*
    lookup(Style& style, const role_table<Style>& table,
           std::string_view role) {
      auto key = normalize_role(role);
      for (const auto& [name, member] : table) {
        if (name == key) return &(style.*member);
      }
      return nullptr;
    }

  } // namespace

  std::string
  first_upper(std::string_view word) {
    std::string result(word);
    if (!result.empty()) result[0] = to_upper(result[0]);
    return result;
  }

  namespace ident_style {

    std::string
    camel_upper(std::string_view token) {
      std::string result;
      result.reserve(token.size());
      for (auto word : split_words(token))
        result += first_upper(word);
      return result;
    }

    std::string
    camel_lower(std::string_view token) {
      auto words = split_words(token);
      std::string result(words.front());
      for (std::size_t i = 1; i < words.size(); ++i)
        result += first_upper(words[i]);
      return result;
    }

    std::string
    identity(std::string_view token) {
      return std::string(token);
    }

    std::string
    underscore_cap(std::string_view token) {
      std::string result;
      result.reserve(token.size());
      bool first = true;
      for (auto word : split_words(token)) {
        if (!first) result += '_';
        result += first_upper(word);
        first = false;
      }
      return result;
    }

    std::string
    all_caps(std::string_view token) {
      std::string result(token);
      for (auto& c : result)
        c = to_upper(c);
      return result;
    }

    ident_converter
    with_prefix(std::string prefix, ident_converter base) {
      return [prefix = std::move(prefix),
              base = std::move(base)](std::string_view token) {
        return prefix + base(token);
      };
    }

    const std::vector<probe>&
    probes() {
      // The first entry whose example ends the configured token wins.
      static const std::vector<probe> table = {
          {"FooBar", camel_upper},     {"fooBar", camel_lower},
          {"foo_bar", identity},       {"Foo_Bar", underscore_cap},
          {"FOO_BAR", all_caps},
      };
      return table;
    }

    std::optional<ident_converter>
    infer(std::string_view example) {
      for (const auto& p : probes()) {
        if (!example.ends_with(p.example)) continue;

        auto remainder = example.substr(0, example.size() - p.example.size());
        if (remainder.empty()) return ident_converter(p.style);
        return with_prefix(std::string(remainder), p.style);
      }
      return std::nullopt;
    }

  } // namespace ident_style

  cpp_ident_style
  cpp_ident_style::defaults() {
    using namespace ident_style;
    return {
        .type = camel_upper,
        .enum_type = camel_upper,
        .type_param = camel_upper,
        .method = identity,
        .field = identity,
        .local = identity,
        .enum_member = all_caps,
        .constant = all_caps,
    };
  }

  java_ident_style
  java_ident_style::defaults() {
    using namespace ident_style;
    return {
        .type = camel_upper,
        .type_param = camel_upper,
        .method = camel_lower,
        .field = camel_lower,
        .local = camel_lower,
        .enum_member = all_caps,
        .constant = all_caps,
    };
  }

  objc_ident_style
  objc_ident_style::defaults() {
    using namespace ident_style;
    return {
        .type = camel_upper,
        .type_param = camel_upper,
        .method = camel_lower,
        .field = camel_lower,
        .local = camel_lower,
        .enum_member = camel_upper,
        .constant = camel_upper,
    };
  }

  python_ident_style
  python_ident_style::defaults() {
    using namespace ident_style;
    return {
        .type = identity,
        .class_name = camel_upper,
        .type_param = identity,
        .method = identity,
        .field = identity,
        .local = identity,
        .enum_member = underscore_cap,
        .constant = all_caps,
    };
  }

  cpp_cli_ident_style
  cpp_cli_ident_style::defaults() {
    using namespace ident_style;
    return {
        .type = camel_upper,
        .type_param = camel_upper,
        .property = camel_upper,
        .method = camel_upper,
        .field = with_prefix("_", camel_lower),
        .local = camel_lower,
        .enum_member = camel_upper,
        .constant = camel_upper,
        .file = camel_upper,
    };
  }

  ident_converter*
  find_role(cpp_ident_style& style, std::string_view role) {
    using s = cpp_ident_style;
    static const role_table<s> table = {
        {"type", &s::type},
        {"enum_type", &s::enum_type},
        {"type_param", &s::type_param},
        {"method", &s::method},
        {"field", &s::field},
        {"local", &s::local},
        {"enum", &s::enum_member},
        {"enum_member", &s::enum_member},
        {"const", &s::constant},
        {"constant", &s::constant},
    };
    return lookup(style, table, role);
  }

  ident_converter*
  find_role(java_ident_style& style, std::string_view role) {
    using s = java_ident_style;
    static const role_table<s> table = {
        {"type", &s::type},
        {"type_param", &s::type_param},
        {"method", &s::method},
        {"field", &s::field},
        {"local", &s::local},
        {"enum", &s::enum_member},
        {"enum_member", &s::enum_member},
        {"const", &s::constant},
        {"constant", &s::constant},
    };
    return lookup(style, table, role);
  }

  ident_converter*
  find_role(objc_ident_style& style, std::string_view role) {
    using s = objc_ident_style;
    static const role_table<s> table = {
        {"type", &s::type},
        {"type_param", &s::type_param},
        {"method", &s::method},
        {"field", &s::field},
        {"local", &s::local},
        {"enum", &s::enum_member},
        {"enum_member", &s::enum_member},
        {"const", &s::constant},
        {"constant", &s::constant},
    };
    return lookup(style, table, role);
  }

  ident_converter*
  find_role(python_ident_style& style, std::string_view role) {
    using s = python_ident_style;
    static const role_table<s> table = {
        {"type", &s::type},
        {"class_name", &s::class_name},
        {"type_param", &s::type_param},
        {"method", &s::method},
        {"field", &s::field},
        {"local", &s::local},
        {"enum", &s::enum_member},
        {"enum_member", &s::enum_member},
        {"const", &s::constant},
        {"constant", &s::constant},
    };
    return lookup(style, table, role);
  }

  ident_converter*
  find_role(cpp_cli_ident_style& style, std::string_view role) {
    using s = cpp_cli_ident_style;
    static const role_table<s> table = {
        {"type", &s::type},
        {"type_param", &s::type_param},
        {"property", &s::property},
        {"method", &s::method},
        {"field", &s::field},
        {"local", &s::local},
        {"enum", &s::enum_member},
        {"enum_member", &s::enum_member},
        {"const", &s::constant},
        {"constant", &s::constant},
        {"file", &s::file},
    };
    return lookup(style, table, role);
  }

} // namespace ib
