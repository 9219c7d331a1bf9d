#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ib {

  // Canonical (underscore-delimited) identifier as written in the IDL.
  class ident {
    std::string name_;

  public:
    ident() = default;

    explicit ident(std::string name) : name_(std::move(name)) {}

    const std::string&
    name() const {
      return name_;
    }

    bool
    operator==(const ident&) const = default;
  };

  struct doc {
    std::vector<std::string> lines;

    bool
    operator==(const doc&) const = default;
  };

  struct type_param {
    ib::ident ident;

    bool
    operator==(const type_param&) const = default;
  };

  // Resolved type expression, e.g. "map" with arguments {"string", "i32"}.
  struct type_ref {
    std::string name;
    std::vector<type_ref> args;

    bool
    operator==(const type_ref&) const = default;
  };

  struct field {
    ib::ident ident;
    type_ref type;
    ib::doc doc;

    bool
    operator==(const field&) const = default;
  };

  struct constant {
    ib::ident ident;
    type_ref type;
    std::string value;
    ib::doc doc;

    bool
    operator==(const constant&) const = default;
  };

  // Which languages provide a hand-written extension of the generated type.
  struct ext {
    bool cpp = false;
    bool java = false;
    bool objc = false;

    bool
    operator==(const ext&) const = default;
  };

  enum class special_flag { no_flags, all_flags };

  struct enum_option {
    ib::ident ident;
    ib::doc doc;
    std::optional<ib::special_flag> special_flag;

    bool
    operator==(const enum_option&) const = default;
  };

  struct enum_decl {
    std::vector<enum_option> options;
    bool flags = false;

    bool
    operator==(const enum_decl&) const = default;
  };

  enum class deriving { eq, ord };

  struct record_decl {
    ib::ext ext;
    std::vector<field> fields;
    std::vector<constant> consts;
    std::vector<deriving> derivings;

    bool
    operator==(const record_decl&) const = default;
  };

  struct method {
    ib::ident ident;
    std::vector<field> params;
    std::optional<type_ref> ret;
    ib::doc doc;
    bool is_static = false;
    bool is_const = false;

    bool
    operator==(const method&) const = default;
  };

  struct interface_decl {
    ib::ext ext;
    std::vector<method> methods;
    std::vector<constant> consts;

    bool
    operator==(const interface_decl&) const = default;
  };

  using type_body = std::variant<enum_decl, record_decl, interface_decl>;

  struct type_decl {
    ib::ident ident;
    std::vector<type_param> params;
    ib::doc doc;
    std::string origin;
    type_body body;
    // Declarations pulled in from an imported module are not generated.
    bool imported = false;

    bool
    operator==(const type_decl&) const = default;
  };

} // namespace ib
