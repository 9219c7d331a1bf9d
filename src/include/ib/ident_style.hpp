#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ib {

  using ident_converter = std::function<std::string(std::string_view)>;

  // Upper-cases the first ASCII letter only.
  std::string
  first_upper(std::string_view word);

  namespace ident_style {

    // All built-in styles take a canonical underscore-delimited token.
    std::string
    camel_upper(std::string_view token);

    std::string
    camel_lower(std::string_view token);

    std::string
    identity(std::string_view token);

    std::string
    underscore_cap(std::string_view token);

    std::string
    all_caps(std::string_view token);

    ident_converter
    with_prefix(std::string prefix, ident_converter base);

    struct probe {
      std::string_view example;
      std::string (*style)(std::string_view);
    };

    // Probes in the order infer() tries them.
    const std::vector<probe>&
    probes();

    std::optional<ident_converter>
    infer(std::string_view example);

  } // namespace ident_style

  struct cpp_ident_style {
    ident_converter type;
    ident_converter enum_type;
    ident_converter type_param;
    ident_converter method;
    ident_converter field;
    ident_converter local;
    ident_converter enum_member;
    ident_converter constant;

    static cpp_ident_style
    defaults();
  };

  struct java_ident_style {
    ident_converter type;
    ident_converter type_param;
    ident_converter method;
    ident_converter field;
    ident_converter local;
    ident_converter enum_member;
    ident_converter constant;

    static java_ident_style
    defaults();
  };

  struct objc_ident_style {
    ident_converter type;
    ident_converter type_param;
    ident_converter method;
    ident_converter field;
    ident_converter local;
    ident_converter enum_member;
    ident_converter constant;

    static objc_ident_style
    defaults();
  };

  struct python_ident_style {
    ident_converter type;
    ident_converter class_name;
    ident_converter type_param;
    ident_converter method;
    ident_converter field;
    ident_converter local;
    ident_converter enum_member;
    ident_converter constant;

    static python_ident_style
    defaults();
  };

  struct cpp_cli_ident_style {
    ident_converter type;
    ident_converter type_param;
    ident_converter property;
    ident_converter method;
    ident_converter field;
    ident_converter local;
    ident_converter enum_member;
    ident_converter constant;
    ident_converter file;

    static cpp_cli_ident_style
    defaults();
  };

  // Looks up the converter slot for a role name such as "enum_type" or
  // "type-param". Returns nullptr when the bundle has no such role.
  ident_converter*
  find_role(cpp_ident_style& style, std::string_view role);

  ident_converter*
  find_role(java_ident_style& style, std::string_view role);

  ident_converter*
  find_role(objc_ident_style& style, std::string_view role);

  ident_converter*
  find_role(python_ident_style& style, std::string_view role);

  ident_converter*
  find_role(cpp_cli_ident_style& style, std::string_view role);

} // namespace ib
