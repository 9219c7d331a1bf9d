#pragma once

#include <ib/ident_style.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace ib {

  namespace fs = std::filesystem;

  // A backend runs iff its `out` folder is set.

  struct cpp_spec {
    std::optional<fs::path> out;
    std::optional<fs::path> header_out;
    std::string include_prefix;
    std::string extended_record_include_prefix;
    std::string ns;
    cpp_ident_style ident = cpp_ident_style::defaults();
    ident_converter file_ident = ident_style::identity;
    std::string ext = "cpp";
    std::string header_ext = "hpp";
    std::string optional_template = "std::optional";
    std::string optional_header = "<optional>";
    bool enum_hash_workaround = true;
    std::optional<std::string> nn_header;
    std::optional<std::string> nn_type;
    std::optional<std::string> nn_check_expression;
    bool use_wide_strings = false;
    bool omit_default_record_ctor = false;
    std::optional<std::string> json_serialization;
  };

  enum class java_access_modifier { public_access, package_access };

  struct java_spec {
    std::optional<fs::path> out;
    std::optional<std::string> package;
    java_access_modifier class_access = java_access_modifier::public_access;
    java_ident_style ident = java_ident_style::defaults();
    std::optional<std::string> cpp_exception;
    std::optional<std::string> annotation;
    bool generate_interfaces = false;
    std::optional<std::string> nullable_annotation;
    std::optional<std::string> nonnull_annotation;
    bool implement_android_os_parcelable = false;
    bool use_final_for_record = true;
  };

  struct jni_spec {
    std::optional<fs::path> out;
    std::optional<fs::path> header_out;
    std::string include_prefix;
    std::string include_cpp_prefix;
    std::string ns = "ib_generated";
    ident_converter class_ident =
        ident_style::with_prefix("Native", ident_style::camel_upper);
    ident_converter file_ident =
        ident_style::with_prefix("Native", ident_style::camel_upper);
    bool generate_main = true;
  };

  struct objc_spec {
    std::optional<fs::path> out;
    std::optional<fs::path> header_out;
    objc_ident_style ident = objc_ident_style::defaults();
    ident_converter file_ident = ident_style::camel_upper;
    std::string header_ext = "h";
    std::string include_prefix;
    std::string extended_record_include_prefix;
    std::optional<std::string> swift_bridging_header_name;
    bool closed_enums = false;
  };

  struct objcpp_spec {
    std::optional<fs::path> out;
    std::optional<fs::path> header_out;
    std::string ext = "mm";
    std::string include_prefix;
    std::string include_cpp_prefix;
    std::string include_objc_prefix;
    std::string ns = "ib_generated";
  };

  struct cpp_cli_spec {
    std::optional<fs::path> out;
    cpp_cli_ident_style ident = cpp_cli_ident_style::defaults();
    std::string ns;
    std::string include_cpp_prefix;
  };

  struct yaml_spec {
    std::optional<fs::path> out;
    // When set, every declaration is appended to this single file.
    std::optional<std::string> out_file;
    std::string prefix;
  };

  struct python_spec {
    std::optional<fs::path> out;
    python_ident_style ident = python_ident_style::defaults();
    std::string import_prefix;
  };

  struct c_wrapper_spec {
    std::optional<fs::path> out;
    std::optional<fs::path> header_out;
    std::string include_prefix;
    std::string include_cpp_prefix;
  };

  struct pycffi_spec {
    std::optional<fs::path> out;
    std::string package_name;
    std::string dynamic_lib_list;
  };

  // Read-only once built; generators only ever see a const reference.
  struct spec {
    cpp_spec cpp;
    java_spec java;
    jni_spec jni;
    objc_spec objc;
    objcpp_spec objcpp;
    cpp_cli_spec cpp_cli;
    yaml_spec yaml;
    python_spec python;
    c_wrapper_spec c_wrapper;
    pycffi_spec pycffi;

    // Dry run: claim and list outputs without touching the file system.
    bool skip_generation = false;
    // Where the list of generated files goes ("-" is standard output).
    std::optional<fs::path> out_file_list;
    std::string idl_file_name;
  };

} // namespace ib
