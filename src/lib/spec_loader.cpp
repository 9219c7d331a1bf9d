#include <ib/spec_loader.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ib {

  namespace {

    // One backend's sub-object of the configuration, or the top-level
    // object when unnamed. An absent sub-object behaves like an empty one.
    class section {
      const nlohmann::json* obj_ = nullptr;
      std::string name_;

      std::string
      where(const char* key) const {
        return name_.empty() ? std::string(key) : name_ + "." + key;
      }

    public:
      explicit section(const nlohmann::json& root) : obj_(&root) {}

      section(const nlohmann::json& parent, std::string name)
          : name_(std::move(name)) {
        auto it = parent.find(name_);
        if (it == parent.end()) return;
        if (!it->is_object())
          throw std::runtime_error("spec: '" + name_ + "' must be an object");
        obj_ = &*it;
      }

      const std::string&
      name() const {
        return name_;
      }

      const nlohmann::json*
      child(const char* key) const {
        if (!obj_) return nullptr;
        auto it = obj_->find(key);
        if (it == obj_->end()) return nullptr;
        return &*it;
      }

      std::optional<std::string>
      optional_string(const char* key) const {
        const auto* value = child(key);
        if (!value) return std::nullopt;
        if (!value->is_string())
          throw std::runtime_error("spec: '" + where(key) +
                                   "' must be a string");
        return value->get<std::string>();
      }

      std::string
      string(const char* key, std::string fallback = {}) const {
        return optional_string(key).value_or(std::move(fallback));
      }

      std::optional<fs::path>
      path(const char* key) const {
        auto value = optional_string(key);
        if (!value) return std::nullopt;
        return fs::path(*value);
      }

      bool
      boolean(const char* key, bool fallback) const {
        const auto* value = child(key);
        if (!value) return fallback;
        if (!value->is_boolean())
          throw std::runtime_error("spec: '" + where(key) +
                                   "' must be a boolean");
        return value->get<bool>();
      }
    };

    ident_converter
    infer_style(const std::string& example, const std::string& where) {
      auto style = ident_style::infer(example);
      if (!style)
        throw std::runtime_error("spec: cannot infer an identifier style from '" +
                                 example + "' (" + where + ")");
      return *style;
    }

    template <typename Style>
    void
    load_ident_style(const section& sec, Style& style) {
      const auto* idents = sec.child("ident");
      if (!idents) return;
      if (!idents->is_object())
        throw std::runtime_error("spec: '" + sec.name() +
                                 ".ident' must be an object");

      for (auto it = idents->begin(); it != idents->end(); ++it) {
        const auto where = sec.name() + ".ident." + it.key();
        auto* slot = find_role(style, it.key());
        if (!slot)
          throw std::runtime_error("spec: unknown identifier role '" +
                                   it.key() + "' in " + sec.name() + ".ident");
        if (!it.value().is_string())
          throw std::runtime_error("spec: '" + where + "' must be a string");
        *slot = infer_style(it.value().get<std::string>(), where);
      }
    }

    void
    load_file_ident(const section& sec, const char* key,
                    ident_converter& style) {
      if (auto example = sec.optional_string(key))
        style = infer_style(*example, sec.name() + "." + key);
    }

    void
    load_cpp(const nlohmann::json& config, cpp_spec& cpp) {
      section sec(config, "cpp");
      cpp.out = sec.path("out");
      cpp.header_out = sec.path("header-out");
      if (!cpp.header_out) cpp.header_out = cpp.out;
      cpp.include_prefix = sec.string("include-prefix");
      cpp.extended_record_include_prefix =
          sec.string("extended-record-include-prefix");
      cpp.ns = sec.string("namespace");
      load_ident_style(sec, cpp.ident);
      load_file_ident(sec, "file-ident", cpp.file_ident);
      cpp.ext = sec.string("ext", cpp.ext);
      cpp.header_ext = sec.string("header-ext", cpp.header_ext);
      cpp.optional_template =
          sec.string("optional-template", cpp.optional_template);
      cpp.optional_header = sec.string("optional-header", cpp.optional_header);
      cpp.enum_hash_workaround =
          sec.boolean("enum-hash-workaround", cpp.enum_hash_workaround);
      cpp.nn_header = sec.optional_string("nn-header");
      cpp.nn_type = sec.optional_string("nn-type");
      cpp.nn_check_expression = sec.optional_string("nn-check-expression");
      cpp.use_wide_strings =
          sec.boolean("use-wide-strings", cpp.use_wide_strings);
      cpp.omit_default_record_ctor = sec.boolean(
          "omit-default-record-constructor", cpp.omit_default_record_ctor);
      cpp.json_serialization = sec.optional_string("json-serialization");
    }

    void
    load_java(const nlohmann::json& config, java_spec& java) {
      section sec(config, "java");
      java.out = sec.path("out");
      java.package = sec.optional_string("package");

      auto access = sec.string("class-access-modifier", "public");
      if (access == "public")
        java.class_access = java_access_modifier::public_access;
      else if (access == "package")
        java.class_access = java_access_modifier::package_access;
      else
        throw std::runtime_error(
            "spec: 'java.class-access-modifier' must be \"public\" or "
            "\"package\"");

      load_ident_style(sec, java.ident);
      java.cpp_exception = sec.optional_string("cpp-exception");
      java.annotation = sec.optional_string("annotation");
      java.generate_interfaces =
          sec.boolean("generate-interfaces", java.generate_interfaces);
      java.nullable_annotation = sec.optional_string("nullable-annotation");
      java.nonnull_annotation = sec.optional_string("nonnull-annotation");
      java.implement_android_os_parcelable =
          sec.boolean("implement-android-os-parcelable",
                      java.implement_android_os_parcelable);
      java.use_final_for_record =
          sec.boolean("use-final-for-record", java.use_final_for_record);
    }

    void
    load_jni(const nlohmann::json& config, jni_spec& jni) {
      section sec(config, "jni");
      jni.out = sec.path("out");
      jni.header_out = sec.path("header-out");
      if (!jni.header_out) jni.header_out = jni.out;
      jni.include_prefix = sec.string("include-prefix");
      jni.include_cpp_prefix = sec.string("include-cpp-prefix");
      jni.ns = sec.string("namespace", jni.ns);
      load_file_ident(sec, "class-ident", jni.class_ident);
      load_file_ident(sec, "file-ident", jni.file_ident);
      jni.generate_main = sec.boolean("generate-main", jni.generate_main);
    }

    void
    load_objc(const nlohmann::json& config, objc_spec& objc) {
      section sec(config, "objc");
      objc.out = sec.path("out");
      objc.header_out = sec.path("header-out");
      load_ident_style(sec, objc.ident);
      load_file_ident(sec, "file-ident", objc.file_ident);
      objc.header_ext = sec.string("header-ext", objc.header_ext);
      objc.include_prefix = sec.string("include-prefix");
      objc.extended_record_include_prefix =
          sec.string("extended-record-include-prefix");
      objc.swift_bridging_header_name =
          sec.optional_string("swift-bridging-header");
      objc.closed_enums = sec.boolean("closed-enums", objc.closed_enums);
    }

    void
    load_objcpp(const nlohmann::json& config, objcpp_spec& objcpp) {
      section sec(config, "objcpp");
      objcpp.out = sec.path("out");
      objcpp.header_out = sec.path("header-out");
      objcpp.ext = sec.string("ext", objcpp.ext);
      objcpp.include_prefix = sec.string("include-prefix");
      objcpp.include_cpp_prefix = sec.string("include-cpp-prefix");
      objcpp.include_objc_prefix = sec.string("include-objc-prefix");
      objcpp.ns = sec.string("namespace", objcpp.ns);
    }

    void
    load_cpp_cli(const nlohmann::json& config, cpp_cli_spec& cli) {
      section sec(config, "cppcli");
      cli.out = sec.path("out");
      load_ident_style(sec, cli.ident);
      cli.ns = sec.string("namespace");
      cli.include_cpp_prefix = sec.string("include-cpp-prefix");
    }

    void
    load_yaml(const nlohmann::json& config, yaml_spec& yaml) {
      section sec(config, "yaml");
      yaml.out = sec.path("out");
      yaml.out_file = sec.optional_string("out-file");
      yaml.prefix = sec.string("prefix");
    }

    void
    load_python(const nlohmann::json& config, python_spec& python) {
      section sec(config, "python");
      python.out = sec.path("out");
      load_ident_style(sec, python.ident);
      python.import_prefix = sec.string("import-prefix");
    }

    void
    load_c_wrapper(const nlohmann::json& config, c_wrapper_spec& c) {
      section sec(config, "c-wrapper");
      c.out = sec.path("out");
      c.header_out = sec.path("header-out");
      if (!c.header_out) c.header_out = c.out;
      c.include_prefix = sec.string("include-prefix");
      c.include_cpp_prefix = sec.string("include-cpp-prefix");
    }

    void
    load_pycffi(const nlohmann::json& config, pycffi_spec& cffi) {
      section sec(config, "pycffi");
      cffi.out = sec.path("out");
      cffi.package_name = sec.string("package-name");
      cffi.dynamic_lib_list = sec.string("dynamic-lib-list");
    }

  } // namespace

  spec
  load_spec(const nlohmann::json& config) {
    if (!config.is_object())
      throw std::runtime_error("spec: configuration must be a JSON object");

    spec result;
    load_cpp(config, result.cpp);
    load_java(config, result.java);
    load_jni(config, result.jni);
    load_objc(config, result.objc);
    load_objcpp(config, result.objcpp);
    load_cpp_cli(config, result.cpp_cli);
    load_yaml(config, result.yaml);
    load_python(config, result.python);
    load_c_wrapper(config, result.c_wrapper);
    load_pycffi(config, result.pycffi);

    section root(config);
    result.skip_generation = root.boolean("skip-generation", false);
    result.out_file_list = root.path("list-out-files");
    result.idl_file_name = root.string("idl-file-name");

    return result;
  }

  spec
  load_spec_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw std::runtime_error("spec: cannot open file: " + path.string());

    nlohmann::json config;
    try {
      config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("spec: " + path.string() + ": " + e.what());
    }
    return load_spec(config);
  }

} // namespace ib
