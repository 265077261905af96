#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace devportal::data {

struct PackageVersion {
  std::int64_t major{0};
  std::int64_t minor{0};
  std::int64_t build{0};
  std::int64_t revision{0};

  std::string to_string() const {
    return fmt::format("{}.{}.{}.{}", major, minor, build, revision);
  }

  friend PackageVersion
  tag_invoke(const boost::json::value_to_tag<PackageVersion> &,
             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("PackageVersion expects JSON object");
    }
    const auto &obj = jv.as_object();
    PackageVersion v{};
    if (auto *p = obj.if_contains("Major"); p && p->is_number()) {
      v.major = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("Minor"); p && p->is_number()) {
      v.minor = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("Build"); p && p->is_number()) {
      v.build = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("Revision"); p && p->is_number()) {
      v.revision = p->to_number<std::int64_t>();
    }
    return v;
  }
};

struct AppXPackage {
  std::string name;
  std::string package_family_name;
  std::string package_full_name;
  std::int64_t package_origin{0};
  std::string package_relative_id;
  std::string publisher;
  bool can_uninstall{false};
  PackageVersion version;

  friend AppXPackage tag_invoke(const boost::json::value_to_tag<AppXPackage> &,
                                const boost::json::value &jv) {
    using namespace boost::json;

    if (!jv.is_object()) {
      throw std::runtime_error("AppXPackage expects JSON object");
    }
    const auto &obj = jv.as_object();
    AppXPackage pkg{};
    if (auto *p = obj.if_contains("Name"); p && !p->is_null()) {
      pkg.name = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("PackageFamilyName"); p && !p->is_null()) {
      pkg.package_family_name = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("PackageFullName"); p && !p->is_null()) {
      pkg.package_full_name = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("PackageOrigin"); p && p->is_number()) {
      pkg.package_origin = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("PackageRelativeId"); p && !p->is_null()) {
      pkg.package_relative_id = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Publisher"); p && !p->is_null()) {
      pkg.publisher = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("CanUninstall"); p && p->is_bool()) {
      pkg.can_uninstall = p->as_bool();
    }
    if (auto *p = obj.if_contains("Version"); p && p->is_object()) {
      pkg.version = value_to<PackageVersion>(*p);
    }
    return pkg;
  }
};

// GET /api/appx/packagemanager/packages
struct AppXPackages {
  std::vector<AppXPackage> installed_packages;

  friend AppXPackages
  tag_invoke(const boost::json::value_to_tag<AppXPackages> &,
             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("AppXPackages expects JSON object");
    }
    AppXPackages pkgs{};
    if (auto *p = jv.as_object().if_contains("InstalledPackages");
        p && p->is_array()) {
      pkgs.installed_packages =
          boost::json::value_to<std::vector<AppXPackage>>(*p);
    }
    return pkgs;
  }
};

} // namespace devportal::data
