#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace devportal::data {

// GET /api/os/machinename
struct MachineName {
  std::string name;

  friend MachineName tag_invoke(const boost::json::value_to_tag<MachineName> &,
                                const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("MachineName expects JSON object");
    }
    const auto &obj = jv.as_object();
    MachineName mn{};
    // Device Portal reports "ComputerName"; older builds used "Name".
    if (auto *p = obj.if_contains("ComputerName"); p && !p->is_null()) {
      mn.name = boost::json::value_to<std::string>(*p);
    } else if (auto *legacy = obj.if_contains("Name");
               legacy && !legacy->is_null()) {
      mn.name = boost::json::value_to<std::string>(*legacy);
    }
    return mn;
  }
};

// GET /api/os/info
struct SoftwareInfo {
  std::string computer_name;
  std::string language;
  std::string os_edition;
  std::string os_edition_id;
  std::string os_version;
  std::string platform;

  friend SoftwareInfo
  tag_invoke(const boost::json::value_to_tag<SoftwareInfo> &,
             const boost::json::value &jv) {
    using namespace boost::json;

    if (!jv.is_object()) {
      throw std::runtime_error("SoftwareInfo expects JSON object");
    }
    const auto &obj = jv.as_object();
    SoftwareInfo info{};

    if (auto *p = obj.if_contains("ComputerName"); p && !p->is_null()) {
      info.computer_name = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Language"); p && !p->is_null()) {
      info.language = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("OsEdition"); p && !p->is_null()) {
      info.os_edition = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("OsEditionId"); p && !p->is_null()) {
      // Some firmware reports the edition id as a number.
      if (p->is_number()) {
        info.os_edition_id = std::to_string(p->to_number<std::int64_t>());
      } else {
        info.os_edition_id = value_to<std::string>(*p);
      }
    }
    if (auto *p = obj.if_contains("OsVersion"); p && !p->is_null()) {
      info.os_version = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Platform"); p && !p->is_null()) {
      info.platform = value_to<std::string>(*p);
    }
    return info;
  }
};

} // namespace devportal::data
