#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace devportal::data {

struct IpAddressInfo {
  std::string ip_address;
  std::string mask;

  friend IpAddressInfo
  tag_invoke(const boost::json::value_to_tag<IpAddressInfo> &,
             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("IpAddressInfo expects JSON object");
    }
    const auto &obj = jv.as_object();
    IpAddressInfo info{};
    if (auto *p = obj.if_contains("IpAddress"); p && !p->is_null()) {
      info.ip_address = boost::json::value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Mask"); p && !p->is_null()) {
      info.mask = boost::json::value_to<std::string>(*p);
    }
    return info;
  }
};

struct DhcpInfo {
  std::int64_t lease_expires{0};
  std::int64_t lease_obtained{0};
  IpAddressInfo address;

  friend DhcpInfo tag_invoke(const boost::json::value_to_tag<DhcpInfo> &,
                             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("DhcpInfo expects JSON object");
    }
    const auto &obj = jv.as_object();
    DhcpInfo dhcp{};
    if (auto *p = obj.if_contains("LeaseExpires"); p && p->is_number()) {
      dhcp.lease_expires = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("LeaseObtained"); p && p->is_number()) {
      dhcp.lease_obtained = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("Address"); p && !p->is_null()) {
      dhcp.address = boost::json::value_to<IpAddressInfo>(*p);
    }
    return dhcp;
  }
};

struct NetworkAdapter {
  std::string description;
  std::string hardware_address;
  std::int64_t index{0};
  std::string name;
  std::string type;
  DhcpInfo dhcp;
  std::vector<IpAddressInfo> gateways;
  std::vector<IpAddressInfo> ip_addresses;

  friend NetworkAdapter
  tag_invoke(const boost::json::value_to_tag<NetworkAdapter> &,
             const boost::json::value &jv) {
    using namespace boost::json;

    if (!jv.is_object()) {
      throw std::runtime_error("NetworkAdapter expects JSON object");
    }
    const auto &obj = jv.as_object();
    NetworkAdapter adapter{};
    if (auto *p = obj.if_contains("Description"); p && !p->is_null()) {
      adapter.description = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("HardwareAddress"); p && !p->is_null()) {
      adapter.hardware_address = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Index"); p && p->is_number()) {
      adapter.index = p->to_number<std::int64_t>();
    }
    if (auto *p = obj.if_contains("Name"); p && !p->is_null()) {
      adapter.name = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("Type"); p && !p->is_null()) {
      adapter.type = value_to<std::string>(*p);
    }
    if (auto *p = obj.if_contains("DHCP"); p && p->is_object()) {
      adapter.dhcp = value_to<DhcpInfo>(*p);
    }
    if (auto *p = obj.if_contains("Gateways"); p && p->is_array()) {
      adapter.gateways = value_to<std::vector<IpAddressInfo>>(*p);
    }
    if (auto *p = obj.if_contains("IpAddresses"); p && p->is_array()) {
      adapter.ip_addresses = value_to<std::vector<IpAddressInfo>>(*p);
    }
    return adapter;
  }
};

// GET /api/networking/ipconfig
struct IpConfig {
  std::vector<NetworkAdapter> adapters;

  friend IpConfig tag_invoke(const boost::json::value_to_tag<IpConfig> &,
                             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("IpConfig expects JSON object");
    }
    IpConfig cfg{};
    if (auto *p = jv.as_object().if_contains("Adapters"); p && p->is_array()) {
      cfg.adapters = boost::json::value_to<std::vector<NetworkAdapter>>(*p);
    }
    return cfg;
  }
};

} // namespace devportal::data
