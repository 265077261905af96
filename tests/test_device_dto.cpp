#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "data/appx_packages.hpp"
#include "data/connection.hpp"
#include "data/networking.hpp"
#include "data/os_info.hpp"
#include "device_api/device_api.hpp"

namespace devportal::data {
namespace json = boost::json;

TEST(DeviceDtoTest, MachineNamePrefersComputerName) {
  auto mn = json::value_to<MachineName>(
      json::parse(R"({"ComputerName":"minwinpc","Name":"legacy"})"));
  EXPECT_EQ(mn.name, "minwinpc");

  auto legacy = json::value_to<MachineName>(json::parse(R"({"Name":"DeviceX"})"));
  EXPECT_EQ(legacy.name, "DeviceX");
}

TEST(DeviceDtoTest, SoftwareInfoIgnoresUnknownAndDefaultsMissing) {
  auto info = json::value_to<SoftwareInfo>(json::parse(R"({
    "ComputerName": "minwinpc",
    "Language": "en-US",
    "OsEdition": "IoTUAP",
    "OsEditionId": 123,
    "OsVersion": "17763.1.amd64fre.rs5_release.180914-1434",
    "SomethingNew": {"nested": true}
  })"));
  EXPECT_EQ(info.computer_name, "minwinpc");
  EXPECT_EQ(info.language, "en-US");
  EXPECT_EQ(info.os_edition, "IoTUAP");
  EXPECT_EQ(info.os_edition_id, "123");
  EXPECT_EQ(info.os_version, "17763.1.amd64fre.rs5_release.180914-1434");
  EXPECT_TRUE(info.platform.empty());
}

TEST(DeviceDtoTest, IpConfigAdapters) {
  auto cfg = json::value_to<IpConfig>(json::parse(R"({
    "Adapters": [{
      "Description": "Intel(R) Ethernet Connection",
      "HardwareAddress": "00-15-5d-01-02-03",
      "Index": 4,
      "Name": "{A1B2}",
      "Type": "Ethernet",
      "DHCP": {
        "LeaseExpires": 1700003600,
        "LeaseObtained": 1700000000,
        "Address": {"IpAddress": "192.168.1.1", "Mask": "255.255.255.255"}
      },
      "Gateways": [{"IpAddress": "192.168.1.1", "Mask": "0.0.0.0"}],
      "IpAddresses": [
        {"IpAddress": "192.168.1.42", "Mask": "255.255.255.0"},
        {"IpAddress": "fe80::1", "Mask": ""}
      ]
    }]
  })"));
  ASSERT_EQ(cfg.adapters.size(), 1u);
  const auto &a = cfg.adapters.front();
  EXPECT_EQ(a.description, "Intel(R) Ethernet Connection");
  EXPECT_EQ(a.hardware_address, "00-15-5d-01-02-03");
  EXPECT_EQ(a.index, 4);
  EXPECT_EQ(a.type, "Ethernet");
  EXPECT_EQ(a.dhcp.lease_expires, 1700003600);
  EXPECT_EQ(a.dhcp.address.ip_address, "192.168.1.1");
  ASSERT_EQ(a.gateways.size(), 1u);
  EXPECT_EQ(a.gateways[0].mask, "0.0.0.0");
  ASSERT_EQ(a.ip_addresses.size(), 2u);
  EXPECT_EQ(a.ip_addresses[1].ip_address, "fe80::1");
}

TEST(DeviceDtoTest, IpConfigWithoutAdaptersIsEmpty) {
  auto cfg = json::value_to<IpConfig>(json::parse("{}"));
  EXPECT_TRUE(cfg.adapters.empty());
}

TEST(DeviceDtoTest, AppXPackagesWithVersion) {
  auto pkgs = json::value_to<AppXPackages>(json::parse(R"({
    "InstalledPackages": [{
      "CanUninstall": true,
      "Name": "IoTCoreDefaultApp",
      "PackageFamilyName": "IoTCoreDefaultApp_1w720vyc4ccym",
      "PackageFullName": "IoTCoreDefaultApp_1.2.0.0_x64__1w720vyc4ccym",
      "PackageOrigin": 2,
      "PackageRelativeId": "IoTCoreDefaultApp_1w720vyc4ccym!App",
      "Publisher": "CN=MSFT",
      "Version": {"Build": 0, "Major": 1, "Minor": 2, "Revision": 0}
    }, {
      "Name": "NoVersion"
    }]
  })"));
  ASSERT_EQ(pkgs.installed_packages.size(), 2u);
  const auto &p = pkgs.installed_packages[0];
  EXPECT_TRUE(p.can_uninstall);
  EXPECT_EQ(p.package_origin, 2);
  EXPECT_EQ(p.publisher, "CN=MSFT");
  EXPECT_EQ(p.version.to_string(), "1.2.0.0");
  EXPECT_FALSE(pkgs.installed_packages[1].can_uninstall);
  EXPECT_EQ(pkgs.installed_packages[1].version.to_string(), "0.0.0.0");
}

TEST(DeviceDtoTest, NonObjectThrows) {
  EXPECT_THROW(json::value_to<MachineName>(json::parse("\"text\"")),
               std::exception);
  EXPECT_THROW(json::value_to<AppXPackages>(json::parse("[]")),
               std::exception);
}

TEST(DeviceDtoTest, DecodeBodyStatuses) {
  EXPECT_EQ(decode_body<MachineName>("/p", std::nullopt).status,
            FetchStatus::Empty);
  EXPECT_EQ(decode_body<MachineName>("/p", std::string("null")).status,
            FetchStatus::Empty);
  auto broken = decode_body<MachineName>("/p", std::string("{not json"));
  EXPECT_EQ(broken.status, FetchStatus::DecodeError);
  EXPECT_NE(broken.error.find("/p"), std::string::npos);
  auto shape = decode_body<IpConfig>("/p", std::string("42"));
  EXPECT_EQ(shape.status, FetchStatus::DecodeError);
}

TEST(ConnectionTest, FromUrlDefaults) {
  auto plain = Connection::from_url("http://minwinpc");
  EXPECT_EQ(plain.scheme, "http");
  EXPECT_EQ(plain.host, "minwinpc");
  EXPECT_EQ(plain.port, 80);
  EXPECT_EQ(plain.base_url(), "http://minwinpc");

  auto tls = Connection::from_url("https://10.0.0.5:8443");
  EXPECT_TRUE(tls.secure());
  EXPECT_EQ(tls.port, 8443);
  EXPECT_EQ(tls.host_header(), "10.0.0.5:8443");
}

TEST(ConnectionTest, FromUrlRejectsBadInput) {
  EXPECT_THROW(Connection::from_url("not a url"), DeviceApiError);
  EXPECT_THROW(Connection::from_url("ftp://device"), DeviceApiError);
  try {
    Connection::from_url("ws://device:80");
    FAIL() << "expected DeviceApiError";
  } catch (const DeviceApiError &e) {
    EXPECT_TRUE(e.is_invalid_argument());
  }
}

TEST(CredentialsTest, EmptinessAndKind) {
  EXPECT_TRUE(Credentials{}.empty());
  EXPECT_FALSE(Credentials::basic("admin", "").empty());
  EXPECT_FALSE(Credentials::bearer("t0k").empty());
  EXPECT_TRUE(Credentials::bearer("t0k").uses_token());
  EXPECT_FALSE(Credentials::basic("admin", "pw").uses_token());
}

} // namespace devportal::data
