#pragma once

#include "gmock/gmock.h"
#include "codebox/utils/container_client.hpp"

namespace codebox {
namespace testing {

class MockContainerClient : public utils::ContainerClient {
 public:
  MOCK_METHOD(void, Ping, (), (override));
  MOCK_METHOD(bool, ImageExists, (const std::string& image), (override));
  MOCK_METHOD(void, BuildImage, (const utils::BuildRequest& request), (override));
  MOCK_METHOD(void, RemoveImage, (const std::string& image, bool force), (override));
  MOCK_METHOD(std::vector<std::string>, ListImageTags, (), (override));
  MOCK_METHOD(std::string, RunDetached, (const utils::ContainerSpec& spec), (override));
  MOCK_METHOD(int, Wait, (const std::string& container_id, std::chrono::seconds timeout),
              (override));
  MOCK_METHOD(std::string, Logs, (const std::string& container_id, utils::LogStream stream),
              (override));
  MOCK_METHOD(std::optional<std::uint64_t>, MemoryUsageBytes,
              (const std::string& container_id), (override));
  MOCK_METHOD(void, Kill, (const std::string& container_id), (override));
  MOCK_METHOD(void, Remove, (const std::string& container_id, bool force), (override));
  MOCK_METHOD(std::vector<std::string>, ListContainers,
              (const utils::ContainerFilter& filter), (override));
  MOCK_METHOD(utils::SystemInfo, Info, (), (override));
};

}  // namespace testing
}  // namespace codebox
