// Repository: Z-Play-supply
// Component: Contract Registry Environment
// Purpose: Fails the test binary when a domain's expected rules went untested.
// Copyright (c) 2025 Z-Play

#include "ContractRegistryEnvironment.h"

#include <map>
#include <mutex>
#include <set>
#include <sstream>

#include <gtest/gtest.h>

#include "../ContractRegistry.h"

namespace zplay::tests {

namespace {

using ExpectedCoverageMap = std::map<std::string, std::vector<std::string>>;

ExpectedCoverageMap& CoverageExpectations() {
  static ExpectedCoverageMap map;
  return map;
}

std::mutex& CoverageMutex() {
  static std::mutex mutex;
  return mutex;
}

std::string Join(const std::vector<std::string>& values) {
  std::ostringstream oss;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i != 0) oss << ", ";
    oss << values[i];
  }
  return oss.str();
}

class ContractRegistryEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    // A filtered run only exercises part of each domain.
    const std::string filter = GTEST_FLAG_GET(filter);
    if (!filter.empty() && filter != "*") {
      return;
    }
    std::lock_guard<std::mutex> lock(CoverageMutex());
    for (const auto& [domain, rules] : CoverageExpectations()) {
      std::set<std::string> unique(rules.begin(), rules.end());
      const auto missing = ContractRegistry::Instance().MissingRules(
          domain, std::vector<std::string>(unique.begin(), unique.end()));
      if (!missing.empty()) {
        ADD_FAILURE() << "Missing contract coverage for domain '" << domain
                      << "': " << Join(missing);
      }
    }
  }
};

::testing::Environment* const kContractRegistryEnvironment =
    ::testing::AddGlobalTestEnvironment(new ContractRegistryEnvironment());

}  // namespace

void RegisterExpectedDomainCoverage(std::string domain, std::vector<std::string> rule_ids) {
  std::lock_guard<std::mutex> lock(CoverageMutex());
  auto& rules = CoverageExpectations()[std::move(domain)];
  rules.insert(rules.end(), rule_ids.begin(), rule_ids.end());
}

}  // namespace zplay::tests
