// Repository: Z-Play-supply
// Component: Contract Registry Environment
// Purpose: Fails the test binary when a domain's expected rules went untested.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_TESTS_CONTRACT_REGISTRY_ENVIRONMENT_H_
#define ZPLAY_TESTS_CONTRACT_REGISTRY_ENVIRONMENT_H_

#include <string>
#include <vector>

namespace zplay::tests {

// Declares the rules a domain must cover. Checked once after all tests ran.
void RegisterExpectedDomainCoverage(std::string domain, std::vector<std::string> rule_ids);

}  // namespace zplay::tests

#endif  // ZPLAY_TESTS_CONTRACT_REGISTRY_ENVIRONMENT_H_
