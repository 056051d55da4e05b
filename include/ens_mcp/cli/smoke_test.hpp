#pragma once

#include <ens_mcp/ens/i_ens_resolver.hpp>

#include <iostream>

namespace ens_mcp {

// Name exercised by the smoke test.
constexpr const char* kSmokeTestName = "vitalik.eth";

// ---------------------------------------------------------------------------
// RunSmokeTest — run the four ENS operations once against a live resolver
// and print each envelope (2-space JSON) under a section header:
//
//   resolve vitalik.eth
//   reverse resolve the address found (skipped if resolution failed)
//   text record "url"
//   full info
//
// Returns true when every operation that ran reported success.
// ---------------------------------------------------------------------------
bool RunSmokeTest(IEnsResolver& resolver,
                  std::ostream& out = std::cout,
                  bool use_color = false);

} // namespace ens_mcp
