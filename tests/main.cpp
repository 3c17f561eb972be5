#include <iostream>

int test_args();
int test_cvars();
int test_log_sinks();
int test_compatibility();
int test_betrayal();
int test_alliance_terms();
int test_alliance_formation();
int test_negotiation();
int test_trust_ledger();
int test_relationship_analyzer();
int test_network();
int test_faction_roster();
int test_diplomacy_text();
int test_diplomacy_config();
int test_engine();
int test_concurrency();
int test_signature();
int test_json();

int main() {
  int fails = 0;

  fails += test_args();
  fails += test_cvars();
  fails += test_log_sinks();
  fails += test_compatibility();
  fails += test_betrayal();
  fails += test_alliance_terms();
  fails += test_alliance_formation();
  fails += test_negotiation();
  fails += test_trust_ledger();
  fails += test_relationship_analyzer();
  fails += test_network();
  fails += test_faction_roster();
  fails += test_diplomacy_text();
  fails += test_diplomacy_config();
  fails += test_engine();
  fails += test_concurrency();
  fails += test_signature();
  fails += test_json();

  if (fails == 0) {
    std::cout << "[entente_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[entente_tests] FAILS=" << fails << "\n";
  return 1;
}
