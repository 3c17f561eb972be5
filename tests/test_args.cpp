#include "entente/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using entente::core::Args;

  // Fixed-arity keys take exactly that many values.
  {
    auto argv = makeArgv({"app", "--evaluate", "3", "7", "extra", "--json"});
    Args args;
    args.setArity("evaluate", 2);
    args.parse((int)argv.size(), argv.data());

    std::vector<unsigned long long> ids;
    if (!args.getU64List("evaluate", ids) || ids.size() != 2 || ids[0] != 3 || ids[1] != 7) {
      std::cerr << "[test_args] expected --evaluate 3 7\n";
      ++fails;
    }
    if (args.positional().size() != 1 || args.positional()[0] != "extra") {
      std::cerr << "[test_args] expected 'extra' to stay positional\n";
      ++fails;
    }
    if (!args.hasFlag("json")) {
      std::cerr << "[test_args] expected --json to be a flag\n";
      ++fails;
    }
  }

  // Greedy keys consume everything up to the next switch.
  {
    auto argv = makeArgv({"app", "--negotiate", "1", "2", "3", "4", "--terms", "mutual_defense=true"});
    Args args;
    args.setGreedy("negotiate");
    args.parse((int)argv.size(), argv.data());

    if (args.values("negotiate").size() != 4) {
      std::cerr << "[test_args] expected greedy --negotiate to take 4 values\n";
      ++fails;
    }
    const auto t = args.last("terms");
    if (!t || *t != "mutual_defense=true") {
      std::cerr << "[test_args] expected --terms value after greedy key\n";
      ++fails;
    }
  }

  // Negative numeric values should be accepted as values and not be misread as switches.
  {
    auto argv = makeArgv({"app", "--day", "-2.5"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    double day = 0.0;
    if (!args.getDouble("day", day) || std::abs(day - (-2.5)) > 1e-9) {
      std::cerr << "[test_args] expected --day -2.5 to parse\n";
      ++fails;
    }
  }

  // --key=value and repeated keys.
  {
    auto argv = makeArgv({"app", "--seed=7", "--set", "a=1", "--set", "b=2"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    unsigned long long seed = 0;
    if (!args.getU64("seed", seed) || seed != 7) {
      std::cerr << "[test_args] expected --seed=7\n";
      ++fails;
    }
    const auto sets = args.values("set");
    if (sets.size() != 2 || args.last("set").value_or("") != "b=2") {
      std::cerr << "[test_args] expected two --set values, last b=2\n";
      ++fails;
    }
  }

  // Ids must be whole unsigned numbers.
  {
    unsigned long long v = 0;
    if (Args::parseU64("-3", v) || Args::parseU64("12x", v) || Args::parseU64("", v) || !Args::parseU64("42", v) ||
        v != 42) {
      std::cerr << "[test_args] parseU64 accepted or rejected the wrong tokens\n";
      ++fails;
    }

    auto argv = makeArgv({"app", "--ids", "1", "two"});
    Args args;
    args.setGreedy("ids");
    args.parse((int)argv.size(), argv.data());
    std::vector<unsigned long long> ids;
    if (args.getU64List("ids", ids)) {
      std::cerr << "[test_args] expected a non-numeric id to fail the list\n";
      ++fails;
    }
  }

  // The end-of-options marker should force everything after it to be positional.
  {
    auto argv = makeArgv({"app", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("flag")) {
      std::cerr << "[test_args] expected --flag to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    if (args.positional().size() != 3) {
      std::cerr << "[test_args] expected 3 positional args after --\n";
      ++fails;
    }
  }

  // A single '-' is a stdout placeholder, not a switch.
  {
    auto argv = makeArgv({"app", "--out", "-"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    const auto v = args.last("out");
    if (args.hasFlag("out") || !v || *v != "-") {
      std::cerr << "[test_args] expected --out to have value '-'\n";
      ++fails;
    }
  }

  // Short flag parsing should still work; negative positionals stay positional.
  {
    auto argv = makeArgv({"app", "-hv", "-1"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
    if (args.positional().size() != 1 || args.positional()[0] != "-1") {
      std::cerr << "[test_args] expected -1 to remain positional\n";
      ++fails;
    }
  }

  // Options outside the known set are reported once each, sorted.
  {
    auto argv = makeArgv({"app", "--roster", "r.txt", "--jsn", "--seed", "1", "--sed=2", "--jsn"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    const auto unknown = args.unknownOptions({"roster", "seed", "json"});
    if (unknown.size() != 2 || unknown[0] != "jsn" || unknown[1] != "sed") {
      std::cerr << "[test_args] expected unknown options jsn and sed\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
