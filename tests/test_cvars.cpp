#include "entente/core/CVar.h"
#include "entente/core/Log.h"

#include "test_harness.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

int test_cvars() {
  int failures = 0;

  using entente::core::CVarRegistry;
  using entente::core::CVarType;

  // ---- Define + typed get/set ----
  {
    CVarRegistry r;
    CHECK(r.defineBool("a.bool", true, entente::core::CVar_Archive, "test") != nullptr);
    CHECK(r.defineInt("a.int", 42, entente::core::CVar_None) != nullptr);
    CHECK(r.defineFloat("a.float", 1.5, entente::core::CVar_None) != nullptr);
    CHECK(r.defineString("a.str", "hello") != nullptr);

    CHECK(r.getBool("a.bool", false) == true);
    CHECK(r.getInt("a.int", 0) == 42);
    CHECK(r.getFloat("a.float", 0.0) > 1.4);
    CHECK(r.getString("a.str", "") == "hello");
    CHECK(r.find("a.int")->type == CVarType::Int);

    std::string err;
    CHECK(r.setFromString("a.bool", "false", &err));
    CHECK(r.getBool("a.bool", true) == false);

    CHECK(r.setFromString("a.int", "-7", &err));
    CHECK(r.getInt("a.int", 0) == -7);

    CHECK(r.setFromString("a.str", "\"hi there\"", &err));
    CHECK(r.getString("a.str", "") == "hi there");

    CHECK(!r.setFromString("a.int", "seven", &err));
    CHECK(!r.setFromString("missing.var", "1", &err));

    // Redefinition with another type is refused; same type keeps the value.
    CHECK(r.defineString("a.int", "x") == nullptr);
    CHECK(r.defineInt("a.int", 1) != nullptr);
    CHECK(r.getInt("a.int", 0) == -7);

    CHECK(r.reset("a.int", &err));
    CHECK(r.getInt("a.int", 0) == 42);
  }

  // ---- Bounds and read-only ----
  {
    CVarRegistry r;
    CHECK(r.defineFloat("b.unit", 0.5, entente::core::CVar_Archive, "", 0.0, 1.0) != nullptr);
    CHECK(r.defineInt("b.fixed", 3, entente::core::CVar_ReadOnly) != nullptr);

    std::string err;
    CHECK(!r.setFromString("b.unit", "1.5", &err));
    CHECK(err.find("out of range") != std::string::npos);
    CHECK(r.getFloat("b.unit", 0.0) == 0.5);
    CHECK(r.setFromString("b.unit", "1", &err));

    CHECK(!r.setInt("b.fixed", 4, &err));
    CHECK(r.getInt("b.fixed", 0) == 3);
  }

  // ---- Pending assignment (load before define) ----
  {
    const std::string path = "entente_test_cvars_pending.cfg";
    {
      std::FILE* f = std::fopen(path.c_str(), "wb");
      CHECK(f != nullptr);
      if (f) {
        std::fputs("# test\n", f);
        std::fputs("pending.int = 123\n", f);
        std::fputs("pending.str = \"hello world\"  // trailing comment\n", f);
        std::fclose(f);
      }
    }

    CVarRegistry r;
    std::string err;
    CHECK(r.loadFile(path, &err));
    CHECK(r.hasPending("pending.int"));
    CHECK(r.pendingValue("pending.str") && *r.pendingValue("pending.str") == "\"hello world\"");

    // Defining should apply pending assignments automatically.
    CHECK(r.defineInt("pending.int", 0) != nullptr);
    CHECK(r.defineString("pending.str", "x") != nullptr);

    CHECK(r.getInt("pending.int", 0) == 123);
    CHECK(r.getString("pending.str", "") == "hello world");
    CHECK(!r.hasPending("pending.int"));

    std::remove(path.c_str());
  }

  // ---- Write + reload ----
  {
    const std::string path = "entente_test_cvars_roundtrip.cfg";

    CVarRegistry a;
    CHECK(a.defineBool("rt.b", true) != nullptr);
    CHECK(a.defineInt("rt.i", 1) != nullptr);
    CHECK(a.defineFloat("rt.f", 1.0) != nullptr);
    CHECK(a.defineString("rt.s", "hello world") != nullptr);
    CHECK(a.defineInt("rt.hidden", 5, entente::core::CVar_None) != nullptr);

    std::string err;
    CHECK(a.setFromString("rt.b", "0", &err));
    CHECK(a.setFromString("rt.i", "99", &err));
    CHECK(a.setFromString("rt.f", "3.5", &err));

    {
      std::ofstream out(path);
      a.writeTo(out);
    }

    CVarRegistry b;
    CHECK(b.loadFile(path, &err));
    CHECK(!b.hasPending("rt.hidden"));

    CHECK(b.defineBool("rt.b", true) != nullptr);
    CHECK(b.defineInt("rt.i", 0) != nullptr);
    CHECK(b.defineFloat("rt.f", 0.0) != nullptr);
    CHECK(b.defineString("rt.s", "") != nullptr);

    CHECK(b.getBool("rt.b", true) == false);
    CHECK(b.getInt("rt.i", 0) == 99);
    CHECK(b.getFloat("rt.f", 0.0) > 3.4);
    CHECK(b.getString("rt.s", "") == "hello world");
    CHECK(b.find("rt.i")->origin.rfind(path + ":", 0) == 0);
    CHECK(a.find("rt.i")->origin == "set");

    std::remove(path.c_str());
  }

  CHECK(!CVarRegistry{}.loadFile("entente_test_no_such_file.cfg"));

  // ---- Bad lines are reported by line; good lines still apply ----
  {
    const std::string path = "entente_test_cvars_bad.cfg";
    {
      std::ofstream out(path);
      out << "bad.i = 3\n"
          << "bad.i = three\n"
          << "bad.f = 9\n";
    }
    CVarRegistry r;
    r.defineInt("bad.i", 0);
    r.defineFloat("bad.f", 0.0, entente::core::CVar_Archive, "", 0.0, 1.0);

    std::string err;
    CHECK(!r.loadFile(path, &err));
    CHECK(err.find(path + ":2:") != std::string::npos);
    CHECK(err.find(path + ":3:") != std::string::npos);
    CHECK(err.find(path + ":1:") == std::string::npos);
    CHECK(r.getInt("bad.i", 0) == 3);
    CHECK(r.getFloat("bad.f", -1.0) == 0.0);
    CHECK(r.reset("bad.i") && r.find("bad.i")->origin.empty());

    std::remove(path.c_str());
  }

  // ---- log.level drives the logger ----
  {
    const auto prev = entente::core::getLogLevel();
    CVarRegistry r;
    entente::core::installDefaultCVars(r);
    CHECK(r.exists("log.level"));
    CHECK(r.setFromString("log.level", "error"));
    CHECK(entente::core::getLogLevel() == entente::core::LogLevel::Error);
    entente::core::setLogLevel(prev);
  }

  // ---- Listing is name-sorted and filterable ----
  {
    CVarRegistry r;
    r.defineInt("z.last", 0);
    r.defineInt("a.first", 0);
    r.defineInt("m.Middle", 0);
    const auto all = r.list();
    CHECK(all.size() == 3);
    CHECK(all.front().name == "a.first" && all.back().name == "z.last");
    CHECK(r.list("middle").size() == 1);
  }

  return failures;
}
