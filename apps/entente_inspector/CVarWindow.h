#pragma once

#include "LogWindow.h"

#include <string>

namespace entente::core {
class CVarRegistry;
}

namespace entente::inspector {

// Browser/editor for the diplo.* and log.* cvars.
//
// Edits land in the registry right away; the diplomacy window rebuilds its
// engine from the registry on request.
struct CVarWindowState {
  bool open{false};

  char filter[128]{};
  bool showChangedOnly{false};

  // Quick set line: "name = value" (press Enter)
  char setLine[256]{};

  char configPath[160]{"entente.cfg"};
};

void drawCVarWindow(CVarWindowState& st, core::CVarRegistry& registry, const ToastFn& toast);

} // namespace entente::inspector
