#include "CVarWindow.h"

#include "entente/core/CVar.h"

#include <imgui.h>

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace entente::inspector {
namespace {

std::string trimAscii(std::string_view sv) {
  std::size_t b = 0;
  while (b < sv.size() && std::isspace((unsigned char)sv[b])) ++b;
  std::size_t e = sv.size();
  while (e > b && std::isspace((unsigned char)sv[e - 1])) --e;
  return std::string(sv.substr(b, e - b));
}

// "name = value" or "name value".
bool parseSetLine(std::string_view line, std::string& outName, std::string& outValue) {
  const std::string trimmed = trimAscii(line);
  if (trimmed.empty()) return false;

  std::size_t cut = trimmed.find('=');
  std::size_t skip = 1;
  if (cut == std::string::npos) {
    cut = 0;
    while (cut < trimmed.size() && !std::isspace((unsigned char)trimmed[cut])) ++cut;
    skip = 0;
  }
  outName = trimAscii(std::string_view(trimmed).substr(0, cut));
  outValue = trimAscii(std::string_view(trimmed).substr(std::min(trimmed.size(), cut + skip)));
  return !outName.empty() && !outValue.empty();
}

void helpTooltip(const core::CVar& v) {
  if (!ImGui::IsItemHovered()) return;
  ImGui::BeginTooltip();
  ImGui::TextUnformatted(v.name.c_str());
  if (!v.help.empty()) {
    ImGui::Separator();
    ImGui::TextWrapped("%s", v.help.c_str());
  }
  ImGui::Separator();
  ImGui::TextDisabled("Type: %s", core::CVarRegistry::typeName(v.type));
  ImGui::TextDisabled("Default: %s", core::CVarRegistry::valueToString(v.defaultValue).c_str());
  ImGui::TextDisabled("Set by: %s", v.origin.empty() ? "default" : v.origin.c_str());
  if (v.minValue || v.maxValue) {
    ImGui::TextDisabled("Range: [%g, %g]", v.minValue.value_or(-DBL_MAX), v.maxValue.value_or(DBL_MAX));
  }
  ImGui::EndTooltip();
}

} // namespace

void drawCVarWindow(CVarWindowState& st, core::CVarRegistry& registry, const ToastFn& toast) {
  if (!st.open) return;

  ImGui::SetNextWindowSize(ImVec2(780.0f, 560.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("CVars", &st.open)) {
    ImGui::End();
    return;
  }

  ImGui::PushItemWidth(260.0f);
  ImGui::InputTextWithHint("##cvar_filter", "Filter (substring)...", st.filter, sizeof(st.filter));
  ImGui::PopItemWidth();
  ImGui::SameLine();
  ImGui::Checkbox("Changed only", &st.showChangedOnly);

  {
    ImGui::PushItemWidth(-80.0f);
    bool apply = ImGui::InputTextWithHint("##cvar_set", "Set: name = value   (press Enter)", st.setLine,
                                          sizeof(st.setLine), ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::PopItemWidth();
    ImGui::SameLine();
    if (ImGui::Button("Apply")) apply = true;

    if (apply) {
      std::string name, value, err;
      if (!parseSetLine(st.setLine, name, value)) {
        if (toast) toast("Expected: name = value", 2.0);
      } else if (!registry.setFromString(name, value, &err)) {
        if (toast) toast("CVar error: " + err, 2.6);
      } else {
        if (toast) toast("Set " + name + " = " + value, 1.8);
        st.setLine[0] = '\0';
      }
    }
  }

  ImGui::Separator();
  ImGui::PushItemWidth(220.0f);
  ImGui::InputTextWithHint("##cvar_cfg", "entente.cfg", st.configPath, sizeof(st.configPath));
  ImGui::PopItemWidth();
  ImGui::SameLine();
  if (ImGui::Button("Save")) {
    std::ofstream f(st.configPath, std::ios::out | std::ios::trunc);
    if (f) registry.writeTo(f);
    if (toast) toast(f ? std::string("Saved cvars.") : std::string("Cannot write ") + st.configPath, 2.2);
  }
  ImGui::SameLine();
  if (ImGui::Button("Load")) {
    std::string err;
    const bool ok = registry.loadFile(st.configPath, &err);
    if (toast) toast(ok ? std::string("Loaded cvars.") : "Load failed: " + err, 2.2);
  }

  ImGui::Separator();

  const std::vector<core::CVar> vars = registry.list(trimAscii(st.filter));

  const ImGuiTableFlags tableFlags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg |
                                     ImGuiTableFlags_SizingStretchProp | ImGuiTableFlags_Resizable |
                                     ImGuiTableFlags_ScrollY;
  if (ImGui::BeginTable("##cvars_table", 4, tableFlags, ImVec2(0.0f, ImGui::GetContentRegionAvail().y))) {
    ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthStretch, 0.40f);
    ImGui::TableSetupColumn("Value", ImGuiTableColumnFlags_WidthStretch, 0.30f);
    ImGui::TableSetupColumn("Default", ImGuiTableColumnFlags_WidthStretch, 0.20f);
    ImGui::TableSetupColumn("##reset", ImGuiTableColumnFlags_WidthFixed, 56.0f);
    ImGui::TableHeadersRow();

    for (const core::CVar& v : vars) {
      const bool changed = v.value != v.defaultValue;
      if (st.showChangedOnly && !changed) continue;
      const bool readOnly = (v.flags & core::CVar_ReadOnly) != 0u;

      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      if (changed) {
        ImGui::TextUnformatted(v.name.c_str());
      } else {
        ImGui::TextDisabled("%s", v.name.c_str());
      }
      helpTooltip(v);

      ImGui::TableSetColumnIndex(1);
      std::string err;
      const std::string id = "##v_" + v.name;
      if (readOnly) {
        ImGui::TextDisabled("%s", core::CVarRegistry::valueToString(v).c_str());
      } else {
        switch (v.type) {
          case core::CVarType::Bool: {
            bool cur = std::get<bool>(v.value);
            if (ImGui::Checkbox(id.c_str(), &cur) && !registry.setBool(v.name, cur, &err) && toast) {
              toast("CVar error: " + err, 2.4);
            }
          } break;
          case core::CVarType::Int: {
            long long cur = static_cast<long long>(std::get<std::int64_t>(v.value));
            ImGui::SetNextItemWidth(-FLT_MIN);
            if (ImGui::InputScalar(id.c_str(), ImGuiDataType_S64, &cur, nullptr, nullptr, "%lld",
                                   ImGuiInputTextFlags_EnterReturnsTrue) &&
                !registry.setInt(v.name, cur, &err) && toast) {
              toast("CVar error: " + err, 2.4);
            }
          } break;
          case core::CVarType::Float: {
            double cur = std::get<double>(v.value);
            ImGui::SetNextItemWidth(-FLT_MIN);
            if (ImGui::InputDouble(id.c_str(), &cur, 0.0, 0.0, "%.6g", ImGuiInputTextFlags_EnterReturnsTrue) &&
                !registry.setFloat(v.name, cur, &err) && toast) {
              toast("CVar error: " + err, 2.4);
            }
          } break;
          case core::CVarType::String:
            ImGui::TextUnformatted(std::get<std::string>(v.value).c_str());
            break;
        }
      }

      ImGui::TableSetColumnIndex(2);
      ImGui::TextDisabled("%s", core::CVarRegistry::valueToString(v.defaultValue).c_str());

      ImGui::TableSetColumnIndex(3);
      if (changed && !readOnly && ImGui::SmallButton(("Reset" + id).c_str())) {
        if (!registry.reset(v.name, &err) && toast) toast("Reset failed: " + err, 2.4);
      }
    }
    ImGui::EndTable();
  }

  ImGui::End();
}

} // namespace entente::inspector
