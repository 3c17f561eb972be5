#include "LogWindow.h"

#include <imgui.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace entente::inspector {

void LogRing::push(core::LogLevel level, std::string_view timestamp, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  LogLine l;
  l.seq = nextSeq_++;
  l.level = level;
  l.timestamp = std::string(timestamp);
  l.message = std::string(message);
  lines_.push_back(std::move(l));
  while (lines_.size() > capacity_) lines_.pop_front();
}

void LogRing::snapshot(std::vector<LogLine>& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  out.assign(lines_.begin(), lines_.end());
}

void LogRing::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.clear();
}

void LogRing::sinkFn(core::LogLevel level, std::string_view timestamp, std::string_view message, void* user) {
  auto* ring = static_cast<LogRing*>(user);
  if (ring) ring->push(level, timestamp, message);
}

static bool levelShown(core::LogLevel lvl, const LogWindowState& st) {
  switch (lvl) {
    case core::LogLevel::Trace:
    case core::LogLevel::Debug: return st.showDebug;
    case core::LogLevel::Info:  return st.showInfo;
    case core::LogLevel::Warn:  return st.showWarn;
    case core::LogLevel::Error: return st.showError;
    case core::LogLevel::Off:   return false;
  }
  return true;
}

static ImVec4 levelColor(core::LogLevel lvl) {
  switch (lvl) {
    case core::LogLevel::Warn:  return ImVec4(1.00f, 0.80f, 0.30f, 1.0f);
    case core::LogLevel::Error: return ImVec4(1.00f, 0.40f, 0.35f, 1.0f);
    case core::LogLevel::Info:  return ImVec4(0.85f, 0.88f, 0.92f, 1.0f);
    default:                    return ImVec4(0.55f, 0.58f, 0.62f, 1.0f);
  }
}

// Case-insensitive substring match.
static bool containsNoCase(std::string_view hay, std::string_view needle) {
  if (needle.empty()) return true;
  const auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower((unsigned char)a) == std::tolower((unsigned char)b);
  });
  return it != hay.end();
}

void drawLogWindow(LogWindowState& st, LogRing& ring, const ToastFn& toast) {
  if (!st.open) return;

  ImGui::SetNextWindowSize(ImVec2(820.0f, 300.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Log", &st.open)) {
    ImGui::End();
    return;
  }

  ImGui::Checkbox("Debug", &st.showDebug);
  ImGui::SameLine();
  ImGui::Checkbox("Info", &st.showInfo);
  ImGui::SameLine();
  ImGui::Checkbox("Warn", &st.showWarn);
  ImGui::SameLine();
  ImGui::Checkbox("Error", &st.showError);
  ImGui::SameLine();
  ImGui::Checkbox("Auto-scroll", &st.autoScroll);
  ImGui::SameLine();
  ImGui::PushItemWidth(200.0f);
  ImGui::InputTextWithHint("##log_filter", "Filter...", st.filter, sizeof(st.filter));
  ImGui::PopItemWidth();

  std::vector<LogLine> lines;
  ring.snapshot(lines);

  std::vector<const LogLine*> shown;
  shown.reserve(lines.size());
  for (const LogLine& l : lines) {
    if (!levelShown(l.level, st)) continue;
    if (!containsNoCase(l.message, st.filter)) continue;
    shown.push_back(&l);
  }

  ImGui::SameLine();
  if (ImGui::Button("Copy")) {
    std::string text;
    for (const LogLine* l : shown) {
      text += "[" + l->timestamp + "][" + std::string(core::toString(l->level)) + "] " + l->message + "\n";
    }
    ImGui::SetClipboardText(text.c_str());
    if (toast) toast("Copied " + std::to_string(shown.size()) + " log lines.", 1.5);
  }
  ImGui::SameLine();
  if (ImGui::Button("Clear")) ring.clear();

  ImGui::Separator();
  ImGui::BeginChild("##log_lines", ImVec2(0.0f, 0.0f), false, ImGuiWindowFlags_HorizontalScrollbar);
  for (const LogLine* l : shown) {
    ImGui::TextDisabled("%s", l->timestamp.c_str());
    ImGui::SameLine();
    ImGui::TextColored(levelColor(l->level), "%s", l->message.c_str());
  }
  if (st.autoScroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
  ImGui::EndChild();

  ImGui::End();
}

} // namespace entente::inspector
