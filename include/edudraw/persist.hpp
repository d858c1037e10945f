#pragma once
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <edudraw/app_state.hpp>

namespace edudraw {

// Fixed key the state blob is stored under.
inline constexpr const char* kStorageKey = "drawLotsGeneratorState";

// $HOME/.config/edudraw (current directory when HOME is unset).
std::filesystem::path default_state_dir();

// <dir>/drawLotsGeneratorState.json
std::filesystem::path state_file_path(const std::filesystem::path& dir);

// Serialize to the JSON document (history capped at kMaxHistory).
std::string state_to_json(const AppState& s);

// Stream-based loader (test-friendly; no filesystem required). Fields present
// in the document override `defaults`; anything unreadable yields nullopt.
std::optional<AppState> state_from_json_stream(std::istream& in, const AppState& defaults);

// Best-effort load: missing or corrupt file -> nullopt (logged), never throws.
std::optional<AppState> load_state(const std::filesystem::path& file, const AppState& defaults);

// Fire-and-forget save; failures are logged and reported as false.
bool save_state(const std::filesystem::path& file, const AppState& s);

} // namespace edudraw
