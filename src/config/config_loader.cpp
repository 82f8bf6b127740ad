// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "config/config_loader.hpp"

#include <iostream>
#include <fstream>
#include <string_view>
#include <absl/base/no_destructor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

namespace canusb::config {

ConfigLoader& ConfigLoader::getInstance() {
  static absl::NoDestructor<ConfigLoader> instance;
  return *instance;
}

bool ConfigLoader::Load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;

  std::string raw, section;
  while (std::getline(in, raw)) {
    std::string_view line = absl::StripAsciiWhitespace(raw);
    if (line.empty() || line[0] == ';' || line[0] == '#') continue;
    if (line.front() == '[' && line.back() == ']') {
      section = std::string(absl::StripAsciiWhitespace(line.substr(1, line.size() - 2)));
      continue;
    }
    auto pos = line.find('=');
    if (pos == std::string_view::npos) continue;
    std::string key(absl::StripAsciiWhitespace(line.substr(0, pos)));
    std::string val(absl::StripAsciiWhitespace(line.substr(pos + 1)));
    table_[section][key] = val;
  }
  std::cout << "[Config] Loaded " << path << std::endl;
  return true;
}

std::string ConfigLoader::Get(const std::string& section,
                                     const std::string& key,
                                     const std::string& def) const {

  auto s_it = table_.find(section);
  if (s_it == table_.end()) return def;

  auto k_it = s_it->second.find(key);

  if (k_it == s_it->second.end()) return def;
  return k_it->second;
}

int64_t ConfigLoader::GetInt(const std::string& section,
                             const std::string& key,
                             int64_t def) const {
  const std::string val = Get(section, key, "");
  if (val.empty()) return def;

  int64_t out = 0;
  if (!absl::SimpleAtoi(val, &out)) {
    std::cerr << "[Config] " << section << "." << key << "=" << val
              << " is not a number, using " << def << "\n";
    return def;
  }
  return out;
}

int64_t ConfigLoader::GetIntInRange(const std::string& section,
                                    const std::string& key,
                                    int64_t def, int64_t lo, int64_t hi) const {
  const int64_t val = GetInt(section, key, def);
  if (val < lo || val > hi) {
    std::cerr << "[Config] " << section << "." << key << "=" << val
              << " is outside [" << lo << ", " << hi << "], using " << def << "\n";
    return def;
  }
  return val;
}

bool ConfigLoader::GetBool(const std::string& section,
                           const std::string& key,
                           bool def) const {
  const std::string val = Get(section, key, "");
  if (val.empty()) return def;

  for (const char* t : {"true", "1", "yes", "on"})
    if (absl::EqualsIgnoreCase(val, t)) return true;
  for (const char* f : {"false", "0", "no", "off"})
    if (absl::EqualsIgnoreCase(val, f)) return false;

  std::cerr << "[Config] " << section << "." << key << "=" << val
            << " is not a boolean, using " << (def ? "true" : "false") << "\n";
  return def;
}

}  // namespace canusb::config
