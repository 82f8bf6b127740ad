// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <absl/base/no_destructor.h>

namespace canusb::config{

class ConfigLoader {
 public:
  static ConfigLoader& getInstance();

  /// INI: [section], key=value, ';' or '#' comment lines. Later files override.
  bool Load(const std::string& path);
  void Clear() { table_.clear(); }

  std::string Get(const std::string& section,
                         const std::string& key,
                         const std::string& def) const ;

  int64_t GetInt(const std::string& section,
                 const std::string& key,
                 int64_t def) const;

  bool GetBool(const std::string& section,
               const std::string& key,
               bool def) const;

  /// GetInt, but a value outside [lo, hi] is reported and replaced by def.
  int64_t GetIntInRange(const std::string& section,
                        const std::string& key,
                        int64_t def, int64_t lo, int64_t hi) const;

 private:
  ConfigLoader() = default;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> table_;
  friend class absl::NoDestructor<ConfigLoader>;


};

}
