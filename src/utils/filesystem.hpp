#pragma once

#include <string>

namespace fs {
  /* directory part of 'path', empty if there is none */
  inline std::string basepath(const std::string& path) {
    const auto index = path.find_last_of('/');
    if (index != std::string::npos) {
      return path.substr(0, index);
    }
    return "";
  }

  /* 'path' relative to the directory 'base', unless it is absolute */
  inline std::string resolve(const std::string& base, const std::string& path) {
    if (base.empty() || (!path.empty() && path[0] == '/')) {
      return path;
    }
    return base + "/" + path;
  }
}
