// src/message.cpp

#include "amicall/message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace amicall {

static const std::string kEmpty;

static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

const std::string& Message::get(const std::string& key) const {
  for (const auto& f : fields_) {
    if (f.first == key) return f.second;
  }
  return kEmpty;
}

bool Message::has(const std::string& key) const {
  return std::any_of(fields_.begin(), fields_.end(),
                     [&](const Field& f) { return f.first == key; });
}

Message& Message::set(const std::string& key, std::string value) {
  for (auto& f : fields_) {
    if (f.first == key) {
      f.second = std::move(value);
      return *this;
    }
  }
  fields_.emplace_back(key, std::move(value));
  return *this;
}

Message& Message::add(std::string key, std::string value) {
  fields_.emplace_back(std::move(key), std::move(value));
  return *this;
}

bool Message::is_success() const {
  return lower(get("Response")) == "success";
}

std::string Message::summary() const {
  std::ostringstream oss;
  bool first = true;
  for (const auto& f : fields_) {
    if (f.first == "Secret") continue;
    if (!first) oss << ", ";
    oss << f.first << ": " << f.second;
    first = false;
  }
  return oss.str();
}

}  // namespace amicall
