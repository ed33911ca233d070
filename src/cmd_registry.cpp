#include "cmd_registry.hpp"
#include <cctype>

bool CommandRegistry::parse(const std::string& line, std::string& name, std::vector<std::string>& args) {
  name.clear();
  args.clear();
  size_t i = 0, n = line.size();
  auto skip_space = [&]() { while (i < n && std::isspace(static_cast<unsigned char>(line[i]))) i++; };
  skip_space();
  if (i < n && line[i] == ':') { i++; skip_space(); }
  while (i < n && !std::isspace(static_cast<unsigned char>(line[i]))) name.push_back(line[i++]);
  while (true) {
    skip_space();
    if (i >= n) break;
    std::string arg;
    while (i < n && !std::isspace(static_cast<unsigned char>(line[i]))) arg.push_back(line[i++]);
    args.push_back(std::move(arg));
  }
  return !name.empty();
}

void CommandRegistry::alias(const std::string& name, const std::string& target) {
  auto it = handlers_.find(target);
  if (it != handlers_.end()) handlers_[name] = it->second;
}

bool CommandRegistry::run_line(const std::string& line, std::string& msg) const {
  std::string name;
  std::vector<std::string> args;
  if (!parse(line, name, args)) return true;
  auto it = handlers_.find(name);
  if (it == handlers_.end()) { msg = "not an editor command: " + name; return false; }
  return it->second(args, msg);
}
