#pragma once
/*
 * CommandRegistry
 *
 * Purpose: ':' commands, typed on the command line or read from the rc file.
 * Design: name -> handler(args, msg); a handler returns false when the
 *         command failed and leaves the reason in msg.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>& args, std::string& msg)>;

  void add(const std::string& name, Handler h) { handlers_[name] = std::move(h); }
  void alias(const std::string& name, const std::string& target);
  bool contains(const std::string& name) const { return handlers_.count(name) != 0; }

  // "set wrap=word" -> name "set", args {"wrap=word"}; a leading ':' is skipped
  static bool parse(const std::string& line, std::string& name, std::vector<std::string>& args);
  // empty lines succeed; unknown names fail with a message
  bool run_line(const std::string& line, std::string& msg) const;
private:
  std::unordered_map<std::string, Handler> handlers_;
};
