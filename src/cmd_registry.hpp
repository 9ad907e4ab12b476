#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands.
 * Design: map name → handler (args vector, message out); "set opt value" and
 *         "set opt=value" both route to the handler registered as "set opt".
 *         Double-quoted arguments keep their spaces.
 */
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }

  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }

  bool execute_line(const std::string& line, std::string& msg) const {
    std::vector<std::string> words = tokenize(line);
    if (words.empty()) return true;
    std::string cmd = words[0];
    std::vector<std::string> args(words.begin() + 1, words.end());
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::vector<std::string> subargs;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        subargs.push_back(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
      for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
      return execute("set " + name, subargs, msg);
    }
    return execute(cmd, args, msg);
  }

  static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_word = false;
    bool quoted = false;
    for (char c : line) {
      if (quoted) {
        if (c == '"') quoted = false; else cur.push_back(c);
        continue;
      }
      if (c == '"') { quoted = true; in_word = true; continue; }
      if (c == ' ' || c == '\t') {
        if (in_word) { out.push_back(cur); cur.clear(); in_word = false; }
        continue;
      }
      cur.push_back(c);
      in_word = true;
    }
    if (in_word) out.push_back(cur);
    return out;
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
