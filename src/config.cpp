#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "cmd_registry.hpp"
#include "file_store.hpp"
#include "syntax.hpp"

static std::string unescape(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      char n = s[++i];
      if (n == 'n') out.push_back('\n');
      else if (n == 't') out.push_back('\t');
      else out.push_back(n);
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

static std::string join(const std::vector<std::string>& args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i) out.push_back(' ');
    out += args[i];
  }
  return out;
}

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static void register_config_commands(CommandRegistry& registry, Config& cfg) {
  registry.register_command("set tabwidth", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set tabwidth: use set tabwidth <width>"; return false; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() < 4 &&
              std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { msg = "set tabwidth: width must be a number"; return false; }
    int w = std::stoi(s);
    if (w < 1) { msg = "set tabwidth: width must be >= 1"; return false; }
    cfg.tab_width = w;
    msg = "tabwidth=" + s;
    return true;
  });
  registry.register_command("set number", [&cfg](const std::vector<std::string>& args, std::string& msg){
    bool v = false;
    if (!parse_on_off(args, cfg.show_line_numbers, v)) { msg = "set number: use set number on|off"; return false; }
    cfg.show_line_numbers = v;
    msg = v ? "number on" : "number off";
    return true;
  });
  registry.register_command("set model", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set model: use set model <name>"; return false; }
    cfg.model = args[0];
    msg = "model=" + cfg.model;
    return true;
  });
  registry.register_command("set model_alt", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set model_alt: use set model_alt <name>"; return false; }
    cfg.model_alt = args[0];
    msg = "model_alt=" + cfg.model_alt;
    return true;
  });
  registry.register_command("set endpoint", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set endpoint: use set endpoint <url>"; return false; }
    std::string url = args[0];
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
      msg = "set endpoint: url must start with http:// or https://";
      return false;
    }
    cfg.endpoint = url;
    msg = "endpoint=" + url;
    return true;
  });
  registry.register_command("set timeout", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || args[0].empty() ||
        !std::all_of(args[0].begin(), args[0].end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
      msg = "set timeout: use set timeout <seconds>";
      return false;
    }
    cfg.request_timeout_s = std::strtol(args[0].c_str(), nullptr, 10);
    msg = "timeout=" + args[0];
    return true;
  });
  registry.register_command("set response_header", [&cfg](const std::vector<std::string>& args, std::string& msg){
    cfg.response_header = unescape(join(args));
    msg = "response_header updated";
    return true;
  });
  registry.register_command("set system_prompt", [&cfg](const std::vector<std::string>& args, std::string& msg){
    cfg.system_prompt = unescape(join(args));
    msg = "system_prompt updated";
    return true;
  });
  registry.register_command("set capture", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 2) { msg = "set capture: use set capture <capture-name> <style>"; return false; }
    Style st = Style::Normal;
    if (!style_from_name(args[1], st)) { msg = "set capture: unknown style " + args[1]; return false; }
    cfg.captures.push_back(CaptureOverride{args[0], st});
    msg = "capture " + args[0] + "=" + style_name(st);
    return true;
  });
}

static std::string trim(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

static bool apply_with(const CommandRegistry& registry, const std::string& raw, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  return registry.execute_line(s, msg);
}

bool apply_config_line(const std::string& raw, Config& cfg, std::string& msg) {
  CommandRegistry registry;
  register_config_commands(registry, cfg);
  return apply_with(registry, raw, msg);
}

bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  CommandRegistry registry;
  register_config_commands(registry, cfg);
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!apply_with(registry, lines[i], m)) {
      ok = false;
      msg = path.string() + ":" + std::to_string(i + 1) + ": " + m;
    }
  }
  return ok;
}

std::vector<std::filesystem::path> default_config_paths() {
  std::vector<std::filesystem::path> out;
  if (const char* home = std::getenv("HOME")) out.push_back(std::filesystem::path(home) / SCRIBE_RC_NAME);
  out.push_back(std::filesystem::path(SCRIBE_RC_NAME));
  return out;
}
