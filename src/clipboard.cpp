#include "clipboard.hpp"
#include <cstdio>

bool XclipClipboard::set(const std::string& text, std::string& msg) {
  FILE* pipe = popen("xclip -selection clipboard -i 2>/dev/null", "w");
  if (!pipe) { msg = "clipboard: can not start xclip"; return false; }
  size_t written = fwrite(text.data(), 1, text.size(), pipe);
  int rc = pclose(pipe);
  if (written != text.size() || rc != 0) { msg = "clipboard: xclip failed"; return false; }
  msg = "copied " + std::to_string(text.size()) + " bytes";
  return true;
}

bool XclipClipboard::get(std::string& text, std::string& msg) {
  text.clear();
  FILE* pipe = popen("xclip -selection clipboard -o 2>/dev/null", "r");
  if (!pipe) { msg = "clipboard: can not start xclip"; return false; }
  char buf[4096];
  size_t n = 0;
  while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) text.append(buf, n);
  int rc = pclose(pipe);
  if (rc != 0) { msg = "clipboard: xclip failed"; return false; }
  return true;
}
