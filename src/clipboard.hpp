#pragma once
/*
 * Clipboard
 *
 * Purpose: system clipboard collaborator. XclipClipboard pipes through
 *          `xclip -selection clipboard`; failures come back as messages.
 */
#include <string>

class IClipboard {
public:
  virtual ~IClipboard() = default;
  virtual bool set(const std::string& text, std::string& msg) = 0;
  virtual bool get(std::string& text, std::string& msg) = 0;
};

class XclipClipboard : public IClipboard {
public:
  bool set(const std::string& text, std::string& msg) override;
  bool get(std::string& text, std::string& msg) override;
};
