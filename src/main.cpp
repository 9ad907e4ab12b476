#include "terminal.hpp"
#include "editor.hpp"
#include "chat_client.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "file_store.hpp"
#include "ncurses_terminal.hpp"
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static std::string api_key_from_env() {
  for (const char* name : {"SCRIBE_API_KEY", "OPENAI_API_KEY"}) {
    const char* v = std::getenv(name);
    if (v && *v) return v;
  }
  return {};
}

int main(int argc, char** argv) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(SCRIBE_LOG_FILE).parent_path(), ec);
  static plog::RollingFileAppender<plog::TxtFormatter> fileAppender(SCRIBE_LOG_FILE, 1024 * 1024, 3);
  plog::init(plog::info, &fileAppender);
  PLOGI << "scribe starting";

  Config cfg;
  std::vector<std::string> config_problems;
  for (const auto& p : default_config_paths()) {
    std::string msg;
    if (!load_config(p, cfg, msg)) config_problems.push_back(msg);
  }
  for (const auto& m : config_problems) PLOGW << "config: " << m;

  std::filesystem::path document = argc >= 2 ? std::filesystem::path(argv[1]) : std::filesystem::path(SCRIBE_DEFAULT_DOCUMENT);

  int rc = 0;
  std::string fatal;
  try {
    PosixFileStore files;
    XclipClipboard clipboard;
    ChatClient backend(cfg.endpoint, api_key_from_env(), cfg.system_prompt, cfg.request_timeout_s);
    Terminal guard;
    NcursesTerminal term;
    Editor ed(term, files, clipboard, backend, cfg);
    if (!ed.open(document)) PLOGW << "starting with an empty buffer";
    ed.run();
  } catch (const std::exception& e) {
    fatal = e.what();
    rc = 1;
  }
  if (rc != 0) {
    PLOGF << fatal;
    std::cerr << "scribe: " << fatal << "\n";
  }
  for (const auto& m : config_problems) std::cerr << "scribe: config: " << m << "\n";
  PLOGI << "scribe exiting";
  return rc;
}
