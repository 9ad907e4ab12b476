#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults plus the runtime settings read from the rc file.
 * Usage: load_config(path, cfg, msg) applies ":set"-style lines through a
 *        CommandRegistry; unknown options are reported, never fatal.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

#define SCRIBE_ROPE_LEAF_LINES 128
#define SCRIBE_WRITE_CHUNK_SIZE (1 << 16)
#define SCRIBE_TAB_WIDTH 4
#define SCRIBE_FRAME_MS 16
#define SCRIBE_INPUT_POLL_MS 1
#define SCRIBE_DEFAULT_DOCUMENT ".scribe/history.md"
#define SCRIBE_LOG_FILE ".scribe/scribe.log"
#define SCRIBE_RC_NAME ".scriberc"

struct CaptureOverride {
  std::string capture;
  Style style;
};

struct Config {
  int tab_width = SCRIBE_TAB_WIDTH;
  bool show_line_numbers = true;
  std::string model = "llama3.2";
  std::string model_alt = "gpt-4o-mini";
  std::string endpoint = "http://localhost:11434/v1";
  std::string system_prompt = "You are a helpful assistant answering questions written in a text editor.";
  std::string response_header = "\n\nAssistant\n ";
  long request_timeout_s = 300;
  std::vector<CaptureOverride> captures;
};

/* Applies one rc line to cfg. Returns false with msg set when the line is not understood. */
bool apply_config_line(const std::string& line, Config& cfg, std::string& msg);
/* Missing file is not an error. Returns false if any line was rejected; msg holds the last problem. */
bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg);
std::vector<std::filesystem::path> default_config_paths();
