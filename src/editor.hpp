#pragma once
/*
 * Editor
 *
 * Purpose: modal key dispatch (Normal / Insert / Select plus one-key
 *          sub-menus and the file pickers) over one document, wired to the
 *          highlighter, the request coordinator and the renderer.
 * Collaborators: terminal, file store, clipboard and AI backend are injected
 *          so the whole editor runs headless in tests.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include "ai_backend.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "file_store.hpp"
#include "highlighter.hpp"
#include "iterminal.hpp"
#include "menu.hpp"
#include "renderer.hpp"
#include "request_coordinator.hpp"
#include "syntax.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(ITerminal& term, IFileStore& files, IClipboard& clipboard, IAiBackend& backend, Config cfg);

  /* loads path into the buffer; a missing file starts an empty document bound to path */
  bool open(const std::filesystem::path& path);
  void run();
  /* one frame: consume a finished AI reply, then render */
  void tick();
  void handle_key(const Key& k);

  Mode mode() const { return mode_; }
  MenuState menu() const { return menu_; }
  const Cursor& cursor() const { return cur_; }
  const TextBuffer& buffer() const { return buf_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }
  bool modified() const { return modified_; }
  const std::string& message() const { return message_; }
  bool should_quit() const { return should_quit_; }
  const FilePicker& picker() const { return picker_; }
  const std::filesystem::path& picker_dir() const { return picker_dir_; }
  std::optional<std::pair<size_t, size_t>> selection_range() const;
  RequestCoordinator& coordinator() { return coordinator_; }
  SyntaxHighlighter& highlighter() { return hl_; }
  const Renderer& renderer() const { return renderer_; }
  const Config& config() const { return cfg_; }

  void set_text(std::string_view text);
  void set_cursor(Cursor c);

private:
  void handle_normal_key(const Key& k);
  void handle_insert_key(const Key& k);
  void handle_select_key(const Key& k);
  void handle_menu_key(const Key& k);
  void handle_picker_load_key(const Key& k);
  void handle_picker_save_key(const Key& k);
  bool handle_motion_key(const Key& k);
  bool open_menu_for(const Key& k);
  void run_menu_action(MenuAction action);

  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void move_to_top();
  void move_to_bottom();
  void move_to_line_start();
  void move_to_line_end();

  void enter_insert();
  void enter_select();
  void select_line();
  void exit_select();
  void insert_char(char32_t c);
  void insert_newline();
  void backspace();
  void delete_forward();
  void copy_selection();
  void delete_selection();
  void paste_clipboard();

  void save();
  bool save_to(const std::filesystem::path& path);
  void open_file_picker();
  bool refresh_picker(const std::filesystem::path& dir);
  void confirm_picker_load();
  void confirm_picker_save();
  void submit_ai(const std::string& model);

  void report(ErrKind kind, const std::string& msg);
  void request_exit();
  RenderView make_view() const;

  ITerminal& term_;
  IFileStore& files_;
  IClipboard& clipboard_;
  Config cfg_;
  std::vector<std::string> language_problems_;
  LanguageRegistry languages_;
  SyntaxHighlighter hl_;
  TextBuffer buf_;
  Cursor cur_{};
  Cursor anchor_{};
  Mode mode_ = Mode::Normal;
  MenuState menu_ = MenuState::Inactive;
  FilePicker picker_;
  std::filesystem::path picker_dir_;
  std::optional<std::filesystem::path> file_path_;
  bool modified_ = false;
  bool should_quit_ = false;
  std::string message_;
  Renderer renderer_;
  RequestCoordinator coordinator_;
};
