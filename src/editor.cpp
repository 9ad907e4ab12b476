#include "editor.hpp"
#include <ncurses.h>
#include <plog/Log.h>
#include <algorithm>
#include <chrono>

static bool is_enter(const Key& k) {
  return (!k.special && (k.code == '\n' || k.code == '\r')) || (k.special && k.code == KEY_ENTER);
}

static bool is_backspace(const Key& k) {
  return (!k.special && (k.code == BACKSPACE_ASCII || k.code == 8)) || (k.special && k.code == KEY_BACKSPACE);
}

static bool is_esc(const Key& k) { return !k.special && k.code == ESC; }

static bool is_printable(const Key& k) {
  return !k.special && (k.code == '\t' || (k.code >= 32 && k.code != BACKSPACE_ASCII));
}

Editor::Editor(ITerminal& term, IFileStore& files, IClipboard& clipboard, IAiBackend& backend, Config cfg)
  : term_(term), files_(files), clipboard_(clipboard), cfg_(std::move(cfg)),
    languages_(LanguageRegistry::with_builtin_languages(&language_problems_)),
    hl_(languages_, CaptureStyleMap::with_defaults()),
    coordinator_(backend, cfg_.response_header) {
  for (const auto& p : language_problems_) PLOGW << "highlighting disabled for " << p;
  for (const auto& o : cfg_.captures) hl_.styles().set(o.capture, o.style);
  std::error_code ec;
  picker_dir_ = std::filesystem::current_path(ec);
  if (ec) picker_dir_ = ".";
}

void Editor::run() {
  using clock = std::chrono::steady_clock;
  auto next_frame = clock::now();
  while (!should_quit_) {
    auto now = clock::now();
    if (now >= next_frame) {
      tick();
      next_frame = now + std::chrono::milliseconds(SCRIBE_FRAME_MS);
    }
    if (auto k = term_.read_key(SCRIBE_INPUT_POLL_MS)) handle_key(*k);
  }
}

void Editor::tick() {
  PollResult r = coordinator_.poll(buf_, hl_, cur_);
  if (r == PollResult::Appended) {
    modified_ = true;
    PLOGI << "reply appended, document now " << buf_.line_count() << " lines";
  } else if (r == PollResult::Failed) {
    PLOGE << "backend: " << coordinator_.state().error;
  }
  renderer_.render(term_, make_view(), hl_);
}

RenderView Editor::make_view() const {
  RenderView v;
  v.buf = &buf_;
  v.cur = cur_;
  v.selection = selection_range();
  v.mode = mode_;
  v.menu = menu_;
  v.file_name = file_path_ ? file_path_->string() : std::string();
  v.modified = modified_;
  v.message = message_;
  v.request = coordinator_.state();
  v.show_line_numbers = cfg_.show_line_numbers;
  v.tab_width = cfg_.tab_width;
  v.picker = &picker_;
  v.picker_dir = picker_dir_.string();
  return v;
}

std::optional<std::pair<size_t, size_t>> Editor::selection_range() const {
  if (mode_ != Mode::Select) return std::nullopt;
  size_t a = buf_.char_idx_from_position(anchor_);
  size_t b = buf_.char_idx_from_position(cur_);
  return std::make_pair(std::min(a, b), std::max(a, b));
}

void Editor::set_text(std::string_view text) {
  buf_.set_text(text);
  hl_.clear();
  cur_ = Cursor{0, 0};
  anchor_ = cur_;
}

void Editor::set_cursor(Cursor c) {
  c.row = std::clamp(c.row, 0, buf_.line_count() - 1);
  c.col = std::clamp(c.col, 0, buf_.line_len(c.row));
  cur_ = c;
}

void Editor::report(ErrKind kind, const std::string& msg) {
  message_ = msg;
  if (kind == ErrKind::Exit) {
    request_exit();
    return;
  }
  PLOGW << err_kind_name(kind) << ": " << msg;
}

void Editor::request_exit() { should_quit_ = true; }

void Editor::handle_key(const Key& k) {
  if (!k.special && k.code == CTRL_Q) { report(ErrKind::Exit, "quit"); return; }
  if (k.special && k.code == KEY_RESIZE) { renderer_.force_redraw(); return; }
  if (menu_ == MenuState::FilePickerLoad) { handle_picker_load_key(k); return; }
  if (menu_ == MenuState::FilePickerSave) { handle_picker_save_key(k); return; }
  if (menu_ != MenuState::Inactive) { handle_menu_key(k); return; }
  switch (mode_) {
    case Mode::Normal: handle_normal_key(k); break;
    case Mode::Insert: handle_insert_key(k); break;
    case Mode::Select: handle_select_key(k); break;
  }
}

bool Editor::handle_motion_key(const Key& k) {
  if (k.special) {
    switch (k.code) {
      case KEY_LEFT: move_left(); return true;
      case KEY_RIGHT: move_right(); return true;
      case KEY_UP: move_up(); return true;
      case KEY_DOWN: move_down(); return true;
      case KEY_HOME: move_to_line_start(); return true;
      case KEY_END: move_to_line_end(); return true;
      default: return false;
    }
  }
  if (mode_ == Mode::Insert) return false;
  switch (k.code) {
    case 'h': move_left(); return true;
    case 'l': move_right(); return true;
    case 'k': move_up(); return true;
    case 'j': move_down(); return true;
    default: return false;
  }
}

bool Editor::open_menu_for(const Key& k) {
  if (k.special) return false;
  MenuState m = menu_for_trigger(k.code);
  if (m == MenuState::Inactive) return false;
  menu_ = m;
  return true;
}

void Editor::handle_normal_key(const Key& k) {
  if (handle_motion_key(k)) return;
  if (open_menu_for(k)) return;
  if (k.special) return;
  switch (k.code) {
    case 'i': enter_insert(); break;
    case 'v': enter_select(); break;
    case 'x': select_line(); break;
    case 's': save(); break;
    case 'p': paste_clipboard(); break;
    case 'q': report(ErrKind::Exit, "quit"); break;
    default: break;
  }
}

void Editor::handle_insert_key(const Key& k) {
  if (is_esc(k)) { mode_ = Mode::Normal; return; }
  if (handle_motion_key(k)) return;
  if (is_enter(k)) { insert_newline(); return; }
  if (is_backspace(k)) { backspace(); return; }
  if (k.special && k.code == KEY_DC) { delete_forward(); return; }
  if (is_printable(k)) insert_char(static_cast<char32_t>(k.code));
}

void Editor::handle_select_key(const Key& k) {
  if (is_esc(k)) { exit_select(); return; }
  if (handle_motion_key(k)) return;
  if (open_menu_for(k)) return;
  if (k.special) return;
  switch (k.code) {
    case 'y': copy_selection(); break;
    case 'd': delete_selection(); break;
    case 'x': select_line(); break;
    default: break;
  }
}

void Editor::handle_menu_key(const Key& k) {
  MenuState m = menu_;
  menu_ = MenuState::Inactive;
  if (k.special) return;
  if (auto action = menu_lookup(m, k.code)) run_menu_action(*action);
}

void Editor::handle_picker_load_key(const Key& k) {
  if (is_esc(k)) { menu_ = MenuState::Inactive; picker_.close(); return; }
  if (is_enter(k)) { confirm_picker_load(); return; }
  if ((k.special && k.code == KEY_UP) || (!k.special && k.code == 'k')) { picker_.move_up(); return; }
  if ((k.special && k.code == KEY_DOWN) || (!k.special && k.code == 'j')) { picker_.move_down(); return; }
}

void Editor::handle_picker_save_key(const Key& k) {
  if (is_esc(k)) { menu_ = MenuState::Inactive; picker_.close(); return; }
  if (is_enter(k)) { confirm_picker_save(); return; }
  if (is_backspace(k)) { picker_.delete_previous(); return; }
  if (k.special) {
    switch (k.code) {
      case KEY_DC: picker_.delete_current(); break;
      case KEY_LEFT: picker_.cursor_left(); break;
      case KEY_RIGHT: picker_.cursor_right(); break;
      case KEY_HOME: picker_.cursor_home(); break;
      case KEY_END: picker_.cursor_end(); break;
      default: break;
    }
    return;
  }
  if (k.code >= 32 && k.code != BACKSPACE_ASCII) picker_.insert_char(static_cast<char32_t>(k.code));
}

void Editor::move_left() {
  if (cur_.col > 0) { cur_.col--; return; }
  if (cur_.row > 0) {
    cur_.row--;
    cur_.col = buf_.line_len(cur_.row);
  }
}

void Editor::move_right() {
  if (cur_.col < buf_.line_len(cur_.row)) { cur_.col++; return; }
  if (cur_.row + 1 < buf_.line_count()) {
    cur_.row++;
    cur_.col = 0;
  }
}

void Editor::move_up() {
  if (cur_.row == 0) return;
  cur_.row--;
  cur_.col = std::min(cur_.col, buf_.line_len(cur_.row));
}

void Editor::move_down() {
  if (cur_.row + 1 >= buf_.line_count()) return;
  cur_.row++;
  cur_.col = std::min(cur_.col, buf_.line_len(cur_.row));
}

void Editor::move_to_top() { cur_ = Cursor{0, 0}; }
void Editor::move_to_bottom() { cur_ = Cursor{buf_.line_count() - 1, 0}; }
void Editor::move_to_line_start() { cur_.col = 0; }
void Editor::move_to_line_end() { cur_.col = buf_.line_len(cur_.row); }

void Editor::enter_insert() {
  if (buf_.len_chars() == 0) {
    buf_.insert_char(0, U'\n');
    hl_.invalidate_from(buf_, 0);
    modified_ = true;
  }
  mode_ = Mode::Insert;
}

void Editor::enter_select() {
  anchor_ = cur_;
  mode_ = Mode::Select;
}

void Editor::select_line() {
  if (mode_ != Mode::Select) {
    anchor_ = Cursor{cur_.row, 0};
    mode_ = Mode::Select;
  }
  if (cur_.row + 1 < buf_.line_count()) cur_ = Cursor{cur_.row + 1, 0};
  else cur_.col = buf_.line_len(cur_.row);
}

void Editor::exit_select() {
  mode_ = Mode::Normal;
  anchor_ = cur_;
}

void Editor::insert_char(char32_t c) {
  size_t idx = buf_.char_idx_from_position(cur_);
  buf_.insert_char(idx, c);
  hl_.invalidate_line(buf_, cur_.row);
  cur_.col++;
  modified_ = true;
}

void Editor::insert_newline() {
  size_t idx = buf_.char_idx_from_position(cur_);
  buf_.insert_char(idx, U'\n');
  hl_.invalidate_from(buf_, cur_.row);
  cur_ = Cursor{cur_.row + 1, 0};
  modified_ = true;
}

void Editor::backspace() {
  size_t idx = buf_.char_idx_from_position(cur_);
  if (idx == 0) return;
  bool joins = cur_.col == 0;
  buf_.remove(idx - 1, idx);
  cur_ = buf_.position_from_char_idx(idx - 1);
  if (joins) hl_.invalidate_from(buf_, cur_.row);
  else hl_.invalidate_line(buf_, cur_.row);
  modified_ = true;
}

void Editor::delete_forward() {
  size_t idx = buf_.char_idx_from_position(cur_);
  if (idx >= buf_.len_chars()) return;
  bool joins = cur_.col >= buf_.line_len(cur_.row);
  buf_.remove(idx, idx + 1);
  if (joins) hl_.invalidate_from(buf_, cur_.row);
  else hl_.invalidate_line(buf_, cur_.row);
  modified_ = true;
}

void Editor::copy_selection() {
  auto range = selection_range();
  if (!range || range->first == range->second) {
    report(ErrKind::NoSelection, "nothing selected");
    return;
  }
  std::string msg;
  if (clipboard_.set(buf_.slice(range->first, range->second), msg)) message_ = msg;
  else report(ErrKind::Io, msg);
  exit_select();
}

void Editor::delete_selection() {
  auto range = selection_range();
  if (!range || range->first == range->second) {
    report(ErrKind::NoSelection, "nothing selected");
    return;
  }
  Cursor start = buf_.position_from_char_idx(range->first);
  buf_.remove(range->first, range->second);
  hl_.invalidate_from(buf_, start.row);
  cur_ = start;
  modified_ = true;
  exit_select();
}

void Editor::paste_clipboard() {
  std::string text, msg;
  if (!clipboard_.get(text, msg)) { report(ErrKind::Io, msg); return; }
  if (text.empty()) { message_ = "clipboard empty"; return; }
  size_t idx = buf_.char_idx_from_position(cur_);
  int row = cur_.row;
  size_t before = buf_.len_chars();
  buf_.insert_str(idx, text);
  hl_.invalidate_from(buf_, row);
  cur_ = buf_.position_from_char_idx(idx + (buf_.len_chars() - before));
  modified_ = true;
}
