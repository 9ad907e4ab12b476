#include "editor.hpp"
#include <plog/Log.h>
#include <vector>

void Editor::run_menu_action(MenuAction action) {
  switch (action) {
    case MenuAction::GotoTop: move_to_top(); break;
    case MenuAction::GotoBottom: move_to_bottom(); break;
    case MenuAction::GotoLineStart: move_to_line_start(); break;
    case MenuAction::GotoLineEnd: move_to_line_end(); break;
    case MenuAction::OpenFilePicker: open_file_picker(); break;
    case MenuAction::SaveAs:
      picker_.open_input(file_path_ ? file_path_->string() : std::string());
      menu_ = MenuState::FilePickerSave;
      break;
    case MenuAction::Save: save(); break;
    case MenuAction::AskPrimary: submit_ai(cfg_.model); break;
    case MenuAction::AskAlternate: submit_ai(cfg_.model_alt); break;
  }
}

bool Editor::open(const std::filesystem::path& path) {
  std::string msg;
  if (!files_.exists(path)) {
    buf_.set_text("");
    message_ = "new file: " + path.string();
  } else {
    std::vector<std::string> lines;
    if (!files_.read_lines(path, lines, msg)) {
      report(ErrKind::Io, msg);
      return false;
    }
    buf_.init_from_lines(lines);
    message_ = msg;
  }
  file_path_ = path;
  modified_ = false;
  mode_ = Mode::Normal;
  cur_ = Cursor{0, 0};
  anchor_ = cur_;
  hl_.set_document(file_path_);
  PLOGI << "opened " << path.string() << " (" << buf_.line_count() << " lines)";
  return true;
}

void Editor::save() {
  if (!file_path_) {
    report(ErrKind::Io, "no file path, use Space a to save as");
    return;
  }
  save_to(*file_path_);
}

bool Editor::save_to(const std::filesystem::path& path) {
  std::string msg;
  if (!files_.write(path, buf_.to_string(), msg)) {
    report(ErrKind::Io, msg);
    return false;
  }
  modified_ = false;
  message_ = msg;
  PLOGI << "saved " << path.string();
  return true;
}

bool Editor::refresh_picker(const std::filesystem::path& dir) {
  std::vector<std::string> files, dirs;
  std::string msg;
  if (!files_.list(dir, files, dirs, msg)) {
    report(ErrKind::Io, msg);
    return false;
  }
  std::vector<std::string> entries;
  if (dir.has_parent_path() && dir.parent_path() != dir) entries.push_back("../");
  for (const auto& d : dirs) entries.push_back(d + "/");
  for (const auto& f : files) entries.push_back(f);
  picker_dir_ = dir;
  picker_.open_list(std::move(entries));
  return true;
}

void Editor::open_file_picker() {
  if (refresh_picker(picker_dir_)) menu_ = MenuState::FilePickerLoad;
}

void Editor::confirm_picker_load() {
  std::optional<std::string> sel = picker_.selected();
  if (!sel) {
    menu_ = MenuState::Inactive;
    picker_.close();
    return;
  }
  if (!sel->empty() && sel->back() == '/') {
    std::string name = sel->substr(0, sel->size() - 1);
    std::filesystem::path next = (name == "..") ? picker_dir_.parent_path() : picker_dir_ / name;
    refresh_picker(next);
    return;
  }
  std::filesystem::path target = picker_dir_ / *sel;
  std::error_code ec;
  std::filesystem::path shown = std::filesystem::proximate(target, ec);
  if (!ec) target = shown;
  menu_ = MenuState::Inactive;
  picker_.close();
  open(target);
}

void Editor::confirm_picker_save() {
  std::string name = picker_.input();
  if (name.find_first_not_of(" \t") == std::string::npos) {
    report(ErrKind::Io, "file name is empty");
    return;
  }
  std::filesystem::path path(name);
  menu_ = MenuState::Inactive;
  picker_.close();
  if (save_to(path)) {
    bool retarget = !file_path_ || file_path_->extension() != path.extension();
    file_path_ = path;
    if (retarget) hl_.set_document(file_path_);
  }
}

void Editor::submit_ai(const std::string& model) {
  auto range = selection_range();
  std::string content = range ? buf_.slice(range->first, range->second) : buf_.to_string();
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  if (!coordinator_.submit(content, model, kind, msg)) {
    report(kind, msg);
    return;
  }
  message_ = msg;
  PLOGI << "sending " << content.size() << " bytes to " << model;
  if (mode_ == Mode::Select) exit_select();
}
