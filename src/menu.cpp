#include "menu.hpp"
#include <algorithm>
#include "utf8.hpp"

MenuState menu_for_trigger(int key) {
  switch (key) {
    case 'g': return MenuState::GoTo;
    case ' ': return MenuState::File;
    case '"': return MenuState::AI;
    default: return MenuState::Inactive;
  }
}

const std::vector<MenuEntry>& menu_entries(MenuState menu) {
  static const std::vector<MenuEntry> none;
  static const std::vector<MenuEntry> go_to = {
    {'g', MenuAction::GotoTop, "top of file"},
    {'e', MenuAction::GotoBottom, "end of file"},
    {'h', MenuAction::GotoLineStart, "line start"},
    {'l', MenuAction::GotoLineEnd, "line end"},
  };
  static const std::vector<MenuEntry> file = {
    {'o', MenuAction::OpenFilePicker, "open file"},
    {'a', MenuAction::SaveAs, "save as"},
    {'w', MenuAction::Save, "save"},
  };
  static const std::vector<MenuEntry> ai = {
    {'l', MenuAction::AskPrimary, "ask primary model"},
    {'a', MenuAction::AskAlternate, "ask alternate model"},
  };
  switch (menu) {
    case MenuState::GoTo: return go_to;
    case MenuState::File: return file;
    case MenuState::AI: return ai;
    default: return none;
  }
}

const char* menu_title(MenuState menu) {
  switch (menu) {
    case MenuState::GoTo: return "Go to";
    case MenuState::File: return "File";
    case MenuState::AI: return "AI";
    case MenuState::FilePickerLoad: return "Pick a file";
    case MenuState::FilePickerSave: return "Save As";
    default: return "";
  }
}

std::optional<MenuAction> menu_lookup(MenuState menu, int key) {
  for (const auto& e : menu_entries(menu)) {
    if (e.key == key) return e.action;
  }
  return std::nullopt;
}

bool is_picker(MenuState menu) {
  return menu == MenuState::FilePickerLoad || menu == MenuState::FilePickerSave;
}

void FilePicker::open_list(std::vector<std::string> entries) {
  entries_ = std::move(entries);
  index_ = 0;
}

void FilePicker::open_input(const std::string& initial) {
  input_ = utf8::decode(initial);
  cursor_ = static_cast<int>(input_.size());
}

void FilePicker::close() {
  entries_.clear();
  index_ = 0;
  input_.clear();
  cursor_ = 0;
}

void FilePicker::move_up() {
  if (index_ > 0) index_--;
}

void FilePicker::move_down() {
  if (index_ + 1 < static_cast<int>(entries_.size())) index_++;
}

std::optional<std::string> FilePicker::selected() const {
  if (index_ < 0 || index_ >= static_cast<int>(entries_.size())) return std::nullopt;
  return entries_[static_cast<size_t>(index_)];
}

void FilePicker::insert_char(char32_t c) {
  input_.insert(input_.begin() + cursor_, c);
  cursor_++;
}

void FilePicker::delete_previous() {
  if (cursor_ == 0) return;
  input_.erase(input_.begin() + (cursor_ - 1));
  cursor_--;
}

void FilePicker::delete_current() {
  if (cursor_ >= static_cast<int>(input_.size())) return;
  input_.erase(input_.begin() + cursor_);
}

void FilePicker::cursor_left() {
  if (cursor_ > 0) cursor_--;
}

void FilePicker::cursor_right() {
  cursor_ = std::min(cursor_ + 1, static_cast<int>(input_.size()));
}

std::string FilePicker::input() const { return utf8::encode(input_); }
