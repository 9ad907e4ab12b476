#pragma once
/*
 * Menu
 *
 * Purpose: the sub-menu dispatch table (GoTo / File / AI) shared by Normal and
 *          Select mode, and the FilePicker used by the Load and Save-As popups.
 * Rule: a sub-menu consumes exactly one key; unknown keys are absorbed.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class MenuAction {
  GotoTop,
  GotoBottom,
  GotoLineStart,
  GotoLineEnd,
  OpenFilePicker,
  SaveAs,
  Save,
  AskPrimary,
  AskAlternate,
};

struct MenuEntry {
  int key;
  MenuAction action;
  const char* label;
};

/* key that opens a sub-menu from Normal/Select, or Inactive */
MenuState menu_for_trigger(int key);
const std::vector<MenuEntry>& menu_entries(MenuState menu);
const char* menu_title(MenuState menu);
std::optional<MenuAction> menu_lookup(MenuState menu, int key);
bool is_picker(MenuState menu);

class FilePicker {
public:
  void open_list(std::vector<std::string> entries);
  void open_input(const std::string& initial);
  void close();

  /* list navigation, clamped to [0, size) */
  void move_up();
  void move_down();
  int index() const { return index_; }
  const std::vector<std::string>& entries() const { return entries_; }
  std::optional<std::string> selected() const;

  /* single-line input */
  void insert_char(char32_t c);
  void delete_previous();
  void delete_current();
  void cursor_left();
  void cursor_right();
  void cursor_home() { cursor_ = 0; }
  void cursor_end() { cursor_ = static_cast<int>(input_.size()); }
  int cursor() const { return cursor_; }
  std::string input() const;

private:
  std::vector<std::string> entries_;
  int index_ = 0;
  std::u32string input_;
  int cursor_ = 0;
};
