#include "editor.hpp"
#include "fakes.hpp"
#include "headless_terminal.hpp"
#include <ncurses.h>
#include <cassert>

static Key special(int code) { return Key{code, true}; }
static Key ch(int code) { return Key{code, false}; }

struct Fixture {
  HeadlessTerminal term{24, 80};
  MemoryFileStore files;
  FakeClipboard clipboard;
  EchoBackend backend;
  Editor ed{term, files, clipboard, backend, Config{}};
};

static void test_right_wraps_to_next_line() {
  Fixture f;
  f.ed.set_text("ab\ncd");
  f.ed.set_cursor(Cursor{0, 2});
  f.ed.handle_key(special(KEY_RIGHT));
  assert(f.ed.cursor() == (Cursor{1, 0}));
  f.ed.handle_key(ch('l'));
  assert(f.ed.cursor() == (Cursor{1, 1}));
  f.ed.handle_key(ch('l'));
  f.ed.handle_key(ch('l'));
  assert(f.ed.cursor() == (Cursor{1, 2}));
}

static void test_left_wraps_to_previous_line_end() {
  Fixture f;
  f.ed.set_text("abc\nd");
  f.ed.set_cursor(Cursor{1, 0});
  f.ed.handle_key(ch('h'));
  assert(f.ed.cursor() == (Cursor{0, 3}));
  f.ed.set_cursor(Cursor{0, 0});
  f.ed.handle_key(special(KEY_LEFT));
  assert(f.ed.cursor() == (Cursor{0, 0}));
}

static void test_vertical_motion_clamps_column() {
  Fixture f;
  f.ed.set_text("abcdef\nab\nabcd");
  f.ed.set_cursor(Cursor{0, 5});
  f.ed.handle_key(ch('j'));
  assert(f.ed.cursor() == (Cursor{1, 2}));
  f.ed.handle_key(special(KEY_DOWN));
  assert(f.ed.cursor() == (Cursor{2, 2}));
  f.ed.handle_key(ch('j'));
  assert(f.ed.cursor() == (Cursor{2, 2}));
  f.ed.handle_key(ch('k'));
  f.ed.handle_key(ch('k'));
  f.ed.handle_key(special(KEY_UP));
  assert(f.ed.cursor() == (Cursor{0, 2}));
}

static void test_line_terminator_not_counted() {
  Fixture f;
  f.ed.set_text("xy\n");
  f.ed.handle_key(special(KEY_END));
  assert(f.ed.cursor() == (Cursor{0, 2}));
  f.ed.handle_key(ch('l'));
  assert(f.ed.cursor() == (Cursor{1, 0}));
  f.ed.handle_key(ch('l'));
  assert(f.ed.cursor() == (Cursor{1, 0}));
}

static void test_goto_menu() {
  Fixture f;
  f.ed.set_text("one\ntwo\nthree");
  f.ed.set_cursor(Cursor{1, 1});
  f.ed.handle_key(ch('g'));
  assert(f.ed.menu() == MenuState::GoTo);
  f.ed.handle_key(ch('e'));
  assert(f.ed.menu() == MenuState::Inactive);
  assert(f.ed.cursor() == (Cursor{2, 0}));
  f.ed.handle_key(ch('g'));
  f.ed.handle_key(ch('l'));
  assert(f.ed.cursor() == (Cursor{2, 5}));
  f.ed.handle_key(ch('g'));
  f.ed.handle_key(ch('h'));
  assert(f.ed.cursor() == (Cursor{2, 0}));
  f.ed.handle_key(ch('g'));
  f.ed.handle_key(ch('g'));
  assert(f.ed.cursor() == (Cursor{0, 0}));
}

static void test_unknown_menu_key_is_absorbed() {
  Fixture f;
  f.ed.set_text("abc");
  f.ed.set_cursor(Cursor{0, 1});
  f.ed.handle_key(ch('g'));
  f.ed.handle_key(ch('j'));
  assert(f.ed.menu() == MenuState::Inactive);
  assert(f.ed.cursor() == (Cursor{0, 1}));
  assert(f.ed.mode() == Mode::Normal);
}

static void test_insert_mode_letters_do_not_move() {
  Fixture f;
  f.ed.set_text("ab");
  f.ed.set_cursor(Cursor{0, 1});
  f.ed.handle_key(ch('i'));
  f.ed.handle_key(ch('h'));
  f.ed.handle_key(ch('j'));
  assert(f.ed.buffer().to_string() == std::string("ahjb"));
  assert(f.ed.cursor() == (Cursor{0, 3}));
  f.ed.handle_key(special(KEY_LEFT));
  assert(f.ed.cursor() == (Cursor{0, 2}));
}

int main() {
  test_right_wraps_to_next_line();
  test_left_wraps_to_previous_line_end();
  test_vertical_motion_clamps_column();
  test_line_terminator_not_counted();
  test_goto_menu();
  test_unknown_menu_key_is_absorbed();
  test_insert_mode_letters_do_not_move();
  return 0;
}
