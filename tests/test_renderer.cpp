#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

struct Scene {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl{reg, CaptureStyleMap::with_defaults()};
  TextBuffer buf;
  Renderer r;
  RenderView view;

  explicit Scene(const std::string& text) {
    buf.set_text(text);
    view.buf = &buf;
  }
  void render(HeadlessTerminal& term) { r.render(term, view, hl); }
};

static bool screen_contains(const HeadlessTerminal& t, int rows, const std::string& s) {
  for (int i = 0; i < rows; ++i) {
    if (t.row_text(i).find(s) != std::string::npos) return true;
  }
  return false;
}

static void test_layout_and_status() {
  HeadlessTerminal term(10, 40);
  Scene s("hello\nworld");
  s.render(term);
  assert(term.row_text(0) == "1 hello");
  assert(term.row_text(1) == "2 world");
  assert(term.cell(0, 0).fg == Color::DarkGrey);
  assert(term.row_text(8).rfind("[No Name] - NORMAL", 0) == 0);
  assert(term.cell(8, 36).ch == U'1' && term.cell(8, 38).ch == U'1');
  assert(term.cell(8, 0).bg == Color::Grey);
  assert(term.row_text(9) == "Request Status: Idle");
  assert(term.cursor_row() == 0 && term.cursor_col() == 2);
  assert(s.r.text_height() == 8);

  s.view.file_name = "notes.md";
  s.view.modified = true;
  s.view.mode = Mode::Insert;
  s.view.message = "saved";
  assert(Renderer::status_text(s.view) == "notes.md [+] - INSERT  saved");
  s.view.menu = MenuState::AI;
  assert(Renderer::status_text(s.view) == "notes.md [+] - WAITING FOR COMMAND  saved");
}

static void test_only_changed_cells_are_written() {
  HeadlessTerminal term(10, 40);
  Scene s("hello\nworld");
  s.render(term);
  assert(s.r.last_runs() > 0);

  term.clear_writes();
  s.render(term);
  assert(s.r.last_runs() == 0);
  assert(term.writes().empty());

  s.buf.insert_char(5, U'!');
  s.hl.invalidate_line(s.buf, 0);
  s.render(term);
  assert(s.r.last_runs() == 1);
  assert(term.writes().size() == 1);
  assert(term.writes()[0].row == 0 && term.writes()[0].col == 7 && term.writes()[0].text == "!");

  term.clear_writes();
  s.view.cur = Cursor{0, 1};
  s.render(term);
  assert(s.r.last_runs() == 1);
  assert(term.writes()[0].row == 8 && term.writes()[0].text == "2");
  assert(term.cursor_col() == 3);
}

static void test_selection_and_syntax_colors() {
  HeadlessTerminal term(10, 40);
  Scene s("int x;\ncd");
  s.hl.set_document(std::filesystem::path("a.cpp"));
  s.view.show_line_numbers = false;
  s.render(term);
  assert(term.cell(0, 0).fg == Color::Cyan);
  assert(term.cell(0, 4).fg == Color::Default);

  s.view.selection = std::make_pair(size_t{2}, size_t{8});
  s.render(term);
  assert(term.cell(0, 1).bg == Color::Default);
  assert(term.cell(0, 2).bg == Color::Grey && term.cell(0, 2).fg == Color::Black);
  assert(term.cell(0, 5).bg == Color::Grey);
  /* the selected terminator of line 0 */
  assert(term.cell(0, 6).bg == Color::Grey);
  assert(term.cell(1, 0).bg == Color::Grey);
  assert(term.cell(1, 1).bg == Color::Default);
}

static void test_soft_wrap_and_gutter() {
  HeadlessTerminal term(10, 10);
  Scene s("abcdefghijklmnop\nxy");
  s.render(term);
  assert(s.r.wrapped().size() == 3);
  assert(term.row_text(0) == "1 abcdefgh");
  assert(term.row_text(1) == "  ijklmnop");
  assert(term.row_text(2) == "2 xy");

  s.view.show_line_numbers = false;
  s.view.cur = Cursor{0, 12};
  s.render(term);
  assert(term.row_text(0) == "abcdefghij");
  assert(term.row_text(1) == "klmnop");
  assert(term.cursor_row() == 1 && term.cursor_col() == 2);
}

static void test_tabs_expand_to_stops() {
  HeadlessTerminal term(6, 20);
  Scene s("\tx\nab\tc");
  s.view.show_line_numbers = false;
  s.render(term);
  assert(term.cell(0, 4).ch == U'x');
  assert(term.cell(1, 4).ch == U'c');
  s.view.cur = Cursor{1, 3};
  s.render(term);
  assert(term.cursor_col() == 4);

  s.view.tab_width = 8;
  s.render(term);
  assert(term.cell(1, 8).ch == U'c');

  std::vector<WrappedLine> rows = compute_wrapped_lines(TextBuffer::from_string("a\tb\tc"), 6, 4);
  assert(rows.size() == 2);
  assert(rows[0].start_col == 0 && rows[0].end_col == 3);
  assert(rows[1].start_col == 3 && rows[1].end_col == 5);
}

static void test_scroll_follows_cursor() {
  HeadlessTerminal term(6, 20);
  std::string text;
  for (int i = 0; i < 20; ++i) text += "L" + std::to_string(i) + (i < 19 ? "\n" : "");
  Scene s(text);
  s.view.show_line_numbers = false;
  s.view.cur = Cursor{10, 0};
  s.render(term);
  assert(s.r.scroll() == 7);
  assert(term.row_text(0) == "L7");
  assert(term.cursor_row() == 3);

  s.view.cur = Cursor{19, 0};
  s.render(term);
  assert(s.r.scroll() == 16);
  assert(term.row_text(3) == "L19");

  s.view.cur = Cursor{2, 0};
  s.render(term);
  assert(s.r.scroll() == 2);
  assert(term.row_text(0) == "L2");

  assert(clamp_scroll(50, 3, 10, 4) == 3);
  assert(clamp_scroll(0, 9, 10, 4) == 6);
  assert(clamp_scroll(0, 0, 2, 4) == 0);
}

static void test_resize_forces_full_redraw() {
  HeadlessTerminal term(8, 30);
  Scene s("resize me");
  s.render(term);
  term.resize(12, 50);
  term.clear_writes();
  s.render(term);
  assert(term.row_text(0) == "1 resize me");
  assert(term.row_text(11) == "Request Status: Idle");
  assert(term.cell(10, 49).bg == Color::Grey);

  term.clear_writes();
  s.r.force_redraw();
  s.render(term);
  assert(!term.writes().empty());
}

static void test_request_line_colors() {
  HeadlessTerminal term(6, 60);
  Scene s("q");
  s.view.request = RequestState{RequestStatus::Processing, ""};
  s.render(term);
  assert(term.row_text(5) == "Request Status: In Progress");
  assert(term.cell(5, 0).fg == Color::Yellow);
  s.view.request = RequestState{RequestStatus::Error, "boom"};
  s.render(term);
  assert(term.row_text(5) == "Request Status: Error: boom");
  assert(term.cell(5, 0).fg == Color::Red);
}

static void test_popups() {
  HeadlessTerminal term(24, 80);
  Scene s("text");
  s.view.menu = MenuState::GoTo;
  s.render(term);
  assert(screen_contains(term, 22, " Go to "));
  assert(screen_contains(term, 22, "g  top of file"));

  FilePicker picker;
  picker.open_list({"../", "a.txt"});
  picker.move_down();
  s.view.menu = MenuState::FilePickerLoad;
  s.view.picker = &picker;
  s.view.picker_dir = "/tmp";
  s.render(term);
  assert(!screen_contains(term, 22, "g  top of file"));
  assert(screen_contains(term, 22, "Pick a file: /tmp"));
  assert(term.cell(11, 22).ch == U'a');
  assert(term.cell(11, 22).fg == Color::Black && term.cell(11, 22).bg == Color::White);
  assert(term.cell(10, 22).bg == Color::Default);

  picker.close();
  picker.open_input("abc");
  s.view.menu = MenuState::FilePickerSave;
  s.render(term);
  assert(screen_contains(term, 22, "Enter: Save | Esc: Cancel"));
  assert(term.cursor_row() == 10 && term.cursor_col() == 25);
}

int main() {
  test_layout_and_status();
  test_only_changed_cells_are_written();
  test_selection_and_syntax_colors();
  test_soft_wrap_and_gutter();
  test_tabs_expand_to_stops();
  test_scroll_follows_cursor();
  test_resize_forces_full_redraw();
  test_request_line_colors();
  test_popups();
  return 0;
}
