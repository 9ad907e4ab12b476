#include "terminal.hpp"
#include <locale.h>
#include <ncurses.h>
#include <stdexcept>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  if (initscr() == nullptr) throw std::runtime_error("can not initialize terminal");
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
}
