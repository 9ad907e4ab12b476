#include "request_coordinator.hpp"
#include "fakes.hpp"
#include <cassert>
#include <string>

struct Doc {
  LanguageRegistry registry = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl{registry, CaptureStyleMap::with_defaults()};
  TextBuffer buf;
  Cursor cur{};
};

static void test_empty_content_fails_fast() {
  EchoBackend backend;
  RequestCoordinator rc(backend);
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(!rc.submit("", "m", kind, msg));
  assert(kind == ErrKind::EmptyInput);
  assert(msg == std::string("Cannot send empty buffer. Please write the question"));
  RequestState st = rc.state();
  assert(st.status == RequestStatus::Error);
  assert(st.error == msg);
  assert(!rc.needs_check());
  assert(backend.call_count() == 0);
  assert(request_status_text(st) == std::string("Request Status: Error: Cannot send empty buffer. Please write the question"));
}

static void test_reply_lands_at_document_end_when_polled() {
  GatedBackend backend;
  RequestCoordinator rc(backend, "");
  Doc d;
  d.buf.set_text("Q?");
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit(d.buf.to_string(), "m", kind, msg));
  assert(rc.state().status == RequestStatus::Processing);
  assert(request_status_text(rc.state()) == std::string("Request Status: In Progress"));
  backend.wait_entered();

  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Nothing);
  assert(rc.needs_check());

  d.buf.insert_str(d.buf.len_chars(), "Y");
  d.hl.invalidate_line(d.buf, 0);
  backend.release();
  assert(wait_until([&]{ return rc.has_response(); }));
  assert(rc.state().status == RequestStatus::Idle);

  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Appended);
  assert(d.buf.to_string() == std::string("Q?YX"));
  assert(d.cur == d.buf.end_position());
  assert(!rc.needs_check());
  assert(!rc.has_response());
  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Nothing);
}

static void test_second_submit_is_rejected_while_processing() {
  GatedBackend backend;
  RequestCoordinator rc(backend);
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit("first", "m", kind, msg));
  assert(!rc.submit("second", "m", kind, msg));
  assert(kind == ErrKind::Busy);
  assert(rc.state().status == RequestStatus::Processing);
  assert(rc.busy());

  kind = ErrKind::Backend;
  assert(!rc.submit("", "m", kind, msg));
  assert(kind == ErrKind::Busy);
  assert(rc.state().status == RequestStatus::Processing);
  backend.release();
  assert(wait_until([&]{ return !rc.busy(); }));
}

static void test_header_prefixes_reply() {
  EchoBackend backend;
  backend.reply = "answer";
  RequestCoordinator rc(backend);
  Doc d;
  d.buf.set_text("question");
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit("question", "llama", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  assert(backend.last_model == std::string("llama"));
  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Appended);
  assert(d.buf.to_string() == std::string("question\n\nAssistant\n answer"));
  assert(d.buf.line_count() == 4);
  assert(d.cur.row == 3 && d.cur.col == 7);
}

static void test_backend_failure_sets_error() {
  EchoBackend backend;
  backend.error = "connection refused";
  RequestCoordinator rc(backend);
  Doc d;
  d.buf.set_text("q");
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit("q", "m", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  RequestState st = rc.state();
  assert(st.status == RequestStatus::Error);
  assert(st.error == std::string("connection refused"));
  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Failed);
  assert(d.buf.to_string() == std::string("q"));
  assert(!rc.needs_check());

  backend.error.clear();
  assert(rc.submit("q", "m", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  assert(rc.state().status == RequestStatus::Idle);
}

static void test_throwing_backend_becomes_error_state() {
  ThrowingBackend backend;
  RequestCoordinator rc(backend);
  Doc d;
  d.buf.set_text("q");
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit("caf\xe9 question", "m", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  RequestState st = rc.state();
  assert(st.status == RequestStatus::Error);
  assert(st.error == backend.what);
  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Failed);
  assert(d.buf.to_string() == std::string("q"));

  /* the worker thread survived and runs the next request */
  assert(rc.submit("again", "m", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  assert(rc.state().status == RequestStatus::Error);
  assert(!rc.busy());
}

static void test_appended_lines_are_rehighlighted() {
  EchoBackend backend;
  backend.reply = "int x;";
  RequestCoordinator rc(backend, "");
  Doc d;
  d.hl.set_document(std::filesystem::path("a.cpp"));
  d.buf.set_text("int y;\n");
  assert(d.hl.get_style(d.buf, 0, 0) == Style::Type);
  ErrKind kind = ErrKind::Backend;
  std::string msg;
  assert(rc.submit("int y;", "m", kind, msg));
  assert(wait_until([&]{ return rc.has_response(); }));
  assert(rc.poll(d.buf, d.hl, d.cur) == PollResult::Appended);
  assert(d.buf.line(1) == std::string("int x;"));
  size_t parses = d.hl.parse_count();
  assert(d.hl.get_style(d.buf, 0, 0) == Style::Type);
  assert(d.hl.parse_count() == parses);
  assert(d.hl.get_style(d.buf, 1, 0) == Style::Type);
  assert(d.hl.parse_count() == parses + 1);
}

static void test_shutdown_with_request_in_flight() {
  GatedBackend backend;
  {
    RequestCoordinator rc(backend);
    ErrKind kind = ErrKind::Backend;
    std::string msg;
    assert(rc.submit("slow", "m", kind, msg));
    backend.wait_entered();
  }
}

int main() {
  test_empty_content_fails_fast();
  test_reply_lands_at_document_end_when_polled();
  test_second_submit_is_rejected_while_processing();
  test_header_prefixes_reply();
  test_backend_failure_sets_error();
  test_throwing_backend_becomes_error_state();
  test_appended_lines_are_rehighlighted();
  test_shutdown_with_request_in_flight();
  return 0;
}
