#include "request_coordinator.hpp"
#include <plog/Log.h>
#include <exception>

static const char* kEmptyBuffer = "Cannot send empty buffer. Please write the question";

RequestCoordinator::RequestCoordinator(IAiBackend& backend, std::string response_header)
  : backend_(backend), response_header_(std::move(response_header)), shared_(std::make_shared<Shared>()) {}

RequestCoordinator::~RequestCoordinator() {
  if (busy()) backend_.cancel();
}

bool RequestCoordinator::submit(const std::string& content, const std::string& model, ErrKind& kind, std::string& msg) {
  std::shared_ptr<Shared> shared = shared_;
  {
    std::lock_guard<std::mutex> lk(shared->mu);
    if (shared->state.status == RequestStatus::Processing) {
      kind = ErrKind::Busy;
      msg = "request already in progress";
      return false;
    }
    if (content.empty()) {
      shared->state = RequestState{RequestStatus::Error, kEmptyBuffer};
      kind = ErrKind::EmptyInput;
      msg = kEmptyBuffer;
      return false;
    }
    shared->state = RequestState{RequestStatus::Processing, ""};
    shared->response.reset();
  }

  IAiBackend* backend = &backend_;
  std::string header = response_header_;
  bool queued = runner_.post([shared, backend, header, content, model]{
    std::string reply;
    std::string err;
    bool ok = false;
    try {
      ok = backend->send(content, model, reply, err);
    } catch (const std::exception& e) {
      PLOGE << "backend threw: " << e.what();
      err = e.what();
    }
    std::lock_guard<std::mutex> lk(shared->mu);
    if (ok) {
      shared->state = RequestState{RequestStatus::Idle, ""};
      shared->response = PendingResponse{header + reply, std::nullopt};
    } else {
      shared->state = RequestState{RequestStatus::Error, err};
      shared->response = PendingResponse{"", err};
    }
  });
  if (!queued) {
    std::lock_guard<std::mutex> lk(shared->mu);
    shared->state = RequestState{RequestStatus::Error, "request worker stopped"};
    kind = ErrKind::Backend;
    msg = "request worker stopped";
    return false;
  }
  needs_check_ = true;
  msg = "sent to " + model;
  return true;
}

std::optional<PendingResponse> RequestCoordinator::take_response() {
  std::lock_guard<std::mutex> lk(shared_->mu);
  std::optional<PendingResponse> out = std::move(shared_->response);
  shared_->response.reset();
  return out;
}

PollResult RequestCoordinator::poll(TextBuffer& buf, SyntaxHighlighter& hl, Cursor& cur) {
  if (!needs_check_) return PollResult::Nothing;
  std::optional<PendingResponse> resp = take_response();
  if (!resp) return PollResult::Nothing;
  needs_check_ = false;
  if (resp->error) return PollResult::Failed;
  if (resp->content.empty()) return PollResult::Nothing;
  int first = buf.line_count() - 1;
  buf.insert_str(buf.len_chars(), resp->content);
  hl.invalidate_from(buf, first);
  cur = buf.end_position();
  return PollResult::Appended;
}

RequestState RequestCoordinator::state() const {
  std::lock_guard<std::mutex> lk(shared_->mu);
  return shared_->state;
}

bool RequestCoordinator::busy() const {
  return state().status == RequestStatus::Processing;
}

bool RequestCoordinator::has_response() const {
  std::lock_guard<std::mutex> lk(shared_->mu);
  return shared_->response.has_value();
}

std::string request_status_text(const RequestState& st) {
  switch (st.status) {
    case RequestStatus::Idle: return "Request Status: Idle";
    case RequestStatus::Processing: return "Request Status: In Progress";
    case RequestStatus::Error: return "Request Status: Error: " + st.error;
  }
  return "Request Status: Idle";
}
