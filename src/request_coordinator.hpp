#pragma once
/*
 * RequestCoordinator
 *
 * Purpose: runs AI requests on an owned worker while the UI thread keeps going.
 * Shared state: RequestState and PendingResponse live in one block behind a
 *   mutex; the worker gets a shared_ptr to it plus copies of its inputs. The
 *   lock is never held across the backend call.
 * Policy: one request at a time; submit while Processing is rejected.
 * Ordering: replies are appended at the document end as it is when poll()
 *   consumes them, not as it was at submit time.
 */
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "ai_backend.hpp"
#include "errors.hpp"
#include "highlighter.hpp"
#include "task_runner.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

enum class RequestStatus { Idle, Processing, Error };

struct RequestState {
  RequestStatus status = RequestStatus::Idle;
  std::string error;
};

struct PendingResponse {
  std::string content;
  std::optional<std::string> error;
};

enum class PollResult { Nothing, Appended, Failed };

class RequestCoordinator {
public:
  explicit RequestCoordinator(IAiBackend& backend, std::string response_header = "\n\nAssistant\n ");
  ~RequestCoordinator();
  RequestCoordinator(const RequestCoordinator&) = delete;
  RequestCoordinator& operator=(const RequestCoordinator&) = delete;

  bool submit(const std::string& content, const std::string& model, ErrKind& kind, std::string& msg);
  PollResult poll(TextBuffer& buf, SyntaxHighlighter& hl, Cursor& cur);

  RequestState state() const;
  bool busy() const;
  bool needs_check() const { return needs_check_; }
  /* true once the worker has published a reply that poll() has not taken yet */
  bool has_response() const;
  void set_response_header(std::string header) { response_header_ = std::move(header); }
  const std::string& response_header() const { return response_header_; }

private:
  struct Shared {
    std::mutex mu;
    RequestState state;
    std::optional<PendingResponse> response;
  };

  std::optional<PendingResponse> take_response();

  IAiBackend& backend_;
  std::string response_header_;
  std::shared_ptr<Shared> shared_;
  bool needs_check_ = false;
  TaskRunner runner_;
};

std::string request_status_text(const RequestState& st);
