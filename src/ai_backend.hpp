#pragma once
/*
 * IAiBackend
 *
 * Purpose: one blocking, fallible chat call. Runs only on the request worker.
 */
#include <string>

class IAiBackend {
public:
  virtual ~IAiBackend() = default;
  virtual bool send(const std::string& content, const std::string& model, std::string& reply, std::string& err) = 0;
  /* asks an in-flight send() to give up; called from the UI thread on shutdown */
  virtual void cancel() {}
};
