#pragma once
/*
 * ChatClient
 *
 * Purpose: IAiBackend over an OpenAI-compatible /chat/completions endpoint
 *          (OpenAI, Ollama's /v1, llama.cpp server). libcurl transport,
 *          nlohmann::json bodies.
 */
#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ai_backend.hpp"

class ChatClient : public IAiBackend {
public:
  struct Response {
    long http_code = 0;
    std::string body;
    std::string curl_error;
  };

  ChatClient(std::string base_url, std::string api_key, std::string system_prompt, long timeout_s);
  bool send(const std::string& content, const std::string& model, std::string& reply, std::string& err) override;
  void cancel() override { cancelled_ = true; }

  Response post_json(const std::string& path, const std::string& body) const;
  static nlohmann::json build_request(const std::string& model, const std::string& system_prompt, const std::string& content);
  /* extracts the assistant text; false with err set for error payloads */
  static bool parse_reply(const std::string& body, std::string& reply, std::string& err);

private:
  std::string build_url(const std::string& path) const;
  std::string base_url_;
  std::string api_key_;
  std::string system_prompt_;
  long timeout_s_;
  std::atomic<bool> cancelled_{false};
};
