#include "chat_client.hpp"
#include <curl/curl.h>
#include <mutex>

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t realsize = size * nmemb;
  std::string* mem = reinterpret_cast<std::string*>(userp);
  if (mem) mem->append(reinterpret_cast<char*>(contents), realsize);
  return realsize;
}

static int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const std::atomic<bool>* cancelled = static_cast<const std::atomic<bool>*>(userp);
  return (cancelled && cancelled->load()) ? 1 : 0;
}

ChatClient::ChatClient(std::string base_url, std::string api_key, std::string system_prompt, long timeout_s)
  : base_url_(std::move(base_url)), api_key_(std::move(api_key)),
    system_prompt_(std::move(system_prompt)), timeout_s_(timeout_s) {
  static std::once_flag curl_once;
  std::call_once(curl_once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string ChatClient::build_url(const std::string& path) const {
  if (path.empty()) return base_url_;
  if (path.front() == '/') return base_url_ + path;
  return base_url_ + "/" + path;
}

ChatClient::Response ChatClient::post_json(const std::string& path, const std::string& body) const {
  Response resp;
  CURL* curl = curl_easy_init();
  if (!curl) { resp.curl_error = "curl_easy_init failed"; return resp; }

  std::string url = build_url(path);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(&cancelled_));

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Accept: application/json");
  if (!api_key_.empty()) {
    std::string auth = std::string("Authorization: Bearer ") + api_key_;
    headers = curl_slist_append(headers, auth.c_str());
  }
  if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) resp.curl_error = curl_easy_strerror(res);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.http_code);

  if (headers) curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return resp;
}

nlohmann::json ChatClient::build_request(const std::string& model, const std::string& system_prompt, const std::string& content) {
  nlohmann::json body;
  body["model"] = model;
  body["stream"] = false;
  body["messages"] = nlohmann::json::array();
  if (!system_prompt.empty()) body["messages"].push_back({{"role", "system"}, {"content", system_prompt}});
  body["messages"].push_back({{"role", "user"}, {"content", content}});
  return body;
}

bool ChatClient::parse_reply(const std::string& body, std::string& reply, std::string& err) {
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) { err = "backend returned invalid JSON"; return false; }
  if (j.contains("error")) {
    const auto& e = j["error"];
    if (e.is_object() && e.contains("message") && e["message"].is_string()) err = e["message"].get<std::string>();
    else if (e.is_string()) err = e.get<std::string>();
    else err = e.dump();
    return false;
  }
  if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty() && j["choices"][0].is_object()) {
    const auto& choice = j["choices"][0];
    if (choice.contains("message") && choice["message"].is_object()) {
      const auto& msg = choice["message"];
      if (msg.contains("content") && msg["content"].is_string()) {
        reply = msg["content"].get<std::string>();
        return true;
      }
    }
  }
  /* Ollama native /api/chat shape */
  if (j.contains("message") && j["message"].is_object() && j["message"].contains("content") && j["message"]["content"].is_string()) {
    reply = j["message"]["content"].get<std::string>();
    return true;
  }
  err = "backend reply has no message content";
  return false;
}

bool ChatClient::send(const std::string& content, const std::string& model, std::string& reply, std::string& err) {
  std::string payload = build_request(model, system_prompt_, content)
                            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  Response resp = post_json("/chat/completions", payload);
  if (!resp.curl_error.empty()) { err = resp.curl_error; return false; }
  std::string perr;
  if (!parse_reply(resp.body, reply, perr)) {
    err = resp.http_code >= 400 ? "HTTP " + std::to_string(resp.http_code) + ": " + perr : perr;
    return false;
  }
  if (resp.http_code >= 400) { err = "HTTP " + std::to_string(resp.http_code); return false; }
  return true;
}
