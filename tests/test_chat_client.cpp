#include "chat_client.hpp"
#include <cassert>
#include <string>

static void test_request_body() {
  nlohmann::json body = ChatClient::build_request("llama3.2", "be brief", "what is a rope?");
  assert(body["model"] == "llama3.2");
  assert(body["stream"] == false);
  assert(body["messages"].size() == 2);
  assert(body["messages"][0]["role"] == "system");
  assert(body["messages"][1]["role"] == "user");
  assert(body["messages"][1]["content"] == "what is a rope?");

  nlohmann::json bare = ChatClient::build_request("m", "", "hi");
  assert(bare["messages"].size() == 1);
}

static void test_reply_shapes() {
  std::string reply, err;
  assert(ChatClient::parse_reply(R"({"choices":[{"message":{"role":"assistant","content":"A tree."}}]})", reply, err));
  assert(reply == "A tree.");

  assert(ChatClient::parse_reply(R"({"model":"llama3.2","message":{"role":"assistant","content":"native"}})", reply, err));
  assert(reply == "native");

  assert(!ChatClient::parse_reply(R"({"error":{"message":"model not found"}})", reply, err));
  assert(err == "model not found");
  assert(!ChatClient::parse_reply(R"({"error":"overloaded"})", reply, err));
  assert(err == "overloaded");
  assert(!ChatClient::parse_reply("<html>502</html>", reply, err));
  assert(err == "backend returned invalid JSON");
  assert(!ChatClient::parse_reply(R"({"choices":[]})", reply, err));
  assert(!ChatClient::parse_reply(R"({"choices":[{"message":{"content":null}}]})", reply, err));
}

static void test_unreachable_endpoint() {
  ChatClient client("http://127.0.0.1:9", "", "", 2);
  std::string reply, err;
  assert(!client.send("hello", "m", reply, err));
  assert(!err.empty());

  /* malformed UTF-8 in the buffer is replaced, not thrown */
  err.clear();
  assert(!client.send("caf\xe9 question", "m", reply, err));
  assert(!err.empty());
  std::string body = ChatClient::build_request("m", "", "caf\xe9")
                         .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  assert(body.find("caf\xef\xbf\xbd") != std::string::npos);
}

int main() {
  test_request_body();
  test_reply_shapes();
  test_unreachable_endpoint();
  return 0;
}
