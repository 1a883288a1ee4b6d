#include <chattpl/chat_template.hpp>
#include <chattpl/error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace chattpl;

static const std::string tinyllama_template =
    "{% for message in messages %}\n"
    "{% if message['role'] == 'user' %}\n"
    "{{ '<|user|>\\n' + message['content'] + eos_token }}\n"
    "{% elif message['role'] == 'system' %}\n"
    "{{ '<|system|>\\n' + message['content'] + eos_token }}\n"
    "{% elif message['role'] == 'assistant' %}\n"
    "{{ '<|assistant|>\\n'  + message['content'] + eos_token }}\n"
    "{% endif %}\n"
    "{% if loop.last and add_generation_prompt %}\n"
    "{{ '<|assistant|>' }}\n"
    "{% endif %}\n"
    "{% endfor %}";

// == Context assembly ========================================================

TEST_CASE("render_context: later settings replace earlier ones",
          "[chat_template]") {
  render_context ctx;
  ctx.set_var("x", "one");
  ctx.set_var("x", "two");
  CHECK(ctx.vars().at("x") == "two");

  ctx.set_flag("x", true);
  CHECK(ctx.vars().count("x") == 0);
  CHECK(ctx.flags().at("x") == true);
}

TEST_CASE("render_context: 'messages' is reserved", "[chat_template]") {
  render_context ctx;
  CHECK_THROWS_AS(ctx.set_var("messages", "x"), context_error);
  CHECK_THROWS_AS(ctx.set_flag("messages", true), context_error);
}

TEST_CASE("default context: eos_token and generation prompt",
          "[chat_template]") {
  auto ctx = default_render_context();
  CHECK(ctx.vars().at("eos_token") == "</s>");
  CHECK(ctx.flags().at("add_generation_prompt") == true);
}

TEST_CASE("make_base_scope binds messages, variables and flags",
          "[chat_template]") {
  render_context ctx;
  ctx.set_var("bos_token", "<s>");
  ctx.set_flag("add_generation_prompt", false);

  auto base = make_base_scope({{"user", "hi"}}, ctx);
  REQUIRE(base.count("messages") == 1);
  auto& list = base.at("messages").get<value_list>();
  REQUIRE(list.size() == 1);
  CHECK(list[0] == value{value_map{{"role", "user"}, {"content", "hi"}}});
  CHECK(base.at("bos_token") == value{"<s>"});
  CHECK(base.at("add_generation_prompt") == value{false});
}

// == End to end ==============================================================

TEST_CASE("chat: simple loop over messages", "[chat_template]") {
  std::vector<chat_message> messages{
      {"system", "You are a helpful assistant."}, {"user", "Hello"}};
  CHECK(render_chat_template("{% for message in messages %}{{ message.role }}: "
                             "{{ message.content }}\n{% endfor %}",
                             messages) ==
        "system: You are a helpful assistant.\nuser: Hello\n");
}

TEST_CASE("chat: template without newlines adds none", "[chat_template]") {
  std::vector<chat_message> messages{
      {"system", "You are a helpful assistant."}, {"user", "Hello"}};
  CHECK(render_chat_template("{% for message in messages %}{{ message.role }}: "
                             "{{ message.content }}{% endfor %}",
                             messages) ==
        "system: You are a helpful assistant.user: Hello");
}

TEST_CASE("chat: sequential loops and literals", "[chat_template]") {
  std::vector<chat_message> messages{
      {"system", "You are a helpful assistant."}, {"user", "Hello"}};
  CHECK(render_chat_template(
            "prefix-\n"
            "{% for message in messages %}A: {{ message.role }}\n{% endfor %}"
            "middle-\n"
            "{% for message in messages %}B: {{ message.content }}\n"
            "{% endfor %}suffix",
            messages) == "prefix-\n"
                         "A: system\n"
                         "A: user\n"
                         "middle-\n"
                         "B: You are a helpful assistant.\n"
                         "B: Hello\n"
                         "suffix");
}

TEST_CASE("chat: empty message list", "[chat_template]") {
  CHECK(render_chat_template(
            "{% for message in messages %}{{ message.content }}{% endfor %}",
            {}) == "");
}

TEST_CASE("chat: context variables outside a loop", "[chat_template]") {
  render_context ctx;
  ctx.set_var("bos_token", "<s>");
  ctx.set_var("eos_token", "</s>");
  CHECK(render_chat_template("{{ bos_token }}PROMPT{{ eos_token }}", {}, ctx) ==
        "<s>PROMPT</s>");
}

TEST_CASE("chat: content is passed through untouched", "[chat_template]") {
  const std::string source =
      "{% for message in messages %}{{ message.content }}{% endfor %}";
  CHECK(render_chat_template(source, {{"user", "Hello <world> & \"friends\""}}) ==
        "Hello <world> & \"friends\"");
  CHECK(render_chat_template(source, {{"user", "こんにちは 🌍"}}) ==
        "こんにちは 🌍");
}

TEST_CASE("chat: role dispatch with elif", "[chat_template]") {
  CHECK(render_chat_template(
            "{% for message in messages %}{% if message.role == 'user' %}U"
            "{% elif message.role == 'system' %}S{% else %}O{% endif %}"
            "{% endfor %}",
            {{"user", ""}, {"system", ""}, {"tool", ""}}) == "USO");
}

TEST_CASE("chat: explicit context without the flag has no prompt",
          "[chat_template]") {
  CHECK(render_chat_template(
            "{% for message in messages %}{{ message.role }}"
            "{% if loop.last and add_generation_prompt %}PROMPT{% endif %}"
            "{% endfor %}",
            {{"user", ""}}, render_context{}) == "user");
}

TEST_CASE("chat: malformed for is a parse error, not literal text",
          "[chat_template]") {
  CHECK_THROWS_AS(render_chat_template("before {% for message in messages "
                                       "%}broken",
                                       {{"system", "x"}}),
                  parse_error);
}

TEST_CASE("chat: render errors reach the caller", "[chat_template]") {
  CHECK_THROWS_AS(render_chat_template("{{ messages }}", {{"user", "x"}}),
                  render_error);
}

// == TinyLlama ===============================================================

TEST_CASE("chat: TinyLlama template with default context",
          "[chat_template]") {
  auto rendered = render_chat_template(
      tinyllama_template,
      {{"system", "You are a friendly AI."}, {"user", "Hello!"}});
  CHECK(rendered == "<|system|>\nYou are a friendly AI.</s>\n"
                    "<|user|>\nHello!</s>\n"
                    "<|assistant|>\n");
}

TEST_CASE("chat: TinyLlama template without generation prompt",
          "[chat_template]") {
  render_context ctx;
  ctx.set_var("eos_token", "</s>");
  ctx.set_flag("add_generation_prompt", false);

  auto rendered = render_chat_template(tinyllama_template, {{"user", "Hi"}}, ctx);
  CHECK(rendered == "<|user|>\nHi</s>\n");
}

TEST_CASE("chat: TinyLlama multi-turn with custom eos token",
          "[chat_template]") {
  render_context ctx;
  ctx.set_var("eos_token", "<|endoftext|>");
  ctx.set_flag("add_generation_prompt", true);

  chat_template tmpl(tinyllama_template);
  auto rendered = tmpl.render({{"system", "You help."},
                               {"user", "What is 2+2?"},
                               {"assistant", "4"},
                               {"user", "Thanks!"}},
                              ctx);
  CHECK(rendered == "<|system|>\nYou help.<|endoftext|>\n"
                    "<|user|>\nWhat is 2+2?<|endoftext|>\n"
                    "<|assistant|>\n4<|endoftext|>\n"
                    "<|user|>\nThanks!<|endoftext|>\n"
                    "<|assistant|>\n");
}

TEST_CASE("chat: a parsed template renders repeatedly", "[chat_template]") {
  chat_template tmpl("{% for m in messages %}{{ m.role }}{% endfor %}");
  auto ctx = default_render_context();
  CHECK(tmpl.render({{"a", ""}}, ctx) == "a");
  CHECK(tmpl.render({{"b", ""}, {"c", ""}}, ctx) == "bc");
  CHECK(tmpl.render(scope{{"messages", value_list{}}}) == "");
}

TEST_CASE("chat: constructing from a broken template throws",
          "[chat_template]") {
  CHECK_THROWS_AS(chat_template("{% if x %}"), parse_error);
  CHECK_THROWS_AS(chat_template("{{ 'x }}"), lex_error);
}
