#include <chattpl/chat_template.hpp>
#include <chattpl/error.hpp>
#include <chattpl/json_context.hpp>
#include <chattpl/tokenizer.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_render = 4;
static constexpr int exit_context = 5;

struct cli_options {
  std::string template_file;
  std::string messages_file;
  std::string config_file;
  std::string vars_file;
  std::string template_name = "default";
  std::string output_file;
  std::vector<std::pair<std::string, std::string>> vars;
  std::vector<std::pair<std::string, bool>> flags;
  bool generation_prompt = true;
  bool dump_tokens = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: chattpl [options] [template-file]\n"
     << "\n"
     << "Options:\n"
     << "  -m <file>               Messages JSON file (array of "
        "{\"role\", \"content\"})\n"
     << "  -c <file>               tokenizer_config.json (chat_template and "
        "special tokens)\n"
     << "  --template-name <name>  Named template to use from the config "
        "(default: default)\n"
     << "  --vars <file>           JSON object of variables (strings, numbers "
        "and booleans)\n"
     << "  -D <name=value>         Define a string variable\n"
     << "  --flag <name=bool>      Define a boolean flag (true or false)\n"
     << "  --no-generation-prompt  Set add_generation_prompt to false\n"
     << "  -o <file>               Output file (default: stdout)\n"
     << "  --tokens                Print the template's token stream and "
        "exit\n"
     << "  -h, --help              Show this help message\n"
     << "  --version               Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "chattpl " << CHATTPL_VERSION << "\n";
}

static std::pair<std::string, std::string>
split_assignment(const std::string& arg, const char* option) {
  auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::cerr << "chattpl: " << option << " argument must be name=value\n";
    std::exit(exit_usage);
  }
  return {arg.substr(0, eq), arg.substr(eq + 1)};
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  auto require_value = [&](int& i, const std::string& arg) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "chattpl: " << arg << " requires an argument\n";
      std::exit(exit_usage);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-m") {
      opts.messages_file = require_value(i, arg);
      continue;
    }

    if (arg == "-c") {
      opts.config_file = require_value(i, arg);
      continue;
    }

    if (arg == "--vars") {
      opts.vars_file = require_value(i, arg);
      continue;
    }

    if (arg == "--template-name") {
      opts.template_name = require_value(i, arg);
      continue;
    }

    if (arg == "-o") {
      opts.output_file = require_value(i, arg);
      continue;
    }

    if (arg == "-D") {
      opts.vars.push_back(split_assignment(require_value(i, arg), "-D"));
      continue;
    }

    if (arg == "--flag") {
      auto [name, text] = split_assignment(require_value(i, arg), "--flag");
      if (text != "true" && text != "false") {
        std::cerr << "chattpl: --flag value must be true or false\n";
        std::exit(exit_usage);
      }
      opts.flags.emplace_back(name, text == "true");
      continue;
    }

    if (arg == "--no-generation-prompt") {
      opts.generation_prompt = false;
      continue;
    }

    if (arg == "--tokens") {
      opts.dump_tokens = true;
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "chattpl: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.template_file.empty()) {
      std::cerr << "chattpl: more than one template file given\n";
      std::exit(exit_usage);
    }
    opts.template_file = arg;
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "chattpl: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::optional<nlohmann::json>
read_json_file(const std::string& path) {
  std::string text = read_file(path);
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "chattpl: invalid JSON in " << path << ": " << e.what()
              << "\n";
    return std::nullopt;
  }
}

static int
dump_tokens(const std::string& source, std::ostream& os) {
  try {
    for (const auto& tok : chattpl::tokenize(source)) {
      os << tok.offset << "\t" << chattpl::to_string(tok.kind);
      if (tok.kind == chattpl::token_kind::text ||
          tok.kind == chattpl::token_kind::identifier ||
          tok.kind == chattpl::token_kind::string_literal)
        os << "\t"
           << nlohmann::json(tok.value).dump(
                  -1, ' ', false, nlohmann::json::error_handler_t::replace);
      os << "\n";
    }
  } catch (const chattpl::lex_error& e) {
    std::cerr << "chattpl: " << e.what() << "\n";
    return exit_parse;
  }
  return exit_success;
}

static int
run(const cli_options& opts) {
  chattpl::render_context ctx;
  ctx.set_flag("add_generation_prompt", opts.generation_prompt);

  // Template source and special tokens from the tokenizer config
  std::optional<std::string> source;
  bool eos_configured = false;
  if (!opts.config_file.empty()) {
    auto json = read_json_file(opts.config_file);
    if (!json) return exit_context;
    // A template file replaces the config's template, so none is selected.
    if (!opts.template_file.empty() && json->is_object())
      json->erase("chat_template");
    try {
      auto cfg = chattpl::tokenizer_config_from_json(*json, opts.template_name);
      cfg.apply(ctx);
      source = cfg.chat_template;
      eos_configured = cfg.eos_token.has_value();
    } catch (const chattpl::context_error& e) {
      std::cerr << "chattpl: " << opts.config_file << ": " << e.what() << "\n";
      return exit_context;
    }
  }
  if (!opts.template_file.empty()) source = read_file(opts.template_file);

  if (!source) {
    std::cerr << "chattpl: no template given (pass a template file or a "
                 "config with chat_template)\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  if (opts.dump_tokens) return dump_tokens(*source, std::cout);

  std::vector<chattpl::chat_message> messages;
  if (!opts.messages_file.empty()) {
    auto json = read_json_file(opts.messages_file);
    if (!json) return exit_context;
    try {
      messages = chattpl::messages_from_json(*json);
    } catch (const chattpl::context_error& e) {
      std::cerr << "chattpl: " << opts.messages_file << ": " << e.what()
                << "\n";
      return exit_context;
    }
  }

  try {
    if (!eos_configured) ctx.set_var("eos_token", "</s>");
    if (!opts.vars_file.empty()) {
      auto json = read_json_file(opts.vars_file);
      if (!json) return exit_context;
      chattpl::apply_variables(*json, ctx);
    }
    for (const auto& [name, text] : opts.vars)
      ctx.set_var(name, text);
    for (const auto& [name, flag] : opts.flags)
      ctx.set_flag(name, flag);
  } catch (const chattpl::context_error& e) {
    std::cerr << "chattpl: " << e.what() << "\n";
    return exit_context;
  }

  std::string rendered;
  try {
    chattpl::chat_template tmpl(*source);
    rendered = tmpl.render(messages, ctx);
  } catch (const chattpl::lex_error& e) {
    std::cerr << "chattpl: " << e.what() << "\n";
    return exit_parse;
  } catch (const chattpl::parse_error& e) {
    std::cerr << "chattpl: " << e.what() << "\n";
    return exit_parse;
  } catch (const chattpl::render_error& e) {
    std::cerr << "chattpl: " << e.what() << "\n";
    return exit_render;
  }

  if (opts.output_file.empty()) {
    std::cout << rendered;
    return exit_success;
  }

  std::ofstream out(opts.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "chattpl: cannot write file: " << opts.output_file << "\n";
    return exit_io;
  }
  out << rendered;
  out.flush();
  if (!out) {
    std::cerr << "chattpl: failed writing file: " << opts.output_file << "\n";
    return exit_io;
  }
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  return run(opts);
}
