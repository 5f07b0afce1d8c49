#include "tutorguard/cli/commands.hpp"

#include "tutorguard/common/strings.hpp"
#include "tutorguard/config/config.hpp"
#include "tutorguard/fallback/roster.hpp"
#include "tutorguard/observability/factory.hpp"
#include "tutorguard/observability/global.hpp"
#include "tutorguard/pipeline/message_pipeline.hpp"
#include "tutorguard/providers/gemini.hpp"
#include "tutorguard/security/injection_detector.hpp"
#include "tutorguard/security/response_guard.hpp"
#include "tutorguard/security/rules.hpp"
#include "tutorguard/security/sanitizer.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace tutorguard::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Leaves `out_value` untouched when the option is absent; fails only on a dangling flag.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value, std::string &error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return true;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: tutorguard [--config PATH] <command> [args]\n\n";
  std::cout << "commands:\n";
  std::cout << "  check <text>        Sanitize a student message and run the injection checks\n";
  std::cout << "  guard <text>        Screen a model response for leaks and persona breaks\n";
  std::cout << "  models              Show the model roster and fallback cursor\n";
  std::cout << "  config validate     Load and validate the configuration\n";
  std::cout << "  config path         Print the configuration file location\n";
  std::cout << "  chat [-m MSG] [--identity ID]\n";
  std::cout << "                      Talk to the tutor through the full pipeline\n";
  std::cout << "  version             Show version\n\n";
  std::cout << "chat commands: /new  /history  /models  /quit\n";
}

common::Result<config::Config> load_and_observe() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

void print_snapshot(const fallback::RosterSnapshot &snapshot) {
  std::cout << "current_model: " << snapshot.current_model << "\n";
  std::cout << "current_index: " << snapshot.current_index << "\n";
  std::cout << "remaining_fallbacks: " << snapshot.remaining_fallbacks << "\n";
  std::cout << "available_models:\n";
  for (std::size_t i = 0; i < snapshot.available_models.size(); ++i) {
    std::cout << (i == snapshot.current_index ? "  * " : "    ") << snapshot.available_models[i]
              << "\n";
  }
}

int run_check(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: tutorguard check <text>\n";
    return 1;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto rules = security::ValidationRuleSet::from_config(cfg.value().validation);
  if (!rules.ok()) {
    std::cerr << rules.error() << "\n";
    return 1;
  }

  const security::InjectionDetector detector(rules.value());
  const auto message = security::sanitize(join_tokens(args));
  const auto verdict = detector.check(message);
  if (!verdict.passed) {
    std::cout << "REJECTED: " << verdict.reason << "\n";
    return 1;
  }
  std::cout << "PASSED: " << verdict.text << "\n";
  return 0;
}

int run_guard(const std::vector<std::string> &args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const security::ResponseGuard guard(cfg.value().persona);
  const auto verdict = guard.validate(join_tokens(args));
  if (!verdict.passed) {
    std::cout << "REJECTED: " << verdict.text << "\n";
    return 1;
  }
  std::cout << "PASSED\n";
  return 0;
}

int run_models() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto roster = fallback::ModelRoster::create(cfg.value().models.roster);
  if (!roster.ok()) {
    std::cerr << roster.error() << "\n";
    return 1;
  }
  print_snapshot(roster.value()->snapshot());
  return 0;
}

int run_config(const std::vector<std::string> &args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  if (args.empty() || args[0] != "validate") {
    std::cerr << "usage: tutorguard config <validate|path>\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] " << cfg.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "[FAIL] " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "[WARN] " << warning << "\n";
  }
  std::cout << "[OK] configuration is valid\n";
  return 0;
}

void print_chat_error(const common::Error &error) {
  std::cerr << "[" << common::http_status(error.kind) << " " << common::error_kind_name(error.kind)
            << "] " << error.message;
  if (error.retry_after_seconds.has_value()) {
    std::cerr << " (retry after " << *error.retry_after_seconds << "s)";
  }
  std::cerr << "\n";
}

int run_chat(std::vector<std::string> args) {
  std::string message;
  std::string identity = "local";
  std::string error;
  if (!take_option(args, "--message", "-m", message, error) ||
      !take_option(args, "--identity", "", identity, error)) {
    std::cerr << error << "\n";
    return 1;
  }

  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto backend = providers::create_backend(cfg.value().backend);
  if (!backend.ok()) {
    std::cerr << backend.error() << "\n";
    return 1;
  }
  auto pipeline = pipeline::MessagePipeline::create(
      cfg.value(), std::shared_ptr<providers::GenerationBackend>(std::move(backend.value())));
  if (!pipeline.ok()) {
    std::cerr << pipeline.error() << "\n";
    return 1;
  }
  auto &tutor = *pipeline.value();

  if (!message.empty()) {
    auto reply = tutor.chat(identity, std::nullopt, message);
    if (!reply.ok()) {
      print_chat_error(reply.error());
      return 1;
    }
    std::cout << reply.value().text << "\n";
    return 0;
  }

  std::optional<std::string> session_id;
  std::string line;
  std::cout << cfg.value().persona.name << " is ready. Type /quit to leave.\n";
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string input = common::trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "/quit" || input == "/exit") {
      break;
    }
    if (input == "/models") {
      print_snapshot(tutor.roster_info());
      continue;
    }
    if (input == "/new") {
      if (session_id.has_value()) {
        if (auto removed = tutor.delete_session(*session_id); !removed.ok()) {
          print_chat_error(removed.error());
        }
      }
      session_id.reset();
      std::cout << "started a new session\n";
      continue;
    }
    if (input == "/history") {
      if (!session_id.has_value()) {
        std::cout << "(no messages yet)\n";
        continue;
      }
      auto history = tutor.session_history(*session_id);
      if (!history.ok()) {
        print_chat_error(history.error());
        continue;
      }
      for (const auto &turn : history.value()) {
        std::cout << providers::turn_role_name(turn.role) << ": " << turn.text << "\n";
      }
      continue;
    }

    auto reply = tutor.chat(identity, session_id, input);
    if (!reply.ok()) {
      print_chat_error(reply.error());
      continue;
    }
    session_id = reply.value().session_id;
    std::cout << reply.value().text << "\n";
  }

  observability::record_event(observability::SessionEvent{
      .session_id = session_id.value_or(""), .action = "closed"});
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

} // namespace

std::string version_string() {
#ifdef TUTORGUARD_VERSION
  const std::string version = TUTORGUARD_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "tutorguard " + version;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(args);
  }
  if (subcommand == "guard") {
    return run_guard(args);
  }
  if (subcommand == "models") {
    return run_models();
  }
  if (subcommand == "config") {
    return run_config(args);
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tutorguard::cli
