#include "safelayer/cli/commands.hpp"

#include "safelayer/audit/audit.hpp"
#include "safelayer/common/fs.hpp"
#include "safelayer/common/http.hpp"
#include "safelayer/config/config.hpp"
#include "safelayer/guards/factory.hpp"
#include "safelayer/guards/manager.hpp"
#include "safelayer/observability/factory.hpp"
#include "safelayer/observability/global.hpp"
#include "safelayer/policy/policy_io.hpp"
#include "safelayer/policy/store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace safelayer::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_BLOCKED = 2;

std::string version_string() {
#ifdef SAFELAYER_VERSION
  return std::string("safelayer ") + SAFELAYER_VERSION;
#else
  return "safelayer 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
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

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

void print_help() {
  std::cout << "usage: safelayer [--config FILE] <command> [options]\n\n"
            << "commands:\n"
            << "  run [-i FILE] [-o FILE] [-p POLICY] [--explain]\n"
            << "                                  sanitize text from FILE or stdin\n"
            << "  policy validate FILE            check a policy file\n"
            << "  policy show FILE                print a policy summary and document\n"
            << "  policy template NAME GUARD... [-o FILE]\n"
            << "                                  create a template policy\n"
            << "  version                         print the version\n";
}

void print_summary(const policy::PolicySummary &summary) {
  std::cout << "name: " << summary.name << "\n";
  std::cout << "version: " << summary.version << "\n";
  std::cout << "description: " << summary.description << "\n";
  std::cout << "parent_policy: " << summary.parent_policy.value_or("-") << "\n";
  std::cout << "guards: " << summary.guard_count << " (" << summary.enabled_guards
            << " enabled)\n";
  for (const auto &[key, value] : summary.metadata) {
    std::cout << "metadata." << key << ": " << value << "\n";
  }
}

int run_pipeline(std::vector<std::string> args) {
  std::string input_path;
  std::string output_path;
  std::string policy_path;
  take_option(args, "--input", "-i", input_path);
  take_option(args, "--output", "-o", output_path);
  take_option(args, "--policy", "-p", policy_path);
  const bool explain = take_flag(args, "--explain");
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return EXIT_ERROR;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return EXIT_ERROR;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    std::cerr << warnings.error() << "\n";
    return EXIT_ERROR;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  const config::Config &settings = cfg.value();
  observability::set_global_observer(observability::create_observer(settings));

  policy::PolicyStore store(config::expand_config_path(settings.policy.dir));
  auto from_env = store.load_from_env();
  if (!from_env.ok()) {
    std::cerr << from_env.error() << "\n";
    return EXIT_ERROR;
  }
  if (policy_path.empty() && !from_env.value().has_value()) {
    policy_path = settings.policy.file;
  }
  if (!policy_path.empty()) {
    auto loaded = store.load(config::expand_config_path(policy_path));
    if (!loaded.ok()) {
      std::cerr << loaded.error() << "\n";
      return EXIT_ERROR;
    }
    auto activated = store.set_active(loaded.value().name);
    if (!activated.ok()) {
      std::cerr << activated.error() << "\n";
      return EXIT_ERROR;
    }
  }

  const policy::PolicySet active = store.active();
  for (const auto &issue : policy::validate_policy(active)) {
    std::cerr << "warning: policy '" << active.name << "': " << issue << "\n";
  }

  guards::GuardFactoryOptions factory_options;
  factory_options.explain = explain || settings.guards.explain;
  factory_options.pii.backend = settings.pii.backend;
  factory_options.pii.presidio.base_url = settings.pii.presidio_url;
  factory_options.pii.presidio.timeout_ms = settings.pii.timeout_ms;
  if (settings.pii.backend == "presidio") {
    factory_options.http_client = std::make_shared<common::CurlHttpClient>();
  }
  auto built = guards::build_guards(active, factory_options);
  if (!built.ok()) {
    std::cerr << built.error() << "\n";
    return EXIT_ERROR;
  }

  std::shared_ptr<audit::IAuditSink> sink;
  if (settings.audit.enabled) {
    sink = std::make_shared<audit::JsonlAuditSink>(config::expand_config_path(settings.audit.path));
  } else {
    sink = std::make_shared<audit::NoopAuditSink>();
  }
  const guards::GuardManager manager(
      built.value(), sink,
      guards::GuardManagerOptions{.isolate_failures = settings.guards.isolate_failures,
                                  .include_excerpt = settings.audit.include_excerpt});

  std::string input;
  if (input_path.empty()) {
    input = read_stdin_all();
  } else {
    auto content = common::read_file(input_path);
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return EXIT_ERROR;
    }
    input = std::move(content.value());
  }

  auto result = manager.run(input);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return result.kind() == common::ErrorKind::Blocked ? EXIT_BLOCKED : EXIT_ERROR;
  }

  if (output_path.empty()) {
    std::cout << result.value();
    std::cout.flush();
    return EXIT_OK;
  }
  std::ofstream out(output_path, std::ios::trunc);
  if (!out) {
    std::cerr << "Failed to open output file: " << output_path << "\n";
    return EXIT_ERROR;
  }
  out << result.value();
  if (!out) {
    std::cerr << "Failed to write output file: " << output_path << "\n";
    return EXIT_ERROR;
  }
  return EXIT_OK;
}

int run_policy(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: safelayer policy <validate|show|template> ...\n";
    return EXIT_ERROR;
  }
  const std::string action = args.front();
  args.erase(args.begin());

  if (action == "validate" || action == "show") {
    if (args.size() != 1) {
      std::cerr << "usage: safelayer policy " << action << " FILE\n";
      return EXIT_ERROR;
    }
    auto loaded = policy::load_policy_file(args.front());
    if (!loaded.ok()) {
      std::cerr << loaded.error() << "\n";
      return EXIT_ERROR;
    }
    const auto issues = policy::validate_policy(loaded.value());

    if (action == "show") {
      print_summary(policy::summarize(loaded.value()));
      auto yaml = policy::serialize_policy_yaml(loaded.value());
      if (!yaml.ok()) {
        std::cerr << yaml.error() << "\n";
        return EXIT_ERROR;
      }
      std::cout << "---\n" << yaml.value();
      for (const auto &issue : issues) {
        std::cerr << "warning: " << issue << "\n";
      }
      return EXIT_OK;
    }

    if (issues.empty()) {
      std::cout << "Policy '" << loaded.value().name << "' is valid\n";
      return EXIT_OK;
    }
    for (const auto &issue : issues) {
      std::cout << "- " << issue << "\n";
    }
    return EXIT_ERROR;
  }

  if (action == "template") {
    std::string output_path;
    take_option(args, "--output", "-o", output_path);
    if (args.size() < 2) {
      std::cerr << "usage: safelayer policy template NAME GUARD... [-o FILE]\n";
      return EXIT_ERROR;
    }
    const std::string name = args.front();
    const std::vector<std::string> guard_names(args.begin() + 1, args.end());
    const policy::PolicySet tmpl = policy::create_policy_template(name, guard_names);

    if (output_path.empty()) {
      auto yaml = policy::serialize_policy_yaml(tmpl);
      if (!yaml.ok()) {
        std::cerr << yaml.error() << "\n";
        return EXIT_ERROR;
      }
      std::cout << yaml.value();
      return EXIT_OK;
    }
    auto saved = policy::save_policy_file(tmpl, output_path);
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return EXIT_ERROR;
    }
    std::cout << "Wrote " << output_path << "\n";
    return EXIT_OK;
  }

  std::cerr << "Unknown policy command: " << action << "\n";
  return EXIT_ERROR;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_ERROR;
  }

  if (args.empty()) {
    print_help();
    return EXIT_OK;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return EXIT_OK;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return EXIT_OK;
  }
  if (subcommand == "run") {
    return run_pipeline(std::move(args));
  }
  if (subcommand == "policy") {
    return run_policy(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_ERROR;
}

} // namespace safelayer::cli
