#include "tests/helpers/test_helpers.hpp"

#include "safelayer/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace safelayer::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("safelayer-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ScopedObserver::ScopedObserver(std::shared_ptr<observability::IObserver> observer)
    : previous_(observability::get_global_observer()) {
  observability::set_global_observer(std::move(observer));
}

ScopedObserver::~ScopedObserver() { observability::set_global_observer(previous_); }

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ScriptedGuard::ScriptedGuard(std::string name, const Mode mode, std::string suffix)
    : Guard(false), name_(std::move(name)), mode_(mode), suffix_(std::move(suffix)) {}

common::Result<std::vector<guards::Finding>> ScriptedGuard::check(const std::string &text) const {
  if (mode_ == Mode::FailCheck) {
    return common::Result<std::vector<guards::Finding>>::failure("scripted check failure",
                                                                 common::ErrorKind::GuardFailure);
  }
  if (mode_ == Mode::ThrowCheck) {
    throw std::runtime_error("scripted check exception");
  }
  std::vector<guards::Finding> findings;
  if (!text.empty()) {
    findings.push_back(make_finding("scripted", 0, text.size(), "Scripted finding"));
  }
  return common::Result<std::vector<guards::Finding>>::success(std::move(findings));
}

common::Result<std::string> ScriptedGuard::mask(const std::string &text) const {
  if (mode_ == Mode::FailMask) {
    return common::Result<std::string>::failure("scripted mask failure",
                                                common::ErrorKind::GuardFailure);
  }
  if (mode_ == Mode::ThrowMask) {
    throw std::runtime_error("scripted mask exception");
  }
  if (!suffix_.empty() && text.size() >= suffix_.size() &&
      text.compare(text.size() - suffix_.size(), suffix_.size(), suffix_) == 0) {
    return common::Result<std::string>::success(text);
  }
  return common::Result<std::string>::success(text + suffix_);
}

void FakeHttpClient::push_response(const std::uint16_t status, std::string body) {
  common::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  responses_.push_back(std::move(response));
}

void FakeHttpClient::push_network_error(std::string message) {
  common::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  responses_.push_back(std::move(response));
}

common::HttpResponse FakeHttpClient::next() {
  if (responses_.empty()) {
    common::HttpResponse response;
    response.network_error = true;
    response.network_error_message = "no queued response";
    return response;
  }
  common::HttpResponse response = std::move(responses_.front());
  responses_.erase(responses_.begin());
  return response;
}

common::HttpResponse FakeHttpClient::post_json(const std::string &url, const common::HttpHeaders &,
                                               const std::string &body, std::uint64_t) {
  requests_.push_back(Request{.method = "POST", .url = url, .body = body});
  return next();
}

common::HttpResponse FakeHttpClient::get(const std::string &url, const common::HttpHeaders &,
                                         std::uint64_t) {
  requests_.push_back(Request{.method = "GET", .url = url, .body = ""});
  return next();
}

std::string read_text(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace safelayer::testing
