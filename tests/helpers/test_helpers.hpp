#pragma once

#include "safelayer/common/http.hpp"
#include "safelayer/guards/guard.hpp"
#include "safelayer/observability/observer.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safelayer::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Sets (or unsets) an environment variable for the lifetime of the guard.
struct EnvGuard {
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

/// Installs an observer as the global one and restores the previous observer on destruction.
class ScopedObserver {
public:
  explicit ScopedObserver(std::shared_ptr<observability::IObserver> observer);
  ~ScopedObserver();

  ScopedObserver(const ScopedObserver &) = delete;
  ScopedObserver &operator=(const ScopedObserver &) = delete;

private:
  std::shared_ptr<observability::IObserver> previous_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename Event> [[nodiscard]] std::vector<Event> events_of() const {
    std::vector<Event> out;
    for (const auto &event : events()) {
      if (const auto *typed = std::get_if<Event>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Guard stub with canned behaviour for pipeline tests.
class ScriptedGuard final : public guards::Guard {
public:
  enum class Mode { Append, FailCheck, FailMask, ThrowCheck, ThrowMask };

  ScriptedGuard(std::string name, Mode mode, std::string suffix = "");

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] common::Result<std::vector<guards::Finding>>
  check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;

private:
  std::string name_;
  Mode mode_;
  std::string suffix_;
};

/// HttpClient double that returns queued responses and records requests.
class FakeHttpClient final : public common::HttpClient {
public:
  struct Request {
    std::string method;
    std::string url;
    std::string body;
  };

  void push_response(std::uint16_t status, std::string body);
  void push_network_error(std::string message);

  [[nodiscard]] common::HttpResponse post_json(const std::string &url,
                                               const common::HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) override;
  [[nodiscard]] common::HttpResponse get(const std::string &url, const common::HttpHeaders &headers,
                                         std::uint64_t timeout_ms) override;

  [[nodiscard]] const std::vector<Request> &requests() const { return requests_; }

private:
  common::HttpResponse next();

  std::vector<common::HttpResponse> responses_;
  std::vector<Request> requests_;
};

std::string read_text(const std::filesystem::path &path);

} // namespace safelayer::testing
