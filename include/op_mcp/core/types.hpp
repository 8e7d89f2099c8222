#pragma once

#include <op_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace op_mcp {

// ---------------------------------------------------------------------------
// ProjectId: backend project id, always > 0.
// ---------------------------------------------------------------------------
class ProjectId {
public:
    static Result<ProjectId, std::string> Create(std::int64_t id);

    [[nodiscard]] std::int64_t Value() const noexcept { return value_; }
    [[nodiscard]] std::string ToString() const { return std::to_string(value_); }

    bool operator==(const ProjectId& other) const { return value_ == other.value_; }
    bool operator!=(const ProjectId& other) const { return value_ != other.value_; }

private:
    explicit ProjectId(std::int64_t value) : value_(value) {}
    std::int64_t value_;
};

// ---------------------------------------------------------------------------
// WeekLabel: ISO week label "YYYY-Wnn".
//
// Rules:
//   - Four-digit year, literal "-W", then a week number 1..53
//   - Week number may be written with or without a leading zero ("W7", "W07")
// ---------------------------------------------------------------------------
class WeekLabel {
public:
    static Result<WeekLabel, std::string> Create(std::string_view label);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] int Year() const noexcept { return year_; }
    [[nodiscard]] int Week() const noexcept { return week_; }

    bool operator==(const WeekLabel& other) const { return value_ == other.value_; }
    bool operator!=(const WeekLabel& other) const { return value_ != other.value_; }

private:
    WeekLabel(std::string value, int year, int week)
        : value_(std::move(value)), year_(year), week_(week) {}
    std::string value_;
    int year_;
    int week_;
};

// ---------------------------------------------------------------------------
// BaseUrl: backend API root, e.g. "https://op.example.com/api/v3".
//
// Scheme must be http or https and a host is required. A trailing '/' is
// dropped from the path prefix.
// ---------------------------------------------------------------------------
class BaseUrl {
public:
    static Result<BaseUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] int Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& PathPrefix() const noexcept { return path_prefix_; }
    [[nodiscard]] bool UseTls() const noexcept { return scheme_ == "https"; }

    /// "scheme://host:port" as understood by httplib::Client.
    [[nodiscard]] std::string Origin() const;

    bool operator==(const BaseUrl& other) const { return value_ == other.value_; }
    bool operator!=(const BaseUrl& other) const { return value_ != other.value_; }

private:
    BaseUrl() = default;
    std::string value_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string path_prefix_;
};

} // namespace op_mcp
