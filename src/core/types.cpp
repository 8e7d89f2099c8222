#include <op_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace op_mcp {

namespace {

bool AllDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

int ToInt(std::string_view digits) {
    int v = 0;
    for (char c : digits) {
        v = v * 10 + (c - '0');
    }
    return v;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ProjectId
// ---------------------------------------------------------------------------
Result<ProjectId, std::string> ProjectId::Create(std::int64_t id) {
    if (id <= 0) {
        return Result<ProjectId, std::string>::Err(
            "project_id must be a positive integer, got " + std::to_string(id));
    }
    return Result<ProjectId, std::string>::Ok(ProjectId(id));
}

// ---------------------------------------------------------------------------
// WeekLabel
// ---------------------------------------------------------------------------
Result<WeekLabel, std::string> WeekLabel::Create(std::string_view label) {
    using R = Result<WeekLabel, std::string>;
    const auto bad = [&]() {
        return R::Err("week must have the form YYYY-Wnn with nn in 1..53, got '" +
                      std::string(label) + "'");
    };

    if (label.size() < 7 || label.size() > 8) return bad();
    auto year_part = label.substr(0, 4);
    if (!AllDigits(year_part) || label.substr(4, 2) != "-W") return bad();
    auto week_part = label.substr(6);
    if (!AllDigits(week_part)) return bad();

    const int week = ToInt(week_part);
    if (week < 1 || week > 53) return bad();

    return R::Ok(WeekLabel(std::string(label), ToInt(year_part), week));
}

// ---------------------------------------------------------------------------
// BaseUrl
// ---------------------------------------------------------------------------
Result<BaseUrl, std::string> BaseUrl::Create(std::string_view url) {
    using R = Result<BaseUrl, std::string>;
    if (url.empty()) {
        return R::Err("base URL must not be empty");
    }

    BaseUrl out;
    std::string_view rest;
    if (url.substr(0, 8) == "https://") {
        out.scheme_ = "https";
        out.port_ = 443;
        rest = url.substr(8);
    } else if (url.substr(0, 7) == "http://") {
        out.scheme_ = "http";
        out.port_ = 80;
        rest = url.substr(7);
    } else {
        return R::Err("base URL must start with http:// or https://");
    }

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    std::string_view path = slash == std::string_view::npos
        ? std::string_view{} : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_part = authority.substr(colon + 1);
        if (!AllDigits(port_part) || port_part.size() > 5) {
            return R::Err("base URL has an invalid port");
        }
        out.port_ = ToInt(port_part);
        if (out.port_ < 1 || out.port_ > 65535) {
            return R::Err("base URL port must be in 1..65535");
        }
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return R::Err("base URL must contain a host");
    }
    out.host_ = std::string(authority);

    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    out.path_prefix_ = std::string(path);
    out.value_ = out.scheme_ + "://" + std::string(rest.substr(0, slash)) +
                 out.path_prefix_;
    return R::Ok(std::move(out));
}

std::string BaseUrl::Origin() const {
    return scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

} // namespace op_mcp
