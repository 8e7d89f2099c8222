#include <op_mcp/backend/domain.hpp>

#include <cstdint>
#include <limits>

namespace op_mcp {

namespace {

using json = nlohmann::json;

Error MakeProtocolError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::UpstreamProtocol, operation, message);
}

// Accepts a JSON integer, or a float with no fractional part. Values outside
// the int64 range are absent.
std::optional<std::int64_t> AsInt(const json& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    if (v.is_number_float()) {
        // 2^63 is exactly representable; anything at or beyond it is not an int64.
        constexpr double kLimit = 9223372036854775808.0;
        const double d = v.get<double>();
        if (!(d >= -kLimit && d < kLimit)) return std::nullopt;
        const auto i = static_cast<std::int64_t>(d);
        if (static_cast<double>(i) == d) return i;
    }
    return std::nullopt;
}

std::optional<std::string> OptString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// First string-valued key among camelCase / snake_case spellings.
std::optional<std::string> OptStringEither(const json& obj,
                                           const char* camel,
                                           const char* snake) {
    if (auto v = OptString(obj, camel)) return v;
    return OptString(obj, snake);
}

// Resolve a single-object reference (status, priority, assignee) to its
// display name. Tries, in order:
//   wp.<ref>.name             plain object form
//   wp._embedded.<ref>.name   HAL embedded resource
//   wp._links.<ref>.title     HAL link
// Any other shape is treated as absent.
std::optional<std::string> ResolveReference(const json& wp, const char* ref) {
    auto direct = wp.find(ref);
    if (direct != wp.end()) {
        if (direct->is_object()) {
            if (auto name = OptString(*direct, "name")) return name;
        } else if (direct->is_string()) {
            return direct->get<std::string>();
        }
    }

    auto embedded = wp.find("_embedded");
    if (embedded != wp.end() && embedded->is_object()) {
        auto it = embedded->find(ref);
        if (it != embedded->end() && it->is_object()) {
            if (auto name = OptString(*it, "name")) return name;
        }
    }

    auto links = wp.find("_links");
    if (links != wp.end() && links->is_object()) {
        auto it = links->find(ref);
        if (it != links->end() && it->is_object()) {
            if (auto title = OptString(*it, "title")) return title;
        }
    }
    return std::nullopt;
}

std::optional<FormattableText> MapFormattable(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) {
        return FormattableText{"plain", it->get<std::string>(), ""};
    }
    if (!it->is_object()) return std::nullopt;
    FormattableText text;
    text.format = OptString(*it, "format").value_or("");
    text.raw = OptString(*it, "raw").value_or("");
    text.html = OptString(*it, "html").value_or("");
    return text;
}

json OrNull(const std::optional<std::string>& v) {
    return v.has_value() ? json(*v) : json(nullptr);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MapProject
// ---------------------------------------------------------------------------
Result<Project, Error> MapProject(const json& j) {
    if (!j.is_object()) {
        return Result<Project, Error>::Err(
            MakeProtocolError("MapProject", "Project response is not a JSON object"));
    }

    std::optional<std::int64_t> id;
    if (auto it = j.find("id"); it != j.end()) {
        id = AsInt(*it);
    }
    if (!id.has_value() || *id <= 0) {
        return Result<Project, Error>::Err(
            MakeProtocolError("MapProject", "Project has no positive integer 'id'"));
    }

    auto name = OptString(j, "name");
    if (!name.has_value()) {
        return Result<Project, Error>::Err(
            MakeProtocolError("MapProject", "Project is missing required field 'name'"));
    }
    auto identifier = OptString(j, "identifier");
    if (!identifier.has_value()) {
        return Result<Project, Error>::Err(
            MakeProtocolError("MapProject", "Project is missing required field 'identifier'"));
    }

    Project p;
    p.id = *id;
    p.name = std::move(*name);
    p.identifier = std::move(*identifier);
    p.description = MapFormattable(j, "description");
    p.created_at = OptStringEither(j, "createdAt", "created_at");
    p.updated_at = OptStringEither(j, "updatedAt", "updated_at");
    return Result<Project, Error>::Ok(std::move(p));
}

// ---------------------------------------------------------------------------
// MapWorkPackage
// ---------------------------------------------------------------------------
Result<WorkPackage, Error> MapWorkPackage(const json& j) {
    if (!j.is_object()) {
        return Result<WorkPackage, Error>::Err(
            MakeProtocolError("MapWorkPackage", "Work package is not a JSON object"));
    }

    auto subject = OptString(j, "subject");
    if (!subject.has_value()) {
        return Result<WorkPackage, Error>::Err(
            MakeProtocolError("MapWorkPackage",
                              "Work package is missing required field 'subject'"));
    }

    WorkPackage wp;
    if (auto it = j.find("id"); it != j.end()) {
        wp.id = AsInt(*it);
    }
    wp.subject = std::move(*subject);
    wp.status = ResolveReference(j, "status");
    wp.priority = ResolveReference(j, "priority");
    wp.assignee = ResolveReference(j, "assignee");
    wp.due_date = OptStringEither(j, "dueDate", "due_date");
    wp.created_at = OptStringEither(j, "createdAt", "created_at");
    wp.updated_at = OptStringEither(j, "updatedAt", "updated_at");
    return Result<WorkPackage, Error>::Ok(std::move(wp));
}

// ---------------------------------------------------------------------------
// MapWorkPackageCollection
// ---------------------------------------------------------------------------
Result<std::vector<WorkPackage>, Error> MapWorkPackageCollection(const json& j) {
    using R = Result<std::vector<WorkPackage>, Error>;

    const json* elements = nullptr;
    if (j.is_array()) {
        elements = &j;
    } else if (j.is_object()) {
        auto embedded = j.find("_embedded");
        if (embedded != j.end() && embedded->is_object()) {
            auto it = embedded->find("elements");
            if (it != embedded->end() && it->is_array()) {
                elements = &*it;
            }
        }
        if (elements == nullptr) {
            auto it = j.find("elements");
            if (it != j.end() && it->is_array()) {
                elements = &*it;
            }
        }
    }

    if (elements == nullptr) {
        return R::Err(MakeProtocolError(
            "MapWorkPackageCollection",
            "Work package collection has no 'elements' array"));
    }

    std::vector<WorkPackage> out;
    out.reserve(elements->size());
    for (size_t i = 0; i < elements->size(); ++i) {
        auto wp = MapWorkPackage((*elements)[i]);
        if (wp.IsErr()) {
            auto err = wp.Error();
            err.message += " (element " + std::to_string(i) + ")";
            return R::Err(std::move(err));
        }
        out.push_back(std::move(wp).Value());
    }
    return R::Ok(std::move(out));
}

WeeklyReport MakeWeeklyReport(Project project,
                              std::vector<WorkPackage> work_packages,
                              std::string week) {
    WeeklyReport report;
    report.summary = "Found " + std::to_string(work_packages.size()) + " work packages";
    report.project = std::move(project);
    report.work_packages = std::move(work_packages);
    report.week = std::move(week);
    return report;
}

// ---------------------------------------------------------------------------
// ToJson
// ---------------------------------------------------------------------------
json ToJson(const Project& project) {
    json description = nullptr;
    if (project.description.has_value()) {
        description = {
            {"format", project.description->format},
            {"raw", project.description->raw},
            {"html", project.description->html},
        };
    }
    return {
        {"id", project.id},
        {"name", project.name},
        {"identifier", project.identifier},
        {"description", description},
        {"created_at", OrNull(project.created_at)},
        {"updated_at", OrNull(project.updated_at)},
    };
}

json ToJson(const WorkPackage& wp) {
    return {
        {"id", wp.id.has_value() ? json(*wp.id) : json(nullptr)},
        {"subject", wp.subject},
        {"status", OrNull(wp.status)},
        {"priority", OrNull(wp.priority)},
        {"assignee", OrNull(wp.assignee)},
        {"due_date", OrNull(wp.due_date)},
        {"created_at", OrNull(wp.created_at)},
        {"updated_at", OrNull(wp.updated_at)},
    };
}

json ToJson(const WeeklyReport& report) {
    json packages = json::array();
    for (const auto& wp : report.work_packages) {
        packages.push_back(ToJson(wp));
    }
    return {
        {"project", {
            {"id", report.project.id},
            {"name", report.project.name},
            {"identifier", report.project.identifier},
        }},
        {"week", report.week},
        {"work_packages", std::move(packages)},
        {"summary", report.summary},
        {"total_packages", report.work_packages.size()},
    };
}

} // namespace op_mcp
