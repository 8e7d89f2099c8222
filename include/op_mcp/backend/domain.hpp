#pragma once

#include <op_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace op_mcp {

// Backend "Formattable" text: {format, raw, html}. A bare string maps to raw.
struct FormattableText {
    std::string format;
    std::string raw;
    std::string html;
};

struct Project {
    std::int64_t id = 0; // always > 0 once mapped
    std::string name;
    std::string identifier;
    std::optional<FormattableText> description;
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;
};

struct WorkPackage {
    std::optional<std::int64_t> id;
    std::string subject;
    std::optional<std::string> status;
    std::optional<std::string> priority;
    std::optional<std::string> assignee;
    std::optional<std::string> due_date;
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;
};

// Never partially populated: either both fetches succeeded or there is no
// report at all.
struct WeeklyReport {
    Project project;
    std::vector<WorkPackage> work_packages; // backend order
    std::string week;
    std::string summary;
};

// ---------------------------------------------------------------------------
// Mapping from backend JSON. Required fields missing or of the wrong type
// fail with UpstreamProtocol; optional fields degrade to absent.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<Project, Error> MapProject(const nlohmann::json& j);
[[nodiscard]] Result<WorkPackage, Error> MapWorkPackage(const nlohmann::json& j);

// Accepts a HAL collection (`_embedded.elements`), an object with a top-level
// `elements` array, or a bare array.
[[nodiscard]] Result<std::vector<WorkPackage>, Error> MapWorkPackageCollection(
    const nlohmann::json& j);

// Builds the report; summary is "Found N work packages".
WeeklyReport MakeWeeklyReport(Project project,
                              std::vector<WorkPackage> work_packages,
                              std::string week);

// ---------------------------------------------------------------------------
// Tool output shapes. Absent optionals render as null.
// ---------------------------------------------------------------------------

// {id, name, identifier, description, created_at, updated_at}
nlohmann::json ToJson(const Project& project);

// {id, subject, status, priority, assignee, due_date, created_at, updated_at}
nlohmann::json ToJson(const WorkPackage& wp);

// {project:{id,name,identifier}, week, work_packages, summary, total_packages}
nlohmann::json ToJson(const WeeklyReport& report);

} // namespace op_mcp
